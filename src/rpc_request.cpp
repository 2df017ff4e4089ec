/*
 * This file is part of coinpool, a mining sub-pool host
 * Copyright (c) 2024 The coinpool developers
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, version 3.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */

#include "common.h"
#include "rpc_request.h"

LOG_CATEGORY(RpcRequest)

namespace coinpool {

int32_t RpcResult::error_code() const
{
	switch (status) {
	case Status::Ok:             return 0;
	case Status::Unauthorized:   return -32001;
	case Status::MethodNotFound: return -32601;
	case Status::NotImplemented: return -32002;
	case Status::Error:          break;
	}
	return -32603;
}

const char* RpcResult::error_message() const
{
	switch (status) {
	case Status::Ok:             return "";
	case Status::Unauthorized:   return "Unauthorized";
	case Status::MethodNotFound: return "Method not found";
	case Status::NotImplemented: return "Not implemented";
	case Status::Error:          break;
	}
	return "Internal error";
}

RpcResponder::~RpcResponder()
{
	if (!m_answered.exchange(true)) {
		LOGWARN(5, "request was dropped without an answer");
		(*m_callback)(RpcResult(RpcResult::Status::Error));
	}
	delete m_callback;
}

bool RpcResponder::respond(const RpcResult& result)
{
	if (m_answered.exchange(true)) {
		LOGERR(1, "request was answered more than once, ignoring the second answer (" << result.status << ')');
		return false;
	}

	(*m_callback)(result);
	return true;
}

} // namespace coinpool
