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
#include "gtest/gtest.h"

namespace coinpool {

TEST(rpc_request, error_codes)
{
	ASSERT_EQ(RpcResult(RpcResult::Status::Ok).error_code(), 0);
	ASSERT_EQ(RpcResult(RpcResult::Status::Unauthorized).error_code(), -32001);
	ASSERT_EQ(RpcResult(RpcResult::Status::MethodNotFound).error_code(), -32601);
	ASSERT_EQ(RpcResult(RpcResult::Status::NotImplemented).error_code(), -32002);
	ASSERT_EQ(RpcResult(RpcResult::Status::Error).error_code(), -32603);

	ASSERT_STREQ(RpcResult(RpcResult::Status::MethodNotFound).error_message(), "Method not found");
	ASSERT_STREQ(RpcResult().error_message(), "Internal error");
}

TEST(rpc_request, respond_once)
{
	std::vector<RpcResult> results;

	RpcResponder* r = new RpcResponder([&results](const RpcResult& result) { results.push_back(result); });
	ASSERT_FALSE(r->answered());

	ASSERT_TRUE(r->respond(RpcResult(RpcResult::Status::Ok, "true")));
	ASSERT_TRUE(r->answered());

	ASSERT_FALSE(r->respond(RpcResult(RpcResult::Status::Error)));

	delete r;

	ASSERT_EQ(results.size(), 1U);
	ASSERT_EQ(results[0].status, RpcResult::Status::Ok);
	ASSERT_EQ(results[0].payload, "true");
}

TEST(rpc_request, unanswered_responder)
{
	std::vector<RpcResult> results;

	RpcResponder* r = new RpcResponder([&results](const RpcResult& result) { results.push_back(result); });
	delete r;

	ASSERT_EQ(results.size(), 1U);
	ASSERT_EQ(results[0].status, RpcResult::Status::Error);
}

}
