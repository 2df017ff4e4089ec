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

#pragma once

namespace coinpool {

struct RpcAuth
{
	std::string user;
	std::string password;
};

struct RpcResult
{
	enum class Status {
		Ok,
		Error,
		Unauthorized,
		MethodNotFound,
		NotImplemented,
	};

	enum Options : uint32_t {
		OPTION_LONGPOLLING = 1,
	};

	FORCEINLINE RpcResult() : status(Status::Error), options(0) {}
	FORCEINLINE RpcResult(Status s, const std::string& p = std::string(), uint32_t o = 0) : status(s), payload(p), options(o) {}

	// JSON-RPC error code and message, only meaningful when status != Ok
	int32_t error_code() const;
	const char* error_message() const;

	Status status;

	// Serialized JSON, empty means null
	std::string payload;
	uint32_t options;
};

// Answers one RPC request. The callback runs exactly once: on the first respond() call,
// or with an Error result when the responder is destroyed unanswered.
class RpcResponder : public nocopy_nomove
{
public:
	typedef Callback<void, const RpcResult&>::Base CallbackBase;

	template<typename T>
	explicit FORCEINLINE RpcResponder(T&& callback) : m_callback(new Callback<void, const RpcResult&>::Derived<T>(std::move(callback))), m_answered(false) {}

	~RpcResponder();

	// Returns false if this responder was already answered
	bool respond(const RpcResult& result);
	bool answered() const { return m_answered.load(); }

private:
	CallbackBase* m_callback;
	std::atomic<bool> m_answered;
};

// Receives the requests a listener reads from its connections. Ownership of the responder moves to the handler.
class IRpcHandler
{
public:
	virtual ~IRpcHandler() {}

	virtual bool rpc_request(RpcResponder* responder, const std::string& method, const std::string& params, const RpcAuth& auth) = 0;
	virtual bool rpc_lp_request(RpcResponder* responder, const RpcAuth& auth) = 0;
};

class IRpcListener
{
public:
	virtual ~IRpcListener() {}

	// Both calls return only after the port is actually open (or closed).
	// After stop() returns, owner is never called again for requests that came through this port.
	virtual bool start(int32_t port, IRpcHandler* owner) = 0;
	virtual void stop(int32_t port) = 0;
};

namespace log {

template<> struct Stream::Entry<RpcResult::Status>
{
	static NOINLINE void put(RpcResult::Status value, Stream* wrapper)
	{
		switch (value) {
		case RpcResult::Status::Ok:             *wrapper << "ok";               break;
		case RpcResult::Status::Error:          *wrapper << "error";            break;
		case RpcResult::Status::Unauthorized:   *wrapper << "unauthorized";     break;
		case RpcResult::Status::MethodNotFound: *wrapper << "method not found"; break;
		case RpcResult::Status::NotImplemented: *wrapper << "not implemented";  break;
		}
	}
};

} // namespace log

} // namespace coinpool
