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
#include "rpc_server.h"
#include "gtest/gtest.h"

#ifndef _WIN32
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/time.h>
#endif

namespace coinpool {

class TestHandler : public IRpcHandler
{
public:
	TestHandler() : m_requests(0) {}

	bool rpc_request(RpcResponder* responder, const std::string& method, const std::string& params, const RpcAuth& auth) override
	{
		++m_requests;
		m_lastMethod = method;
		m_lastParams = params;

		if (auth.user != "alice") {
			responder->respond(RpcResult(RpcResult::Status::Unauthorized));
		}
		else {
			responder->respond(RpcResult(RpcResult::Status::Ok, "{\"work\":1}"));
		}

		delete responder;
		return true;
	}

	bool rpc_lp_request(RpcResponder* responder, const RpcAuth& /*auth*/) override
	{
		++m_requests;
		delete responder;
		return true;
	}

	std::atomic<uint32_t> m_requests;
	std::string m_lastMethod;
	std::string m_lastParams;
};

TEST(rpc_server, start_stop)
{
	TestHandler handler;
	RpcServer server("127.0.0.1");

	ASSERT_TRUE(server.start(38101, &handler));
	ASSERT_TRUE(server.start(38102, &handler));

	ASSERT_FALSE(server.start(38101, &handler));
	ASSERT_FALSE(server.start(0, &handler));
	ASSERT_FALSE(server.start(70000, &handler));
	ASSERT_FALSE(server.start(38103, nullptr));

	ASSERT_EQ(server.ports(), (std::vector<int32_t>{ 38101, 38102 }));

	server.stop(38101);
	server.stop(38104);
	ASSERT_EQ(server.ports(), (std::vector<int32_t>{ 38102 }));

	// The port can be opened again
	ASSERT_TRUE(server.start(38101, &handler));
}

#ifndef _WIN32
static std::string request(int32_t port, const std::string& data)
{
	const int fd = socket(AF_INET, SOCK_STREAM, 0);
	if (fd < 0) {
		return std::string();
	}

	timeval tv{};
	tv.tv_sec = 5;
	setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

	sockaddr_in addr{};
	addr.sin_family = AF_INET;
	addr.sin_port = htons(static_cast<uint16_t>(port));
	addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

	std::string result;

	if ((connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) && (send(fd, data.data(), data.size(), 0) == static_cast<ssize_t>(data.size()))) {
		char buf[1024];
		while (result.find('\n') == std::string::npos) {
			const ssize_t n = recv(fd, buf, sizeof(buf), 0);
			if (n <= 0) {
				break;
			}
			result.append(buf, static_cast<size_t>(n));
		}
	}

	close(fd);
	return result;
}

TEST(rpc_server, requests)
{
	TestHandler handler;
	RpcServer server("127.0.0.1");

	ASSERT_TRUE(server.start(38111, &handler));

	std::string response = request(38111, "{\"id\":1,\"method\":\"getwork\",\"params\":[1,2],\"user\":\"alice\",\"pass\":\"x\"}\r\n");
	ASSERT_EQ(response, "{\"id\":1,\"result\":{\"work\":1},\"error\":null}\n");
	ASSERT_EQ(handler.m_lastMethod, "getwork");
	ASSERT_EQ(handler.m_lastParams, "[1,2]");

	response = request(38111, "{\"id\":2,\"method\":\"getwork\",\"user\":\"bob\"}\n");
	ASSERT_EQ(response, "{\"id\":2,\"result\":null,\"error\":{\"code\":-32001,\"message\":\"Unauthorized\"}}\n");

	// Invalid requests close the connection without an answer
	response = request(38111, "{\"method\":\"getwork\"}\n");
	ASSERT_TRUE(response.empty());

	response = request(38111, "not json\n");
	ASSERT_TRUE(response.empty());

	ASSERT_EQ(handler.m_requests.load(), 2U);
}
#endif

}
