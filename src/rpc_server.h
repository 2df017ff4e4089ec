/*
 * This file is part of coinpool, a mining sub-pool host
 * Copyright (c) 2021-2024 SChernykh <https://github.com/SChernykh>
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

#include "uv_util.h"
#include "rpc_request.h"

namespace coinpool {

// Accepts JSON-RPC connections on any number of ports, one request per line.
// All sockets live on one event loop thread, requests are handed to the pool that owns the port.
class RpcServer : public IRpcListener, public nocopy_nomove
{
public:
	explicit RpcServer(const std::string& host);
	~RpcServer() override;

	bool start(int32_t port, IRpcHandler* owner) override;
	void stop(int32_t port) override;

	std::vector<int32_t> ports() const;
	void print_status() const;

	uv_loop_t* get_loop() { return &m_loop; }

	struct Listener
	{
		uv_tcp_t m_socket;
		int32_t m_port;
		IRpcHandler* m_owner;
		RpcServer* m_server;
	};

	struct Client
	{
		enum params : uint32_t { READ_BUF_SIZE = 16384 };

		Client();

		void reset();

		static void on_alloc(uv_handle_t* handle, size_t suggested_size, uv_buf_t* buf);
		static void on_read(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf);
		static void on_write(uv_write_t* req, int status);

		bool on_read(char* data, uint32_t size);
		bool process_request(char* data, uint32_t size);
		void send_response(uint64_t id, const RpcResult& result);

		void close();

		RpcServer* m_owner;
		Listener* m_listener;

		uv_tcp_t m_socket;

		bool m_readBufInUse;
		bool m_isClosing;
		uint32_t m_numRead;

		char m_addrString[72];

		std::atomic<uint32_t> m_resetCounter;

		char m_readBuf[READ_BUF_SIZE];
	};

	struct WriteBuf
	{
		uv_write_t m_write = {};
		Client* m_client = nullptr;
		std::string m_data;
	};

private:
	static void loop(void* data);

	template<typename T>
	bool run_on_loop(T&& callback);

	bool start_listening(int32_t port, IRpcHandler* owner);
	void stop_listening(int32_t port);

	static void on_new_connection(uv_stream_t* server, int status);
	static void on_connection_close(uv_handle_t* handle);

	Client* get_client();
	void return_client(Client* c);

	static void on_shutdown(uv_async_t* async)
	{
		RpcServer* server = reinterpret_cast<RpcServer*>(async->data);
		server->on_shutdown();

		uv_close(reinterpret_cast<uv_handle_t*>(&server->m_shutdownAsync), nullptr);

		DeleteLoopUserData(&server->m_loop);
	}

	void on_shutdown();

	std::string m_host;
	bool m_hostIsV6;

	mutable uv_mutex_t m_listenersLock;
	std::vector<Listener*> m_listeners;

	std::vector<Client*> m_clients;
	std::vector<Client*> m_freeClients;
	std::atomic<uint32_t> m_numConnections;

	uv_mutex_t m_callLock;
	uv_cond_t m_callCond;

	uv_loop_t m_loop;
	uv_thread_t m_loopThread;
	uv_async_t m_shutdownAsync;
};

} // namespace coinpool
