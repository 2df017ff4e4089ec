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

#include "common.h"
#include "rpc_server.h"
#include "json_parsers.h"

#ifndef _WIN32
#include <arpa/inet.h>
#endif

LOG_CATEGORY(RpcServer)

static constexpr int DEFAULT_BACKLOG = 128;

namespace coinpool {

static thread_local RpcServer* rpc_server_event_loop_thread = nullptr;

RpcServer::RpcServer(const std::string& host)
	: m_host(host)
	, m_hostIsV6(host.find(':') != std::string::npos)
	, m_listenersLock{}
	, m_numConnections(0)
	, m_callLock{}
	, m_callCond{}
	, m_loop{}
	, m_loopThread{}
	, m_shutdownAsync{}
{
	if (m_host.empty()) {
		LOGERR(1, "listen address is not set");
		throw std::exception();
	}

	int err = uv_loop_init(&m_loop);
	if (err) {
		LOGERR(1, "failed to create event loop, error " << uv_err_name(err));
		throw std::exception();
	}

	// Init loop user data before running it
	GetLoopUserData(&m_loop);

	err = uv_async_init(&m_loop, &m_shutdownAsync, on_shutdown);
	if (err) {
		LOGERR(1, "uv_async_init failed, error " << uv_err_name(err));
		DeleteLoopUserData(&m_loop);
		uv_run(&m_loop, UV_RUN_NOWAIT);
		uv_loop_close(&m_loop);
		throw std::exception();
	}
	m_shutdownAsync.data = this;

	uv_mutex_init_checked(&m_listenersLock);
	uv_mutex_init_checked(&m_callLock);
	uv_cond_init_checked(&m_callCond);

	err = uv_thread_create(&m_loopThread, loop, this);
	if (err) {
		LOGERR(1, "failed to start event loop thread, error " << uv_err_name(err));
		uv_close(reinterpret_cast<uv_handle_t*>(&m_shutdownAsync), nullptr);
		DeleteLoopUserData(&m_loop);
		uv_run(&m_loop, UV_RUN_NOWAIT);
		uv_loop_close(&m_loop);

		uv_cond_destroy(&m_callCond);
		uv_mutex_destroy(&m_callLock);
		uv_mutex_destroy(&m_listenersLock);
		throw std::exception();
	}
}

RpcServer::~RpcServer()
{
	uv_async_send(&m_shutdownAsync);
	uv_thread_join(&m_loopThread);

	for (Client* c : m_clients) {
		delete c;
	}
	m_clients.clear();

	for (Client* c : m_freeClients) {
		delete c;
	}
	m_freeClients.clear();

	uv_cond_destroy(&m_callCond);
	uv_mutex_destroy(&m_callLock);
	uv_mutex_destroy(&m_listenersLock);

	LOGINFO(1, "stopped");
}

template<typename T>
bool RpcServer::run_on_loop(T&& callback)
{
	bool done = false;
	bool result = false;

	const bool posted = CallOnLoop(&m_loop,
		[this, &callback, &done, &result]()
		{
			const bool r = callback();

			MutexLock lock(m_callLock);
			result = r;
			done = true;
			uv_cond_broadcast(&m_callCond);
		});

	if (!posted) {
		LOGERR(1, "event loop is not running");
		return false;
	}

	MutexLock lock(m_callLock);
	while (!done) {
		uv_cond_wait(&m_callCond, &m_callLock);
	}

	return result;
}

bool RpcServer::start(int32_t port, IRpcHandler* owner)
{
	if (rpc_server_event_loop_thread == this) {
		LOGERR(1, "start() can't be called from the event loop thread");
		return false;
	}

	if (!owner) {
		LOGERR(1, "can't listen on port " << port << " without an owner");
		return false;
	}

	return run_on_loop([this, port, owner]() { return start_listening(port, owner); });
}

void RpcServer::stop(int32_t port)
{
	if (rpc_server_event_loop_thread == this) {
		LOGERR(1, "stop() can't be called from the event loop thread");
		return;
	}

	run_on_loop([this, port]() { stop_listening(port); return true; });
}

bool RpcServer::start_listening(int32_t port, IRpcHandler* owner)
{
	if ((port <= 0) || (port > MAX_PORT)) {
		LOGERR(1, "invalid port " << port);
		return false;
	}

	for (const Listener* l : m_listeners) {
		if (l->m_port == port) {
			LOGERR(1, "already listening on port " << port);
			return false;
		}
	}

	Listener* listener = new Listener{};
	listener->m_port = port;
	listener->m_owner = owner;
	listener->m_server = this;

	int err = uv_tcp_init(&m_loop, &listener->m_socket);
	if (err) {
		LOGERR(1, "failed to create tcp server handle, error " << uv_err_name(err));
		delete listener;
		return false;
	}
	listener->m_socket.data = listener;

	ON_SCOPE_LEAVE([this, listener]()
	{
		if (std::find(m_listeners.begin(), m_listeners.end(), listener) == m_listeners.end()) {
			uv_close(reinterpret_cast<uv_handle_t*>(&listener->m_socket), [](uv_handle_t* h) { delete static_cast<Listener*>(h->data); });
		}
	});

	char address[64] = {};
	{
		log::Stream s(address);
		if (m_hostIsV6) {
			s << '[' << m_host << "]:" << port;
		}
		else {
			s << m_host << ':' << port;
		}
	}

	if (m_hostIsV6) {
		sockaddr_in6 addr6;
		err = uv_ip6_addr(m_host.c_str(), port, &addr6);
		if (err) {
			LOGERR(1, "failed to parse IPv6 address " << m_host << ", error " << uv_err_name(err));
			return false;
		}

		err = uv_tcp_bind(&listener->m_socket, reinterpret_cast<sockaddr*>(&addr6), UV_TCP_IPV6ONLY);
	}
	else {
		sockaddr_in addr;
		err = uv_ip4_addr(m_host.c_str(), port, &addr);
		if (err) {
			LOGERR(1, "failed to parse IPv4 address " << m_host << ", error " << uv_err_name(err));
			return false;
		}

		err = uv_tcp_bind(&listener->m_socket, reinterpret_cast<sockaddr*>(&addr), 0);
	}

	if (err) {
		LOGERR(1, "failed to bind tcp server socket " << static_cast<const char*>(address) << ", error " << uv_err_name(err));
		return false;
	}

	err = uv_listen(reinterpret_cast<uv_stream_t*>(&listener->m_socket), DEFAULT_BACKLOG, on_new_connection);
	if (err) {
		LOGERR(1, "failed to listen on tcp server socket " << static_cast<const char*>(address) << ", error " << uv_err_name(err));
		return false;
	}

	{
		MutexLock lock(m_listenersLock);
		m_listeners.push_back(listener);
	}

	LOGINFO(1, "listening on " << log::Gray() << static_cast<const char*>(address));
	return true;
}

void RpcServer::stop_listening(int32_t port)
{
	Listener* listener = nullptr;
	{
		MutexLock lock(m_listenersLock);

		for (auto it = m_listeners.begin(); it != m_listeners.end(); ++it) {
			if ((*it)->m_port == port) {
				listener = *it;
				m_listeners.erase(it);
				break;
			}
		}
	}

	if (!listener) {
		LOGWARN(3, "not listening on port " << port);
		return;
	}

	size_t numClosed = 0;

	// close() doesn't remove the client from m_clients until its close callback runs
	for (Client* c : m_clients) {
		if ((c->m_listener == listener) && !c->m_isClosing) {
			c->close();
			++numClosed;
		}
	}

	if (numClosed > 0) {
		LOGINFO(3, "closed " << numClosed << " connections on port " << port);
	}

	uv_close(reinterpret_cast<uv_handle_t*>(&listener->m_socket), [](uv_handle_t* h) { delete static_cast<Listener*>(h->data); });

	LOGINFO(1, "stopped listening on port " << port);
}

std::vector<int32_t> RpcServer::ports() const
{
	std::vector<int32_t> result;
	{
		MutexLock lock(m_listenersLock);

		result.reserve(m_listeners.size());
		for (const Listener* l : m_listeners) {
			result.push_back(l->m_port);
		}
	}

	std::sort(result.begin(), result.end());
	return result;
}

void RpcServer::print_status() const
{
	char buf[log::Stream::BUF_SIZE + 1] = {};
	log::Stream s(buf);

	for (int32_t port : ports()) {
		s << ' ' << port;
	}

	LOGINFO(0, "status" <<
		"\nListening on =" << static_cast<const char*>(buf) <<
		"\nConnections  = " << m_numConnections.load()
	);
}

void RpcServer::loop(void* data)
{
	RpcServer* server = static_cast<RpcServer*>(data);
	rpc_server_event_loop_thread = server;

	LOGINFO(1, "event loop started");

	int err = uv_run(&server->m_loop, UV_RUN_DEFAULT);
	if (err) {
		LOGWARN(1, "uv_run returned " << err);
	}

	err = uv_loop_close(&server->m_loop);
	if (err) {
		LOGWARN(1, "uv_loop_close returned error " << uv_err_name(err));
	}

	rpc_server_event_loop_thread = nullptr;

	LOGINFO(1, "event loop stopped");
}

void RpcServer::on_shutdown()
{
	std::vector<Listener*> listeners;
	{
		MutexLock lock(m_listenersLock);
		listeners.swap(m_listeners);
	}

	for (Listener* l : listeners) {
		uv_close(reinterpret_cast<uv_handle_t*>(&l->m_socket), [](uv_handle_t* h) { delete static_cast<Listener*>(h->data); });
	}

	size_t numClosed = 0;

	for (Client* c : m_clients) {
		if (!c->m_isClosing) {
			c->close();
			++numClosed;
		}
	}

	if (numClosed > 0) {
		LOGWARN(1, "closed " << numClosed << " active client connections");
	}
}

void RpcServer::on_new_connection(uv_stream_t* server, int status)
{
	Listener* listener = static_cast<Listener*>(server->data);
	RpcServer* pThis = listener->m_server;

	if (status < 0) {
		LOGWARN(1, "new connection error " << uv_strerror(status));
		return;
	}

	Client* client = pThis->get_client();

	int err = uv_tcp_init(&pThis->m_loop, &client->m_socket);
	if (err) {
		LOGERR(1, "failed to create tcp client handle, error " << uv_err_name(err));
		pThis->return_client(client);
		return;
	}
	client->m_socket.data = client;
	client->m_owner = pThis;
	client->m_listener = listener;

	pThis->m_clients.push_back(client);
	++pThis->m_numConnections;

	err = uv_accept(server, reinterpret_cast<uv_stream_t*>(&client->m_socket));
	if (err) {
		LOGERR(1, "failed to accept client connection, error " << uv_err_name(err));
		client->close();
		return;
	}

	sockaddr_storage peer_addr;
	int peer_addr_len = static_cast<int>(sizeof(peer_addr));
	err = uv_tcp_getpeername(&client->m_socket, reinterpret_cast<sockaddr*>(&peer_addr), &peer_addr_len);
	if (err) {
		LOGERR(1, "failed to get IP address of the client connection, error " << uv_err_name(err));
		client->close();
		return;
	}

	char addr_str[64] = {};
	log::Stream s(client->m_addrString);

	if (peer_addr.ss_family == AF_INET6) {
		const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&peer_addr);
		uv_ip6_name(a, addr_str, sizeof(addr_str) - 1);
		s << '[' << static_cast<const char*>(addr_str) << "]:" << ntohs(a->sin6_port) << '\0';
	}
	else {
		const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&peer_addr);
		uv_ip4_name(a, addr_str, sizeof(addr_str) - 1);
		s << static_cast<const char*>(addr_str) << ':' << ntohs(a->sin_port) << '\0';
	}

	LOGINFO(5, "new connection from " << log::Gray() << static_cast<const char*>(client->m_addrString) << log::NoColor() << " on port " << listener->m_port);

	err = uv_read_start(reinterpret_cast<uv_stream_t*>(&client->m_socket), Client::on_alloc, Client::on_read);
	if (err) {
		LOGERR(1, "failed to start reading from client connection, error " << uv_err_name(err));
		client->close();
	}
}

void RpcServer::on_connection_close(uv_handle_t* handle)
{
	Client* client = static_cast<Client*>(handle->data);
	RpcServer* owner = client->m_owner;

	LOGINFO(5, "client " << log::Gray() << static_cast<const char*>(client->m_addrString) << log::NoColor() << " disconnected");

	auto it = std::find(owner->m_clients.begin(), owner->m_clients.end(), client);
	if (it != owner->m_clients.end()) {
		owner->m_clients.erase(it);
		--owner->m_numConnections;
	}

	client->reset();
	owner->return_client(client);
}

RpcServer::Client* RpcServer::get_client()
{
	if (!m_freeClients.empty()) {
		Client* c = m_freeClients.back();
		m_freeClients.pop_back();
		return c;
	}

	return new Client();
}

void RpcServer::return_client(Client* c)
{
	m_freeClients.push_back(c);
}

RpcServer::Client::Client()
	: m_owner(nullptr)
	, m_listener(nullptr)
	, m_socket{}
	, m_readBufInUse(false)
	, m_isClosing(false)
	, m_numRead(0)
	, m_addrString{}
	, m_resetCounter{ 0 }
{
	m_readBuf[0] = '\0';
}

void RpcServer::Client::reset()
{
	m_resetCounter.fetch_add(1);

	m_owner = nullptr;
	m_listener = nullptr;
	memset(&m_socket, 0, sizeof(m_socket));
	m_readBufInUse = false;
	m_isClosing = false;
	m_numRead = 0;
	m_addrString[0] = '\0';
	m_readBuf[0] = '\0';
}

void RpcServer::Client::on_alloc(uv_handle_t* handle, size_t /*suggested_size*/, uv_buf_t* buf)
{
	Client* pThis = static_cast<Client*>(handle->data);

	if (pThis->m_readBufInUse || (pThis->m_numRead >= READ_BUF_SIZE)) {
		LOGWARN(4, "client " << static_cast<const char*>(pThis->m_addrString) << " read buffer is full");
		buf->len = 0;
		buf->base = nullptr;
		return;
	}

	buf->len = READ_BUF_SIZE - pThis->m_numRead;
	buf->base = pThis->m_readBuf + pThis->m_numRead;
	pThis->m_readBufInUse = true;
}

void RpcServer::Client::on_read(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf)
{
	Client* client = static_cast<Client*>(stream->data);
	client->m_readBufInUse = false;

	if (client->m_isClosing) {
		return;
	}

	if (nread > 0) {
		if (!client->on_read(buf->base, static_cast<uint32_t>(nread))) {
			client->close();
		}
	}
	else if (nread < 0) {
		if (nread != UV_EOF) {
			LOGWARN(5, "client " << static_cast<const char*>(client->m_addrString) << " failed to read request, err = " << uv_err_name(static_cast<int>(nread)));
		}
		client->close();
	}
}

bool RpcServer::Client::on_read(char* data, uint32_t size)
{
	if ((data != m_readBuf + m_numRead) || (data + size > m_readBuf + READ_BUF_SIZE)) {
		LOGERR(1, "client: invalid data pointer or size in on_read()");
		return false;
	}

	m_numRead += size;

	char* line_start = m_readBuf;
	for (char* c = data; c < m_readBuf + m_numRead; ++c) {
		if (*c == '\n') {
			char* line_end = c;
			if ((line_end > line_start) && (line_end[-1] == '\r')) {
				--line_end;
			}
			*line_end = '\0';

			if ((line_end > line_start) && !process_request(line_start, static_cast<uint32_t>(line_end - line_start))) {
				return false;
			}

			// process_request() can close the connection
			if (m_isClosing) {
				return true;
			}

			line_start = c + 1;
		}
	}

	// Move the possible unfinished line to the beginning of m_readBuf to free up more space for reading
	if (line_start != m_readBuf) {
		m_numRead = static_cast<uint32_t>(m_readBuf + m_numRead - line_start);
		if (m_numRead > 0) {
			memmove(m_readBuf, line_start, m_numRead);
		}
	}

	return true;
}

bool RpcServer::Client::process_request(char* data, uint32_t /*size*/)
{
	rapidjson::Document doc;
	if (doc.ParseInsitu(data).HasParseError()) {
		LOGWARN(4, "client " << static_cast<const char*>(m_addrString) << " invalid JSON request (parse error)");
		return false;
	}

	if (!doc.IsObject()) {
		LOGWARN(4, "client " << static_cast<const char*>(m_addrString) << " invalid JSON request (not an object)");
		return false;
	}

	uint64_t id;
	if (!parseValue(doc, "id", id)) {
		LOGWARN(4, "client " << static_cast<const char*>(m_addrString) << " invalid JSON request ('id' field is missing or not an integer)");
		return false;
	}

	bool longpoll = false;
	parseValue(doc, "longpoll", longpoll);

	std::string method;
	if (!longpoll && !parseValue(doc, "method", method)) {
		LOGWARN(4, "client " << static_cast<const char*>(m_addrString) << " invalid JSON request ('method' field is missing or not a string)");
		return false;
	}

	RpcAuth auth;
	parseValue(doc, "user", auth.user);
	parseValue(doc, "pass", auth.password);

	std::string params;
	auto it = doc.FindMember("params");
	if (it != doc.MemberEnd()) {
		params = to_json_string(it->value);
	}

	RpcServer* server = m_owner;
	Client* client = this;
	const uint32_t reset_counter = m_resetCounter.load();

	// Runs on the pool's thread, the response is written on the event loop thread
	RpcResponder* responder = new RpcResponder(
		[server, client, reset_counter, id](const RpcResult& result)
		{
			const bool posted = CallOnLoop(&server->m_loop,
				[client, reset_counter, id, result]()
				{
					if ((client->m_resetCounter.load() == reset_counter) && !client->m_isClosing) {
						client->send_response(id, result);
					}
				});

			if (!posted) {
				LOGWARN(5, "response to request " << id << " was discarded");
			}
		});

	IRpcHandler* handler = m_listener->m_owner;

	const bool delivered = longpoll ? handler->rpc_lp_request(responder, auth) : handler->rpc_request(responder, method, params, auth);
	if (!delivered) {
		LOGWARN(4, "port " << m_listener->m_port << ": request " << id << " from " << static_cast<const char*>(m_addrString) << " was not delivered");
	}

	return true;
}

void RpcServer::Client::send_response(uint64_t id, const RpcResult& result)
{
	rapidjson::StringBuffer buf;
	rapidjson::Writer<rapidjson::StringBuffer> writer(buf);

	writer.StartObject();

	writer.Key("id");
	writer.Uint64(id);

	writer.Key("result");
	if ((result.status == RpcResult::Status::Ok) && !result.payload.empty()) {
		writer.RawValue(result.payload.c_str(), result.payload.length(), rapidjson::kObjectType);
	}
	else {
		writer.Null();
	}

	writer.Key("error");
	if (result.status == RpcResult::Status::Ok) {
		writer.Null();
	}
	else {
		writer.StartObject();
		writer.Key("code");
		writer.Int(result.error_code());
		writer.Key("message");
		writer.String(result.error_message());
		writer.EndObject();
	}

	if (result.options & RpcResult::OPTION_LONGPOLLING) {
		writer.Key("options");
		writer.StartArray();
		writer.String("longpolling");
		writer.EndArray();
	}

	writer.EndObject();

	WriteBuf* wb = new WriteBuf();
	wb->m_write.data = wb;
	wb->m_client = this;
	wb->m_data.assign(buf.GetString(), buf.GetSize());
	wb->m_data.push_back('\n');

	uv_buf_t bufs[1];
	bufs[0].base = &wb->m_data[0];
	bufs[0].len = static_cast<decltype(bufs[0].len)>(wb->m_data.size());

	const int err = uv_write(&wb->m_write, reinterpret_cast<uv_stream_t*>(&m_socket), bufs, 1, on_write);
	if (err) {
		LOGWARN(1, "failed to start writing data to client connection " << static_cast<const char*>(m_addrString) << ", error " << uv_err_name(err));
		delete wb;
		close();
	}
}

void RpcServer::Client::on_write(uv_write_t* req, int status)
{
	WriteBuf* wb = static_cast<WriteBuf*>(req->data);
	Client* client = wb->m_client;
	delete wb;

	if ((status != 0) && (status != UV_ECANCELED)) {
		LOGWARN(5, "client " << static_cast<const char*>(client->m_addrString) << " failed to write data to client connection, error " << uv_err_name(status));
		client->close();
	}
}

void RpcServer::Client::close()
{
	if (m_isClosing || !m_owner) {
		// Already closed
		return;
	}

	m_isClosing = true;

	uv_read_stop(reinterpret_cast<uv_stream_t*>(&m_socket));

	uv_handle_t* h = reinterpret_cast<uv_handle_t*>(&m_socket);
	if (!uv_is_closing(h)) {
		uv_close(h, on_connection_close);
	}
}

} // namespace coinpool
