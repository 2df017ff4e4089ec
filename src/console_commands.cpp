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
#include "console_commands.h"
#include "coinpool.h"
#include "pool_supervisor.h"
#include "pool_db.h"

LOG_CATEGORY(ConsoleCommands)

namespace coinpool {

ConsoleCommands::ConsoleCommands(coinpool* pool)
	: m_pool(pool)
	, m_loop{}
	, m_loopThread{}
	, m_shutdownAsync{}
	, m_tty{}
	, m_stdin_pipe{}
	, m_stdin_handle(nullptr)
	, m_readBuf{}
	, m_readBufInUse(false)
{
	const uv_handle_type stdin_type = uv_guess_handle(0);
	LOGINFO(3, "uv_guess_handle returned " << static_cast<int>(stdin_type));
	if (stdin_type != UV_TTY && stdin_type != UV_NAMED_PIPE) {
		LOGERR(1, "tty or named pipe is not available");
		throw std::exception();
	}

	int err = uv_loop_init(&m_loop);
	if (err) {
		LOGERR(1, "failed to create event loop, error " << uv_err_name(err));
		throw std::exception();
	}

	err = uv_async_init(&m_loop, &m_shutdownAsync, on_shutdown);
	if (err) {
		LOGERR(1, "uv_async_init failed, error " << uv_err_name(err));
		uv_loop_close(&m_loop);
		throw std::exception();
	}
	m_shutdownAsync.data = this;

	if (stdin_type == UV_TTY) {
		LOGINFO(3, "processing stdin as UV_TTY");
		err = uv_tty_init(&m_loop, &m_tty, 0, 1);
		if (err) {
			LOGERR(1, "uv_tty_init failed, error " << uv_err_name(err));
			throw std::exception();
		}
		m_stdin_handle = reinterpret_cast<uv_stream_t*>(&m_tty);
	}
	else {
		LOGINFO(3, "processing stdin as UV_NAMED_PIPE");
		err = uv_pipe_init(&m_loop, &m_stdin_pipe, 0);
		if (err) {
			LOGERR(1, "uv_pipe_init failed, error " << uv_err_name(err));
			throw std::exception();
		}
		m_stdin_handle = reinterpret_cast<uv_stream_t*>(&m_stdin_pipe);
		err = uv_pipe_open(&m_stdin_pipe, 0);
		if (err) {
			LOGERR(1, "uv_pipe_open failed, error " << uv_err_name(err));
			throw std::exception();
		}
	}

	m_stdin_handle->data = this;
	err = uv_read_start(m_stdin_handle, allocCallback, stdinReadCallback);
	if (err) {
		LOGERR(1, "uv_read_start failed, error " << uv_err_name(err));
		throw std::exception();
	}

	err = uv_thread_create(&m_loopThread, loop, this);
	if (err) {
		LOGERR(1, "failed to start event loop thread, error " << uv_err_name(err));
		throw std::exception();
	}
}

ConsoleCommands::~ConsoleCommands()
{
	uv_async_send(&m_shutdownAsync);
	uv_thread_join(&m_loopThread);

	LOGINFO(1, "stopped");
}

void ConsoleCommands::loop(void* data)
{
	ConsoleCommands* console = static_cast<ConsoleCommands*>(data);

	LOGINFO(1, "event loop started");

	int err = uv_run(&console->m_loop, UV_RUN_DEFAULT);
	if (err) {
		LOGWARN(1, "uv_run returned " << err);
	}

	err = uv_loop_close(&console->m_loop);
	if (err) {
		LOGWARN(1, "uv_loop_close returned error " << uv_err_name(err));
	}

	LOGINFO(1, "event loop stopped");
}

void ConsoleCommands::on_shutdown(uv_async_t* async)
{
	ConsoleCommands* console = reinterpret_cast<ConsoleCommands*>(async->data);

	if (console->m_stdin_handle) {
		uv_read_stop(console->m_stdin_handle);
		uv_close(reinterpret_cast<uv_handle_t*>(console->m_stdin_handle), nullptr);
	}

	uv_close(reinterpret_cast<uv_handle_t*>(&console->m_shutdownAsync), nullptr);
}

typedef struct strconst {
	const char *str;
	size_t len;
} strconst;

#define STRCONST(x)	{x, sizeof(x)-1}
#define STRCNULL	{NULL, 0}

typedef void (cmdfunc)(coinpool *pool, const char *args);

typedef struct cmd {
	strconst name;
	const char *arg;
	const char *descr;
	cmdfunc *func;
} cmd;

static cmdfunc do_help, do_status, do_reload, do_loglevel, do_pools, do_start_pool, do_stop_pool, do_worker, do_rmworker, do_exit, do_version;

static cmd cmds[] = {
	{ STRCONST("help"), "", "display list of commands", do_help },
	{ STRCONST("status"), "", "display pools, listener and coin daemons status", do_status },
	{ STRCONST("reload"), "", "reload config and workers of all running pools", do_reload },
	{ STRCONST("loglevel"), "<level>", "set log level", do_loglevel },
	{ STRCONST("pools"), "", "show running pools", do_pools },
	{ STRCONST("start_pool"), "<pool>", "start a pool from the database", do_start_pool },
	{ STRCONST("stop_pool"), "<pool>", "stop a running pool", do_stop_pool },
	{ STRCONST("worker"), "<pool> <json>", "add or update a worker of a pool", do_worker },
	{ STRCONST("rmworker"), "<pool> <id>", "remove a worker from a pool", do_rmworker },
	{ STRCONST("exit"), "", "terminate coinpool", do_exit },
	{ STRCONST("version"), "", "show coinpool version", do_version },
	{ STRCNULL, NULL, NULL, NULL }
};

static void do_help(coinpool * /* pool */, const char * /* args */)
{
	LOGINFO(0, "List of commands");
	for (int i = 0; cmds[i].name.len; ++i) {
		LOGINFO(0, log::pad_right(cmds[i].name.str, 20) << log::pad_right(cmds[i].arg, 16) << cmds[i].descr);
	}
}

static void do_status(coinpool *pool, const char * /* args */)
{
	pool->print_status();
}

static void do_reload(coinpool *pool, const char * /* args */)
{
	pool->reload();
}

static void do_loglevel(coinpool * /* pool */, const char *args)
{
	int level = static_cast<int>(strtol(args, nullptr, 10));
	level = std::min(std::max(level, 0), log::MAX_GLOBAL_LOG_LEVEL);
	log::GLOBAL_LOG_LEVEL = level;
	LOGINFO(0, "log level set to " << level);
}

static void do_pools(coinpool *pool, const char * /* args */)
{
	const std::vector<std::string> pools = pool->supervisor().running_pools();

	LOGINFO(0, pools.size() << " pool(s) running");
	for (const std::string& id : pools) {
		LOGINFO(0, id);
	}
}

static void do_start_pool(coinpool *pool, const char *args)
{
	if (pool->supervisor().start_pool(args)) {
		LOGINFO(0, "pool " << args << " started");
	}
}

static void do_stop_pool(coinpool *pool, const char *args)
{
	pool->supervisor().stop_pool(args);
}

// Splits "<word> <rest>" into the word and the rest of the line
static bool split_first_word(const char* args, std::string& word, const char*& rest)
{
	const char* p = args;
	while (*p && (*p != ' ') && (*p != '\t')) {
		++p;
	}

	word.assign(args, p);

	while ((*p == ' ') || (*p == '\t')) {
		++p;
	}

	rest = p;
	return !word.empty() && *rest;
}

static void do_worker(coinpool *pool, const char *args)
{
	std::string pool_id;
	const char* json;

	if (!split_first_word(args, pool_id, json)) {
		LOGWARN(0, "usage: worker <pool> <json>");
		return;
	}

	Worker w;
	if (!worker_from_json(json, pool_id, w)) {
		return;
	}

	const uint32_t n = pool->supervisor().worker_changed(pool_id, w);
	LOGINFO(0, "worker " << w.id << " (" << w.name << ") sent to " << n << " pool(s)");
}

static void do_rmworker(coinpool *pool, const char *args)
{
	std::string pool_id;
	const char* worker_id;

	if (!split_first_word(args, pool_id, worker_id)) {
		LOGWARN(0, "usage: rmworker <pool> <id>");
		return;
	}

	const uint32_t n = pool->supervisor().worker_removed(pool_id, worker_id);
	LOGINFO(0, "worker " << worker_id << " removed from " << n << " pool(s)");
}

static void do_exit(coinpool *pool, const char * /* args */)
{
	pool->stop();
}

static void do_version(coinpool * /* pool */, const char * /* args */)
{
	LOGINFO(0, log::LightCyan() << VERSION);
}

void ConsoleCommands::allocCallback(uv_handle_t* handle, size_t /*suggested_size*/, uv_buf_t* buf)
{
	ConsoleCommands* pThis = static_cast<ConsoleCommands*>(handle->data);

	if (pThis->m_readBufInUse) {
		buf->len = 0;
		buf->base = nullptr;
		return;
	}

	buf->len = sizeof(pThis->m_readBuf);
	buf->base = pThis->m_readBuf;
	pThis->m_readBufInUse = true;
}

void ConsoleCommands::stdinReadCallback(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf)
{
	ConsoleCommands* pThis = static_cast<ConsoleCommands*>(stream->data);

	if (nread > 0) {
		process_input(pThis->m_pool, pThis->m_command, buf->base, static_cast<uint32_t>(nread));
	}
	else if (nread < 0) {
		LOGWARN(4, "read error " << uv_err_name(static_cast<int>(nread)));
		if (nread == UV_EOF) {
			uv_read_stop(stream);
		}
	}

	pThis->m_readBufInUse = false;
}

void ConsoleCommands::process_input(coinpool* pool, std::string& command, const char* data, uint32_t size)
{
	command.append(data, size);

	do {
		size_t k = command.find_first_of("\r\n");
		if (k == std::string::npos) {
			break;
		}
		command[k] = '\0';

		cmd* c = cmds;
		for (; c->name.len; ++c) {
			// The command name must be followed by the end of line or by its arguments
			if (!strncmp(command.c_str(), c->name.str, c->name.len) && ((command[c->name.len] == '\0') || (command[c->name.len] == ' ') || (command[c->name.len] == '\t'))) {
				const char* args = (c->name.len + 1 <= k) ? (command.c_str() + c->name.len + 1) : "";

				// Skip spaces
				while ((args[0] == ' ') || (args[0] == '\t')) {
					++args;
				}

				// Check if an argument is required
				if (strlen(c->arg) && !strlen(args)) {
					LOGWARN(0, c->name.str << " requires arguments");
					do_help(nullptr, nullptr);
					break;
				}

				c->func(pool, args);
				break;
			}
		}

		if (!c->name.len && command[0]) {
			LOGWARN(0, "Unknown command " << command.c_str());
			do_help(nullptr, nullptr);
		}

		k = command.find_first_not_of("\r\n", k + 1);
		command.erase(0, k);
	} while (true);
}

} // namespace coinpool
