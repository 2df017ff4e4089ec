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

namespace coinpool {

class coinpool;

// Reads commands from stdin (a terminal or a pipe) on its own event loop thread
class ConsoleCommands : public nocopy_nomove
{
public:
	explicit ConsoleCommands(coinpool* pool);
	~ConsoleCommands();

	// Splits the input into lines and runs every complete line as a command
	static void process_input(coinpool* pool, std::string& command, const char* data, uint32_t size);

private:
	coinpool* m_pool;

	uv_loop_t m_loop;
	uv_thread_t m_loopThread;
	uv_async_t m_shutdownAsync;

	uv_tty_t m_tty;
	uv_pipe_t m_stdin_pipe;
	uv_stream_t* m_stdin_handle;

	char m_readBuf[64];
	bool m_readBufInUse;

	std::string m_command;

	static void loop(void* data);

	static void allocCallback(uv_handle_t* handle, size_t suggested_size, uv_buf_t* buf);
	static void stdinReadCallback(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf);

	static void on_shutdown(uv_async_t* async);
};

} // namespace coinpool
