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

#ifdef _MSC_VER

#pragma warning(disable : 4005 4061 4324 4365 4464 4619 4625 4626 4668 4710 4711 4714 4804 4820 5039 5045 5220 5246 5264)
#define FORCEINLINE __forceinline
#define NOINLINE __declspec(noinline)
#define LIKELY(expression) expression

#elif __GNUC__

#define FORCEINLINE __attribute__((always_inline)) inline
#define NOINLINE __attribute__((noinline))
#define LIKELY(expression) __builtin_expect(expression, 1)

#else

#define FORCEINLINE inline
#define NOINLINE
#define LIKELY(expression) expression

#endif

#include <functional>
#include <type_traits>
#include <limits>

#include <cstdint>
#include <cstring>
#include <cstdio>
#include <cstdlib>

#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <atomic>
#include <chrono>

#include <signal.h>

#ifdef _WIN32

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif

#ifndef NOMINMAX
#define NOMINMAX
#endif

#ifndef _WIN32_WINNT
#define _WIN32_WINNT 0x0600
#endif

#include <Windows.h>

#elif defined(__linux__) || defined(__unix__) || defined(_POSIX_VERSION) || defined(__MACH__)

#include <unistd.h>

#endif

namespace coinpool {

constexpr int32_t MAX_PORT = 65535;

// Listener port 0 means "this pool has no listener"
struct PoolConfig
{
	FORCEINLINE PoolConfig() : port(0) {}

	FORCEINLINE bool operator==(const PoolConfig& other) const
	{
		return (id == other.id) && (port == other.port) && (pool_type == other.pool_type) && (coin_daemon_config == other.coin_daemon_config);
	}

	FORCEINLINE bool operator!=(const PoolConfig& other) const { return !operator==(other); }

	std::string id;
	int32_t port;
	std::string pool_type;

	// Serialized JSON, compared byte for byte and never interpreted outside of the daemon adapters
	std::string coin_daemon_config;
};

struct Worker
{
	FORCEINLINE bool operator==(const Worker& other) const
	{
		return (id == other.id) && (name == other.name) && (pool_id == other.pool_id) && (extra == other.extra);
	}

	FORCEINLINE bool operator!=(const Worker& other) const { return !operator==(other); }

	std::string id;
	std::string name;
	std::string pool_id;

	// Every other field of the worker record, as serialized JSON
	std::string extra;
};

struct WorkUnit
{
	std::string id;
	std::string worker;
};

} // namespace coinpool

#include "util.h"
#include "log.h"
