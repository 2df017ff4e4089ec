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

struct CoinDaemonType;

struct ReconcilePlan
{
	enum class ListenerAction {
		None,
		Start,
		Stop,
		StopThenStart,
	};

	enum class DaemonAction {
		None,
		Start,
		StopThenStart,
	};

	FORCEINLINE ReconcilePlan() : listener(ListenerAction::None), old_port(0), new_port(0), daemon(DaemonAction::None), daemon_type(nullptr) {}

	ListenerAction listener;
	int32_t old_port;
	int32_t new_port;

	DaemonAction daemon;
	const CoinDaemonType* daemon_type;
};

// Decides which sub-services must be (re)started to go from old_config to new_config.
// old_config is nullptr when the pool has no applied config yet.
// Returns false if new_config names a pool type with no registered coin daemon.
bool reconcile(const PoolConfig* old_config, const PoolConfig& new_config, ReconcilePlan& plan);

namespace log {

template<> struct Stream::Entry<ReconcilePlan::ListenerAction>
{
	static NOINLINE void put(ReconcilePlan::ListenerAction value, Stream* wrapper)
	{
		switch (value) {
		case ReconcilePlan::ListenerAction::None:          *wrapper << "none";            break;
		case ReconcilePlan::ListenerAction::Start:         *wrapper << "start";           break;
		case ReconcilePlan::ListenerAction::Stop:          *wrapper << "stop";            break;
		case ReconcilePlan::ListenerAction::StopThenStart: *wrapper << "stop then start"; break;
		}
	}
};

template<> struct Stream::Entry<ReconcilePlan::DaemonAction>
{
	static NOINLINE void put(ReconcilePlan::DaemonAction value, Stream* wrapper)
	{
		switch (value) {
		case ReconcilePlan::DaemonAction::None:          *wrapper << "none";            break;
		case ReconcilePlan::DaemonAction::Start:         *wrapper << "start";           break;
		case ReconcilePlan::DaemonAction::StopThenStart: *wrapper << "stop then start"; break;
		}
	}
};

} // namespace log

} // namespace coinpool
