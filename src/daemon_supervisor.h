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

#include "uv_util.h"

namespace coinpool {

struct CoinDaemonType;
class ICoinDaemon;

class IDaemonSupervisor
{
public:
	virtual ~IDaemonSupervisor() {}

	// Starts (or restarts) the coin daemon adapter of pool_id. Returns nullptr if it could not be started.
	// The returned adapter stays owned by the supervisor and is valid until the next start() or stop() for this pool.
	virtual ICoinDaemon* start(const std::string& pool_id, const CoinDaemonType& type, const std::string& config) = 0;
	virtual void stop(const std::string& pool_id) = 0;
};

class DaemonSupervisor : public IDaemonSupervisor, public nocopy_nomove
{
public:
	DaemonSupervisor();
	~DaemonSupervisor() override;

	ICoinDaemon* start(const std::string& pool_id, const CoinDaemonType& type, const std::string& config) override;
	void stop(const std::string& pool_id) override;

	void stop_all();
	size_t size() const;
	void print_status() const;

private:
	mutable uv_mutex_t m_lock;
	unordered_map<std::string, ICoinDaemon*> m_daemons;
};

} // namespace coinpool
