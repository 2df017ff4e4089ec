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
#include "daemon_supervisor.h"
#include "coin_daemon.h"

LOG_CATEGORY(DaemonSupervisor)

namespace coinpool {

DaemonSupervisor::DaemonSupervisor()
{
	uv_mutex_init_checked(&m_lock);
}

DaemonSupervisor::~DaemonSupervisor()
{
	stop_all();
	uv_mutex_destroy(&m_lock);
}

ICoinDaemon* DaemonSupervisor::start(const std::string& pool_id, const CoinDaemonType& type, const std::string& config)
{
	stop(pool_id);

	ICoinDaemon* daemon = ICoinDaemon::create(type, pool_id, config);
	if (!daemon) {
		return nullptr;
	}

	ICoinDaemon* prev = nullptr;
	{
		MutexLock lock(m_lock);

		auto it = m_daemons.find(pool_id);
		if (it != m_daemons.end()) {
			prev = it->second;
			it->second = daemon;
		}
		else {
			m_daemons.emplace(pool_id, daemon);
		}
	}

	// Someone else started a daemon for this pool in the meantime
	delete prev;

	LOGINFO(3, "started " << type.pool_type << " coin daemon for pool " << pool_id);
	return daemon;
}

void DaemonSupervisor::stop(const std::string& pool_id)
{
	ICoinDaemon* daemon = nullptr;
	{
		MutexLock lock(m_lock);

		auto it = m_daemons.find(pool_id);
		if (it == m_daemons.end()) {
			return;
		}

		daemon = it->second;
		m_daemons.erase(it);
	}

	LOGINFO(3, "stopping " << daemon->type().pool_type << " coin daemon for pool " << pool_id);
	delete daemon;
}

void DaemonSupervisor::stop_all()
{
	std::vector<ICoinDaemon*> daemons;
	{
		MutexLock lock(m_lock);

		daemons.reserve(m_daemons.size());
		for (const auto& it : m_daemons) {
			daemons.push_back(it.second);
		}
		m_daemons.clear();
	}

	for (ICoinDaemon* d : daemons) {
		delete d;
	}
}

size_t DaemonSupervisor::size() const
{
	MutexLock lock(m_lock);
	return m_daemons.size();
}

void DaemonSupervisor::print_status() const
{
	MutexLock lock(m_lock);

	LOGINFO(0, "coin daemons running = " << m_daemons.size());

	for (const auto& it : m_daemons) {
		it.second->print_status();
	}
}

} // namespace coinpool
