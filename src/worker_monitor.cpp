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
#include "worker_monitor.h"

LOG_CATEGORY(WorkerMonitor)

namespace coinpool {

WorkerMonitor::WorkerMonitor()
{
	uv_mutex_init_checked(&m_lock);
}

WorkerMonitor::~WorkerMonitor()
{
	uv_mutex_destroy(&m_lock);
}

void WorkerMonitor::set_worker_notifications(const std::string& pool_id, const std::vector<std::string>& source_pools)
{
	MutexLock lock(m_lock);

	if (source_pools.empty()) {
		if (m_subscriptions.erase(pool_id)) {
			LOGINFO(5, "pool " << pool_id << " unsubscribed from worker changes");
		}
		return;
	}

	std::vector<std::string> v = source_pools;
	std::sort(v.begin(), v.end());
	v.erase(std::unique(v.begin(), v.end()), v.end());

	LOGINFO(5, "pool " << pool_id << " subscribed to worker changes of " << v.size() << " pool(s)");

	m_subscriptions[pool_id] = std::move(v);
}

std::vector<std::string> WorkerMonitor::subscribers_of(const std::string& source_pool) const
{
	std::vector<std::string> result;

	MutexLock lock(m_lock);

	for (const auto& it : m_subscriptions) {
		if (std::binary_search(it.second.begin(), it.second.end(), source_pool)) {
			result.push_back(it.first);
		}
	}

	std::sort(result.begin(), result.end());
	return result;
}

std::vector<std::string> WorkerMonitor::subscriptions_of(const std::string& pool_id) const
{
	MutexLock lock(m_lock);

	auto it = m_subscriptions.find(pool_id);
	if (it == m_subscriptions.end()) {
		return std::vector<std::string>();
	}

	return it->second;
}

size_t WorkerMonitor::size() const
{
	MutexLock lock(m_lock);
	return m_subscriptions.size();
}

} // namespace coinpool
