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

class IWorkerMonitor
{
public:
	virtual ~IWorkerMonitor() {}

	// Replaces the set of pools whose worker changes pool_id wants to receive. An empty set unsubscribes.
	virtual void set_worker_notifications(const std::string& pool_id, const std::vector<std::string>& source_pools) = 0;

	// Pools that must see worker changes made in source_pool
	virtual std::vector<std::string> subscribers_of(const std::string& source_pool) const = 0;
};

class WorkerMonitor : public IWorkerMonitor, public nocopy_nomove
{
public:
	WorkerMonitor();
	~WorkerMonitor() override;

	void set_worker_notifications(const std::string& pool_id, const std::vector<std::string>& source_pools) override;

	std::vector<std::string> subscribers_of(const std::string& source_pool) const override;
	std::vector<std::string> subscriptions_of(const std::string& pool_id) const;

	size_t size() const;

private:
	mutable uv_mutex_t m_lock;
	unordered_map<std::string, std::vector<std::string>> m_subscriptions;
};

} // namespace coinpool
