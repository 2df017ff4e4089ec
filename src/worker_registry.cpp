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
#include "worker_registry.h"

LOG_CATEGORY(WorkerRegistry)

namespace coinpool {

WorkerRegistry::WorkerRegistry()
{
	uv_rwlock_init_checked(&m_lock);
}

WorkerRegistry::~WorkerRegistry()
{
	uv_rwlock_destroy(&m_lock);
}

bool WorkerRegistry::update(const Worker& worker)
{
	if (worker.id.empty() || worker.name.empty()) {
		LOGWARN(3, "ignoring worker record with an empty id or name (id \"" << worker.id << "\", name \"" << worker.name << "\")");
		return false;
	}

	WriteLock lock(m_lock);
	update_internal(worker);
	return true;
}

void WorkerRegistry::update_internal(const Worker& worker)
{
	auto it = m_names.find(worker.id);

	if (it == m_names.end()) {
		LOGINFO(6, "new worker " << worker.id << " (" << worker.name << ')');

		release_name(worker.name, worker.id);
		m_names.emplace(worker.id, worker.name);
		m_workers[worker.name] = worker;
		return;
	}

	if (it->second == worker.name) {
		LOGINFO(6, "worker " << worker.id << " (" << worker.name << ") updated");

		m_workers[worker.name] = worker;
		return;
	}

	const std::string old_name = it->second;
	LOGINFO(5, "worker " << worker.id << " renamed: " << old_name << " -> " << worker.name);

	m_workers.erase(old_name);
	release_name(worker.name, worker.id);

	// release_name() can modify m_names, so look it up again
	m_names[worker.id] = worker.name;
	m_workers[worker.name] = worker;
}

// If the name is currently held by another worker id, that id loses its index entry:
// its record is about to be overwritten and the index must never point at a record with a different id
void WorkerRegistry::release_name(const std::string& name, const std::string& new_owner_id)
{
	auto it = m_workers.find(name);
	if ((it == m_workers.end()) || (it->second.id == new_owner_id)) {
		return;
	}

	LOGWARN(4, "worker name " << name << " moves from worker " << it->second.id << " to worker " << new_owner_id);

	m_names.erase(it->second.id);
}

void WorkerRegistry::remove(const std::string& id)
{
	WriteLock lock(m_lock);

	auto it = m_names.find(id);
	if (it == m_names.end()) {
		return;
	}

	const std::string name = it->second;
	m_names.erase(it);
	m_workers.erase(name);

	LOGINFO(6, "worker " << id << " (" << name << ") removed");
}

void WorkerRegistry::replace_all(const std::vector<Worker>& workers)
{
	WriteLock lock(m_lock);

	m_names.clear();
	m_workers.clear();

	for (const Worker& w : workers) {
		if (w.id.empty() || w.name.empty()) {
			LOGWARN(3, "ignoring worker record with an empty id or name (id \"" << w.id << "\", name \"" << w.name << "\")");
			continue;
		}
		update_internal(w);
	}
}

void WorkerRegistry::clear()
{
	WriteLock lock(m_lock);

	m_names.clear();
	m_workers.clear();
}

bool WorkerRegistry::find_by_id(const std::string& id, Worker& out_worker) const
{
	ReadLock lock(m_lock);

	auto it = m_names.find(id);
	if (it == m_names.end()) {
		return false;
	}

	auto it2 = m_workers.find(it->second);
	if (it2 == m_workers.end()) {
		return false;
	}

	out_worker = it2->second;
	return true;
}

bool WorkerRegistry::find_by_name(const std::string& name, Worker& out_worker) const
{
	ReadLock lock(m_lock);

	auto it = m_workers.find(name);
	if (it == m_workers.end()) {
		return false;
	}

	out_worker = it->second;
	return true;
}

size_t WorkerRegistry::size() const
{
	ReadLock lock(m_lock);
	return m_names.size();
}

bool WorkerRegistry::consistent() const
{
	ReadLock lock(m_lock);

	if (m_names.size() != m_workers.size()) {
		return false;
	}

	for (const auto& it : m_names) {
		auto it2 = m_workers.find(it.second);
		if ((it2 == m_workers.end()) || (it2->second.id != it.first) || (it2->second.name != it.second)) {
			return false;
		}
	}

	return true;
}

} // namespace coinpool
