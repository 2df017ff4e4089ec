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

// Two tables that always agree with each other:
//   m_names:   worker id -> current worker name
//   m_workers: worker name -> worker record (record.id is the id that points at this name)
//
// All writes happen under the write lock, so readers never see a rename half done.
class WorkerRegistry : public nocopy_nomove
{
public:
	WorkerRegistry();
	~WorkerRegistry();

	// Returns false only for records with an empty id or name
	bool update(const Worker& worker);
	void remove(const std::string& id);

	void replace_all(const std::vector<Worker>& workers);
	void clear();

	bool find_by_id(const std::string& id, Worker& out_worker) const;
	bool find_by_name(const std::string& name, Worker& out_worker) const;

	size_t size() const;
	bool consistent() const;

	template<typename T>
	void for_each(T&& callback) const
	{
		ReadLock lock(m_lock);

		for (const auto& it : m_names) {
			callback(it.first, it.second);
		}
	}

private:
	void update_internal(const Worker& worker);
	void release_name(const std::string& name, const std::string& new_owner_id);

	mutable uv_rwlock_t m_lock;

	unordered_map<std::string, std::string> m_names;
	unordered_map<std::string, Worker> m_workers;
};

} // namespace coinpool
