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

class IPoolDatabase
{
public:
	virtual ~IPoolDatabase() {}

	virtual bool get_pool_config(const std::string& pool_id, PoolConfig& out_config) = 0;
	virtual bool get_workers_for_pools(const std::vector<std::string>& pool_ids, std::vector<Worker>& out_workers) = 0;
	virtual bool get_pool_ids(std::vector<std::string>& out_pool_ids) = 0;
};

// Pools and workers stored in a JSON file. The file is read again on every query,
// so changes made to it are picked up by the next reload.
class PoolDatabase : public IPoolDatabase
{
public:
	explicit PoolDatabase(const std::string& filename);

	bool get_pool_config(const std::string& pool_id, PoolConfig& out_config) override;
	bool get_workers_for_pools(const std::vector<std::string>& pool_ids, std::vector<Worker>& out_workers) override;
	bool get_pool_ids(std::vector<std::string>& out_pool_ids) override;

	const std::string& filename() const { return m_filename; }

private:
	bool load(std::vector<PoolConfig>& pools, std::vector<Worker>& workers) const;

	std::string m_filename;
};

// Parses one worker record, pool_id is taken from default_pool if the record has no "pool" member
bool worker_from_json(const std::string& json, const std::string& default_pool, Worker& out_worker);

} // namespace coinpool
