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
#include "pool_db.h"
#include "json_parsers.h"
#include <rapidjson/istreamwrapper.h>
#include <fstream>

LOG_CATEGORY(PoolDatabase)

namespace coinpool {

PoolDatabase::PoolDatabase(const std::string& filename)
	: m_filename(filename)
{
	LOGINFO(1, "using pool database " << log::Gray() << m_filename);
}

static bool parse_pool(const rapidjson::Value& v, PoolConfig& cfg)
{
	if (!v.IsObject()) {
		LOGERR(1, "pool entry is not an object");
		return false;
	}

	if (!PARSE(v, cfg, id) || cfg.id.empty()) {
		LOGERR(1, "pool entry without an id");
		return false;
	}

	if (v.HasMember("port") && (!PARSE(v, cfg, port) || (cfg.port < 0) || (cfg.port > MAX_PORT))) {
		LOGERR(1, "pool " << cfg.id << ": invalid port");
		return false;
	}

	if (!PARSE(v, cfg, pool_type) || cfg.pool_type.empty()) {
		LOGERR(1, "pool " << cfg.id << ": pool_type is not set");
		return false;
	}

	auto it = v.FindMember("coin_daemon");
	if (it != v.MemberEnd()) {
		if (!it->value.IsObject()) {
			LOGERR(1, "pool " << cfg.id << ": coin_daemon is not an object");
			return false;
		}
		cfg.coin_daemon_config = to_json_string(it->value);
	}

	return true;
}

static bool parse_worker(const rapidjson::Value& v, const std::string& default_pool, Worker& w)
{
	if (!v.IsObject()) {
		LOGERR(1, "worker entry is not an object");
		return false;
	}

	if (!PARSE(v, w, id) || w.id.empty()) {
		LOGERR(1, "worker entry without an id");
		return false;
	}

	if (!parseValue(v, "pool", w.pool_id)) {
		w.pool_id = default_pool;
	}

	if (w.pool_id.empty()) {
		LOGERR(1, "worker " << w.id << ": pool is not set");
		return false;
	}

	if (!PARSE(v, w, name) || w.name.empty()) {
		LOGERR(1, "worker " << w.id << ": name is not set");
		return false;
	}

	rapidjson::Document extra;
	extra.SetObject();

	for (auto it = v.MemberBegin(); it != v.MemberEnd(); ++it) {
		const char* key = it->name.GetString();
		if (!strcmp(key, "id") || !strcmp(key, "pool") || !strcmp(key, "name")) {
			continue;
		}

		rapidjson::Value name(it->name, extra.GetAllocator());
		rapidjson::Value value(it->value, extra.GetAllocator());
		extra.AddMember(name, value, extra.GetAllocator());
	}

	w.extra = to_json_string(extra);
	return true;
}

bool worker_from_json(const std::string& json, const std::string& default_pool, Worker& out_worker)
{
	rapidjson::Document doc;
	if (doc.Parse<rapidjson::kParseCommentsFlag | rapidjson::kParseTrailingCommasFlag>(json.c_str(), json.length()).HasParseError()) {
		LOGERR(1, "failed to parse worker JSON data");
		return false;
	}

	return parse_worker(doc, default_pool, out_worker);
}

bool PoolDatabase::load(std::vector<PoolConfig>& pools, std::vector<Worker>& workers) const
{
	pools.clear();
	workers.clear();

	std::ifstream f(m_filename);
	if (!f.is_open()) {
		LOGERR(1, "can't open " << m_filename);
		return false;
	}

	rapidjson::Document doc;
	rapidjson::IStreamWrapper s(f);
	if (doc.ParseStream<rapidjson::kParseCommentsFlag | rapidjson::kParseTrailingCommasFlag>(s).HasParseError()) {
		LOGERR(1, "failed to parse JSON data in " << m_filename);
		return false;
	}

	if (!doc.IsObject()) {
		LOGERR(1, "invalid JSON data in " << m_filename << ": top level is not an object");
		return false;
	}

	auto it = doc.FindMember("pools");
	if (it != doc.MemberEnd()) {
		if (!it->value.IsArray()) {
			LOGERR(1, "invalid JSON data in " << m_filename << ": \"pools\" is not an array");
			return false;
		}

		const auto& arr = it->value.GetArray();
		pools.reserve(arr.Size());

		for (const auto& v : arr) {
			PoolConfig cfg;
			if (!parse_pool(v, cfg)) {
				return false;
			}

			for (const PoolConfig& p : pools) {
				if (p.id == cfg.id) {
					LOGERR(1, "duplicate pool id " << cfg.id << " in " << m_filename);
					return false;
				}
			}

			pools.emplace_back(std::move(cfg));
		}
	}

	it = doc.FindMember("workers");
	if (it != doc.MemberEnd()) {
		if (!it->value.IsArray()) {
			LOGERR(1, "invalid JSON data in " << m_filename << ": \"workers\" is not an array");
			return false;
		}

		const auto& arr = it->value.GetArray();
		workers.reserve(arr.Size());

		for (const auto& v : arr) {
			Worker w;
			if (!parse_worker(v, std::string(), w)) {
				return false;
			}
			workers.emplace_back(std::move(w));
		}
	}

	return true;
}

bool PoolDatabase::get_pool_config(const std::string& pool_id, PoolConfig& out_config)
{
	std::vector<PoolConfig> pools;
	std::vector<Worker> workers;

	if (!load(pools, workers)) {
		return false;
	}

	for (PoolConfig& cfg : pools) {
		if (cfg.id == pool_id) {
			out_config = std::move(cfg);
			return true;
		}
	}

	LOGWARN(1, "pool " << pool_id << " not found in " << m_filename);
	return false;
}

bool PoolDatabase::get_workers_for_pools(const std::vector<std::string>& pool_ids, std::vector<Worker>& out_workers)
{
	out_workers.clear();

	std::vector<PoolConfig> pools;
	std::vector<Worker> workers;

	if (!load(pools, workers)) {
		return false;
	}

	for (Worker& w : workers) {
		if (std::find(pool_ids.begin(), pool_ids.end(), w.pool_id) != pool_ids.end()) {
			out_workers.emplace_back(std::move(w));
		}
	}

	return true;
}

bool PoolDatabase::get_pool_ids(std::vector<std::string>& out_pool_ids)
{
	out_pool_ids.clear();

	std::vector<PoolConfig> pools;
	std::vector<Worker> workers;

	if (!load(pools, workers)) {
		return false;
	}

	out_pool_ids.reserve(pools.size());
	for (const PoolConfig& cfg : pools) {
		out_pool_ids.push_back(cfg.id);
	}

	return true;
}

} // namespace coinpool
