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
#include "coin_daemon.h"
#include "json_parsers.h"

LOG_CATEGORY(CoinDaemon)

namespace coinpool {

static ICoinDaemon* create_json_rpc_daemon(const CoinDaemonType& type, const std::string& pool_id, const std::string& config)
{
	return new CoinDaemonJSON_RPC(type, pool_id, config);
}

static const CoinDaemonType coin_daemon_types[] = {
	{ "btc", 8332, create_json_rpc_daemon },
	{ "ltc", 9332, create_json_rpc_daemon },
};

const CoinDaemonType* find_coin_daemon_type(const std::string& pool_type)
{
	for (const CoinDaemonType& t : coin_daemon_types) {
		if (pool_type == t.pool_type) {
			return &t;
		}
	}
	return nullptr;
}

void print_coin_daemon_types()
{
	for (const CoinDaemonType& t : coin_daemon_types) {
		LOGINFO(0, log::pad_right(t.pool_type, 8) << "default RPC port " << t.default_rpc_port);
	}
}

ICoinDaemon* ICoinDaemon::create(const CoinDaemonType& type, const std::string& pool_id, const std::string& config) noexcept
{
	try {
		return type.create(type, pool_id, config);
	}
	catch (const std::exception&) {
		LOGERR(1, "Failed to create " << type.pool_type << " coin daemon for pool " << pool_id);
	}
	return nullptr;
}

CoinDaemonJSON_RPC::CoinDaemonJSON_RPC(const CoinDaemonType& type, const std::string& pool_id, const std::string& config)
	: m_type(type)
	, m_poolId(pool_id)
	, m_port(type.default_rpc_port)
{
	rapidjson::Document doc;
	if (doc.Parse(config.c_str(), config.length()).HasParseError() || !doc.IsObject()) {
		LOGERR(1, "pool " << pool_id << ": coin daemon config is not a JSON object");
		throw std::exception();
	}

	if (!parseValue(doc, "host", m_host) || m_host.empty()) {
		LOGERR(1, "pool " << pool_id << ": coin daemon host is not set");
		throw std::exception();
	}

	if (doc.HasMember("port") && (!parseValue(doc, "port", m_port) || (m_port <= 0) || (m_port > MAX_PORT))) {
		LOGERR(1, "pool " << pool_id << ": invalid coin daemon port");
		throw std::exception();
	}

	parseValue(doc, "user", m_user);
	parseValue(doc, "pass", m_pass);

	LOGINFO(1, "pool " << pool_id << ": " << type.pool_type << " daemon at " << log::Gray() << m_host << ':' << m_port);
}

CoinDaemonJSON_RPC::~CoinDaemonJSON_RPC()
{
	LOGINFO(1, "pool " << m_poolId << ": " << m_type.pool_type << " daemon at " << m_host << ':' << m_port << " released");
}

void CoinDaemonJSON_RPC::print_status() const
{
	LOGINFO(0, "pool " << m_poolId << ": " << m_type.pool_type << " daemon " << m_host << ':' << m_port << (m_user.empty() ? "" : ", RPC login ") << m_user);
}

} // namespace coinpool
