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

class ICoinDaemon;

// One entry per supported pool type, the pool type string in the pool config selects it
struct CoinDaemonType
{
	const char* pool_type;
	int32_t default_rpc_port;
	ICoinDaemon* (*create)(const CoinDaemonType& type, const std::string& pool_id, const std::string& config);
};

const CoinDaemonType* find_coin_daemon_type(const std::string& pool_type);
void print_coin_daemon_types();

class ICoinDaemon
{
public:
	// Returns nullptr if the config is not valid for this daemon type
	static ICoinDaemon* create(const CoinDaemonType& type, const std::string& pool_id, const std::string& config) noexcept;
	virtual ~ICoinDaemon() {}

	virtual const CoinDaemonType& type() const = 0;
	virtual void print_status() const = 0;
};

class CoinDaemonJSON_RPC : public ICoinDaemon
{
public:
	CoinDaemonJSON_RPC(const CoinDaemonType& type, const std::string& pool_id, const std::string& config);
	~CoinDaemonJSON_RPC() override;

	const CoinDaemonType& type() const override { return m_type; }
	void print_status() const override;

	const std::string& host() const { return m_host; }
	int32_t port() const { return m_port; }
	const std::string& user() const { return m_user; }

private:
	const CoinDaemonType& m_type;
	std::string m_poolId;

	std::string m_host;
	int32_t m_port;
	std::string m_user;
	std::string m_pass;
};

} // namespace coinpool
