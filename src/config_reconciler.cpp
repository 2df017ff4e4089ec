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
#include "config_reconciler.h"
#include "coin_daemon.h"

LOG_CATEGORY(ConfigReconciler)

namespace coinpool {

bool reconcile(const PoolConfig* old_config, const PoolConfig& new_config, ReconcilePlan& plan)
{
	plan = ReconcilePlan();

	const CoinDaemonType* new_type = find_coin_daemon_type(new_config.pool_type);
	if (!new_type) {
		LOGERR(1, "pool " << new_config.id << ": unknown pool type \"" << new_config.pool_type << "\", no coin daemon is registered for it");
		return false;
	}

	plan.daemon_type = new_type;

	const int32_t old_port = old_config ? old_config->port : 0;
	const int32_t new_port = new_config.port;

	plan.old_port = old_port;
	plan.new_port = new_port;

	if (old_port == new_port) {
		plan.listener = ReconcilePlan::ListenerAction::None;
	}
	else if (old_port == 0) {
		plan.listener = ReconcilePlan::ListenerAction::Start;
	}
	else if (new_port == 0) {
		plan.listener = ReconcilePlan::ListenerAction::Stop;
	}
	else {
		plan.listener = ReconcilePlan::ListenerAction::StopThenStart;
	}

	if (!old_config) {
		plan.daemon = ReconcilePlan::DaemonAction::Start;
	}
	else if ((find_coin_daemon_type(old_config->pool_type) == new_type) && (old_config->coin_daemon_config == new_config.coin_daemon_config)) {
		plan.daemon = ReconcilePlan::DaemonAction::None;
	}
	else {
		plan.daemon = ReconcilePlan::DaemonAction::StopThenStart;
	}

	LOGINFO(5, "pool " << new_config.id << ": listener " << plan.listener << " (" << old_port << " -> " << new_port << "), daemon " << plan.daemon);
	return true;
}

} // namespace coinpool
