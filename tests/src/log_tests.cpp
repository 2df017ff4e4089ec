/*
 * This file is part of coinpool, a mining sub-pool host
 * Copyright (c) 2021-2024 SChernykh <https://github.com/SChernykh>
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
#include "rpc_request.h"
#include "config_reconciler.h"
#include "gtest/gtest.h"

namespace coinpool {

TEST(log, stream)
{
	constexpr int N = 63;

	char buf[N + 1] = {};
	log::Stream s(buf);

	for (int iter = 0; iter < 2; ++iter) {
		ASSERT_EQ(s.m_bufSize, N);

		for (int i = 0; i < N; ++i) {
			s << ' ';

			ASSERT_EQ(s.m_pos, i + 1);
			ASSERT_EQ(s.m_spilled, 0);
		}

		s << ' ';

		ASSERT_EQ(s.m_pos, N);
		ASSERT_EQ(s.m_spilled, 1);

		for (int i = 0; i < N; ++i) {
			ASSERT_EQ(buf[i], ' ');
		}

		ASSERT_EQ(buf[N], '\0');

		s.reset(buf, N + 1);
	}
}

TEST(log, pad_right)
{
	constexpr int N = 63;

	char buf[N + 1] = {};
	log::Stream s(buf);

	s << log::pad_right('1', N);

	ASSERT_EQ(s.m_pos, N);
	ASSERT_EQ(s.m_spilled, 0);

	ASSERT_EQ(buf[0], '1');

	for (int i = 1; i < N; ++i) {
		ASSERT_EQ(buf[i], ' ');
	}

	ASSERT_EQ(buf[N], '\0');
}

template<typename T>
void check_number(T value)
{
	constexpr size_t N = 64;

	char buf[N];
	memset(buf, -1, N);
	log::Stream s(buf);
	s << value << '\0';

	ASSERT_EQ(buf, std::to_string(value));
}

TEST(log, numbers)
{
	for (int32_t i = -1024; i <= 1024; ++i) {
		check_number<int32_t>(i);
		check_number<int64_t>(i);

		if (i >= 0) {
			check_number<uint32_t>(static_cast<uint32_t>(i));
			check_number<uint64_t>(static_cast<uint64_t>(i));
		}
	}

	check_number<int32_t>(std::numeric_limits<int32_t>::min());
	check_number<int64_t>(std::numeric_limits<int64_t>::min());
	check_number<int64_t>(std::numeric_limits<int64_t>::max());
	check_number<uint64_t>(std::numeric_limits<uint64_t>::max());
}

template<typename T>
static std::string to_log_string(T value)
{
	char buf[64] = {};
	log::Stream s(buf);
	s << value << '\0';
	return buf;
}

TEST(log, enums)
{
	ASSERT_EQ(to_log_string(RpcResult::Status::Ok), "ok");
	ASSERT_EQ(to_log_string(RpcResult::Status::MethodNotFound), "method not found");
	ASSERT_EQ(to_log_string(RpcResult::Status::NotImplemented), "not implemented");

	ASSERT_EQ(to_log_string(ReconcilePlan::ListenerAction::StopThenStart), "stop then start");
	ASSERT_EQ(to_log_string(ReconcilePlan::ListenerAction::Stop), "stop");
	ASSERT_EQ(to_log_string(ReconcilePlan::DaemonAction::None), "none");
}

}
