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
#include "uv_util.h"
#include "gtest/gtest.h"

namespace coinpool {

TEST(util, scope_guard)
{
	int n = 0;
	{
		ON_SCOPE_LEAVE([&n]() { ++n; });
		ASSERT_EQ(n, 0);
	}
	ASSERT_EQ(n, 1);
}

TEST(util, callback)
{
	int n = 0;

	Callback<int, int>::Base* cb = new Callback<int, int>::Derived<std::function<int(int)>>([&n](int k) { n += k; return n; });

	ASSERT_EQ((*cb)(2), 2);
	ASSERT_EQ((*cb)(3), 5);

	delete cb;
}

TEST(util, array_size)
{
	const char data[17] = {};
	ASSERT_EQ(array_size(data), 17U);
}

TEST(util, call_on_loop)
{
	uv_loop_t loop{};
	ASSERT_EQ(uv_loop_init(&loop), 0);

	// Without loop user data there is no way to call anything on this loop
	ASSERT_FALSE(CallOnLoop(&loop, []() {}));

	GetLoopUserData(&loop);

	int n = 0;
	ASSERT_TRUE(CallOnLoop(&loop, [&n]() { ++n; }));
	ASSERT_TRUE(CallOnLoop(&loop, [&n]() { n *= 10; }));
	ASSERT_EQ(n, 0);

	uv_run(&loop, UV_RUN_NOWAIT);
	ASSERT_EQ(n, 10);

	DeleteLoopUserData(&loop);
	uv_run(&loop, UV_RUN_DEFAULT);
	ASSERT_EQ(uv_loop_close(&loop), 0);
}

TEST(util, seconds_since_epoch)
{
	const uint64_t t1 = seconds_since_epoch();
	const uint64_t t2 = seconds_since_epoch();
	ASSERT_GE(t2, t1);
}

}
