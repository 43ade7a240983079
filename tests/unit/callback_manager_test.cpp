/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2024-2025, kcenon
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are met:

1. Redistributions of source code must retain the above copyright notice, this
   list of conditions and the following disclaimer.

2. Redistributions in binary form must reproduce the above copyright notice,
   this list of conditions and the following disclaimer in the documentation
   and/or other materials provided with the distribution.

3. Neither the name of the copyright holder nor the names of its
   contributors may be used to endorse or promote products derived from
   this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*****************************************************************************/

#include "netkit/utils/callback_manager.h"
#include <gtest/gtest.h>

#include <functional>
#include <string>

using netkit::utils::callback_manager;

/**
 * @file callback_manager_test.cpp
 * @brief Unit tests for thread-safe callback slots
 */

namespace
{
	using int_callback = std::function<void(int)>;
	using text_callback = std::function<void(const std::string&)>;
	using manager = callback_manager<int_callback, text_callback>;
} // namespace

class CallbackManagerTest : public ::testing::Test
{
};

TEST_F(CallbackManagerTest, EmptySlotIsNotInvoked)
{
	manager callbacks;

	EXPECT_FALSE(callbacks.invoke<0>(1));
	EXPECT_FALSE(static_cast<bool>(callbacks.get<1>()));
}

TEST_F(CallbackManagerTest, LatestRegistrationWins)
{
	manager callbacks;
	int first = 0;
	int second = 0;

	callbacks.set<0>([&first](int n) { first += n; });
	callbacks.set<0>([&second](int n) { second += n; });

	EXPECT_TRUE(callbacks.invoke<0>(5));
	EXPECT_EQ(first, 0);
	EXPECT_EQ(second, 5);
}

TEST_F(CallbackManagerTest, SlotsAreIndependent)
{
	manager callbacks;
	std::string seen;

	callbacks.set<1>([&seen](const std::string& text) { seen = text; });

	EXPECT_FALSE(callbacks.invoke<0>(1));
	EXPECT_TRUE(callbacks.invoke<1>(std::string("hello")));
	EXPECT_EQ(seen, "hello");
}

TEST_F(CallbackManagerTest, CallbackMayReRegister)
{
	manager callbacks;
	int calls = 0;

	callbacks.set<0>([&](int) {
		++calls;
		callbacks.set<0>(nullptr);
	});

	EXPECT_TRUE(callbacks.invoke<0>(0));
	EXPECT_FALSE(callbacks.invoke<0>(0));
	EXPECT_EQ(calls, 1);
}

TEST_F(CallbackManagerTest, AssignFromCopiesEverySlot)
{
	manager source;
	manager target;
	int total = 0;

	source.set<0>([&total](int n) { total += n; });
	target.set<1>([](const std::string&) {});
	target.assign_from(source);

	EXPECT_TRUE(target.invoke<0>(3));
	EXPECT_EQ(total, 3);
	EXPECT_FALSE(static_cast<bool>(target.get<1>()));
}

TEST_F(CallbackManagerTest, ClearEmptiesSlots)
{
	manager callbacks;
	callbacks.set<0>([](int) {});

	callbacks.clear();

	EXPECT_FALSE(callbacks.invoke<0>(1));
}
