// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "thread/ThreadLocal.hxx"

#include <gtest/gtest.h>

#include <string>
#include <thread>

TEST(ThreadLocal, Basic)
{
	const ThreadLocal<int> value{"test.basic"};
	EXPECT_EQ(value.GetKey(), "test.basic");
	EXPECT_EQ(value.Get(), nullptr);
	EXPECT_FALSE(value.IsSet());

	value.Set(42);
	ASSERT_NE(value.Get(), nullptr);
	EXPECT_EQ(*value.Get(), 42);

	value.Set(7);
	EXPECT_EQ(*value.Get(), 7);

	value.Reset();
	EXPECT_EQ(value.Get(), nullptr);

	/* resetting twice is harmless */
	value.Reset();
	EXPECT_EQ(value.Get(), nullptr);
}

TEST(ThreadLocal, SharedKey)
{
	const ThreadLocal<std::string> a{"test.shared"};
	const ThreadLocal<std::string> b{"test.shared"};

	a.Set("hello");
	ASSERT_NE(b.Get(), nullptr);
	EXPECT_EQ(*b.Get(), "hello");

	b.Reset();
	EXPECT_EQ(a.Get(), nullptr);
}

TEST(ThreadLocal, TypeMismatch)
{
	const ThreadLocal<int> i{"test.type"};
	const ThreadLocal<std::string> s{"test.type"};

	i.Set(1);
	EXPECT_EQ(s.Get(), nullptr);

	s.Set("x");
	EXPECT_EQ(i.Get(), nullptr);
	ASSERT_NE(s.Get(), nullptr);

	i.Reset();
}

TEST(ThreadLocal, PerThread)
{
	const ThreadLocal<std::string> value{"test.thread"};
	value.Set("main");

	const std::string dummy;
	const std::string *seen = &dummy;
	std::string seen_after;

	std::thread thread([&]{
		seen = value.Get();
		value.Set("worker");
		seen_after = *value.Get();
	});
	thread.join();

	EXPECT_EQ(seen, nullptr);
	EXPECT_EQ(seen_after, "worker");

	ASSERT_NE(value.Get(), nullptr);
	EXPECT_EQ(*value.Get(), "main");

	value.Reset();
}
