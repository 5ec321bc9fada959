/* Xfer: Core
 * Copyright 2026 The Xfer Authors
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */


#include "xfer/transport/bounded_channel.hpp"
#include <gtest/gtest.h>
#include <boost/thread/thread.hpp>
#include <boost/chrono.hpp>
#include <atomic>
#include <memory>

namespace xfer::transport::test
{

namespace
{
using Int_ptr = std::unique_ptr<int>;
using Channel = Bounded_channel<Int_ptr>;
} // namespace (anon)

TEST(Bounded_channel_test, Fifo_and_capacity)
{
  Channel channel(2);
  EXPECT_EQ(channel.capacity(), 2u);
  EXPECT_TRUE(channel.try_push(std::make_unique<int>(1)));
  EXPECT_TRUE(channel.try_push(std::make_unique<int>(2)));

  auto third = std::make_unique<int>(3);
  EXPECT_FALSE(channel.try_push(std::move(third)));
  ASSERT_TRUE(third) << "A rejected payload must be left untouched.";
  EXPECT_EQ(channel.size(), 2u);

  auto first = channel.try_pop();
  ASSERT_TRUE(first);
  EXPECT_EQ(**first, 1);
  EXPECT_TRUE(channel.try_push(std::move(third)));

  EXPECT_EQ(**channel.try_pop(), 2);
  EXPECT_EQ(**channel.try_pop(), 3);
  EXPECT_FALSE(channel.try_pop());
}

TEST(Bounded_channel_test, Push_blocks_while_full)
{
  Channel channel(1);
  ASSERT_TRUE(channel.push(std::make_unique<int>(1)));

  std::atomic<bool> pushed(false);
  boost::thread pusher([&]()
  {
    EXPECT_TRUE(channel.push(std::make_unique<int>(2)));
    pushed = true;
  });

  boost::this_thread::sleep_for(boost::chrono::milliseconds(100));
  EXPECT_FALSE(pushed) << "Capacity 1 is taken; the second push must wait for a pop.";

  EXPECT_EQ(**channel.try_pop(), 1);
  pusher.join();
  EXPECT_TRUE(pushed);
  EXPECT_EQ(**channel.try_pop(), 2);
}

TEST(Bounded_channel_test, Close_wakes_pushers_and_keeps_items)
{
  Channel channel(1);
  ASSERT_TRUE(channel.push(std::make_unique<int>(1)));

  std::atomic<bool> push_result(true);
  boost::thread pusher([&]()
  {
    auto payload = std::make_unique<int>(2);
    push_result = channel.push(std::move(payload));
    EXPECT_TRUE(payload) << "A rejected payload must be left untouched.";
  });

  boost::this_thread::sleep_for(boost::chrono::milliseconds(50));
  channel.close();
  pusher.join();

  EXPECT_FALSE(push_result);
  EXPECT_TRUE(channel.closed());
  EXPECT_FALSE(channel.push(std::make_unique<int>(3)));

  // Already-queued item survives closing.
  auto item = channel.try_pop();
  ASSERT_TRUE(item);
  EXPECT_EQ(**item, 1);
  EXPECT_FALSE(channel.try_pop());
}

TEST(Bounded_channel_test, Notifier)
{
  Channel channel(4);
  int notified = 0;
  channel.set_notifier([&]() { ++notified; });

  channel.push(std::make_unique<int>(1));
  channel.try_push(std::make_unique<int>(2));
  EXPECT_EQ(notified, 2);

  channel.try_pop(); // No notification on pop.
  EXPECT_EQ(notified, 2);

  channel.close();
  channel.close(); // Idempotent; notifies once.
  EXPECT_EQ(notified, 3);

  EXPECT_FALSE(channel.try_push(std::make_unique<int>(3)));
  EXPECT_EQ(notified, 3);
}

} // namespace xfer::transport::test
