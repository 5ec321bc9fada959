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



#include "xfer/transport/detail/worker.hpp"
#include "xfer/transport/transfer_builder.hpp"
#include "xfer/test/test_logger.hpp"
#include "xfer/test/test_http_server.hpp"
#include "xfer/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <boost/chrono.hpp>

namespace xfer::transport::test
{

namespace
{
using xfer::test::Test_logger;
using xfer::test::Test_http_server;
using xfer::test::get_test_suite_name;
using xfer::test::wait_until;
using boost::chrono::seconds;
using State = Worker::State;

/* Builds a GET request and connects it to `*receiver`.  The Bridge only serves as the builder's destination; the
 * request goes to the Worker under test. */
Request make_request(const Bridge& bridge, const std::string& url, Reply_receiver* receiver)
{
  Request request;
  request.m_transfer
    = Transfer_builder<Building>(bridge).url(url).timeout(seconds(20)).finalize().release();
  make_reply_channel(&request.m_reply, receiver);
  return request;
}

} // namespace (anon)

TEST(Worker_test, State_machine)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name() + "_builder");

  Worker::Request_channel channel(4);
  Worker worker(&logger, get_test_suite_name(), Bridge_config(), &channel);
  channel.set_notifier([&]() { worker.on_channel_event(); });

  EXPECT_EQ(worker.state(), State::S_IDLE);
  EXPECT_EQ(worker.registered_count(), 0u);
  EXPECT_FALSE(worker.in_worker_thread());

  // One transfer in flight: polling.
  Reply_receiver receiver;
  ASSERT_TRUE(channel.push(make_request(bridge, server.url("/delay/1000"), &receiver)));
  ASSERT_TRUE(wait_until([&]() -> bool
                           { return (worker.state() == State::S_DRAINING) && (worker.registered_count() == 1); },
                         seconds(5)));

  // Completed with the channel still open: back to idle, not stopped.
  Error_code err_code;
  auto transfer = receiver.get(&err_code);
  ASSERT_FALSE(err_code) << err_code.message();
  EXPECT_EQ(std::string(transfer.sink().str()), "delayed");
  EXPECT_TRUE(wait_until([&]() -> bool { return worker.state() == State::S_IDLE; }, seconds(5)));
  EXPECT_EQ(worker.registered_count(), 0u);

  // A canceled receiver gets its transfer swept out long before the server would answer.
  Reply_receiver canceled;
  ASSERT_TRUE(channel.push(make_request(bridge, server.url("/delay/5000"), &canceled)));
  ASSERT_TRUE(wait_until([&]() -> bool { return worker.registered_count() == 1; }, seconds(5)));
  canceled.cancel();
  EXPECT_TRUE(canceled.null());
  EXPECT_TRUE(wait_until([&]() -> bool { return worker.registered_count() == 0; }, seconds(2)));
  EXPECT_TRUE(wait_until([&]() -> bool { return worker.state() == State::S_IDLE; }, seconds(2)));

  // Closed and empty: final.
  channel.close();
  worker.await_stopped();
  EXPECT_EQ(worker.state(), State::S_STOPPED);
  EXPECT_EQ(worker.registered_count(), 0u);
}

TEST(Worker_test, Close_waits_for_registered)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name() + "_builder");

  Worker::Request_channel channel(4);
  Worker worker(&logger, get_test_suite_name(), Bridge_config(), &channel);
  channel.set_notifier([&]() { worker.on_channel_event(); });

  Reply_receiver receiver;
  ASSERT_TRUE(channel.push(make_request(bridge, server.url("/delay/300"), &receiver)));
  channel.close();
  EXPECT_NE(worker.state(), State::S_STOPPED) << "Nothing may stop while a transfer is outstanding.";

  worker.await_stopped();
  EXPECT_EQ(worker.state(), State::S_STOPPED);
  // The reply itself may still be in flight on thread W.
  Error_code err_code;
  auto transfer = receiver.get(&err_code);
  ASSERT_FALSE(err_code) << err_code.message();
  EXPECT_EQ(std::string(transfer.sink().str()), "delayed");
}

TEST(Worker_test, Posted_request_bypasses_channel)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name() + "_builder");

  Worker::Request_channel channel(1);
  Worker worker(&logger, get_test_suite_name(), Bridge_config(), &channel);
  channel.set_notifier([&]() { worker.on_channel_event(); });

  Reply_receiver receiver;
  worker.post_request(make_request(bridge, server.url("/echo/posted"), &receiver));
  EXPECT_EQ(channel.size(), 0u);

  Error_code err_code;
  auto transfer = receiver.get(&err_code);
  ASSERT_FALSE(err_code) << err_code.message();
  EXPECT_EQ(std::string(transfer.sink().str()), "posted");

  channel.close();
  worker.await_stopped();
  EXPECT_EQ(worker.state(), State::S_STOPPED);
}

} // namespace xfer::transport::test
