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


#include "xfer/transport/bridge.hpp"
#include "xfer/transport/transfer_builder.hpp"
#include "xfer/test/test_logger.hpp"
#include "xfer/test/test_http_server.hpp"
#include "xfer/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <boost/thread/thread.hpp>
#include <boost/thread/future.hpp>
#include <boost/chrono.hpp>
#include <atomic>
#include <optional>
#include <vector>
#include <string>

namespace xfer::transport::test
{

namespace
{
using error::Code;
using xfer::test::Test_logger;
using xfer::test::Test_http_server;
using xfer::test::get_test_suite_name;
using xfer::test::wait_until;
using boost::chrono::seconds;
using boost::chrono::milliseconds;

Reply_receiver get(const Bridge& bridge, const std::string& url)
{
  return Transfer_builder<Building>(bridge).url(url).timeout(seconds(20)).finalize().perform();
}

} // namespace (anon)

TEST(Bridge_test, Two_concurrent_gets)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name());

  auto receiver1 = get(bridge, server.url("/async-test"));
  auto receiver2 = get(bridge, server.url("/async-test"));

  for (auto* receiver : { &receiver1, &receiver2 })
  {
    Error_code err_code;
    auto transfer = receiver->get(&err_code);
    ASSERT_FALSE(err_code) << err_code.message();
    EXPECT_EQ(transfer.response_code(), 200);
    EXPECT_EQ(std::string(transfer.sink().str()), Test_http_server::S_ASYNC_TEST_BODY);
  }
  EXPECT_EQ(server.request_count(), 2u);
}

TEST(Bridge_test, No_cross_talk_between_copies)
{
  constexpr size_t S_N_THREADS = 8;
  constexpr size_t S_N_PER_THREAD = 4;

  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name());

  std::atomic<size_t> n_ok(0);
  std::vector<boost::thread> threads;
  for (size_t thread_idx = 0; thread_idx != S_N_THREADS; ++thread_idx)
  {
    threads.emplace_back([&, thread_idx]()
    {
      const Bridge bridge_copy(bridge);
      std::vector<std::pair<std::string, Reply_receiver>> receivers;
      for (size_t idx = 0; idx != S_N_PER_THREAD; ++idx)
      {
        const auto text = "t" + std::to_string(thread_idx) + "r" + std::to_string(idx);
        receivers.emplace_back(text, get(bridge_copy, server.url("/echo/" + text)));
      }
      for (auto& text_and_receiver : receivers)
      {
        Error_code err_code;
        auto transfer = text_and_receiver.second.get(&err_code);
        EXPECT_FALSE(err_code) << err_code.message();
        EXPECT_EQ(transfer.response_code(), 200);
        EXPECT_EQ(std::string(transfer.sink().str()), text_and_receiver.first);
        if ((!err_code) && (std::string(transfer.sink().str()) == text_and_receiver.first))
        {
          ++n_ok;
        }
      }
    });
  }
  for (auto& thread : threads)
  {
    thread.join();
  }

  EXPECT_EQ(n_ok, S_N_THREADS * S_N_PER_THREAD);
  EXPECT_EQ(bridge.use_count(), 1) << "Every copy went away with its thread.";
}

TEST(Bridge_test, Cancel_one_of_several)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name());

  auto slow = get(bridge, server.url("/delay/2000"));
  auto fast1 = get(bridge, server.url("/echo/one"));
  auto fast2 = get(bridge, server.url("/echo/two"));

  slow.cancel();
  EXPECT_TRUE(slow.null());

  EXPECT_EQ(std::string(fast1.get().sink().str()), "one");
  EXPECT_EQ(std::string(fast2.get().sink().str()), "two");

  // The Worker is still healthy after the cancellation.
  EXPECT_EQ(std::string(get(bridge, server.url("/echo/three")).get().sink().str()), "three");
}

TEST(Bridge_test, Drop_receiver_mid_flight)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name());

  {
    auto doomed = get(bridge, server.url("/delay/3000"));
    // Let it get registered and going.
    ASSERT_TRUE(wait_until([&]() -> bool { return server.request_count() == 1; }, seconds(10)));
  } // Destroying the receiver cancels.

  const auto start = flow::Fine_clock::now();
  EXPECT_EQ(std::string(get(bridge, server.url("/echo/after")).get().sink().str()), "after");
  EXPECT_LT(flow::Fine_clock::now() - start, util::Fine_duration(seconds(3)))
    << "The other transfer must not wait behind the canceled one.";
}

TEST(Bridge_test, Unreachable_host)
{
  Test_logger logger;
  Bridge bridge(&logger, get_test_suite_name());

  const auto start = flow::Fine_clock::now();
  auto receiver = Transfer_builder<Building>(bridge).url("http://127.0.0.1:1/")
                    .connect_timeout(seconds(5)).finalize().perform();
  Error_code err_code;
  auto transfer = receiver.get(&err_code);

  ASSERT_TRUE(err_code);
  EXPECT_TRUE(error::is_engine_error(err_code)) << err_code << ' ' << err_code.message();
  EXPECT_FALSE(error::is_channel_error(err_code));
  EXPECT_FALSE(transfer.null()) << "Engine errors give the transfer back for inspection.";
  EXPECT_LT(flow::Fine_clock::now() - start, util::Fine_duration(seconds(10)));
}

TEST(Bridge_test, Http_error_status_is_not_an_engine_error)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name());

  Error_code err_code;
  auto transfer = get(bridge, server.url("/status/404")).get(&err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(transfer.response_code(), 404);

  transfer = Transfer_builder<Building>(bridge).url(server.url("/status/500")).fail_on_error(true).finalize()
               .perform().get(&err_code);
  EXPECT_EQ(err_code, error::make_engine_error_code(CURLE_HTTP_RETURNED_ERROR));
}

TEST(Bridge_test, Async_submit)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name());

  std::atomic<int> n_done(0);
  std::string body;
  bool in_worker_thread = false;
  const auto caller_id = boost::this_thread::get_id();

  Transfer_builder<Building>(bridge).url(server.url("/async-test")).finalize()
    .async_perform([&](const Error_code& err_code, Transfer&& transfer)
  {
    EXPECT_FALSE(err_code);
    body = std::string(transfer.sink().str());
    in_worker_thread = boost::this_thread::get_id() != caller_id;

    // Submitting from the handler (thread W) must not deadlock.
    Transfer_builder<Building>(bridge).url(server.url("/echo/chained")).finalize()
      .async_perform([&](const Error_code& chained_err_code, Transfer&& chained)
    {
      EXPECT_FALSE(chained_err_code);
      EXPECT_EQ(std::string(chained.sink().str()), "chained");
      ++n_done;
    });
    ++n_done;
  });

  ASSERT_TRUE(wait_until([&]() -> bool { return n_done == 2; }, seconds(10)));
  EXPECT_EQ(body, Test_http_server::S_ASYNC_TEST_BODY);
  EXPECT_TRUE(in_worker_thread);
}

TEST(Bridge_test, Async_submit_never_blocks)
{
  Test_logger logger;
  Test_http_server server(&logger);

  // The first handler holds thread W, so nothing drains the queue until it is released.
  boost::promise<void> release;
  auto released = release.get_future();
  std::atomic<bool> w_held(false);
  std::atomic<int> n_done(0);
  Bridge bridge(&logger, get_test_suite_name()); // Request queue capacity 1.

  Transfer_builder<Building>(bridge).url(server.url("/echo/first")).finalize()
    .async_perform([&](const Error_code& err_code, Transfer&&)
  {
    EXPECT_FALSE(err_code);
    w_held = true;
    released.wait();
    ++n_done;
  });
  ASSERT_TRUE(wait_until([&]() -> bool { return w_held; }, seconds(10)));

  std::atomic<int> n_submitted(0);
  boost::thread submitter([&]()
  {
    for (int idx = 0; idx != 3; ++idx)
    {
      Transfer_builder<Building>(bridge).url(server.url("/echo/" + std::to_string(idx))).finalize()
        .async_perform([&, idx](const Error_code& err_code, Transfer&& transfer)
      {
        EXPECT_FALSE(err_code);
        EXPECT_EQ(std::string(transfer.sink().str()), std::to_string(idx));
        ++n_done;
      });
      ++n_submitted;
    }
  });

  // All 3 return while the queue is full and W is still held.
  EXPECT_TRUE(wait_until([&]() -> bool { return n_submitted == 3; }, seconds(5)));
  EXPECT_TRUE(w_held);
  EXPECT_EQ(n_done, 0);

  release.set_value();
  submitter.join();
  EXPECT_TRUE(wait_until([&]() -> bool { return n_done == 4; }, seconds(10)));
}

TEST(Bridge_test, Invalid_config)
{
  Test_logger logger;

  Bridge_config config;
  config.m_request_queue_capacity = 0;
  Error_code err_code;
  Bridge bridge(&logger, get_test_suite_name(), config, &err_code);
  EXPECT_EQ(err_code, Error_code(Code::S_INVALID_ARGUMENT));

  // Unusable, but safely so.
  auto transfer = get(bridge, "http://127.0.0.1:1/").get(&err_code);
  EXPECT_EQ(err_code, Error_code(Code::S_CHANNEL_SEND_FAILED));
  EXPECT_FALSE(transfer.null());

  config = Bridge_config();
  config.m_poll_slice = util::Fine_duration::zero();
  EXPECT_THROW({ Bridge bad(&logger, get_test_suite_name(), config); }, flow::error::Runtime_error);

  config = Bridge_config();
  config.m_max_host_connections = -1;
  EXPECT_THROW({ Bridge bad(&logger, get_test_suite_name(), config); }, flow::error::Runtime_error);
}

TEST(Bridge_test, Connection_limits_and_deep_queue)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge_config config;
  config.m_request_queue_capacity = 16;
  config.m_max_total_connections = 2;
  config.m_max_host_connections = 1;
  Bridge bridge(&logger, get_test_suite_name(), config);
  EXPECT_EQ(bridge.config().m_max_host_connections, 1);

  std::vector<Reply_receiver> receivers;
  for (int idx = 0; idx != 6; ++idx)
  {
    receivers.emplace_back(get(bridge, server.url("/echo/" + std::to_string(idx))));
  }
  for (int idx = 0; idx != 6; ++idx)
  {
    EXPECT_EQ(std::string(receivers[idx].get().sink().str()), std::to_string(idx));
  }
}

TEST(Bridge_test, Destructor_awaits_drain)
{
  Test_logger logger;
  Test_http_server server(&logger);

  std::optional<Error_code> result;
  long status = 0;
  Reply_receiver receiver;
  {
    Bridge bridge(&logger, get_test_suite_name());
    receiver = get(bridge, server.url("/delay/300"));
    Transfer_builder<Building>(bridge).url(server.url("/delay/300")).finalize()
      .async_perform([&](const Error_code& err_code, Transfer&& transfer)
    {
      result = err_code;
      status = transfer.response_code();
    });
  } // Last copy gone: waits for both.

  ASSERT_TRUE(result);
  EXPECT_FALSE(*result);
  EXPECT_EQ(status, 200);
  ASSERT_TRUE(receiver.ready());
  EXPECT_EQ(std::string(receiver.get().sink().str()), "delayed");
}

TEST(Bridge_test, Copies_share_and_moved_from_fails)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name());
  EXPECT_EQ(bridge.use_count(), 1);

  Bridge copy(bridge);
  EXPECT_EQ(bridge.use_count(), 2);
  EXPECT_EQ(copy.nickname(), bridge.nickname());

  Bridge moved(std::move(copy));
  EXPECT_EQ(moved.use_count(), 2);
  EXPECT_EQ(copy.use_count(), 0);

  Error_code err_code;
  auto transfer = get(copy, server.url("/echo/x")).get(&err_code);
  EXPECT_EQ(err_code, Error_code(Code::S_CHANNEL_SEND_FAILED));
  EXPECT_FALSE(transfer.null());
  EXPECT_EQ(server.request_count(), 0u);

  std::optional<Error_code> async_result;
  copy.async_submit(std::move(transfer), [&](const Error_code& async_err_code, Transfer&&)
  {
    async_result = async_err_code;
  });
  ASSERT_TRUE(async_result);
  EXPECT_EQ(*async_result, Error_code(Code::S_CHANNEL_SEND_FAILED));

  EXPECT_EQ(std::string(get(moved, server.url("/echo/y")).get().sink().str()), "y");
}

TEST(Bridge_test, Dedicated_workers)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge1(&logger, "one");
  Bridge bridge2(&logger, "two");

  auto slow = get(bridge1, server.url("/delay/500"));
  auto fast = get(bridge2, server.url("/echo/fast"));
  EXPECT_EQ(std::string(fast.get().sink().str()), "fast");
  EXPECT_EQ(std::string(slow.get().sink().str()), "delayed");
}

} // namespace xfer::transport::test
