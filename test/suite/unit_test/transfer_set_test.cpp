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


#include "xfer/transport/sync_io/transfer_set.hpp"
#include "xfer/transport/transfer_builder.hpp"
#include "xfer/transport/bridge.hpp"
#include "xfer/test/test_logger.hpp"
#include "xfer/test/test_http_server.hpp"
#include "xfer/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <boost/chrono.hpp>
#include <map>
#include <algorithm>

namespace xfer::transport::test
{

namespace
{
using error::Code;
using sync_io::Transfer_set;
using xfer::test::Test_logger;
using xfer::test::Test_http_server;
using xfer::test::get_test_suite_name;

/* Builds a GET transfer without submitting it.  The Bridge only serves as the builder's destination; its Worker
 * never sees the Transfer. */
Transfer make_get(const Bridge& bridge, const std::string& url)
{
  return Transfer_builder<Building>(bridge).url(url).timeout(boost::chrono::seconds(10)).finalize().release();
}

} // namespace (anon)

TEST(Transfer_set_test, Transfer_basics)
{
  Test_logger logger;

  Transfer null_transfer;
  EXPECT_TRUE(null_transfer.null());
  EXPECT_EQ(null_transfer.native_handle(), nullptr);
  Error_code err_code;
  null_transfer.response_code(&err_code);
  EXPECT_EQ(err_code, Error_code(Code::S_ILLEGAL_STATE));
  EXPECT_TRUE(null_transfer.take_body().empty());

  Transfer transfer(&logger);
  ASSERT_FALSE(transfer.null());
  EXPECT_NE(transfer.native_handle(), nullptr);
  EXPECT_TRUE(transfer.sink().empty());
  EXPECT_EQ(transfer.response_code(), 0) << "Nothing was performed.";

  const auto handle = transfer.native_handle();
  Transfer moved(std::move(transfer));
  EXPECT_TRUE(transfer.null());
  EXPECT_EQ(moved.native_handle(), handle);
}

TEST(Transfer_set_test, Add_and_remove_errors)
{
  Test_logger logger;
  Transfer_set transfers(&logger, get_test_suite_name());
  EXPECT_TRUE(transfers.empty());

  Error_code err_code;
  transfers.add(Transfer(), &err_code);
  EXPECT_EQ(err_code, Error_code(Code::S_INVALID_ARGUMENT));
  EXPECT_TRUE(transfers.empty());

  const auto removed = transfers.remove(12345, &err_code);
  EXPECT_EQ(err_code, Error_code(Code::S_INVALID_ARGUMENT));
  EXPECT_TRUE(removed.null());

  EXPECT_THROW(transfers.remove(12345), flow::error::Runtime_error);
}

TEST(Transfer_set_test, Forced_removal)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name());

  Transfer_set transfers(&logger, get_test_suite_name());
  const auto id = transfers.add(make_get(bridge, server.url("/delay/5000")));
  EXPECT_TRUE(transfers.contains(id));
  EXPECT_EQ(transfers.size(), 1u);
  transfers.drive();

  // Not complete; removal aborts it and gives it back intact.
  auto transfer = transfers.remove(id);
  EXPECT_FALSE(transfer.null());
  EXPECT_FALSE(transfers.contains(id));
  EXPECT_TRUE(transfers.empty());
}

TEST(Transfer_set_test, Multiplexing)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name());

  Transfer_set transfers(&logger, get_test_suite_name());
  const auto id_a = transfers.add(make_get(bridge, server.url("/echo/a")));
  const auto id_b = transfers.add(make_get(bridge, server.url("/echo/b")));
  ASSERT_NE(id_a, id_b);

  std::map<Transfer_id, Error_code> results;
  const bool done = xfer::test::wait_until([&]() -> bool
  {
    transfers.drive();
    transfers.drain_completions([&](Transfer_id id, const Error_code& result)
    {
      EXPECT_EQ(results.count(id), 0u) << "Each completion is reported once.";
      results[id] = result;
    });
    const auto wait = transfers.suggested_wait();
    transfers.wait(wait ? std::min(*wait, util::Fine_duration(boost::chrono::milliseconds(50)))
                        : util::Fine_duration(boost::chrono::milliseconds(50)));
    return results.size() == 2;
  }, boost::chrono::seconds(10), boost::chrono::milliseconds(1));
  ASSERT_TRUE(done);

  EXPECT_FALSE(results[id_a]);
  EXPECT_FALSE(results[id_b]);
  EXPECT_EQ(transfers.size(), 2u) << "Completed transfers stay registered until removed.";

  auto a = transfers.remove(id_a);
  auto b = transfers.remove(id_b);
  EXPECT_TRUE(transfers.empty());
  EXPECT_EQ(a.response_code(), 200);
  EXPECT_EQ(b.response_code(), 200);
  EXPECT_EQ(std::string(a.sink().str()), "a");
  EXPECT_EQ(std::string(b.sink().str()), "b");
}

TEST(Transfer_set_test, Perform_blocking)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name());

  auto transfer = make_get(bridge, server.url("/async-test"));
  Error_code err_code;
  sync_io::perform_blocking(&logger, &transfer, &err_code);
  EXPECT_FALSE(err_code) << err_code.message();
  ASSERT_FALSE(transfer.null());
  EXPECT_EQ(transfer.response_code(), 200);
  EXPECT_EQ(transfer.content_type(), "application/json");
  EXPECT_EQ(transfer.effective_url(), server.url("/async-test"));
  EXPECT_GE(transfer.total_time(), util::Fine_duration::zero());

  const auto body = transfer.take_body();
  EXPECT_EQ(std::string(body.begin(), body.end()), Test_http_server::S_ASYNC_TEST_BODY);
  EXPECT_TRUE(transfer.sink().empty());
  EXPECT_EQ(server.request_count(), 1u);
}

TEST(Transfer_set_test, Perform_blocking_engine_error)
{
  Test_logger logger;
  Bridge bridge(&logger, get_test_suite_name());

  auto transfer = Transfer_builder<Building>(bridge).url("http://127.0.0.1:1/")
                    .connect_timeout(boost::chrono::seconds(5)).finalize().release();
  Error_code err_code;
  sync_io::perform_blocking(&logger, &transfer, &err_code);
  ASSERT_TRUE(err_code);
  EXPECT_TRUE(error::is_engine_error(err_code));
  EXPECT_FALSE(transfer.null()) << "The transfer comes back even on failure.";
  EXPECT_FALSE(transfer.engine_error_detail().empty());
}

} // namespace xfer::transport::test
