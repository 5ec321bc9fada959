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


#include "xfer/transport/transfer_builder.hpp"
#include "xfer/transport/bridge.hpp"
#include "xfer/test/test_logger.hpp"
#include "xfer/test/test_http_server.hpp"
#include "xfer/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <boost/chrono.hpp>
#include <optional>
#include <atomic>
#include <type_traits>

namespace xfer::transport::test
{

namespace
{
using error::Code;
using xfer::test::Test_logger;
using xfer::test::Test_http_server;
using xfer::test::get_test_suite_name;

template<typename Builder, typename = void>
struct Can_perform : std::false_type {};
template<typename Builder>
struct Can_perform<Builder, std::void_t<decltype(std::declval<Builder>().perform())>> : std::true_type {};

template<typename Builder, typename = void>
struct Can_set_url : std::false_type {};
template<typename Builder>
struct Can_set_url<Builder, std::void_t<decltype(std::declval<Builder>().url(util::String_view()))>> :
  std::true_type {};

template<typename Builder, typename = void>
struct Can_finalize : std::false_type {};
template<typename Builder>
struct Can_finalize<Builder, std::void_t<decltype(std::declval<Builder>().finalize())>> : std::true_type {};

} // namespace (anon)

TEST(Transfer_builder_test, Type_state)
{
  static_assert(!Can_perform<Transfer_builder<Building>>::value, "Building must not offer perform().");
  static_assert(Can_set_url<Transfer_builder<Building>>::value, "Building must offer setters.");
  static_assert(Can_finalize<Transfer_builder<Building>>::value, "Building must offer finalize().");

  static_assert(Can_perform<Transfer_builder<Finalized>>::value, "Finalized must offer perform().");
  static_assert(!Can_set_url<Transfer_builder<Finalized>>::value, "Finalized must not offer setters.");
  static_assert(!Can_finalize<Transfer_builder<Finalized>>::value, "Finalized must not go back.");

  // Setters and finalize() need an rvalue: a named builder cannot be reused by accident.
  static_assert(!Can_set_url<Transfer_builder<Building>&>::value, "Setters must be rvalue-only.");
  static_assert(!Can_perform<Transfer_builder<Finalized>&>::value, "perform() must be rvalue-only.");

  static_assert(!std::is_copy_constructible_v<Transfer_builder<Building>>);
  static_assert(!std::is_copy_constructible_v<Transfer_builder<Finalized>>);
  static_assert(!std::is_copy_constructible_v<Transfer>);
}

TEST(Transfer_builder_test, Get)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name());

  auto receiver = Transfer_builder<Building>(bridge)
                    .url(server.url("/async-test"))
                    .get(true)
                    .user_agent("xfer-test")
                    .http_headers({ "Accept: application/json" })
                    .timeout(boost::chrono::seconds(10))
                    .finalize()
                    .perform();
  Error_code err_code;
  auto transfer = receiver.get(&err_code);
  EXPECT_FALSE(err_code) << err_code.message();
  EXPECT_EQ(transfer.response_code(), 200);
  EXPECT_EQ(std::string(transfer.sink().str()), Test_http_server::S_ASYNC_TEST_BODY);
}

TEST(Transfer_builder_test, Post_fields_copy)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name());

  Transfer_builder<Finalized> finalized = [&]()
  {
    std::string body = "posted=1&x=y";
    auto building = Transfer_builder<Building>(bridge).url(server.url("/echo-body")).post(true)
                      .post_fields_copy(util::Blob_const(body.data(), body.size()));
    body.assign(body.size(), '!'); // The copy was taken; the original may now change or die.
    return std::move(building).finalize();
  }();

  auto transfer = std::move(finalized).perform().get();
  EXPECT_EQ(transfer.response_code(), 200);
  EXPECT_EQ(std::string(transfer.sink().str()), "posted=1&x=y");
}

TEST(Transfer_builder_test, Sticky_error)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name());

  Error_code err_code;
  auto building = Transfer_builder<Building>(bridge).url(server.url("/async-test"))
                    .max_redirections(-5, &err_code);
  EXPECT_EQ(err_code, error::make_engine_error_code(CURLE_BAD_FUNCTION_ARGUMENT));
  EXPECT_EQ(building.sticky_err_code(), err_code);

  // Later setters are no-ops that report the same error.
  Error_code later_err_code;
  auto still_building = std::move(building).follow_location(true, &later_err_code);
  EXPECT_EQ(later_err_code, err_code);

  auto finalized = std::move(still_building).finalize();
  EXPECT_EQ(finalized.sticky_err_code(), err_code);

  auto receiver = std::move(finalized).perform();
  EXPECT_TRUE(receiver.ready()) << "Resolved without involving the Worker.";
  Error_code result;
  const auto transfer = receiver.get(&result);
  EXPECT_EQ(result, err_code);
  EXPECT_FALSE(transfer.null());
  EXPECT_EQ(server.request_count(), 0u) << "Nothing may be submitted after a setter failed.";
}

TEST(Transfer_builder_test, Setter_throws_without_err_code)
{
  Test_logger logger;
  Bridge bridge(&logger, get_test_suite_name());

  EXPECT_THROW(Transfer_builder<Building>(bridge).max_redirections(-5), flow::error::Runtime_error);
}

TEST(Transfer_builder_test, Sticky_error_async)
{
  Test_logger logger;
  Bridge bridge(&logger, get_test_suite_name());

  Error_code err_code;
  auto finalized = Transfer_builder<Building>(bridge).low_speed_limit(10, &err_code)
                     .max_redirections(-2, &err_code).finalize();
  ASSERT_TRUE(finalized.sticky_err_code());

  std::optional<Error_code> result;
  std::move(finalized).async_perform([&](const Error_code& async_err_code, Transfer&&)
  {
    result = async_err_code;
  });
  ASSERT_TRUE(result) << "With a sticky error the handler runs before async_perform() returns.";
  EXPECT_EQ(*result, error::make_engine_error_code(CURLE_BAD_FUNCTION_ARGUMENT));

  Error_code release_err_code;
  auto released = Transfer_builder<Building>(bridge).max_redirections(-1, &release_err_code)
                    .max_redirections(-3, &release_err_code);
  EXPECT_TRUE(release_err_code);
  const auto transfer = std::move(released).finalize().release(&release_err_code);
  EXPECT_TRUE(release_err_code);
  EXPECT_FALSE(transfer.null());
}

TEST(Transfer_builder_test, Async_perform)
{
  Test_logger logger;
  Test_http_server server(&logger);
  Bridge bridge(&logger, get_test_suite_name());

  std::atomic<bool> done(false);
  long status = 0;
  std::string body;
  Transfer_builder<Building>(bridge).url(server.url("/echo/hello")).finalize()
    .async_perform([&](const Error_code& err_code, Transfer&& transfer)
  {
    EXPECT_FALSE(err_code);
    status = transfer.response_code();
    body = std::string(transfer.sink().str());
    done = true;
  });

  ASSERT_TRUE(xfer::test::wait_until([&]() -> bool { return done; }, boost::chrono::seconds(10)));
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body, "hello");
}

} // namespace xfer::transport::test
