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

/// @file
#include "xfer/transport/error.hpp"
#include "xfer/util/util_fwd.hpp"

namespace xfer::transport::error
{

// Types.

/**
 * The boost.system category for errors returned by the xfer::transport module itself.  Think of it as the
 * polymorphic counterpart of error::Code, and it kicks in when, for `Error_code ec`, something
 * like `ec.message()` is invoked.
 *
 * Note that this class's declaration is not available outside this translation unit (.cpp
 * file), and its logic is accessed indirectly through standard boost.system machinery
 * (`Error_code::name()` and `Error_code::message()`).
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns a `static` string representing this `error_category` (which,
   * for example, shows up in the `ostream` representation of any Category-belonging #Error_code).
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        Error code of a Category error (realistically, a #Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_ILLEGAL_STATE => `"ILLEGAL_STATE"`.
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

/**
 * The boost.system category for per-transfer engine results (`CURLcode`).  Messages are exactly libcurl's.
 * Only this translation unit knows the class; the outside world uses engine_category().
 */
class Engine_category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Engine_category.
  static const Engine_category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns `"xfer/curl"`.
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: returns `curl_easy_strerror(CURLcode(val))`.
   *
   * @param val
   *        A `CURLcode` value cast to `int`.
   * @return See above.
   */
  std::string message(int val) const override;

private:
  // Constructors.

  /// Boring constructor.
  explicit Engine_category();
}; // class Engine_category

/// Like Engine_category but for multiplexer-level results (`CURLMcode`).
class Engine_multi_category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Engine_multi_category.
  static const Engine_multi_category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns `"xfer/curl-multi"`.
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: returns `curl_multi_strerror(CURLMcode(val))`.
   *
   * @param val
   *        A `CURLMcode` value cast to `int`.
   * @return See above.
   */
  std::string message(int val) const override;

private:
  // Constructors.

  /// Boring constructor.
  explicit Engine_multi_category();
}; // class Engine_multi_category

// Static initializations.

const Category Category::S_CATEGORY;
const Engine_category Engine_category::S_CATEGORY;
const Engine_multi_category Engine_multi_category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  /* Assign Category as the category for transport::error::Code-cast error_codes;
   * this basically glues together Category::name()/message() with the Code enum. */
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Error_code make_engine_error_code(CURLcode curl_code)
{
  if (curl_code == CURLE_OK)
  {
    return Error_code();
  }
  // else
  return Error_code(static_cast<int>(curl_code), Engine_category::S_CATEGORY);
}

Error_code make_engine_multi_error_code(CURLMcode curl_multi_code)
{
  if (curl_multi_code == CURLM_OK)
  {
    return Error_code();
  }
  // else
  return Error_code(static_cast<int>(curl_multi_code), Engine_multi_category::S_CATEGORY);
}

const boost::system::error_category& engine_category()
{
  return Engine_category::S_CATEGORY;
}

const boost::system::error_category& engine_multi_category()
{
  return Engine_multi_category::S_CATEGORY;
}

bool is_engine_error(const Error_code& err_code)
{
  return err_code
         && ((err_code.category() == Engine_category::S_CATEGORY)
             || (err_code.category() == Engine_multi_category::S_CATEGORY)
             || (err_code == Code::S_ENGINE_INIT_FAILED));
}

bool is_channel_error(const Error_code& err_code)
{
  return (err_code == Code::S_CHANNEL_SEND_FAILED) || (err_code == Code::S_CHANNEL_RECEIVE_FAILED);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "xfer/transport";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_CHANNEL_SEND_FAILED:
    return "Could not submit request: the request channel is closed, so the worker is unreachable.";
  case Code::S_CHANNEL_RECEIVE_FAILED:
    return "Could not obtain reply: the reply sender was destroyed without sending, as the worker dropped "
           "the request.";
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments outside its documented contract.";
  case Code::S_ILLEGAL_STATE:
    return "User called an API on an object whose state does not allow it (e.g., moved-from or already consumed).";
  case Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER:
    return "Async completion handler is being called prematurely, because underlying object is shutting down, "
           "as user desires.";
  case Code::S_ENGINE_INIT_FAILED:
    return "Transfer engine could not be initialized: global init, transfer handle or multiplexer creation failed.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_CHANNEL_SEND_FAILED:
    return "CHANNEL_SEND_FAILED";
  case Code::S_CHANNEL_RECEIVE_FAILED:
    return "CHANNEL_RECEIVE_FAILED";
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case Code::S_ILLEGAL_STATE:
    return "ILLEGAL_STATE";
  case Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER:
    return "OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER";
  case Code::S_ENGINE_INIT_FAILED:
    return "ENGINE_INIT_FAILED";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

Engine_category::Engine_category() = default;

const char* Engine_category::name() const noexcept // Virtual.
{
  return "xfer/curl";
}

std::string Engine_category::message(int val) const // Virtual.
{
  // libcurl returns a static string, even for values it does not know ("Unknown error").
  return curl_easy_strerror(static_cast<CURLcode>(val));
}

Engine_multi_category::Engine_multi_category() = default;

const char* Engine_multi_category::name() const noexcept // Virtual.
{
  return "xfer/curl-multi";
}

std::string Engine_multi_category::message(int val) const // Virtual.
{
  return curl_multi_strerror(static_cast<CURLMcode>(val));
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace xfer::transport::error
