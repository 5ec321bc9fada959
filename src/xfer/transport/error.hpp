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
#pragma once

#include "xfer/common.hpp"
#include <curl/curl.h>

/**
 * Namespace containing the xfer::transport module's extension of boost.system error conventions.  There are three
 * error categories in play, and together they form the module's error taxonomy:
 *   - `"xfer/transport"`: error::Code.  The bridge/channel layer.  Notably Code::S_CHANNEL_SEND_FAILED
 *     (the worker is unreachable: request channel closed) and Code::S_CHANNEL_RECEIVE_FAILED (the reply sender
 *     was destroyed without sending).
 *   - `"xfer/curl"`: a per-transfer engine failure, the value being a libcurl `CURLcode` (DNS failure, connection
 *     refused, TLS failure, ...).  See make_engine_error_code().
 *   - `"xfer/curl-multi"`: a multiplexer-level engine failure, the value being a libcurl `CURLMcode`.
 *     See make_engine_multi_error_code().
 *
 * Use is_engine_error() and is_channel_error() to tell which layer failed without caring about the exact value.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace xfer::transport::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by xfer::transport functions/methods *outside of*
 * engine-reported errors (see make_engine_error_code()) and system errors.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message() and its
 * symbol (minus the `S_`) to Category::code_symbol().  Add it to the end, ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Could not submit request: the request channel is closed, so the worker is unreachable.
  S_CHANNEL_SEND_FAILED = S_CODE_LOWEST_INT_VALUE,

  /// Could not obtain reply: the reply sender was destroyed without sending, as the worker dropped the request.
  S_CHANNEL_RECEIVE_FAILED,

  /// User called an API with 1 or more arguments outside its documented contract.
  S_INVALID_ARGUMENT,

  /// User called an API on an object whose state does not allow it (e.g., moved-from or already consumed).
  S_ILLEGAL_STATE,

  /// Async completion handler is being called prematurely, because underlying object is shutting down, as user desires.
  S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER,

  /// Transfer engine could not be initialized: global init, transfer handle or multiplexer creation failed.
  S_ENGINE_INIT_FAILED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Creates an #Error_code in the `"xfer/curl"` category from a per-transfer engine result.
 * `CURLE_OK` yields a success (falsy) #Error_code.  The message comes from `curl_easy_strerror()`.
 *
 * @param curl_code
 *        Result of a `curl_easy_*()` call or of a completed transfer.
 * @return See above.
 */
Error_code make_engine_error_code(CURLcode curl_code);

/**
 * Creates an #Error_code in the `"xfer/curl-multi"` category from a multiplexer-level engine result.
 * `CURLM_OK` yields a success (falsy) #Error_code.  The message comes from `curl_multi_strerror()`.
 *
 * @param curl_multi_code
 *        Result of a `curl_multi_*()` call.
 * @return See above.
 */
Error_code make_engine_multi_error_code(CURLMcode curl_multi_code);

/**
 * The `"xfer/curl"` category.
 * @return See above.
 */
const boost::system::error_category& engine_category();

/**
 * The `"xfer/curl-multi"` category.
 * @return See above.
 */
const boost::system::error_category& engine_multi_category();

/**
 * Returns `true` if and only if `err_code` is a failure reported by the transfer engine: either category above or
 * Code::S_ENGINE_INIT_FAILED.
 *
 * @param err_code
 *        Any #Error_code.
 * @return See above.
 */
bool is_engine_error(const Error_code& err_code);

/**
 * Returns `true` if and only if `err_code` is Code::S_CHANNEL_SEND_FAILED or Code::S_CHANNEL_RECEIVE_FAILED.
 *
 * @param err_code
 *        Any #Error_code.
 * @return See above.
 */
bool is_channel_error(const Error_code& err_code);

/**
 * Deserializes a transport::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "CHANNEL_SEND_FAILED" (or "channel_send_failed" or...) for Code::S_CHANNEL_SEND_FAILED.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a transport::error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator: Code::S_CHANNEL_SEND_FAILED => `"CHANNEL_SEND_FAILED"`.  To print an #Error_code storing
 * a Code, continue to do the standard thing (output the #Error_code plus its `.message()`).
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace xfer::transport::error

namespace boost::system
{

// Types.

/**
 * Specialization that authorizes boost.system to make `enum` `Code` convertible to `Error_code`.
 * This is the official way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::xfer::transport::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
