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

#include "xfer/transport/response_sink.hpp"
#include "xfer/transport/error.hpp"
#include <flow/log/log.hpp>
#include <flow/error/error.hpp>
#include <boost/move/unique_ptr.hpp>
#include <curl/curl.h>
#include <string>
#include <vector>

namespace xfer::transport
{

// Types.

/**
 * One configured transfer: a libcurl easy handle (`CURL*`) plus the Response_sink into which the engine writes the
 * response body, plus the auxiliary storage the handle points into (request header list, error-detail buffer).
 * It is the unit of ownership that moves end-to-end: from Transfer_builder, into a Request, into the worker's
 * sync_io::Transfer_set, back out inside the reply, and finally to the caller.
 *
 * ### Ownership and state ###
 * Move-only; never aliased.  A Transfer is either *null* (default-constructed, moved-from, or failed construction
 * with non-null `err_code`) or *live* (owns a handle).  Only live Transfers can be configured or submitted; on null
 * ones the accessors emit error::Code::S_ILLEGAL_STATE.
 *
 * Options are settable only by Transfer_builder<Building> (befriended); hence once a Transfer leaves the builder no
 * further option can be set.  The result accessors (response_code(), effective_url(), ...) are meant to be used after
 * completion, when the Transfer is back in the caller's hands.
 *
 * Internally the handle's storage is heap-allocated once (#m_state) so that the pointers the engine holds
 * (`CURLOPT_WRITEDATA`, `CURLOPT_ERRORBUFFER`, `CURLOPT_HTTPHEADER`) remain valid across moves.
 *
 * ### Thread safety ###
 * None: a given Transfer is only ever touched by one thread at a time, as ownership moves.
 */
class Transfer :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /// Constructs null Transfer.
  Transfer();

  /**
   * Constructs live Transfer: creates the engine handle and binds it to the given sink.
   * Also sets the options needed for multithreaded use of the engine (no signals).
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param sink
   *        Response sink; moved-into `*this`.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ENGINE_INIT_FAILED; `"xfer/curl"` category errors (setting the base options).
   *        On error `*this` is null.
   */
  explicit Transfer(flow::log::Logger* logger_ptr, Response_sink&& sink = Response_sink(), Error_code* err_code = 0);

  /**
   * Move-constructs; `src` becomes null.
   * @param src
   *        Moved-from object.
   */
  Transfer(Transfer&& src);

  /// Disallow copying.
  Transfer(const Transfer&) = delete;

  /// Releases the engine handle and associated storage, if live.
  ~Transfer();

  // Methods.

  /**
   * Move-assigns; `src` becomes null; `*this`'s previous handle (if any) is released.
   * @param src
   *        Moved-from object.
   * @return `*this`.
   */
  Transfer& operator=(Transfer&& src);

  /// Disallow copying.
  Transfer& operator=(const Transfer&) = delete;

  /**
   * Whether `*this` is null (see class doc header).
   * @return See above.
   */
  bool null() const;

  /**
   * The native engine handle; null if null().  Use with care: do not touch it while the Transfer is registered in a
   * sync_io::Transfer_set.
   *
   * @return See above.
   */
  CURL* native_handle() const;

  /**
   * The sink holding the body received so far.
   * @return See above.  Behavior undefined if null().
   */
  const Response_sink& sink() const;

  /**
   * Moves the accumulated response body out of the sink.
   * @return See above.  Empty if null().
   */
  util::Bytes take_body();

  /**
   * Response status code (`CURLINFO_RESPONSE_CODE`); 0 if no response was received.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ILLEGAL_STATE (null()); `"xfer/curl"` category errors.
   * @return See above.
   */
  long response_code(Error_code* err_code = 0) const;

  /**
   * Last used URL (`CURLINFO_EFFECTIVE_URL`).
   *
   * @param err_code
   *        See response_code().
   * @return See above.
   */
  std::string effective_url(Error_code* err_code = 0) const;

  /**
   * Value of the response's Content-Type header (`CURLINFO_CONTENT_TYPE`); empty if none.
   *
   * @param err_code
   *        See response_code().
   * @return See above.
   */
  std::string content_type(Error_code* err_code = 0) const;

  /**
   * Total time of the previous transfer (`CURLINFO_TOTAL_TIME_T`).
   *
   * @param err_code
   *        See response_code().
   * @return See above.
   */
  util::Fine_duration total_time(Error_code* err_code = 0) const;

  /**
   * Human-readable detail the engine recorded for the latest failure (`CURLOPT_ERRORBUFFER`), often more specific
   * than the message of the corresponding `"xfer/curl"` #Error_code.  Empty if none or null().
   *
   * @return See above.
   */
  std::string engine_error_detail() const;

private:
  // Types.

  /// The heap-allocated storage; see class doc header.
  struct State;

  // Friends.

  /// It alone sets options.
  template<typename Builder_state>
  friend class Transfer_builder;

  // Methods.

  /**
   * Sets an engine option: `curl_easy_setopt(native_handle(), option, value)`.
   *
   * @tparam Value
   *         Type libcurl expects for `option`: `long`, `curl_off_t`, `const char*`, pointer or function pointer.
   * @param option
   *        Option.
   * @param value
   *        Value.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ILLEGAL_STATE (null()); `"xfer/curl"` category errors.
   */
  template<typename Value>
  void set_option(CURLoption option, Value value, Error_code* err_code = 0);

  /**
   * Replaces the request's custom headers (`CURLOPT_HTTPHEADER`); `*this` owns the list.
   *
   * @param headers
   *        Header lines such as `"Accept: application/json"`.  Empty means "no custom headers."
   * @param err_code
   *        See set_option().  Additionally error::Code::S_INVALID_ARGUMENT if the list cannot be built.
   */
  void set_headers(const std::vector<std::string>& headers, Error_code* err_code = 0);

  /**
   * Helper for accessors: `curl_easy_getinfo()`, mapping failures to #Error_code.
   *
   * @tparam Value
   *         Type libcurl writes for `info`.
   * @param info
   *        What to get.
   * @param value
   *        Where to write it.
   * @param err_code
   *        Non-null.
   */
  template<typename Value>
  void get_info(CURLINFO info, Value* value, Error_code* err_code) const;

  // Data.

  /// Null if and only if null().
  boost::movelib::unique_ptr<State> m_state;
}; // class Transfer

// Template implementations.

template<typename Value>
void Transfer::set_option(CURLoption option, Value value, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { set_option(option, value, actual_err_code); },
         err_code, "Transfer::set_option()"))
  {
    return;
  }
  // else

  if (null())
  {
    *err_code = error::Code::S_ILLEGAL_STATE;
    return;
  }
  // else

  *err_code = error::make_engine_error_code(curl_easy_setopt(native_handle(), option, value));
  if (*err_code)
  {
    FLOW_LOG_WARNING("Transfer [" << *this << "]: Setting option [" << int(option) << "] failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
  }
}

template<typename Value>
void Transfer::get_info(CURLINFO info, Value* value, Error_code* err_code) const
{
  if (null())
  {
    *err_code = error::Code::S_ILLEGAL_STATE;
    return;
  }
  // else
  *err_code = error::make_engine_error_code(curl_easy_getinfo(native_handle(), info, value));
}

} // namespace xfer::transport
