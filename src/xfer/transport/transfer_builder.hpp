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

#include "xfer/transport/bridge.hpp"
#include <string>
#include <vector>

namespace xfer::transport
{

// Types.

/// Tag: Transfer_builder state in which options may be set.  See Transfer_builder<Building>.
struct Building {};

/// Tag: Transfer_builder state in which the Transfer may be performed.  See Transfer_builder<Finalized>.
struct Finalized {};

/**
 * Builds, finalizes and performs one Transfer via a Bridge; the state is part of the type.  Only the two explicit
 * specializations exist:
 *   - Transfer_builder<Building>: option setters and finalize().  No perform().
 *   - Transfer_builder<Finalized>: perform() and async_perform().  No setters.
 *
 * So performing a not-yet-finalized Transfer, or configuring a finalized one, does not compile.  The only
 * transition is `finalize() &&`, which consumes the Building builder.
 *
 * Typical use:
 *
 *   ~~~
 *   auto reply = Transfer_builder<Building>(bridge)
 *                  .url("http://127.0.0.1:8080/async-test")
 *                  .get(true)
 *                  .finalize()
 *                  .perform();
 *   Error_code err_code;
 *   auto transfer = reply.get(&err_code);
 *   ~~~
 *
 * @tparam State
 *         Building or Finalized.
 */
template<typename State>
class Transfer_builder;

/**
 * Transfer_builder state that configures the Transfer.  Each setter is a thin passthrough to one engine option.
 *
 * ### Error reporting; sticky error ###
 * Each setter takes the customary trailing `Error_code* err_code`: see `flow::Error_code` docs for error reporting
 * semantics.  Additionally the first failure *sticks*: from then on every setter does nothing but report that same
 * error; finalize() carries it over; and Transfer_builder<Finalized>::perform() delivers it without ever submitting.
 * Hence, in non-throwing use, one may ignore the individual setters' results and check only the final outcome.
 * Setter errors are `"xfer/curl"` category errors, or error::Code::S_ILLEGAL_STATE on a moved-from builder.
 *
 * All setters are `&&`-qualified: invoke them on a temporary, chaining, or on `std::move(builder)`.
 */
template<>
class Transfer_builder<Building> :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Creates the Transfer (engine handle), with the given sink, destined for the given Bridge.
   *
   * @param bridge
   *        The Transfer will be submitted here.  The builder holds a copy (sharing the Worker).
   * @param sink
   *        Receives the response body.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated: as Transfer ctor.
   *        The error also sticks.
   */
  explicit Transfer_builder(const Bridge& bridge, Response_sink&& sink = Response_sink(), Error_code* err_code = 0);

  /**
   * Move-constructs.
   * @param src
   *        Moved-from; it then holds a null Transfer.
   */
  Transfer_builder(Transfer_builder&& src);

  // Methods.

  /**
   * Leaves the Building state.  The resulting builder holds the Transfer, the Bridge and the sticky error (if any).
   * @return See above.
   */
  Transfer_builder<Finalized> finalize() &&;

  /**
   * The sticky error; falsy if all went well so far.
   * @return See above.
   */
  const Error_code& sticky_err_code() const;

  // Setters: request.

  /**
   * `CURLOPT_URL`.
   * @param url
   *        URL.
   * @param err_code
   *        See class doc header.
   * @return `std::move(*this)`.
   */
  Transfer_builder&& url(util::String_view url, Error_code* err_code = 0) &&;

  /**
   * `CURLOPT_PORT`: overrides the URL's port.
   * @param port
   *        Port.
   * @param err_code
   *        See class doc header.
   * @return `std::move(*this)`.
   */
  Transfer_builder&& port(uint16_t port, Error_code* err_code = 0) &&;

  /**
   * `CURLOPT_HTTPGET`.
   * @param enable
   *        Whether to do a GET.
   * @param err_code
   *        See class doc header.
   * @return `std::move(*this)`.
   */
  Transfer_builder&& get(bool enable, Error_code* err_code = 0) &&;

  /**
   * `CURLOPT_POST`.
   * @param enable
   *        Whether to do a POST.
   * @param err_code
   *        See class doc header.
   * @return `std::move(*this)`.
   */
  Transfer_builder&& post(bool enable, Error_code* err_code = 0) &&;

  /**
   * `CURLOPT_POSTFIELDSIZE_LARGE` then `CURLOPT_COPYPOSTFIELDS`: the request body, copied (the blob need not
   * outlive the call).  Implies POST.
   *
   * @param body
   *        Body.
   * @param err_code
   *        See class doc header.
   * @return `std::move(*this)`.
   */
  Transfer_builder&& post_fields_copy(const util::Blob_const& body, Error_code* err_code = 0) &&;

  /**
   * `CURLOPT_CUSTOMREQUEST`: e.g., `"PUT"`, `"DELETE"`.
   * @param method
   *        Method.
   * @param err_code
   *        See class doc header.
   * @return `std::move(*this)`.
   */
  Transfer_builder&& custom_request(util::String_view method, Error_code* err_code = 0) &&;

  /**
   * `CURLOPT_NOBODY`: e.g., for HEAD.
   * @param enable
   *        Whether to skip the body.
   * @param err_code
   *        See class doc header.
   * @return `std::move(*this)`.
   */
  Transfer_builder&& nobody(bool enable, Error_code* err_code = 0) &&;

  /**
   * `CURLOPT_HTTPHEADER`: replaces the custom request headers.
   * @param headers
   *        Lines such as `"Accept: application/json"`.
   * @param err_code
   *        See class doc header.
   * @return `std::move(*this)`.
   */
  Transfer_builder&& http_headers(const std::vector<std::string>& headers, Error_code* err_code = 0) &&;

  /// `CURLOPT_USERAGENT`.  See url() for the parameters.
  Transfer_builder&& user_agent(util::String_view agent, Error_code* err_code = 0) &&;

  /// `CURLOPT_REFERER`.  See url() for the parameters.
  Transfer_builder&& referer(util::String_view referer, Error_code* err_code = 0) &&;

  /// `CURLOPT_ACCEPT_ENCODING`; empty means all encodings the engine supports.  See url() for the parameters.
  Transfer_builder&& accept_encoding(util::String_view encoding, Error_code* err_code = 0) &&;

  // Setters: behavior.

  /// `CURLOPT_FOLLOWLOCATION`.  See get() for the parameters.
  Transfer_builder&& follow_location(bool enable, Error_code* err_code = 0) &&;

  /**
   * `CURLOPT_MAXREDIRS`.
   * @param max
   *        Max redirections to follow; -1 for unlimited.  Less than -1 is an error.
   * @param err_code
   *        See class doc header.
   * @return `std::move(*this)`.
   */
  Transfer_builder&& max_redirections(long max, Error_code* err_code = 0) &&;

  /**
   * `CURLOPT_TIMEOUT_MS`: limit on the whole transfer.
   * @param timeout
   *        Limit; zero means none.
   * @param err_code
   *        See class doc header.
   * @return `std::move(*this)`.
   */
  Transfer_builder&& timeout(util::Fine_duration timeout, Error_code* err_code = 0) &&;

  /// `CURLOPT_CONNECTTIMEOUT_MS`.  See timeout() for the parameters.
  Transfer_builder&& connect_timeout(util::Fine_duration timeout, Error_code* err_code = 0) &&;

  /**
   * `CURLOPT_LOW_SPEED_LIMIT`: see low_speed_time().
   * @param bytes_per_sec
   *        Speed below which the transfer is considered too slow.  Negative is an error.
   * @param err_code
   *        See class doc header.
   * @return `std::move(*this)`.
   */
  Transfer_builder&& low_speed_limit(long bytes_per_sec, Error_code* err_code = 0) &&;

  /**
   * `CURLOPT_LOW_SPEED_TIME`: abort if slower than low_speed_limit() for this long (second resolution).
   * @param period
   *        Period.
   * @param err_code
   *        See class doc header.
   * @return `std::move(*this)`.
   */
  Transfer_builder&& low_speed_time(util::Fine_duration period, Error_code* err_code = 0) &&;

  /// `CURLOPT_VERBOSE`: the engine writes protocol chatter to stderr.  See get() for the parameters.
  Transfer_builder&& verbose(bool enable, Error_code* err_code = 0) &&;

  /// `CURLOPT_FAILONERROR`: a response status >= 400 becomes an engine error.  See get() for the parameters.
  Transfer_builder&& fail_on_error(bool enable, Error_code* err_code = 0) &&;

  // Setters: TLS.

  /// `CURLOPT_SSL_VERIFYPEER`.  See get() for the parameters.
  Transfer_builder&& ssl_verify_peer(bool enable, Error_code* err_code = 0) &&;

  /// `CURLOPT_SSL_VERIFYHOST` (2 if enabled, else 0).  See get() for the parameters.
  Transfer_builder&& ssl_verify_host(bool enable, Error_code* err_code = 0) &&;

  /// `CURLOPT_CAINFO`: CA bundle path.  See url() for the parameters.
  Transfer_builder&& cainfo(util::String_view path, Error_code* err_code = 0) &&;

  // Setters: connection.

  /// `CURLOPT_PROXY`.  See url() for the parameters.
  Transfer_builder&& proxy(util::String_view proxy_url, Error_code* err_code = 0) &&;

  /// `CURLOPT_PROXYPORT`.  See port() for the parameters.
  Transfer_builder&& proxy_port(uint16_t port, Error_code* err_code = 0) &&;

  /// `CURLOPT_NOPROXY`: comma-separated hosts to reach directly.  See url() for the parameters.
  Transfer_builder&& noproxy(util::String_view hosts, Error_code* err_code = 0) &&;

  /// `CURLOPT_UNIX_SOCKET_PATH`: connect via this Unix domain socket instead.  See url() for the parameters.
  Transfer_builder&& unix_socket(util::String_view path, Error_code* err_code = 0) &&;

  // Setters: authentication.

  /// `CURLOPT_USERNAME`.  See url() for the parameters.
  Transfer_builder&& username(util::String_view name, Error_code* err_code = 0) &&;

  /// `CURLOPT_PASSWORD`.  See url() for the parameters.
  Transfer_builder&& password(util::String_view password, Error_code* err_code = 0) &&;

private:
  // Types.

  /// Applies one or more options to #m_transfer, writing the result to the arg.
  using Setter_func = Function<void (Error_code* err_code)>;

  // Methods.

  /**
   * Runs the setter unless there is a sticky error; records any new error as sticky; reports per
   * `flow::Error_code` conventions.
   *
   * @param setter_func
   *        Setter.
   * @param err_code
   *        See class doc header.
   * @param context
   *        For the exception message.
   */
  void apply(const Setter_func& setter_func, Error_code* err_code, const char* context);

  /**
   * Helper for string options.
   * @param option
   *        Option.
   * @param value
   *        Value (copied by the engine).
   * @param err_code
   *        See class doc header.
   * @param context
   *        See apply().
   */
  void apply_string(CURLoption option, util::String_view value, Error_code* err_code, const char* context);

  /**
   * Helper for `long` options.
   * @param option
   *        Option.
   * @param value
   *        Value.
   * @param err_code
   *        See class doc header.
   * @param context
   *        See apply().
   */
  void apply_long(CURLoption option, long value, Error_code* err_code, const char* context);

  // Data.

  /// The destination.
  Bridge m_bridge;

  /// See sticky_err_code().  Precedes #m_transfer, whose construction may write it.
  Error_code m_sticky_err_code;

  /// What we build.
  Transfer m_transfer;
}; // class Transfer_builder<Building>

/**
 * Transfer_builder state that performs the Transfer: move-only result of Transfer_builder<Building>::finalize().
 * No options can be set anymore.
 */
template<>
class Transfer_builder<Finalized> :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Move-constructs.
   * @param src
   *        Moved-from; it then holds a null Transfer.
   */
  Transfer_builder(Transfer_builder&& src);

  // Methods.

  /**
   * Submits the Transfer via the Bridge (Bridge::submit()); or, if there is a sticky error, returns a receiver
   * already resolved to that error (and the Transfer), submitting nothing.
   *
   * @return See above.
   */
  Reply_receiver perform() &&;

  /**
   * Like perform() but via Bridge::async_submit().  With a sticky error the handler runs synchronously, before this
   * returns.
   *
   * @param on_done_func
   *        Handler.
   */
  void async_perform(Bridge::On_done_func&& on_done_func) &&;

  /**
   * Gives up the Transfer without submitting it, for use outside any Bridge: with sync_io::perform_blocking() or a
   * Transfer_set of one's own.  Options cannot be set on it any further either way.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated: the sticky error,
   *        if any.  In that case the Transfer is still returned (unless an exception is thrown instead).
   * @return See above.
   */
  Transfer release(Error_code* err_code = 0) &&;

  /**
   * The sticky error carried over from Transfer_builder<Building>.
   * @return See above.
   */
  const Error_code& sticky_err_code() const;

private:
  // Friends.

  /// The only way to create us: finalize().
  friend class Transfer_builder<Building>;

  // Constructors.

  /**
   * Used by finalize().
   * @param bridge
   *        Destination.
   * @param transfer
   *        The Transfer.
   * @param sticky_err_code
   *        The sticky error.
   */
  explicit Transfer_builder(Bridge&& bridge, Transfer&& transfer, const Error_code& sticky_err_code);

  // Data.

  /// The destination.
  Bridge m_bridge;

  /// What we perform.
  Transfer m_transfer;

  /// See sticky_err_code().
  Error_code m_sticky_err_code;
}; // class Transfer_builder<Finalized>

} // namespace xfer::transport
