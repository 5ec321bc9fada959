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

#include "xfer/transport/transfer.hpp"
#include <boost/unordered_map.hpp>
#include <boost/noncopyable.hpp>
#include <map>
#include <optional>

namespace xfer::transport::sync_io
{

// Types.

/**
 * The engine's multiplexer (a libcurl multi handle, `CURLM*`): holds any number of registered Transfer objects and
 * advances all of them with one non-blocking call, reporting which have completed and with what result.
 * This is a `sync_io`-pattern object: it starts no threads and performs no blocking calls, except wait(), which
 * exists for callers that own a blocking-safe thread (see perform_blocking()).  Its owner drives it.
 *
 * The usage cycle:
 *   -# add() a Transfer: it is now registered and owned by `*this`.  You get a Transfer_id for it.
 *   -# drive() repeatedly, pausing for up to suggested_wait() in between (the pausing is up to you).
 *   -# After each drive(), drain_completions(): for each completed Transfer, your callback receives its Transfer_id
 *      and the outcome.  Call remove() to get the Transfer back (from within the callback or later).
 *   -# remove() may also be invoked on a not-yet-completed Transfer: that aborts it (forced removal).
 *
 * Once completed, a Transfer is not advanced any further by drive(), and its completion is reported exactly once.
 *
 * ### Thread safety ###
 * None.  In practice all access to a given Transfer_set is from one thread (thread W of the owning Worker).
 */
class Transfer_set :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /**
   * Callback type for drain_completions().  `result` is success or a `"xfer/curl"` category error.
   * The callback may call remove() on `id` (or on any Transfer_id).
   */
  using Completion_func = Function<void (Transfer_id id, const Error_code& result)>;

  // Constructors/destructor.

  /**
   * Creates the multiplexer, with nothing registered.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ENGINE_INIT_FAILED.  On error all other methods emit error::Code::S_ILLEGAL_STATE.
   */
  explicit Transfer_set(flow::log::Logger* logger_ptr, util::String_view nickname_str, Error_code* err_code = 0);

  /// Aborts (removes) and destroys any still-registered Transfer objects; then destroys the multiplexer.
  ~Transfer_set();

  // Methods.

  /**
   * Limits connections the multiplexer may open: `CURLMOPT_MAX_TOTAL_CONNECTIONS` and
   * `CURLMOPT_MAX_HOST_CONNECTIONS`.  0 means unlimited.
   *
   * @param max_total
   *        Limit over all hosts.
   * @param max_per_host
   *        Limit per host.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ILLEGAL_STATE, `"xfer/curl-multi"` category errors.
   */
  void set_max_connections(long max_total, long max_per_host, Error_code* err_code = 0);

  /**
   * Registers the given Transfer, which `*this` takes over, and returns its ID.
   *
   * @param transfer
   *        Live Transfer.  It is moved-from on success; untouched on failure, so the caller may give it back
   *        to its originator.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ILLEGAL_STATE (`*this` unusable), error::Code::S_INVALID_ARGUMENT (`transfer` is null),
   *        `"xfer/curl-multi"` category errors.
   * @return ID, unique over the lifetime of `*this`; 0 on failure.
   */
  Transfer_id add(Transfer&& transfer, Error_code* err_code = 0);

  /**
   * Advances all registered, not-yet-completed transfers as far as possible without blocking.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ILLEGAL_STATE, `"xfer/curl-multi"` category errors.  The latter is not a failure of
   *        any particular Transfer; the caller decides what to do about the registered ones.
   * @return Number of registered transfers not yet completed.  On error: size().
   */
  size_t drive(Error_code* err_code = 0);

  /**
   * How long the engine suggests to wait before the next drive(), assuming no socket activity; or none, if the
   * engine has no opinion (typically: nothing registered).
   *
   * @param err_code
   *        See drive().
   * @return See above.
   */
  std::optional<util::Fine_duration> suggested_wait(Error_code* err_code = 0);

  /**
   * Blocks until there is activity on a registered transfer's socket, or until `max_wait` (or sooner, if the engine
   * wants to be driven sooner).  Unlike everything else here this blocks; do not call it from a thread
   * shared with unrelated async work.
   *
   * @param max_wait
   *        Upper bound on the blocking.
   * @param err_code
   *        See drive().
   */
  void wait(util::Fine_duration max_wait, Error_code* err_code = 0);

  /**
   * Reports every transfer that completed since the last call, in no particular order, each exactly once.
   *
   * @param on_completion_func
   *        Invoked synchronously for each completed transfer.
   * @return Number of invocations of `on_completion_func`.
   */
  size_t drain_completions(const Completion_func& on_completion_func);

  /**
   * Unregisters the given Transfer and gives it back.  If it had not completed, it is aborted.
   *
   * @param id
   *        Value returned by add().
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (`id` is not registered), `"xfer/curl-multi"` category errors.
   *        The Transfer is given back even in the latter case.
   * @return The Transfer; null if `id` is not registered.
   */
  Transfer remove(Transfer_id id, Error_code* err_code = 0);

  /**
   * Number of registered transfers, completed or not.
   * @return See above.
   */
  size_t size() const;

  /**
   * `size() == 0`.
   * @return See above.
   */
  bool empty() const;

  /**
   * Whether `id` is registered.
   *
   * @param id
   *        ID.
   * @return See above.
   */
  bool contains(Transfer_id id) const;

  /**
   * Nickname as passed to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// The multiplexer.  Null if and only if construction failed.
  CURLM* m_multi;

  /// Next add() shall return this.
  Transfer_id m_next_id;

  /// Registered transfers.
  std::map<Transfer_id, Transfer> m_transfers;

  /// Reverse of #m_transfers, as the engine reports completions by handle.
  boost::unordered_map<CURL*, Transfer_id> m_ids_by_handle;
}; // class Transfer_set

// Free functions.

/**
 * Drives one Transfer to completion on the calling thread, blocking until it completes.  This is the
 * single-request-blocking way to perform a transfer: it uses a private Transfer_set, so it needs no Bridge; but it
 * occupies the calling thread for the transfer's duration.  Therefore call it only from a thread dedicated to
 * blocking work, never from a thread shared with unrelated async work.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param transfer
 *        Live Transfer.  On return it is the same Transfer, completed or not, now holding its response.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        `"xfer/curl"` category errors (the transfer failed), others as emitted by Transfer_set.
 */
void perform_blocking(flow::log::Logger* logger_ptr, Transfer* transfer, Error_code* err_code = 0);

} // namespace xfer::transport::sync_io
