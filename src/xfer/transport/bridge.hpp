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

#include "xfer/transport/reply_channel.hpp"
#include <boost/shared_ptr.hpp>
#include <boost/chrono.hpp>

namespace xfer::transport
{

// Types.

/**
 * Tuning knobs for a Bridge.  Defaults are sensible; most users leave them alone.
 * Aggregate; set members directly.
 */
struct Bridge_config
{
  // Data.

  /**
   * Max number of Request objects queued between Bridge::submit() and the Worker.  Must be positive.
   * With the default 1, a `submit()` returns no sooner than the Worker has dequeued the preceding Request, which
   * bounds memory under a flood of submissions.
   */
  size_t m_request_queue_capacity = 1;

  /// How long to wait between polls when the engine has no timeout to suggest.  Must be positive.
  util::Fine_duration m_default_wait = boost::chrono::seconds(2);

  /**
   * Upper bound on the wait between polls while anything is registered.  Must be positive.  Smaller means quicker
   * reaction to socket activity at the cost of more wakeups.
   */
  util::Fine_duration m_poll_slice = boost::chrono::milliseconds(10);

  /// `CURLMOPT_MAX_TOTAL_CONNECTIONS`; 0 = unlimited.
  long m_max_total_connections = 0;

  /// `CURLMOPT_MAX_HOST_CONNECTIONS`; 0 = unlimited.
  long m_max_host_connections = 0;
}; // struct Bridge_config

/**
 * The actor handle: submits Transfer objects to a background Worker, which performs them concurrently, many at once,
 * in one thread (thread W), and replies to each submitter individually.  No operation here blocks thread W;
 * the only suspension points are submit() itself (not async_submit()), when the request queue is full
 * (backpressure), and whatever awaiting of the returned Reply_receiver the caller chooses to do.
 *
 * ### Copies ###
 * Bridge is copyable (cheaply): copies share the one request queue and the one Worker.  Each construction via
 * the non-copy ctor spawns a new Worker with its own thread; so to share a background loop, copy; for a dedicated
 * worker, construct another.  When the last copy is destroyed, the request queue is closed; the Worker finishes
 * all registered transfers (delivering each reply), then stops; and the destructor returns only once thread W has
 * been joined.
 *
 * ### Error reporting ###
 * Engine errors of a given transfer go only to that transfer's Reply_receiver.  If the Worker cannot be reached
 * (queue closed; or construction failed) the Reply_receiver is returned already holding
 * error::Code::S_CHANNEL_SEND_FAILED (and the Transfer, given back).
 *
 * ### Thread safety ###
 * Distinct copies may be used concurrently without locking.  A given copy has the usual thread safety: concurrent
 * `const` access is fine.  Do not destroy the last copy from thread W (i.e., from an async_submit() handler).
 */
class Bridge
{
public:
  // Types.

  /// Short-hand for async_submit() completion handler.
  using On_done_func = Transfer_done_func;

  // Constructors/destructor.

  /**
   * Starts a new Worker (thread W) with an empty, open request queue.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname, used in logging and the OS thread name.
   * @param config
   *        See Bridge_config.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (`config` out of range), error::Code::S_ENGINE_INIT_FAILED.
   *        On error `*this` is usable only in the sense that submit() yields error::Code::S_CHANNEL_SEND_FAILED.
   */
  explicit Bridge(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                  const Bridge_config& config = Bridge_config(), Error_code* err_code = 0);

  /**
   * Copy-constructs: `*this` shares `src`'s Worker.
   * @param src
   *        Source.
   */
  Bridge(const Bridge& src);

  /**
   * Move-constructs: `*this` takes over `src`'s share of the Worker.  `src` becomes unusable except for destruction
   * and assignment.
   * @param src
   *        Source.
   */
  Bridge(Bridge&& src);

  /// If this is the last copy: closes the queue, awaits drain of all registered transfers, joins thread W.
  ~Bridge();

  // Methods.

  /**
   * Copy-assigns.  See copy ctor and dtor.
   * @param src
   *        Source.
   * @return `*this`.
   */
  Bridge& operator=(const Bridge& src);

  /**
   * Move-assigns.  See move ctor and dtor.
   * @param src
   *        Source.
   * @return `*this`.
   */
  Bridge& operator=(Bridge&& src);

  /**
   * Hands the Transfer to the Worker, which starts performing it; returns the future of its outcome.
   * Blocks while the request queue is full.  May be called from thread W itself (e.g., from an async_submit()
   * handler); then the queue is bypassed and this never blocks.
   *
   * @param transfer
   *        Live Transfer, normally from Transfer_builder.  Moved-from.
   * @return Receiver; see Reply_receiver::get() for the possible outcomes.  Never null.
   */
  Reply_receiver submit(Transfer&& transfer);

  /**
   * Like submit(); but the outcome is delivered to the given handler, invoked from thread W (or from the calling
   * thread, in some failure cases, before this returns).  If the Worker shuts down before the outcome is known,
   * the handler receives error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER.
   * Do not block in the handler: it runs in thread W.
   *
   * Unlike submit() this never blocks: if the request queue is full, the Request is handed to thread W directly,
   * so there is no backpressure on this path.
   *
   * @param transfer
   *        See submit().
   * @param on_done_func
   *        Handler.  Invoked exactly once.
   */
  void async_submit(Transfer&& transfer, On_done_func&& on_done_func);

  /**
   * Nickname as passed to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * Config as passed to ctor.
   * @return See above.
   */
  const Bridge_config& config() const;

  /**
   * Logger as passed to ctor.
   * @return See above.
   */
  flow::log::Logger* get_logger() const;

  /**
   * Number of copies (including `*this`) sharing the Worker.  For logging/testing.
   * @return See above.  0 if `*this` was moved-from.
   */
  long use_count() const;

private:
  // Types.

  /// The shared implementation.
  class Impl;

  // Friends.

  /// Friend of Bridge.
  friend std::ostream& operator<<(std::ostream& os, const Bridge& val);
  /// Friend of Bridge.
  friend std::ostream& operator<<(std::ostream& os, const Impl& val);

  // Data.

  /// The shared implementation; null if moved-from.
  boost::shared_ptr<Impl> m_impl;
}; // class Bridge

} // namespace xfer::transport
