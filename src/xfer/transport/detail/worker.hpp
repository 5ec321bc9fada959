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
#include "xfer/transport/bounded_channel.hpp"
#include "xfer/transport/sync_io/transfer_set.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/util/util.hpp>
#include <boost/thread/future.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>
#include <map>

namespace xfer::transport
{

// Types.

/**
 * The background actor behind a Bridge: owns thread W, the engine multiplexer (sync_io::Transfer_set) and the
 * Reply_sender of every transfer registered in it; consumes Request objects from a Bounded_channel and drives the
 * engine until each transfer completes, replying to each submitter.
 *
 * ### State machine ###
 *   - State::S_IDLE: nothing registered; no timer armed.  Wakes up only when the channel notifies.
 *   - State::S_DRAINING: 1+ transfers registered; the poll timer is armed.
 *   - State::S_STOPPED: the channel is closed and nothing is registered.  Final.  await_stopped() returns.
 *
 * ### One poll iteration (thread W) ###
 *   -# Pull every available Request (non-blocking) and register its Transfer.  A registration failure is replied to
 *      that submitter only.
 *   -# Drive the engine.  A multiplexer-level failure is replied to every registered submitter (each transfer is
 *      removed); the loop keeps going.
 *   -# Drain completions; remove each completed Transfer and send it, with its result, to its submitter.  If the
 *      submitter is gone that is logged and otherwise ignored.
 *   -# Cancellation sweep: each registered Transfer whose Reply_receiver is gone is removed (aborted) at once.
 *   -# If anything remains registered, arm the timer for the engine's suggested wait (or
 *      Bridge_config::m_default_wait if none), capped at Bridge_config::m_poll_slice.
 *
 * Replies are sent via tasks posted onto thread W, not directly from within the iteration; so handlers
 * (Bridge::async_submit()) never run in the middle of an iteration, and may themselves submit more work.
 *
 * Nothing here blocks thread W: the engine is only driven non-blockingly, and waits are timer-based.
 *
 * ### Thread safety ###
 * on_channel_event(), post_request(), await_stopped(), state(), registered_count(), in_worker_thread() are
 * thread-safe.
 * accept() must be called from thread W.  The dtor must not be called from thread W.
 */
class Worker :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// See class doc header.
  enum class State
  {
    /// Nothing registered; waiting for requests.
    S_IDLE,
    /// 1+ transfers registered; polling.
    S_DRAINING,
    /// Channel closed and nothing registered.  Final.
    S_STOPPED
  };

  /// The request channel type.
  using Request_channel = Bounded_channel<Request>;

  // Constructors/destructor.

  /**
   * Starts thread W; creates the multiplexer.  Does not consume `*channel` until on_channel_event().
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname.  Also used in the OS thread name.
   * @param config
   *        Tuning.  Assumed valid.
   * @param channel
   *        The request channel.  Must outlive `*this`.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ENGINE_INIT_FAILED, `"xfer/curl-multi"` category errors (connection limits).
   *        On error `*this` is unusable: destroy it without connecting it to the channel.
   */
  explicit Worker(flow::log::Logger* logger_ptr, util::String_view nickname_str, const Bridge_config& config,
                  Request_channel* channel, Error_code* err_code = 0);

  /**
   * Stops and joins thread W.  Then runs, from a transient thread, any tasks still pending (typically deliveries of
   * last replies).  Any Transfer still registered (only possible if the dtor runs before State::S_STOPPED) is
   * aborted; its submitter is informed as per Reply_sender dtor.
   */
  ~Worker();

  // Methods.

  /**
   * To be invoked by the channel's notifier: schedules a pull of all available Request objects on thread W.
   * Thread-safe.
   */
  void on_channel_event();

  /**
   * Registers the Request directly, bypassing the channel.  Must be called from thread W.  Used when a submitter
   * runs in thread W, where pushing to a full channel would deadlock.
   *
   * @param request
   *        The Request.
   */
  void accept(Request&& request);

  /**
   * Schedules accept() of the Request on thread W, bypassing the channel.  Thread-safe; never blocks.  Used by
   * Bridge::async_submit() when the channel is full.
   *
   * @param request
   *        The Request.
   */
  void post_request(Request&& request);

  /**
   * Blocks until state() is State::S_STOPPED.  Never call from thread W.
   */
  void await_stopped();

  /**
   * Current state.  Thread-safe; of course it may change right after return.
   * @return See above.
   */
  State state() const;

  /**
   * Number of registered transfers.  Thread-safe; for logging/testing.
   * @return See above.
   */
  size_t registered_count() const;

  /**
   * Whether the calling thread is thread W.
   * @return See above.
   */
  bool in_worker_thread() const;

  /**
   * Nickname as passed to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// Reply senders by transfer.
  using Reply_map = std::map<sync_io::Transfer_id, Reply_sender>;

  // Methods.

  /// Thread W: pulls all available requests, registers them, then polls.
  void pull_requests();

  /**
   * Thread W: registers the Request's Transfer with #m_transfers, remembering the Reply_sender; or replies with the
   * failure.
   *
   * @param request
   *        The Request.
   */
  void register_request(Request&& request);

  /// Thread W: drive, drain, sweep, then schedule the next poll or go idle/stopped.
  void poll();

  /**
   * Thread W: removes all registered transfers, replying to each with the given error.
   * @param err_code
   *        Truthy error.
   */
  void fail_all(const Error_code& err_code);

  /// Thread W: removes each registered Transfer whose receiver is gone.
  void sweep_canceled();

  /// Thread W: arms #m_poll_timer if not armed already.
  void schedule_poll();

  /// Thread W: updates state; if the channel is closed and nothing is registered, goes State::S_STOPPED.
  void update_state();

  /**
   * Thread W: sends the outcome via the sender, not synchronously but via a task posted onto thread W.
   *
   * @param reply
   *        Sender.  Moved-from.
   * @param err_code
   *        Outcome.
   * @param transfer
   *        Transfer.  Moved-from.
   */
  void deliver(Reply_sender&& reply, const Error_code& err_code, Transfer&& transfer);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// Tuning.
  const Bridge_config m_config;

  /// The request channel; not owned.
  Request_channel* const m_channel;

  /// Thread W.  All subsequent members except as noted are accessed only from thread W.
  flow::async::Single_thread_task_loop m_worker;

  /// Fires to trigger the next poll().
  flow::util::Timer m_poll_timer;

  /// Whether #m_poll_timer is armed.
  bool m_poll_scheduled;

  /// The multiplexer.  Null if its construction failed.
  boost::movelib::unique_ptr<sync_io::Transfer_set> m_transfers;

  /// Sender for each registered transfer.
  Reply_map m_replies;

  /// See state().  Written in thread W only.
  std::atomic<State> m_state;

  /// See registered_count().  Written in thread W only.
  std::atomic<size_t> m_registered_count;

  /// Fulfilled (once) when entering State::S_STOPPED.
  boost::promise<void> m_stopped_signal;

  /// Future of #m_stopped_signal; see await_stopped().
  boost::unique_future<void> m_stopped_future;
}; // class Worker

// Free functions.

/**
 * Prints string representation of the given Worker::State to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Worker::State val);

} // namespace xfer::transport
