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
#include <boost/thread/future.hpp>
#include <boost/shared_ptr.hpp>

namespace xfer::transport
{

// Types.

/// What travels through a reply channel: the outcome of one Transfer plus the Transfer itself.
struct Reply_result
{
  /// Outcome: falsy on success.
  Error_code m_err_code;
  /// The Transfer.
  Transfer m_transfer;
};

/**
 * What the two ends of one reply channel share besides the `boost::promise` and its future: the cancellation flag
 * and, in handler mode, the handler.  Defined in the .cpp only.
 */
struct Reply_link;

/**
 * The sending end of a one-shot reply channel: carries exactly one `(Error_code, Transfer)` outcome from the Worker
 * (thread W) to the one caller who submitted the corresponding Request.  Obtain one (together with its
 * Reply_receiver) from make_reply_channel(); or (handler mode) from make_reply_handler(), in which case send()
 * invokes the handler instead.
 *
 * At most one value is ever sent.  If a non-null Reply_sender is destroyed (or assigned-over) without having sent,
 * the other end learns of it: a Reply_receiver then yields error::Code::S_CHANNEL_RECEIVE_FAILED; a handler is
 * invoked with error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER.
 *
 * ### Thread safety ###
 * A given Reply_sender is used by one thread at a time; but it may be used concurrently with its Reply_receiver.
 */
class Reply_sender
{
public:
  // Constructors/destructor.

  /// Constructs null sender; send() always returns `false`.
  Reply_sender();

  /**
   * Move-constructs; `src` becomes null.
   * @param src
   *        Moved-from object.
   */
  Reply_sender(Reply_sender&& src);

  /// Disallow copying.
  Reply_sender(const Reply_sender&) = delete;

  /// If not null, and nothing was sent: informs the other end.  See class doc header.
  ~Reply_sender();

  // Methods.

  /**
   * Move-assigns; `src` becomes null.  `*this`'s previous channel, if any, is treated as in the dtor.
   * @param src
   *        Moved-from object.
   * @return `*this`.
   */
  Reply_sender& operator=(Reply_sender&& src);

  /// Disallow copying.
  Reply_sender& operator=(const Reply_sender&) = delete;

  /**
   * Sends the outcome, if the receiving end is still interested.  In handler mode the handler is invoked
   * synchronously, from the calling thread, before this returns.
   *
   * If the Reply_receiver is canceled concurrently with this call, `true` may still be returned; the outcome
   * (and the Transfer) is then destroyed unseen, when the last end lets go of it.
   *
   * @param err_code
   *        Outcome: falsy on success.
   * @param transfer
   *        The Transfer.  Moved-from if and only if `true` is returned.
   * @return `true` if delivered; `false` if null, if already sent, or if the Reply_receiver is gone
   *         (destroyed or Reply_receiver::cancel()ed).
   */
  bool send(const Error_code& err_code, Transfer&& transfer);

  /**
   * Whether the receiving end is gone: the Reply_receiver was destroyed or Reply_receiver::cancel()ed.
   * Never `true` in handler mode.  `true` if null().
   *
   * @return See above.
   */
  bool receiver_gone() const;

  /**
   * Whether `*this` is null: default-constructed, moved-from, or already send()-ed successfully.
   * @return See above.
   */
  bool null() const;

private:
  // Friends.

  /// Creates live senders.
  friend void make_reply_channel(Reply_sender* sender, Reply_receiver* receiver);
  /// Creates live senders.
  friend Reply_sender make_reply_handler(Transfer_done_func&& on_done_func);

  // Methods.

  /// Informs the other end that nothing will be sent; makes `*this` null.  No-op if null.
  void abandon();

  // Data.

  /// Shared with the receiving end; null if and only if null().
  boost::shared_ptr<Reply_link> m_link;

  /// Fulfilled by send(); broken (`boost::broken_promise`) by abandon().  Unused in handler mode.
  boost::promise<Reply_result> m_promise;
}; // class Reply_sender

/**
 * The receiving end of a one-shot reply channel: the caller-side future that resolves, once, to the outcome of
 * a submitted Transfer.  Returned by Bridge::submit() and Transfer_builder<Finalized>::perform().
 *
 * Awaiting it (get(), wait(), wait_for()) is a suspension point for the calling thread only.  Abandoning it,
 * by destroying it or calling cancel(), tells the Worker the caller is no longer interested; the Worker then
 * removes the in-flight Transfer from the engine promptly (the Transfer is destroyed, never given back).
 *
 * ### Thread safety ###
 * A given Reply_receiver is used by one thread at a time; but it may be used concurrently with its Reply_sender.
 */
class Reply_receiver
{
public:
  // Constructors/destructor.

  /// Constructs null receiver.
  Reply_receiver();

  /**
   * Move-constructs; `src` becomes null.
   * @param src
   *        Moved-from object.
   */
  Reply_receiver(Reply_receiver&& src);

  /// Disallow copying.
  Reply_receiver(const Reply_receiver&) = delete;

  /// cancel()s.
  ~Reply_receiver();

  // Methods.

  /**
   * Move-assigns; `src` becomes null.  `*this`'s previous channel, if any, is cancel()ed first.
   * @param src
   *        Moved-from object.
   * @return `*this`.
   */
  Reply_receiver& operator=(Reply_receiver&& src);

  /// Disallow copying.
  Reply_receiver& operator=(const Reply_receiver&) = delete;

  /**
   * Blocks until the outcome is available; then yields it and makes `*this` null.
   *
   * On success the returned Transfer holds the response.  If an engine error (`"xfer/curl"` or `"xfer/curl-multi"`
   * category) or error::Code::S_CHANNEL_SEND_FAILED is emitted, the Transfer is still returned when `err_code` is
   * not null, so the caller can inspect partial data.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        engine errors; error::Code::S_CHANNEL_SEND_FAILED (request never reached the worker);
   *        error::Code::S_CHANNEL_RECEIVE_FAILED (the sending end vanished without a reply);
   *        error::Code::S_INVALID_ARGUMENT (the Transfer submitted was null);
   *        error::Code::S_ILLEGAL_STATE (null(): e.g., get() called twice).
   * @return The Transfer; null on some errors (see above).
   */
  Transfer get(Error_code* err_code = 0);

  /// Blocks until ready().  Returns immediately if null().
  void wait() const;

  /**
   * Blocks until ready() or until the given time has passed.
   *
   * @param timeout
   *        Upper bound on the blocking.
   * @return `true` if ready() (or null()); `false` on timeout.
   */
  bool wait_for(util::Fine_duration timeout) const;

  /**
   * Whether get() would not block: the outcome was sent, or the sending end is gone.  `false` if null().
   * @return See above.
   */
  bool ready() const;

  /**
   * Abandons the channel: no outcome shall be received; the Worker shall stop the transfer.  Makes `*this` null.
   * No-op if null().
   */
  void cancel();

  /**
   * Whether `*this` is null: default-constructed, moved-from, cancel()ed, or get() already done.
   * @return See above.
   */
  bool null() const;

private:
  // Friends.

  /// Creates live receivers.
  friend void make_reply_channel(Reply_sender* sender, Reply_receiver* receiver);

  // Data.

  /// Shared with the sending end; null if and only if null().
  boost::shared_ptr<Reply_link> m_link;

  /// Future of Reply_sender::m_promise; invalid if and only if null().
  boost::unique_future<Reply_result> m_future;
}; // class Reply_receiver

/**
 * What Bridge::submit() hands to the Worker: the Transfer to perform plus the sender on which to reply.
 * Move-only; consumed exactly once by the Worker.
 */
struct Request
{
  /// The Transfer to perform.
  Transfer m_transfer;
  /// Where the outcome goes.
  Reply_sender m_reply;
};

// Free functions.

/**
 * Creates a connected, empty reply channel.
 *
 * @param sender
 *        Receives the sending end.  Not null.
 * @param receiver
 *        Receives the receiving end.  Not null.
 */
void make_reply_channel(Reply_sender* sender, Reply_receiver* receiver);

/**
 * Creates a sender in handler mode: Reply_sender::send() invokes `on_done_func` (once) instead of filling a
 * Reply_receiver.  If the sender is abandoned, `on_done_func` is invoked with
 * error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER and a null Transfer.
 *
 * @param on_done_func
 *        Handler.
 * @return The sender.
 */
Reply_sender make_reply_handler(Transfer_done_func&& on_done_func);

} // namespace xfer::transport
