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

#include "xfer/transport/transport_fwd.hpp"
#include <flow/util/util.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/noncopyable.hpp>
#include <deque>
#include <optional>

namespace xfer::transport
{

// Types.

/**
 * Bounded multi-producer, single-consumer FIFO queue with close semantics: the request channel between any number
 * of Bridge copies (producers, in threads U) and the Worker (consumer, thread W).
 *
 * - push() blocks while the queue holds capacity() items.  This is the backpressure: with capacity 1 a producer
 *   returns from push() no earlier than the moment the consumer has taken the preceding item.
 * - try_pop() never blocks; the consumer learns that items are available from the *notifier* (see set_notifier()),
 *   rather than by blocking in a pop.  This way the consumer's thread never performs an unbounded blocking call.
 * - close() is one-way.  After it, push() fails (and hands the payload back untouched), and any push() blocked
 *   on a full queue wakes up and fails likewise.  Items already queued remain poppable.
 *
 * @tparam Payload
 *         Item type.  Must be move-constructible.
 *
 * ### Thread safety ###
 * All methods may be called concurrently, except set_notifier(), which must precede all concurrent use.
 */
template<typename Payload>
class Bounded_channel :
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the item type.
  using Value = Payload;

  /// Notifier signature.  See set_notifier().
  using Notifier_func = Function<void ()>;

  // Constructors/destructor.

  /**
   * Constructs open, empty channel.
   *
   * @param capacity
   *        Max number of items queued at once.  Must be positive.
   */
  explicit Bounded_channel(size_t capacity);

  // Methods.

  /**
   * Sets the function invoked after each successful push and after close() (the first one only).  It is invoked
   * from the pushing/closing thread, without any lock held; typically it schedules the consumer to try_pop().
   *
   * @param notifier_func
   *        Function.
   */
  void set_notifier(Notifier_func&& notifier_func);

  /**
   * Enqueues the payload, first blocking while the queue is full.
   *
   * @param payload
   *        Item.  Moved-from if and only if `true` is returned.
   * @return `true` if enqueued; `false` if the channel is (or became, while waiting) closed.
   */
  bool push(Payload&& payload);

  /**
   * Like push() but fails instead of blocking.
   *
   * @param payload
   *        Item.  Moved-from if and only if `true` is returned.
   * @return `true` if enqueued; `false` if full or closed.
   */
  bool try_push(Payload&& payload);

  /**
   * Dequeues the oldest item, if any, without blocking.  Unblocks one producer blocked in push(), if any.
   *
   * @return The item, or none if the queue is empty.
   */
  std::optional<Payload> try_pop();

  /// Closes the channel (idempotent).  See class doc header.
  void close();

  /**
   * Whether close() has been called.
   * @return See above.
   */
  bool closed() const;

  /**
   * Number of items queued at the moment.
   * @return See above.
   */
  size_t size() const;

  /**
   * Capacity given to ctor.
   * @return See above.
   */
  size_t capacity() const;

private:
  // Types.

  /// Short-hand for the mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for the lock type.
  using Lock = flow::util::Lock_guard<Mutex>;

  // Data.

  /// See capacity().
  const size_t m_capacity;

  /// See set_notifier().  Immutable once concurrent use begins.
  Notifier_func m_notifier_func;

  /// Protects the subsequent members.
  mutable Mutex m_mutex;

  /// Signaled when an item is popped or the channel is closed.
  boost::condition_variable m_not_full_or_closed;

  /// The items, oldest at front.
  std::deque<Payload> m_queue;

  /// See closed().
  bool m_closed;
}; // class Bounded_channel

// Template implementations.

template<typename Payload>
Bounded_channel<Payload>::Bounded_channel(size_t capacity) :
  m_capacity(capacity),
  m_closed(false)
{
  assert((m_capacity != 0) && "Capacity 0 would make every push() block forever.");
}

template<typename Payload>
void Bounded_channel<Payload>::set_notifier(Notifier_func&& notifier_func)
{
  m_notifier_func = std::move(notifier_func);
}

template<typename Payload>
bool Bounded_channel<Payload>::push(Payload&& payload)
{
  {
    Lock lock(m_mutex);
    while ((!m_closed) && (m_queue.size() >= m_capacity))
    {
      m_not_full_or_closed.wait(lock);
    }
    if (m_closed)
    {
      return false;
    }
    // else
    m_queue.emplace_back(std::move(payload));
  } // Lock lock(m_mutex);

  if (m_notifier_func)
  {
    m_notifier_func();
  }
  return true;
}

template<typename Payload>
bool Bounded_channel<Payload>::try_push(Payload&& payload)
{
  {
    Lock lock(m_mutex);
    if (m_closed || (m_queue.size() >= m_capacity))
    {
      return false;
    }
    // else
    m_queue.emplace_back(std::move(payload));
  }

  if (m_notifier_func)
  {
    m_notifier_func();
  }
  return true;
}

template<typename Payload>
std::optional<Payload> Bounded_channel<Payload>::try_pop()
{
  std::optional<Payload> payload;
  {
    Lock lock(m_mutex);
    if (m_queue.empty())
    {
      return payload;
    }
    // else
    payload.emplace(std::move(m_queue.front()));
    m_queue.pop_front();
  }
  m_not_full_or_closed.notify_one();
  return payload;
}

template<typename Payload>
void Bounded_channel<Payload>::close()
{
  {
    Lock lock(m_mutex);
    if (m_closed)
    {
      return;
    }
    // else
    m_closed = true;
  }
  m_not_full_or_closed.notify_all();

  if (m_notifier_func)
  {
    m_notifier_func();
  }
}

template<typename Payload>
bool Bounded_channel<Payload>::closed() const
{
  Lock lock(m_mutex);
  return m_closed;
}

template<typename Payload>
size_t Bounded_channel<Payload>::size() const
{
  Lock lock(m_mutex);
  return m_queue.size();
}

template<typename Payload>
size_t Bounded_channel<Payload>::capacity() const
{
  return m_capacity;
}

} // namespace xfer::transport
