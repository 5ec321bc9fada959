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
#include "xfer/transport/reply_channel.hpp"
#include <boost/make_shared.hpp>
#include <atomic>
#include <ostream>

namespace xfer::transport
{

// Types.

struct Reply_link
{
  // Data.

  /// Whether the receiver was destroyed or canceled.  Set by the receiving end only; read by the sending end.
  std::atomic<bool> m_receiver_gone{false};

  /// Handler mode: if not empty, the outcome goes here instead of into the promise.  Touched by the sender only.
  Transfer_done_func m_on_done_func;
}; // struct Reply_link

// Reply_sender implementations.

Reply_sender::Reply_sender() = default;

Reply_sender::Reply_sender(Reply_sender&& src) = default;

Reply_sender::~Reply_sender()
{
  abandon();
}

Reply_sender& Reply_sender::operator=(Reply_sender&& src)
{
  if (&src != this)
  {
    abandon();
    m_link = std::move(src.m_link);
    m_promise = std::move(src.m_promise);
  }
  return *this;
}

bool Reply_sender::send(const Error_code& err_code, Transfer&& transfer)
{
  using boost::promise;

  if ((!m_link) || m_link->m_receiver_gone)
  {
    return false;
  }
  // else

  const auto link = std::move(m_link); // We are null from now on, whatever happens.

  if (link->m_on_done_func)
  {
    const auto on_done_func = std::move(link->m_on_done_func);
    link->m_on_done_func = Transfer_done_func();
    on_done_func(err_code, std::move(transfer)); // The handler may do anything, even submit more.
    return true;
  }
  // else

  promise<Reply_result> fulfilled(std::move(m_promise));
  fulfilled.set_value(Reply_result{ err_code, std::move(transfer) });
  return true;
} // Reply_sender::send()

bool Reply_sender::receiver_gone() const
{
  return (!m_link) || m_link->m_receiver_gone;
}

bool Reply_sender::null() const
{
  return !m_link;
}

void Reply_sender::abandon()
{
  using boost::promise;

  if (!m_link)
  {
    return;
  }
  // else

  const auto link = std::move(m_link);
  {
    // Unfulfilled: its destruction marks the future with boost::broken_promise, waking any waiter.
    promise<Reply_result> broken(std::move(m_promise));
  }

  if (link->m_on_done_func)
  {
    const auto on_done_func = std::move(link->m_on_done_func);
    link->m_on_done_func = Transfer_done_func();
    on_done_func(error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER, Transfer());
  }
} // Reply_sender::abandon()

// Reply_receiver implementations.

Reply_receiver::Reply_receiver() = default;

Reply_receiver::Reply_receiver(Reply_receiver&& src) = default;

Reply_receiver::~Reply_receiver()
{
  cancel();
}

Reply_receiver& Reply_receiver::operator=(Reply_receiver&& src)
{
  if (&src != this)
  {
    cancel();
    m_link = std::move(src.m_link);
    m_future = std::move(src.m_future);
  }
  return *this;
}

Transfer Reply_receiver::get(Error_code* err_code)
{
  using boost::unique_future;

  Transfer transfer;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Transfer { return get(actual_err_code); },
         &transfer, err_code, "Reply_receiver::get()"))
  {
    return transfer;
  }
  // else

  if (!m_link)
  {
    *err_code = error::Code::S_ILLEGAL_STATE;
    return transfer;
  }
  // else

  m_future.wait();
  if (m_future.has_exception()) // boost::broken_promise: the sender was abandoned.
  {
    *err_code = error::Code::S_CHANNEL_RECEIVE_FAILED;
  }
  else
  {
    auto result = m_future.get();
    *err_code = result.m_err_code;
    transfer = std::move(result.m_transfer);
  }

  // Not cancel(): the sender has nothing left to learn.
  m_future = unique_future<Reply_result>();
  m_link.reset();
  return transfer;
} // Reply_receiver::get()

void Reply_receiver::wait() const
{
  if (m_link)
  {
    m_future.wait();
  }
}

bool Reply_receiver::wait_for(util::Fine_duration timeout) const
{
  return (!m_link) || (m_future.wait_for(timeout) == boost::future_status::ready);
}

bool Reply_receiver::ready() const
{
  return m_link && m_future.is_ready();
}

void Reply_receiver::cancel()
{
  using boost::unique_future;

  if (!m_link)
  {
    return;
  }
  // else

  m_link->m_receiver_gone = true;
  m_future = unique_future<Reply_result>(); // If the outcome already arrived, it (with its Transfer) may die here.
  m_link.reset();
}

bool Reply_receiver::null() const
{
  return !m_link;
}

// Free function implementations.

void make_reply_channel(Reply_sender* sender, Reply_receiver* receiver)
{
  using boost::promise;

  assert(sender && receiver);

  auto link = boost::make_shared<Reply_link>();
  *sender = Reply_sender();
  *receiver = Reply_receiver();

  sender->m_promise = promise<Reply_result>();
  receiver->m_future = sender->m_promise.get_future();
  sender->m_link = link;
  receiver->m_link = std::move(link);
}

Reply_sender make_reply_handler(Transfer_done_func&& on_done_func)
{
  Reply_sender sender;
  sender.m_link = boost::make_shared<Reply_link>();
  sender.m_link->m_on_done_func = std::move(on_done_func);
  return sender;
}

std::ostream& operator<<(std::ostream& os, const Reply_receiver& val)
{
  if (val.null())
  {
    return os << "reply[null]@" << static_cast<const void*>(&val);
  }
  // else
  return os << "reply[" << (val.ready() ? "ready" : "pending") << "]@" << static_cast<const void*>(&val);
}

} // namespace xfer::transport
