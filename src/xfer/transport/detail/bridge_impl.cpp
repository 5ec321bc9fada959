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
#include "xfer/transport/detail/bridge_impl.hpp"
#include <flow/error/error.hpp>
#include <boost/move/make_unique.hpp>
#include <ostream>

namespace xfer::transport
{

// Implementations.

Bridge::Impl::Impl(flow::log::Logger* logger_ptr, util::String_view nickname_str, const Bridge_config& config,
                   Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_config(config)
{
  using flow::error::Runtime_error;
  using boost::movelib::make_unique;

  if ((m_config.m_request_queue_capacity == 0)
      || (m_config.m_default_wait <= util::Fine_duration::zero())
      || (m_config.m_poll_slice <= util::Fine_duration::zero())
      || (m_config.m_max_total_connections < 0) || (m_config.m_max_host_connections < 0))
  {
    FLOW_LOG_WARNING("Bridge [" << *this << "]: Config [" << m_config << "] is invalid.  Bridge is unusable.");
    const Error_code our_err_code = error::Code::S_INVALID_ARGUMENT;
    if (err_code)
    {
      *err_code = our_err_code;
      return;
    }
    // else
    throw Runtime_error(our_err_code, "Bridge::Bridge()");
  }
  // else

  m_channel = make_unique<Worker::Request_channel>(m_config.m_request_queue_capacity);

  Error_code our_err_code;
  m_worker = make_unique<Worker>(get_logger(), m_nickname, m_config, m_channel.get(), &our_err_code);
  if (our_err_code)
  {
    // Dismantle.  No notifier was set, so the Worker never saw the (empty) channel.
    m_channel->close();
    m_worker.reset();
    FLOW_LOG_WARNING("Bridge [" << *this << "]: Worker startup failed.  Bridge is unusable.");
    if (err_code)
    {
      *err_code = our_err_code;
      return;
    }
    // else
    throw Runtime_error(our_err_code, "Bridge::Bridge()");
  }
  // else

  // Before anyone can push: the notifier tells the Worker to pull.
  m_channel->set_notifier([this]() { m_worker->on_channel_event(); });

  if (err_code)
  {
    err_code->clear();
  }
  FLOW_LOG_INFO("Bridge [" << *this << "]: Started.");
} // Bridge::Impl::Impl()

Bridge::Impl::~Impl()
{
  if (!m_worker)
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Bridge [" << *this << "]: Last handle gone.  Closing request channel and awaiting drain of "
                "[" << m_worker->registered_count() << "] registered transfers.");
  m_channel->close();
  m_worker->await_stopped();
  m_worker.reset(); // Joins thread W; runs any last deliveries.
  FLOW_LOG_INFO("Bridge [" << *this << "]: Shut down.");
}

Reply_receiver Bridge::Impl::submit(Transfer&& transfer)
{
  Request request;
  Reply_receiver receiver;
  make_reply_channel(&request.m_reply, &receiver);
  request.m_transfer = std::move(transfer);

  submit_request(std::move(request), true);
  return receiver;
}

void Bridge::Impl::async_submit(Transfer&& transfer, On_done_func&& on_done_func)
{
  Request request;
  request.m_reply = make_reply_handler(std::move(on_done_func));
  request.m_transfer = std::move(transfer);

  submit_request(std::move(request), false);
}

void Bridge::Impl::submit_request(Request&& request, bool may_block)
{
  FLOW_LOG_TRACE("Bridge [" << *this << "]: Submitting transfer [" << request.m_transfer << "].");

  if (m_worker)
  {
    if (m_worker->in_worker_thread())
    {
      // A handler is submitting.  Pushing could block on a full channel, which only we could empty: deadlock.
      m_worker->accept(std::move(request));
      return;
    }
    // else
    if (may_block)
    {
      if (m_channel->push(std::move(request)))
      {
        return;
      }
      // else: Closed.  `request` is untouched.
    }
    else
    {
      if (m_channel->try_push(std::move(request)))
      {
        return;
      }
      // else: Full (or closed, though only our own dtor closes it).  `request` is untouched.
      FLOW_LOG_TRACE("Bridge [" << *this << "]: Request channel full; "
                     "handing request straight to the worker thread.");
      m_worker->post_request(std::move(request));
      return;
    }
  }

  FLOW_LOG_WARNING("Bridge [" << *this << "]: Request channel unavailable; "
                   "replying with send failure, returning the transfer to its submitter.");
  if (!request.m_reply.send(error::Code::S_CHANNEL_SEND_FAILED, std::move(request.m_transfer)))
  {
    FLOW_LOG_INFO("Bridge [" << *this << "]: Send failure could not be reported either: submitter is gone.");
  }
} // Bridge::Impl::submit_request()

const std::string& Bridge::Impl::nickname() const
{
  return m_nickname;
}

const Bridge_config& Bridge::Impl::config() const
{
  return m_config;
}

std::ostream& operator<<(std::ostream& os, const Bridge::Impl& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace xfer::transport
