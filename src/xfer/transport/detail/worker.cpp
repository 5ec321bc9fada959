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
#include "xfer/transport/detail/worker.hpp"
#include <flow/async/util.hpp>
#include <flow/error/error.hpp>
#include <boost/move/make_unique.hpp>
#include <boost/make_shared.hpp>
#include <algorithm>
#include <ostream>

namespace xfer::transport
{

// Implementations.

Worker::Worker(flow::log::Logger* logger_ptr, util::String_view nickname_str, const Bridge_config& config,
               Request_channel* channel, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_config(config),
  m_channel(channel),
  // (Linux) OS thread name will truncate the nickname to 15-4=11 chars.
  m_worker(get_logger(), flow::util::ostream_op_string("XfW-", m_nickname)),
  m_poll_timer(*(m_worker.task_engine())),
  m_poll_scheduled(false),
  m_state(State::S_IDLE),
  m_registered_count(0),
  m_stopped_future(m_stopped_signal.get_future())
{
  using flow::async::reset_thread_pinning;
  using flow::error::Runtime_error;
  using boost::movelib::make_unique;

  Error_code init_err_code;
  FLOW_LOG_TRACE("Worker [" << *this << "]: Awaiting initial setup in worker thread.");
  m_worker.start([&]() // Execute all this synchronously in the thread.
  {
    reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity!  Worker must float free.

    FLOW_LOG_INFO("Worker [" << *this << "]: Starting (am in worker thread) with config [" << m_config << "].");

    m_transfers = make_unique<sync_io::Transfer_set>(get_logger(), m_nickname, &init_err_code);
    if ((!init_err_code)
        && ((m_config.m_max_total_connections != 0) || (m_config.m_max_host_connections != 0)))
    {
      m_transfers->set_max_connections(m_config.m_max_total_connections, m_config.m_max_host_connections,
                                       &init_err_code);
    }

    if (init_err_code) // It logged.
    {
      m_transfers.reset();
    }
  }); // m_worker.start()

  if (init_err_code)
  {
    // Thread W keeps going, idle, until the dtor; the owner must not hand us any Request.
    if (err_code)
    {
      *err_code = init_err_code;
      return;
    }
    // else
    throw Runtime_error(init_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
  FLOW_LOG_INFO("Worker [" << *this << "]: Ready for requests.");
} // Worker::Worker()

Worker::~Worker()
{
  using flow::async::Single_thread_task_loop;
  using flow::async::reset_thread_pinning;
  using flow::util::ostream_op_string;

  assert((!in_worker_thread()) && "Worker dtor must not run from its own thread.");

  FLOW_LOG_INFO("Worker [" << *this << "]: Shutting down in state [" << state() << "].  "
                "Internal async handlers will be canceled; and worker thread will be joined.");

  m_worker.stop();
  // Thread W is (synchronously!) no more.

  /* Tasks may still be queued on the now-stopped engine: typically deliveries of last replies, posted by deliver()
   * right before we went S_STOPPED.  They must run (each delivers exactly one reply); run them from a transient
   * thread, so that no user handler ever runs in the thread calling our dtor. */
  FLOW_LOG_INFO("Worker [" << *this << "]: Continuing shutdown.  Next we will run pending handlers from some "
                "other thread.  In this user thread we will await those handlers' completion and then return.");
  Single_thread_task_loop one_thread(get_logger(), ostream_op_string("XfWDeinit-", m_nickname));

  one_thread.start([&]()
  {
    reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity.  Float free.

    const auto task_engine = m_worker.task_engine();
    task_engine->restart();
    const auto count = task_engine->poll();
    if (count != 0)
    {
      FLOW_LOG_INFO("Worker [" << *this << "]: "
                    "In transient finisher thread: Ran [" << count << "] internal handlers after all.");
    }
    task_engine->stop();

    if (!m_replies.empty())
    {
      FLOW_LOG_INFO("Worker [" << *this << "]: In transient finisher thread: Aborting [" << m_replies.size() << "] "
                    "still-registered transfers; their submitters are informed.");
    }
    // Abort the transfers first; then the senders, on their way out, inform the submitters.
    m_transfers.reset();
    m_replies.clear();

    FLOW_LOG_INFO("Transient finisher exiting.");
  }); // one_thread.start()
  // Here thread exits/joins synchronously.
} // Worker::~Worker()

void Worker::on_channel_event()
{
  // We are in thread U (or W, if a handler submitted while the channel happened to accept it).
  m_worker.post([this]()
  {
    // We are in thread W.
    pull_requests();
  }); // m_worker.post()
}

void Worker::accept(Request&& request)
{
  assert(in_worker_thread());

  if (m_state == State::S_STOPPED)
  {
    FLOW_LOG_WARNING("Worker [" << *this << "]: Request arrived from worker thread after stop; rejecting.");
    deliver(std::move(request.m_reply), error::Code::S_CHANNEL_SEND_FAILED, std::move(request.m_transfer));
    return;
  }
  // else

  register_request(std::move(request));
  poll();
}

void Worker::post_request(Request&& request)
{
  // Tasks must be copyable.  Queued ahead of any later close() notification, so it runs in thread W before S_STOPPED.
  auto request_ptr = boost::make_shared<Request>(std::move(request));
  m_worker.post([this, request_ptr]()
  {
    // We are in thread W.
    accept(std::move(*request_ptr));
  }); // m_worker.post()
}

void Worker::pull_requests()
{
  size_t count = 0;
  for (auto request = m_channel->try_pop(); request; request = m_channel->try_pop())
  {
    register_request(std::move(*request));
    ++count;
  }

  FLOW_LOG_TRACE("Worker [" << *this << "]: Pulled [" << count << "] requests; "
                 "registered count now [" << m_replies.size() << "].");
  poll();
}

void Worker::register_request(Request&& request)
{
  if (request.m_reply.receiver_gone())
  {
    FLOW_LOG_INFO("Worker [" << *this << "]: Request for transfer [" << request.m_transfer << "] was canceled "
                  "before it was registered.  Dropping it.");
    return;
  }
  // else

  Error_code err_code;
  const auto id = m_transfers->add(std::move(request.m_transfer), &err_code);
  if (err_code)
  {
    // Only this submitter is affected.  The Transfer was left untouched, so give it back.
    deliver(std::move(request.m_reply), err_code, std::move(request.m_transfer));
    return;
  }
  // else

  m_replies.emplace(id, std::move(request.m_reply));
  m_registered_count = m_replies.size();
} // Worker::register_request()

void Worker::poll()
{
  if (!m_replies.empty())
  {
    Error_code err_code;
    m_transfers->drive(&err_code);
    if (err_code)
    {
      FLOW_LOG_WARNING("Worker [" << *this << "]: Driving the engine failed; failing all [" << m_replies.size() << "] "
                       "registered transfers; the worker keeps running.");
      fail_all(err_code);
    }
    else
    {
      const auto count = m_transfers->drain_completions([&](sync_io::Transfer_id id, const Error_code& result)
      {
        Error_code remove_err_code;
        auto transfer = m_transfers->remove(id, &remove_err_code);
        if (remove_err_code)
        {
          FLOW_LOG_WARNING("Worker [" << *this << "]: Unregistering completed transfer ID [" << id << "] reported "
                           "[" << remove_err_code << "] [" << remove_err_code.message() << "]; "
                           "delivering its result anyway.");
        }

        const auto it = m_replies.find(id);
        assert(it != m_replies.end());
        auto reply = std::move(it->second);
        m_replies.erase(it);

        FLOW_LOG_TRACE("Worker [" << *this << "]: Transfer ID [" << id << "] completed with "
                       "[" << result << "] [" << result.message() << "].");
        deliver(std::move(reply), result, std::move(transfer));
      });

      if (count != 0)
      {
        FLOW_LOG_TRACE("Worker [" << *this << "]: [" << count << "] transfers completed; "
                       "[" << m_replies.size() << "] remain.");
      }

      sweep_canceled();
    }
  } // if (!m_replies.empty())

  update_state();
  if (m_state == State::S_DRAINING)
  {
    schedule_poll();
  }
} // Worker::poll()

void Worker::fail_all(const Error_code& err_code)
{
  for (auto& id_and_reply : m_replies)
  {
    Error_code remove_err_code;
    auto transfer = m_transfers->remove(id_and_reply.first, &remove_err_code);
    deliver(std::move(id_and_reply.second), err_code, std::move(transfer));
  }
  m_replies.clear();
}

void Worker::sweep_canceled()
{
  for (auto it = m_replies.begin(); it != m_replies.end(); )
  {
    if (!it->second.receiver_gone())
    {
      ++it;
      continue;
    }
    // else

    const auto id = it->first;
    Error_code err_code;
    m_transfers->remove(id, &err_code); // Returned Transfer dies right here: aborted.

    FLOW_LOG_INFO("Worker [" << *this << "]: Submitter of transfer ID [" << id << "] is gone; transfer aborted "
                  "and unregistered.");
    it = m_replies.erase(it);
  }
}

void Worker::schedule_poll()
{
  if (m_poll_scheduled)
  {
    return;
  }
  // else

  Error_code err_code;
  const auto suggested = m_transfers->suggested_wait(&err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Worker [" << *this << "]: Engine could not suggest a wait: "
                     "[" << err_code << "] [" << err_code.message() << "]; using default.");
  }
  const auto wait = std::min(suggested ? *suggested : m_config.m_default_wait, m_config.m_poll_slice);

  m_poll_timer.expires_after(wait);
  m_poll_scheduled = true;
  m_poll_timer.async_wait([this](const Error_code& async_err_code)
  {
    // We are in thread W.
    auto sys_err_code = async_err_code;
    m_poll_scheduled = false;

    if (sys_err_code == boost::asio::error::operation_aborted)
    {
      return; // Stuff is shutting down.  GTFO.
    }
    // else

    if (sys_err_code)
    {
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      FLOW_LOG_WARNING("Worker [" << *this << "]: "
                       "Timer system error; just logged; totally unexpected; pretending it fired normally.");
    }

    poll();
  }); // m_poll_timer.async_wait()
} // Worker::schedule_poll()

void Worker::update_state()
{
  m_registered_count = m_replies.size();

  if (!m_replies.empty())
  {
    m_state = State::S_DRAINING;
    return;
  }
  // else

  if ((!m_channel->closed()) || (m_channel->size() != 0))
  {
    m_state = State::S_IDLE;
    return;
  }
  // else

  if (m_state == State::S_STOPPED)
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Worker [" << *this << "]: Request channel closed, and nothing is registered.  Stopped.");
  m_poll_timer.cancel();
  m_state = State::S_STOPPED;
  m_stopped_signal.set_value();
} // Worker::update_state()

void Worker::deliver(Reply_sender&& reply, const Error_code& err_code, Transfer&& transfer)
{
  struct Delivery
  {
    Reply_sender m_reply;
    Error_code m_err_code;
    Transfer m_transfer;
  };

  // Tasks must be copyable; so the move-only payload rides in a shared_ptr.
  auto delivery = boost::make_shared<Delivery>();
  delivery->m_reply = std::move(reply);
  delivery->m_err_code = err_code;
  delivery->m_transfer = std::move(transfer);

  m_worker.post([this, delivery]()
  {
    if (!delivery->m_reply.send(delivery->m_err_code, std::move(delivery->m_transfer)))
    {
      FLOW_LOG_INFO("Worker [" << *this << "]: Reply with result [" << delivery->m_err_code << "] could not be "
                    "delivered: submitter is gone.  Discarding.");
    }
  }); // m_worker.post()
} // Worker::deliver()

void Worker::await_stopped()
{
  assert(!in_worker_thread());

  m_stopped_future.wait();
}

Worker::State Worker::state() const
{
  return m_state;
}

size_t Worker::registered_count() const
{
  return m_registered_count;
}

bool Worker::in_worker_thread() const
{
  return m_worker.in_thread();
}

const std::string& Worker::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, Worker::State val)
{
  switch (val)
  {
  case Worker::State::S_IDLE:
    return os << "IDLE";
  case Worker::State::S_DRAINING:
    return os << "DRAINING";
  case Worker::State::S_STOPPED:
    return os << "STOPPED";
  }
  return os << "?";
}

std::ostream& operator<<(std::ostream& os, const Worker& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace xfer::transport
