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
#include "xfer/transport/sync_io/transfer_set.hpp"
#include "xfer/transport/detail/engine.hpp"
#include <flow/error/error.hpp>
#include <algorithm>
#include <boost/chrono.hpp>
#include <ostream>

namespace xfer::transport::sync_io
{

// Implementations.

Transfer_set::Transfer_set(flow::log::Logger* logger_ptr, util::String_view nickname_str, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_multi(nullptr),
  m_next_id(1)
{
  Error_code our_err_code;
  init_engine_globally(get_logger(), &our_err_code);
  if (!our_err_code)
  {
    m_multi = curl_multi_init();
    if (!m_multi)
    {
      our_err_code = error::Code::S_ENGINE_INIT_FAILED;
    }
  }

  if (our_err_code)
  {
    FLOW_LOG_WARNING("Transfer_set [" << *this << "]: Creation failed: "
                     "[" << our_err_code << "] [" << our_err_code.message() << "].");
    if (err_code)
    {
      *err_code = our_err_code;
      return;
    }
    // else
    throw flow::error::Runtime_error(our_err_code, "Transfer_set::Transfer_set()");
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
  FLOW_LOG_TRACE("Transfer_set [" << *this << "]: Created.");
} // Transfer_set::Transfer_set()

Transfer_set::~Transfer_set()
{
  if (!m_transfers.empty())
  {
    FLOW_LOG_INFO("Transfer_set [" << *this << "]: Shutting down with [" << m_transfers.size() << "] transfers "
                  "still registered.  They are aborted.");
  }

  // Each easy handle must leave the multi handle before either is cleaned up.
  for (const auto& id_and_transfer : m_transfers)
  {
    const auto result = curl_multi_remove_handle(m_multi, id_and_transfer.second.native_handle());
    if (result != CURLM_OK)
    {
      FLOW_LOG_WARNING("Transfer_set [" << *this << "]: Aborting transfer [" << id_and_transfer.second << "] "
                       "failed: [" << curl_multi_strerror(result) << "].  Proceeding anyway.");
    }
  }
  m_ids_by_handle.clear();
  m_transfers.clear();

  if (m_multi)
  {
    const auto result = curl_multi_cleanup(m_multi);
    if (result != CURLM_OK)
    {
      FLOW_LOG_WARNING("Transfer_set [" << *this << "]: Multiplexer cleanup failed: "
                       "[" << curl_multi_strerror(result) << "].");
    }
  }
} // Transfer_set::~Transfer_set()

void Transfer_set::set_max_connections(long max_total, long max_per_host, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { set_max_connections(max_total, max_per_host, actual_err_code); },
         err_code, "Transfer_set::set_max_connections()"))
  {
    return;
  }
  // else

  if (!m_multi)
  {
    *err_code = error::Code::S_ILLEGAL_STATE;
    return;
  }
  // else

  auto result = curl_multi_setopt(m_multi, CURLMOPT_MAX_TOTAL_CONNECTIONS, max_total);
  if (result == CURLM_OK)
  {
    result = curl_multi_setopt(m_multi, CURLMOPT_MAX_HOST_CONNECTIONS, max_per_host);
  }
  *err_code = error::make_engine_multi_error_code(result);
}

Transfer_id Transfer_set::add(Transfer&& transfer, Error_code* err_code)
{
  Transfer_id id = 0;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Transfer_id { return add(std::move(transfer), actual_err_code); },
         &id, err_code, "Transfer_set::add()"))
  {
    return id;
  }
  // else

  if (!m_multi)
  {
    *err_code = error::Code::S_ILLEGAL_STATE;
    return 0;
  }
  // else
  if (transfer.null())
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return 0;
  }
  // else

  CURL* const easy = transfer.native_handle();
  *err_code = error::make_engine_multi_error_code(curl_multi_add_handle(m_multi, easy));
  if (*err_code)
  {
    FLOW_LOG_WARNING("Transfer_set [" << *this << "]: Registering transfer [" << transfer << "] failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return 0; // transfer untouched, as promised.
  }
  // else

  id = m_next_id++;
  m_transfers.emplace(id, std::move(transfer));
  m_ids_by_handle.emplace(easy, id);

  FLOW_LOG_TRACE("Transfer_set [" << *this << "]: Registered transfer ID [" << id << "]; "
                 "registered count now [" << m_transfers.size() << "].");
  return id;
} // Transfer_set::add()

size_t Transfer_set::drive(Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, drive, _1);

  if (!m_multi)
  {
    *err_code = error::Code::S_ILLEGAL_STATE;
    return 0;
  }
  // else

  int running = 0;
  *err_code = error::make_engine_multi_error_code(curl_multi_perform(m_multi, &running));
  if (*err_code)
  {
    FLOW_LOG_WARNING("Transfer_set [" << *this << "]: Driving failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return m_transfers.size();
  }
  // else
  return size_t(running);
}

std::optional<util::Fine_duration> Transfer_set::suggested_wait(Error_code* err_code)
{
  using std::optional;
  using util::Fine_duration;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(optional<Fine_duration>, suggested_wait, _1);

  if (!m_multi)
  {
    *err_code = error::Code::S_ILLEGAL_STATE;
    return std::nullopt;
  }
  // else

  long timeout_ms = -1;
  *err_code = error::make_engine_multi_error_code(curl_multi_timeout(m_multi, &timeout_ms));
  if (*err_code || (timeout_ms < 0))
  {
    return std::nullopt; // -1 = the engine has no opinion.
  }
  // else
  return Fine_duration(boost::chrono::milliseconds(timeout_ms));
}

void Transfer_set::wait(util::Fine_duration max_wait, Error_code* err_code)
{
  using boost::chrono::duration_cast;
  using boost::chrono::milliseconds;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { wait(max_wait, actual_err_code); },
         err_code, "Transfer_set::wait()"))
  {
    return;
  }
  // else

  if (!m_multi)
  {
    *err_code = error::Code::S_ILLEGAL_STATE;
    return;
  }
  // else

  int num_fds = 0;
  const auto timeout_ms = int(duration_cast<milliseconds>(max_wait).count());
  *err_code = error::make_engine_multi_error_code(curl_multi_wait(m_multi, nullptr, 0, timeout_ms, &num_fds));
}

size_t Transfer_set::drain_completions(const Completion_func& on_completion_func)
{
  if (!m_multi)
  {
    return 0;
  }
  // else

  size_t count = 0;
  int msgs_in_queue = 0;
  while (CURLMsg* const msg = curl_multi_info_read(m_multi, &msgs_in_queue))
  {
    if (msg->msg != CURLMSG_DONE)
    {
      continue; // As of this writing the engine defines no other kind; be ready for future ones.
    }
    // else

    const auto id_it = m_ids_by_handle.find(msg->easy_handle);
    if (id_it == m_ids_by_handle.end())
    {
      FLOW_LOG_WARNING("Transfer_set [" << *this << "]: Completion reported for unknown handle "
                       "[" << msg->easy_handle << "].  Ignoring.");
      continue;
    }
    // else

    // Copy out of msg before the callback; remove() may invalidate it.
    const auto id = id_it->second;
    const auto result = error::make_engine_error_code(msg->data.result);
    FLOW_LOG_TRACE("Transfer_set [" << *this << "]: Transfer ID [" << id << "] completed with "
                   "[" << result << "] [" << result.message() << "].");
    ++count;
    on_completion_func(id, result);
  }
  return count;
} // Transfer_set::drain_completions()

Transfer Transfer_set::remove(Transfer_id id, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Transfer, remove, id, _1);

  const auto it = m_transfers.find(id);
  if (it == m_transfers.end())
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return Transfer();
  }
  // else

  Transfer transfer(std::move(it->second));
  m_transfers.erase(it);
  m_ids_by_handle.erase(transfer.native_handle());

  *err_code = error::make_engine_multi_error_code(curl_multi_remove_handle(m_multi, transfer.native_handle()));
  if (*err_code)
  {
    FLOW_LOG_WARNING("Transfer_set [" << *this << "]: Unregistering transfer ID [" << id << "] failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].  Giving it back regardless.");
  }

  FLOW_LOG_TRACE("Transfer_set [" << *this << "]: Unregistered transfer ID [" << id << "]; "
                 "registered count now [" << m_transfers.size() << "].");
  return transfer;
} // Transfer_set::remove()

size_t Transfer_set::size() const
{
  return m_transfers.size();
}

bool Transfer_set::empty() const
{
  return m_transfers.empty();
}

bool Transfer_set::contains(Transfer_id id) const
{
  return m_transfers.find(id) != m_transfers.end();
}

const std::string& Transfer_set::nickname() const
{
  return m_nickname;
}

void perform_blocking(flow::log::Logger* logger_ptr, Transfer* transfer, Error_code* err_code)
{
  using util::Fine_duration;
  using boost::chrono::seconds;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { perform_blocking(logger_ptr, transfer, actual_err_code); },
         err_code, "perform_blocking()"))
  {
    return;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  // Upper bound on one blocking wait; the engine usually asks to be driven much sooner.
  constexpr Fine_duration S_MAX_WAIT = seconds(1);

  Transfer_set transfers(logger_ptr, "blocking", err_code);
  if (*err_code)
  {
    return;
  }
  // else

  const auto id = transfers.add(std::move(*transfer), err_code);
  if (*err_code)
  {
    return; // *transfer untouched.
  }
  // else

  FLOW_LOG_TRACE("Blocking transfer: Starting.");

  bool done = false;
  Error_code result;
  while (!done)
  {
    transfers.drive(err_code);
    if (*err_code)
    {
      break; // Multiplexer failure: give the transfer back unfinished, reporting that.
    }
    // else

    transfers.drain_completions([&](Transfer_id completed_id, const Error_code& completed_result)
    {
      if (completed_id == id)
      {
        done = true;
        result = completed_result;
      }
    });
    if (done)
    {
      break;
    }
    // else

    const auto suggested = transfers.suggested_wait(err_code);
    if (*err_code)
    {
      break;
    }
    // else
    transfers.wait(suggested ? std::min(*suggested, S_MAX_WAIT) : S_MAX_WAIT, err_code);
    if (*err_code)
    {
      break;
    }
  } // while (!done)

  Error_code remove_err_code;
  *transfer = transfers.remove(id, &remove_err_code);
  if (done)
  {
    *err_code = result;
  }
  else if (!*err_code)
  {
    *err_code = remove_err_code;
  }

  FLOW_LOG_TRACE("Blocking transfer: Finished with [" << *err_code << "] [" << err_code->message() << "].");
} // perform_blocking()

std::ostream& operator<<(std::ostream& os, const Transfer_set& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace xfer::transport::sync_io
