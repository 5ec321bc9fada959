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

// Include Bridge::Impl class body to complete that type and enable pImpl forwarding.
#include "xfer/transport/detail/bridge_impl.hpp"
#include <boost/make_shared.hpp>
#include <boost/chrono/io/duration_io.hpp>
#include <ostream>

namespace xfer::transport
{

// Implementations (strict pImpl-idiom style).

Bridge::Bridge(flow::log::Logger* logger_ptr, util::String_view nickname_str, const Bridge_config& config,
               Error_code* err_code) :
  m_impl(boost::make_shared<Impl>(logger_ptr, nickname_str, config, err_code))
{
  // Yay.
}

// Copies share m_impl; that is the whole point.

Bridge::Bridge(const Bridge&) = default;
Bridge::Bridge(Bridge&&) = default;
Bridge& Bridge::operator=(const Bridge&) = default;
Bridge& Bridge::operator=(Bridge&&) = default;

Bridge::~Bridge() = default; // The last one out runs ~Impl(), the shutdown sequence.

// The rest is strict forwarding to m_impl; a moved-from Bridge acts like one whose Worker is gone.

Reply_receiver Bridge::submit(Transfer&& transfer)
{
  if (m_impl)
  {
    return m_impl->submit(std::move(transfer));
  }
  // else

  Reply_sender sender;
  Reply_receiver receiver;
  make_reply_channel(&sender, &receiver);
  [[maybe_unused]] const bool sent = sender.send(error::Code::S_CHANNEL_SEND_FAILED, std::move(transfer));
  assert(sent && "The receiver is right here; it cannot be gone.");
  return receiver;
}

void Bridge::async_submit(Transfer&& transfer, On_done_func&& on_done_func)
{
  if (m_impl)
  {
    m_impl->async_submit(std::move(transfer), std::move(on_done_func));
    return;
  }
  // else
  on_done_func(error::Code::S_CHANNEL_SEND_FAILED, std::move(transfer));
}

const std::string& Bridge::nickname() const
{
  static const std::string S_EMPTY;
  return m_impl ? m_impl->nickname() : S_EMPTY;
}

const Bridge_config& Bridge::config() const
{
  static const Bridge_config S_DEFAULT;
  return m_impl ? m_impl->config() : S_DEFAULT;
}

flow::log::Logger* Bridge::get_logger() const
{
  return m_impl ? m_impl->get_logger() : nullptr;
}

long Bridge::use_count() const
{
  return m_impl.use_count();
}

std::ostream& operator<<(std::ostream& os, const Bridge& val)
{
  if (!val.m_impl)
  {
    return os << "null_bridge@" << static_cast<const void*>(&val);
  }
  // else
  return os << *val.m_impl;
}

std::ostream& operator<<(std::ostream& os, const Bridge_config& val)
{
  return os << "queue_cap[" << val.m_request_queue_capacity << "] "
               "default_wait[" << val.m_default_wait << "] poll_slice[" << val.m_poll_slice << "] "
               "max_conns[" << val.m_max_total_connections << '/' << val.m_max_host_connections << ']';
}

} // namespace xfer::transport
