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
#include "xfer/transport/transfer_builder.hpp"
#include <flow/error/error.hpp>
#include <boost/chrono.hpp>
#include <boost/chrono/round.hpp>

namespace xfer::transport
{

namespace
{

/**
 * Converts a duration to whole milliseconds, as libcurl's `*_MS` options want them.
 * @param duration
 *        Duration.
 * @return See above.
 */
long to_msec(util::Fine_duration duration)
{
  return long(boost::chrono::round<boost::chrono::milliseconds>(duration).count());
}

} // namespace (anon)

// Transfer_builder<Building> implementations.

Transfer_builder<Building>::Transfer_builder(const Bridge& bridge, Response_sink&& sink, Error_code* err_code) :
  flow::log::Log_context(bridge.get_logger(), Log_component::S_TRANSPORT),
  m_bridge(bridge),
  m_sticky_err_code(),
  m_transfer(get_logger(), std::move(sink), &m_sticky_err_code)
{
  if (m_sticky_err_code)
  {
    if (err_code)
    {
      *err_code = m_sticky_err_code;
      return;
    }
    // else
    throw flow::error::Runtime_error(m_sticky_err_code, "Transfer_builder::Transfer_builder()");
  }
  // else
  if (err_code)
  {
    err_code->clear();
  }
}

Transfer_builder<Building>::Transfer_builder(Transfer_builder&& src) = default;

Transfer_builder<Finalized> Transfer_builder<Building>::finalize() &&
{
  FLOW_LOG_TRACE("Transfer_builder: Finalizing transfer [" << m_transfer << "] for bridge [" << m_bridge << "]; "
                 "sticky error [" << m_sticky_err_code << "].");
  return Transfer_builder<Finalized>(std::move(m_bridge), std::move(m_transfer), m_sticky_err_code);
}

const Error_code& Transfer_builder<Building>::sticky_err_code() const
{
  return m_sticky_err_code;
}

void Transfer_builder<Building>::apply(const Setter_func& setter_func, Error_code* err_code, const char* context)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { apply(setter_func, actual_err_code, context); },
         err_code, context))
  {
    return;
  }
  // else

  if (m_sticky_err_code)
  {
    *err_code = m_sticky_err_code; // Already failed: do nothing but report it again.
    return;
  }
  // else

  setter_func(err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Transfer_builder: [" << context << "] failed on transfer [" << m_transfer << "]: "
                     "[" << *err_code << "] [" << err_code->message() << "] "
                     "[" << m_transfer.engine_error_detail() << "].  This error now sticks.");
    m_sticky_err_code = *err_code;
  }
}

void Transfer_builder<Building>::apply_string(CURLoption option, util::String_view value, Error_code* err_code,
                                              const char* context)
{
  const std::string value_str(value); // NUL-terminated.  The engine copies it.
  apply([&](Error_code* actual_err_code) { m_transfer.set_option(option, value_str.c_str(), actual_err_code); },
        err_code, context);
}

void Transfer_builder<Building>::apply_long(CURLoption option, long value, Error_code* err_code,
                                            const char* context)
{
  apply([&](Error_code* actual_err_code) { m_transfer.set_option(option, value, actual_err_code); },
        err_code, context);
}

Transfer_builder<Building>&& Transfer_builder<Building>::url(util::String_view url, Error_code* err_code) &&
{
  apply_string(CURLOPT_URL, url, err_code, "Transfer_builder::url()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::port(uint16_t port, Error_code* err_code) &&
{
  apply_long(CURLOPT_PORT, long(port), err_code, "Transfer_builder::port()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::get(bool enable, Error_code* err_code) &&
{
  apply_long(CURLOPT_HTTPGET, long(enable), err_code, "Transfer_builder::get()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::post(bool enable, Error_code* err_code) &&
{
  apply_long(CURLOPT_POST, long(enable), err_code, "Transfer_builder::post()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::post_fields_copy(const util::Blob_const& body,
                                                                          Error_code* err_code) &&
{
  apply([&](Error_code* actual_err_code)
  {
    // Size first: otherwise the engine would strlen() the data, which need not be NUL-terminated.
    m_transfer.set_option(CURLOPT_POSTFIELDSIZE_LARGE, curl_off_t(body.size()), actual_err_code);
    if (!*actual_err_code)
    {
      m_transfer.set_option(CURLOPT_COPYPOSTFIELDS, static_cast<const char*>(body.data()), actual_err_code);
    }
  }, err_code, "Transfer_builder::post_fields_copy()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::custom_request(util::String_view method,
                                                                        Error_code* err_code) &&
{
  apply_string(CURLOPT_CUSTOMREQUEST, method, err_code, "Transfer_builder::custom_request()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::nobody(bool enable, Error_code* err_code) &&
{
  apply_long(CURLOPT_NOBODY, long(enable), err_code, "Transfer_builder::nobody()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::http_headers(const std::vector<std::string>& headers,
                                                                      Error_code* err_code) &&
{
  apply([&](Error_code* actual_err_code) { m_transfer.set_headers(headers, actual_err_code); },
        err_code, "Transfer_builder::http_headers()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::user_agent(util::String_view agent, Error_code* err_code) &&
{
  apply_string(CURLOPT_USERAGENT, agent, err_code, "Transfer_builder::user_agent()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::referer(util::String_view referer, Error_code* err_code) &&
{
  apply_string(CURLOPT_REFERER, referer, err_code, "Transfer_builder::referer()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::accept_encoding(util::String_view encoding,
                                                                         Error_code* err_code) &&
{
  apply_string(CURLOPT_ACCEPT_ENCODING, encoding, err_code, "Transfer_builder::accept_encoding()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::follow_location(bool enable, Error_code* err_code) &&
{
  apply_long(CURLOPT_FOLLOWLOCATION, long(enable), err_code, "Transfer_builder::follow_location()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::max_redirections(long max, Error_code* err_code) &&
{
  apply_long(CURLOPT_MAXREDIRS, max, err_code, "Transfer_builder::max_redirections()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::timeout(util::Fine_duration timeout,
                                                                 Error_code* err_code) &&
{
  apply_long(CURLOPT_TIMEOUT_MS, to_msec(timeout), err_code, "Transfer_builder::timeout()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::connect_timeout(util::Fine_duration timeout,
                                                                         Error_code* err_code) &&
{
  apply_long(CURLOPT_CONNECTTIMEOUT_MS, to_msec(timeout), err_code, "Transfer_builder::connect_timeout()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::low_speed_limit(long bytes_per_sec,
                                                                         Error_code* err_code) &&
{
  apply_long(CURLOPT_LOW_SPEED_LIMIT, bytes_per_sec, err_code, "Transfer_builder::low_speed_limit()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::low_speed_time(util::Fine_duration period,
                                                                        Error_code* err_code) &&
{
  using boost::chrono::seconds;
  using boost::chrono::round;

  apply_long(CURLOPT_LOW_SPEED_TIME, long(round<seconds>(period).count()), err_code,
             "Transfer_builder::low_speed_time()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::verbose(bool enable, Error_code* err_code) &&
{
  apply_long(CURLOPT_VERBOSE, long(enable), err_code, "Transfer_builder::verbose()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::fail_on_error(bool enable, Error_code* err_code) &&
{
  apply_long(CURLOPT_FAILONERROR, long(enable), err_code, "Transfer_builder::fail_on_error()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::ssl_verify_peer(bool enable, Error_code* err_code) &&
{
  apply_long(CURLOPT_SSL_VERIFYPEER, long(enable), err_code, "Transfer_builder::ssl_verify_peer()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::ssl_verify_host(bool enable, Error_code* err_code) &&
{
  apply_long(CURLOPT_SSL_VERIFYHOST, enable ? 2L : 0L, err_code, "Transfer_builder::ssl_verify_host()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::cainfo(util::String_view path, Error_code* err_code) &&
{
  apply_string(CURLOPT_CAINFO, path, err_code, "Transfer_builder::cainfo()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::proxy(util::String_view proxy_url, Error_code* err_code) &&
{
  apply_string(CURLOPT_PROXY, proxy_url, err_code, "Transfer_builder::proxy()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::proxy_port(uint16_t port, Error_code* err_code) &&
{
  apply_long(CURLOPT_PROXYPORT, long(port), err_code, "Transfer_builder::proxy_port()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::noproxy(util::String_view hosts, Error_code* err_code) &&
{
  apply_string(CURLOPT_NOPROXY, hosts, err_code, "Transfer_builder::noproxy()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::unix_socket(util::String_view path, Error_code* err_code) &&
{
  apply_string(CURLOPT_UNIX_SOCKET_PATH, path, err_code, "Transfer_builder::unix_socket()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::username(util::String_view name, Error_code* err_code) &&
{
  apply_string(CURLOPT_USERNAME, name, err_code, "Transfer_builder::username()");
  return std::move(*this);
}

Transfer_builder<Building>&& Transfer_builder<Building>::password(util::String_view password,
                                                                  Error_code* err_code) &&
{
  apply_string(CURLOPT_PASSWORD, password, err_code, "Transfer_builder::password()");
  return std::move(*this);
}

// Transfer_builder<Finalized> implementations.

Transfer_builder<Finalized>::Transfer_builder(Bridge&& bridge, Transfer&& transfer,
                                              const Error_code& sticky_err_code) :
  flow::log::Log_context(bridge.get_logger(), Log_component::S_TRANSPORT),
  m_bridge(std::move(bridge)),
  m_transfer(std::move(transfer)),
  m_sticky_err_code(sticky_err_code)
{
  // Yay.
}

Transfer_builder<Finalized>::Transfer_builder(Transfer_builder&& src) = default;

Reply_receiver Transfer_builder<Finalized>::perform() &&
{
  if (!m_sticky_err_code)
  {
    return m_bridge.submit(std::move(m_transfer));
  }
  // else

  FLOW_LOG_INFO("Transfer_builder: Not submitting transfer [" << m_transfer << "]: configuration failed earlier "
                "with [" << m_sticky_err_code << "] [" << m_sticky_err_code.message() << "].");

  Reply_sender sender;
  Reply_receiver receiver;
  make_reply_channel(&sender, &receiver);
  [[maybe_unused]] const bool sent = sender.send(m_sticky_err_code, std::move(m_transfer));
  assert(sent && "The receiver is right here; it cannot be gone.");
  return receiver;
}

void Transfer_builder<Finalized>::async_perform(Bridge::On_done_func&& on_done_func) &&
{
  if (!m_sticky_err_code)
  {
    m_bridge.async_submit(std::move(m_transfer), std::move(on_done_func));
    return;
  }
  // else

  FLOW_LOG_INFO("Transfer_builder: Not submitting transfer [" << m_transfer << "]: configuration failed earlier "
                "with [" << m_sticky_err_code << "] [" << m_sticky_err_code.message() << "].");
  on_done_func(m_sticky_err_code, std::move(m_transfer));
}

Transfer Transfer_builder<Finalized>::release(Error_code* err_code) &&
{
  if (m_sticky_err_code && (!err_code))
  {
    throw flow::error::Runtime_error(m_sticky_err_code, "Transfer_builder<Finalized>::release()");
  }
  // else
  if (err_code)
  {
    *err_code = m_sticky_err_code;
  }
  return std::move(m_transfer);
}

const Error_code& Transfer_builder<Finalized>::sticky_err_code() const
{
  return m_sticky_err_code;
}

} // namespace xfer::transport
