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
#include "xfer/transport/transfer.hpp"
#include "xfer/transport/detail/engine.hpp"
#include <boost/move/make_unique.hpp>
#include <array>
#include <boost/chrono.hpp>
#include <ostream>

namespace xfer::transport
{

// Types.

struct Transfer::State
{
  // Constructors/destructor.

  /**
   * Takes the sink; handle stays null for now.
   * @param sink
   *        Moved-into #m_sink.
   */
  explicit State(Response_sink&& sink);

  /// Releases #m_easy and #m_headers.
  ~State();

  // Data.

  /// The engine handle.  Null only briefly during construction.
  CURL* m_easy;

  /// Body accumulator; `CURLOPT_WRITEDATA` points here.
  Response_sink m_sink;

  /// Custom request headers; `CURLOPT_HTTPHEADER` points here when not null.
  curl_slist* m_headers;

  /// `CURLOPT_ERRORBUFFER` points here.
  std::array<char, CURL_ERROR_SIZE> m_err_buf;
}; // struct Transfer::State

// Implementations.

Transfer::State::State(Response_sink&& sink) :
  m_easy(nullptr),
  m_sink(std::move(sink)),
  m_headers(nullptr)
{
  m_err_buf[0] = '\0';
}

Transfer::State::~State()
{
  if (m_easy)
  {
    curl_easy_cleanup(m_easy);
  }
  if (m_headers)
  {
    curl_slist_free_all(m_headers);
  }
}

Transfer::Transfer() :
  flow::log::Log_context(nullptr, Log_component::S_TRANSPORT)
{
  // That's it.  Null.
}

Transfer::Transfer(flow::log::Logger* logger_ptr, Response_sink&& sink, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT)
{
  using boost::movelib::make_unique;

  Error_code our_err_code;
  init_engine_globally(get_logger(), &our_err_code);

  auto state = make_unique<State>(std::move(sink));
  if (!our_err_code)
  {
    state->m_easy = curl_easy_init();
    if (!state->m_easy)
    {
      our_err_code = error::Code::S_ENGINE_INIT_FAILED;
    }
  }

  if (!our_err_code)
  {
    /* These pointers stay valid across moves of *this, since State is heap-allocated once.
     * NOSIGNAL: we live in a multithreaded process, and the engine's signal-based DNS timeouts are not safe there. */
    CURL* const easy = state->m_easy;
    CURLcode result = curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &Response_sink::write_callback);
    if (result == CURLE_OK)
    {
      result = curl_easy_setopt(easy, CURLOPT_WRITEDATA, static_cast<void*>(&state->m_sink));
    }
    if (result == CURLE_OK)
    {
      result = curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, state->m_err_buf.data());
    }
    if (result == CURLE_OK)
    {
      result = curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    }
    our_err_code = error::make_engine_error_code(result);
  }

  if (our_err_code)
  {
    FLOW_LOG_WARNING("Transfer: Creation failed: [" << our_err_code << "] [" << our_err_code.message() << "].");
    if (err_code)
    {
      *err_code = our_err_code;
      return; // State dtor cleans up.  We are null.
    }
    // else
    throw flow::error::Runtime_error(our_err_code, "Transfer::Transfer()");
  }
  // else

  m_state = std::move(state);
  if (err_code)
  {
    err_code->clear();
  }
  FLOW_LOG_TRACE("Transfer [" << *this << "]: Created.");
} // Transfer::Transfer()

Transfer::Transfer(Transfer&& src) = default;

Transfer::~Transfer() = default;

Transfer& Transfer::operator=(Transfer&& src) = default;

bool Transfer::null() const
{
  return !m_state;
}

CURL* Transfer::native_handle() const
{
  return null() ? nullptr : m_state->m_easy;
}

const Response_sink& Transfer::sink() const
{
  assert((!null()) && "sink() on null Transfer is undefined behavior, as advertised.");
  return m_state->m_sink;
}

util::Bytes Transfer::take_body()
{
  return null() ? util::Bytes() : m_state->m_sink.take();
}

long Transfer::response_code(Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(long, response_code, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  long code = 0;
  get_info(CURLINFO_RESPONSE_CODE, &code, err_code);
  return code;
}

std::string Transfer::effective_url(Error_code* err_code) const
{
  using std::string;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(string, effective_url, _1);

  char* url = nullptr;
  get_info(CURLINFO_EFFECTIVE_URL, &url, err_code);
  return url ? string(url) : string();
}

std::string Transfer::content_type(Error_code* err_code) const
{
  using std::string;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(string, content_type, _1);

  char* type = nullptr; // Stays null if the response carried no such header.
  get_info(CURLINFO_CONTENT_TYPE, &type, err_code);
  return type ? string(type) : string();
}

util::Fine_duration Transfer::total_time(Error_code* err_code) const
{
  using util::Fine_duration;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Fine_duration, total_time, _1);

  curl_off_t usec = 0;
  get_info(CURLINFO_TOTAL_TIME_T, &usec, err_code);
  return boost::chrono::microseconds(usec);
}

std::string Transfer::engine_error_detail() const
{
  return null() ? std::string() : std::string(m_state->m_err_buf.data());
}

void Transfer::set_headers(const std::vector<std::string>& headers, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { set_headers(headers, actual_err_code); },
         err_code, "Transfer::set_headers()"))
  {
    return;
  }
  // else

  if (null())
  {
    *err_code = error::Code::S_ILLEGAL_STATE;
    return;
  }
  // else

  curl_slist* list = nullptr;
  for (const auto& header : headers)
  {
    curl_slist* const new_list = curl_slist_append(list, header.c_str());
    if (!new_list)
    {
      FLOW_LOG_WARNING("Transfer [" << *this << "]: Could not build header list at [" << header << "].");
      curl_slist_free_all(list);
      *err_code = error::Code::S_INVALID_ARGUMENT;
      return;
    }
    // else
    list = new_list;
  }

  // Point the handle at the new list (possibly null = none) before freeing the old one.
  set_option(CURLOPT_HTTPHEADER, list, err_code);
  if (*err_code)
  {
    curl_slist_free_all(list);
    return;
  }
  // else

  if (m_state->m_headers)
  {
    curl_slist_free_all(m_state->m_headers);
  }
  m_state->m_headers = list;
} // Transfer::set_headers()

std::ostream& operator<<(std::ostream& os, const Transfer& val)
{
  if (val.null())
  {
    return os << "null@" << static_cast<const void*>(&val);
  }
  // else
  return os << "easy@" << static_cast<const void*>(val.native_handle());
}

} // namespace xfer::transport
