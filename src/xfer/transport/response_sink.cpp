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
#include "xfer/transport/response_sink.hpp"
#include <ostream>

namespace xfer::transport
{

// Implementations.

Response_sink::Response_sink() = default;

Response_sink::Response_sink(size_t capacity_hint)
{
  m_data.reserve(capacity_hint);
}

void Response_sink::append(const util::Blob_const& chunk)
{
  const auto begin = static_cast<const uint8_t*>(chunk.data());
  m_data.insert(m_data.end(), begin, begin + chunk.size());
}

const util::Bytes& Response_sink::data() const
{
  return m_data;
}

util::Bytes Response_sink::take()
{
  util::Bytes taken;
  taken.swap(m_data);
  return taken;
}

util::String_view Response_sink::str() const
{
  return util::String_view(reinterpret_cast<const char*>(m_data.data()), m_data.size());
}

size_t Response_sink::size() const
{
  return m_data.size();
}

bool Response_sink::empty() const
{
  return m_data.empty();
}

void Response_sink::clear()
{
  m_data.clear();
}

size_t Response_sink::write_callback(char* ptr, size_t size, size_t nmemb, void* sink_ptr) // Static.
{
  const size_t n = size * nmemb;
  static_cast<Response_sink*>(sink_ptr)->append(util::Blob_const(ptr, n));
  return n;
}

std::ostream& operator<<(std::ostream& os, const Response_sink& val)
{
  return os << "sink[sz=" << val.size() << "]@" << static_cast<const void*>(&val);
}

} // namespace xfer::transport
