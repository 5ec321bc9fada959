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

namespace xfer::transport
{

// Types.

/**
 * Accumulates a response body, in the order the engine delivers its chunks, for retrieval after the transfer
 * completes.  A Transfer owns exactly one of these; the engine writes into it (from thread W, while the Transfer
 * is registered in a sync_io::Transfer_set) via write_callback().
 *
 * A default-constructed sink is empty.  It is copyable and movable; but once given to a Transfer, access it only
 * through that Transfer (Transfer::sink(), Transfer::take_body()).
 *
 * ### Thread safety ###
 * Same as for standard library containers.
 */
class Response_sink
{
public:
  // Constructors/destructor.

  /// Constructs empty sink.
  Response_sink();

  /**
   * Constructs empty sink with storage for at least `capacity_hint` bytes pre-reserved.
   *
   * @param capacity_hint
   *        Expected body size.  Exceeding it is fine.
   */
  explicit Response_sink(size_t capacity_hint);

  // Methods.

  /**
   * Appends the given chunk after all previously appended ones.
   *
   * @param chunk
   *        Bytes to copy.  Size 0 is allowed and is a no-op.
   */
  void append(const util::Blob_const& chunk);

  /**
   * The bytes accumulated so far, in order.
   * @return See above.
   */
  const util::Bytes& data() const;

  /**
   * Moves the accumulated bytes out; `*this` becomes empty.
   * @return See above.
   */
  util::Bytes take();

  /**
   * View of data() as characters; valid until the next non-`const` call.
   * @return See above.
   */
  util::String_view str() const;

  /**
   * Number of bytes accumulated.
   * @return See above.
   */
  size_t size() const;

  /**
   * `size() == 0`.
   * @return See above.
   */
  bool empty() const;

  /// Discards all accumulated bytes.
  void clear();

  /**
   * libcurl `CURLOPT_WRITEFUNCTION`-compatible callback: appends `[ptr, ptr + size * nmemb)` to the Response_sink
   * at `sink_ptr` (as set via `CURLOPT_WRITEDATA`).
   *
   * @param ptr
   *        Chunk start.
   * @param size
   *        Always 1 per libcurl docs.
   * @param nmemb
   *        Chunk size.
   * @param sink_ptr
   *        `Response_sink*`.
   * @return Number of bytes consumed; always all of them.
   */
  static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* sink_ptr);

private:
  // Data.

  /// See data().
  util::Bytes m_data;
}; // class Response_sink

} // namespace xfer::transport
