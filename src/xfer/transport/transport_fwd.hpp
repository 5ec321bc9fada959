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

#include "xfer/util/util_fwd.hpp"

/**
 * Xfer module providing the actor-based asynchronous bridge over the blocking transfer engine.  See namespace
 * ::xfer doc header for a bottom-up synopsis of its pieces.
 *
 * In short: build a Transfer via Transfer_builder; `finalize()` it; `perform()` it, which goes through
 * Bridge::submit(); the resulting Reply_receiver yields the Transfer back, now holding its response, or an
 * #Error_code naming the layer that failed.
 *
 * Threads: "thread U" is any user thread calling into these APIs; "thread W" is a Bridge's background worker
 * thread, which exclusively owns the sync_io::Transfer_set and every Transfer registered in it.
 */
namespace xfer::transport
{

// Types.

// Find doc headers near the bodies of these compound types.

class Response_sink;
class Transfer;
struct Bridge_config;
class Bridge;
class Reply_sender;
class Reply_receiver;
struct Request;
template<typename Payload>
class Bounded_channel;
struct Building;
struct Finalized;
template<typename State>
class Transfer_builder;
class Worker;

/**
 * Signature of a completion handler for Bridge::async_submit() and similar: receives the outcome and, regardless
 * of outcome, the Transfer that was submitted (when it could be recovered).
 */
using Transfer_done_func = Function<void (const Error_code& err_code, Transfer&& transfer)>;

// Free functions.

/**
 * Prints string representation of the given Response_sink to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Response_sink& val);

/**
 * Prints string representation of the given Transfer to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Transfer& val);

/**
 * Prints string representation of the given Bridge_config to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Bridge_config& val);

/**
 * Prints string representation of the given Bridge to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Bridge& val);

/**
 * Prints string representation of the given Reply_receiver to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Reply_receiver& val);

/**
 * Prints string representation of the given Worker to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Worker& val);

} // namespace xfer::transport

/**
 * `sync_io`-pattern counterparts to async-I/O-pattern objects in parent namespace xfer::transport.
 * Objects here never start threads; they are driven, non-blockingly, by their owner.
 */
namespace xfer::transport::sync_io
{

// Types.

class Transfer_set;

/// Identifies a Transfer registered in a Transfer_set, from Transfer_set::add() until Transfer_set::remove().
using Transfer_id = uint64_t;

// Free functions.

/**
 * Prints string representation of the given Transfer_set to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Transfer_set& val);

} // namespace xfer::transport::sync_io
