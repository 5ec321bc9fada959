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

// flow/common.hpp must #undef FLOW_LOG_CFG_COMPONENT_ENUM_* before we #define them; hence this goes first.
#include <flow/util/util.hpp>

#include "xfer/detail/common.hpp"

/* The APIs and header-inlined stuff (templates, most notably transport::Transfer_builder) require C++17 or newer;
 * and that applies to the `#include`ing translation unit too.  So fail compile otherwise. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any xfer/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Xfer project: a library in modern C++17 that exposes a blocking, poll-driven
 * transfer engine (libcurl's easy/multi interface) as an awaitable, cancellation-tolerant, concurrency-safe
 * operation.  Many transfers can be in flight at once without a thread per transfer, and without ever blocking
 * a thread that is shared with unrelated asynchronous work.
 *
 * From the user's perspective the namespace consists of:
 *   - Symbols directly in `xfer`: the most basic, commonly used ones, such as the alias xfer::Error_code and
 *     `enum class` xfer::Log_component.
 *   - Sub-namespaces, each representing a module:
 *     - *xfer::transport*: the actual point of the library.  In bottom-up order:
 *       - transport::Response_sink accumulates a response body, chunk by chunk, in arrival order.
 *       - transport::Transfer is one configured transfer (an engine easy handle) plus its Response_sink.
 *       - transport::sync_io::Transfer_set is the engine's multiplexer: it holds many `Transfer`s and advances
 *         all of them with one non-blocking call.  It never starts threads; its owner drives it.
 *       - transport::Bounded_channel and transport::Reply_sender / transport::Reply_receiver are the request
 *         and reply channels of the actor protocol.
 *       - transport::Bridge is the cloneable front-end.  It owns (shared among its copies) a background
 *         worker thread W, which alone owns and drives a `Transfer_set`.
 *       - transport::Transfer_builder is the type-state builder: `Transfer_builder<Building>` takes options;
 *         `finalize()` yields `Transfer_builder<Finalized>`, which alone can `perform()`.
 *     - *xfer::util*: miscellaneous aliases used throughout.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * Xfer requires Flow and Boost, not only internally but also in its APIs.  `flow::log` is the assumed logging
 * system; `flow::Error_code` and related conventions are used for error reporting; `flow::async` supplies the
 * worker thread.
 *
 * ### Error reporting ###
 * As in Flow: an API that can fail takes a trailing `Error_code* err_code = 0`.  If non-null, `*err_code` is
 * set to success or the error; if null, an error causes `flow::error::Runtime_error` to be thrown instead.
 *
 * ### Logging ###
 * Supply a `flow::log::Logger*` to the various APIs to enable logging; null means log nowhere.
 */
namespace xfer
{

// Types.  They're outside of `namespace ::xfer::util` for brevity due to their frequent use.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef XFER_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing the log components used by Xfer internal logging.
 * The user specifies it, rarely, when configuring logging via
 * `flow::log::Config::init_component_to_union_idx_mapping()` and `flow::log::Config::init_component_names()`.
 *
 * The members are generated by `flow::log` macro magic; see `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only.  See doc header above.
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in xfer::Log_component to its
 * string representation as used in log output and verbosity config.  `S_SOME_NAME` maps to `"SOME_NAME"`
 * (optionally prefixed as supplied to `flow::log::Config::init_component_names()`).
 */
extern const boost::unordered_multimap<Log_component, std::string> S_XFER_LOG_COMPONENT_NAME_MAP;

#endif // XFER_DOXYGEN_ONLY

} // namespace xfer
