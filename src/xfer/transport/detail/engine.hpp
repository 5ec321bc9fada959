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

#include "xfer/common.hpp"
#include <flow/log/log.hpp>

namespace xfer::transport
{

// Free functions.

/**
 * Performs libcurl's process-wide initialization (`curl_global_init()`) the first time it is called in the process;
 * subsequent calls (from any thread, concurrently or not) yield the memorized result of that first attempt.
 * Every path that creates an engine handle (Transfer, sync_io::Transfer_set) invokes this first.
 *
 * The matching `curl_global_cleanup()` is never called: engine handles may be destroyed as late as static
 * deinitialization.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_ENGINE_INIT_FAILED.
 */
void init_engine_globally(flow::log::Logger* logger_ptr, Error_code* err_code = 0);

} // namespace xfer::transport
