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
#include "xfer/transport/detail/engine.hpp"
#include "xfer/transport/error.hpp"
#include <flow/error/error.hpp>
#include <curl/curl.h>
#include <mutex>

namespace xfer::transport
{

// Implementations.

void init_engine_globally(flow::log::Logger* logger_ptr, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { init_engine_globally(logger_ptr, actual_err_code); },
         err_code, "init_engine_globally()"))
  {
    return;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  static std::once_flag s_once;
  static CURLcode s_result = CURLE_OK;

  std::call_once(s_once, [&]()
  {
    s_result = curl_global_init(CURL_GLOBAL_ALL);
    if (s_result == CURLE_OK)
    {
      FLOW_LOG_INFO("Transfer engine globally initialized: [" << curl_version() << "].");
    }
    else
    {
      FLOW_LOG_WARNING("Transfer engine global init failed: "
                       "[" << error::make_engine_error_code(s_result) << "] "
                       "[" << curl_easy_strerror(s_result) << "].  All engine-handle creation shall fail.");
    }
  });

  if (s_result == CURLE_OK)
  {
    err_code->clear();
  }
  else
  {
    *err_code = error::Code::S_ENGINE_INIT_FAILED;
  }
} // init_engine_globally()

} // namespace xfer::transport
