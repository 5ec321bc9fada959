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
#include <boost/chrono.hpp>
#include <string>
#include <type_traits>

namespace xfer::test
{

/**
 * Returns the name of the currently running test suite; e.g., for use as an object nickname.
 *
 * @return See above.
 */
std::string get_test_suite_name();

/**
 * Polls the given predicate until it returns `true` or the timeout elapses.
 *
 * @param pred The predicate.
 * @param timeout Upper bound on the waiting.
 * @param period Pause between polls.
 *
 * @return Whether `pred` returned `true` in time.
 */
bool wait_until(const Function<bool ()>& pred, util::Fine_duration timeout,
                util::Fine_duration period = boost::chrono::milliseconds(5));

/**
 * Casts an enumeration to its primitive type.
 *
 * @tparam Enum The enumeration type.
 * @param e The enumeration value.
 *
 * @return The primitive type form of the enumeration value.
 */
template <class Enum>
constexpr std::underlying_type_t<Enum> to_underlying(Enum e) noexcept
{
  return static_cast<std::underlying_type_t<Enum>>(e);
}

} // namespace xfer::test
