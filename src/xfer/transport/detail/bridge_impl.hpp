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

#include "xfer/transport/bridge.hpp"
#include "xfer/transport/detail/worker.hpp"
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>

namespace xfer::transport
{

// Types.

/**
 * Internal, non-movable pImpl implementation of Bridge class, shared by all copies of one Bridge.
 * It owns the request channel (a Bounded_channel of Request) and the Worker consuming it.
 *
 * Its destructor, run when the last Bridge copy goes away, is the whole shutdown sequence: close the channel, so
 * no further Request can enter; await the Worker's State::S_STOPPED, meaning every registered transfer has been
 * replied to (or aborted, because its submitter left); then destroy the Worker, which joins thread W.
 */
class Bridge::Impl :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * See Bridge ctor.
   *
   * @param logger_ptr
   *        See Bridge ctor.
   * @param nickname_str
   *        See Bridge ctor.
   * @param config
   *        See Bridge ctor.
   * @param err_code
   *        See Bridge ctor.
   */
  explicit Impl(flow::log::Logger* logger_ptr, util::String_view nickname_str, const Bridge_config& config,
                Error_code* err_code);

  /// See class doc header.
  ~Impl();

  // Methods.

  /**
   * See Bridge::submit().
   * @param transfer
   *        See Bridge::submit().
   * @return See Bridge::submit().
   */
  Reply_receiver submit(Transfer&& transfer);

  /**
   * See Bridge::async_submit().
   * @param transfer
   *        See Bridge::async_submit().
   * @param on_done_func
   *        See Bridge::async_submit().
   */
  void async_submit(Transfer&& transfer, On_done_func&& on_done_func);

  /**
   * See Bridge::nickname().
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * See Bridge::config().
   * @return See above.
   */
  const Bridge_config& config() const;

private:
  // Methods.

  /**
   * Gets the Request to the Worker: via the channel; or directly if in thread W.  If neither is possible, replies
   * with error::Code::S_CHANNEL_SEND_FAILED, synchronously.
   *
   * @param request
   *        The Request.
   * @param may_block
   *        If `false`, a full channel does not block us: the Request is posted to thread W instead.
   */
  void submit_request(Request&& request, bool may_block);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See config().
  const Bridge_config m_config;

  /// The request channel.  Null if construction failed (invalid config).
  boost::movelib::unique_ptr<Worker::Request_channel> m_channel;

  /// The worker.  Null if construction failed.
  boost::movelib::unique_ptr<Worker> m_worker;
}; // class Bridge::Impl

// Free functions.

/**
 * Prints string representation of the given Bridge::Impl to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Bridge::Impl& val);

} // namespace xfer::transport
