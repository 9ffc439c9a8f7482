/* Ordo
 * Copyright 2026 The Ordo Authors
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

#include "ordo/log/log.hpp"
#include <boost/io/ios_state.hpp>
#include <ostream>

namespace ordo::log
{

// Types.

/**
 * Utility class, each object of which wraps a given `ostream` and outputs discrete messages to it adorned with
 * time stamps and other formatting such as separating newlines.  A `Logger` implementation uses it, inside
 * whatever synchronization it provides, for the formatting work.
 *
 * Format of each line:
 *   `<local date/time with microseconds> [<sev>]: T<thread nickname or ID>: <component>: <file>:<function>(<line>): <msg>`
 * where `<component>: ` is omitted when Config declines to print the component (e.g., it is empty).
 *
 * ### Thread safety ###
 * None.  Protect each object with a mutex, if accessed concurrently.
 */
class Ostream_log_msg_writer :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs object wrapping the given `ostream`.  The stream's formatting state is saved and restored at
   * destruction.
   *
   * @param config
   *        Controls the component output.  Must exist at least as long as `*this`.
   * @param os
   *        Stream to wrap.  Must exist at least as long as `*this`.
   */
  explicit Ostream_log_msg_writer(const Config& config, std::ostream& os);

  // Methods.

  /**
   * Logs to the wrapped `ostream` the given message and associated metadata, followed by a newline and flush.
   *
   * @param metadata
   *        All information about the message except the message itself.
   * @param msg
   *        The message.
   */
  void log(const Msg_metadata& metadata, util::String_view msg);

private:
  // Data.

  /// Reference to the config object passed to constructor.
  const Config& m_config;

  /// Reference to stream to which to log messages.
  std::ostream& m_os;

  /// Saves `m_os` formatting state at construction; restores it at destruction.
  boost::io::ios_all_saver m_clean_os_state;
}; // class Ostream_log_msg_writer

} // namespace ordo::log
