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

#include "ordo/log/ostream_log_msg_writer.hpp"
#include "ordo/log/log.hpp"
#include "ordo/util/util_fwd.hpp"
#include <boost/shared_ptr.hpp>
#include <iostream>

namespace ordo::log
{

// Types.

/**
 * An ordo::log::Logger that logs messages to a given `ostream` (e.g., `cout` or an `ofstream` for a file), and
 * messages of WARNING severity or worse to another (e.g., `cerr`), synchronously: do_log() writes before returning,
 * blocking the logging thread.  Filtering is per log::Config.
 *
 * ### Thread safety ###
 * do_log() may be called concurrently; a mutex ensures messages don't interleave.  The Config may be modified
 * concurrently; see Config.
 */
class Simple_ostream_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs Logger that logs to the given streams; messages of WARNING severity or worse go to `os_for_err`,
   * the rest to `os`.  The two may be the same object.
   *
   * @param config
   *        Controls filtering and output details.  Must exist at least as long as `*this`.
   * @param os
   *        `ostream` for messages less severe than WARNING.
   * @param os_for_err
   *        `ostream` for messages of WARNING severity or worse.
   */
  explicit Simple_ostream_logger(Config* config,
                                 std::ostream& os = std::cout, std::ostream& os_for_err = std::cerr);

  // Methods.

  /**
   * Implements interface method by returning `true` if the severity and component (which is allowed to be null)
   * indicate it should; this is per the Config passed to constructor.
   *
   * @param sev
   *        Severity of the message.
   * @param component
   *        Component of the message.  Reminder: `component.empty() == true` is allowed.
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const override;

  /**
   * Implements interface method by synchronously logging the message and some subset of the metadata.
   *
   * @param metadata
   *        All information about the message except the message itself.
   * @param msg
   *        The message.
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  // Data.  (Public!)

  /// Reference to the config object passed to constructor.  Note that object is mutable; see notes on thread safety.
  Config* const m_config;

private:
  // Types.

  /// Short-hand for ref-counted pointer to an Ostream_log_msg_writer.
  using Ostream_log_msg_writer_ptr = boost::shared_ptr<Ostream_log_msg_writer>;

  // Methods.

  /**
   * The writer for messages of the given severity.
   * @param sev
   *        Severity.
   * @return #m_err_writer or #m_out_writer.
   */
  Ostream_log_msg_writer& writer_for(Sev sev) const;

  // Data.

  /// Writer for `os`.
  const Ostream_log_msg_writer_ptr m_out_writer;

  /// Writer for `os_for_err`; the same as #m_out_writer if the two streams are the same object.
  const Ostream_log_msg_writer_ptr m_err_writer;

  /// Mutex protecting against log messages being logged concurrently and thus being garbled.
  mutable util::Mutex_non_recursive m_log_mutex;
}; // class Simple_ostream_logger

} // namespace ordo::log
