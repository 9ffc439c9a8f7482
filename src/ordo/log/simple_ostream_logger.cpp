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
#include "ordo/log/simple_ostream_logger.hpp"
#include "ordo/log/config.hpp"

namespace ordo::log
{

// Implementations.

Simple_ostream_logger::Simple_ostream_logger(Config* config,
                                             std::ostream& os, std::ostream& os_for_err) :
  m_config(config),
  m_out_writer(new Ostream_log_msg_writer(*m_config, os)),
  m_err_writer((&os == &os_for_err) ? m_out_writer
                                    : Ostream_log_msg_writer_ptr(new Ostream_log_msg_writer(*m_config, os_for_err)))
{
  // Nothing else.
}

bool Simple_ostream_logger::should_log(Sev sev, const Component& component) const // Virtual.
{
  return m_config->output_whether_should_log(sev, component);
}

void Simple_ostream_logger::do_log(Msg_metadata* metadata, util::String_view msg) // Virtual.
{
  assert(metadata);

  /* One mutex for both writers, even when the streams differ: they may well end up on the same device
   * (2>&1), and interleaving there is what we want to avoid. */
  util::Lock_guard<decltype(m_log_mutex)> lock(m_log_mutex);

  writer_for(metadata->m_msg_sev).log(*metadata, msg);
}

Ostream_log_msg_writer& Simple_ostream_logger::writer_for(Sev sev) const
{
  // Sev counts up from the most severe.
  return (sev > Sev::S_WARNING) ? *m_out_writer : *m_err_writer;
}

} // namespace ordo::log
