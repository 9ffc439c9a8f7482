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
#include "ordo/log/ostream_log_msg_writer.hpp"
#include "ordo/log/config.hpp"
#include "ordo/util/fmt.hpp"

namespace ordo::log
{

// Implementations.

Ostream_log_msg_writer::Ostream_log_msg_writer(const Config& config, std::ostream& os) :
  m_config(config),
  m_os(os),
  m_clean_os_state(m_os)
{
  // Nothing.
}

void Ostream_log_msg_writer::log(const Msg_metadata& metadata, util::String_view msg)
{
  using boost::chrono::system_clock;
  using boost::chrono::duration_cast;
  using boost::chrono::microseconds;
  using std::flush;

  assert(metadata.m_msg_sev != Sev::S_NONE); // S_NONE can be used only as a sentinel.

  /* Local calendar time to the second via fmt (strftime-style); the sub-second part is appended from the
   * time point itself, since to_time_t() has 1-second resolution. */
  const auto usec_of_second
    = duration_cast<microseconds>(metadata.m_called_when.time_since_epoch()).count() % 1'000'000;
  m_os << fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06} ",
                      fmt::localtime(system_clock::to_time_t(metadata.m_called_when)),
                      usec_of_second);

  m_os << '[' << metadata.m_msg_sev << "]: T";
  if (metadata.m_call_thread_nickname.empty())
  {
    m_os << metadata.m_call_thread_id;
  }
  else
  {
    m_os << metadata.m_call_thread_nickname;
  }
  m_os << ": ";

  // As noted, this part may be omitted by Config.
  if (m_config.output_component_to_ostream(&m_os, metadata.m_msg_component))
  {
    m_os << ": ";
  }

  m_os << ORDO_UTIL_WHERE_AM_I_FROM_ARGS(metadata.m_msg_src_file, metadata.m_msg_src_function,
                                         metadata.m_msg_src_line)
       << ": "
       << msg << '\n'
       << flush;
} // Ostream_log_msg_writer::log()

} // namespace ordo::log
