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
#include "ordo/log/config.hpp"
#include <boost/algorithm/string/case_conv.hpp>

namespace ordo::log
{

// Static initializations.

const Sev Config::S_MOST_VERBOSE_SEV_DEFAULT = Sev::S_INFO;

// Implementations.

Config::Config(Sev most_verbose_sev_default) :
  m_verbosity_default(most_verbose_sev_default)
{
  // Nothing.
}

bool Config::output_whether_should_log(Sev sev, const Component& component) const
{
  assert(sev != Sev::S_NONE);

  util::Shared_lock_guard<decltype(m_mutex)> lock(m_mutex);

  auto most_verbose_sev = m_verbosity_default;
  if (!component.empty())
  {
    const auto it = m_verbosities_by_component.find(component_key(component));
    if (it != m_verbosities_by_component.end())
    {
      most_verbose_sev = it->second;
    }
  }

  // Sev values increase with verbosity, so "at least as severe" is "<=".
  return sev <= most_verbose_sev;
}

bool Config::output_component_to_ostream(std::ostream* os, const Component& component) const
{
  assert(os);

  if (component.empty())
  {
    return false;
  }
  // else

  const auto key = component_key(component);
  util::Shared_lock_guard<decltype(m_mutex)> lock(m_mutex);
  const auto it = m_component_names_by_key.find(key);
  if (it == m_component_names_by_key.end())
  {
    *os << key.second;
  }
  else
  {
    *os << it->second;
  }
  return true;
}

void Config::configure_default_verbosity(Sev most_verbose_sev_default, bool reset)
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  m_verbosity_default = most_verbose_sev_default;
  if (reset)
  {
    m_verbosities_by_component.clear();
  }
}

bool Config::configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name)
{
  const auto name_normalized = normalized_component_name(component_name);

  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  const auto it = m_component_keys_by_name.find(name_normalized);
  if (it == m_component_keys_by_name.end())
  {
    return false;
  }
  m_verbosities_by_component[it->second] = most_verbose_sev;
  return true;
}

Config::Component_key Config::component_key(const Component& component) // Static.
{
  return Component_key(component.payload_type_index(), component.payload_enum_raw_value());
}

std::string Config::normalized_component_name(util::String_view name) // Static.
{
  return boost::algorithm::to_upper_copy(std::string(name));
}

} // namespace ordo::log
