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
#include <boost/unordered_map.hpp>
#include <typeindex>
#include <utility>

namespace ordo::log
{

// Types.

/**
 * Class used to configure the filtering and logging behavior of `Logger`s; its use in your custom `Logger`s is
 * optional but encouraged; it supports dynamically changing filter settings even while concurrent logging occurs.
 *
 * Filtering: each message has a Sev and a Component.  The message passes iff its Sev is at least as severe as the
 * verbosity configured for its Component, or (if none) the default verbosity.
 *
 * Output: a Component whose `enum` type was registered via init_component_names() is printed by name (prefixed
 * per that call); other non-empty ones are printed numerically; an empty one is not printed.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently with each other and with themselves.  Configuration changes are
 * rare, filtering frequent: hence a shared (readers-writer) mutex.
 */
class Config :
  private boost::noncopyable
{
public:
  // Constants.

  /// Recommended default/catch-all most-verbose-severity-to-log value.
  static const Sev S_MOST_VERBOSE_SEV_DEFAULT;

  // Constructors/destructor.

  /**
   * Constructs a conceptually blank but functional set of Config: only the default verbosity is set.
   *
   * @param most_verbose_sev_default
   *        Messages with this or more severe Sev pass, unless a per-component setting overrides.
   */
  explicit Config(Sev most_verbose_sev_default = S_MOST_VERBOSE_SEV_DEFAULT);

  // Methods.

  /**
   * A key output of Config, this computes the verbosity-filtering answer to Logger::should_log() based on the
   * given log-call-site severity and component and the verbosity configuration in this Config.
   *
   * @param sev
   *        See Logger::should_log().
   * @param component
   *        See Logger::should_log().
   * @return `true` if we recommend to let the associated message be logged; `false` to suppress it.
   */
  bool output_whether_should_log(Sev sev, const Component& component) const;

  /**
   * An output of Config, this writes a string representation of the given component value to the given `ostream`,
   * if possible.  Returns `true` if it wrote anything.
   *
   * @param os
   *        Pointer (not null) to the `ostream` to which to possibly write.
   * @param component
   *        The component value from the log call site.
   * @return `true` if and only if something was written.
   */
  bool output_component_to_ostream(std::ostream* os, const Component& component) const;

  /**
   * Registers the names of the values of the given component `enum`, for output and for
   * configure_component_verbosity_by_name().  Names are normalized to upper case and prefixed with
   * `payload_type_prefix_or_empty` (also upper-cased).
   *
   * @tparam Component_payload
   *         See Component.
   * @param component_names
   *         Mapping of each `enum` value to its name; e.g., ordo::S_ORDO_LOG_COMPONENT_NAME_MAP.
   * @param payload_type_prefix_or_empty
   *        Prefix prepended to each name; distinguishes `enum`s registered by different modules.
   */
  template<typename Component_payload>
  void init_component_names(const boost::unordered_multimap<Component_payload, std::string>& component_names,
                            util::String_view payload_type_prefix_or_empty = util::String_view());

  /**
   * Sets the default verbosity to the given value, to be used by subsequent output_whether_should_log() calls
   * for components without their own setting.
   *
   * @param most_verbose_sev_default
   *        The new default.
   * @param reset
   *        If `true`, also forget all per-component verbosities.
   */
  void configure_default_verbosity(Sev most_verbose_sev_default, bool reset);

  /**
   * Sets the verbosity for the given component, overriding the default for it.
   *
   * @tparam Component_payload
   *         See Component.
   * @param most_verbose_sev
   *        The new verbosity for the component.
   * @param component_payload
   *        The component.
   */
  template<typename Component_payload>
  void configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload);

  /**
   * Like configure_component_verbosity(), but the component is given by its registered (prefixed) name,
   * case-insensitively.
   *
   * @param most_verbose_sev
   *        The new verbosity.
   * @param component_name
   *        Name as registered via init_component_names(), prefix included.
   * @return `true` on success; `false` if the name is not known.
   */
  bool configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name);

private:
  // Types.

  /// Identifies one component: the `enum` type plus raw value.
  using Component_key = std::pair<std::type_index, Component::enum_raw_t>;

  // Methods.

  /**
   * Returns the Component_key of a non-empty Component.
   * @param component
   *        Component; not empty.
   * @return See above.
   */
  static Component_key component_key(const Component& component);

  /**
   * Normalizes a component name (or prefix) to upper case.
   * @param name
   *        Name.
   * @return See above.
   */
  static std::string normalized_component_name(util::String_view name);

  // Data.

  /// Protects the rest of the data members.
  mutable util::Mutex_shared_non_recursive m_mutex;

  /// Verbosity for components without an entry in #m_verbosities_by_component.
  Sev m_verbosity_default;

  /// Per-component verbosities.
  boost::unordered_map<Component_key, Sev> m_verbosities_by_component;

  /// Registered normalized names by component.
  boost::unordered_map<Component_key, std::string> m_component_names_by_key;

  /// Inverse of #m_component_names_by_key.
  boost::unordered_map<std::string, Component_key> m_component_keys_by_name;
}; // class Config

// Template implementations.

template<typename Component_payload>
void Config::init_component_names
       (const boost::unordered_multimap<Component_payload, std::string>& component_names,
        util::String_view payload_type_prefix_or_empty)
{
  using std::string;

  const string prefix_normalized(normalized_component_name(payload_type_prefix_or_empty));

  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  for (const auto& enum_val_and_name : component_names)
  {
    assert(!enum_val_and_name.second.empty());
    const auto key = component_key(Component(enum_val_and_name.first));
    const string name_normalized = prefix_normalized + normalized_component_name(enum_val_and_name.second);

    m_component_keys_by_name.insert_or_assign(name_normalized, key);
    /* A multimap can have 2+ names for one enum value (aliases).  The first one encountered is used for output;
     * all of them work for configure_component_verbosity_by_name(). */
    m_component_names_by_key.emplace(key, name_normalized);
  }
}

template<typename Component_payload>
void Config::configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload)
{
  const auto key = component_key(Component(component_payload));
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  m_verbosities_by_component[key] = most_verbose_sev;
}

} // namespace ordo::log
