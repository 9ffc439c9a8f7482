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

#include <boost/system/error_code.hpp>
#include <boost/unordered_map.hpp>
#include <boost/chrono/chrono.hpp>
/* boost.chrono I/O: chrono.hpp doesn't include the ostream<< output of durations and time points, which the
 * loggers rely upon. */
#include <boost/chrono/io/duration_io.hpp>
#include <boost/chrono/io/time_point_io.hpp>
#include <cstdint>
#include <string>

/**
 * Catch-all namespace for the Ordo project: an ordered/hashed associative container whose iteration order,
 * equality and duplicate-key policy are given by one pluggable order strategy, plus a family of decorator views
 * layered over a single underlying container.
 *
 * Layout, leaves first:
 *   - ordo::util: stream/string helpers, mutex aliases, null-key detection, the insertion chain used by linked views.
 *   - ordo::log: logging (Logger, Log_context, Config, Simple_ostream_logger, `ORDO_LOG_*()` macros).
 *   - ordo::error: Runtime_error and the `Error_code*`-or-throw reporting convention.
 *   - ordo::order: the Order strategy interface and its built-in implementations.
 *   - ordo::map: entries, the entry container, the core map, its frozen snapshot, and all views.
 */
namespace ordo
{

// Types.  They're outside of `namespace ::ordo::util` for brevity due to their frequent use.

/**
 * Short-hand for a boost.system error code.  Every fallible Ordo API takes an optional `Error_code*` as its
 * last argument; see ordo::error for the convention.
 */
using Error_code = boost::system::error_code;

/**
 * The ordo::log::Component payload enumeration comprising various log components used by Ordo's own internal
 * logging.  Internal Ordo code specifies members thereof when indicating the log component for each particular
 * piece of logging code.  Ordo user code should use its own `enum class`es.
 */
enum class Ordo_log_component : unsigned int
{
  /// Log call sites outside namespace `ordo::X`, for all X in `ordo`.
  S_UNCAT = 0,
  /// Logging from namespace ordo::log.
  S_LOG = 1,
  /// Logging from the ordo::map core: Fast_map, Immutable_map.
  S_MAP = 2,
  /// Logging from the ordo::map views.
  S_VIEW = 3,
  /// Logging from ordo::map::Entry_table.
  S_CONTAINER = 4,
  /// Sentinel; not a component.
  S_END_SENTINEL
}; // enum class Ordo_log_component

/**
 * The map collection, generated once in common.cpp, of names keyed by Ordo_log_component, suitable for
 * log::Config::init_component_names().
 */
extern const boost::unordered_multimap<Ordo_log_component, std::string> S_ORDO_LOG_COMPONENT_NAME_MAP;

} // namespace ordo

/* We build in C++17 mode ourselves; linking users must as well, as the API headers use C++17 features
 * (std::optional, std::string_view, `if constexpr`). */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any ordo/ API headers, use C++17 compile mode or later."
#endif
