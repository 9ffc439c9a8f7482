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

#include "ordo/common.hpp"
#include <iosfwd>

/**
 * Ordo module providing logging functionality.  The interface is tiny: a Logger decides (should_log()) whether
 * a message of a given severity and Component passes its filter, and consumes it (do_log()).  Call sites use the
 * `ORDO_LOG_*()` macros, which evaluate the `<<` stream fragment only if the message passes the filter.  Classes
 * that log derive from Log_context, which stores the Logger pointer and the Component.
 *
 * Out of the box: Simple_ostream_logger (synchronous output to `ostream`s), filtering via Config.
 * A null Logger pointer disables logging at a call site entirely.
 */
namespace ordo::log
{
// Types.

// Find doc headers near the bodies of these compound types.

class Component;
class Config;
class Log_context;
class Logger;
struct Msg_metadata;
class Ostream_log_msg_writer;
class Simple_ostream_logger;

/**
 * Enumeration containing one of several message severity levels, ordered from highest to
 * lowest.  Generally speaking, volume/verbosity is inversely proportional to severity, though
 * this is not enforced somehow.
 *
 * ### Semantic guidelines ###
 *   - S_FATAL: the program will abort shortly due to the condition being logged.
 *   - S_ERROR: a non-fatal but bad condition; typically not expected.
 *   - S_WARNING: an unusual condition, such as an error code emitted to an API caller.
 *   - S_INFO: significant, infrequent events (freezing a map, publishing a snapshot).
 *   - S_DEBUG: like INFO, but more verbose (cloning, view creation).
 *   - S_TRACE: per-operation events (each put/remove).
 *   - S_DATA: like TRACE, but may include bulk data (keys and values).
 */
enum class Sev : size_t
{
  /// Sentinel log level that must not be specified for any actual message (at risk of undefined behavior).
  S_NONE = 0,
  /// Message indicates a "fatally bad" condition.
  S_FATAL,
  /// Message indicates a "bad" condition that is not frequent enough to be of severity Sev::S_WARNING.
  S_ERROR,
  /// Message indicates a "bad" condition with "worse" impact than Sev::S_INFO.
  S_WARNING,
  /// Message indicates a not-"bad" condition that is not frequent enough to be of severity Sev::S_DEBUG.
  S_INFO,
  /// Message indicates a condition with, perhaps, no significant perf impact if enabled.
  S_DEBUG,
  /// Message indicates any condition that may occur with great frequency.
  S_TRACE,
  /// Message satisfies Sev::S_TRACE description and contains variable-length data.
  S_DATA,
  /// Not an actual value but rather stores the highest numerical payload, useful for validity checks.
  S_END_SENTINEL
}; // enum class Sev

// Free functions.

/**
 * Serializes a log::Sev to a standard output stream, as its name without the `S_` prefix (e.g., "WARNING").
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * Deserializes a log::Sev from a standard input stream: reads a word and matches it case-insensitively against the
 * names output by `<<`, or against the numeric value.  On no match yields Sev::S_NONE.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Sev& val);

/**
 * Log_context ADL-friendly swap.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
void swap(Log_context& val1, Log_context& val2);

} // namespace ordo::log
