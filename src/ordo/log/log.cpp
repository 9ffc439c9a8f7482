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
#include "ordo/log/log.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <istream>

namespace ordo::log
{

// Static initializations.

boost::thread_specific_ptr<std::string> Logger::s_this_thread_nickname_ptr;

// Logger implementations.

void Logger::this_thread_set_logged_nickname(util::String_view thread_nickname, Logger* logger_ptr) // Static.
{
  using std::string;

  s_this_thread_nickname_ptr.reset(thread_nickname.empty()
                                     ? nullptr
                                     : new string(thread_nickname));

  // Log about it if given an object capable of logging about itself.
  if (logger_ptr)
  {
    ORDO_LOG_SET_CONTEXT(logger_ptr, Ordo_log_component::S_LOG);
    ORDO_LOG_INFO("Set new thread nickname for current thread ID "
                  "[" << boost::this_thread::get_id() << "].");
  }
} // Logger::this_thread_set_logged_nickname()

void Logger::set_thread_info_in_msg_metadata(Msg_metadata* msg_metadata) // Static.
{
  assert(msg_metadata);

  auto const this_thread_nickname_ptr = s_this_thread_nickname_ptr.get();
  if (this_thread_nickname_ptr)
  {
    msg_metadata->m_call_thread_nickname = *this_thread_nickname_ptr;
  }
  else
  {
    msg_metadata->m_call_thread_id = boost::this_thread::get_id();
  }
}

// Component implementations.

Component::Component() :
  m_payload_type_or_null(nullptr) // <=> empty() == true.
{
  // That's it.  m_payload_enum_raw_value is uninitialized.
}

Component::Component(const Component& src) = default;
Component::Component(Component&& src_moved) = default; // Note it doesn't empty()-ify src_moved.
Component& Component::operator=(const Component& src) = default;
Component& Component::operator=(Component&& src_moved) = default;

bool Component::empty() const
{
  return !m_payload_type_or_null;
}

const std::type_info& Component::payload_type() const
{
  assert(!empty()); // We advertised undefined behavior in this case.
  return *m_payload_type_or_null;
}

std::type_index Component::payload_type_index() const
{
  return std::type_index(payload_type());
}

Component::enum_raw_t Component::payload_enum_raw_value() const
{
  assert(!empty()); // We advertised undefined behavior in this case.
  return m_payload_enum_raw_value;
}

// Log_context implementations.

Log_context::Log_context(Logger* logger) :
  m_logger(logger)
{
  // Nothing.
}

Log_context::Log_context(const Log_context& src) = default;

Log_context::Log_context(Log_context&& src) :
  m_logger(nullptr)
{
  operator=(std::move(src));
}

Log_context& Log_context::operator=(const Log_context& src) = default;

Log_context& Log_context::operator=(Log_context&& src)
{
  if (&src != this)
  {
    m_logger = nullptr;
    m_component = Component();
    swap(src);
  }
  return *this;
}

Logger* Log_context::get_logger() const
{
  return m_logger;
}

const Component& Log_context::get_log_component() const
{
  return m_component;
}

void Log_context::swap(Log_context& other)
{
  using std::swap;

  swap(m_logger, other.m_logger);
  swap(m_component, other.m_component);
}

void swap(Log_context& val1, Log_context& val2)
{
  val1.swap(val2);
}

// Sev implementations.

std::ostream& operator<<(std::ostream& os, Sev val)
{
  // Note: Must stay consistent with operator>>().
  switch (val)
  {
    case Sev::S_NONE: return os << "NONE";
    case Sev::S_FATAL: return os << "FATAL";
    case Sev::S_ERROR: return os << "ERROR";
    case Sev::S_WARNING: return os << "WARNING";
    case Sev::S_INFO: return os << "INFO";
    case Sev::S_DEBUG: return os << "DEBUG";
    case Sev::S_TRACE: return os << "TRACE";
    case Sev::S_DATA: return os << "DATA";
    case Sev::S_END_SENTINEL: assert(false && "Should not be printing sentinel.");
  }
  assert(false && "Looks like a corrupt/sentinel log::Sev value.  gcc would've caught an incomplete switch().");
  return os;
}

std::istream& operator>>(std::istream& is, Sev& val)
{
  using boost::algorithm::iequals;
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using std::string;
  using raw_t = std::underlying_type_t<Sev>;

  // Range [NONE, END_SENTINEL); no match => NONE; allow for number instead of ostream<< string; case-insensitive.
  string token;
  is >> token;

  val = Sev::S_NONE;
  for (raw_t raw_val = 0; raw_val != raw_t(Sev::S_END_SENTINEL); ++raw_val)
  {
    const auto candidate = Sev(raw_val);
    if (iequals(token, util::ostream_op_string(candidate)))
    {
      val = candidate;
      return is;
    }
  }

  try
  {
    const auto raw_val = lexical_cast<raw_t>(token);
    if (raw_val < raw_t(Sev::S_END_SENTINEL))
    {
      val = Sev(raw_val);
    }
  }
  catch (const bad_lexical_cast&)
  {
    // Neither a name nor a number: S_NONE, as advertised.
  }
  return is;
} // operator>>(istream, Sev)

} // namespace ordo::log
