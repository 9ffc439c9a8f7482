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
#include "ordo/test/test_common_util.hpp"
#include "ordo/test/test_config.hpp"
#include "ordo/util/string_ostream.hpp"
#include <gtest/gtest.h>
#include <regex>

using std::string;
using std::ostream;
using std::vector;

namespace ordo::test
{

const string Test_config::S_HELP_PARAM = "help";
const string Test_config::S_LOG_SEVERITY_PARAM = "minloglevel";

string get_test_suite_name()
{
  return ::testing::UnitTest::GetInstance()->current_test_info()->test_suite_name();
}

/**
 * Captures output directed to a stream during function execution.
 *
 * @param os_dest The location to store the directed output.
 * @param func The function to execute.
 * @param os_source The stream to capture output from.
 */
static void collect_output(ostream& os_dest, const std::function<void()>& func, ostream& os_source)
{
  std::streambuf* const original_buffer = os_source.rdbuf();
  os_source.rdbuf(os_dest.rdbuf());
  func();
  os_source.flush();
  os_source.rdbuf(original_buffer);
}

static void collect_output(util::String_ostream& ss,
                           const std::function<void()>& func,
                           ostream& os,
                           bool output_buffer)
{
  collect_output(ss.os(), func, os);
  if (output_buffer)
  {
    os << ss.str();
    os.flush();
  }
}

bool check_output(const string& output, const vector<string>& regex_matches)
{
  bool result = true;
  for (const auto& regex_match : regex_matches)
  {
    if (!std::regex_search(output, std::regex(regex_match)))
    {
      result = false;
    }
  }
  return result;
}

bool check_output(const std::function<void()>& func,
                  ostream& os,
                  const vector<string>& regex_matches,
                  bool output_buffer)
{
  util::String_ostream ss;
  collect_output(ss, func, os, output_buffer);
  return check_output(ss.str(), regex_matches);
}

string collect_output(const std::function<void()>& func, ostream& os, bool output_buffer)
{
  util::String_ostream ss;
  collect_output(ss, func, os, output_buffer);
  return ss.str();
}

} // namespace ordo::test
