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

#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace ordo::test
{

/**
 * Returns the test suite name.
 *
 * @return See above.
 */
std::string get_test_suite_name();

/**
 * Examines output for matches.
 *
 * @param output The output to match against.
 * @param regex_matches The regular expressions each of which must be found in `output`.
 *
 * @return Whether the output matched all the expected regular expressions.
 */
bool check_output(const std::string& output, const std::vector<std::string>& regex_matches);

/**
 * Executes a function and examines stream output for matches.
 *
 * @param func The function to execute.
 * @param os The stream to check output on.
 * @param regex_matches The regular expressions each of which must be found in the stream output.
 * @param output_buffer Whether to output the contents of the buffer to the intended destination.
 *
 * @return Whether the output matched all the expected regular expressions.
 */
bool check_output(const std::function<void()>& func,
                  std::ostream& os,
                  const std::vector<std::string>& regex_matches,
                  bool output_buffer = true);

/**
 * Collects output during the execution of a function.
 *
 * @param func The function to execute.
 * @param os The stream to check output on.
 * @param output_buffer Whether to output the contents of the buffer to the intended destination.
 *
 * @return The collected output.
 */
std::string collect_output(const std::function<void()>& func, std::ostream& os = std::cout,
                           bool output_buffer = true);

} // namespace ordo::test
