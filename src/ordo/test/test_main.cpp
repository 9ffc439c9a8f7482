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
#include "ordo/test/test_config.hpp"
#include <boost/program_options.hpp>
#include <gtest/gtest.h>
#include <iostream>

/**
 * Unit test driver: parses our own options (leaving gtest's to InitGoogleTest()), then runs all tests.
 *
 * @param argc
 *        See `main()`.
 * @param argv
 *        See `main()`.
 * @return 0 on success; else nonzero.
 */
int main(int argc, char** argv)
{
  namespace opts = boost::program_options;
  using ordo::test::Test_config;

  ::testing::InitGoogleTest(&argc, argv);

  auto& config = Test_config::get_singleton();
  opts::options_description desc("Ordo unit test options");
  desc.add_options()
    (Test_config::S_HELP_PARAM.c_str(), "Show help.")
    (Test_config::S_LOG_SEVERITY_PARAM.c_str(), opts::value<ordo::log::Sev>(&config.m_sev),
     "Most verbose log severity to print (e.g., info, trace).");

  opts::variables_map vars;
  try
  {
    opts::store(opts::command_line_parser(argc, argv).options(desc).allow_unregistered().run(), vars);
    opts::notify(vars);
  }
  catch (const opts::error& exc)
  {
    std::cerr << "Bad command line: [" << exc.what() << "].\n" << desc << '\n';
    return 1;
  }

  if (vars.count(Test_config::S_HELP_PARAM) != 0)
  {
    std::cout << desc << '\n';
    return 0;
  }
  // else

  return RUN_ALL_TESTS();
}
