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

#include "ordo/log/log.hpp"
#include "ordo/log/config.hpp"
#include "ordo/log/simple_ostream_logger.hpp"
#include "ordo/util/string_ostream.hpp"
#include "ordo/util/util.hpp"
#include "ordo/common.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace ordo::log::test
{

namespace
{
using std::string;
} // Anonymous namespace

// Yes... this is very cheesy... but this is a test, so I don't really care.
#define CTX util::ostream_op_string("Caller context [", ORDO_UTIL_WHERE_AM_I_STR(), "].")

TEST(Log_context, Interface)
{
  using std::swap; // ADL-swap.

  Config cfg;
  Simple_ostream_logger logger1{&cfg};
  Simple_ostream_logger logger2{&cfg};
  const auto comp1 = Ordo_log_component::S_MAP;
  const auto comp2 = Ordo_log_component::S_VIEW;

  const auto comps_equal = [](const Component& c1, const Component& c2, const string& ctx)
  {
    if (c1.empty() && c2.empty())
    {
      return;
    }
    EXPECT_EQ(c1.empty(), c2.empty()) << ctx;
    EXPECT_EQ(c1.payload_type(), c2.payload_type()) << ctx;
    EXPECT_EQ(int(c1.payload_enum_raw_value()), int(c2.payload_enum_raw_value())) << ctx;
  };

  Log_context ctx1;
  EXPECT_TRUE(ctx1.get_log_component().empty());
  EXPECT_EQ(ctx1.get_logger(), nullptr);
  ctx1 = Log_context{&logger1, comp1};
  comps_equal(ctx1.get_log_component(), Component(comp1), CTX);
  EXPECT_EQ(ctx1.get_logger(), &logger1);

  Log_context ctx2{&logger2};
  EXPECT_TRUE(ctx2.get_log_component().empty());
  EXPECT_EQ(ctx2.get_logger(), &logger2);
  ctx2 = Log_context{&logger2, comp2};

  swap(ctx1, ctx2);
  comps_equal(ctx1.get_log_component(), Component(comp2), CTX);
  EXPECT_EQ(ctx1.get_logger(), &logger2);
  comps_equal(ctx2.get_log_component(), Component(comp1), CTX);
  EXPECT_EQ(ctx2.get_logger(), &logger1);

  ctx1 = ctx2; // Copy-assign.
  comps_equal(ctx1.get_log_component(), Component(comp1), CTX);
  EXPECT_EQ(ctx1.get_logger(), &logger1);

  Log_context ctx3{ctx2}; // Copy-ct.
  comps_equal(ctx3.get_log_component(), Component(comp1), CTX);
  EXPECT_EQ(ctx3.get_logger(), &logger1);

  Log_context ctx4{std::move(ctx3)}; // Move-ct.
  EXPECT_TRUE(ctx3.get_log_component().empty());
  EXPECT_EQ(ctx3.get_logger(), nullptr);
  comps_equal(ctx4.get_log_component(), Component(comp1), CTX);
  EXPECT_EQ(ctx4.get_logger(), &logger1);
} // TEST(Log_context, Interface)

TEST(Sev, Stream_io)
{
  EXPECT_EQ(util::ostream_op_string(Sev::S_WARNING), "WARNING");
  EXPECT_EQ(util::ostream_op_string(Sev::S_TRACE), "TRACE");

  const auto parse = [](const string& str)
  {
    std::istringstream is(str);
    Sev sev = Sev::S_FATAL;
    is >> sev;
    return sev;
  };
  EXPECT_EQ(parse("WARNING"), Sev::S_WARNING);
  EXPECT_EQ(parse("trace"), Sev::S_TRACE);
  EXPECT_EQ(parse("Info"), Sev::S_INFO);
  EXPECT_EQ(parse("bogus"), Sev::S_NONE);
}

TEST(Config, Verbosity)
{
  Config cfg(Sev::S_INFO);
  cfg.init_component_names<Ordo_log_component>(S_ORDO_LOG_COMPONENT_NAME_MAP, "ordo-");
  const Component map_comp(Ordo_log_component::S_MAP);
  const Component view_comp(Ordo_log_component::S_VIEW);

  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_WARNING, map_comp));
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_INFO, map_comp));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_DEBUG, map_comp));
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_INFO, Component()));

  cfg.configure_component_verbosity(Sev::S_TRACE, Ordo_log_component::S_MAP);
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_TRACE, map_comp));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_TRACE, view_comp));

  EXPECT_TRUE(cfg.configure_component_verbosity_by_name(Sev::S_ERROR, "ordo-view"));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_WARNING, view_comp));
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_ERROR, view_comp));
  EXPECT_FALSE(cfg.configure_component_verbosity_by_name(Sev::S_ERROR, "no-such-component"));

  std::ostringstream os;
  EXPECT_TRUE(cfg.output_component_to_ostream(&os, map_comp));
  EXPECT_EQ(os.str(), "ORDO-MAP");
  EXPECT_FALSE(cfg.output_component_to_ostream(&os, Component()));

  cfg.configure_default_verbosity(Sev::S_WARNING, true);
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_TRACE, map_comp)) << "Reset forgets per-component settings.";
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_INFO, view_comp));
}

TEST(Simple_ostream_logger, Output)
{
  Config cfg(Sev::S_INFO);
  cfg.init_component_names<Ordo_log_component>(S_ORDO_LOG_COMPONENT_NAME_MAP, "ordo-");
  std::ostringstream os;
  std::ostringstream os_err;
  Simple_ostream_logger logger(&cfg, os, os_err);

  {
    ORDO_LOG_SET_CONTEXT(&logger, Ordo_log_component::S_MAP);
    ORDO_LOG_INFO("Informative [" << 42 << "].");
    ORDO_LOG_DEBUG("Too verbose; filtered out.");
    ORDO_LOG_WARNING("Worrisome.");
  }

  const auto out = os.str();
  const auto err = os_err.str();
  EXPECT_NE(out.find("[INFO]"), string::npos) << out;
  EXPECT_NE(out.find("ORDO-MAP"), string::npos) << out;
  EXPECT_NE(out.find("Informative [42]."), string::npos) << out;
  EXPECT_NE(out.find("log_test.cpp"), string::npos) << out;
  EXPECT_EQ(out.find("filtered out"), string::npos) << out;
  EXPECT_EQ(out.find("Worrisome"), string::npos) << "WARNING goes to the error stream only.";
  EXPECT_NE(err.find("[WARNING]"), string::npos) << err;
  EXPECT_NE(err.find("Worrisome."), string::npos) << err;

  // Thread nickname replaces the thread ID.
  Logger::this_thread_set_logged_nickname("tester");
  {
    ORDO_LOG_SET_CONTEXT(&logger, Ordo_log_component::S_VIEW);
    ORDO_LOG_INFO("Nicknamed.");
  }
  Logger::this_thread_set_logged_nickname();
  EXPECT_NE(os.str().find("Ttester: ORDO-VIEW"), string::npos) << os.str();

  // A null logger disables logging; nothing is evaluated.
  {
    ORDO_LOG_SET_CONTEXT(static_cast<Logger*>(nullptr), Ordo_log_component::S_MAP);
    bool evaluated = false;
    ORDO_LOG_WARNING("Never [" << (evaluated = true) << "].");
    EXPECT_FALSE(evaluated);
  }
} // TEST(Simple_ostream_logger, Output)

} // namespace ordo::log::test
