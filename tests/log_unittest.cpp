/*!
 * \file log_unittest.cpp
 * \brief file log_unittest.cpp
 *
 * Copyright 2019 by Intel.
 *
 * Contact: kevin.rogovin@intel.com
 *
 * This Source Code Form is subject to the
 * terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with
 * this file, You can obtain one at
 * http://mozilla.org/MPL/2.0/.
 *
 * \author Kevin Rogovin <kevin.rogovin@intel.com>
 *
 */


#include <iostream>
#include <sstream>
#include <gtest/gtest.h>
#include <blendpaint/util/log.hpp>

namespace {

TEST(LogTest, FormatsFileLineAndLevel) {
  std::ostringstream str;
  std::ostream *prev(blendpaint::set_log_stream(&str));

  blendpaint::log_message(blendpaint::log_error, "canvas.cpp", 12, "bad rect");
  BLENDPAINTlog_warning("value = " << 3);

  blendpaint::set_log_stream(prev);
  EXPECT_EQ(0u, str.str().find("[canvas.cpp,12] error: bad rect\n"));
  EXPECT_NE(std::string::npos, str.str().find("warning: value = 3\n"));
}

TEST(LogTest, NullStreamRestoresStderr) {
  std::ostringstream str;
  std::ostream *prev(blendpaint::set_log_stream(&str));

  EXPECT_EQ(&str, blendpaint::set_log_stream(nullptr));
  EXPECT_EQ(&std::cerr, blendpaint::set_log_stream(prev));
}

TEST(LogTest, Labels) {
  EXPECT_STREQ("warning", blendpaint::label(blendpaint::log_warning));
  EXPECT_STREQ("error", blendpaint::label(blendpaint::log_error));
}

}  // namespace
