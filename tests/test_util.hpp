/*!
 * \file test_util.hpp
 * \brief file test_util.hpp
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

#pragma once

#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <blendpaint/util/vecN.hpp>
#include <blendpaint/util/rect.hpp>
#include <blendpaint/util/log.hpp>
#include <blendpaint/image.hpp>

namespace blendpaint_test
{
  /* Redirects the log to a string for the lifetime of the object. */
  class LogCapture
  {
  public:
    LogCapture(void)
    {
      m_prev = blendpaint::set_log_stream(&m_str);
    }

    ~LogCapture()
    {
      blendpaint::set_log_stream(m_prev);
    }

    std::string
    text(void) const
    {
      return m_str.str();
    }

    bool
    contains(const std::string &s) const
    {
      return text().find(s) != std::string::npos;
    }

  private:
    std::ostringstream m_str;
    std::ostream *m_prev;
  };

  inline
  void
  ExpectVecNear(const blendpaint::vec2 &expected, const blendpaint::vec2 &actual,
                float tol = 1e-4f)
  {
    EXPECT_NEAR(expected.x(), actual.x(), tol);
    EXPECT_NEAR(expected.y(), actual.y(), tol);
  }

  inline
  void
  ExpectVecNear(const blendpaint::vec4 &expected, const blendpaint::vec4 &actual,
                float tol = 1e-4f)
  {
    for (unsigned int i = 0; i < 4; ++i)
      {
        EXPECT_NEAR(expected[i], actual[i], tol) << "channel " << i;
      }
  }

  inline
  void
  ExpectRectNear(const blendpaint::Rect &expected, const blendpaint::Rect &actual,
                 float tol = 1e-4f)
  {
    ExpectVecNear(expected.m_min_point, actual.m_min_point, tol);
    ExpectVecNear(expected.m_max_point, actual.m_max_point, tol);
  }

  /* Bitmap whose border pixels are one color and interior another. */
  inline
  blendpaint::reference_counted_ptr<blendpaint::Bitmap>
  MakeFramedBitmap(int w, int h, blendpaint::u8vec4 border, blendpaint::u8vec4 interior)
  {
    std::vector<blendpaint::u8vec4> pixels(w * h);
    for (int y = 0; y < h; ++y)
      {
        for (int x = 0; x < w; ++x)
          {
            bool on_border(x == 0 || y == 0 || x == w - 1 || y == h - 1);
            pixels[x + y * w] = on_border ? border : interior;
          }
      }
    return blendpaint::Bitmap::create(w, h, blendpaint::c_array<const blendpaint::u8vec4>(pixels),
                                      blendpaint::Bitmap::rgba_format);
  }

  inline
  blendpaint::reference_counted_ptr<blendpaint::Image>
  MakeSolidImage(int w, int h, blendpaint::u8vec4 color = blendpaint::u8vec4(255, 0, 0, 255))
  {
    return blendpaint::Image::create(blendpaint::Bitmap::create_solid(w, h, color));
  }
}
