/*!
 * \file raster_surface.cpp
 * \brief file raster_surface.cpp
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

#include <algorithm>
#include <blendpaint/painter/raster_surface.hpp>
#include <blendpaint/painter/blend.hpp>
#include <blendpaint/util/math.hpp>

namespace
{
  uint8_t
  pack_channel(float v)
  {
    v = blendpaint::t_clamp(v, 0.0f, 1.0f);
    return static_cast<uint8_t>(blendpaint::t_round(v * 255.0f));
  }
}

blendpaint::RasterSurface::
RasterSurface(int w, int h, const vec4 &clear_color):
  m_dimensions(t_max(w, 1), t_max(h, 1)),
  m_pixels(m_dimensions.x() * m_dimensions.y(), clear_color)
{}

void
blendpaint::RasterSurface::
clear(const vec4 &premultiplied_color)
{
  std::fill(m_pixels.begin(), m_pixels.end(), premultiplied_color);
}

blendpaint::u8vec4
blendpaint::RasterSurface::
rgba8(int x, int y) const
{
  vec4 c(unpremultiply(pixel(x, y)));
  return u8vec4(pack_channel(c.x()), pack_channel(c.y()),
                pack_channel(c.z()), pack_channel(c.w()));
}

std::vector<blendpaint::u8vec4>
blendpaint::RasterSurface::
to_rgba8(void) const
{
  std::vector<u8vec4> return_value;

  return_value.reserve(m_pixels.size());
  for (int y = 0; y < m_dimensions.y(); ++y)
    {
      for (int x = 0; x < m_dimensions.x(); ++x)
        {
          return_value.push_back(rgba8(x, y));
        }
    }
  return return_value;
}
