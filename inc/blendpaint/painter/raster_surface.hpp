/*!
 * \file raster_surface.hpp
 * \brief file raster_surface.hpp
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

#include <vector>
#include <blendpaint/util/util.hpp>
#include <blendpaint/util/vecN.hpp>
#include <blendpaint/util/c_array.hpp>

namespace blendpaint
{
/*!\addtogroup Painter
 * @{
 */

  /*!
   * \brief
   * A RasterSurface is a rectangle of pixels that a
   * RasterCanvas renders to. Pixels are RGBA float values
   * in [0, 1] with alpha pre-multiplied; the pixel (0, 0)
   * is the top-left pixel.
   */
  class RasterSurface:noncopyable
  {
  public:
    /*!
     * Ctor.
     * \param w width of the surface, values less than 1 are taken as 1
     * \param h height of the surface, values less than 1 are taken as 1
     * \param clear_color initial value (alpha pre-multiplied) of each pixel
     */
    RasterSurface(int w, int h, const vec4 &clear_color = vec4(0.0f));

    /*!
     * Returns the dimensions of the surface.
     */
    ivec2
    dimensions(void) const
    {
      return m_dimensions;
    }

    int
    width(void) const
    {
      return m_dimensions.x();
    }

    int
    height(void) const
    {
      return m_dimensions.y();
    }

    /*!
     * Returns a reference to a pixel.
     * \param x x-coordinate with 0 <= x < width()
     * \param y y-coordinate with 0 <= y < height()
     */
    vec4&
    pixel(int x, int y)
    {
      BLENDPAINTassert(x >= 0 && x < m_dimensions.x());
      BLENDPAINTassert(y >= 0 && y < m_dimensions.y());
      return m_pixels[x + y * m_dimensions.x()];
    }

    const vec4&
    pixel(int x, int y) const
    {
      BLENDPAINTassert(x >= 0 && x < m_dimensions.x());
      BLENDPAINTassert(y >= 0 && y < m_dimensions.y());
      return m_pixels[x + y * m_dimensions.x()];
    }

    /*!
     * Returns all pixels, row by row.
     */
    c_array<vec4>
    pixels(void)
    {
      return c_array<vec4>(m_pixels);
    }

    /*!
     * Set every pixel to a value.
     * \param premultiplied_color value with alpha pre-multiplied
     */
    void
    clear(const vec4 &premultiplied_color);

    /*!
     * Returns the pixels as RGBA8 with alpha NOT
     * pre-multiplied, row by row.
     */
    std::vector<u8vec4>
    to_rgba8(void) const;

    /*!
     * Returns a pixel as RGBA8 with alpha NOT pre-multiplied.
     */
    u8vec4
    rgba8(int x, int y) const;

  private:
    ivec2 m_dimensions;
    std::vector<vec4> m_pixels;
  };

/*! @} */
}
