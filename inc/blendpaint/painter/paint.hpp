/*!
 * \file paint.hpp
 * \brief file paint.hpp
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

#include <boost/optional.hpp>
#include <blendpaint/util/vecN.hpp>
#include <blendpaint/painter/painter_enums.hpp>
#include <blendpaint/painter/color_filter.hpp>

namespace blendpaint
{
/*!\addtogroup Painter
 * @{
 */

  /*!
   * \brief
   * A Paint describes how a draw is composited onto a
   * Canvas. For drawing images only the alpha of color()
   * is used; it modulates the image.
   */
  class Paint
  {
  public:
    Paint(void):
      m_color(0.0f, 0.0f, 0.0f, 1.0f),
      m_blend_mode(PainterEnums::blend_porter_duff_src_over),
      m_filter_quality(PainterEnums::filter_quality_none),
      m_invert_colors(false),
      m_anti_alias(true)
    {}

    /*!
     * Set the color (alpha not pre-multiplied), default
     * value is (0, 0, 0, 1).
     */
    Paint&
    color(const vec4 &v)
    {
      m_color = v;
      return *this;
    }

    /*!
     * Returns the color.
     */
    const vec4&
    color(void) const
    {
      return m_color;
    }

    /*!
     * Provided as a conveniance, sets the alpha of
     * color() leaving the other channels as is.
     */
    Paint&
    alpha(float v)
    {
      m_color.w() = v;
      return *this;
    }

    float
    alpha(void) const
    {
      return m_color.w();
    }

    /*!
     * Set the blend mode, default value is
     * \ref PainterEnums::blend_porter_duff_src_over.
     */
    Paint&
    blend_mode(enum PainterEnums::blend_mode_t v)
    {
      m_blend_mode = v;
      return *this;
    }

    enum PainterEnums::blend_mode_t
    blend_mode(void) const
    {
      return m_blend_mode;
    }

    /*!
     * Set the color filter, default value is no filter.
     */
    Paint&
    color_filter(const boost::optional<ColorFilter> &v)
    {
      m_color_filter = v;
      return *this;
    }

    const boost::optional<ColorFilter>&
    color_filter(void) const
    {
      return m_color_filter;
    }

    /*!
     * Set the filter quality with which images are
     * sampled, default value is
     * \ref PainterEnums::filter_quality_none.
     */
    Paint&
    filter_quality(enum PainterEnums::filter_quality_t v)
    {
      m_filter_quality = v;
      return *this;
    }

    enum PainterEnums::filter_quality_t
    filter_quality(void) const
    {
      return m_filter_quality;
    }

    /*!
     * Set if the colors are inverted; the inversion is
     * applied after color_filter(). Default is false.
     */
    Paint&
    invert_colors(bool v)
    {
      m_invert_colors = v;
      return *this;
    }

    bool
    invert_colors(void) const
    {
      return m_invert_colors;
    }

    /*!
     * Set if edges are anti-aliased, default is true.
     */
    Paint&
    anti_alias(bool v)
    {
      m_anti_alias = v;
      return *this;
    }

    bool
    anti_alias(void) const
    {
      return m_anti_alias;
    }

    /*!
     * Apply color_filter() and then, if invert_colors()
     * is true, the inversion to a color with alpha
     * pre-multiplied.
     */
    vec4
    filter_color(const vec4 &premultiplied) const
    {
      vec4 c(premultiplied);
      if (m_color_filter)
        {
          c = m_color_filter->apply(c);
        }
      if (m_invert_colors)
        {
          c = ColorFilter::invert().apply(c);
        }
      return c;
    }

    bool
    operator==(const Paint &rhs) const
    {
      return m_color == rhs.m_color
        && m_blend_mode == rhs.m_blend_mode
        && m_color_filter == rhs.m_color_filter
        && m_filter_quality == rhs.m_filter_quality
        && m_invert_colors == rhs.m_invert_colors
        && m_anti_alias == rhs.m_anti_alias;
    }

    bool
    operator!=(const Paint &rhs) const
    {
      return !operator==(rhs);
    }

  private:
    vec4 m_color;
    enum PainterEnums::blend_mode_t m_blend_mode;
    boost::optional<ColorFilter> m_color_filter;
    enum PainterEnums::filter_quality_t m_filter_quality;
    bool m_invert_colors;
    bool m_anti_alias;
  };

/*! @} */
}
