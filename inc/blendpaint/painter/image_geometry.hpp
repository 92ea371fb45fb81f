/*!
 * \file image_geometry.hpp
 * \brief file image_geometry.hpp
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
#include <blendpaint/util/vecN.hpp>
#include <blendpaint/util/rect.hpp>
#include <blendpaint/painter/painter_enums.hpp>

namespace blendpaint
{
/*!\addtogroup Painter
 * @{
 */

  /*!
   * \brief
   * The pair of sizes computed by apply_box_fit().
   */
  class FittedSizes
  {
  public:
    FittedSizes(void):
      m_source(0.0f, 0.0f),
      m_destination(0.0f, 0.0f)
    {}

    FittedSizes(const vec2 &source, const vec2 &destination):
      m_source(source),
      m_destination(destination)
    {}

    bool
    operator==(const FittedSizes &rhs) const
    {
      return m_source == rhs.m_source
        && m_destination == rhs.m_destination;
    }

    bool
    operator!=(const FittedSizes &rhs) const
    {
      return !operator==(rhs);
    }

    /*!
     * The size of the portion of the input that is shown.
     */
    vec2 m_source;

    /*!
     * The size of the portion of the output that is covered.
     */
    vec2 m_destination;
  };

  /*!
   * Compute how a box of size input is fit into a box
   * of size output. If any dimension of input or output
   * is not positive, both returned sizes are (0, 0).
   * \param fit how to fit
   * \param input size of the box to fit, for example an image
   * \param output size of the box into which to fit
   */
  FittedSizes
  apply_box_fit(enum PainterEnums::box_fit_t fit,
                const vec2 &input, const vec2 &output);

  /*!
   * Returns the rectangles that tile an output rectangle
   * with copies of a fundamental rectangle. The stride is
   * the size of the fundamental rectangle; along an axis
   * that repeats, the tile indices run from
   * floor((output.min - fundamental.min) / stride) to
   * ceil((output.max - fundamental.max) / stride)
   * inclusive and along an axis that does not repeat the
   * only index is 0. The rectangles are listed with the
   * x-index in the outer loop. An empty fundamental
   * rectangle gives no rectangles.
   * \param output rectangle to cover
   * \param fundamental rectangle to repeat
   * \param repeat how to repeat
   */
  std::vector<Rect>
  generate_image_tile_rects(const Rect &output, const Rect &fundamental,
                            enum PainterEnums::image_repeat_t repeat);

/*! @} */
}
