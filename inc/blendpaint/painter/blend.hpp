/*!
 * \file blend.hpp
 * \brief file blend.hpp
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

#include <blendpaint/util/vecN.hpp>
#include <blendpaint/painter/painter_enums.hpp>

namespace blendpaint
{
/*!\addtogroup Painter
 * @{
 */

  /*!
   * Composite a source color onto a destination color with
   * the formula of a \ref PainterEnums::blend_mode_t. Both
   * colors are RGBA with alpha pre-multiplied and channels in
   * [0, 1]; the return value is pre-multiplied and clamped
   * to [0, 1].
   * \param mode blend mode to apply
   * \param src source color
   * \param dst destination color
   */
  vec4
  blend_colors(enum PainterEnums::blend_mode_t mode,
               const vec4 &src, const vec4 &dst);

  /*!
   * Returns the color with alpha pre-multiplied, i.e.
   * (c.r * c.a, c.g * c.a, c.b * c.a, c.a).
   */
  vec4
  premultiply(const vec4 &c);

  /*!
   * Returns the color with the pre-multiplication of
   * alpha undone; if alpha is zero, returns (0, 0, 0, 0).
   */
  vec4
  unpremultiply(const vec4 &c);

/*! @} */
}
