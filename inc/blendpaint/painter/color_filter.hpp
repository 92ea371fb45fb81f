/*!
 * \file color_filter.hpp
 * \brief file color_filter.hpp
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

#include <blendpaint/util/util.hpp>
#include <blendpaint/util/vecN.hpp>
#include <blendpaint/painter/painter_enums.hpp>

namespace blendpaint
{
/*!\addtogroup Painter
 * @{
 */

  /*!
   * \brief
   * A ColorFilter is a function applied to each color
   * of a drawn image before it is composited.
   */
  class ColorFilter
  {
  public:
    /*!
     * \brief
     * Enumeration specifying the kind of a ColorFilter
     */
    enum type_t
      {
        /*!
         * Composite a constant color with a blend mode;
         * the constant color is the source and the
         * filtered color is the destination.
         */
        mode_filter,

        /*!
         * Apply a 4x5 matrix to the color with alpha
         * not pre-multiplied.
         */
        matrix_filter,

        /*!
         * Apply the sRGB gamma curve to a color in
         * linear space.
         */
        linear_to_srgb_gamma_filter,

        /*!
         * Apply the inverse of the sRGB gamma curve to
         * a color in sRGB space.
         */
        srgb_to_linear_gamma_filter,
      };

    /*!
     * Typedef for the 20 values of a matrix filter,
     * given in row-major order.
     */
    typedef vecN<float, 20> matrix_type;

    /*!
     * Ctor, initializes as a mode filter with
     * color (0, 0, 0, 0) and blend mode
     * \ref PainterEnums::blend_porter_duff_dst,
     * which leaves every color unchanged.
     */
    ColorFilter(void);

    /*!
     * Create a filter that composites a color onto the
     * filtered color.
     * \param color color (alpha NOT pre-multiplied) to use
     *              as the source of the blend
     * \param mode blend mode to apply
     */
    static
    ColorFilter
    mode(const vec4 &color, enum PainterEnums::blend_mode_t mode);

    /*!
     * Create a filter that applies a 4x5 matrix. The color
     * (r, g, b, a), alpha not pre-multiplied, is transformed
     * as
     * \code
     * r' = m[0] * r + m[1] * g + m[2] * b + m[3] * a + m[4] / 255
     * g' = m[5] * r + m[6] * g + m[7] * b + m[8] * a + m[9] / 255
     * b' = m[10] * r + m[11] * g + m[12] * b + m[13] * a + m[14] / 255
     * a' = m[15] * r + m[16] * g + m[17] * b + m[18] * a + m[19] / 255
     * \endcode
     * i.e. the translation column is in units of 0..255.
     */
    static
    ColorFilter
    matrix(const matrix_type &m);

    /*!
     * Create a filter converting from linear to sRGB.
     */
    static
    ColorFilter
    linear_to_srgb_gamma(void);

    /*!
     * Create a filter converting from sRGB to linear.
     */
    static
    ColorFilter
    srgb_to_linear_gamma(void);

    /*!
     * Returns the matrix filter that inverts the color
     * channels and keeps the alpha, i.e. c' = 1 - c.
     */
    static
    ColorFilter
    invert(void);

    /*!
     * Returns a string for a type_t value.
     */
    static
    c_string
    label(enum type_t v);

    /*!
     * Returns the kind of filter.
     */
    enum type_t
    type(void) const
    {
      return m_type;
    }

    /*!
     * For a mode filter, returns the color.
     */
    const vec4&
    color(void) const
    {
      return m_color;
    }

    /*!
     * For a mode filter, returns the blend mode.
     */
    enum PainterEnums::blend_mode_t
    blend_mode(void) const
    {
      return m_blend_mode;
    }

    /*!
     * For a matrix filter, returns the matrix.
     */
    const matrix_type&
    matrix_values(void) const
    {
      return m_matrix;
    }

    /*!
     * Apply the filter to a color.
     * \param premultiplied color with alpha pre-multiplied
     * \returns filtered color with alpha pre-multiplied
     */
    vec4
    apply(const vec4 &premultiplied) const;

    bool
    operator==(const ColorFilter &rhs) const;

    bool
    operator!=(const ColorFilter &rhs) const
    {
      return !operator==(rhs);
    }

  private:
    enum type_t m_type;
    vec4 m_color;
    enum PainterEnums::blend_mode_t m_blend_mode;
    matrix_type m_matrix;
  };

/*! @} */
}
