/*!
 * \file painter_enums.hpp
 * \brief file painter_enums.hpp
 *
 * Copyright 2016 by Intel.
 *
 * Contact: kevin.rogovin@gmail.com
 *
 * This Source Code Form is subject to the
 * terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with
 * this file, You can obtain one at
 * http://mozilla.org/MPL/2.0/.
 *
 * \author Kevin Rogovin <kevin.rogovin@gmail.com>
 *
 */


#pragma once

#include <blendpaint/util/util.hpp>

namespace blendpaint
{
/*!\addtogroup Painter
 * @{
 */

  /*!
   * \brief
   * Class to contain various enumerations needed for
   * painting images.
   */
  class PainterEnums
  {
  public:
    /*!
     * \brief
     * Enumeration specifying the quality of sampling
     * an image when it is scaled.
     */
    enum filter_quality_t
      {
        /*!
         * Fastest possible filtering, nearest neighbor.
         */
        filter_quality_none,

        /*!
         * Better quality than none, bilinear filtering.
         */
        filter_quality_low,

        /*!
         * Better quality than low, bilinear filtering.
         */
        filter_quality_medium,

        /*!
         * Best quality, bicubic filtering.
         */
        filter_quality_high,

        number_filter_quality,
      };

    /*!
     * \brief
     * Enumeration specifying what filter to apply to an image
     */
    enum filter_t
      {
        /*!
         * Indicates to use nearest filtering (i.e
         * choose closest pixel).
         */
        filter_nearest = 1,

        /*!
         * Indicates to use bilinear filtering.
         */
        filter_linear = 2,

        /*!
         * Indicates to use bicubic filtering.
         */
        filter_cubic = 3,
      };

    /*!
     * \brief
     * Enumeration specifying how to paint any portions
     * of a box not covered by an image.
     */
    enum image_repeat_t
      {
        /*!
         * Repeat the image in both the x and y directions
         * until the box is filled.
         */
        image_repeat,

        /*!
         * Repeat the image in the x direction only.
         */
        image_repeat_x,

        /*!
         * Repeat the image in the y direction only.
         */
        image_repeat_y,

        /*!
         * Leave uncovered portions of the box transparent.
         */
        image_no_repeat,

        number_image_repeat,
      };

    /*!
     * \brief
     * Enumeration specifying how a box (typically an
     * image) should be inscribed into another box.
     */
    enum box_fit_t
      {
        /*!
         * Fill the target box by distorting the
         * source's aspect ratio.
         */
        box_fit_fill,

        /*!
         * As large as possible while still containing
         * the source entirely within the target box.
         */
        box_fit_contain,

        /*!
         * As small as possible while still covering
         * the entire target box.
         */
        box_fit_cover,

        /*!
         * Make sure the full width of the source is shown,
         * regardless of whether this means the source
         * overflows the target box vertically.
         */
        box_fit_fit_width,

        /*!
         * Make sure the full height of the source is shown,
         * regardless of whether this means the source
         * overflows the target box horizontally.
         */
        box_fit_fit_height,

        /*!
         * Align the source within the target box (by default,
         * centering) and discard any portions of the source
         * that lie outside the box. The source is not resized.
         */
        box_fit_none,

        /*!
         * Align the source within the target box and, if
         * necessary, scale the source down to ensure that
         * the source fits within the box. This is the same
         * as box_fit_contain if that would shrink the image,
         * otherwise it is the same as box_fit_none.
         */
        box_fit_scale_down,

        number_box_fit,
      };

    /*!
     * \brief
     * Enumeration specifying the direction of text,
     * used to resolve directional alignments and to
     * flip images in right-to-left contexts.
     */
    enum text_direction_t
      {
        text_direction_rtl, /*!< text flows from right to left */
        text_direction_ltr, /*!< text flows from left to right */

        number_text_direction
      };

    /*!
     * \brief
     * Enumerations specifying common fill rules.
     */
    enum fill_rule_t
      {
        odd_even_fill_rule, /*!< indicates to use odd-even fill rule */
        complement_odd_even_fill_rule, /*!< indicates to give the complement of the odd-even fill rule */
        nonzero_fill_rule, /*!< indicates to use the non-zero fill rule */
        complement_nonzero_fill_rule, /*!< indicates to give the complement of the non-zero fill rule */

        number_fill_rule /*!< count of enums */
      };

    /*!
     * \brief
     * Enumeration specifying blend modes. All colors are with
     * alpha pre-multiplied. Letting S be the source color and D
     * be the destination color, each mode gives the new
     * destination value F. The following function-formulas are
     * used in a number of the blend modes:
     * \code
     * UndoAlpha(C.rgba) = (0, 0, 0) if Ca = 0
     *                     C.rgb / C.a otherwise
     * MinColorChannel(C.rgb) = min(C.r, C.g, C.b)
     * MaxColorChannel(C.rgb) = max(C.r, C.g, C.b)
     * Luminosity(C.rgb) = dot(C.rgb, vec3(0.30, 0.59, 0.11))
     * Saturation(C.rgb) = MaxColorChannel(C.rgb) - MinColorChannel(C.rgb)
     *
     * ClipColor(C): L = Luminosity(C), MinC = MinColorChannel(C),
     *               MaxC = MaxColorChannel(C)
     *    if MinC < 0, C = L + (C - L) * (L / (L - MinC))
     *    if MaxC > 1, C = L + (C - L) * ((1 - L) / (MaxC - L))
     *
     * OverrideLuminosity(C, L) = ClipColor(C + Luminosity(L) - Luminosity(C))
     *
     * OverrideLuminosityAndSaturation(C, S, L):
     *    C = (C - MinColorChannel(C)) * Saturation(S) / Saturation(C)
     *        if Saturation(C) > 0, otherwise vec3(0)
     *    return OverrideLuminosity(C, L)
     * \endcode
     * The separable and non-separable W3C modes all have the form
     * \code
     * F.a = S.a + D.a * (1 - S.a)
     * F.rgb = f(UndoAlpha(S), UndoAlpha(D)) * S.a * D.a + S.rgb * (1 - D.a) + D.rgb * (1 - S.a)
     * \endcode
     * where the function f is documented at each mode.
     */
    enum blend_mode_t
      {
        /*!
         * F.rgba = (0, 0, 0, 0).
         */
        blend_porter_duff_clear,

        /*!
         * F = S
         */
        blend_porter_duff_src,

        /*!
         * F = D
         */
        blend_porter_duff_dst,

        /*!
         * \code
         * F.a = S.a + D.a * (1 - S.a)
         * F.rgb = S.rgb + D.rgb * (1 - S.a)
         * \endcode
         */
        blend_porter_duff_src_over,

        /*!
         * \code
         * F.a = D.a + S.a * (1 - D.a)
         * F.rgb = D.rgb + S.rgb * (1 - D.a)
         * \endcode
         */
        blend_porter_duff_dst_over,

        /*!
         * F.rgba = S.rgba * D.a
         */
        blend_porter_duff_src_in,

        /*!
         * F.rgba = D.rgba * S.a
         */
        blend_porter_duff_dst_in,

        /*!
         * F.rgba = S.rgba * (1 - D.a)
         */
        blend_porter_duff_src_out,

        /*!
         * F.rgba = D.rgba * (1 - S.a)
         */
        blend_porter_duff_dst_out,

        /*!
         * \code
         * F.a = D.a
         * F.rgb = S.rgb * D.a + D.rgb * (1 - S.a)
         * \endcode
         */
        blend_porter_duff_src_atop,

        /*!
         * \code
         * F.a = S.a
         * F.rgb = D.rgb * S.a + S.rgb * (1 - D.a)
         * \endcode
         */
        blend_porter_duff_dst_atop,

        /*!
         * F.rgba = S.rgba * (1 - D.a) + D.rgba * (1 - S.a)
         */
        blend_porter_duff_xor,

        /*!
         * F.rgba = min(1, S.rgba + D.rgba)
         */
        blend_porter_duff_plus,

        /*!
         * F.rgba = S.rgba * D.rgba
         */
        blend_porter_duff_modulate,

        /*!
         * f(S, D).c = S.c + D.c - S.c * D.c
         */
        blend_w3c_screen,

        /*!
         * \code
         * f(S, D).c = 2 * S.c * D.c, if D.c <= 0.5
         *             1 - 2 * (1 - S.c) * (1 - D.c), otherwise
         * \endcode
         */
        blend_w3c_overlay,

        /*!
         * f(S, D).c = min(S.c, D.c)
         */
        blend_w3c_darken,

        /*!
         * f(S, D).c = max(S.c, D.c)
         */
        blend_w3c_lighten,

        /*!
         * \code
         * f(S, D).c = 0, if D.c <= 0
         *             min(1, D.c / (1 - S.c)), if D.c > 0 and S.c < 1
         *             1, if D.c > 0 and S.c >= 1
         * \endcode
         */
        blend_w3c_color_dodge,

        /*!
         * \code
         * f(S, D).c = 1, if D.c >= 1
         *             1 - min(1, (1 - D.c) / S.c), if D.c < 1 and S.c > 0
         *             0, if D.c < 1 and S.c <= 0
         * \endcode
         */
        blend_w3c_color_burn,

        /*!
         * \code
         * f(S, D).c = 2 * S.c * D.c, if S.c <= 0.5
         *             1 - 2 * (1 - S.c) * (1 - D.c), otherwise
         * \endcode
         */
        blend_w3c_hardlight,

        /*!
         * \code
         * f(S, D).c =
         *    D.c - (1 - 2 * S.c) * D.c * (1 - D.c), if S.c <= 0.5
         *    D.c + (2 * S.c - 1) * D.c * ((16 * D.c - 12) * D.c + 3), if S.c > 0.5 and D.c <= 0.25
         *    D.c + (2 * S.c - 1) * (sqrt(D.c) - D.c), if S.c > 0.5 and D.c > 0.25
         * \endcode
         */
        blend_w3c_softlight,

        /*!
         * f(S, D).c = abs(S.c - D.c)
         */
        blend_w3c_difference,

        /*!
         * f(S, D).c = S.c + D.c - 2 * S.c * D.c
         */
        blend_w3c_exclusion,

        /*!
         * f(S, D).c = S.c * D.c
         */
        blend_w3c_multiply,

        /*!
         * f(S, D).rgb = OverrideLuminosityAndSaturation(S.rgb, D.rgb, D.rgb)
         */
        blend_w3c_hue,

        /*!
         * f(S, D).rgb = OverrideLuminosityAndSaturation(D.rgb, S.rgb, D.rgb)
         */
        blend_w3c_saturation,

        /*!
         * f(S, D).rgb = OverrideLuminosity(S.rgb, D.rgb)
         */
        blend_w3c_color,

        /*!
         * f(S, D).rgb = OverrideLuminosity(D.rgb, S.rgb)
         */
        blend_w3c_luminosity,

        number_blend_mode,
      };

    /*!
     * Returns the filter used to sample an image
     * for a filter quality: nearest for
     * \ref filter_quality_none, linear for
     * \ref filter_quality_low and \ref filter_quality_medium
     * and cubic for \ref filter_quality_high.
     */
    static
    enum filter_t
    filter_for_quality(enum filter_quality_t q);

    /*!
     * Returns a string for a filter_quality_t value.
     */
    static
    c_string
    label(enum filter_quality_t v);

    /*!
     * Returns a string for a filter_t value.
     */
    static
    c_string
    label(enum filter_t v);

    /*!
     * Returns a string for an image_repeat_t value.
     */
    static
    c_string
    label(enum image_repeat_t v);

    /*!
     * Returns a string for a box_fit_t value.
     */
    static
    c_string
    label(enum box_fit_t v);

    /*!
     * Returns a string for a text_direction_t value.
     */
    static
    c_string
    label(enum text_direction_t v);

    /*!
     * Returns a string for a fill_rule_t value.
     */
    static
    c_string
    label(enum fill_rule_t v);

    /*!
     * Returns a string for a blend_mode_t value.
     */
    static
    c_string
    label(enum blend_mode_t v);
  };

/*! @} */
}
