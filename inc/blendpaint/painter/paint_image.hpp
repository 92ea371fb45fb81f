/*!
 * \file paint_image.hpp
 * \brief file paint_image.hpp
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

#include <string>
#include <boost/optional.hpp>
#include <blendpaint/util/util.hpp>
#include <blendpaint/util/rect.hpp>
#include <blendpaint/util/reference_counted.hpp>
#include <blendpaint/image.hpp>
#include <blendpaint/painter/painter_enums.hpp>
#include <blendpaint/painter/color_filter.hpp>
#include <blendpaint/painter/alignment.hpp>
#include <blendpaint/painter/canvas.hpp>

namespace blendpaint
{
/*!\addtogroup Painter
 * @{
 */

  /*!
   * \brief
   * PaintImageParams specifies how paint_image() draws
   * an Image into a rectangle of a Canvas.
   */
  class PaintImageParams
  {
  public:
    /*!
     * Ctor.
     * \param rect rectangle into which to paint
     * \param image image to paint
     */
    PaintImageParams(const Rect &rect = Rect(),
                     const reference_counted_ptr<Image> &image = reference_counted_ptr<Image>()):
      m_rect(rect),
      m_image(image),
      m_blend_mode(PainterEnums::blend_porter_duff_src_over),
      m_scale(1.0f),
      m_opacity(1.0f),
      m_repeat(PainterEnums::image_no_repeat),
      m_flip_horizontally(false),
      m_invert_colors(false),
      m_filter_quality(PainterEnums::filter_quality_low),
      m_anti_alias(false)
    {}

    /*!
     * Set the rectangle into which to paint.
     */
    PaintImageParams&
    rect(const Rect &v)
    {
      m_rect = v;
      return *this;
    }

    const Rect&
    rect(void) const
    {
      return m_rect;
    }

    /*!
     * Set the image to paint.
     */
    PaintImageParams&
    image(const reference_counted_ptr<Image> &v)
    {
      m_image = v;
      return *this;
    }

    const reference_counted_ptr<Image>&
    image(void) const
    {
      return m_image;
    }

    /*!
     * Set the blend mode with which to draw, default
     * value is \ref PainterEnums::blend_porter_duff_src_over.
     */
    PaintImageParams&
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
     * Set the label used in diagnostics.
     */
    PaintImageParams&
    debug_label(const std::string &v)
    {
      m_debug_label = v;
      return *this;
    }

    const std::string&
    debug_label(void) const
    {
      return m_debug_label;
    }

    /*!
     * Set the number of image pixels per logical pixel,
     * default value is 1.
     */
    PaintImageParams&
    scale(float v)
    {
      m_scale = v;
      return *this;
    }

    float
    scale(void) const
    {
      return m_scale;
    }

    /*!
     * Set the opacity, default value is 1.
     */
    PaintImageParams&
    opacity(float v)
    {
      m_opacity = v;
      return *this;
    }

    float
    opacity(void) const
    {
      return m_opacity;
    }

    /*!
     * Set the color filter, default value is no filter.
     */
    PaintImageParams&
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
     * Set how the image is fit into the rectangle. If not
     * set, \ref PainterEnums::box_fit_scale_down is used
     * when there is no center slice and \ref
     * PainterEnums::box_fit_fill when there is.
     */
    PaintImageParams&
    fit(const boost::optional<enum PainterEnums::box_fit_t> &v)
    {
      m_fit = v;
      return *this;
    }

    const boost::optional<enum PainterEnums::box_fit_t>&
    fit(void) const
    {
      return m_fit;
    }

    /*!
     * Set the alignment of the image within the rectangle,
     * default value is Alignment::center().
     */
    PaintImageParams&
    alignment(const Alignment &v)
    {
      m_alignment = v;
      return *this;
    }

    const Alignment&
    alignment(void) const
    {
      return m_alignment;
    }

    /*!
     * Set the center slice, in logical pixels of the
     * image, for drawing the image as a nine-patch.
     */
    PaintImageParams&
    center_slice(const boost::optional<Rect> &v)
    {
      m_center_slice = v;
      return *this;
    }

    const boost::optional<Rect>&
    center_slice(void) const
    {
      return m_center_slice;
    }

    /*!
     * Set how the image repeats, default value is
     * \ref PainterEnums::image_no_repeat.
     */
    PaintImageParams&
    repeat(enum PainterEnums::image_repeat_t v)
    {
      m_repeat = v;
      return *this;
    }

    enum PainterEnums::image_repeat_t
    repeat(void) const
    {
      return m_repeat;
    }

    /*!
     * Set if the image is mirrored horizontally about the
     * center of the rectangle, default value is false.
     */
    PaintImageParams&
    flip_horizontally(bool v)
    {
      m_flip_horizontally = v;
      return *this;
    }

    bool
    flip_horizontally(void) const
    {
      return m_flip_horizontally;
    }

    /*!
     * Set if colors are inverted, default value is false.
     */
    PaintImageParams&
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
     * Set the filter quality, default value is
     * \ref PainterEnums::filter_quality_low.
     */
    PaintImageParams&
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
     * Set if drawing is anti-aliased, default value is false.
     */
    PaintImageParams&
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

  private:
    Rect m_rect;
    reference_counted_ptr<Image> m_image;
    enum PainterEnums::blend_mode_t m_blend_mode;
    std::string m_debug_label;
    float m_scale, m_opacity;
    boost::optional<ColorFilter> m_color_filter;
    boost::optional<enum PainterEnums::box_fit_t> m_fit;
    Alignment m_alignment;
    boost::optional<Rect> m_center_slice;
    enum PainterEnums::image_repeat_t m_repeat;
    bool m_flip_horizontally, m_invert_colors;
    enum PainterEnums::filter_quality_t m_filter_quality;
    bool m_anti_alias;
  };

  /*!
   * Paint an image into a rectangle of a Canvas. The image
   * is fit into the rectangle according to PaintImageParams::fit(),
   * placed by PaintImageParams::alignment() and optionally
   * tiled, drawn as a nine-patch and mirrored. Returns
   * routine_fail (and draws nothing) if:
   *  - the image is null or disposed
   *  - the scale is not positive
   *  - a center slice is used with \ref PainterEnums::box_fit_none
   *    or \ref PainterEnums::box_fit_cover
   *  - a center slice is used with a fit that crops the image
   * An empty rectangle draws nothing and returns routine_success.
   * Any save issued on the Canvas is restored before returning.
   * \param canvas Canvas to which to draw
   * \param params parameters of the draw
   */
  enum return_code
  paint_image(Canvas &canvas, const PaintImageParams &params);

/*! @} */
}
