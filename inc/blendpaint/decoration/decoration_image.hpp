/*!
 * \file decoration_image.hpp
 * \brief file decoration_image.hpp
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

#include <iosfwd>
#include <boost/function.hpp>
#include <boost/optional.hpp>
#include <blendpaint/util/util.hpp>
#include <blendpaint/util/rect.hpp>
#include <blendpaint/util/reference_counted.hpp>
#include <blendpaint/painter/painter_enums.hpp>
#include <blendpaint/painter/color_filter.hpp>
#include <blendpaint/painter/alignment.hpp>
#include <blendpaint/painter/path.hpp>
#include <blendpaint/painter/canvas.hpp>
#include <blendpaint/image/image_stream.hpp>
#include <blendpaint/image/image_provider.hpp>
#include <blendpaint/image/image_configuration.hpp>

namespace blendpaint
{
/*!\addtogroup Decoration
 * @{
 */

  class DecorationImagePainter;

  /*!
   * \brief
   * A DecorationImage describes an image used to decorate
   * a box: where the image comes from and how it is fit,
   * aligned, repeated and composited.
   */
  class DecorationImage
  {
  public:
    /*!
     * Ctor.
     * \param image provider of the image
     */
    explicit
    DecorationImage(const reference_counted_ptr<ImageProvider> &image =
                    reference_counted_ptr<ImageProvider>()):
      m_image(image),
      m_repeat(PainterEnums::image_no_repeat),
      m_match_text_direction(false),
      m_scale(1.0f),
      m_opacity(1.0f),
      m_filter_quality(PainterEnums::filter_quality_low),
      m_invert_colors(false),
      m_anti_alias(false)
    {}

    /*!
     * Set the provider of the image.
     */
    DecorationImage&
    image(const reference_counted_ptr<ImageProvider> &v)
    {
      m_image = v;
      return *this;
    }

    const reference_counted_ptr<ImageProvider>&
    image(void) const
    {
      return m_image;
    }

    /*!
     * Set the callback for errors resolving the image;
     * if not set, errors are logged.
     */
    DecorationImage&
    on_error(const ImageStreamListener::error_callback &v)
    {
      m_on_error = v;
      return *this;
    }

    const ImageStreamListener::error_callback&
    on_error(void) const
    {
      return m_on_error;
    }

    /*!
     * Set the color filter, default value is no filter.
     */
    DecorationImage&
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
     * Set the fit, see PaintImageParams::fit().
     */
    DecorationImage&
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
     * Set the alignment, default value is Alignment::center().
     * An AlignmentDirectional requires the ImageConfiguration
     * passed to DecorationImagePainter::paint() to have a
     * text direction.
     */
    DecorationImage&
    alignment(const AlignmentGeometry &v)
    {
      m_alignment = v;
      return *this;
    }

    const AlignmentGeometry&
    alignment(void) const
    {
      return m_alignment;
    }

    /*!
     * Set the center slice, see PaintImageParams::center_slice().
     */
    DecorationImage&
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
    DecorationImage&
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
     * Set if the image is mirrored when the text direction
     * is right-to-left, default value is false.
     */
    DecorationImage&
    match_text_direction(bool v)
    {
      m_match_text_direction = v;
      return *this;
    }

    bool
    match_text_direction(void) const
    {
      return m_match_text_direction;
    }

    /*!
     * Set the scale, multiplied with the scale of the
     * resolved image; default value is 1.
     */
    DecorationImage&
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
    DecorationImage&
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
     * Set the filter quality, default value is
     * \ref PainterEnums::filter_quality_low.
     */
    DecorationImage&
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
     * Set if colors are inverted, default value is false.
     */
    DecorationImage&
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
     * Set if drawing is anti-aliased, default value is false.
     */
    DecorationImage&
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
     * Create a DecorationImagePainter for this DecorationImage.
     * \param on_changed called when the image changes other
     *                   than from within DecorationImagePainter::paint()
     */
    reference_counted_ptr<DecorationImagePainter>
    create_painter(const boost::function<void ()> &on_changed) const;

  private:
    reference_counted_ptr<ImageProvider> m_image;
    ImageStreamListener::error_callback m_on_error;
    boost::optional<ColorFilter> m_color_filter;
    boost::optional<enum PainterEnums::box_fit_t> m_fit;
    AlignmentGeometry m_alignment;
    boost::optional<Rect> m_center_slice;
    enum PainterEnums::image_repeat_t m_repeat;
    bool m_match_text_direction;
    float m_scale, m_opacity;
    enum PainterEnums::filter_quality_t m_filter_quality;
    bool m_invert_colors, m_anti_alias;
  };

  /*!
   * \brief
   * A DecorationImagePainter resolves the image of a
   * DecorationImage and paints it. The image is resolved on
   * each paint(); until the image is available paint() draws
   * nothing.
   */
  class DecorationImagePainter:
    public reference_counted<DecorationImagePainter>::concurrent
  {
  public:
    /*!
     * Ctor.
     * \param details DecorationImage to paint
     * \param on_changed called when the image changes other
     *                   than from within paint()
     */
    DecorationImagePainter(const DecorationImage &details,
                           const boost::function<void ()> &on_changed);

    /*!
     * Dtor, calls dispose().
     */
    ~DecorationImagePainter();

    /*!
     * Paint the image into a rectangle. Returns routine_fail if
     * the painter is disposed, if the DecorationImage has no
     * provider, if a text direction is required but absent
     * from configuration or if drawing the image fails.
     * Returns routine_success without drawing if the image
     * is not yet available.
     * \param canvas Canvas to which to paint
     * \param rect rectangle into which to paint
     * \param clip_path if present, drawing is clipped to it
     * \param configuration configuration with which to resolve
     *                      the image
     * \param blend_mode blend mode with which to draw
     */
    enum return_code
    paint(Canvas &canvas, const Rect &rect,
          const boost::optional<Path> &clip_path,
          const ImageConfiguration &configuration,
          enum PainterEnums::blend_mode_t blend_mode);

    /*!
     * Stop listening to the image and dispose of the image
     * held; the painter cannot paint afterwards.
     */
    void
    dispose(void);

    /*!
     * Returns true if dispose() has been called.
     */
    bool
    disposed(void) const
    {
      return m_disposed;
    }

    const DecorationImage&
    details(void) const
    {
      return m_details;
    }

    /*!
     * Returns the image held, its image is null if
     * no image was received yet.
     */
    const ImageInfo&
    image(void) const
    {
      return m_image;
    }

    /*!
     * Returns the stream last resolved, null before the
     * first paint().
     */
    const reference_counted_ptr<ImageStream>&
    stream(void) const
    {
      return m_stream;
    }

  private:
    void
    handle_image(const ImageInfo &value, bool synchronous_call);

    DecorationImage m_details;
    boost::function<void ()> m_on_changed;
    reference_counted_ptr<ImageStream> m_stream;
    ImageStream::Connection m_connection;
    ImageInfo m_image;
    bool m_disposed;
  };

  std::ostream&
  operator<<(std::ostream &str, const DecorationImage &v);

  std::ostream&
  operator<<(std::ostream &str, const DecorationImagePainter &v);

/*! @} */
}
