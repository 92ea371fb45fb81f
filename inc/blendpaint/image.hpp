/*!
 * \file image.hpp
 * \brief file image.hpp
 *
 * Copyright 2016 by Intel.
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
#include <vector>
#include <iosfwd>
#include <blendpaint/util/util.hpp>
#include <blendpaint/util/vecN.hpp>
#include <blendpaint/util/c_array.hpp>
#include <blendpaint/util/reference_counted.hpp>

namespace blendpaint
{
/*!\addtogroup Imaging
 * @{
 */

  /*!
   * \brief
   * A Bitmap holds decoded image data, as RGBA8 with
   * alpha pre-multiplied. A Bitmap is immutable once
   * created.
   */
  class Bitmap:
    public reference_counted<Bitmap>::concurrent
  {
  public:
    /*!
     * \brief
     * Enumeration to describe the format of input pixels
     */
    enum format_t
      {
        /*!
         * Pixels are RGBA8 with alpha NOT pre-multiplied.
         */
        rgba_format,

        /*!
         * Pixels are RGBA8 with alpha pre-multiplied.
         */
        premultiplied_rgba_format,
      };

    /*!
     * Create a Bitmap. Returns a null handle if w or h is
     * not positive or if the number of pixels is not w * h.
     * \param w width of the image
     * \param h height of the image
     * \param pixels pixels of the image, row by row with the
     *               top row first
     * \param fmt format of the pixels
     */
    static
    reference_counted_ptr<Bitmap>
    create(int w, int h, c_array<const u8vec4> pixels, enum format_t fmt);

    /*!
     * Provided as a conveniance, creates a Bitmap where
     * every pixel is the same color.
     * \param w width of the image
     * \param h height of the image
     * \param color color (alpha NOT pre-multiplied) of each pixel
     */
    static
    reference_counted_ptr<Bitmap>
    create_solid(int w, int h, u8vec4 color);

    /*!
     * Returns the dimensions of the Bitmap.
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
     * Returns the pixels, alpha pre-multiplied.
     */
    c_array<const u8vec4>
    pixels(void) const
    {
      return m_pixels;
    }

    /*!
     * Returns a pixel, alpha pre-multiplied, with the
     * location clamped to the dimensions of the Bitmap.
     */
    u8vec4
    pixel(int x, int y) const;

    /*!
     * Returns a pixel as float values in [0, 1] with alpha
     * pre-multiplied, with the location clamped to the
     * dimensions of the Bitmap.
     */
    vec4
    texel(int x, int y) const;

  private:
    Bitmap(int w, int h);

    ivec2 m_dimensions;
    std::vector<u8vec4> m_pixels;
  };

  /*!
   * \brief
   * An Image is a handle onto a Bitmap. Several handles
   * may refer to the same Bitmap; each handle is released
   * separately with dispose(). A disposed handle cannot
   * be drawn.
   */
  class Image:
    public reference_counted<Image>::concurrent
  {
  public:
    /*!
     * Create a handle onto a Bitmap. Returns a null
     * handle if the Bitmap is null.
     */
    static
    reference_counted_ptr<Image>
    create(const reference_counted_ptr<const Bitmap> &bitmap);

    /*!
     * Create a new handle onto the same Bitmap as this
     * handle. Cloning a disposed handle returns a null
     * handle.
     */
    reference_counted_ptr<Image>
    clone(void) const;

    /*!
     * Release the handle; after dispose() the handle no
     * longer refers to a Bitmap. Other handles onto the
     * same Bitmap are not affected.
     */
    void
    dispose(void);

    /*!
     * Returns true if dispose() has been called.
     */
    bool
    disposed(void) const
    {
      return !m_bitmap;
    }

    /*!
     * Returns true if this handle and another handle
     * refer to the same Bitmap; disposed handles are
     * never clones.
     */
    bool
    is_clone_of(const Image &other) const
    {
      return m_bitmap && m_bitmap == other.m_bitmap;
    }

    /*!
     * Returns the Bitmap, a null handle if disposed.
     */
    const reference_counted_ptr<const Bitmap>&
    bitmap(void) const
    {
      return m_bitmap;
    }

    /*!
     * Returns the width in pixels, 0 if disposed.
     */
    int
    width(void) const
    {
      return m_bitmap ? m_bitmap->width() : 0;
    }

    /*!
     * Returns the height in pixels, 0 if disposed.
     */
    int
    height(void) const
    {
      return m_bitmap ? m_bitmap->height() : 0;
    }

  private:
    explicit
    Image(const reference_counted_ptr<const Bitmap> &bitmap);

    reference_counted_ptr<const Bitmap> m_bitmap;
  };

  /*!
   * \brief
   * An ImageInfo is an Image handle together with the
   * scale at which to draw it and a label for diagnostics.
   */
  class ImageInfo
  {
  public:
    /*!
     * Ctor, initializes as having no image.
     */
    ImageInfo(void):
      m_scale(1.0f)
    {}

    /*!
     * Ctor.
     * \param image handle of the image
     * \param scale number of image pixels per logical pixel
     * \param debug_label label for diagnostics
     */
    explicit
    ImageInfo(const reference_counted_ptr<Image> &image,
              float scale = 1.0f,
              const std::string &debug_label = std::string()):
      m_image(image),
      m_scale(scale),
      m_debug_label(debug_label)
    {}

    const reference_counted_ptr<Image>&
    image(void) const
    {
      return m_image;
    }

    float
    scale(void) const
    {
      return m_scale;
    }

    const std::string&
    debug_label(void) const
    {
      return m_debug_label;
    }

    /*!
     * Returns an ImageInfo with a clone of image()
     * and the same scale and label.
     */
    ImageInfo
    clone(void) const;

    /*!
     * Disposes image().
     */
    void
    dispose(void) const;

    /*!
     * Returns true if the image of this and another
     * ImageInfo are clones of each other and the scale
     * and labels are the same.
     */
    bool
    is_clone_of(const ImageInfo &other) const;

    /*!
     * Two ImageInfo are equal if they use the same Image
     * handle with the same scale and label.
     */
    bool
    operator==(const ImageInfo &rhs) const
    {
      return m_image == rhs.m_image
        && m_scale == rhs.m_scale
        && m_debug_label == rhs.m_debug_label;
    }

    bool
    operator!=(const ImageInfo &rhs) const
    {
      return !operator==(rhs);
    }

  private:
    reference_counted_ptr<Image> m_image;
    float m_scale;
    std::string m_debug_label;
  };

  /*!
   * Print an ImageInfo as its size, scale and label.
   */
  std::ostream&
  operator<<(std::ostream &str, const ImageInfo &info);

/*! @} */
}
