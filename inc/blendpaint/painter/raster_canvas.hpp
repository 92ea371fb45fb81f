/*!
 * \file raster_canvas.hpp
 * \brief file raster_canvas.hpp
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

#include <blendpaint/painter/canvas.hpp>
#include <blendpaint/painter/raster_surface.hpp>

namespace blendpaint
{
/*!\addtogroup Painter
 * @{
 */

  /*!
   * \brief
   * A RasterCanvas is a Canvas that renders in software
   * to a RasterSurface.
   *
   * Each drawn pixel goes through the following steps:
   *  - the image is sampled at the pixel center with the
   *    filter given by PainterEnums::filter_for_quality()
   *    of the Paint, never reading outside of the source
   *    rectangle
   *  - the color filter, then the color inversion, of the
   *    Paint are applied
   *  - the color is modulated by the alpha of the Paint
   *  - the blend mode of the Paint composites the color
   *    with the destination pixel; the result is weighted
   *    by coverage and the clipping region.
   *
   * Coverage is computed from 4 samples per pixel when the
   * Paint is anti-aliased and from the pixel center otherwise.
   * Clipping regions are always computed from 4 samples per
   * pixel.
   */
  class RasterCanvas:public Canvas
  {
  public:
    /*!
     * Ctor.
     * \param surface RasterSurface to which to render, the
     *                surface must outlive the RasterCanvas
     */
    explicit
    RasterCanvas(RasterSurface &surface);

    ~RasterCanvas();

    virtual
    void
    save(void);

    virtual
    void
    save_layer(const Rect &bounds, const Paint &paint);

    virtual
    void
    restore(void);

    virtual
    int
    save_count(void) const;

    virtual
    void
    translate(float dx, float dy);

    virtual
    void
    scale(float sx, float sy);

    virtual
    void
    concat(const float3x3 &m);

    virtual
    void
    clip_rect(const Rect &r);

    virtual
    void
    clip_path(const Path &path);

    virtual
    void
    draw_image_rect(const reference_counted_ptr<Image> &image,
                    const Rect &src, const Rect &dst,
                    const Paint &paint);

    virtual
    void
    draw_image_nine(const reference_counted_ptr<Image> &image,
                    const Rect &center, const Rect &dst,
                    const Paint &paint);

    /*!
     * Returns the current transformation from local
     * coordinates to pixel coordinates.
     */
    const float3x3&
    transformation(void) const;

    /*!
     * Returns the coverage in [0, 1] of the current
     * clipping region at a pixel.
     */
    float
    clip_coverage(int x, int y) const;

    /*!
     * Returns the RasterSurface rendered to.
     */
    RasterSurface&
    surface(void) const;

  private:
    void *m_d;
  };

/*! @} */
}
