/*!
 * \file canvas.hpp
 * \brief file canvas.hpp
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

#include <blendpaint/util/util.hpp>
#include <blendpaint/util/vecN.hpp>
#include <blendpaint/util/rect.hpp>
#include <blendpaint/util/matrix.hpp>
#include <blendpaint/util/reference_counted.hpp>
#include <blendpaint/painter/paint.hpp>
#include <blendpaint/painter/path.hpp>
#include <blendpaint/image.hpp>

namespace blendpaint
{
/*!\addtogroup Painter
 * @{
 */

  /*!
   * \brief
   * A Canvas is the interface through which images are
   * drawn. A Canvas maintains a stack of states; each state
   * holds a transformation and a clipping region. Drawing
   * commands are in the local coordinates of the current
   * transformation and are clipped to the current clipping
   * region.
   */
  class Canvas:noncopyable
  {
  public:
    virtual
    ~Canvas()
    {}

    /*!
     * Push a copy of the current transformation and
     * clipping region onto the state stack.
     */
    virtual
    void
    save(void) = 0;

    /*!
     * As save(), but additionally redirect drawing to an
     * offscreen layer; at the matching restore() the layer
     * is composited with the color filter, alpha and blend
     * mode of a Paint.
     * \param bounds bounds, in local coordinates, to which
     *               the layer is clipped when composited
     * \param paint Paint with which to composite the layer
     */
    virtual
    void
    save_layer(const Rect &bounds, const Paint &paint) = 0;

    /*!
     * Pop the state stack, restoring the transformation and
     * clipping region to what they were at the matching
     * save(). A restore() without a matching save() is
     * ignored.
     */
    virtual
    void
    restore(void) = 0;

    /*!
     * Returns the number of states on the stack; a Canvas
     * starts with a save count of 1.
     */
    virtual
    int
    save_count(void) const = 0;

    /*!
     * Concat the transformation with a translation.
     */
    virtual
    void
    translate(float dx, float dy) = 0;

    /*!
     * Concat the transformation with a scaling.
     */
    virtual
    void
    scale(float sx, float sy) = 0;

    /*!
     * Concat the transformation with a matrix.
     */
    virtual
    void
    concat(const float3x3 &m) = 0;

    /*!
     * Intersect the clipping region with a Rect.
     */
    virtual
    void
    clip_rect(const Rect &r) = 0;

    /*!
     * Intersect the clipping region with a Path.
     */
    virtual
    void
    clip_path(const Path &path) = 0;

    /*!
     * Draw the portion src of an image stretched to
     * the Rect dst.
     * \param image image to draw
     * \param src sub-rectangle of the image in pixels
     * \param dst destination in local coordinates
     * \param paint Paint with which to draw
     */
    virtual
    void
    draw_image_rect(const reference_counted_ptr<Image> &image,
                    const Rect &src, const Rect &dst,
                    const Paint &paint) = 0;

    /*!
     * Draw an image as a nine-patch. The lines of center
     * split the image into a 3x3 grid. The four corners are
     * drawn unscaled at the corners of dst, the top and
     * bottom edges are stretched horizontally, the left and
     * right edges vertically and the center in both
     * directions.
     * \param image image to draw
     * \param center center of the grid, in pixels
     * \param dst destination in local coordinates
     * \param paint Paint with which to draw
     */
    virtual
    void
    draw_image_nine(const reference_counted_ptr<Image> &image,
                    const Rect &center, const Rect &dst,
                    const Paint &paint) = 0;
  };

/*! @} */
}
