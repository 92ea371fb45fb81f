/*!
 * \file rect.hpp
 * \brief file rect.hpp
 *
 * Copyright 2018 by Intel.
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
#include <blendpaint/util/math.hpp>

namespace blendpaint
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * Class to specify the geometry of a rectangle
   * by its min-corner and max-corner. The y-coordinate
   * increases downwards, so the min-corner is the
   * top-left corner.
   */
  template<typename T>
  class RectT
  {
  public:
    /*!
     * Empty ctor; intializes both \ref m_min_point and
     * \ref m_max_point to (0, 0);
     */
    RectT(void):
      m_min_point(T(0), T(0)),
      m_max_point(T(0), T(0))
    {}

    /*!
     * Ctor from min and max corners.
     */
    RectT(const vecN<T, 2> &pmin, const vecN<T, 2> &pmax):
      m_min_point(pmin),
      m_max_point(pmax)
    {}

    /*!
     * Copy ctor from different rect type
     */
    template<typename S>
    explicit
    RectT(const RectT<S> &rect):
      m_min_point(rect.m_min_point),
      m_max_point(rect.m_max_point)
    {}

    /*!
     * Create a RectT from its left, top, right and bottom edges.
     */
    static
    RectT
    from_ltrb(T left, T top, T right, T bottom)
    {
      return RectT(vecN<T, 2>(left, top), vecN<T, 2>(right, bottom));
    }

    /*!
     * Create a RectT from its left and top edges
     * and its width and height.
     */
    static
    RectT
    from_ltwh(T left, T top, T width, T height)
    {
      return RectT(vecN<T, 2>(left, top),
                   vecN<T, 2>(left + width, top + height));
    }

    /*!
     * Create a RectT from its min-corner and its size.
     */
    static
    RectT
    from_point_and_size(const vecN<T, 2> &p, const vecN<T, 2> &sz)
    {
      return RectT(p, p + sz);
    }

    /*!
     * Set \ref m_min_point.
     */
    RectT&
    min_point(const vecN<T, 2> &p)
    {
      m_min_point = p;
      return *this;
    }

    /*!
     * Set \ref m_max_point.
     */
    RectT&
    max_point(const vecN<T, 2> &p)
    {
      m_max_point = p;
      return *this;
    }

    T
    min_x(void) const { return m_min_point.x(); }

    T
    min_y(void) const { return m_min_point.y(); }

    T
    max_x(void) const { return m_max_point.x(); }

    T
    max_y(void) const { return m_max_point.y(); }

    /*!
     * Translate the Rect, equivalent to
     * \code
     * m_min_point += tr;
     * m_max_point += tr;
     * \endcode
     * \param tr amount by which to translate
     */
    RectT&
    translate(const vecN<T, 2> &tr)
    {
      m_min_point += tr;
      m_max_point += tr;
      return *this;
    }

    /*!
     * Translate the Rect, equivalent to
     * \code
     * translate(vecN<T, 2>(x, y))
     * \endcode
     */
    RectT&
    translate(T x, T y)
    {
      return translate(vecN<T, 2>(x, y));
    }

    /*!
     * Returns a copy of this Rect translated by an amount.
     * \param tr amount by which to translate
     */
    RectT
    shift(const vecN<T, 2> &tr) const
    {
      RectT R(*this);
      R.translate(tr);
      return R;
    }

    /*!
     * Set \ref m_max_point from \ref m_min_point
     * and a size.
     */
    RectT&
    size(const vecN<T, 2> &sz)
    {
      m_max_point = m_min_point + sz;
      return *this;
    }

    /*!
     * Returns the size of the Rect; provided as
     * a conveniance, equivalent to
     * \code
     * m_max_point - m_min_point
     * \endcode
     */
    vecN<T, 2>
    size(void) const
    {
      return m_max_point - m_min_point;
    }

    T
    width(void) const
    {
      return m_max_point.x() - m_min_point.x();
    }

    T
    height(void) const
    {
      return m_max_point.y() - m_min_point.y();
    }

    /*!
     * Returns the center of the Rect.
     */
    vecN<T, 2>
    center(void) const
    {
      return (m_min_point + m_max_point) / T(2);
    }

    /*!
     * Returns true if the Rect encloses no area,
     * i.e. if width() or height() is not positive.
     */
    bool
    is_empty(void) const
    {
      return !(m_min_point.x() < m_max_point.x())
        || !(m_min_point.y() < m_max_point.y());
    }

    /*!
     * Returns true if a point is within the Rect; points
     * on the min-side edges are inside, points on the
     * max-side edges are not.
     * \param p point to test
     */
    bool
    contains(const vecN<T, 2> &p) const
    {
      return p.x() >= m_min_point.x() && p.x() < m_max_point.x()
        && p.y() >= m_min_point.y() && p.y() < m_max_point.y();
    }

    /*!
     * Returns the intersection of this Rect with another;
     * if they do not intersect the return value is_empty().
     * \param rhs Rect with which to intersect
     */
    RectT
    intersect(const RectT &rhs) const
    {
      return RectT(m_min_point.max_with(rhs.m_min_point),
                   m_max_point.min_with(rhs.m_max_point));
    }

    /*!
     * Sanitizes the Rect so that both width() and
     * height() are non-negative.
     */
    RectT&
    sanitize_size(void)
    {
      m_max_point = m_max_point.max_with(m_min_point);
      return *this;
    }

    bool
    operator==(const RectT &rhs) const
    {
      return m_min_point == rhs.m_min_point
        && m_max_point == rhs.m_max_point;
    }

    bool
    operator!=(const RectT &rhs) const
    {
      return !operator==(rhs);
    }

    /*!
     * Specifies the min-corner of the rectangle
     */
    vecN<T, 2> m_min_point;

    /*!
     * Specifies the max-corner of the rectangle.
     */
    vecN<T, 2> m_max_point;
  };

  /*!
   * Returns a RectT whose edges are those of
   * a RectT multiplied by a scalar.
   * \param rect Rect to scale
   * \param scale amount by which to scale
   */
  template<typename T>
  RectT<T>
  scale_rect(const RectT<T> &rect, T scale)
  {
    return RectT<T>(rect.m_min_point * scale, rect.m_max_point * scale);
  }

  /*!
   * Conveniance typedef for RectT<float>
   */
  typedef RectT<float> Rect;

  /*!
   * Conveniance typedef for RectT<int>
   */
  typedef RectT<int> IRect;

/*! @} */
}
