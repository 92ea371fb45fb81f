/*!
 * \file alignment.hpp
 * \brief file alignment.hpp
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
#include <boost/optional.hpp>
#include <blendpaint/util/util.hpp>
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
   * An Alignment is a point within a rectangle where
   * (-1, -1) is the top-left corner, (0, 0) the center
   * and (1, 1) the bottom-right corner.
   */
  class Alignment
  {
  public:
    /*!
     * Ctor.
     * \param x horizontal position, -1 is the left side
     * \param y vertical position, -1 is the top side
     */
    Alignment(float x = 0.0f, float y = 0.0f):
      m_x(x),
      m_y(y)
    {}

    float
    x(void) const
    {
      return m_x;
    }

    float
    y(void) const
    {
      return m_y;
    }

    /*!
     * Returns the rectangle of the given size placed
     * within a rectangle according to this Alignment.
     * \param size size of the rectangle to place
     * \param rect rectangle in which to place
     */
    Rect
    inscribe(const vec2 &size, const Rect &rect) const;

    /*!
     * Returns the point within a rectangle given by
     * this Alignment.
     */
    vec2
    within_rect(const Rect &rect) const;

    bool
    operator==(const Alignment &rhs) const
    {
      return m_x == rhs.m_x && m_y == rhs.m_y;
    }

    bool
    operator!=(const Alignment &rhs) const
    {
      return !operator==(rhs);
    }

    static Alignment top_left(void) { return Alignment(-1.0f, -1.0f); }
    static Alignment top_center(void) { return Alignment(0.0f, -1.0f); }
    static Alignment top_right(void) { return Alignment(1.0f, -1.0f); }
    static Alignment center_left(void) { return Alignment(-1.0f, 0.0f); }
    static Alignment center(void) { return Alignment(0.0f, 0.0f); }
    static Alignment center_right(void) { return Alignment(1.0f, 0.0f); }
    static Alignment bottom_left(void) { return Alignment(-1.0f, 1.0f); }
    static Alignment bottom_center(void) { return Alignment(0.0f, 1.0f); }
    static Alignment bottom_right(void) { return Alignment(1.0f, 1.0f); }

  private:
    float m_x, m_y;
  };

  /*!
   * \brief
   * An AlignmentDirectional is an Alignment whose horizontal
   * position is measured from the start side of the text
   * direction: the left side for left-to-right and the
   * right side for right-to-left.
   */
  class AlignmentDirectional
  {
  public:
    /*!
     * Ctor.
     * \param start horizontal position, -1 is the start side
     * \param y vertical position, -1 is the top side
     */
    AlignmentDirectional(float start = 0.0f, float y = 0.0f):
      m_start(start),
      m_y(y)
    {}

    float
    start(void) const
    {
      return m_start;
    }

    float
    y(void) const
    {
      return m_y;
    }

    /*!
     * Returns the Alignment for a text direction.
     */
    Alignment
    resolve(enum PainterEnums::text_direction_t direction) const
    {
      return Alignment(direction == PainterEnums::text_direction_rtl ? -m_start : m_start,
                       m_y);
    }

    bool
    operator==(const AlignmentDirectional &rhs) const
    {
      return m_start == rhs.m_start && m_y == rhs.m_y;
    }

    bool
    operator!=(const AlignmentDirectional &rhs) const
    {
      return !operator==(rhs);
    }

    static AlignmentDirectional top_start(void) { return AlignmentDirectional(-1.0f, -1.0f); }
    static AlignmentDirectional top_end(void) { return AlignmentDirectional(1.0f, -1.0f); }
    static AlignmentDirectional center_start(void) { return AlignmentDirectional(-1.0f, 0.0f); }
    static AlignmentDirectional center_end(void) { return AlignmentDirectional(1.0f, 0.0f); }
    static AlignmentDirectional bottom_start(void) { return AlignmentDirectional(-1.0f, 1.0f); }
    static AlignmentDirectional bottom_end(void) { return AlignmentDirectional(1.0f, 1.0f); }

  private:
    float m_start, m_y;
  };

  /*!
   * \brief
   * An AlignmentGeometry holds either an Alignment or an
   * AlignmentDirectional.
   */
  class AlignmentGeometry
  {
  public:
    /*!
     * Ctor, initializes as Alignment::center().
     */
    AlignmentGeometry(void):
      m_directional(false)
    {}

    AlignmentGeometry(const Alignment &v):
      m_alignment(v),
      m_directional(false)
    {}

    AlignmentGeometry(const AlignmentDirectional &v):
      m_alignment_directional(v),
      m_directional(true)
    {}

    /*!
     * Returns true if the value is an AlignmentDirectional.
     */
    bool
    is_directional(void) const
    {
      return m_directional;
    }

    /*!
     * Returns the Alignment value, only meaningful
     * if is_directional() is false.
     */
    const Alignment&
    alignment(void) const
    {
      return m_alignment;
    }

    /*!
     * Returns the AlignmentDirectional value, only
     * meaningful if is_directional() is true.
     */
    const AlignmentDirectional&
    alignment_directional(void) const
    {
      return m_alignment_directional;
    }

    /*!
     * Resolve to an Alignment. An Alignment ignores the text
     * direction. An AlignmentDirectional requires a text
     * direction; without one the failure is logged, out is
     * not modified and routine_fail is returned.
     * \param direction text direction, if any
     * \param[out] out location to which to write the Alignment
     */
    enum return_code
    resolve(const boost::optional<enum PainterEnums::text_direction_t> &direction,
            Alignment *out) const;

    bool
    operator==(const AlignmentGeometry &rhs) const;

    bool
    operator!=(const AlignmentGeometry &rhs) const
    {
      return !operator==(rhs);
    }

  private:
    Alignment m_alignment;
    AlignmentDirectional m_alignment_directional;
    bool m_directional;
  };

  std::ostream&
  operator<<(std::ostream &str, const Alignment &v);

  std::ostream&
  operator<<(std::ostream &str, const AlignmentDirectional &v);

  std::ostream&
  operator<<(std::ostream &str, const AlignmentGeometry &v);

/*! @} */
}
