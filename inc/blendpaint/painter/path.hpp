/*!
 * \file path.hpp
 * \brief file path.hpp
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

#include <vector>
#include <iosfwd>
#include <blendpaint/util/vecN.hpp>
#include <blendpaint/util/rect.hpp>
#include <blendpaint/util/matrix.hpp>
#include <blendpaint/painter/painter_enums.hpp>

namespace blendpaint
{
/*!\addtogroup Painter
 * @{
 */

  /*!
   * \brief
   * A Path is a sequence of polygonal contours; each contour
   * is implicitely closed. Curved shapes (ovals, rounded
   * corners) are flattened to line segments when added.
   * A Path is used to specify clipping regions.
   */
  class Path
  {
  public:
    /*!
     * Number of line segments used to approximate a
     * quarter of an ellipse.
     */
    enum
      {
        segments_per_quarter = 16
      };

    /*!
     * Ctor, initializes the Path as empty with fill rule
     * \ref PainterEnums::nonzero_fill_rule.
     */
    Path(void);

    /*!
     * Start a new contour at a point; if a contour is
     * in progress it is ended.
     */
    Path&
    move_to(const vec2 &pt);

    /*!
     * Add a line segment to the current contour; if there
     * is no current contour, one is started at the point.
     */
    Path&
    line_to(const vec2 &pt);

    /*!
     * End the current contour.
     */
    Path&
    close_contour(void);

    /*!
     * Add a closed contour of the four corners of a Rect.
     */
    Path&
    add_rect(const Rect &r);

    /*!
     * Add a closed contour approximating the ellipse
     * inscribed in a Rect.
     */
    Path&
    add_oval(const Rect &r);

    /*!
     * Add a closed contour of a Rect with its corners
     * rounded by an ellipse of radii (rx, ry); the radii
     * are clamped to half of the size of the Rect.
     */
    Path&
    add_rounded_rect(const Rect &r, float rx, float ry);

    /*!
     * Set the fill rule used by contains() when no fill
     * rule is passed; default value is
     * \ref PainterEnums::nonzero_fill_rule.
     */
    Path&
    fill_rule(enum PainterEnums::fill_rule_t v)
    {
      m_fill_rule = v;
      return *this;
    }

    enum PainterEnums::fill_rule_t
    fill_rule(void) const
    {
      return m_fill_rule;
    }

    /*!
     * Returns the number of contours.
     */
    unsigned int
    number_contours(void) const
    {
      return m_contours.size();
    }

    /*!
     * Returns the points of a contour.
     * \param I which contour with 0 <= I < number_contours()
     */
    const std::vector<vec2>&
    contour(unsigned int I) const
    {
      BLENDPAINTassert(I < m_contours.size());
      return m_contours[I];
    }

    /*!
     * Returns true if the Path has no points.
     */
    bool
    empty(void) const;

    /*!
     * Returns the bounding box of the points of the Path;
     * if the Path is empty, returns a Rect at the origin
     * of size zero.
     */
    Rect
    bounds(void) const;

    /*!
     * Returns the winding number of the Path around a point.
     */
    int
    winding_number(const vec2 &pt) const;

    /*!
     * Returns true if a point is inside the Path for a
     * fill rule.
     */
    bool
    contains(const vec2 &pt, enum PainterEnums::fill_rule_t rule) const;

    /*!
     * Returns true if a point is inside the Path for
     * fill_rule().
     */
    bool
    contains(const vec2 &pt) const
    {
      return contains(pt, m_fill_rule);
    }

    /*!
     * Returns a copy of this Path with every point
     * transformed by a matrix.
     */
    Path
    transformed(const float3x3 &m) const;

    bool
    operator==(const Path &rhs) const
    {
      return m_fill_rule == rhs.m_fill_rule
        && m_contours == rhs.m_contours;
    }

    bool
    operator!=(const Path &rhs) const
    {
      return !operator==(rhs);
    }

  private:
    void
    add_arc(const vec2 &center, const vec2 &radii,
            float start_angle, unsigned int num_segments);

    std::vector<std::vector<vec2> > m_contours;
    bool m_contour_open;
    enum PainterEnums::fill_rule_t m_fill_rule;
  };

  /*!
   * Print the contours of a Path.
   */
  std::ostream&
  operator<<(std::ostream &str, const Path &path);

/*! @} */
}
