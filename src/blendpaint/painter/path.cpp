/*!
 * \file path.cpp
 * \brief file path.cpp
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

#include <iostream>
#include <blendpaint/painter/path.hpp>
#include <blendpaint/util/math.hpp>
#include "../private/util_private_ostream.hpp"

namespace
{
  /* > 0 if p is left of the line through a and b,
   * < 0 if right and 0 if on the line.
   */
  float
  is_left(const blendpaint::vec2 &a, const blendpaint::vec2 &b,
          const blendpaint::vec2 &p)
  {
    return (b.x() - a.x()) * (p.y() - a.y()) - (p.x() - a.x()) * (b.y() - a.y());
  }
}

blendpaint::Path::
Path(void):
  m_contour_open(false),
  m_fill_rule(PainterEnums::nonzero_fill_rule)
{}

blendpaint::Path&
blendpaint::Path::
move_to(const vec2 &pt)
{
  m_contours.push_back(std::vector<vec2>());
  m_contours.back().push_back(pt);
  m_contour_open = true;
  return *this;
}

blendpaint::Path&
blendpaint::Path::
line_to(const vec2 &pt)
{
  if (!m_contour_open)
    {
      return move_to(pt);
    }
  m_contours.back().push_back(pt);
  return *this;
}

blendpaint::Path&
blendpaint::Path::
close_contour(void)
{
  m_contour_open = false;
  return *this;
}

blendpaint::Path&
blendpaint::Path::
add_rect(const Rect &r)
{
  move_to(vec2(r.min_x(), r.min_y()));
  line_to(vec2(r.max_x(), r.min_y()));
  line_to(vec2(r.max_x(), r.max_y()));
  line_to(vec2(r.min_x(), r.max_y()));
  return close_contour();
}

void
blendpaint::Path::
add_arc(const vec2 &center, const vec2 &radii,
        float start_angle, unsigned int num_segments)
{
  float delta(0.5f * BLENDPAINT_PI / static_cast<float>(num_segments));

  for (unsigned int i = 0; i <= num_segments; ++i)
    {
      float theta(start_angle + delta * static_cast<float>(i));
      line_to(center + vec2(radii.x() * t_cos(theta),
                            radii.y() * t_sin(theta)));
    }
}

blendpaint::Path&
blendpaint::Path::
add_oval(const Rect &r)
{
  vec2 center(r.center());
  vec2 radii(r.size() * 0.5f);
  float delta(0.5f * BLENDPAINT_PI / static_cast<float>(segments_per_quarter));

  move_to(center + vec2(radii.x(), 0.0f));
  for (unsigned int i = 1; i < 4 * segments_per_quarter; ++i)
    {
      float theta(delta * static_cast<float>(i));
      line_to(center + vec2(radii.x() * t_cos(theta),
                            radii.y() * t_sin(theta)));
    }
  return close_contour();
}

blendpaint::Path&
blendpaint::Path::
add_rounded_rect(const Rect &r, float rx, float ry)
{
  rx = t_clamp(rx, 0.0f, 0.5f * t_abs(r.width()));
  ry = t_clamp(ry, 0.0f, 0.5f * t_abs(r.height()));

  if (rx <= 0.0f || ry <= 0.0f)
    {
      return add_rect(r);
    }

  vec2 radii(rx, ry);

  /* y increases downwards, angles increase clockwise
   * starting from the positive x-axis
   */
  close_contour();
  add_arc(vec2(r.max_x() - rx, r.max_y() - ry), radii, 0.0f, segments_per_quarter);
  add_arc(vec2(r.min_x() + rx, r.max_y() - ry), radii, 0.5f * BLENDPAINT_PI, segments_per_quarter);
  add_arc(vec2(r.min_x() + rx, r.min_y() + ry), radii, BLENDPAINT_PI, segments_per_quarter);
  add_arc(vec2(r.max_x() - rx, r.min_y() + ry), radii, 1.5f * BLENDPAINT_PI, segments_per_quarter);
  return close_contour();
}

bool
blendpaint::Path::
empty(void) const
{
  for (const std::vector<vec2> &C : m_contours)
    {
      if (!C.empty())
        {
          return false;
        }
    }
  return true;
}

blendpaint::Rect
blendpaint::Path::
bounds(void) const
{
  bool first(true);
  Rect R;

  for (const std::vector<vec2> &C : m_contours)
    {
      for (const vec2 &p : C)
        {
          if (first)
            {
              R.m_min_point = R.m_max_point = p;
              first = false;
            }
          else
            {
              R.m_min_point = R.m_min_point.min_with(p);
              R.m_max_point = R.m_max_point.max_with(p);
            }
        }
    }
  return R;
}

int
blendpaint::Path::
winding_number(const vec2 &pt) const
{
  int w(0);

  for (const std::vector<vec2> &C : m_contours)
    {
      unsigned int N(C.size());
      if (N < 3)
        {
          continue;
        }

      for (unsigned int i = 0; i < N; ++i)
        {
          const vec2 &a(C[i]);
          const vec2 &b(C[(i + 1 == N) ? 0 : i + 1]);

          if (a.y() <= pt.y())
            {
              if (b.y() > pt.y() && is_left(a, b, pt) > 0.0f)
                {
                  ++w;
                }
            }
          else
            {
              if (b.y() <= pt.y() && is_left(a, b, pt) < 0.0f)
                {
                  --w;
                }
            }
        }
    }
  return w;
}

bool
blendpaint::Path::
contains(const vec2 &pt, enum PainterEnums::fill_rule_t rule) const
{
  int w(winding_number(pt));

  switch (rule)
    {
    case PainterEnums::odd_even_fill_rule:
      return (w & 1) != 0;

    case PainterEnums::complement_odd_even_fill_rule:
      return (w & 1) == 0;

    case PainterEnums::complement_nonzero_fill_rule:
      return w == 0;

    default:
      return w != 0;
    }
}

blendpaint::Path
blendpaint::Path::
transformed(const float3x3 &m) const
{
  Path R;

  R.m_fill_rule = m_fill_rule;
  R.m_contours.reserve(m_contours.size());
  for (const std::vector<vec2> &C : m_contours)
    {
      R.m_contours.push_back(std::vector<vec2>());
      R.m_contours.back().reserve(C.size());
      for (const vec2 &p : C)
        {
          R.m_contours.back().push_back(m.apply_to_point(p));
        }
    }
  return R;
}

std::ostream&
blendpaint::
operator<<(std::ostream &str, const Path &path)
{
  str << "Path(" << PainterEnums::label(path.fill_rule()) << ")";
  for (unsigned int c = 0; c < path.number_contours(); ++c)
    {
      str << "\n\t{";
      for (const vec2 &p : path.contour(c))
        {
          str << p;
        }
      str << "}";
    }
  return str;
}
