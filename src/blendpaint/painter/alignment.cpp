/*!
 * \file alignment.cpp
 * \brief file alignment.cpp
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

#include <iostream>
#include <blendpaint/painter/alignment.hpp>
#include <blendpaint/util/log.hpp>

//////////////////////////////////
// blendpaint::Alignment methods
blendpaint::Rect
blendpaint::Alignment::
inscribe(const vec2 &size, const Rect &rect) const
{
  float half_width_delta, half_height_delta;

  half_width_delta = 0.5f * (rect.width() - size.x());
  half_height_delta = 0.5f * (rect.height() - size.y());
  return Rect::from_ltwh(rect.min_x() + half_width_delta + m_x * half_width_delta,
                         rect.min_y() + half_height_delta + m_y * half_height_delta,
                         size.x(), size.y());
}

blendpaint::vec2
blendpaint::Alignment::
within_rect(const Rect &rect) const
{
  float half_width, half_height;

  half_width = 0.5f * rect.width();
  half_height = 0.5f * rect.height();
  return vec2(rect.min_x() + half_width + m_x * half_width,
              rect.min_y() + half_height + m_y * half_height);
}

///////////////////////////////////////////
// blendpaint::AlignmentGeometry methods
enum blendpaint::return_code
blendpaint::AlignmentGeometry::
resolve(const boost::optional<enum PainterEnums::text_direction_t> &direction,
        Alignment *out) const
{
  if (!m_directional)
    {
      *out = m_alignment;
      return routine_success;
    }

  if (!direction)
    {
      BLENDPAINTlog_error("Cannot resolve " << *this << " without a text direction");
      return routine_fail;
    }

  *out = m_alignment_directional.resolve(*direction);
  return routine_success;
}

bool
blendpaint::AlignmentGeometry::
operator==(const AlignmentGeometry &rhs) const
{
  if (m_directional != rhs.m_directional)
    {
      return false;
    }
  return (m_directional) ?
    m_alignment_directional == rhs.m_alignment_directional :
    m_alignment == rhs.m_alignment;
}

std::ostream&
blendpaint::
operator<<(std::ostream &str, const Alignment &v)
{
  str << "Alignment(" << v.x() << ", " << v.y() << ")";
  return str;
}

std::ostream&
blendpaint::
operator<<(std::ostream &str, const AlignmentDirectional &v)
{
  str << "AlignmentDirectional(" << v.start() << ", " << v.y() << ")";
  return str;
}

std::ostream&
blendpaint::
operator<<(std::ostream &str, const AlignmentGeometry &v)
{
  if (v.is_directional())
    {
      str << v.alignment_directional();
    }
  else
    {
      str << v.alignment();
    }
  return str;
}
