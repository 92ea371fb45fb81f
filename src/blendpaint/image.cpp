/*!
 * \file image.cpp
 * \brief file image.cpp
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
#include <blendpaint/image.hpp>
#include <blendpaint/util/math.hpp>
#include <blendpaint/util/log.hpp>

namespace
{
  inline
  uint8_t
  premultiply_channel(uint8_t c, uint8_t a)
  {
    unsigned int v;

    v = static_cast<unsigned int>(c) * static_cast<unsigned int>(a);
    return static_cast<uint8_t>((v + 127u) / 255u);
  }
}

//////////////////////////////////
// blendpaint::Bitmap methods
blendpaint::Bitmap::
Bitmap(int w, int h):
  m_dimensions(w, h),
  m_pixels(w * h)
{}

blendpaint::reference_counted_ptr<blendpaint::Bitmap>
blendpaint::Bitmap::
create(int w, int h, c_array<const u8vec4> pixels, enum format_t fmt)
{
  if (w <= 0 || h <= 0)
    {
      BLENDPAINTlog_warning("Bitmap::create: invalid dimensions "
                            << w << "x" << h);
      return reference_counted_ptr<Bitmap>();
    }

  if (pixels.size() != static_cast<size_t>(w) * static_cast<size_t>(h))
    {
      BLENDPAINTlog_warning("Bitmap::create: " << pixels.size()
                            << " pixels given for an image of "
                            << w << "x" << h);
      return reference_counted_ptr<Bitmap>();
    }

  Bitmap *p;
  p = BLENDPAINTnew Bitmap(w, h);
  for (size_t i = 0, endi = pixels.size(); i < endi; ++i)
    {
      u8vec4 c(pixels[i]);
      if (fmt == rgba_format)
        {
          c.x() = premultiply_channel(c.x(), c.w());
          c.y() = premultiply_channel(c.y(), c.w());
          c.z() = premultiply_channel(c.z(), c.w());
        }
      p->m_pixels[i] = c;
    }
  return p;
}

blendpaint::reference_counted_ptr<blendpaint::Bitmap>
blendpaint::Bitmap::
create_solid(int w, int h, u8vec4 color)
{
  if (w <= 0 || h <= 0)
    {
      BLENDPAINTlog_warning("Bitmap::create_solid: invalid dimensions "
                            << w << "x" << h);
      return reference_counted_ptr<Bitmap>();
    }

  std::vector<u8vec4> pixels(w * h, color);
  return create(w, h, c_array<const u8vec4>(pixels), rgba_format);
}

blendpaint::u8vec4
blendpaint::Bitmap::
pixel(int x, int y) const
{
  x = t_clamp(x, 0, m_dimensions.x() - 1);
  y = t_clamp(y, 0, m_dimensions.y() - 1);
  return m_pixels[x + y * m_dimensions.x()];
}

blendpaint::vec4
blendpaint::Bitmap::
texel(int x, int y) const
{
  return vec4(pixel(x, y)) / 255.0f;
}

//////////////////////////////////
// blendpaint::Image methods
blendpaint::Image::
Image(const reference_counted_ptr<const Bitmap> &bitmap):
  m_bitmap(bitmap)
{}

blendpaint::reference_counted_ptr<blendpaint::Image>
blendpaint::Image::
create(const reference_counted_ptr<const Bitmap> &bitmap)
{
  if (!bitmap)
    {
      return reference_counted_ptr<Image>();
    }
  return BLENDPAINTnew Image(bitmap);
}

blendpaint::reference_counted_ptr<blendpaint::Image>
blendpaint::Image::
clone(void) const
{
  if (!m_bitmap)
    {
      BLENDPAINTlog_warning("Image::clone: cloning a disposed image");
      return reference_counted_ptr<Image>();
    }
  return BLENDPAINTnew Image(m_bitmap);
}

void
blendpaint::Image::
dispose(void)
{
  m_bitmap.clear();
}

//////////////////////////////////
// blendpaint::ImageInfo methods
blendpaint::ImageInfo
blendpaint::ImageInfo::
clone(void) const
{
  reference_counted_ptr<Image> im;

  if (m_image)
    {
      im = m_image->clone();
    }
  return ImageInfo(im, m_scale, m_debug_label);
}

void
blendpaint::ImageInfo::
dispose(void) const
{
  if (m_image)
    {
      m_image->dispose();
    }
}

bool
blendpaint::ImageInfo::
is_clone_of(const ImageInfo &other) const
{
  return m_image && other.m_image
    && m_image->is_clone_of(*other.m_image)
    && m_scale == other.m_scale
    && m_debug_label == other.m_debug_label;
}

std::ostream&
blendpaint::
operator<<(std::ostream &str, const ImageInfo &info)
{
  if (info.image())
    {
      str << "[" << info.image()->width() << "x" << info.image()->height() << "]";
    }
  else
    {
      str << "[null]";
    }
  str << " @ " << info.scale() << "x";
  if (!info.debug_label().empty())
    {
      str << " (" << info.debug_label() << ")";
    }
  return str;
}
