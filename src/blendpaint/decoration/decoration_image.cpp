/*!
 * \file decoration_image.cpp
 * \brief file decoration_image.cpp
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
#include <boost/bind/bind.hpp>
#include <blendpaint/decoration/decoration_image.hpp>
#include <blendpaint/painter/paint_image.hpp>
#include <blendpaint/util/log.hpp>
#include "../private/util_private_ostream.hpp"

////////////////////////////////////////
// blendpaint::DecorationImage methods
blendpaint::reference_counted_ptr<blendpaint::DecorationImagePainter>
blendpaint::DecorationImage::
create_painter(const boost::function<void ()> &on_changed) const
{
  return BLENDPAINTnew DecorationImagePainter(*this, on_changed);
}

///////////////////////////////////////////////
// blendpaint::DecorationImagePainter methods
blendpaint::DecorationImagePainter::
DecorationImagePainter(const DecorationImage &details,
                       const boost::function<void ()> &on_changed):
  m_details(details),
  m_on_changed(on_changed),
  m_disposed(false)
{}

blendpaint::DecorationImagePainter::
~DecorationImagePainter()
{
  dispose();
}

enum blendpaint::return_code
blendpaint::DecorationImagePainter::
paint(Canvas &canvas, const Rect &rect,
      const boost::optional<Path> &clip_path,
      const ImageConfiguration &configuration,
      enum PainterEnums::blend_mode_t blend_mode)
{
  bool flip_horizontally(false);

  if (m_disposed)
    {
      BLENDPAINTlog_error("DecorationImagePainter::paint called after dispose()");
      return routine_fail;
    }

  if (m_details.match_text_direction())
    {
      if (!configuration.text_direction())
        {
          BLENDPAINTlog_error("DecorationImage::match_text_direction requires a text "
                              << "direction but paint() was given " << configuration
                              << " for " << m_details);
          return routine_fail;
        }
      flip_horizontally = (*configuration.text_direction() == PainterEnums::text_direction_rtl);
    }

  if (!m_details.image())
    {
      BLENDPAINTlog_error("DecorationImage has no image provider: " << m_details);
      return routine_fail;
    }

  reference_counted_ptr<ImageStream> new_stream;

  new_stream = m_details.image()->resolve(configuration);
  if (!m_stream || new_stream->key() != m_stream->key())
    {
      ImageStreamListener listener(boost::bind(&DecorationImagePainter::handle_image, this,
                                               boost::placeholders::_1,
                                               boost::placeholders::_2),
                                   m_details.on_error());

      m_connection.disconnect();
      m_stream = new_stream;
      m_connection = m_stream->add_listener(listener);
    }

  if (!m_image.image())
    {
      return routine_success;
    }

  Alignment alignment;
  if (m_details.alignment().resolve(configuration.text_direction(), &alignment) == routine_fail)
    {
      return routine_fail;
    }

  if (clip_path)
    {
      canvas.save();
      canvas.clip_path(*clip_path);
    }

  enum return_code R;
  PaintImageParams params(rect, m_image.image());

  params
    .blend_mode(blend_mode)
    .debug_label(m_image.debug_label())
    .scale(m_details.scale() * m_image.scale())
    .color_filter(m_details.color_filter())
    .fit(m_details.fit())
    .alignment(alignment)
    .center_slice(m_details.center_slice())
    .repeat(m_details.repeat())
    .flip_horizontally(flip_horizontally)
    .opacity(m_details.opacity())
    .filter_quality(m_details.filter_quality())
    .invert_colors(m_details.invert_colors())
    .anti_alias(m_details.anti_alias());
  R = paint_image(canvas, params);

  if (clip_path)
    {
      canvas.restore();
    }

  return R;
}

void
blendpaint::DecorationImagePainter::
handle_image(const ImageInfo &value, bool synchronous_call)
{
  if (m_image == value)
    {
      return;
    }

  if (m_image.image() && m_image.is_clone_of(value))
    {
      value.dispose();
      return;
    }

  m_image.dispose();
  m_image = value;
  if (!synchronous_call && m_on_changed)
    {
      m_on_changed();
    }
}

void
blendpaint::DecorationImagePainter::
dispose(void)
{
  m_connection.disconnect();
  m_stream.clear();
  m_image.dispose();
  m_image = ImageInfo();
  m_disposed = true;
}

std::ostream&
blendpaint::
operator<<(std::ostream &str, const DecorationImage &v)
{
  str << "DecorationImage(provider = " << v.image().get();
  if (v.color_filter())
    {
      str << ", color filter = " << ColorFilter::label(v.color_filter()->type());
    }
  if (v.fit())
    {
      str << ", " << PainterEnums::label(*v.fit());
    }
  str << ", " << v.alignment();
  if (v.center_slice())
    {
      str << ", center slice = " << *v.center_slice();
    }
  if (v.repeat() != PainterEnums::image_no_repeat)
    {
      str << ", " << PainterEnums::label(v.repeat());
    }
  if (v.match_text_direction())
    {
      str << ", match text direction";
    }
  str << ", scale " << v.scale()
      << ", opacity " << v.opacity()
      << ", " << PainterEnums::label(v.filter_quality());
  if (v.invert_colors())
    {
      str << ", invert colors";
    }
  if (v.anti_alias())
    {
      str << ", anti-alias";
    }
  str << ")";
  return str;
}

std::ostream&
blendpaint::
operator<<(std::ostream &str, const DecorationImagePainter &v)
{
  str << "DecorationImagePainter(stream: ";
  if (v.stream())
    {
      str << *v.stream();
    }
  else
    {
      str << "null";
    }
  str << ", image: ";
  if (v.image().image())
    {
      str << v.image();
    }
  else
    {
      str << "null";
    }
  str << ") for " << v.details();
  return str;
}
