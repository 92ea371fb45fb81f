/*!
 * \file recording_canvas.cpp
 * \brief file recording_canvas.cpp
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
#include <blendpaint/painter/recording_canvas.hpp>
#include <blendpaint/util/log.hpp>
#include "../private/util_private_ostream.hpp"

//////////////////////////////////
// blendpaint::CanvasCommand methods
blendpaint::c_string
blendpaint::CanvasCommand::
label(enum type_t v)
{
  static const c_string labels[number_command_types] =
    {
      /* [save_command] */ "save",
      /* [save_layer_command] */ "save_layer",
      /* [restore_command] */ "restore",
      /* [translate_command] */ "translate",
      /* [scale_command] */ "scale",
      /* [concat_command] */ "concat",
      /* [clip_rect_command] */ "clip_rect",
      /* [clip_path_command] */ "clip_path",
      /* [draw_image_rect_command] */ "draw_image_rect",
      /* [draw_image_nine_command] */ "draw_image_nine",
    };
  return (v < number_command_types) ? labels[v] : "InvalidEnum";
}

std::ostream&
blendpaint::
operator<<(std::ostream &str, const CanvasCommand &cmd)
{
  str << CanvasCommand::label(cmd.m_type);
  switch (cmd.m_type)
    {
    case CanvasCommand::save_layer_command:
      str << "(" << cmd.m_rect << ", "
          << PainterEnums::label(cmd.m_paint.blend_mode()) << ")";
      break;

    case CanvasCommand::translate_command:
    case CanvasCommand::scale_command:
      str << cmd.m_values;
      break;

    case CanvasCommand::concat_command:
      str << cmd.m_matrix.raw_data();
      break;

    case CanvasCommand::clip_rect_command:
      str << "(" << cmd.m_rect << ")";
      break;

    case CanvasCommand::clip_path_command:
      str << "(" << cmd.m_path.bounds() << ")";
      break;

    case CanvasCommand::draw_image_rect_command:
    case CanvasCommand::draw_image_nine_command:
      str << "(" << cmd.m_rect << ", " << cmd.m_dst << ", "
          << PainterEnums::label(cmd.m_paint.blend_mode())
          << ", alpha = " << cmd.m_paint.alpha() << ")";
      break;

    default:
      break;
    }
  return str;
}

//////////////////////////////////
// blendpaint::RecordingCanvas methods
blendpaint::RecordingCanvas::
RecordingCanvas(void):
  m_save_count(1)
{}

void
blendpaint::RecordingCanvas::
save(void)
{
  m_commands.push_back(CanvasCommand(CanvasCommand::save_command));
  ++m_save_count;
}

void
blendpaint::RecordingCanvas::
save_layer(const Rect &bounds, const Paint &paint)
{
  CanvasCommand C(CanvasCommand::save_layer_command);

  C.m_rect = bounds;
  C.m_paint = paint;
  m_commands.push_back(C);
  ++m_save_count;
}

void
blendpaint::RecordingCanvas::
restore(void)
{
  if (m_save_count <= 1)
    {
      BLENDPAINTlog_warning("RecordingCanvas::restore: restore without matching save ignored");
      return;
    }
  m_commands.push_back(CanvasCommand(CanvasCommand::restore_command));
  --m_save_count;
}

int
blendpaint::RecordingCanvas::
save_count(void) const
{
  return m_save_count;
}

void
blendpaint::RecordingCanvas::
translate(float dx, float dy)
{
  CanvasCommand C(CanvasCommand::translate_command);

  C.m_values = vec2(dx, dy);
  m_commands.push_back(C);
}

void
blendpaint::RecordingCanvas::
scale(float sx, float sy)
{
  CanvasCommand C(CanvasCommand::scale_command);

  C.m_values = vec2(sx, sy);
  m_commands.push_back(C);
}

void
blendpaint::RecordingCanvas::
concat(const float3x3 &m)
{
  CanvasCommand C(CanvasCommand::concat_command);

  C.m_matrix = m;
  m_commands.push_back(C);
}

void
blendpaint::RecordingCanvas::
clip_rect(const Rect &r)
{
  CanvasCommand C(CanvasCommand::clip_rect_command);

  C.m_rect = r;
  m_commands.push_back(C);
}

void
blendpaint::RecordingCanvas::
clip_path(const Path &path)
{
  CanvasCommand C(CanvasCommand::clip_path_command);

  C.m_path = path;
  m_commands.push_back(C);
}

void
blendpaint::RecordingCanvas::
draw_image_rect(const reference_counted_ptr<Image> &image,
                const Rect &src, const Rect &dst,
                const Paint &paint)
{
  CanvasCommand C(CanvasCommand::draw_image_rect_command);

  C.m_image = image;
  C.m_rect = src;
  C.m_dst = dst;
  C.m_paint = paint;
  m_commands.push_back(C);
}

void
blendpaint::RecordingCanvas::
draw_image_nine(const reference_counted_ptr<Image> &image,
                const Rect &center, const Rect &dst,
                const Paint &paint)
{
  CanvasCommand C(CanvasCommand::draw_image_nine_command);

  C.m_image = image;
  C.m_rect = center;
  C.m_dst = dst;
  C.m_paint = paint;
  m_commands.push_back(C);
}

unsigned int
blendpaint::RecordingCanvas::
count(enum CanvasCommand::type_t tp) const
{
  unsigned int return_value(0);
  for (const CanvasCommand &C : m_commands)
    {
      if (C.m_type == tp)
        {
          ++return_value;
        }
    }
  return return_value;
}

void
blendpaint::RecordingCanvas::
clear(void)
{
  m_commands.clear();
  m_save_count = 1;
}

void
blendpaint::RecordingCanvas::
replay(Canvas &dst) const
{
  int start_count(dst.save_count());

  for (const CanvasCommand &C : m_commands)
    {
      switch (C.m_type)
        {
        case CanvasCommand::save_command:
          dst.save();
          break;

        case CanvasCommand::save_layer_command:
          dst.save_layer(C.m_rect, C.m_paint);
          break;

        case CanvasCommand::restore_command:
          dst.restore();
          break;

        case CanvasCommand::translate_command:
          dst.translate(C.m_values.x(), C.m_values.y());
          break;

        case CanvasCommand::scale_command:
          dst.scale(C.m_values.x(), C.m_values.y());
          break;

        case CanvasCommand::concat_command:
          dst.concat(C.m_matrix);
          break;

        case CanvasCommand::clip_rect_command:
          dst.clip_rect(C.m_rect);
          break;

        case CanvasCommand::clip_path_command:
          dst.clip_path(C.m_path);
          break;

        case CanvasCommand::draw_image_rect_command:
          dst.draw_image_rect(C.m_image, C.m_rect, C.m_dst, C.m_paint);
          break;

        case CanvasCommand::draw_image_nine_command:
          dst.draw_image_nine(C.m_image, C.m_rect, C.m_dst, C.m_paint);
          break;

        default:
          BLENDPAINTlog_error("RecordingCanvas::replay: invalid command "
                              << C.m_type);
        }
    }

  while (dst.save_count() > start_count)
    {
      dst.restore();
    }
}
