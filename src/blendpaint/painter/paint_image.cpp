/*!
 * \file paint_image.cpp
 * \brief file paint_image.cpp
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

#include <vector>
#include <blendpaint/painter/paint_image.hpp>
#include <blendpaint/painter/image_geometry.hpp>
#include <blendpaint/util/math.hpp>
#include <blendpaint/util/log.hpp>
#include "../private/util_private_ostream.hpp"

namespace
{
  bool
  sizes_match(const blendpaint::vec2 &a, const blendpaint::vec2 &b)
  {
    using namespace blendpaint;
    for (unsigned int i = 0; i < 2; ++i)
      {
        float tol;

        tol = 1e-4f * t_max(1.0f, t_abs(b[i]));
        if (t_abs(a[i] - b[i]) > tol)
          {
            return false;
          }
      }
    return true;
  }

  blendpaint::c_string
  image_label(const blendpaint::PaintImageParams &params)
  {
    return params.debug_label().empty() ?
      "<unlabeled image>" :
      params.debug_label().c_str();
  }
}

enum blendpaint::return_code
blendpaint::
paint_image(Canvas &canvas, const PaintImageParams &params)
{
  const Rect &rect(params.rect());
  const reference_counted_ptr<Image> &image(params.image());
  float scale(params.scale());
  enum PainterEnums::image_repeat_t repeat(params.repeat());
  enum PainterEnums::box_fit_t fit;
  vec2 output_size, input_size, slice_border(0.0f, 0.0f);
  vec2 source_size, destination_size;
  FittedSizes fitted;

  if (rect.is_empty())
    {
      return routine_success;
    }

  if (!image || image->disposed())
    {
      BLENDPAINTlog_warning("Cannot paint " << image_label(params)
                            << ": image is " << (image ? "disposed" : "null"));
      return routine_fail;
    }

  if (scale <= 0.0f)
    {
      BLENDPAINTlog_error("Cannot paint " << image_label(params)
                          << " with non-positive scale " << scale);
      return routine_fail;
    }

  output_size = rect.size();
  input_size = vec2(static_cast<float>(image->width()),
                    static_cast<float>(image->height()));

  if (params.center_slice())
    {
      slice_border = input_size / scale - params.center_slice()->size();
      output_size -= slice_border;
      input_size -= slice_border * scale;
    }

  if (params.fit())
    {
      fit = *params.fit();
    }
  else
    {
      fit = (params.center_slice()) ?
        PainterEnums::box_fit_fill :
        PainterEnums::box_fit_scale_down;
    }

  if (params.center_slice()
      && (fit == PainterEnums::box_fit_none || fit == PainterEnums::box_fit_cover))
    {
      BLENDPAINTlog_error("Cannot paint " << image_label(params)
                          << " with a center slice and "
                          << PainterEnums::label(fit));
      return routine_fail;
    }

  fitted = apply_box_fit(fit, input_size / scale, output_size);
  source_size = fitted.m_source * scale;
  destination_size = fitted.m_destination;

  if (params.center_slice())
    {
      output_size += slice_border;
      destination_size += slice_border;

      if (!sizes_match(source_size, input_size))
        {
          BLENDPAINTlog_error("Cannot paint " << image_label(params)
                              << " with a center slice: "
                              << PainterEnums::label(fit)
                              << " does not show the full image, source size = "
                              << source_size << ", image size = " << input_size);
          return routine_fail;
        }
    }

  if (repeat != PainterEnums::image_no_repeat && destination_size == output_size)
    {
      repeat = PainterEnums::image_no_repeat;
    }

  Paint paint;
  paint
    .anti_alias(params.anti_alias())
    .color_filter(params.color_filter())
    .color(vec4(0.0f, 0.0f, 0.0f, params.opacity()))
    .filter_quality(params.filter_quality())
    .invert_colors(params.invert_colors())
    .blend_mode(params.blend_mode());

  float half_width_delta, half_height_delta, dx, dy, ax;
  Rect destination_rect;

  ax = params.alignment().x();
  half_width_delta = 0.5f * (output_size.x() - destination_size.x());
  half_height_delta = 0.5f * (output_size.y() - destination_size.y());
  dx = half_width_delta + (params.flip_horizontally() ? -ax : ax) * half_width_delta;
  dy = half_height_delta + params.alignment().y() * half_height_delta;
  destination_rect = Rect::from_point_and_size(rect.m_min_point + vec2(dx, dy),
                                               destination_size);

  bool need_save;

  need_save = params.center_slice()
    || repeat != PainterEnums::image_no_repeat
    || params.flip_horizontally();

  if (need_save)
    {
      canvas.save();
    }

  if (repeat != PainterEnums::image_no_repeat)
    {
      canvas.clip_rect(rect);
    }

  if (params.flip_horizontally())
    {
      float cx;

      cx = rect.min_x() + 0.5f * rect.width();
      canvas.translate(cx, 0.0f);
      canvas.scale(-1.0f, 1.0f);
      canvas.translate(-cx, 0.0f);
    }

  std::vector<Rect> tiles;
  if (repeat == PainterEnums::image_no_repeat)
    {
      tiles.push_back(destination_rect);
    }
  else
    {
      tiles = generate_image_tile_rects(rect, destination_rect, repeat);
    }

  if (!params.center_slice())
    {
      Rect source_rect;

      source_rect = params.alignment().inscribe(source_size,
                                                Rect(vec2(0.0f, 0.0f), input_size));
      for (const Rect &tile : tiles)
        {
          canvas.draw_image_rect(image, source_rect, tile, paint);
        }
    }
  else
    {
      Rect center;

      center = scale_rect(*params.center_slice(), scale);
      canvas.scale(1.0f / scale, 1.0f / scale);
      for (const Rect &tile : tiles)
        {
          canvas.draw_image_nine(image, center, scale_rect(tile, scale), paint);
        }
    }

  if (need_save)
    {
      canvas.restore();
    }

  return routine_success;
}
