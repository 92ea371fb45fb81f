/*!
 * \file image_geometry.cpp
 * \brief file image_geometry.cpp
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

#include <blendpaint/painter/image_geometry.hpp>
#include <blendpaint/util/math.hpp>

blendpaint::FittedSizes
blendpaint::
apply_box_fit(enum PainterEnums::box_fit_t fit,
              const vec2 &input, const vec2 &output)
{
  if (input.x() <= 0.0f || input.y() <= 0.0f
      || output.x() <= 0.0f || output.y() <= 0.0f)
    {
      return FittedSizes();
    }

  vec2 source, destination;
  bool output_wider;

  /* true if the output is wider relative to its height than the input */
  output_wider = (output.x() / output.y() > input.x() / input.y());
  switch (fit)
    {
    case PainterEnums::box_fit_fill:
      source = input;
      destination = output;
      break;

    case PainterEnums::box_fit_contain:
      source = input;
      if (output_wider)
        {
          destination = vec2(source.x() * output.y() / source.y(), output.y());
        }
      else
        {
          destination = vec2(output.x(), source.y() * output.x() / source.x());
        }
      break;

    case PainterEnums::box_fit_cover:
      if (output_wider)
        {
          source = vec2(input.x(), input.x() * output.y() / output.x());
        }
      else
        {
          source = vec2(input.y() * output.x() / output.y(), input.y());
        }
      destination = output;
      break;

    case PainterEnums::box_fit_fit_width:
      if (output_wider)
        {
          source = vec2(input.x(), input.x() * output.y() / output.x());
          destination = output;
        }
      else
        {
          source = input;
          destination = vec2(output.x(), source.y() * output.x() / source.x());
        }
      break;

    case PainterEnums::box_fit_fit_height:
      if (output_wider)
        {
          source = input;
          destination = vec2(source.x() * output.y() / source.y(), output.y());
        }
      else
        {
          source = vec2(input.y() * output.x() / output.y(), input.y());
          destination = output;
        }
      break;

    case PainterEnums::box_fit_none:
      source = vec2(t_min(input.x(), output.x()),
                    t_min(input.y(), output.y()));
      destination = source;
      break;

    case PainterEnums::box_fit_scale_down:
    default:
      {
        float aspect_ratio(input.x() / input.y());

        source = input;
        destination = input;
        if (destination.y() > output.y())
          {
            destination = vec2(output.y() * aspect_ratio, output.y());
          }
        if (destination.x() > output.x())
          {
            destination = vec2(output.x(), output.x() / aspect_ratio);
          }
      }
      break;
    }

  return FittedSizes(source, destination);
}

std::vector<blendpaint::Rect>
blendpaint::
generate_image_tile_rects(const Rect &output, const Rect &fundamental,
                          enum PainterEnums::image_repeat_t repeat)
{
  std::vector<Rect> return_value;
  int start_x(0), start_y(0), stop_x(0), stop_y(0);
  float stride_x(fundamental.width());
  float stride_y(fundamental.height());

  if (stride_x <= 0.0f || stride_y <= 0.0f)
    {
      return return_value;
    }

  if (repeat == PainterEnums::image_repeat || repeat == PainterEnums::image_repeat_x)
    {
      start_x = static_cast<int>(t_floor((output.min_x() - fundamental.min_x()) / stride_x));
      stop_x = static_cast<int>(t_ceil((output.max_x() - fundamental.max_x()) / stride_x));
    }

  if (repeat == PainterEnums::image_repeat || repeat == PainterEnums::image_repeat_y)
    {
      start_y = static_cast<int>(t_floor((output.min_y() - fundamental.min_y()) / stride_y));
      stop_y = static_cast<int>(t_ceil((output.max_y() - fundamental.max_y()) / stride_y));
    }

  for (int i = start_x; i <= stop_x; ++i)
    {
      for (int j = start_y; j <= stop_y; ++j)
        {
          return_value.push_back(fundamental.shift(vec2(static_cast<float>(i) * stride_x,
                                                        static_cast<float>(j) * stride_y)));
        }
    }
  return return_value;
}
