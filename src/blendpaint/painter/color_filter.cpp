/*!
 * \file color_filter.cpp
 * \brief file color_filter.cpp
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

#include <blendpaint/painter/color_filter.hpp>
#include <blendpaint/painter/blend.hpp>
#include <blendpaint/util/math.hpp>

namespace
{
  float
  linear_to_srgb(float c)
  {
    c = blendpaint::t_clamp(c, 0.0f, 1.0f);
    return (c <= 0.0031308f) ?
      12.92f * c :
      1.055f * blendpaint::t_pow(c, 1.0f / 2.4f) - 0.055f;
  }

  float
  srgb_to_linear(float c)
  {
    c = blendpaint::t_clamp(c, 0.0f, 1.0f);
    return (c <= 0.04045f) ?
      c / 12.92f :
      blendpaint::t_pow((c + 0.055f) / 1.055f, 2.4f);
  }
}

blendpaint::ColorFilter::
ColorFilter(void):
  m_type(mode_filter),
  m_color(0.0f),
  m_blend_mode(PainterEnums::blend_porter_duff_dst),
  m_matrix(0.0f)
{}

blendpaint::ColorFilter
blendpaint::ColorFilter::
mode(const vec4 &color, enum PainterEnums::blend_mode_t mode)
{
  ColorFilter R;

  R.m_type = mode_filter;
  R.m_color = color;
  R.m_blend_mode = mode;
  return R;
}

blendpaint::ColorFilter
blendpaint::ColorFilter::
matrix(const matrix_type &m)
{
  ColorFilter R;

  R.m_type = matrix_filter;
  R.m_matrix = m;
  return R;
}

blendpaint::ColorFilter
blendpaint::ColorFilter::
linear_to_srgb_gamma(void)
{
  ColorFilter R;

  R.m_type = linear_to_srgb_gamma_filter;
  return R;
}

blendpaint::ColorFilter
blendpaint::ColorFilter::
srgb_to_linear_gamma(void)
{
  ColorFilter R;

  R.m_type = srgb_to_linear_gamma_filter;
  return R;
}

blendpaint::ColorFilter
blendpaint::ColorFilter::
invert(void)
{
  const float values[20] =
    {
      -1.0f, 0.0f, 0.0f, 0.0f, 255.0f,
      0.0f, -1.0f, 0.0f, 0.0f, 255.0f,
      0.0f, 0.0f, -1.0f, 0.0f, 255.0f,
      0.0f, 0.0f, 0.0f, 1.0f, 0.0f
    };
  matrix_type m;

  for (unsigned int i = 0; i < 20; ++i)
    {
      m[i] = values[i];
    }
  return matrix(m);
}

blendpaint::vec4
blendpaint::ColorFilter::
apply(const vec4 &premultiplied) const
{
  switch (m_type)
    {
    case mode_filter:
      return blend_colors(m_blend_mode, premultiply(m_color), premultiplied);

    case matrix_filter:
      {
        vec4 c(unpremultiply(premultiplied)), r;

        for (unsigned int row = 0; row < 4; ++row)
          {
            const float *m(m_matrix.c_ptr() + 5 * row);
            r[row] = m[0] * c[0] + m[1] * c[1] + m[2] * c[2]
              + m[3] * c[3] + m[4] / 255.0f;
            r[row] = t_clamp(r[row], 0.0f, 1.0f);
          }
        return premultiply(r);
      }

    case linear_to_srgb_gamma_filter:
      {
        vec4 c(unpremultiply(premultiplied));
        return premultiply(vec4(linear_to_srgb(c.x()),
                                linear_to_srgb(c.y()),
                                linear_to_srgb(c.z()),
                                c.w()));
      }

    case srgb_to_linear_gamma_filter:
      {
        vec4 c(unpremultiply(premultiplied));
        return premultiply(vec4(srgb_to_linear(c.x()),
                                srgb_to_linear(c.y()),
                                srgb_to_linear(c.z()),
                                c.w()));
      }
    }

  return premultiplied;
}

bool
blendpaint::ColorFilter::
operator==(const ColorFilter &rhs) const
{
  if (m_type != rhs.m_type)
    {
      return false;
    }

  switch (m_type)
    {
    case mode_filter:
      return m_color == rhs.m_color && m_blend_mode == rhs.m_blend_mode;

    case matrix_filter:
      return m_matrix == rhs.m_matrix;

    default:
      return true;
    }
}

blendpaint::c_string
blendpaint::ColorFilter::
label(enum type_t v)
{
  static const c_string labels[] =
    {
      /* [mode_filter] */ "mode_filter",
      /* [matrix_filter] */ "matrix_filter",
      /* [linear_to_srgb_gamma_filter] */ "linear_to_srgb_gamma_filter",
      /* [srgb_to_linear_gamma_filter] */ "srgb_to_linear_gamma_filter",
    };

  return (v <= srgb_to_linear_gamma_filter) ?
    labels[v] :
    "invalid_color_filter";
}
