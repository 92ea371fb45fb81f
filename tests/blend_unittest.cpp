/*!
 * \file blend_unittest.cpp
 * \brief file blend_unittest.cpp
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

#include <string>
#include <gtest/gtest.h>
#include <blendpaint/painter/blend.hpp>
#include <blendpaint/painter/color_filter.hpp>
#include <blendpaint/painter/paint.hpp>
#include "test_util.hpp"

using namespace blendpaint;
using blendpaint_test::ExpectVecNear;

namespace {

const vec4 kHalfRed(0.5f, 0.0f, 0.0f, 0.5f);
const vec4 kBlue(0.0f, 0.0f, 1.0f, 1.0f);

TEST(BlendColorsTest, PorterDuff) {
  ExpectVecNear(vec4(0.0f), blend_colors(PainterEnums::blend_porter_duff_clear, kHalfRed, kBlue));
  ExpectVecNear(kHalfRed, blend_colors(PainterEnums::blend_porter_duff_src, kHalfRed, kBlue));
  ExpectVecNear(kBlue, blend_colors(PainterEnums::blend_porter_duff_dst, kHalfRed, kBlue));
  ExpectVecNear(vec4(0.5f, 0.0f, 0.5f, 1.0f),
                blend_colors(PainterEnums::blend_porter_duff_src_over, kHalfRed, kBlue));
  ExpectVecNear(kBlue, blend_colors(PainterEnums::blend_porter_duff_dst_over, kHalfRed, kBlue));
  ExpectVecNear(vec4(0.0f, 0.0f, 0.5f, 0.5f),
                blend_colors(PainterEnums::blend_porter_duff_dst_in, kHalfRed, kBlue));
  ExpectVecNear(vec4(0.0f),
                blend_colors(PainterEnums::blend_porter_duff_src_out, kHalfRed, kBlue));
  ExpectVecNear(vec4(0.0f, 0.0f, 0.5f, 0.5f),
                blend_colors(PainterEnums::blend_porter_duff_xor, kHalfRed, kBlue));
  ExpectVecNear(vec4(0.5f, 0.0f, 0.5f, 1.0f),
                blend_colors(PainterEnums::blend_porter_duff_src_atop, kHalfRed, kBlue));
}

TEST(BlendColorsTest, PlusIsClamped) {
  ExpectVecNear(vec4(1.0f, 0.0f, 0.0f, 1.0f),
                blend_colors(PainterEnums::blend_porter_duff_plus,
                             vec4(0.8f, 0.0f, 0.0f, 0.8f), kHalfRed));
}

TEST(BlendColorsTest, SeparableModesOnOpaqueColors) {
  ExpectVecNear(vec4(0.5f, 0.25f, 0.0f, 1.0f),
                blend_colors(PainterEnums::blend_w3c_multiply,
                             vec4(1.0f, 0.5f, 0.0f, 1.0f), vec4(0.5f, 0.5f, 1.0f, 1.0f)));
  ExpectVecNear(vec4(0.75f, 0.0f, 1.0f, 1.0f),
                blend_colors(PainterEnums::blend_w3c_screen,
                             vec4(0.5f, 0.0f, 0.0f, 1.0f), vec4(0.5f, 0.0f, 1.0f, 1.0f)));
  ExpectVecNear(vec4(0.75f, 0.5f, 0.0f, 1.0f),
                blend_colors(PainterEnums::blend_w3c_difference,
                             vec4(1.0f, 0.0f, 0.0f, 1.0f), vec4(0.25f, 0.5f, 0.0f, 1.0f)));
  ExpectVecNear(vec4(0.25f, 0.5f, 0.0f, 1.0f),
                blend_colors(PainterEnums::blend_w3c_darken,
                             vec4(1.0f, 0.5f, 0.0f, 1.0f), vec4(0.25f, 0.5f, 1.0f, 1.0f)));
}

TEST(BlendColorsTest, W3CModesOverTransparentGiveSource) {
  for (int m = PainterEnums::blend_w3c_screen; m < PainterEnums::number_blend_mode; ++m)
    {
      enum PainterEnums::blend_mode_t mode(static_cast<enum PainterEnums::blend_mode_t>(m));
      SCOPED_TRACE(PainterEnums::label(mode));
      ExpectVecNear(kHalfRed, blend_colors(mode, kHalfRed, vec4(0.0f)));
    }
}

TEST(BlendColorsTest, Premultiply) {
  ExpectVecNear(vec4(0.5f, 0.25f, 0.0f, 0.5f), premultiply(vec4(1.0f, 0.5f, 0.0f, 0.5f)));
  ExpectVecNear(vec4(1.0f, 0.5f, 0.0f, 0.5f), unpremultiply(vec4(0.5f, 0.25f, 0.0f, 0.5f)));
  ExpectVecNear(vec4(0.0f), unpremultiply(vec4(0.3f, 0.3f, 0.3f, 0.0f)));
}

TEST(ColorFilterTest, InvertKeepsAlpha) {
  ColorFilter f(ColorFilter::invert());

  EXPECT_EQ(ColorFilter::matrix_filter, f.type());
  ExpectVecNear(vec4(0.0f, 1.0f, 1.0f, 1.0f), f.apply(vec4(1.0f, 0.0f, 0.0f, 1.0f)));
  ExpectVecNear(vec4(0.0f, 0.5f, 0.5f, 0.5f), f.apply(kHalfRed));
}

TEST(ColorFilterTest, ModeFilterUsesColorAsSource) {
  ColorFilter f(ColorFilter::mode(vec4(0.0f, 1.0f, 0.0f, 1.0f),
                                  PainterEnums::blend_porter_duff_src_in));
  ExpectVecNear(vec4(0.0f, 0.5f, 0.0f, 0.5f), f.apply(kHalfRed));

  ColorFilter keep(ColorFilter::mode(vec4(0.0f, 1.0f, 0.0f, 1.0f),
                                     PainterEnums::blend_porter_duff_dst));
  ExpectVecNear(kHalfRed, keep.apply(kHalfRed));
}

TEST(ColorFilterTest, MatrixSwapsChannels) {
  ColorFilter::matrix_type m(0.0f);
  m[0 * 5 + 2] = 1.0f;  // red from blue
  m[1 * 5 + 1] = 1.0f;
  m[2 * 5 + 0] = 1.0f;  // blue from red
  m[3 * 5 + 3] = 1.0f;

  ExpectVecNear(vec4(0.0f, 0.0f, 0.5f, 0.5f), ColorFilter::matrix(m).apply(kHalfRed));
}

TEST(ColorFilterTest, GammaFiltersAreInverses) {
  vec4 c(0.2f, 0.5f, 0.8f, 1.0f);
  vec4 srgb(ColorFilter::linear_to_srgb_gamma().apply(c));

  EXPECT_GT(srgb.y(), c.y());
  ExpectVecNear(c, ColorFilter::srgb_to_linear_gamma().apply(srgb), 1e-3f);
}

TEST(ColorFilterTest, EqualityAndLabels) {
  EXPECT_EQ(ColorFilter::invert(), ColorFilter::invert());
  EXPECT_NE(ColorFilter::invert(), ColorFilter::linear_to_srgb_gamma());
  EXPECT_NE(ColorFilter::mode(kBlue, PainterEnums::blend_w3c_multiply),
            ColorFilter::mode(kBlue, PainterEnums::blend_w3c_screen));
  EXPECT_EQ(std::string("matrix_filter"), ColorFilter::label(ColorFilter::matrix_filter));
}

TEST(PaintTest, Defaults) {
  Paint p;

  ExpectVecNear(vec4(0.0f, 0.0f, 0.0f, 1.0f), p.color());
  EXPECT_EQ(PainterEnums::blend_porter_duff_src_over, p.blend_mode());
  EXPECT_EQ(PainterEnums::filter_quality_none, p.filter_quality());
  EXPECT_FALSE(p.color_filter());
  EXPECT_FALSE(p.invert_colors());
  EXPECT_TRUE(p.anti_alias());
}

TEST(PaintTest, FilterColorAppliesFilterThenInversion) {
  Paint p;

  p.color_filter(ColorFilter::mode(vec4(0.0f, 1.0f, 0.0f, 1.0f),
                                   PainterEnums::blend_porter_duff_src_in))
    .invert_colors(true)
    .alpha(0.25f);

  EXPECT_FLOAT_EQ(0.25f, p.alpha());
  // src_in gives (0, 0.5, 0, 0.5), inverting gives (1, 0, 1) at alpha 0.5
  ExpectVecNear(vec4(0.5f, 0.0f, 0.5f, 0.5f), p.filter_color(kHalfRed));
}

}  // namespace
