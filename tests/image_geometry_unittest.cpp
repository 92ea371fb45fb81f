/*!
 * \file image_geometry_unittest.cpp
 * \brief file image_geometry_unittest.cpp
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

#include <gtest/gtest.h>
#include <blendpaint/painter/image_geometry.hpp>
#include "test_util.hpp"

using namespace blendpaint;
using blendpaint_test::ExpectVecNear;
using blendpaint_test::ExpectRectNear;

namespace {

// A wide image (100x50) placed in a square box (200x200).
const vec2 kWideInput(100.0f, 50.0f);
const vec2 kSquareOutput(200.0f, 200.0f);

TEST(ApplyBoxFitTest, FillUsesWholeInputAndOutput) {
  FittedSizes f(apply_box_fit(PainterEnums::box_fit_fill, kWideInput, kSquareOutput));
  ExpectVecNear(kWideInput, f.m_source);
  ExpectVecNear(kSquareOutput, f.m_destination);
}

TEST(ApplyBoxFitTest, ContainKeepsAspectRatio) {
  FittedSizes f(apply_box_fit(PainterEnums::box_fit_contain, kWideInput, kSquareOutput));
  ExpectVecNear(kWideInput, f.m_source);
  ExpectVecNear(vec2(200.0f, 100.0f), f.m_destination);

  f = apply_box_fit(PainterEnums::box_fit_contain, vec2(100.0f, 100.0f), vec2(200.0f, 100.0f));
  ExpectVecNear(vec2(100.0f, 100.0f), f.m_source);
  ExpectVecNear(vec2(100.0f, 100.0f), f.m_destination);
}

TEST(ApplyBoxFitTest, CoverCropsSource) {
  FittedSizes f(apply_box_fit(PainterEnums::box_fit_cover, kWideInput, kSquareOutput));
  ExpectVecNear(vec2(50.0f, 50.0f), f.m_source);
  ExpectVecNear(kSquareOutput, f.m_destination);

  f = apply_box_fit(PainterEnums::box_fit_cover, vec2(100.0f, 100.0f), vec2(200.0f, 100.0f));
  ExpectVecNear(vec2(100.0f, 50.0f), f.m_source);
  ExpectVecNear(vec2(200.0f, 100.0f), f.m_destination);
}

TEST(ApplyBoxFitTest, FitWidth) {
  // Output taller than the input: behaves like contain.
  FittedSizes f(apply_box_fit(PainterEnums::box_fit_fit_width, kWideInput, kSquareOutput));
  ExpectVecNear(kWideInput, f.m_source);
  ExpectVecNear(vec2(200.0f, 100.0f), f.m_destination);

  // Output wider than the input: behaves like cover.
  f = apply_box_fit(PainterEnums::box_fit_fit_width, vec2(100.0f, 100.0f), vec2(200.0f, 100.0f));
  ExpectVecNear(vec2(100.0f, 50.0f), f.m_source);
  ExpectVecNear(vec2(200.0f, 100.0f), f.m_destination);
}

TEST(ApplyBoxFitTest, FitHeight) {
  FittedSizes f(apply_box_fit(PainterEnums::box_fit_fit_height, kWideInput, kSquareOutput));
  ExpectVecNear(vec2(50.0f, 50.0f), f.m_source);
  ExpectVecNear(kSquareOutput, f.m_destination);

  f = apply_box_fit(PainterEnums::box_fit_fit_height, vec2(100.0f, 100.0f), vec2(200.0f, 100.0f));
  ExpectVecNear(vec2(100.0f, 100.0f), f.m_source);
  ExpectVecNear(vec2(100.0f, 100.0f), f.m_destination);
}

TEST(ApplyBoxFitTest, NoneClipsToOutput) {
  FittedSizes f(apply_box_fit(PainterEnums::box_fit_none, kWideInput, vec2(80.0f, 80.0f)));
  ExpectVecNear(vec2(80.0f, 50.0f), f.m_source);
  ExpectVecNear(vec2(80.0f, 50.0f), f.m_destination);
}

TEST(ApplyBoxFitTest, ScaleDownOnlyShrinks) {
  FittedSizes f(apply_box_fit(PainterEnums::box_fit_scale_down, kWideInput, kSquareOutput));
  ExpectVecNear(kWideInput, f.m_source);
  ExpectVecNear(kWideInput, f.m_destination);

  f = apply_box_fit(PainterEnums::box_fit_scale_down, kWideInput, vec2(40.0f, 40.0f));
  ExpectVecNear(kWideInput, f.m_source);
  ExpectVecNear(vec2(40.0f, 20.0f), f.m_destination);
}

TEST(ApplyBoxFitTest, NonPositiveSizesGiveZero) {
  EXPECT_EQ(FittedSizes(), apply_box_fit(PainterEnums::box_fit_fill,
                                         vec2(0.0f, 10.0f), kSquareOutput));
  EXPECT_EQ(FittedSizes(), apply_box_fit(PainterEnums::box_fit_contain,
                                         kWideInput, vec2(10.0f, -1.0f)));
}

TEST(GenerateImageTileRectsTest, NoRepeatGivesFundamental) {
  Rect fundamental(Rect::from_ltrb(40.0f, 40.0f, 60.0f, 60.0f));
  std::vector<Rect> tiles(generate_image_tile_rects(Rect::from_ltrb(0.0f, 0.0f, 100.0f, 100.0f),
                                                    fundamental, PainterEnums::image_no_repeat));
  ASSERT_EQ(1u, tiles.size());
  EXPECT_EQ(fundamental, tiles[0]);
}

TEST(GenerateImageTileRectsTest, RepeatXCoversRow) {
  std::vector<Rect> tiles(generate_image_tile_rects(Rect::from_ltrb(0.0f, 0.0f, 100.0f, 100.0f),
                                                    Rect::from_ltrb(40.0f, 40.0f, 60.0f, 60.0f),
                                                    PainterEnums::image_repeat_x));
  ASSERT_EQ(5u, tiles.size());
  ExpectRectNear(Rect::from_ltrb(0.0f, 40.0f, 20.0f, 60.0f), tiles.front());
  ExpectRectNear(Rect::from_ltrb(80.0f, 40.0f, 100.0f, 60.0f), tiles.back());
}

TEST(GenerateImageTileRectsTest, RepeatYCoversColumn) {
  std::vector<Rect> tiles(generate_image_tile_rects(Rect::from_ltrb(0.0f, 0.0f, 100.0f, 100.0f),
                                                    Rect::from_ltrb(40.0f, 40.0f, 60.0f, 60.0f),
                                                    PainterEnums::image_repeat_y));
  ASSERT_EQ(5u, tiles.size());
  ExpectRectNear(Rect::from_ltrb(40.0f, 0.0f, 60.0f, 20.0f), tiles.front());
  ExpectRectNear(Rect::from_ltrb(40.0f, 80.0f, 60.0f, 100.0f), tiles.back());
}

TEST(GenerateImageTileRectsTest, RepeatIsColumnMajor) {
  std::vector<Rect> tiles(generate_image_tile_rects(Rect::from_ltrb(0.0f, 0.0f, 100.0f, 100.0f),
                                                    Rect::from_ltrb(40.0f, 40.0f, 60.0f, 60.0f),
                                                    PainterEnums::image_repeat));
  ASSERT_EQ(25u, tiles.size());
  ExpectRectNear(Rect::from_ltrb(0.0f, 0.0f, 20.0f, 20.0f), tiles[0]);
  // The y index varies fastest.
  ExpectRectNear(Rect::from_ltrb(0.0f, 20.0f, 20.0f, 40.0f), tiles[1]);
  ExpectRectNear(Rect::from_ltrb(20.0f, 0.0f, 40.0f, 20.0f), tiles[5]);
}

TEST(GenerateImageTileRectsTest, PartialTilesAtEdges) {
  std::vector<Rect> tiles(generate_image_tile_rects(Rect::from_ltrb(0.0f, 0.0f, 50.0f, 50.0f),
                                                    Rect::from_ltrb(5.0f, 5.0f, 25.0f, 25.0f),
                                                    PainterEnums::image_repeat_x));
  // floor(-5 / 20) = -1 through ceil(25 / 20) = 2
  ASSERT_EQ(4u, tiles.size());
  ExpectRectNear(Rect::from_ltrb(-15.0f, 5.0f, 5.0f, 25.0f), tiles.front());
  ExpectRectNear(Rect::from_ltrb(45.0f, 5.0f, 65.0f, 25.0f), tiles.back());
}

TEST(GenerateImageTileRectsTest, EmptyFundamentalGivesNothing) {
  std::vector<Rect> tiles(generate_image_tile_rects(Rect::from_ltrb(0.0f, 0.0f, 50.0f, 50.0f),
                                                    Rect::from_ltrb(5.0f, 5.0f, 5.0f, 25.0f),
                                                    PainterEnums::image_repeat));
  EXPECT_TRUE(tiles.empty());
}

}  // namespace
