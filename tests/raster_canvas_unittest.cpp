/*!
 * \file raster_canvas_unittest.cpp
 * \brief file raster_canvas_unittest.cpp
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
#include <blendpaint/painter/raster_canvas.hpp>
#include "test_util.hpp"

using namespace blendpaint;
using blendpaint_test::ExpectVecNear;
using blendpaint_test::LogCapture;
using blendpaint_test::MakeFramedBitmap;
using blendpaint_test::MakeSolidImage;

namespace {

const vec4 kRed(1.0f, 0.0f, 0.0f, 1.0f);
const vec4 kBlue(0.0f, 0.0f, 1.0f, 1.0f);
const vec4 kTransparent(0.0f);

class RasterCanvasTest : public testing::Test {
 protected:
  RasterCanvasTest()
      : surface_(4, 4),
        red_(MakeSolidImage(2, 2)) {}

  void DrawRed(Canvas &canvas, const Rect &dst, const Paint &paint = Paint()) {
    canvas.draw_image_rect(red_, Rect::from_ltrb(0.0f, 0.0f, 2.0f, 2.0f), dst, paint);
  }

  Rect Full() const { return Rect::from_ltrb(0.0f, 0.0f, 4.0f, 4.0f); }

  RasterSurface surface_;
  reference_counted_ptr<Image> red_;
};

TEST_F(RasterCanvasTest, DrawsOpaqueImage) {
  RasterCanvas canvas(surface_);
  DrawRed(canvas, Full());

  ExpectVecNear(kRed, surface_.pixel(0, 0));
  ExpectVecNear(kRed, surface_.pixel(3, 3));
  EXPECT_EQ(u8vec4(255, 0, 0, 255), surface_.rgba8(1, 2));
}

TEST_F(RasterCanvasTest, PaintAlphaModulatesSource) {
  surface_.clear(kBlue);
  RasterCanvas canvas(surface_);
  DrawRed(canvas, Full(), Paint().alpha(0.5f));

  ExpectVecNear(vec4(0.5f, 0.0f, 0.5f, 1.0f), surface_.pixel(2, 2));
}

TEST_F(RasterCanvasTest, BlendModeIsApplied) {
  surface_.clear(kBlue);
  RasterCanvas canvas(surface_);
  DrawRed(canvas, Rect::from_ltrb(0.0f, 0.0f, 2.0f, 2.0f),
          Paint().blend_mode(PainterEnums::blend_porter_duff_clear));

  ExpectVecNear(kTransparent, surface_.pixel(0, 0));
  ExpectVecNear(kTransparent, surface_.pixel(1, 1));
  ExpectVecNear(kBlue, surface_.pixel(3, 3));
}

TEST_F(RasterCanvasTest, PaintInvertsColors) {
  RasterCanvas canvas(surface_);
  DrawRed(canvas, Full(), Paint().invert_colors(true));

  ExpectVecNear(vec4(0.0f, 1.0f, 1.0f, 1.0f), surface_.pixel(1, 1));
}

TEST_F(RasterCanvasTest, ClipRect) {
  RasterCanvas canvas(surface_);
  canvas.clip_rect(Rect::from_ltrb(0.0f, 0.0f, 2.0f, 4.0f));
  DrawRed(canvas, Full());

  EXPECT_FLOAT_EQ(1.0f, canvas.clip_coverage(1, 1));
  EXPECT_FLOAT_EQ(0.0f, canvas.clip_coverage(3, 1));
  ExpectVecNear(kRed, surface_.pixel(1, 1));
  ExpectVecNear(kTransparent, surface_.pixel(3, 1));
}

TEST_F(RasterCanvasTest, RestoreUndoesClip) {
  RasterCanvas canvas(surface_);

  EXPECT_EQ(1, canvas.save_count());
  canvas.save();
  EXPECT_EQ(2, canvas.save_count());
  canvas.clip_rect(Rect::from_ltrb(0.0f, 0.0f, 1.0f, 1.0f));
  canvas.restore();
  EXPECT_EQ(1, canvas.save_count());

  DrawRed(canvas, Full());
  ExpectVecNear(kRed, surface_.pixel(3, 3));
}

TEST_F(RasterCanvasTest, Translate) {
  RasterCanvas canvas(surface_);
  canvas.translate(2.0f, 0.0f);
  DrawRed(canvas, Rect::from_ltrb(0.0f, 0.0f, 2.0f, 2.0f));

  ExpectVecNear(kTransparent, surface_.pixel(0, 0));
  ExpectVecNear(kRed, surface_.pixel(2, 0));
  ExpectVecNear(kRed, surface_.pixel(3, 1));
  ExpectVecNear(kTransparent, surface_.pixel(3, 2));
}

TEST_F(RasterCanvasTest, Scale) {
  RasterCanvas canvas(surface_);
  canvas.scale(2.0f, 2.0f);
  DrawRed(canvas, Rect::from_ltrb(0.0f, 0.0f, 1.0f, 1.0f));

  ExpectVecNear(kRed, surface_.pixel(1, 1));
  ExpectVecNear(kTransparent, surface_.pixel(2, 2));
}

TEST_F(RasterCanvasTest, SaveLayerCompositesOnRestore) {
  surface_.clear(kBlue);
  RasterCanvas canvas(surface_);

  canvas.save_layer(Full(), Paint().alpha(0.5f));
  DrawRed(canvas, Full());
  ExpectVecNear(kBlue, surface_.pixel(1, 1));

  canvas.restore();
  ExpectVecNear(vec4(0.5f, 0.0f, 0.5f, 1.0f), surface_.pixel(1, 1));
}

TEST_F(RasterCanvasTest, UnbalancedRestoreIsIgnored) {
  LogCapture log;
  RasterCanvas canvas(surface_);

  canvas.restore();
  EXPECT_EQ(1, canvas.save_count());
  EXPECT_TRUE(log.contains("restore without matching save ignored"));
}

TEST_F(RasterCanvasTest, DisposedImageIsNotDrawn) {
  LogCapture log;
  RasterCanvas canvas(surface_);

  red_->dispose();
  DrawRed(canvas, Full());
  ExpectVecNear(kTransparent, surface_.pixel(1, 1));
  EXPECT_TRUE(log.contains("null or disposed image"));
}

TEST(RasterCanvasNineTest, CenterStretchesEdgesKeepSize) {
  RasterSurface surface(6, 6);
  RasterCanvas canvas(surface);
  reference_counted_ptr<Image> image;

  image = Image::create(MakeFramedBitmap(3, 3, u8vec4(255, 0, 0, 255), u8vec4(0, 255, 0, 255)));
  canvas.draw_image_nine(image, Rect::from_ltrb(1.0f, 1.0f, 2.0f, 2.0f),
                         Rect::from_ltrb(0.0f, 0.0f, 6.0f, 6.0f), Paint());

  ExpectVecNear(vec4(1.0f, 0.0f, 0.0f, 1.0f), surface.pixel(0, 0));
  ExpectVecNear(vec4(1.0f, 0.0f, 0.0f, 1.0f), surface.pixel(0, 3));
  ExpectVecNear(vec4(1.0f, 0.0f, 0.0f, 1.0f), surface.pixel(5, 5));
  ExpectVecNear(vec4(0.0f, 1.0f, 0.0f, 1.0f), surface.pixel(1, 1));
  ExpectVecNear(vec4(0.0f, 1.0f, 0.0f, 1.0f), surface.pixel(3, 3));
  ExpectVecNear(vec4(0.0f, 1.0f, 0.0f, 1.0f), surface.pixel(4, 2));
}

TEST(RasterCanvasNineTest, CornersShrinkWhenDestinationIsSmall) {
  RasterSurface surface(2, 2);
  RasterCanvas canvas(surface);
  std::vector<u8vec4> pixels;
  reference_counted_ptr<Image> image;

  // columns 0-1 red, 2-3 green, 4-5 blue
  for (int y = 0; y < 6; ++y) {
    for (int x = 0; x < 6; ++x) {
      pixels.push_back(x < 2 ? u8vec4(255, 0, 0, 255) :
                       x < 4 ? u8vec4(0, 255, 0, 255) :
                       u8vec4(0, 0, 255, 255));
    }
  }
  image = Image::create(Bitmap::create(6, 6, c_array<const u8vec4>(pixels), Bitmap::rgba_format));

  // left and right edges are 2 wide each, scaled by 1/2 to fit 2 pixels
  canvas.draw_image_nine(image, Rect::from_ltrb(2.0f, 0.0f, 4.0f, 6.0f),
                         Rect::from_ltrb(0.0f, 0.0f, 2.0f, 2.0f), Paint());

  ExpectVecNear(vec4(1.0f, 0.0f, 0.0f, 1.0f), surface.pixel(0, 0));
  ExpectVecNear(vec4(1.0f, 0.0f, 0.0f, 1.0f), surface.pixel(0, 1));
  ExpectVecNear(vec4(0.0f, 0.0f, 1.0f, 1.0f), surface.pixel(1, 0));
  ExpectVecNear(vec4(0.0f, 0.0f, 1.0f, 1.0f), surface.pixel(1, 1));
}

TEST(RasterCanvasNineTest, EmptyCenterStretchesWholeImage) {
  RasterSurface surface(6, 6);
  RasterCanvas canvas(surface);

  canvas.draw_image_nine(MakeSolidImage(3, 3), Rect::from_ltrb(1.0f, 1.0f, 1.0f, 2.0f),
                         Rect::from_ltrb(0.0f, 0.0f, 6.0f, 6.0f), Paint());

  ExpectVecNear(kRed, surface.pixel(0, 0));
  ExpectVecNear(kRed, surface.pixel(3, 3));
  ExpectVecNear(kRed, surface.pixel(5, 5));
}

TEST(RasterCanvasNineTest, SubPixelCenterStretchesWholeImage) {
  RasterSurface surface(6, 6);
  RasterCanvas canvas(surface);

  canvas.draw_image_nine(MakeSolidImage(3, 3), Rect::from_ltrb(1.1f, 1.1f, 1.3f, 1.3f),
                         Rect::from_ltrb(0.0f, 0.0f, 6.0f, 6.0f), Paint());

  EXPECT_NEAR(1.0f, surface.pixel(3, 3).w(), 1e-4f);
  ExpectVecNear(kRed, surface.pixel(2, 3));
  ExpectVecNear(kRed, surface.pixel(5, 0));
}

TEST(RasterCanvasCoverageTest, AntiAliasedEdgesArePartiallyCovered) {
  RasterSurface surface(4, 4);
  RasterCanvas canvas(surface);

  // left edge at x = 0.6 and right edge at x = 1.6
  canvas.draw_image_rect(MakeSolidImage(1, 1), Rect::from_ltrb(0.0f, 0.0f, 1.0f, 1.0f),
                         Rect::from_ltrb(0.6f, 0.0f, 1.6f, 4.0f), Paint().anti_alias(true));

  ExpectVecNear(vec4(0.5f, 0.0f, 0.0f, 0.5f), surface.pixel(0, 1));
  ExpectVecNear(vec4(0.5f, 0.0f, 0.0f, 0.5f), surface.pixel(1, 1));
  ExpectVecNear(kTransparent, surface.pixel(2, 1));
}

TEST(RasterCanvasCoverageTest, AliasedEdgesUsePixelCenters) {
  RasterSurface surface(4, 4);
  RasterCanvas canvas(surface);

  canvas.draw_image_rect(MakeSolidImage(1, 1), Rect::from_ltrb(0.0f, 0.0f, 1.0f, 1.0f),
                         Rect::from_ltrb(0.6f, 0.0f, 1.6f, 4.0f), Paint().anti_alias(false));

  ExpectVecNear(kTransparent, surface.pixel(0, 1));
  ExpectVecNear(kRed, surface.pixel(1, 1));
  ExpectVecNear(kTransparent, surface.pixel(2, 1));
}

TEST(RasterCanvasFilterTest, BilinearBlendsNeighbours) {
  RasterSurface surface(4, 1);
  RasterCanvas canvas(surface);
  std::vector<u8vec4> pixels;
  reference_counted_ptr<Image> image;

  pixels.push_back(u8vec4(255, 0, 0, 255));
  pixels.push_back(u8vec4(0, 0, 255, 255));
  image = Image::create(Bitmap::create(2, 1, c_array<const u8vec4>(pixels), Bitmap::rgba_format));
  canvas.draw_image_rect(image, Rect::from_ltrb(0.0f, 0.0f, 2.0f, 1.0f),
                         Rect::from_ltrb(0.0f, 0.0f, 4.0f, 1.0f),
                         Paint().filter_quality(PainterEnums::filter_quality_low));

  ExpectVecNear(vec4(1.0f, 0.0f, 0.0f, 1.0f), surface.pixel(0, 0));
  ExpectVecNear(vec4(0.75f, 0.0f, 0.25f, 1.0f), surface.pixel(1, 0));
  ExpectVecNear(vec4(0.25f, 0.0f, 0.75f, 1.0f), surface.pixel(2, 0));
  ExpectVecNear(vec4(0.0f, 0.0f, 1.0f, 1.0f), surface.pixel(3, 0));
}

TEST(RasterCanvasFilterTest, NearestKeepsTexels) {
  RasterSurface surface(4, 1);
  RasterCanvas canvas(surface);
  std::vector<u8vec4> pixels;
  reference_counted_ptr<Image> image;

  pixels.push_back(u8vec4(255, 0, 0, 255));
  pixels.push_back(u8vec4(0, 0, 255, 255));
  image = Image::create(Bitmap::create(2, 1, c_array<const u8vec4>(pixels), Bitmap::rgba_format));
  canvas.draw_image_rect(image, Rect::from_ltrb(0.0f, 0.0f, 2.0f, 1.0f),
                         Rect::from_ltrb(0.0f, 0.0f, 4.0f, 1.0f),
                         Paint().filter_quality(PainterEnums::filter_quality_none));

  ExpectVecNear(vec4(1.0f, 0.0f, 0.0f, 1.0f), surface.pixel(1, 0));
  ExpectVecNear(vec4(0.0f, 0.0f, 1.0f, 1.0f), surface.pixel(2, 0));
}

TEST(RasterCanvasFilterTest, CubicPreservesSolidColor) {
  RasterSurface surface(8, 8);
  RasterCanvas canvas(surface);

  canvas.draw_image_rect(MakeSolidImage(3, 3), Rect::from_ltrb(0.0f, 0.0f, 3.0f, 3.0f),
                         Rect::from_ltrb(0.0f, 0.0f, 8.0f, 8.0f),
                         Paint().filter_quality(PainterEnums::filter_quality_high));

  ExpectVecNear(vec4(1.0f, 0.0f, 0.0f, 1.0f), surface.pixel(4, 4), 1e-3f);
}

TEST(RasterCanvasClipTest, ClipPathOval) {
  RasterSurface surface(10, 10);
  RasterCanvas canvas(surface);
  Path oval;

  oval.add_oval(Rect::from_ltrb(0.0f, 0.0f, 10.0f, 10.0f));
  canvas.clip_path(oval);
  canvas.draw_image_rect(MakeSolidImage(1, 1), Rect::from_ltrb(0.0f, 0.0f, 1.0f, 1.0f),
                         Rect::from_ltrb(0.0f, 0.0f, 10.0f, 10.0f), Paint());

  EXPECT_FLOAT_EQ(1.0f, canvas.clip_coverage(5, 5));
  EXPECT_FLOAT_EQ(0.0f, canvas.clip_coverage(0, 0));
  ExpectVecNear(vec4(1.0f, 0.0f, 0.0f, 1.0f), surface.pixel(5, 5));
  ExpectVecNear(vec4(0.0f), surface.pixel(0, 0));
}

}  // namespace
