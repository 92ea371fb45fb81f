/*!
 * \file image_unittest.cpp
 * \brief file image_unittest.cpp
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


#include <sstream>
#include <vector>
#include <gtest/gtest.h>
#include <blendpaint/image.hpp>
#include "test_util.hpp"

using namespace blendpaint;
using blendpaint_test::ExpectVecNear;
using blendpaint_test::LogCapture;

namespace {

TEST(BitmapTest, StraightAlphaIsPremultiplied) {
  std::vector<u8vec4> pixels(1, u8vec4(255, 64, 0, 128));
  reference_counted_ptr<Bitmap> bitmap;

  bitmap = Bitmap::create(1, 1, c_array<const u8vec4>(pixels), Bitmap::rgba_format);
  ASSERT_TRUE(bitmap);
  EXPECT_EQ(u8vec4(128, 32, 0, 128), bitmap->pixel(0, 0));

  bitmap = Bitmap::create(1, 1, c_array<const u8vec4>(pixels), Bitmap::premultiplied_rgba_format);
  EXPECT_EQ(u8vec4(255, 64, 0, 128), bitmap->pixel(0, 0));
}

TEST(BitmapTest, RejectsBadInput) {
  LogCapture log;
  std::vector<u8vec4> pixels(3);

  EXPECT_FALSE(Bitmap::create(2, 2, c_array<const u8vec4>(pixels), Bitmap::rgba_format));
  EXPECT_TRUE(log.contains("3 pixels given for an image of 2x2"));
  EXPECT_FALSE(Bitmap::create_solid(0, 4, u8vec4(0, 0, 0, 255)));
  EXPECT_TRUE(log.contains("invalid dimensions 0x4"));
}

TEST(BitmapTest, PixelAccessClampsToEdges) {
  std::vector<u8vec4> pixels;
  reference_counted_ptr<Bitmap> bitmap;

  pixels.push_back(u8vec4(255, 0, 0, 255));
  pixels.push_back(u8vec4(0, 0, 255, 255));
  bitmap = Bitmap::create(2, 1, c_array<const u8vec4>(pixels), Bitmap::rgba_format);

  EXPECT_EQ(ivec2(2, 1), bitmap->dimensions());
  EXPECT_EQ(u8vec4(255, 0, 0, 255), bitmap->pixel(-3, 0));
  EXPECT_EQ(u8vec4(0, 0, 255, 255), bitmap->pixel(7, 4));
  ExpectVecNear(vec4(0.0f, 0.0f, 1.0f, 1.0f), bitmap->texel(1, 0));
}

TEST(ImageTest, ClonesShareBitmap) {
  reference_counted_ptr<Image> image, clone;

  image = Image::create(Bitmap::create_solid(3, 2, u8vec4(0, 255, 0, 255)));
  clone = image->clone();

  ASSERT_TRUE(clone);
  EXPECT_TRUE(clone != image);
  EXPECT_TRUE(clone->is_clone_of(*image));
  EXPECT_TRUE(image->is_clone_of(*clone));
  EXPECT_EQ(3, clone->width());
  EXPECT_EQ(2, clone->height());

  image->dispose();
  EXPECT_TRUE(image->disposed());
  EXPECT_EQ(0, image->width());
  EXPECT_FALSE(clone->disposed());
  EXPECT_FALSE(clone->is_clone_of(*image));
}

TEST(ImageTest, DistinctBitmapsAreNotClones) {
  reference_counted_ptr<Image> a(Image::create(Bitmap::create_solid(1, 1, u8vec4(0, 0, 0, 255))));
  reference_counted_ptr<Image> b(Image::create(Bitmap::create_solid(1, 1, u8vec4(0, 0, 0, 255))));

  EXPECT_FALSE(a->is_clone_of(*b));
  EXPECT_FALSE(Image::create(reference_counted_ptr<const Bitmap>()));
}

TEST(ImageTest, CloningDisposedImageFails) {
  LogCapture log;
  reference_counted_ptr<Image> image(Image::create(Bitmap::create_solid(1, 1, u8vec4(0, 0, 0, 255))));

  image->dispose();
  EXPECT_FALSE(image->clone());
  EXPECT_TRUE(log.contains("cloning a disposed image"));
}

TEST(ImageInfoTest, CloneAndDispose) {
  ImageInfo info(Image::create(Bitmap::create_solid(2, 3, u8vec4(0, 0, 0, 255))), 2.0f, "icon");
  ImageInfo clone(info.clone());

  EXPECT_TRUE(clone.is_clone_of(info));
  EXPECT_NE(info, clone);
  EXPECT_EQ(info, ImageInfo(info.image(), 2.0f, "icon"));
  EXPECT_NE(info, ImageInfo(info.image(), 1.0f, "icon"));
  EXPECT_FALSE(ImageInfo(info.image(), 1.0f, "icon").is_clone_of(info));

  clone.dispose();
  EXPECT_TRUE(clone.image()->disposed());
  EXPECT_FALSE(info.image()->disposed());
  EXPECT_FALSE(ImageInfo().is_clone_of(ImageInfo()));
}

TEST(ImageInfoTest, Prints) {
  std::ostringstream str;

  str << ImageInfo(Image::create(Bitmap::create_solid(2, 3, u8vec4(0, 0, 0, 255))), 2.0f, "icon")
      << "; " << ImageInfo();
  EXPECT_EQ("[2x3] @ 2x (icon); [null] @ 1x", str.str());
}

}  // namespace
