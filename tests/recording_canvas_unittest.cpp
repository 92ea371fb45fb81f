/*!
 * \file recording_canvas_unittest.cpp
 * \brief file recording_canvas_unittest.cpp
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
#include <gtest/gtest.h>
#include <blendpaint/painter/recording_canvas.hpp>
#include <blendpaint/painter/raster_canvas.hpp>
#include "test_util.hpp"

using namespace blendpaint;
using blendpaint_test::ExpectVecNear;
using blendpaint_test::LogCapture;
using blendpaint_test::MakeSolidImage;

namespace {

TEST(RecordingCanvasTest, RecordsCalls) {
  RecordingCanvas canvas;
  reference_counted_ptr<Image> image(MakeSolidImage(2, 2));

  EXPECT_EQ(1, canvas.save_count());
  canvas.save();
  canvas.translate(3.0f, 4.0f);
  canvas.scale(-1.0f, 1.0f);
  canvas.clip_rect(Rect::from_ltrb(0.0f, 0.0f, 5.0f, 5.0f));
  canvas.draw_image_rect(image, Rect::from_ltrb(0.0f, 0.0f, 2.0f, 2.0f),
                         Rect::from_ltrb(1.0f, 1.0f, 3.0f, 3.0f),
                         Paint().alpha(0.5f));
  EXPECT_EQ(2, canvas.save_count());
  canvas.restore();
  EXPECT_EQ(1, canvas.save_count());

  const std::vector<CanvasCommand> &cmds(canvas.commands());
  ASSERT_EQ(6u, cmds.size());
  EXPECT_EQ(CanvasCommand::save_command, cmds[0].m_type);
  EXPECT_EQ(CanvasCommand::translate_command, cmds[1].m_type);
  ExpectVecNear(vec2(3.0f, 4.0f), cmds[1].m_values);
  ExpectVecNear(vec2(-1.0f, 1.0f), cmds[2].m_values);
  EXPECT_EQ(CanvasCommand::clip_rect_command, cmds[3].m_type);
  EXPECT_EQ(CanvasCommand::draw_image_rect_command, cmds[4].m_type);
  EXPECT_TRUE(image == cmds[4].m_image);
  EXPECT_FLOAT_EQ(0.5f, cmds[4].m_paint.alpha());
  EXPECT_FLOAT_EQ(1.0f, cmds[4].m_dst.min_x());
  EXPECT_EQ(CanvasCommand::restore_command, cmds[5].m_type);

  EXPECT_EQ(1u, canvas.count(CanvasCommand::save_command));
  EXPECT_EQ(0u, canvas.count(CanvasCommand::draw_image_nine_command));

  canvas.clear();
  EXPECT_TRUE(canvas.commands().empty());
}

TEST(RecordingCanvasTest, UnbalancedRestoreIsNotRecorded) {
  LogCapture log;
  RecordingCanvas canvas;

  canvas.restore();
  EXPECT_TRUE(canvas.commands().empty());
  EXPECT_TRUE(log.contains("restore without matching save ignored"));
}

TEST(RecordingCanvasTest, ReplayDrawsAndBalancesSaves) {
  RecordingCanvas recording;
  RasterSurface surface(4, 4);
  RasterCanvas raster(surface);

  recording.save();
  recording.translate(2.0f, 2.0f);
  recording.draw_image_rect(MakeSolidImage(1, 1), Rect::from_ltrb(0.0f, 0.0f, 1.0f, 1.0f),
                            Rect::from_ltrb(0.0f, 0.0f, 2.0f, 2.0f), Paint());

  recording.replay(raster);
  EXPECT_EQ(1, raster.save_count());
  ExpectVecNear(vec4(0.0f), surface.pixel(1, 1));
  ExpectVecNear(vec4(1.0f, 0.0f, 0.0f, 1.0f), surface.pixel(3, 3));
}

TEST(RecordingCanvasTest, PrintsCommands) {
  CanvasCommand cmd(CanvasCommand::clip_path_command);
  std::ostringstream str;

  str << cmd;
  EXPECT_EQ(0u, str.str().find("clip_path"));
  EXPECT_STREQ("draw_image_nine", CanvasCommand::label(CanvasCommand::draw_image_nine_command));
}

}  // namespace
