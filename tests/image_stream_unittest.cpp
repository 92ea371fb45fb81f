/*!
 * \file image_stream_unittest.cpp
 * \brief file image_stream_unittest.cpp
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


#include <limits>
#include <sstream>
#include <string>
#include <vector>
#include <boost/bind/bind.hpp>
#include <gtest/gtest.h>
#include <blendpaint/image/image_stream.hpp>
#include "test_util.hpp"

using namespace blendpaint;
using blendpaint_test::LogCapture;
using blendpaint_test::MakeSolidImage;

namespace {

/* Records what a listener receives. */
class Recorder {
 public:
  Recorder() : sync_calls_(0), async_calls_(0) {}

  void OnImage(const ImageInfo &info, bool synchronous) {
    images_.push_back(info);
    if (synchronous)
      ++sync_calls_;
    else
      ++async_calls_;
  }

  void OnError(const ImageErrorDetails &error) {
    errors_.push_back(error);
  }

  ImageStreamListener Listener() {
    return ImageStreamListener(
        boost::bind(&Recorder::OnImage, this, boost::placeholders::_1, boost::placeholders::_2),
        boost::bind(&Recorder::OnError, this, boost::placeholders::_1));
  }

  ImageStreamListener ImageOnlyListener() {
    return ImageStreamListener(
        boost::bind(&Recorder::OnImage, this, boost::placeholders::_1, boost::placeholders::_2));
  }

  std::vector<ImageInfo> images_;
  std::vector<ImageErrorDetails> errors_;
  int sync_calls_;
  int async_calls_;
};

/* Counts the first and last listener notifications. */
class HookedCompleter : public DeferredImageStreamCompleter {
 public:
  HookedCompleter() : first_added_(0), last_removed_(0) {}

  int first_added_;
  int last_removed_;

 protected:
  virtual void on_first_listener_added(void) { ++first_added_; }
  virtual void on_last_listener_removed(void) { ++last_removed_; }
};

ImageInfo SolidInfo(float scale = 1.0f) {
  return ImageInfo(MakeSolidImage(2, 2), scale, "solid");
}

TEST(ImageErrorDetailsTest, Prints) {
  std::ostringstream str;

  str << ImageErrorDetails("decode failed", "while loading a.png")
      << "; " << ImageErrorDetails("boom").library("codec");
  EXPECT_EQ("[image resource service] decode failed (while loading a.png); [codec] boom",
            str.str());
}

TEST(ImageStreamCompleterTest, OneFrameDeliversSynchronouslyAsClone) {
  ImageInfo info(SolidInfo(2.0f));
  reference_counted_ptr<ImageStreamCompleter> completer;
  Recorder a, b;

  completer = BLENDPAINTnew OneFrameImageStreamCompleter(info);
  completer->add_listener(a.Listener());
  completer->add_listener(b.Listener());

  ASSERT_EQ(1u, a.images_.size());
  ASSERT_EQ(1u, b.images_.size());
  EXPECT_EQ(1, a.sync_calls_);
  EXPECT_TRUE(a.images_[0].is_clone_of(info));
  EXPECT_TRUE(a.images_[0].image() != info.image());
  EXPECT_TRUE(a.images_[0].image() != b.images_[0].image());
  EXPECT_FLOAT_EQ(2.0f, a.images_[0].scale());
  EXPECT_EQ(2u, completer->number_listeners());
}

TEST(ImageStreamCompleterTest, DeferredDeliversAsynchronously) {
  reference_counted_ptr<DeferredImageStreamCompleter> completer;
  Recorder r;

  completer = BLENDPAINTnew DeferredImageStreamCompleter();
  completer->add_listener(r.Listener());
  EXPECT_TRUE(r.images_.empty());

  completer->complete(SolidInfo());
  ASSERT_EQ(1u, r.images_.size());
  EXPECT_EQ(0, r.sync_calls_);
  EXPECT_EQ(1, r.async_calls_);
  EXPECT_TRUE(r.images_[0].is_clone_of(completer->current_image()));
}

TEST(ImageStreamCompleterTest, NewImageDisposesPrevious) {
  reference_counted_ptr<DeferredImageStreamCompleter> completer;
  ImageInfo first(SolidInfo()), second(SolidInfo());

  completer = BLENDPAINTnew DeferredImageStreamCompleter();
  completer->complete(first);
  completer->complete(second);

  EXPECT_TRUE(first.image()->disposed());
  EXPECT_FALSE(second.image()->disposed());
  EXPECT_EQ(second, completer->current_image());
}

TEST(ImageStreamCompleterTest, RemovedListenerIsNotCalled) {
  reference_counted_ptr<DeferredImageStreamCompleter> completer;
  Recorder a, b;
  ImageStreamCompleter::listener_id id;

  completer = BLENDPAINTnew DeferredImageStreamCompleter();
  id = completer->add_listener(a.Listener());
  completer->add_listener(b.Listener());
  completer->remove_listener(id);
  completer->complete(SolidInfo());

  EXPECT_TRUE(a.images_.empty());
  EXPECT_EQ(1u, b.images_.size());
  EXPECT_EQ(1u, completer->number_listeners());
}

TEST(ImageStreamCompleterTest, RemovingUnknownListenerWarns) {
  LogCapture log;
  reference_counted_ptr<DeferredImageStreamCompleter> completer;

  completer = BLENDPAINTnew DeferredImageStreamCompleter();
  completer->remove_listener(17);
  EXPECT_TRUE(log.contains("no listener with ID 17"));
}

TEST(ImageStreamCompleterTest, ErrorsReachErrorListeners) {
  LogCapture log;
  reference_counted_ptr<DeferredImageStreamCompleter> completer;
  Recorder with_handler, without_handler, late;

  completer = BLENDPAINTnew DeferredImageStreamCompleter();
  completer->add_listener(with_handler.Listener());
  completer->add_listener(without_handler.ImageOnlyListener());
  completer->fail(ImageErrorDetails("not found"));

  ASSERT_EQ(1u, with_handler.errors_.size());
  EXPECT_EQ("not found", with_handler.errors_[0].exception());
  EXPECT_TRUE(without_handler.errors_.empty());
  ASSERT_TRUE(completer->current_error());
  EXPECT_FALSE(log.contains("Unhandled image error"));

  completer->add_listener(late.Listener());
  EXPECT_EQ(1u, late.errors_.size());
}

TEST(ImageStreamCompleterTest, UnhandledErrorIsLogged) {
  LogCapture log;
  reference_counted_ptr<DeferredImageStreamCompleter> completer;
  Recorder r;

  completer = BLENDPAINTnew DeferredImageStreamCompleter();
  completer->add_listener(r.ImageOnlyListener());
  completer->fail(ImageErrorDetails("not found"));
  EXPECT_TRUE(log.contains("Unhandled image error: [image resource service] not found"));
}

TEST(ImageStreamCompleterTest, ListenerHooks) {
  reference_counted_ptr<HookedCompleter> completer;
  Recorder a, b;
  ImageStreamCompleter::listener_id ia, ib;

  completer = BLENDPAINTnew HookedCompleter();
  ia = completer->add_listener(a.Listener());
  ib = completer->add_listener(b.Listener());
  EXPECT_EQ(1, completer->first_added_);

  completer->remove_listener(ia);
  EXPECT_EQ(0, completer->last_removed_);
  completer->remove_listener(ib);
  EXPECT_EQ(1, completer->last_removed_);
  EXPECT_FALSE(completer->has_listeners());
}

class MultiFrameTest : public testing::Test {
 protected:
  MultiFrameTest() {
    for (int i = 0; i < 3; ++i) {
      frames_.push_back(MultiFrameImageStreamCompleter::Frame(
          Bitmap::create_solid(1, 1, u8vec4(i * 100, 0, 0, 255)), 100));
    }
  }

  std::vector<MultiFrameImageStreamCompleter::Frame> frames_;
  Recorder recorder_;
};

TEST_F(MultiFrameTest, DoesNotAdvanceWithoutListeners) {
  reference_counted_ptr<MultiFrameImageStreamCompleter> completer;

  completer = BLENDPAINTnew MultiFrameImageStreamCompleter(frames_, 0);
  completer->advance(1000);
  EXPECT_EQ(-1, completer->current_frame());
  EXPECT_FALSE(completer->current_image().image());
}

TEST_F(MultiFrameTest, StepsThroughFramesByDuration) {
  reference_counted_ptr<MultiFrameImageStreamCompleter> completer;

  completer = BLENDPAINTnew MultiFrameImageStreamCompleter(frames_, 0, 2.0f, "anim");
  completer->add_listener(recorder_.Listener());
  EXPECT_EQ(3u, completer->frame_count());

  completer->advance(0);
  EXPECT_EQ(0, completer->current_frame());
  ASSERT_EQ(1u, recorder_.images_.size());
  EXPECT_FLOAT_EQ(2.0f, recorder_.images_[0].scale());
  EXPECT_EQ("anim", recorder_.images_[0].debug_label());

  completer->advance(50);
  EXPECT_EQ(0, completer->current_frame());
  completer->advance(50);
  EXPECT_EQ(1, completer->current_frame());
  completer->advance(250);
  EXPECT_EQ(2, completer->current_frame());
  EXPECT_TRUE(completer->finished());
  EXPECT_EQ(3u, recorder_.images_.size());
  EXPECT_EQ(3, recorder_.async_calls_);

  completer->advance(1000);
  EXPECT_EQ(3u, recorder_.images_.size());
}

TEST_F(MultiFrameTest, RepeatsRequestedNumberOfTimes) {
  reference_counted_ptr<MultiFrameImageStreamCompleter> completer;

  completer = BLENDPAINTnew MultiFrameImageStreamCompleter(frames_, 1);
  completer->add_listener(recorder_.Listener());
  completer->advance(0);
  completer->advance(300);
  EXPECT_EQ(0, completer->current_frame());
  EXPECT_FALSE(completer->finished());

  completer->advance(300);
  EXPECT_EQ(2, completer->current_frame());
  EXPECT_TRUE(completer->finished());
}

TEST_F(MultiFrameTest, LoopsForever) {
  reference_counted_ptr<MultiFrameImageStreamCompleter> completer;

  completer = BLENDPAINTnew MultiFrameImageStreamCompleter(frames_, -1);
  completer->add_listener(recorder_.Listener());
  completer->advance(0);
  completer->advance(100 * 3 * 50 + 100);
  EXPECT_EQ(1, completer->current_frame());
  EXPECT_FALSE(completer->finished());
}

TEST_F(MultiFrameTest, LoopsForeverOverLongElapsedTimes) {
  reference_counted_ptr<MultiFrameImageStreamCompleter> completer;
  const int kLong(std::numeric_limits<int>::max());

  completer = BLENDPAINTnew MultiFrameImageStreamCompleter(frames_, -1);
  completer->add_listener(recorder_.Listener());
  completer->advance(0);

  // 2147483647 % 300 == 247
  completer->advance(kLong);
  EXPECT_EQ(2, completer->current_frame());

  // 2 * 2147483647 % 300 == 194
  completer->advance(kLong);
  EXPECT_EQ(1, completer->current_frame());

  // 3 * 2147483647 % 300 == 141
  completer->advance(kLong);
  EXPECT_EQ(1, completer->current_frame());
  EXPECT_FALSE(completer->finished());
}

TEST_F(MultiFrameTest, ManyRepetitionsFinishWithinOneLongAdvance) {
  reference_counted_ptr<MultiFrameImageStreamCompleter> completer;

  completer = BLENDPAINTnew MultiFrameImageStreamCompleter(frames_, 1000000);
  completer->add_listener(recorder_.Listener());
  completer->advance(0);
  completer->advance(std::numeric_limits<int>::max());

  EXPECT_EQ(2, completer->current_frame());
  EXPECT_TRUE(completer->finished());
}

TEST_F(MultiFrameTest, SingleFrameFinishesImmediately) {
  reference_counted_ptr<MultiFrameImageStreamCompleter> completer;
  LogCapture log;

  frames_.resize(1);
  frames_.push_back(MultiFrameImageStreamCompleter::Frame());
  completer = BLENDPAINTnew MultiFrameImageStreamCompleter(frames_, -1);
  EXPECT_EQ(1u, completer->frame_count());
  EXPECT_TRUE(log.contains("dropping frame without bitmap"));

  completer->add_listener(recorder_.Listener());
  completer->advance(0);
  EXPECT_TRUE(completer->finished());
  EXPECT_EQ(1u, recorder_.images_.size());
}

class ImageStreamTest : public testing::Test {
 protected:
  ImageStreamTest()
      : stream_(ImageStream::create()),
        completer_(BLENDPAINTnew DeferredImageStreamCompleter()) {}

  reference_counted_ptr<ImageStream> stream_;
  reference_counted_ptr<DeferredImageStreamCompleter> completer_;
  Recorder recorder_;
};

TEST_F(ImageStreamTest, PendingListenersAttachWhenCompleterIsSet) {
  ImageStream::Connection connection(stream_->add_listener(recorder_.Listener()));
  const void *unresolved_key(stream_->key());

  EXPECT_TRUE(connection.connected());
  EXPECT_EQ(stream_.get(), unresolved_key);

  completer_->complete(SolidInfo());
  stream_->set_completer(completer_);
  EXPECT_EQ(completer_.get(), stream_->key());
  EXPECT_EQ(1u, completer_->number_listeners());
  ASSERT_EQ(1u, recorder_.images_.size());
  EXPECT_EQ(1, recorder_.sync_calls_);
}

TEST_F(ImageStreamTest, DisconnectBeforeCompleter) {
  ImageStream::Connection connection(stream_->add_listener(recorder_.Listener()));

  connection.disconnect();
  EXPECT_FALSE(connection.connected());
  stream_->set_completer(completer_);
  EXPECT_EQ(0u, completer_->number_listeners());
}

TEST_F(ImageStreamTest, DisconnectAfterCompleter) {
  stream_->set_completer(completer_);

  ImageStream::Connection connection(stream_->add_listener(recorder_.Listener()));
  EXPECT_EQ(1u, completer_->number_listeners());

  connection.disconnect();
  EXPECT_FALSE(connection.connected());
  EXPECT_EQ(0u, completer_->number_listeners());

  completer_->complete(SolidInfo());
  EXPECT_TRUE(recorder_.images_.empty());
}

TEST_F(ImageStreamTest, SecondCompleterIsIgnored) {
  LogCapture log;
  reference_counted_ptr<ImageStreamCompleter> other(BLENDPAINTnew DeferredImageStreamCompleter());

  stream_->set_completer(completer_);
  stream_->set_completer(other);
  EXPECT_TRUE(stream_->completer() == completer_);
  EXPECT_TRUE(log.contains("completer already set"));
}

/* Disconnects from within the synchronous image callback. */
class SelfDisconnecting {
 public:
  SelfDisconnecting() : calls_(0) {}

  void OnImage(const ImageInfo &, bool) {
    ++calls_;
    connection_.disconnect();
  }

  ImageStream::Connection connection_;
  int calls_;
};

TEST_F(ImageStreamTest, ListenerMayDisconnectDuringSynchronousDelivery) {
  SelfDisconnecting listener;

  listener.connection_ = stream_->add_listener(ImageStreamListener(
      boost::bind(&SelfDisconnecting::OnImage, &listener,
                  boost::placeholders::_1, boost::placeholders::_2)));
  completer_->complete(SolidInfo());
  stream_->set_completer(completer_);

  EXPECT_EQ(1, listener.calls_);
  EXPECT_FALSE(listener.connection_.connected());
  EXPECT_EQ(0u, completer_->number_listeners());
}

TEST_F(ImageStreamTest, ReleasingStreamRemovesListeners) {
  stream_->set_completer(completer_);
  stream_->add_listener(recorder_.Listener());
  EXPECT_EQ(1u, completer_->number_listeners());

  stream_.clear();
  EXPECT_EQ(0u, completer_->number_listeners());
}

TEST_F(ImageStreamTest, Prints) {
  std::ostringstream unresolved, resolved;

  unresolved << *stream_;
  EXPECT_EQ("ImageStream(unresolved)", unresolved.str());

  stream_->set_completer(completer_);
  resolved << *stream_;
  EXPECT_NE(std::string::npos, resolved.str().find("listeners = 0"));
}

}  // namespace
