/*!
 * \file image_cache_unittest.cpp
 * \brief file image_cache_unittest.cpp
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
#include <string>
#include <vector>
#include <boost/bind/bind.hpp>
#include <gtest/gtest.h>
#include <blendpaint/image/image_cache.hpp>
#include <blendpaint/image/image_provider.hpp>
#include "test_util.hpp"

using namespace blendpaint;
using blendpaint_test::LogCapture;

namespace {

class CountingLoader {
 public:
  CountingLoader() : calls_(0), produce_(true) {}

  reference_counted_ptr<ImageStreamCompleter> Load() {
    ++calls_;
    if (!produce_)
      return reference_counted_ptr<ImageStreamCompleter>();
    return BLENDPAINTnew DeferredImageStreamCompleter();
  }

  ImageCache::loader AsLoader() {
    return boost::bind(&CountingLoader::Load, this);
  }

  int calls_;
  bool produce_;
};

TEST(ImageCacheTest, LoadsOncePerKey) {
  ImageCache cache;
  CountingLoader loader;
  reference_counted_ptr<ImageStreamCompleter> a, b;

  a = cache.put_if_absent("a", loader.AsLoader());
  b = cache.put_if_absent("a", loader.AsLoader());
  EXPECT_EQ(1, loader.calls_);
  EXPECT_TRUE(a == b);
  EXPECT_TRUE(cache.contains("a"));
  EXPECT_EQ(1u, cache.size());
  EXPECT_EQ(1000u, cache.maximum_size());
}

TEST(ImageCacheTest, EvictsLeastRecentlyUsed) {
  ImageCache cache(2);
  CountingLoader loader;

  cache.put_if_absent("a", loader.AsLoader());
  cache.put_if_absent("b", loader.AsLoader());
  cache.put_if_absent("a", loader.AsLoader());
  cache.put_if_absent("c", loader.AsLoader());

  EXPECT_EQ(2u, cache.size());
  EXPECT_TRUE(cache.contains("a"));
  EXPECT_FALSE(cache.contains("b"));
  EXPECT_TRUE(cache.contains("c"));

  cache.maximum_size(1);
  EXPECT_EQ(1u, cache.size());
  EXPECT_TRUE(cache.contains("c"));
}

TEST(ImageCacheTest, ZeroSizeCacheStoresNothing) {
  ImageCache cache(0);
  CountingLoader loader;

  EXPECT_TRUE(cache.put_if_absent("a", loader.AsLoader()));
  EXPECT_TRUE(cache.put_if_absent("a", loader.AsLoader()));
  EXPECT_EQ(2, loader.calls_);
  EXPECT_EQ(0u, cache.size());
}

TEST(ImageCacheTest, FailedLoadIsNotStored) {
  ImageCache cache;
  CountingLoader loader;

  loader.produce_ = false;
  EXPECT_FALSE(cache.put_if_absent("a", loader.AsLoader()));
  EXPECT_FALSE(cache.contains("a"));
}

TEST(ImageCacheTest, EvictAndClear) {
  ImageCache cache;
  CountingLoader loader;

  cache.put_if_absent("a", loader.AsLoader());
  cache.put_if_absent("b", loader.AsLoader());
  EXPECT_TRUE(cache.evict("a"));
  EXPECT_FALSE(cache.evict("a"));
  EXPECT_EQ(1u, cache.size());

  cache.clear();
  EXPECT_EQ(0u, cache.size());
  cache.put_if_absent("b", loader.AsLoader());
  EXPECT_EQ(3, loader.calls_);
}

class ImageListener {
 public:
  ImageListener() : sync_calls_(0) {}

  void OnImage(const ImageInfo &info, bool synchronous) {
    images_.push_back(info);
    if (synchronous)
      ++sync_calls_;
  }

  void OnError(const ImageErrorDetails &error) { errors_.push_back(error); }

  ImageStreamListener Listener() {
    return ImageStreamListener(
        boost::bind(&ImageListener::OnImage, this, boost::placeholders::_1, boost::placeholders::_2),
        boost::bind(&ImageListener::OnError, this, boost::placeholders::_1));
  }

  std::vector<ImageInfo> images_;
  std::vector<ImageErrorDetails> errors_;
  int sync_calls_;
};

TEST(ImageConfigurationTest, PrintsSetFields) {
  std::ostringstream str, empty;
  ImageConfiguration config;

  config
    .device_pixel_ratio(2.0f)
    .locale(std::string("en"))
    .text_direction(PainterEnums::text_direction_rtl);
  str << config;
  EXPECT_EQ(std::string("ImageConfiguration(device_pixel_ratio: 2, locale: en, text_direction: ")
            + PainterEnums::label(PainterEnums::text_direction_rtl) + ")",
            str.str());

  empty << ImageConfiguration::empty();
  EXPECT_EQ("ImageConfiguration()", empty.str());
  EXPECT_NE(config, ImageConfiguration::empty());
  EXPECT_EQ(ImageConfiguration::empty(), ImageConfiguration());
}

TEST(MemoryImageProviderTest, ResolvesSynchronously) {
  ImageCache cache;
  ImageListener listener;
  reference_counted_ptr<MemoryImageProvider> provider;
  reference_counted_ptr<ImageStream> stream;

  provider = BLENDPAINTnew MemoryImageProvider(Bitmap::create_solid(4, 2, u8vec4(0, 0, 255, 255)),
                                               2.0f, "blue");
  stream = provider->resolve(ImageConfiguration(), cache);
  ASSERT_TRUE(stream->completer());
  EXPECT_EQ(1u, cache.size());

  ImageStream::Connection connection(stream->add_listener(listener.Listener()));
  ASSERT_EQ(1u, listener.images_.size());
  EXPECT_EQ(1, listener.sync_calls_);
  EXPECT_EQ(4, listener.images_[0].image()->width());
  EXPECT_FLOAT_EQ(2.0f, listener.images_[0].scale());
  EXPECT_EQ("blue", listener.images_[0].debug_label());
  connection.disconnect();
}

TEST(MemoryImageProviderTest, SameProviderSharesCompleter) {
  ImageCache cache;
  reference_counted_ptr<MemoryImageProvider> provider;

  provider = BLENDPAINTnew MemoryImageProvider(Bitmap::create_solid(1, 1, u8vec4(0, 0, 0, 255)));
  EXPECT_EQ(provider->resolve(ImageConfiguration(), cache)->key(),
            provider->resolve(ImageConfiguration().device_pixel_ratio(3.0f), cache)->key());
  EXPECT_EQ(1u, cache.size());
}

TEST(MemoryImageProviderTest, MissingBitmapReportsError) {
  LogCapture log;
  ImageCache cache;
  ImageListener listener;
  reference_counted_ptr<MemoryImageProvider> provider;
  reference_counted_ptr<ImageStream> stream;

  provider = BLENDPAINTnew MemoryImageProvider(reference_counted_ptr<const Bitmap>());
  stream = provider->resolve(ImageConfiguration(), cache);
  EXPECT_EQ(0u, cache.size());

  ImageStream::Connection connection(stream->add_listener(listener.Listener()));
  ASSERT_EQ(1u, listener.errors_.size());
  EXPECT_EQ("MemoryImageProvider has no bitmap", listener.errors_[0].exception());
  EXPECT_EQ("while resolving an image for ImageConfiguration()", listener.errors_[0].context());
  EXPECT_TRUE(listener.images_.empty());
  connection.disconnect();
}

class LoadObserver {
 public:
  void OnLoad(const std::string &key,
              const reference_counted_ptr<DeferredImageStreamCompleter> &completer) {
    keys_.push_back(key);
    completer_ = completer;
  }

  std::vector<std::string> keys_;
  reference_counted_ptr<DeferredImageStreamCompleter> completer_;
};

TEST(DeferredImageProviderTest, CompletesLater) {
  ImageCache cache;
  ImageListener listener;
  LoadObserver observer;
  reference_counted_ptr<DeferredImageProvider> provider;
  reference_counted_ptr<ImageStream> stream;

  provider = BLENDPAINTnew DeferredImageProvider("later");
  provider->connect_load(boost::bind(&LoadObserver::OnLoad, &observer,
                                     boost::placeholders::_1, boost::placeholders::_2));
  stream = provider->resolve(ImageConfiguration(), cache);

  ASSERT_EQ(1u, observer.keys_.size());
  EXPECT_EQ("DeferredImageProvider(later)", observer.keys_[0]);
  EXPECT_TRUE(observer.completer_ == provider->last_completer());
  EXPECT_TRUE(cache.contains("DeferredImageProvider(later)"));

  ImageStream::Connection connection(stream->add_listener(listener.Listener()));
  EXPECT_TRUE(listener.images_.empty());

  provider->last_completer()->complete(
      ImageInfo(Image::create(Bitmap::create_solid(1, 1, u8vec4(0, 0, 0, 255)))));
  ASSERT_EQ(1u, listener.images_.size());
  EXPECT_EQ(0, listener.sync_calls_);
  connection.disconnect();
}

TEST(DeferredImageProviderTest, EmptyNameFails) {
  LogCapture log;
  ImageCache cache;
  reference_counted_ptr<DeferredImageProvider> provider;
  reference_counted_ptr<ImageStream> stream;

  provider = BLENDPAINTnew DeferredImageProvider("");
  stream = provider->resolve(ImageConfiguration(), cache);
  ASSERT_TRUE(stream->completer());
  ASSERT_TRUE(stream->completer()->current_error());
  EXPECT_EQ("DeferredImageProvider has an empty name",
            stream->completer()->current_error()->exception());
  EXPECT_TRUE(log.contains("Unhandled image error"));
}

TEST(AnimatedImageProviderTest, LoadsMultiFrameCompleter) {
  ImageCache cache;
  std::vector<MultiFrameImageStreamCompleter::Frame> frames;
  reference_counted_ptr<AnimatedImageProvider> provider;

  frames.push_back(MultiFrameImageStreamCompleter::Frame(
      Bitmap::create_solid(1, 1, u8vec4(0, 0, 0, 255)), 40));
  frames.push_back(MultiFrameImageStreamCompleter::Frame(
      Bitmap::create_solid(1, 1, u8vec4(255, 255, 255, 255)), 40));
  provider = BLENDPAINTnew AnimatedImageProvider("spinner", frames, 3, 2.0f);

  provider->resolve(ImageConfiguration(), cache);
  ASSERT_TRUE(provider->last_completer());
  EXPECT_EQ(2u, provider->last_completer()->frame_count());
  EXPECT_EQ(3, provider->last_completer()->repetition_count());
  EXPECT_TRUE(cache.contains("AnimatedImageProvider(spinner)"));
}

TEST(AnimatedImageProviderTest, NoFramesFails) {
  LogCapture log;
  ImageCache cache;
  reference_counted_ptr<AnimatedImageProvider> provider;

  provider = BLENDPAINTnew AnimatedImageProvider("empty",
                                                 std::vector<MultiFrameImageStreamCompleter::Frame>());
  provider->resolve(ImageConfiguration(), cache);
  EXPECT_FALSE(provider->last_completer());
  EXPECT_TRUE(log.contains("AnimatedImageProvider empty has no frames"));
}

TEST(GlobalImageCacheTest, ResolveWithoutCacheUsesGlobal) {
  reference_counted_ptr<DeferredImageProvider> provider;

  global_image_cache().clear();
  provider = BLENDPAINTnew DeferredImageProvider("global-cache-test");
  provider->resolve(ImageConfiguration());
  EXPECT_TRUE(global_image_cache().contains("DeferredImageProvider(global-cache-test)"));
  global_image_cache().clear();
}

}  // namespace
