/*!
 * \file image_provider.cpp
 * \brief file image_provider.cpp
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
#include <iostream>
#include <boost/bind/bind.hpp>
#include <blendpaint/image/image_provider.hpp>
#include <blendpaint/util/log.hpp>
#include "../private/util_private_ostream.hpp"

namespace
{
  blendpaint::reference_counted_ptr<blendpaint::ImageStreamCompleter>
  failed_completer(const blendpaint::ImageErrorDetails &error)
  {
    blendpaint::reference_counted_ptr<blendpaint::DeferredImageStreamCompleter> C;

    C = BLENDPAINTnew blendpaint::DeferredImageStreamCompleter();
    C->fail(error);
    return C;
  }
}

//////////////////////////////////////
// blendpaint::ImageProvider methods
blendpaint::reference_counted_ptr<blendpaint::ImageStream>
blendpaint::ImageProvider::
resolve(const ImageConfiguration &configuration, ImageCache &cache)
{
  reference_counted_ptr<ImageStream> stream;
  reference_counted_ptr<ImageStreamCompleter> completer;
  std::string key;
  ImageErrorDetails error;

  stream = ImageStream::create();
  if (obtain_key(configuration, &key, &error) == routine_fail)
    {
      if (error.context().empty())
        {
          std::ostringstream str;
          str << "while resolving an image for " << configuration;
          error.context(str.str());
        }
      stream->set_completer(failed_completer(error));
      return stream;
    }

  completer = cache.put_if_absent(key, boost::bind(&ImageProvider::load, this, key));
  if (!completer)
    {
      ImageErrorDetails load_error("no completer was created", "while loading " + key);
      stream->set_completer(failed_completer(load_error));
      return stream;
    }

  stream->set_completer(completer);
  return stream;
}

blendpaint::reference_counted_ptr<blendpaint::ImageStream>
blendpaint::ImageProvider::
resolve(const ImageConfiguration &configuration)
{
  return resolve(configuration, global_image_cache());
}

blendpaint::ImageCache&
blendpaint::
global_image_cache(void)
{
  static ImageCache R;
  return R;
}

////////////////////////////////////////////
// blendpaint::MemoryImageProvider methods
enum blendpaint::return_code
blendpaint::MemoryImageProvider::
obtain_key(const ImageConfiguration &configuration,
           std::string *out_key, ImageErrorDetails *out_error)
{
  BLENDPAINTunused(configuration);
  if (!m_bitmap)
    {
      out_error->exception("MemoryImageProvider has no bitmap");
      return routine_fail;
    }

  std::ostringstream str;
  str << "MemoryImageProvider(" << m_bitmap.get() << ", " << m_scale << ")";
  *out_key = str.str();
  return routine_success;
}

blendpaint::reference_counted_ptr<blendpaint::ImageStreamCompleter>
blendpaint::MemoryImageProvider::
load(const std::string &key)
{
  BLENDPAINTunused(key);
  return BLENDPAINTnew OneFrameImageStreamCompleter(ImageInfo(Image::create(m_bitmap),
                                                              m_scale, m_debug_label));
}

//////////////////////////////////////////////
// blendpaint::DeferredImageProvider methods
enum blendpaint::return_code
blendpaint::DeferredImageProvider::
obtain_key(const ImageConfiguration &configuration,
           std::string *out_key, ImageErrorDetails *out_error)
{
  BLENDPAINTunused(configuration);
  if (m_name.empty())
    {
      out_error->exception("DeferredImageProvider has an empty name");
      return routine_fail;
    }
  *out_key = "DeferredImageProvider(" + m_name + ")";
  return routine_success;
}

blendpaint::reference_counted_ptr<blendpaint::ImageStreamCompleter>
blendpaint::DeferredImageProvider::
load(const std::string &key)
{
  m_last_completer = BLENDPAINTnew DeferredImageStreamCompleter();
  m_load(key, m_last_completer);
  return m_last_completer;
}

//////////////////////////////////////////////
// blendpaint::AnimatedImageProvider methods
enum blendpaint::return_code
blendpaint::AnimatedImageProvider::
obtain_key(const ImageConfiguration &configuration,
           std::string *out_key, ImageErrorDetails *out_error)
{
  BLENDPAINTunused(configuration);
  if (m_name.empty())
    {
      out_error->exception("AnimatedImageProvider has an empty name");
      return routine_fail;
    }
  if (m_frames.empty())
    {
      out_error->exception("AnimatedImageProvider " + m_name + " has no frames");
      return routine_fail;
    }
  *out_key = "AnimatedImageProvider(" + m_name + ")";
  return routine_success;
}

blendpaint::reference_counted_ptr<blendpaint::ImageStreamCompleter>
blendpaint::AnimatedImageProvider::
load(const std::string &key)
{
  BLENDPAINTunused(key);
  m_last_completer = BLENDPAINTnew MultiFrameImageStreamCompleter(m_frames, m_repetition_count,
                                                                  m_scale, m_name);
  return m_last_completer;
}

///////////////////////////////////////////
// blendpaint::ImageConfiguration methods
std::ostream&
blendpaint::
operator<<(std::ostream &str, const ImageConfiguration &v)
{
  const char *sep("");

  str << "ImageConfiguration(";
  if (v.device_pixel_ratio())
    {
      str << sep << "device_pixel_ratio: " << *v.device_pixel_ratio();
      sep = ", ";
    }
  if (v.locale())
    {
      str << sep << "locale: " << *v.locale();
      sep = ", ";
    }
  if (v.size())
    {
      str << sep << "size: " << *v.size();
      sep = ", ";
    }
  if (v.text_direction())
    {
      str << sep << "text_direction: " << PainterEnums::label(*v.text_direction());
      sep = ", ";
    }
  if (v.platform())
    {
      str << sep << "platform: " << *v.platform();
    }
  str << ")";
  return str;
}
