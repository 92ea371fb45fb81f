/*!
 * \file image_provider.hpp
 * \brief file image_provider.hpp
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


#pragma once

#include <string>
#include <vector>
#include <boost/signals2.hpp>
#include <blendpaint/util/util.hpp>
#include <blendpaint/util/reference_counted.hpp>
#include <blendpaint/image.hpp>
#include <blendpaint/image/image_stream.hpp>
#include <blendpaint/image/image_cache.hpp>
#include <blendpaint/image/image_configuration.hpp>

namespace blendpaint
{
/*!\addtogroup Imaging
 * @{
 */

  /*!
   * \brief
   * An ImageProvider identifies an image and knows how to
   * produce it. Resolving a provider first computes a key
   * from an ImageConfiguration and then obtains the completer
   * for that key from an ImageCache, creating it with load()
   * on a cache miss.
   */
  class ImageProvider:
    public reference_counted<ImageProvider>::concurrent
  {
  public:
    virtual
    ~ImageProvider()
    {}

    /*!
     * To be implemented by a derived class to compute the key
     * of the image to use for a configuration. On failure,
     * write the reason to out_error and return routine_fail.
     * \param configuration context in which the image is shown
     * \param[out] out_key location to which to write the key
     * \param[out] out_error location to which to write a failure
     */
    virtual
    enum return_code
    obtain_key(const ImageConfiguration &configuration,
               std::string *out_key, ImageErrorDetails *out_error) = 0;

    /*!
     * To be implemented by a derived class to create the
     * completer for a key returned by obtain_key().
     */
    virtual
    reference_counted_ptr<ImageStreamCompleter>
    load(const std::string &key) = 0;

    /*!
     * Returns an ImageStream bound to the completer of the
     * image for a configuration. If obtaining the key or
     * loading fails, the stream is bound to a completer
     * that has reported the failure.
     * \param configuration context in which the image is shown
     * \param cache cache from which to fetch the completer
     */
    reference_counted_ptr<ImageStream>
    resolve(const ImageConfiguration &configuration, ImageCache &cache);

    /*!
     * Equivalent to
     * \code
     * resolve(configuration, global_image_cache());
     * \endcode
     */
    reference_counted_ptr<ImageStream>
    resolve(const ImageConfiguration &configuration);
  };

  /*!
   * Returns the ImageCache shared by all callers that do not
   * provide their own.
   */
  ImageCache&
  global_image_cache(void);

  /*!
   * \brief
   * A MemoryImageProvider provides an already decoded Bitmap;
   * its completer has the image from creation.
   */
  class MemoryImageProvider:public ImageProvider
  {
  public:
    /*!
     * Ctor.
     * \param bitmap pixels of the image
     * \param scale number of image pixels per logical pixel
     * \param debug_label label of the produced image
     */
    explicit
    MemoryImageProvider(const reference_counted_ptr<const Bitmap> &bitmap,
                        float scale = 1.0f,
                        const std::string &debug_label = std::string()):
      m_bitmap(bitmap),
      m_scale(scale),
      m_debug_label(debug_label)
    {}

    virtual
    enum return_code
    obtain_key(const ImageConfiguration &configuration,
               std::string *out_key, ImageErrorDetails *out_error);

    virtual
    reference_counted_ptr<ImageStreamCompleter>
    load(const std::string &key);

    const reference_counted_ptr<const Bitmap>&
    bitmap(void) const
    {
      return m_bitmap;
    }

    float
    scale(void) const
    {
      return m_scale;
    }

  private:
    reference_counted_ptr<const Bitmap> m_bitmap;
    float m_scale;
    std::string m_debug_label;
  };

  /*!
   * \brief
   * A DeferredImageProvider hands each completer it creates
   * to the caller, who completes or fails it later.
   */
  class DeferredImageProvider:public ImageProvider
  {
  public:
    /*!
     * Signal type emitted when a completer is created, with
     * the key and the completer.
     */
    typedef boost::signals2::signal<void (const std::string&,
                                          const reference_counted_ptr<DeferredImageStreamCompleter>&)> signal_load;

    /*!
     * Ctor.
     * \param name name identifying the image, must not be empty
     */
    explicit
    DeferredImageProvider(const std::string &name):
      m_name(name)
    {}

    virtual
    enum return_code
    obtain_key(const ImageConfiguration &configuration,
               std::string *out_key, ImageErrorDetails *out_error);

    virtual
    reference_counted_ptr<ImageStreamCompleter>
    load(const std::string &key);

    /*!
     * Connect to the signal emitted when load() creates a
     * completer.
     * \param slot slot to call
     */
    boost::signals2::connection
    connect_load(const signal_load::slot_type &slot)
    {
      return m_load.connect(slot);
    }

    /*!
     * Returns the completer last created by load(), null
     * if load() was not called.
     */
    const reference_counted_ptr<DeferredImageStreamCompleter>&
    last_completer(void) const
    {
      return m_last_completer;
    }

    const std::string&
    name(void) const
    {
      return m_name;
    }

  private:
    std::string m_name;
    signal_load m_load;
    reference_counted_ptr<DeferredImageStreamCompleter> m_last_completer;
  };

  /*!
   * \brief
   * An AnimatedImageProvider provides an animation as a
   * MultiFrameImageStreamCompleter.
   */
  class AnimatedImageProvider:public ImageProvider
  {
  public:
    /*!
     * Ctor.
     * \param name name identifying the animation, must not be empty
     * \param frames frames of the animation
     * \param repetition_count number of repeats after the first
     *                         play, -1 repeats forever
     * \param scale number of image pixels per logical pixel
     */
    AnimatedImageProvider(const std::string &name,
                          const std::vector<MultiFrameImageStreamCompleter::Frame> &frames,
                          int repetition_count = -1,
                          float scale = 1.0f):
      m_name(name),
      m_frames(frames),
      m_repetition_count(repetition_count),
      m_scale(scale)
    {}

    virtual
    enum return_code
    obtain_key(const ImageConfiguration &configuration,
               std::string *out_key, ImageErrorDetails *out_error);

    virtual
    reference_counted_ptr<ImageStreamCompleter>
    load(const std::string &key);

    /*!
     * Returns the completer last created by load(), null
     * if load() was not called.
     */
    const reference_counted_ptr<MultiFrameImageStreamCompleter>&
    last_completer(void) const
    {
      return m_last_completer;
    }

  private:
    std::string m_name;
    std::vector<MultiFrameImageStreamCompleter::Frame> m_frames;
    int m_repetition_count;
    float m_scale;
    reference_counted_ptr<MultiFrameImageStreamCompleter> m_last_completer;
  };

/*! @} */
}
