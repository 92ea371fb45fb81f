/*!
 * \file image_stream.hpp
 * \brief file image_stream.hpp
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
#include <iosfwd>
#include <boost/function.hpp>
#include <boost/optional.hpp>
#include <blendpaint/util/util.hpp>
#include <blendpaint/util/reference_counted.hpp>
#include <blendpaint/image.hpp>

namespace blendpaint
{
/*!\addtogroup Imaging
 * @{
 */

  /*!
   * \brief
   * ImageErrorDetails describes a failure to produce an
   * image.
   */
  class ImageErrorDetails
  {
  public:
    explicit
    ImageErrorDetails(const std::string &exception = std::string(),
                      const std::string &context = std::string(),
                      const std::string &library = std::string("image resource service")):
      m_exception(exception),
      m_context(context),
      m_library(library)
    {}

    /*!
     * Set the description of what went wrong.
     */
    ImageErrorDetails&
    exception(const std::string &v)
    {
      m_exception = v;
      return *this;
    }

    const std::string&
    exception(void) const
    {
      return m_exception;
    }

    /*!
     * Set the description of what was being done
     * when the error occurred.
     */
    ImageErrorDetails&
    context(const std::string &v)
    {
      m_context = v;
      return *this;
    }

    const std::string&
    context(void) const
    {
      return m_context;
    }

    /*!
     * Set the name of the component that reported the
     * error.
     */
    ImageErrorDetails&
    library(const std::string &v)
    {
      m_library = v;
      return *this;
    }

    const std::string&
    library(void) const
    {
      return m_library;
    }

  private:
    std::string m_exception, m_context, m_library;
  };

  std::ostream&
  operator<<(std::ostream &str, const ImageErrorDetails &v);

  /*!
   * \brief
   * An ImageStreamListener is the pair of callbacks an
   * ImageStreamCompleter calls when an image becomes
   * available or when an error occurs.
   */
  class ImageStreamListener
  {
  public:
    /*!
     * Callback type for when an image becomes available;
     * the first argument is a clone owned by the callee,
     * the second argument is true when the callback is
     * made from within adding the listener.
     */
    typedef boost::function<void (const ImageInfo&, bool)> image_callback;

    /*!
     * Callback type for when an error occurs.
     */
    typedef boost::function<void (const ImageErrorDetails&)> error_callback;

    explicit
    ImageStreamListener(const image_callback &on_image,
                        const error_callback &on_error = error_callback()):
      m_on_image(on_image),
      m_on_error(on_error)
    {}

    const image_callback&
    on_image(void) const
    {
      return m_on_image;
    }

    const error_callback&
    on_error(void) const
    {
      return m_on_error;
    }

    /*!
     * Returns true if on_error() is set.
     */
    bool
    handles_errors(void) const
    {
      return !m_on_error.empty();
    }

  private:
    image_callback m_on_image;
    error_callback m_on_error;
  };

  /*!
   * \brief
   * An ImageStreamCompleter produces images, or errors, for
   * the listeners added to it. The image last produced and
   * the error last reported are retained so that listeners
   * added later receive them immediately.
   */
  class ImageStreamCompleter:
    public reference_counted<ImageStreamCompleter>::concurrent
  {
  public:
    /*!
     * Identifies a listener added with add_listener().
     */
    typedef unsigned int listener_id;

    virtual
    ~ImageStreamCompleter();

    /*!
     * Add a listener. If an image is present, the listener
     * is called before add_listener() returns with a clone
     * of it and synchronous_call as true. If an error has
     * been reported and the listener handles errors, its
     * error callback is called before add_listener() returns.
     * Returns an ID with which to remove the listener.
     */
    listener_id
    add_listener(const ImageStreamListener &listener);

    /*!
     * Remove a listener; removing the last listener calls
     * on_last_listener_removed(). Removing an ID that is not
     * present is logged and ignored.
     */
    void
    remove_listener(listener_id id);

    /*!
     * Returns the number of listeners.
     */
    unsigned int
    number_listeners(void) const;

    /*!
     * Returns true if there is at least one listener.
     */
    bool
    has_listeners(void) const
    {
      return number_listeners() > 0u;
    }

    /*!
     * Returns the image last produced; the returned value
     * has a null image if no image was produced yet.
     */
    const ImageInfo&
    current_image(void) const;

    /*!
     * Returns the error last reported, if any.
     */
    const boost::optional<ImageErrorDetails>&
    current_error(void) const;

  protected:
    ImageStreamCompleter(void);

    /*!
     * To be called by a derived class to produce an image.
     * The previous image is disposed; each listener is
     * called with its own clone of image and synchronous_call
     * as false.
     */
    void
    set_image(const ImageInfo &image);

    /*!
     * To be called by a derived class to report an error.
     * The error callback of each listener that handles
     * errors is called; if no listener handles errors the
     * error is logged.
     */
    void
    report_error(const ImageErrorDetails &error);

    /*!
     * Called when the first listener is added, default
     * implementation does nothing.
     */
    virtual
    void
    on_first_listener_added(void)
    {}

    /*!
     * Called when the last listener is removed, default
     * implementation does nothing.
     */
    virtual
    void
    on_last_listener_removed(void)
    {}

  private:
    void *m_d;
  };

  /*!
   * \brief
   * A OneFrameImageStreamCompleter produces a single
   * image that is available from creation.
   */
  class OneFrameImageStreamCompleter:public ImageStreamCompleter
  {
  public:
    explicit
    OneFrameImageStreamCompleter(const ImageInfo &image);
  };

  /*!
   * \brief
   * A DeferredImageStreamCompleter is completed, or failed,
   * later by whoever holds it.
   */
  class DeferredImageStreamCompleter:public ImageStreamCompleter
  {
  public:
    DeferredImageStreamCompleter(void)
    {}

    /*!
     * Produce an image, see ImageStreamCompleter::set_image().
     */
    void
    complete(const ImageInfo &image)
    {
      set_image(image);
    }

    /*!
     * Report an error, see ImageStreamCompleter::report_error().
     */
    void
    fail(const ImageErrorDetails &error)
    {
      report_error(error);
    }
  };

  /*!
   * \brief
   * A MultiFrameImageStreamCompleter produces the frames of an
   * animation. Time is advanced by the caller with advance();
   * frames are only produced while there are listeners.
   */
  class MultiFrameImageStreamCompleter:public ImageStreamCompleter
  {
  public:
    /*!
     * \brief
     * A frame of an animation.
     */
    class Frame
    {
    public:
      explicit
      Frame(const reference_counted_ptr<const Bitmap> &bitmap =
            reference_counted_ptr<const Bitmap>(),
            int duration_ms = 0):
        m_bitmap(bitmap),
        m_duration_ms(duration_ms)
      {}

      /*!
       * Pixels of the frame.
       */
      reference_counted_ptr<const Bitmap> m_bitmap;

      /*!
       * How long the frame is shown, in milliseconds;
       * values less than 1 are treated as 1.
       */
      int m_duration_ms;
    };

    /*!
     * Ctor.
     * \param frames frames of the animation
     * \param repetition_count number of times the animation
     *                         is repeated after its first
     *                         play, -1 means forever
     * \param scale scale of each produced ImageInfo
     * \param debug_label label of each produced ImageInfo
     */
    MultiFrameImageStreamCompleter(const std::vector<Frame> &frames,
                                   int repetition_count,
                                   float scale = 1.0f,
                                   const std::string &debug_label = std::string());

    /*!
     * Advance the animation. If there are no listeners nothing
     * happens. The first call with listeners produces the first
     * frame; later calls add elapsed_ms to the time spent in the
     * current frame and produce the frame reached, if different.
     * Once the repetitions are exhausted the animation stays on
     * its last frame.
     * \param elapsed_ms time elapsed since the previous call
     */
    void
    advance(int elapsed_ms);

    /*!
     * Returns the number of frames.
     */
    unsigned int
    frame_count(void) const
    {
      return m_frames.size();
    }

    int
    repetition_count(void) const
    {
      return m_repetition_count;
    }

    /*!
     * Returns the index of the frame last produced,
     * -1 if none was produced yet.
     */
    int
    current_frame(void) const
    {
      return m_current_frame;
    }

    /*!
     * Returns true if the animation has stopped.
     */
    bool
    finished(void) const
    {
      return m_finished;
    }

  private:
    void
    emit_frame(unsigned int frame);

    std::vector<Frame> m_frames;
    int m_repetition_count;
    float m_scale;
    std::string m_debug_label;
    int m_current_frame;
    int64_t m_time_in_frame;
    int64_t m_loop_duration_ms;
    int m_completed_loops;
    bool m_finished;
  };

  /*!
   * \brief
   * An ImageStream is the handle returned when resolving
   * an image. Its completer may be set after it is returned;
   * listeners added before then are added to the completer
   * when it is set.
   */
  class ImageStream:
    public reference_counted<ImageStream>::concurrent
  {
  public:
    /*!
     * \brief
     * A Connection represents a listener added to an
     * ImageStream, disconnect() removes the listener.
     */
    class Connection
    {
    public:
      Connection(void):
        m_id(0)
      {}

      /*!
       * Remove the listener; does nothing if already
       * disconnected.
       */
      void
      disconnect(void);

      /*!
       * Returns true if the listener is still added.
       */
      bool
      connected(void) const;

      /*!
       * Returns the stream to which the listener was
       * added, null if disconnected.
       */
      const reference_counted_ptr<ImageStream>&
      stream(void) const
      {
        return m_stream;
      }

    private:
      friend class ImageStream;

      Connection(const reference_counted_ptr<ImageStream> &stream, unsigned int id):
        m_stream(stream),
        m_id(id)
      {}

      reference_counted_ptr<ImageStream> m_stream;
      unsigned int m_id;
    };

    /*!
     * Create an ImageStream without a completer.
     */
    static
    reference_counted_ptr<ImageStream>
    create(void);

    ~ImageStream();

    /*!
     * Set the completer. Listeners already added are
     * added to the completer in the order they were
     * added. An ImageStream can only have its completer
     * set once; later calls are logged and ignored.
     */
    void
    set_completer(const reference_counted_ptr<ImageStreamCompleter> &completer);

    /*!
     * Returns the completer, null if not yet set.
     */
    const reference_counted_ptr<ImageStreamCompleter>&
    completer(void) const;

    /*!
     * Returns a value identifying the source of images;
     * it is the completer once set and the ImageStream
     * before.
     */
    const void*
    key(void) const;

    /*!
     * Add a listener.
     */
    Connection
    add_listener(const ImageStreamListener &listener);

  private:
    ImageStream(void);

    void
    remove_listener(unsigned int id);

    bool
    has_listener(unsigned int id) const;

    void *m_d;
  };

  std::ostream&
  operator<<(std::ostream &str, const ImageStream &v);

/*! @} */
}
