/*!
 * \file image_stream.cpp
 * \brief file image_stream.cpp
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

#include <iostream>
#include <map>
#include <utility>
#include <boost/signals2.hpp>
#include <boost/bind/bind.hpp>
#include <blendpaint/image/image_stream.hpp>
#include <blendpaint/util/math.hpp>
#include <blendpaint/util/log.hpp>

namespace
{
  typedef boost::signals2::signal<void (const blendpaint::ImageInfo&, bool)> signal_image;
  typedef boost::signals2::signal<void (const blendpaint::ImageErrorDetails&)> signal_error;

  class ListenerConnections
  {
  public:
    boost::signals2::connection m_image;
    boost::signals2::connection m_error;
  };

  class ImageStreamCompleterPrivate
  {
  public:
    ImageStreamCompleterPrivate(void):
      m_next_id(0)
    {}

    signal_image m_image_signal;
    signal_error m_error_signal;
    std::map<blendpaint::ImageStreamCompleter::listener_id, ListenerConnections> m_listeners;
    blendpaint::ImageStreamCompleter::listener_id m_next_id;
    blendpaint::ImageInfo m_current_image;
    boost::optional<blendpaint::ImageErrorDetails> m_current_error;
  };

  class PendingListener
  {
  public:
    PendingListener(unsigned int id, const blendpaint::ImageStreamListener &L):
      m_id(id),
      m_listener(L)
    {}

    unsigned int m_id;
    blendpaint::ImageStreamListener m_listener;
  };

  class ImageStreamPrivate
  {
  public:
    enum
      {
        /* marks a listener whose completer ID is not yet known */
        adding_listener = ~0u
      };

    ImageStreamPrivate(void):
      m_next_id(1)
    {}

    blendpaint::reference_counted_ptr<blendpaint::ImageStreamCompleter> m_completer;

    /* listeners added before the completer is set */
    std::vector<PendingListener> m_pending;

    /* stream listener ID to completer listener ID */
    std::map<unsigned int, blendpaint::ImageStreamCompleter::listener_id> m_bound;

    unsigned int m_next_id;
  };

  void
  deliver_image(const blendpaint::ImageStreamListener::image_callback &cb,
                const blendpaint::ImageInfo &image, bool synchronous_call)
  {
    cb(image.clone(), synchronous_call);
  }
}

///////////////////////////////////////
// blendpaint::ImageErrorDetails methods
std::ostream&
blendpaint::
operator<<(std::ostream &str, const ImageErrorDetails &v)
{
  str << "[" << v.library() << "] " << v.exception();
  if (!v.context().empty())
    {
      str << " (" << v.context() << ")";
    }
  return str;
}

///////////////////////////////////////////
// blendpaint::ImageStreamCompleter methods
blendpaint::ImageStreamCompleter::
ImageStreamCompleter(void)
{
  m_d = BLENDPAINTnew ImageStreamCompleterPrivate();
}

blendpaint::ImageStreamCompleter::
~ImageStreamCompleter()
{
  ImageStreamCompleterPrivate *d;
  d = static_cast<ImageStreamCompleterPrivate*>(m_d);

  d->m_image_signal.disconnect_all_slots();
  d->m_error_signal.disconnect_all_slots();
  d->m_current_image.dispose();
  BLENDPAINTdelete(d);
  m_d = nullptr;
}

blendpaint::ImageStreamCompleter::listener_id
blendpaint::ImageStreamCompleter::
add_listener(const ImageStreamListener &listener)
{
  ImageStreamCompleterPrivate *d;
  d = static_cast<ImageStreamCompleterPrivate*>(m_d);

  listener_id id(d->m_next_id++);
  ListenerConnections &C(d->m_listeners[id]);

  C.m_image = d->m_image_signal.connect(boost::bind(&deliver_image, listener.on_image(),
                                                    boost::placeholders::_1,
                                                    boost::placeholders::_2));
  if (listener.handles_errors())
    {
      C.m_error = d->m_error_signal.connect(listener.on_error());
    }

  if (d->m_listeners.size() == 1)
    {
      on_first_listener_added();
    }

  if (d->m_current_image.image())
    {
      listener.on_image()(d->m_current_image.clone(), true);
    }

  if (d->m_current_error && listener.handles_errors())
    {
      listener.on_error()(*d->m_current_error);
    }

  return id;
}

void
blendpaint::ImageStreamCompleter::
remove_listener(listener_id id)
{
  ImageStreamCompleterPrivate *d;
  d = static_cast<ImageStreamCompleterPrivate*>(m_d);

  std::map<listener_id, ListenerConnections>::iterator iter;
  iter = d->m_listeners.find(id);
  if (iter == d->m_listeners.end())
    {
      BLENDPAINTlog_warning("ImageStreamCompleter::remove_listener: no listener with ID " << id);
      return;
    }

  iter->second.m_image.disconnect();
  iter->second.m_error.disconnect();
  d->m_listeners.erase(iter);

  if (d->m_listeners.empty())
    {
      on_last_listener_removed();
    }
}

unsigned int
blendpaint::ImageStreamCompleter::
number_listeners(void) const
{
  const ImageStreamCompleterPrivate *d;
  d = static_cast<const ImageStreamCompleterPrivate*>(m_d);
  return d->m_listeners.size();
}

const blendpaint::ImageInfo&
blendpaint::ImageStreamCompleter::
current_image(void) const
{
  const ImageStreamCompleterPrivate *d;
  d = static_cast<const ImageStreamCompleterPrivate*>(m_d);
  return d->m_current_image;
}

const boost::optional<blendpaint::ImageErrorDetails>&
blendpaint::ImageStreamCompleter::
current_error(void) const
{
  const ImageStreamCompleterPrivate *d;
  d = static_cast<const ImageStreamCompleterPrivate*>(m_d);
  return d->m_current_error;
}

void
blendpaint::ImageStreamCompleter::
set_image(const ImageInfo &image)
{
  ImageStreamCompleterPrivate *d;
  d = static_cast<ImageStreamCompleterPrivate*>(m_d);

  d->m_current_image.dispose();
  d->m_current_image = image;
  d->m_image_signal(d->m_current_image, false);
}

void
blendpaint::ImageStreamCompleter::
report_error(const ImageErrorDetails &error)
{
  ImageStreamCompleterPrivate *d;
  d = static_cast<ImageStreamCompleterPrivate*>(m_d);

  d->m_current_error = error;
  if (d->m_error_signal.empty())
    {
      BLENDPAINTlog_error("Unhandled image error: " << error);
    }
  else
    {
      d->m_error_signal(error);
    }
}

///////////////////////////////////////////////////
// blendpaint::OneFrameImageStreamCompleter methods
blendpaint::OneFrameImageStreamCompleter::
OneFrameImageStreamCompleter(const ImageInfo &image)
{
  set_image(image);
}

/////////////////////////////////////////////////////
// blendpaint::MultiFrameImageStreamCompleter methods
blendpaint::MultiFrameImageStreamCompleter::
MultiFrameImageStreamCompleter(const std::vector<Frame> &frames,
                               int repetition_count,
                               float scale,
                               const std::string &debug_label):
  m_repetition_count(repetition_count),
  m_scale(scale),
  m_debug_label(debug_label),
  m_current_frame(-1),
  m_time_in_frame(0),
  m_loop_duration_ms(0),
  m_completed_loops(0),
  m_finished(false)
{
  for (const Frame &f : frames)
    {
      if (f.m_bitmap)
        {
          m_frames.push_back(f);
          m_loop_duration_ms += t_max(1, f.m_duration_ms);
        }
      else
        {
          BLENDPAINTlog_warning("MultiFrameImageStreamCompleter: dropping frame without bitmap");
        }
    }
}

void
blendpaint::MultiFrameImageStreamCompleter::
emit_frame(unsigned int frame)
{
  m_current_frame = frame;
  set_image(ImageInfo(Image::create(m_frames[frame].m_bitmap), m_scale, m_debug_label));
}

void
blendpaint::MultiFrameImageStreamCompleter::
advance(int elapsed_ms)
{
  if (!has_listeners() || m_frames.empty() || m_finished)
    {
      return;
    }

  if (m_current_frame < 0)
    {
      m_time_in_frame = 0;
      m_finished = (m_frames.size() == 1);
      emit_frame(0);
      return;
    }

  unsigned int frame(m_current_frame);

  m_time_in_frame += static_cast<int64_t>(t_max(0, elapsed_ms));
  while (!m_finished && m_time_in_frame >= t_max(1, m_frames[frame].m_duration_ms))
    {
      m_time_in_frame -= t_max(1, m_frames[frame].m_duration_ms);
      if (frame + 1 < m_frames.size())
        {
          ++frame;
        }
      else if (m_repetition_count < 0)
        {
          frame = 0;
          m_time_in_frame %= m_loop_duration_ms;
        }
      else if (m_completed_loops < m_repetition_count)
        {
          int64_t loops;

          /* whole loops remaining in the elapsed time
           * are skipped without visiting each frame
           */
          ++m_completed_loops;
          frame = 0;
          loops = t_min(m_time_in_frame / m_loop_duration_ms,
                        static_cast<int64_t>(m_repetition_count - m_completed_loops));
          m_completed_loops += static_cast<int>(loops);
          m_time_in_frame -= loops * m_loop_duration_ms;
        }
      else
        {
          m_finished = true;
        }
    }

  if (static_cast<int>(frame) != m_current_frame)
    {
      emit_frame(frame);
    }
}

//////////////////////////////////////////////
// blendpaint::ImageStream::Connection methods
void
blendpaint::ImageStream::Connection::
disconnect(void)
{
  if (m_stream)
    {
      m_stream->remove_listener(m_id);
      m_stream.clear();
    }
}

bool
blendpaint::ImageStream::Connection::
connected(void) const
{
  return m_stream && m_stream->has_listener(m_id);
}

//////////////////////////////////
// blendpaint::ImageStream methods
blendpaint::ImageStream::
ImageStream(void)
{
  m_d = BLENDPAINTnew ImageStreamPrivate();
}

blendpaint::ImageStream::
~ImageStream()
{
  ImageStreamPrivate *d;
  d = static_cast<ImageStreamPrivate*>(m_d);

  if (d->m_completer)
    {
      for (const auto &b : d->m_bound)
        {
          if (b.second != ImageStreamPrivate::adding_listener)
            {
              d->m_completer->remove_listener(b.second);
            }
        }
    }
  BLENDPAINTdelete(d);
  m_d = nullptr;
}

blendpaint::reference_counted_ptr<blendpaint::ImageStream>
blendpaint::ImageStream::
create(void)
{
  return BLENDPAINTnew ImageStream();
}

void
blendpaint::ImageStream::
set_completer(const reference_counted_ptr<ImageStreamCompleter> &completer)
{
  ImageStreamPrivate *d;
  d = static_cast<ImageStreamPrivate*>(m_d);

  if (d->m_completer)
    {
      BLENDPAINTlog_warning("ImageStream::set_completer: completer already set");
      return;
    }

  if (!completer)
    {
      BLENDPAINTlog_warning("ImageStream::set_completer: null completer");
      return;
    }

  std::vector<PendingListener> pending;

  d->m_completer = completer;
  std::swap(pending, d->m_pending);
  for (const PendingListener &p : pending)
    {
      ImageStreamCompleter::listener_id cid;

      d->m_bound[p.m_id] = ImageStreamPrivate::adding_listener;
      cid = d->m_completer->add_listener(p.m_listener);
      if (d->m_bound.find(p.m_id) != d->m_bound.end())
        {
          d->m_bound[p.m_id] = cid;
        }
      else
        {
          d->m_completer->remove_listener(cid);
        }
    }
}

const blendpaint::reference_counted_ptr<blendpaint::ImageStreamCompleter>&
blendpaint::ImageStream::
completer(void) const
{
  const ImageStreamPrivate *d;
  d = static_cast<const ImageStreamPrivate*>(m_d);
  return d->m_completer;
}

const void*
blendpaint::ImageStream::
key(void) const
{
  const ImageStreamPrivate *d;
  d = static_cast<const ImageStreamPrivate*>(m_d);

  if (d->m_completer)
    {
      return d->m_completer.get();
    }
  return this;
}

blendpaint::ImageStream::Connection
blendpaint::ImageStream::
add_listener(const ImageStreamListener &listener)
{
  ImageStreamPrivate *d;
  d = static_cast<ImageStreamPrivate*>(m_d);

  unsigned int id(d->m_next_id++);
  Connection return_value(this, id);

  if (d->m_completer)
    {
      ImageStreamCompleter::listener_id cid;

      /* the completer may call the listener before add_listener()
       * returns and the listener may disconnect from within that call
       */
      d->m_bound[id] = ImageStreamPrivate::adding_listener;
      cid = d->m_completer->add_listener(listener);
      if (d->m_bound.find(id) != d->m_bound.end())
        {
          d->m_bound[id] = cid;
        }
      else
        {
          d->m_completer->remove_listener(cid);
        }
    }
  else
    {
      d->m_pending.push_back(PendingListener(id, listener));
    }
  return return_value;
}

void
blendpaint::ImageStream::
remove_listener(unsigned int id)
{
  ImageStreamPrivate *d;
  d = static_cast<ImageStreamPrivate*>(m_d);

  std::map<unsigned int, ImageStreamCompleter::listener_id>::iterator iter;
  iter = d->m_bound.find(id);
  if (iter != d->m_bound.end())
    {
      ImageStreamCompleter::listener_id cid(iter->second);

      d->m_bound.erase(iter);
      if (cid != ImageStreamPrivate::adding_listener)
        {
          d->m_completer->remove_listener(cid);
        }
      return;
    }

  for (std::vector<PendingListener>::iterator p = d->m_pending.begin();
       p != d->m_pending.end(); ++p)
    {
      if (p->m_id == id)
        {
          d->m_pending.erase(p);
          return;
        }
    }
}

bool
blendpaint::ImageStream::
has_listener(unsigned int id) const
{
  const ImageStreamPrivate *d;
  d = static_cast<const ImageStreamPrivate*>(m_d);

  if (d->m_bound.find(id) != d->m_bound.end())
    {
      return true;
    }

  for (const PendingListener &p : d->m_pending)
    {
      if (p.m_id == id)
        {
          return true;
        }
    }
  return false;
}

std::ostream&
blendpaint::
operator<<(std::ostream &str, const ImageStream &v)
{
  str << "ImageStream(";
  if (v.completer())
    {
      str << "completer = " << v.completer().get()
          << ", listeners = " << v.completer()->number_listeners();
    }
  else
    {
      str << "unresolved";
    }
  str << ")";
  return str;
}
