/*!
 * \file log.cpp
 * \brief file log.cpp
 *
 * Copyright 2018 by Intel.
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
#include <mutex>
#include <blendpaint/util/log.hpp>

namespace
{
  class LogState
  {
  public:
    LogState(void):
      m_stream(&std::cerr)
    {}

    std::mutex m_mutex;
    std::ostream *m_stream;
  };

  LogState&
  log_state(void)
  {
    static LogState R;
    return R;
  }
}

blendpaint::c_string
blendpaint::
label(enum log_level_t v)
{
  switch (v)
    {
    case log_warning:
      return "warning";
    case log_error:
      return "error";
    }
  return "unknown";
}

void
blendpaint::
log_message(enum log_level_t level, c_string file, int line, c_string text)
{
  LogState &st(log_state());
  std::lock_guard<std::mutex> M(st.m_mutex);

  *st.m_stream << "[" << file << "," << line << "] "
               << label(level) << ": " << text << "\n";
  st.m_stream->flush();
}

std::ostream*
blendpaint::
set_log_stream(std::ostream *ostr)
{
  LogState &st(log_state());
  std::lock_guard<std::mutex> M(st.m_mutex);
  std::ostream *prev(st.m_stream);

  st.m_stream = (ostr) ? ostr : &std::cerr;
  return prev;
}
