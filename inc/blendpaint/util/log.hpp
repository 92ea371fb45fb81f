/*!
 * \file log.hpp
 * \brief file log.hpp
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


#pragma once

#include <iosfwd>
#include <sstream>
#include <blendpaint/util/util.hpp>

namespace blendpaint
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * Enumeration of the severity of a logged message.
   */
  enum log_level_t
    {
      /*!
       * Something unexpected happened but the operation
       * still produced a result.
       */
      log_warning,

      /*!
       * The operation failed.
       */
      log_error,
    };

  /*!
   * Returns a string for a log_level_t value.
   */
  c_string
  label(enum log_level_t v);

  /*!
   * Write a message to the log stream as
   * \code
   * [file,line] level: text
   * \endcode
   * followed by a newline.
   */
  void
  log_message(enum log_level_t level, c_string file, int line, c_string text);

  /*!
   * Set the stream to which log_message() writes. Passing
   * nullptr restores the default of std::cerr. Returns the
   * previous stream.
   */
  std::ostream*
  set_log_stream(std::ostream *ostr);

/*! @} */
}

/*!\def BLENDPAINTlog_warning
 * Log a warning; the argument is a stream expression, i.e.
 * \code
 * BLENDPAINTlog_warning("bad value " << v);
 * \endcode
 */
#define BLENDPAINTlog_warning(X) do {                                   \
    std::ostringstream blendpaint_log_str;                              \
    blendpaint_log_str << X;                                            \
    blendpaint::log_message(blendpaint::log_warning, __FILE__, __LINE__, \
                            blendpaint_log_str.str().c_str());          \
  } while(0)

/*!\def BLENDPAINTlog_error
 * Log an error; the argument is a stream expression.
 */
#define BLENDPAINTlog_error(X) do {                                     \
    std::ostringstream blendpaint_log_str;                              \
    blendpaint_log_str << X;                                            \
    blendpaint::log_message(blendpaint::log_error, __FILE__, __LINE__,  \
                            blendpaint_log_str.str().c_str());          \
  } while(0)
