/*!
 * \file util.hpp
 * \brief file util.hpp
 *
 * Adapted from: WRATHUtil.hpp and type_tag.hpp of WRATH:
 *
 * Copyright 2013 by Nomovok Ltd.
 * Contact: info@nomovok.com
 * This Source Code Form is subject to the
 * terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with
 * this file, You can obtain one at
 * http://mozilla.org/MPL/2.0/.
 *
 * \author Kevin Rogovin <kevin.rogovin@nomovok.com>
 * \author Kevin Rogovin <kevin.rogovin@intel.com>
 *
 */


#pragma once

#include <stdint.h>
#include <stddef.h>

/*!
 * All functionality of BlendPaint is in the namespace blendpaint.
 */
namespace blendpaint
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * Typedef for a C-string.
   */
  typedef const char *c_string;

  /*!
   * Enumeration for simple return codes for functions
   * for success or failure.
   */
  enum return_code
    {
      /*!
       * Routine failed
       */
      routine_fail,

      /*!
       * Routine suceeded
       */
      routine_success
    };

  /*!
   * Class for which copy ctor and assignment operator
   * are private functions.
   */
  class noncopyable
  {
  public:
    noncopyable(void)
    {}

  private:
    noncopyable(const noncopyable &obj);

    noncopyable&
    operator=(const noncopyable &rhs);
  };

  /*!
   * Private function used by the assert macros, prints
   * the message with the file and line and, under
   * debug builds, aborts.
   * \param str message to print
   * \param file file of the failed assertion
   * \param line line of the failed assertion
   */
  void
  assert_fail(c_string str, c_string file, int line);

/*! @} */
}

/*!\addtogroup Utility
 * @{
 */

/*!\def BLENDPAINTunused
 * Macro to stop the compiler from reporting
 * an argument as unused. Typically used on
 * those arguments used in assert invocation
 * but otherwise unused.
 * \param X expression of which to ignore the value
 */
#define BLENDPAINTunused(X) do { (void)(X); } while(0)

/*!\def BLENDPAINTstatic_assert
 * Conveniance for static_assert with the
 * expression as the message.
 * \param X compile time condition
 */
#define BLENDPAINTstatic_assert(X) static_assert(X, #X)

#ifdef BLENDPAINT_DEBUG

/*!\def BLENDPAINTassert
 * If BLENDPAINT_DEBUG is defined, checks if the statement
 * is true and if it is not true prints to std::cerr and
 * then aborts. If BLENDPAINT_DEBUG is not defined, then
 * macro is empty (and thus the condition is not evaluated).
 */
#define BLENDPAINTassert(X) do {                                 \
    if (!(X))                                                    \
      {                                                          \
        blendpaint::assert_fail("Assertion '" #X "' failed",     \
                                __FILE__, __LINE__);             \
      }                                                          \
  } while(0)

/*!\def BLENDPAINTmessaged_assert
 * If BLENDPAINT_DEBUG is defined, checks if the statement
 * is true and if it is not true prints to std::cerr the
 * passed message and then aborts. If BLENDPAINT_DEBUG is
 * not defined, then macro is empty.
 */
#define BLENDPAINTmessaged_assert(X, Y) do {                     \
    if (!(X))                                                    \
      {                                                          \
        blendpaint::assert_fail(Y, __FILE__, __LINE__);          \
      }                                                          \
  } while(0)

#else

#define BLENDPAINTassert(X)
#define BLENDPAINTmessaged_assert(X, Y)

#endif

/*! @} */
