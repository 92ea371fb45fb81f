/*!
 * \file math.hpp
 * \brief file math.hpp
 *
 * Copyright 2016 by Intel.
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

#include <math.h>
#include <stdlib.h>

namespace blendpaint
{
/*!\addtogroup Utility
 * @{
 */

/*!\def BLENDPAINT_PI
 * Macro giving the value of pi as a float
 */
#define BLENDPAINT_PI 3.14159265358979323846f

  /*!
   * Conveniance overload avoiding to rely on std::
   */
  template<typename T>
  inline
  const T&
  t_min(const T &a, const T &b)
  {
    return (a < b) ? a : b;
  }

  /*!
   * Conveniance overload avoiding to rely on std::
   */
  template<typename T>
  inline
  const T&
  t_max(const T &a, const T &b)
  {
    return (a < b) ? b : a;
  }

  /*!
   * Clamp a value to the range [lo, hi].
   */
  template<typename T>
  inline
  T
  t_clamp(const T &v, const T &lo, const T &hi)
  {
    return t_max(lo, t_min(v, hi));
  }

  /*!
   * Return the sign of a value.
   */
  template<typename T>
  inline
  T
  t_sign(const T &a)
  {
    return (a < T(0)) ? T(-1) : T(1);
  }

  inline
  float
  t_sin(float x) { return ::sinf(x); }

  inline
  float
  t_cos(float x) { return ::cosf(x); }

  inline
  float
  t_sqrt(float x) { return ::sqrtf(x); }

  inline
  float
  t_floor(float x) { return ::floorf(x); }

  inline
  float
  t_ceil(float x) { return ::ceilf(x); }

  inline
  float
  t_round(float x) { return ::roundf(x); }

  inline
  float
  t_pow(float x, float y) { return ::powf(x, y); }

  inline
  double
  t_floor(double x) { return ::floor(x); }

  inline
  double
  t_ceil(double x) { return ::ceil(x); }

  inline
  int
  t_abs(int x) { return ::abs(x); }

  inline
  float
  t_abs(float x) { return fabsf(x); }

  inline
  double
  t_abs(double x) { return fabs(x); }

/*! @} */
}
