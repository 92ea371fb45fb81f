/*!
 * \file vecN.hpp
 * \brief file vecN.hpp
 *
 * Adapted from: vecN.hpp of WRATH:
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

#include <blendpaint/util/util.hpp>
#include <blendpaint/util/math.hpp>

namespace blendpaint
{
/*!\addtogroup Utility
 * @{
 */

/*!
 * \brief
 * vecN is a simple static array class with no virtual
 * functions and no memory overhead. It is used for
 * points, sizes, offsets and colors.
 *
 * \param T typename with a constructor that takes no arguments.
 * \param N size of array
 */
template<typename T, size_t N>
class vecN
{
public:
  /*!
   * \brief
   * STL compliant typedef
   */
  typedef T value_type;

  /*!
   * \brief
   * STL compliant typedef
   */
  typedef size_t size_type;

  /*!
   * Ctor, no intiliaztion on POD types.
   */
  vecN(void)
  {}

  /*!
   * Ctor, sets all elements to the same value.
   * \param value value to which to set all elements
   */
  explicit
  vecN(const T &value)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] = value;
      }
  }

  /*!
   * Copy ctor from an array of a different type,
   * each element is converted with a static_cast.
   * \param obj values from which to copy
   */
  template<typename S>
  explicit
  vecN(const vecN<S, N> &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] = static_cast<T>(obj[i]);
      }
  }

  /*!
   * Ctor for arrays of size 2.
   */
  vecN(const T &px, const T &py)
  {
    BLENDPAINTstatic_assert(N == 2);
    m_data[0] = px;
    m_data[1] = py;
  }

  /*!
   * Ctor for arrays of size 3.
   */
  vecN(const T &px, const T &py, const T &pz)
  {
    BLENDPAINTstatic_assert(N == 3);
    m_data[0] = px;
    m_data[1] = py;
    m_data[2] = pz;
  }

  /*!
   * Ctor for arrays of size 4.
   */
  vecN(const T &px, const T &py, const T &pz, const T &pw)
  {
    BLENDPAINTstatic_assert(N == 4);
    m_data[0] = px;
    m_data[1] = py;
    m_data[2] = pz;
    m_data[3] = pw;
  }

  /*!
   * Ctor from an array of size N - 1 and the last value.
   * \param p gives values for array indices 0 to N-2 inclusive
   * \param d gives value for array index N-1
   */
  vecN(const vecN<T, N - 1> &p, const T &d)
  {
    for(size_type i = 0; i < N - 1; ++i)
      {
        m_data[i] = p[i];
      }
    m_data[N - 1] = d;
  }

  /*!
   * Returns a C-style pointer to the array.
   */
  T*
  c_ptr(void) { return m_data; }

  /*!
   * Returns a constant C-style pointer to the array.
   */
  const T*
  c_ptr(void) const { return m_data; }

  const T&
  operator[](size_type j) const
  {
    BLENDPAINTassert(j < N);
    return m_data[j];
  }

  T&
  operator[](size_type j)
  {
    BLENDPAINTassert(j < N);
    return m_data[j];
  }

  T&
  x(void) { return m_data[0]; }

  T&
  y(void) { BLENDPAINTstatic_assert(N >= 2); return m_data[1]; }

  T&
  z(void) { BLENDPAINTstatic_assert(N >= 3); return m_data[2]; }

  T&
  w(void) { BLENDPAINTstatic_assert(N >= 4); return m_data[3]; }

  const T&
  x(void) const { return m_data[0]; }

  const T&
  y(void) const { BLENDPAINTstatic_assert(N >= 2); return m_data[1]; }

  const T&
  z(void) const { BLENDPAINTstatic_assert(N >= 3); return m_data[2]; }

  const T&
  w(void) const { BLENDPAINTstatic_assert(N >= 4); return m_data[3]; }

  /*!
   * Returns the size of the array.
   */
  static
  size_type
  size(void)
  {
    return N;
  }

  /*!
   * Set all values of the array.
   * \param v value to which to set all elements
   */
  vecN&
  fill(const T &v)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] = v;
      }
    return *this;
  }

  /*!
   * Component-wise negation operator.
   */
  vecN
  operator-(void) const
  {
    vecN retval;
    for(size_type i = 0; i < N; ++i)
      {
        retval[i] = -m_data[i];
      }
    return retval;
  }

  vecN
  operator+(const vecN &obj) const
  {
    vecN retval(*this);
    retval += obj;
    return retval;
  }

  vecN
  operator-(const vecN &obj) const
  {
    vecN retval(*this);
    retval -= obj;
    return retval;
  }

  /*!
   * Component-wise multiplication operator.
   */
  vecN
  operator*(const vecN &obj) const
  {
    vecN retval(*this);
    retval *= obj;
    return retval;
  }

  /*!
   * Component-wise division operator.
   */
  vecN
  operator/(const vecN &obj) const
  {
    vecN retval(*this);
    retval /= obj;
    return retval;
  }

  vecN
  operator*(const T &obj) const
  {
    vecN retval(*this);
    retval *= obj;
    return retval;
  }

  vecN
  operator/(const T &obj) const
  {
    vecN retval(*this);
    retval /= obj;
    return retval;
  }

  vecN&
  operator+=(const vecN &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] += obj[i];
      }
    return *this;
  }

  vecN&
  operator-=(const vecN &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] -= obj[i];
      }
    return *this;
  }

  vecN&
  operator*=(const vecN &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] *= obj[i];
      }
    return *this;
  }

  vecN&
  operator/=(const vecN &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] /= obj[i];
      }
    return *this;
  }

  vecN&
  operator*=(const T &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] *= obj;
      }
    return *this;
  }

  vecN&
  operator/=(const T &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] /= obj;
      }
    return *this;
  }

  /*!
   * Equality operator, two arrays are equal
   * if each of their elements are equal.
   */
  bool
  operator==(const vecN &obj) const
  {
    for(size_type i = 0; i < N; ++i)
      {
        if (!(m_data[i] == obj[i]))
          {
            return false;
          }
      }
    return true;
  }

  bool
  operator!=(const vecN &obj) const
  {
    return !operator==(obj);
  }

  /*!
   * Returns the dot product of this array with another.
   * \param obj array with which to take the dot product
   */
  T
  dot(const vecN &obj) const
  {
    T retval(m_data[0] * obj[0]);
    for(size_type i = 1; i < N; ++i)
      {
        retval += m_data[i] * obj[i];
      }
    return retval;
  }

  /*!
   * Returns the magnitude squared of the array.
   */
  T
  magnitudeSq(void) const
  {
    return dot(*this);
  }

  /*!
   * Returns the component-wise minimum of this array
   * with another.
   */
  vecN
  min_with(const vecN &obj) const
  {
    vecN retval;
    for(size_type i = 0; i < N; ++i)
      {
        retval[i] = t_min(m_data[i], obj[i]);
      }
    return retval;
  }

  /*!
   * Returns the component-wise maximum of this array
   * with another.
   */
  vecN
  max_with(const vecN &obj) const
  {
    vecN retval;
    for(size_type i = 0; i < N; ++i)
      {
        retval[i] = t_max(m_data[i], obj[i]);
      }
    return retval;
  }

private:
  T m_data[N];
};

/*!
 * Scalar times vector, equivalent to v * s.
 */
template<typename T, size_t N>
inline
vecN<T, N>
operator*(const T &s, const vecN<T, N> &v)
{
  return v * s;
}

/*!
 * Convenience function, equivalent to a.dot(b).
 */
template<typename T, size_t N>
inline
T
dot(const vecN<T, N> &a, const vecN<T, N> &b)
{
  return a.dot(b);
}

/*!
 * Convenience typedef to vecN<float, 2>
 */
typedef vecN<float, 2> vec2;

/*!
 * Convenience typedef to vecN<float, 3>
 */
typedef vecN<float, 3> vec3;

/*!
 * Convenience typedef to vecN<float, 4>
 */
typedef vecN<float, 4> vec4;

/*!
 * Convenience typedef to vecN<int, 2>
 */
typedef vecN<int, 2> ivec2;

/*!
 * Convenience typedef to vecN<uint8_t, 4>
 */
typedef vecN<uint8_t, 4> u8vec4;

/*! @} */
}
