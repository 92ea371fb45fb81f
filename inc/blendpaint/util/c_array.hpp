/*!
 * \file c_array.hpp
 * \brief file c_array.hpp
 *
 * Adapted from: c_array.hpp of WRATH:
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

#include <vector>
#include <blendpaint/util/util.hpp>
#include <blendpaint/util/vecN.hpp>

namespace blendpaint
{
/*!\addtogroup Utility
 * @{
 */

/*!
 * \brief
 * A c_array is a wrapper over a C pointer with a size
 * parameter to facilitate bounds checking and provide
 * an STL-like iterator interface. A c_array does not
 * own the memory it points to.
 */
template<typename T>
class c_array
{
public:
  typedef T* pointer;
  typedef T& reference;
  typedef T value_type;
  typedef size_t size_type;
  typedef ptrdiff_t difference_type;
  typedef pointer iterator;

  /*!
   * Default ctor, initializing the pointer as nullptr
   * with size 0.
   */
  c_array(void):
    m_size(0),
    m_ptr(nullptr)
  {}

  /*!
   * Ctor initializing the pointer and size
   * \param pptr pointer value
   * \param sz size, must be no more than the number of elements
   *           that pptr points to.
   */
  template<typename U>
  c_array(U *pptr, size_type sz):
    m_size(sz),
    m_ptr(pptr)
  {
    BLENDPAINTstatic_assert(sizeof(U) == sizeof(T));
  }

  /*!
   * Ctor from a vecN, size is the size of the vecN
   */
  template<typename U, size_t N>
  c_array(const vecN<U, N> &pptr):
    m_size(N),
    m_ptr(pptr.c_ptr())
  {
    BLENDPAINTstatic_assert(sizeof(U) == sizeof(T));
  }

  /*!
   * Ctor from a std::vector; the c_array is invalidated
   * by any operation that reallocates the vector.
   */
  template<typename U>
  c_array(const std::vector<U> &v):
    m_size(v.size()),
    m_ptr(v.empty() ? nullptr : &v[0])
  {
    BLENDPAINTstatic_assert(sizeof(U) == sizeof(T));
  }

  /*!
   * Ctor from a non-const std::vector.
   */
  template<typename U>
  c_array(std::vector<U> &v):
    m_size(v.size()),
    m_ptr(v.empty() ? nullptr : &v[0])
  {
    BLENDPAINTstatic_assert(sizeof(U) == sizeof(T));
  }

  /*!
   * Ctor from another c_array object.
   */
  template<typename U>
  c_array(const c_array<U> &obj):
    m_size(obj.size()),
    m_ptr(obj.c_ptr())
  {
    BLENDPAINTstatic_assert(sizeof(U) == sizeof(T));
  }

  /*!
   * Pointer of the c_array.
   */
  T*
  c_ptr(void) const
  {
    return m_ptr;
  }

  /*!
   * Access named element of c_array, under
   * debug build also performs bounds checking.
   */
  reference
  operator[](size_type j) const
  {
    BLENDPAINTassert(c_ptr() != nullptr);
    BLENDPAINTassert(j < m_size);
    return c_ptr()[j];
  }

  bool
  empty(void) const
  {
    return m_size == 0;
  }

  size_type
  size(void) const
  {
    return m_size;
  }

  iterator
  begin(void) const
  {
    return iterator(c_ptr());
  }

  iterator
  end(void) const
  {
    return iterator(c_ptr() + static_cast<difference_type>(size()));
  }

  /*!
   * Returns a sub-array
   * \param pos position of returned sub-array to start
   * \param length length of sub array to return
   */
  c_array
  sub_array(size_type pos, size_type length) const
  {
    BLENDPAINTassert(pos + length <= m_size);
    return c_array(m_ptr + pos, length);
  }

private:
  size_type m_size;
  T *m_ptr;
};

/*! @} */
}
