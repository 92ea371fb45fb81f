/*!
 * \file matrix.hpp
 * \brief file matrix.hpp
 *
 * Adapted from: matrixGL.hpp of WRATH:
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

#include <blendpaint/util/vecN.hpp>
#include <blendpaint/util/math.hpp>

namespace blendpaint
{
/*!\addtogroup Utility
 * @{
 */

/*!
 * \brief
 * A 3x3 matrix used to hold a 2D transformation, i.e.
 * a point (x, y) is transformed as
 * \code
 * p = M * vec3(x, y, 1)
 * result = p.xy / p.z
 * \endcode
 * The operator() accesses an element as matrix(row, col).
 * Internally the data is packed column-major, i.e.
 * \code
 * matrix(row, col) <--> raw_data()[row + 3 * col]
 * \endcode
 * \tparam T matrix entry type
 */
template<typename T>
class matrix3x3
{
public:
  /*!
   * Ctor. Initializes as the identity matrix.
   */
  matrix3x3(void)
  {
    reset();
  }

  /*!
   * Ctor. Initializes as an affine transformation from
   * the linear part (a, b; c, d) and translation (tx, ty).
   */
  matrix3x3(T a, T b, T c, T d, T tx, T ty)
  {
    reset();
    operator()(0, 0) = a;
    operator()(0, 1) = b;
    operator()(1, 0) = c;
    operator()(1, 1) = d;
    operator()(0, 2) = tx;
    operator()(1, 2) = ty;
  }

  /*!
   * Set matrix as identity.
   */
  void
  reset(void)
  {
    for(unsigned int col = 0; col < 3; ++col)
      {
        for(unsigned int row = 0; row < 3; ++row)
          {
            m_data[row + 3 * col] = (row == col) ? T(1) : T(0);
          }
      }
  }

  T&
  operator()(unsigned int row, unsigned int col)
  {
    BLENDPAINTassert(row < 3 && col < 3);
    return m_data[row + 3 * col];
  }

  const T&
  operator()(unsigned int row, unsigned int col) const
  {
    BLENDPAINTassert(row < 3 && col < 3);
    return m_data[row + 3 * col];
  }

  /*!
   * Returns the underlying column-major data.
   */
  const vecN<T, 9>&
  raw_data(void) const
  {
    return m_data;
  }

  /*!
   * Matrix-matrix multiplication.
   */
  matrix3x3
  operator*(const matrix3x3 &rhs) const
  {
    matrix3x3 retval;
    for(unsigned int row = 0; row < 3; ++row)
      {
        for(unsigned int col = 0; col < 3; ++col)
          {
            T v(0);
            for(unsigned int k = 0; k < 3; ++k)
              {
                v += operator()(row, k) * rhs(k, col);
              }
            retval(row, col) = v;
          }
      }
    return retval;
  }

  /*!
   * Matrix-vector multiplication.
   */
  vecN<T, 3>
  operator*(const vecN<T, 3> &in) const
  {
    vecN<T, 3> retval;
    for(unsigned int row = 0; row < 3; ++row)
      {
        retval[row] = operator()(row, 0) * in[0]
          + operator()(row, 1) * in[1]
          + operator()(row, 2) * in[2];
      }
    return retval;
  }

  bool
  operator==(const matrix3x3 &rhs) const
  {
    return m_data == rhs.m_data;
  }

  bool
  operator!=(const matrix3x3 &rhs) const
  {
    return m_data != rhs.m_data;
  }

  /*!
   * Apply the matrix to a point, performing the
   * projective divide.
   * \param p point to transform
   */
  vecN<T, 2>
  apply_to_point(const vecN<T, 2> &p) const
  {
    vecN<T, 3> q;

    q = operator*(vecN<T, 3>(p.x(), p.y(), T(1)));
    if (q.z() != T(1) && q.z() != T(0))
      {
        return vecN<T, 2>(q.x() / q.z(), q.y() / q.z());
      }
    return vecN<T, 2>(q.x(), q.y());
  }

  /*!
   * Apply the linear part of the matrix to a direction,
   * i.e. ignoring the translation.
   * \param v direction to transform
   */
  vecN<T, 2>
  apply_to_direction(const vecN<T, 2> &v) const
  {
    return vecN<T, 2>(operator()(0, 0) * v.x() + operator()(0, 1) * v.y(),
                      operator()(1, 0) * v.x() + operator()(1, 1) * v.y());
  }

  /*!
   * Concat this matrix with a translation, i.e.
   * this = this * Translate(x, y).
   */
  matrix3x3&
  translate(T x, T y)
  {
    operator()(0, 2) += operator()(0, 0) * x + operator()(0, 1) * y;
    operator()(1, 2) += operator()(1, 0) * x + operator()(1, 1) * y;
    operator()(2, 2) += operator()(2, 0) * x + operator()(2, 1) * y;
    return *this;
  }

  /*!
   * Provided as a conveniance, equivalent to
   * \code
   * translate(p.x(), p.y());
   * \endcode
   */
  matrix3x3&
  translate(const vecN<T, 2> &p)
  {
    return translate(p.x(), p.y());
  }

  /*!
   * Concat this matrix with a non-uniform scaling, i.e.
   * this = this * Scale(sx, sy).
   */
  matrix3x3&
  shear(T sx, T sy)
  {
    for(unsigned int row = 0; row < 3; ++row)
      {
        operator()(row, 0) *= sx;
        operator()(row, 1) *= sy;
      }
    return *this;
  }

  /*!
   * Concat this matrix with a uniform scaling, equivalent
   * to shear(s, s).
   */
  matrix3x3&
  scale(T s)
  {
    return shear(s, s);
  }

  /*!
   * Returns the determinant of the matrix.
   */
  T
  determinate(void) const
  {
    const matrix3x3 &m(*this);
    return m(0, 0) * (m(1, 1) * m(2, 2) - m(1, 2) * m(2, 1))
      - m(0, 1) * (m(1, 0) * m(2, 2) - m(1, 2) * m(2, 0))
      + m(0, 2) * (m(1, 0) * m(2, 1) - m(1, 1) * m(2, 0));
  }

  /*!
   * Compute the inverse of this matrix. Returns
   * routine_fail if the matrix is singular.
   * \param result location to which to write the inverse
   */
  enum return_code
  inverse(matrix3x3 &result) const
  {
    const matrix3x3 &m(*this);
    T det;

    det = determinate();
    if (det == T(0))
      {
        return routine_fail;
      }

    result(0, 0) = (m(1, 1) * m(2, 2) - m(1, 2) * m(2, 1)) / det;
    result(0, 1) = (m(0, 2) * m(2, 1) - m(0, 1) * m(2, 2)) / det;
    result(0, 2) = (m(0, 1) * m(1, 2) - m(0, 2) * m(1, 1)) / det;
    result(1, 0) = (m(1, 2) * m(2, 0) - m(1, 0) * m(2, 2)) / det;
    result(1, 1) = (m(0, 0) * m(2, 2) - m(0, 2) * m(2, 0)) / det;
    result(1, 2) = (m(0, 2) * m(1, 0) - m(0, 0) * m(1, 2)) / det;
    result(2, 0) = (m(1, 0) * m(2, 1) - m(1, 1) * m(2, 0)) / det;
    result(2, 1) = (m(0, 1) * m(2, 0) - m(0, 0) * m(2, 1)) / det;
    result(2, 2) = (m(0, 0) * m(1, 1) - m(0, 1) * m(1, 0)) / det;
    return routine_success;
  }

private:
  vecN<T, 9> m_data;
};

/*!
 * Convenience typedef to matrix3x3\<float\>
 */
typedef matrix3x3<float> float3x3;

/*! @} */
}
