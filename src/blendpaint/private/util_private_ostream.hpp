/*!
 * \file util_private_ostream.hpp
 * \brief file util_private_ostream.hpp
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

#include <iostream>
#include <blendpaint/util/vecN.hpp>
#include <blendpaint/util/rect.hpp>

namespace blendpaint
{
  template<typename T, size_t N>
  std::ostream&
  operator<<(std::ostream &ostr, const vecN<T, N> &obj)
  {
    ostr << "(";
    for(size_t i = 0; i < N; ++i)
      {
        if (i != 0)
          {
            ostr << ", ";
          }
        ostr << obj[i];
      }
    ostr << ")";
    return ostr;
  }

  template<typename T>
  std::ostream&
  operator<<(std::ostream &ostr, const RectT<T> &obj)
  {
    ostr << "[" << obj.m_min_point << " -- " << obj.m_max_point << "]";
    return ostr;
  }
}
