/*!
 * \file simple_time.hpp
 * \brief file simple_time.hpp
 *
 * Adapted from: WRATHTime.hpp of WRATH:
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

#include <chrono>

#include <stdint.h>

/*
  Milliseconds elapsed since construction or the last restart().
 */
class simple_time
{
public:
  simple_time(void):
    m_start_time(clock::now())
  {}

  int32_t
  elapsed(void) const
  {
    return milliseconds_since(m_start_time);
  }

  int32_t
  restart(void)
  {
    clock::time_point start(m_start_time);

    m_start_time = clock::now();
    return milliseconds_since(start);
  }

private:
  typedef std::chrono::steady_clock clock;

  static
  int32_t
  milliseconds_since(const clock::time_point &begin)
  {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - begin).count();
  }

  clock::time_point m_start_time;
};
