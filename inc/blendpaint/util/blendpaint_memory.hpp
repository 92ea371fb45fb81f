/*!
 * \file blendpaint_memory.hpp
 * \brief file blendpaint_memory.hpp
 *
 * Adapted from: WRATHNew.hpp and WRATHmemory.hpp of WRATH:
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

/*!\addtogroup Utility
 * @{
 */

#include <cstddef>

/*!
 * Internal routine used by BLENDPAINTnew, do not use directly.
 */
void*
operator new(std::size_t n, const char *file, int line) throw ();

/*!
 * Internal routine used by BLENDPAINTnew, do not use directly.
 */
void
operator delete(void *ptr, const char *file, int line) throw();

namespace blendpaint
{

namespace memory
{
  /*!
   * Private function used by macro BLENDPAINTdelete, do NOT call.
   */
  void
  check_object_exists(const void *ptr, const char *file, int line);

  /*!
   * Private function used by macro BLENDPAINTdelete, do NOT call.
   */
  template<typename T>
  void
  call_dtor(T *p)
  {
    p->~T();
  }

  /*!
   * Private function used by macro BLENDPAINTnew, do NOT call.
   */
  void*
  malloc_implement(size_t size, const char *file, int line);

  /*!
   * Private function used by macro BLENDPAINTdelete, do NOT call.
   */
  void
  free_implement(void *ptr, const char *file, int line);

  /*!
   * Returns the number of allocations made with BLENDPAINTnew
   * that have not yet been freed. Only tracked when
   * BLENDPAINT_DEBUG is defined, otherwise returns 0.
   */
  unsigned int
  number_tracked_allocations(void);

} //namespace memory

} //namespace blendpaint

/*!\def BLENDPAINTnew
 * When creating BlendPaint objects, one must use BLENDPAINTnew instead of new
 * to create objects. For debug build of BlendPaint, allocations with BLENDPAINTnew
 * are tracked and at program exit a list of those objects not deleted by
 * BLENDPAINTdelete are printed with the file and line number of the allocation.
 * For release builds of BlendPaint, allocations are not tracked and std::malloc
 * is used to allocate memory. Do NOT use BLENDPAINTnew for creating arrays
 * (i.e. p = new type[N]) as BLENDPAINTdelete does not handle array deletion.
 */
#define BLENDPAINTnew \
  ::new(__FILE__, __LINE__)

/*!\def BLENDPAINTdelete
 * Use \ref BLENDPAINTdelete to delete objects that were allocated with \ref
 * BLENDPAINTnew. For debug builds of BlendPaint, if the memory was not tracked
 * an error message is emitted.
 * \param ptr address of object to delete, value must be a return value
 *            from BLENDPAINTnew
 */
#define BLENDPAINTdelete(ptr) \
  do {                                                                  \
    blendpaint::memory::check_object_exists(ptr, __FILE__, __LINE__);   \
    blendpaint::memory::call_dtor(ptr);                                 \
    blendpaint::memory::free_implement(ptr, __FILE__, __LINE__);        \
  } while(0)

/*! @} */
