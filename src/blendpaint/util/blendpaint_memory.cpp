/*!
 * \file blendpaint_memory.cpp
 * \brief file blendpaint_memory.cpp
 *
 * Adapted from: WRATHNew.cpp and WRATHmemory.cpp of WRATH:
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


#include <map>
#include <mutex>
#include <iostream>
#include <cstdlib>

#include <blendpaint/util/util.hpp>
#include <blendpaint/util/blendpaint_memory.hpp>

#ifdef BLENDPAINT_DEBUG

namespace
{
  class address_set_type:
    private std::map<const void*, std::pair<const char*, int> >
  {
  public:
    ~address_set_type()
    {
      if (!empty())
        {
          std::cerr << "BlendPaint: " << size() << " allocations not freed:\n";
          print(std::cerr);
        }
    }

    bool
    present(const void *ptr)
    {
      std::lock_guard<std::mutex> M(m_mutex);
      return find(ptr) != end();
    }

    void
    track(const void *ptr, const char *file, int line)
    {
      std::lock_guard<std::mutex> M(m_mutex);
      insert(value_type(ptr, mapped_type(file, line)));
    }

    void
    untrack(const void *ptr, const char *file, int line)
    {
      bool found;

      {
        std::lock_guard<std::mutex> M(m_mutex);
        iterator iter;

        iter = find(ptr);
        found = (iter != end());
        if (found)
          {
            erase(iter);
          }
      }

      if (!found)
        {
          std::cerr << "Deletion from [" << file << ", " << line
                    << "] of untracked @" << ptr << "\n" << std::flush;
        }
    }

    unsigned int
    count(void)
    {
      std::lock_guard<std::mutex> M(m_mutex);
      return size();
    }

    void
    print(std::ostream &ostr)
    {
      std::lock_guard<std::mutex> M(m_mutex);
      for (const_iterator iter = begin(); iter != end(); ++iter)
        {
          ostr << const_cast<void*>(iter->first) << "[" << iter->second.first
               << "," << iter->second.second << "]\n";
        }
    }

  private:
    std::mutex m_mutex;
  };

  address_set_type&
  address_set(void)
  {
    static address_set_type retval;
    return retval;
  }
}

#endif

//////////////////////////////////////////////////////
// blendpaint::memory methods
void
blendpaint::memory::
check_object_exists(const void *ptr, const char *file, int line)
{
  #ifdef BLENDPAINT_DEBUG
    {
      if (ptr && !address_set().present(ptr))
        {
          std::cerr << "Deletion from [" << file << ", " << line
                    << "] of untracked @" << ptr << "\n" << std::flush;
        }
    }
  #else
    {
      BLENDPAINTunused(ptr);
      BLENDPAINTunused(file);
      BLENDPAINTunused(line);
    }
  #endif
}

void*
blendpaint::memory::
malloc_implement(size_t size, const char *file, int line)
{
  void *return_value;

  if (size == 0)
    {
      size = 1;
    }

  return_value = std::malloc(size);

  #ifdef BLENDPAINT_DEBUG
    {
      if (!return_value)
        {
          std::cerr << "Allocation at [" << file << "," << line << "] of "
                    << size << " bytes failed\n";
        }
      else
        {
          address_set().track(return_value, file, line);
        }
    }
  #else
    {
      BLENDPAINTunused(file);
      BLENDPAINTunused(line);
    }
  #endif

  return return_value;
}

void
blendpaint::memory::
free_implement(void *ptr, const char *file, int line)
{
  #ifdef BLENDPAINT_DEBUG
    {
      if (ptr)
        {
          address_set().untrack(ptr, file, line);
        }
    }
  #else
    {
      BLENDPAINTunused(file);
      BLENDPAINTunused(line);
    }
  #endif

  std::free(ptr);
}

unsigned int
blendpaint::memory::
number_tracked_allocations(void)
{
  #ifdef BLENDPAINT_DEBUG
    {
      return address_set().count();
    }
  #else
    {
      return 0;
    }
  #endif
}

void*
operator new(std::size_t n, const char *file, int line) throw ()
{
  return blendpaint::memory::malloc_implement(n, file, line);
}

void
operator delete(void *ptr, const char *file, int line) throw()
{
  blendpaint::memory::free_implement(ptr, file, line);
}
