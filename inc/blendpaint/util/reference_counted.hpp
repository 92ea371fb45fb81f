/*!
 * \file reference_counted.hpp
 * \brief file reference_counted.hpp
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

#include <atomic>
#include <blendpaint/util/util.hpp>
#include <blendpaint/util/blendpaint_memory.hpp>

namespace blendpaint
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * \brief
   * Reference counter that is thread safe by having
   * increment and decrement operations atomic.
   */
  class reference_count_atomic:noncopyable
  {
  public:
    reference_count_atomic(void):
      m_reference_count(0)
    {}

    /*!
     * Increment reference counter by 1.
     */
    void
    add_reference(void)
    {
      m_reference_count.fetch_add(1, std::memory_order_relaxed);
    }

    /*!
     * Decrements the counter by 1 and returns status of if the counter
     * is 0 after the decrement operation.
     */
    bool
    remove_reference(void)
    {
      bool return_value;

      if (m_reference_count.fetch_sub(1, std::memory_order_release) == 1)
        {
          std::atomic_thread_fence(std::memory_order_acquire);
          return_value = true;
        }
      else
        {
          return_value = false;
        }
      return return_value;
    }

  private:
    std::atomic<int> m_reference_count;
  };

  /*!
   * \brief
   * Reference counter that is NOT thread safe
   */
  class reference_count_non_concurrent:noncopyable
  {
  public:
    reference_count_non_concurrent(void):
      m_reference_count(0)
    {}

    ~reference_count_non_concurrent()
    {
      BLENDPAINTassert(m_reference_count == 0);
    }

    void
    add_reference(void)
    {
      ++m_reference_count;
    }

    bool
    remove_reference(void)
    {
      --m_reference_count;
      return m_reference_count == 0;
    }

  private:
    int m_reference_count;
  };

  /*!
   * \brief
   * A wrapper over a pointer to implement reference counting.
   *
   * The class T must implement the static methods
   *  - T::add_reference(const T*)
   *  - T::remove_reference(const T*)
   *
   * where T::add_reference() increment the reference count and
   * T::remove_reference() decrements the reference count and will
   * delete the object.
   *
   * See also reference_counted_base and reference_counted.
   */
  template<typename T>
  class reference_counted_ptr
  {
  private:
    typedef void (reference_counted_ptr::*unspecified_bool_type)(void) const;

    void
    fake_function(void) const
    {}

  public:
    /*!
     * Ctor, inits the reference_counted_ptr as
     * equivalent to nullptr.
     */
    reference_counted_ptr(void):
      m_p(nullptr)
    {}

    /*!
     * Ctor, initialize from a T*. If passed non-nullptr,
     * then the reference counter is incremented.
     * \param p pointer value from which to initialize
     */
    reference_counted_ptr(T *p):
      m_p(p)
    {
      if (m_p)
        {
          T::add_reference(m_p);
        }
    }

    reference_counted_ptr(const reference_counted_ptr &obj):
      m_p(obj.get())
    {
      if (m_p)
        {
          T::add_reference(m_p);
        }
    }

    /*!
     * Ctor from a reference_counted_ptr<U> where U* is
     * implicitely convertible to a T*.
     */
    template<typename U>
    reference_counted_ptr(const reference_counted_ptr<U> &obj):
      m_p(obj.get())
    {
      if (m_p)
        {
          T::add_reference(m_p);
        }
    }

    reference_counted_ptr(reference_counted_ptr &&obj):
      m_p(obj.m_p)
    {
      obj.m_p = nullptr;
    }

    ~reference_counted_ptr()
    {
      if (m_p)
        {
          T::remove_reference(m_p);
        }
    }

    reference_counted_ptr&
    operator=(const reference_counted_ptr &rhs)
    {
      reference_counted_ptr temp(rhs);
      temp.swap(*this);
      return *this;
    }

    reference_counted_ptr&
    operator=(reference_counted_ptr &&rhs)
    {
      reference_counted_ptr temp(std::move(rhs));
      temp.swap(*this);
      return *this;
    }

    template<typename U>
    reference_counted_ptr&
    operator=(const reference_counted_ptr<U> &rhs)
    {
      reference_counted_ptr temp(rhs);
      temp.swap(*this);
      return *this;
    }

    /*!
     * Returns the underlying pointer
     */
    T*
    get(void) const
    {
      return m_p;
    }

    T&
    operator*(void) const
    {
      BLENDPAINTassert(m_p);
      return *m_p;
    }

    T*
    operator->(void) const
    {
      BLENDPAINTassert(m_p);
      return m_p;
    }

    /*!
     * Performs swap without needing to increment or
     * decrement the reference counter.
     */
    void
    swap(reference_counted_ptr &rhs)
    {
      T *temp;
      temp = rhs.m_p;
      rhs.m_p = m_p;
      m_p = temp;
    }

    /*!
     * Allows one to write if (p) and if (!p).
     */
    operator unspecified_bool_type() const
    {
      return m_p ? &reference_counted_ptr::fake_function : 0;
    }

    template<typename U>
    bool
    operator==(const reference_counted_ptr<U> &rhs) const
    {
      return m_p == rhs.get();
    }

    template<typename U>
    bool
    operator!=(const reference_counted_ptr<U> &rhs) const
    {
      return m_p != rhs.get();
    }

    /*!
     * Clears the reference_counted_ptr object.
     */
    void
    clear(void)
    {
      if (m_p)
        {
          T::remove_reference(m_p);
          m_p = nullptr;
        }
    }

  private:
    T *m_p;
  };

  /*!
   * \brief
   * Base class to use for reference counted objects,
   * for using reference_counted_ptr. Object deletion
   * (when the reference count goes to zero) is performed
   * via \ref BLENDPAINTdelete, as a consequence objects
   * must be created with \ref BLENDPAINTnew.
   *
   * \tparam T object type that is reference counted
   * \tparam Counter object type to perform reference counting.
   */
  template<typename T, typename Counter>
  class reference_counted_base:noncopyable
  {
  public:
    reference_counted_base(void)
    {}

    virtual
    ~reference_counted_base()
    {}

    /*!
     * Adds a reference count to an object.
     */
    static
    void
    add_reference(const reference_counted_base<T, Counter> *p)
    {
      BLENDPAINTassert(p);
      p->m_counter.add_reference();
    }

    /*!
     * Removes a reference count to an object, if the reference
     * count is 0, then deletes the object with \ref BLENDPAINTdelete.
     */
    static
    void
    remove_reference(const reference_counted_base<T, Counter> *p)
    {
      BLENDPAINTassert(p);
      if (p->m_counter.remove_reference())
        {
          reference_counted_base<T, Counter> *q;
          q = const_cast<reference_counted_base<T, Counter>*>(p);
          BLENDPAINTdelete(q);
        }
    }

  private:
    mutable Counter m_counter;
  };

  /*!
   * \brief
   * Defines default reference counting base classes.
   */
  template<typename T>
  class reference_counted
  {
  public:
    /*!
     * Typedef to reference counting which is NOT thread safe
     */
    typedef reference_counted_base<T, reference_count_non_concurrent> non_concurrent;

    /*!
     * Typedef to reference counting which is thread safe
     */
    typedef reference_counted_base<T, reference_count_atomic> concurrent;
  };

/*! @} */
}
