/*!
 * \file image_cache.hpp
 * \brief file image_cache.hpp
 *
 * Copyright 2019 by Intel.
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

#include <string>
#include <boost/function.hpp>
#include <blendpaint/util/util.hpp>
#include <blendpaint/util/reference_counted.hpp>
#include <blendpaint/image/image_stream.hpp>

namespace blendpaint
{
/*!\addtogroup Imaging
 * @{
 */

  /*!
   * \brief
   * An ImageCache maps keys to ImageStreamCompleter objects so
   * that resolving the same image twice shares one completer.
   * When more than maximum_size() entries are present, the
   * least recently used entries are evicted.
   */
  class ImageCache:noncopyable
  {
  public:
    /*!
     * Function type for creating a completer on a cache miss.
     */
    typedef boost::function<reference_counted_ptr<ImageStreamCompleter> ()> loader;

    /*!
     * Ctor.
     * \param maximum_size maximum number of entries, 0 disables
     *                     caching
     */
    explicit
    ImageCache(unsigned int maximum_size = 1000u);

    ~ImageCache();

    /*!
     * Returns the completer for a key. If the key is present,
     * the entry becomes the most recently used. Otherwise the
     * loader is called and, if it returns a completer, it is
     * added to the cache. Returns null if the loader returns null.
     * \param key key of the image
     * \param load function to create the completer on a miss
     */
    reference_counted_ptr<ImageStreamCompleter>
    put_if_absent(const std::string &key, const loader &load);

    /*!
     * Returns true if the key is present.
     */
    bool
    contains(const std::string &key) const;

    /*!
     * Remove a key; returns true if it was present.
     */
    bool
    evict(const std::string &key);

    /*!
     * Remove all entries.
     */
    void
    clear(void);

    /*!
     * Returns the number of entries.
     */
    unsigned int
    size(void) const;

    /*!
     * Returns the maximum number of entries.
     */
    unsigned int
    maximum_size(void) const;

    /*!
     * Set the maximum number of entries, evicting the least
     * recently used entries if there are more.
     */
    void
    maximum_size(unsigned int v);

  private:
    void *m_d;
  };

/*! @} */
}
