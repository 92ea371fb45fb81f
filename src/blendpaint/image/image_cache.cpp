/*!
 * \file image_cache.cpp
 * \brief file image_cache.cpp
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

#include <list>
#include <map>
#include <blendpaint/image/image_cache.hpp>

namespace
{
  class ImageCachePrivate
  {
  public:
    typedef std::list<std::string> lru_list;
    typedef blendpaint::reference_counted_ptr<blendpaint::ImageStreamCompleter> value_type;

    class Entry
    {
    public:
      value_type m_completer;
      lru_list::iterator m_lru;
    };

    explicit
    ImageCachePrivate(unsigned int maximum_size):
      m_maximum_size(maximum_size)
    {}

    void
    trim(void);

    unsigned int m_maximum_size;

    /* front is the most recently used */
    lru_list m_lru;
    std::map<std::string, Entry> m_entries;
  };
}

//////////////////////////////
// ImageCachePrivate methods
void
ImageCachePrivate::
trim(void)
{
  while (m_entries.size() > m_maximum_size)
    {
      m_entries.erase(m_lru.back());
      m_lru.pop_back();
    }
}

///////////////////////////////////
// blendpaint::ImageCache methods
blendpaint::ImageCache::
ImageCache(unsigned int maximum_size)
{
  m_d = BLENDPAINTnew ImageCachePrivate(maximum_size);
}

blendpaint::ImageCache::
~ImageCache()
{
  ImageCachePrivate *d;
  d = static_cast<ImageCachePrivate*>(m_d);
  BLENDPAINTdelete(d);
  m_d = nullptr;
}

blendpaint::reference_counted_ptr<blendpaint::ImageStreamCompleter>
blendpaint::ImageCache::
put_if_absent(const std::string &key, const loader &load)
{
  ImageCachePrivate *d;
  d = static_cast<ImageCachePrivate*>(m_d);

  std::map<std::string, ImageCachePrivate::Entry>::iterator iter;
  iter = d->m_entries.find(key);
  if (iter != d->m_entries.end())
    {
      d->m_lru.splice(d->m_lru.begin(), d->m_lru, iter->second.m_lru);
      return iter->second.m_completer;
    }

  reference_counted_ptr<ImageStreamCompleter> return_value;

  return_value = load();
  if (!return_value || d->m_maximum_size == 0)
    {
      return return_value;
    }

  ImageCachePrivate::Entry &E(d->m_entries[key]);
  d->m_lru.push_front(key);
  E.m_completer = return_value;
  E.m_lru = d->m_lru.begin();
  d->trim();

  return return_value;
}

bool
blendpaint::ImageCache::
contains(const std::string &key) const
{
  const ImageCachePrivate *d;
  d = static_cast<const ImageCachePrivate*>(m_d);
  return d->m_entries.find(key) != d->m_entries.end();
}

bool
blendpaint::ImageCache::
evict(const std::string &key)
{
  ImageCachePrivate *d;
  d = static_cast<ImageCachePrivate*>(m_d);

  std::map<std::string, ImageCachePrivate::Entry>::iterator iter;
  iter = d->m_entries.find(key);
  if (iter == d->m_entries.end())
    {
      return false;
    }
  d->m_lru.erase(iter->second.m_lru);
  d->m_entries.erase(iter);
  return true;
}

void
blendpaint::ImageCache::
clear(void)
{
  ImageCachePrivate *d;
  d = static_cast<ImageCachePrivate*>(m_d);
  d->m_entries.clear();
  d->m_lru.clear();
}

unsigned int
blendpaint::ImageCache::
size(void) const
{
  const ImageCachePrivate *d;
  d = static_cast<const ImageCachePrivate*>(m_d);
  return d->m_entries.size();
}

unsigned int
blendpaint::ImageCache::
maximum_size(void) const
{
  const ImageCachePrivate *d;
  d = static_cast<const ImageCachePrivate*>(m_d);
  return d->m_maximum_size;
}

void
blendpaint::ImageCache::
maximum_size(unsigned int v)
{
  ImageCachePrivate *d;
  d = static_cast<ImageCachePrivate*>(m_d);
  d->m_maximum_size = v;
  d->trim();
}
