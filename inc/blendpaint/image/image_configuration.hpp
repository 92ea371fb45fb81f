/*!
 * \file image_configuration.hpp
 * \brief file image_configuration.hpp
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
#include <iosfwd>
#include <boost/optional.hpp>
#include <blendpaint/util/vecN.hpp>
#include <blendpaint/painter/painter_enums.hpp>

namespace blendpaint
{
/*!\addtogroup Imaging
 * @{
 */

  /*!
   * \brief
   * An ImageConfiguration describes the context in which an
   * image is to be shown; an ImageProvider may use it to choose
   * which image to provide. Every value is optional.
   */
  class ImageConfiguration
  {
  public:
    /*!
     * Ctor, initializes with no values set.
     */
    ImageConfiguration(void)
    {}

    /*!
     * Returns an ImageConfiguration with no values set.
     */
    static
    ImageConfiguration
    empty(void)
    {
      return ImageConfiguration();
    }

    /*!
     * Set the number of device pixels per logical pixel.
     */
    ImageConfiguration&
    device_pixel_ratio(const boost::optional<float> &v)
    {
      m_device_pixel_ratio = v;
      return *this;
    }

    const boost::optional<float>&
    device_pixel_ratio(void) const
    {
      return m_device_pixel_ratio;
    }

    /*!
     * Set the locale, for example "en_US".
     */
    ImageConfiguration&
    locale(const boost::optional<std::string> &v)
    {
      m_locale = v;
      return *this;
    }

    const boost::optional<std::string>&
    locale(void) const
    {
      return m_locale;
    }

    /*!
     * Set the size, in logical pixels, at which the image
     * is to be shown.
     */
    ImageConfiguration&
    size(const boost::optional<vec2> &v)
    {
      m_size = v;
      return *this;
    }

    const boost::optional<vec2>&
    size(void) const
    {
      return m_size;
    }

    /*!
     * Set the text direction of the context.
     */
    ImageConfiguration&
    text_direction(const boost::optional<enum PainterEnums::text_direction_t> &v)
    {
      m_text_direction = v;
      return *this;
    }

    const boost::optional<enum PainterEnums::text_direction_t>&
    text_direction(void) const
    {
      return m_text_direction;
    }

    /*!
     * Set the name of the platform.
     */
    ImageConfiguration&
    platform(const boost::optional<std::string> &v)
    {
      m_platform = v;
      return *this;
    }

    const boost::optional<std::string>&
    platform(void) const
    {
      return m_platform;
    }

    bool
    operator==(const ImageConfiguration &rhs) const
    {
      return m_device_pixel_ratio == rhs.m_device_pixel_ratio
        && m_locale == rhs.m_locale
        && m_size == rhs.m_size
        && m_text_direction == rhs.m_text_direction
        && m_platform == rhs.m_platform;
    }

    bool
    operator!=(const ImageConfiguration &rhs) const
    {
      return !operator==(rhs);
    }

  private:
    boost::optional<float> m_device_pixel_ratio;
    boost::optional<std::string> m_locale;
    boost::optional<vec2> m_size;
    boost::optional<enum PainterEnums::text_direction_t> m_text_direction;
    boost::optional<std::string> m_platform;
  };

  /*!
   * Print the values of an ImageConfiguration that are set.
   */
  std::ostream&
  operator<<(std::ostream &str, const ImageConfiguration &v);

/*! @} */
}
