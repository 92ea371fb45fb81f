/*!
 * Adapted from: WRATHSDLImageSupport.cpp of WRATH:
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
 * \author Kevin Rogovin <kevin.rogovin@gmail.com>
 */

#include <iostream>
#include <blendpaint/util/c_array.hpp>
#include "ImageLoader.hpp"

namespace
{
  blendpaint::ivec2
  load_image_worker(SDL_Surface *img, std::vector<blendpaint::u8vec4> &bits_data)
  {
    SDL_PixelFormat *fmt;

    fmt = img->format;
    SDL_LockSurface(img);

    int w(img->w), h(img->h);
    int pitch(img->pitch);
    int bytes_per_pixel(img->format->BytesPerPixel);

    const unsigned char *surface_data;
    surface_data = reinterpret_cast<const unsigned char*>(img->pixels);

    bits_data.resize(w * h);
    for(int y = 0; y < h; ++y)
      {
        for(int x = 0; x < w; ++x)
          {
            Uint32 pixel;
            Uint8 red, green, blue, alpha;

            pixel = *reinterpret_cast<const Uint32*>(surface_data + y * pitch + x * bytes_per_pixel);
            SDL_GetRGBA(pixel, fmt, &red, &green, &blue, &alpha);

            bits_data[x + y * w] = blendpaint::u8vec4(red, green, blue, alpha);
          }
      }
    SDL_UnlockSurface(img);
    return blendpaint::ivec2(w, h);
  }
}

blendpaint::ivec2
load_image_to_array(const SDL_Surface *img,
                    std::vector<blendpaint::u8vec4> &out_bytes)
{
  SDL_Surface *q;
  blendpaint::ivec2 R;

  if (!img)
    {
      return blendpaint::ivec2(0, 0);
    }

  q = SDL_ConvertSurfaceFormat(const_cast<SDL_Surface*>(img), SDL_PIXELFORMAT_RGBA8888, 0);
  if (!q)
    {
      return blendpaint::ivec2(0, 0);
    }
  R = load_image_worker(q, out_bytes);
  SDL_FreeSurface(q);
  return R;
}

blendpaint::ivec2
load_image_to_array(const std::string &pfilename,
                    std::vector<blendpaint::u8vec4> &out_bytes)
{
  blendpaint::ivec2 R;
  SDL_Surface *img;

  img = IMG_Load(pfilename.c_str());
  if (!img)
    {
      std::cerr << "Unable to load \"" << pfilename << "\": "
                << IMG_GetError() << "\n";
      return blendpaint::ivec2(0, 0);
    }
  R = load_image_to_array(img, out_bytes);
  SDL_FreeSurface(img);
  return R;
}

blendpaint::reference_counted_ptr<blendpaint::Bitmap>
load_bitmap(const std::string &pfilename)
{
  std::vector<blendpaint::u8vec4> data;
  blendpaint::ivec2 dims;

  dims = load_image_to_array(pfilename, data);
  if (dims.x() <= 0 || dims.y() <= 0)
    {
      return blendpaint::reference_counted_ptr<blendpaint::Bitmap>();
    }
  return blendpaint::Bitmap::create(dims.x(), dims.y(),
                                    blendpaint::c_array<const blendpaint::u8vec4>(data),
                                    blendpaint::Bitmap::rgba_format);
}
