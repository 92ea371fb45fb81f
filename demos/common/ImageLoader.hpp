#pragma once

#include <SDL_image.h>
#include <string>
#include <vector>
#include <stdint.h>
#include <blendpaint/util/vecN.hpp>
#include <blendpaint/util/reference_counted.hpp>
#include <blendpaint/image.hpp>

/*
  Read the pixels of an SDL_Surface as RGBA8 with alpha
  not pre-multiplied, top row first. Returns the dimensions
  of the surface, (0, 0) if img is nullptr.
 */
blendpaint::ivec2
load_image_to_array(const SDL_Surface *img,
                    std::vector<blendpaint::u8vec4> &out_bytes);

blendpaint::ivec2
load_image_to_array(const std::string &pfilename,
                    std::vector<blendpaint::u8vec4> &out_bytes);

/*
  Load an image file with SDL_image into a Bitmap,
  returns a null handle if the file could not be loaded.
 */
blendpaint::reference_counted_ptr<blendpaint::Bitmap>
load_bitmap(const std::string &pfilename);
