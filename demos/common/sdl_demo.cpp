/*!
 * \file sdl_demo.cpp
 * \brief file sdl_demo.cpp
 *
 * Adapted from: sdl_demo.cpp of WRATH:
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

#include <algorithm>
#include <vector>
#include <stdint.h>

#include <blendpaint/util/blendpaint_memory.hpp>

#include "simple_time.hpp"
#include "sdl_demo.hpp"

namespace
{
  bool
  is_help_request(const std::string &v)
  {
    return v == std::string("-help")
      or v == std::string("--help")
      or v == std::string("-h");
  }
}

////////////////////////////
// sdl_demo methods
sdl_demo::
sdl_demo(const std::string &about_text, bool dimensions_must_match_default_value):
  m_about(command_line_argument::tabs_to_spaces(command_line_argument::format_description_string("", about_text))),
  m_common_label("Screen Option", *this),
  m_fullscreen(false, "fullscreen", "fullscreen mode", *this),
  m_hide_cursor(false, "hide_cursor", "If true, hide the mouse cursor with a SDL call", *this),
  m_width(800, "width", "window width", *this),
  m_height(480, "height", "window height", *this),
  m_dimensions_must_match(dimensions_must_match_default_value, "dimensions_must_match",
                          "If true, then will abort if the created window dimensions do not "
                          "match precisely the width and height parameters", *this),
  m_show_framerate(false, "show_framerate", "if true show the cumulative framerate at end", *this),
  m_run_demo(false),
  m_redraw_requested(true),
  m_return_value(0),
  m_window(nullptr)
{
}

sdl_demo::
~sdl_demo()
{
  if (m_window)
    {
      SDL_ShowCursor(SDL_ENABLE);
      SDL_DestroyWindow(m_window);
      SDL_Quit();
    }
}

enum blendpaint::return_code
sdl_demo::
init_sdl(void)
{
  if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS) < 0)
    {
      std::cerr << "\nFailed on SDL_Init: " << SDL_GetError() << "\n";
      return blendpaint::routine_fail;
    }

  Uint32 video_flags;
  video_flags = SDL_WINDOW_RESIZABLE;

  if (m_fullscreen.m_value)
    {
      video_flags = video_flags | SDL_WINDOW_FULLSCREEN;
    }

  m_window = SDL_CreateWindow("",
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              m_width.m_value,
                              m_height.m_value,
                              video_flags);

  if (m_window == nullptr)
    {
      std::cerr << "\nFailed on SDL_CreateWindow: " << SDL_GetError() << "\n";
      return blendpaint::routine_fail;
    }

  if (m_dimensions_must_match.m_value)
    {
      int w, h;
      bool is_fullscreen;
      is_fullscreen = (SDL_GetWindowFlags(m_window) & SDL_WINDOW_FULLSCREEN) != 0;
      SDL_GetWindowSize(m_window, &w, &h);
      if (w != m_width.m_value || h != m_height.m_value || is_fullscreen != m_fullscreen.m_value)
        {
          std::cerr << "\nDimensions did not match and required to match\n";
          return blendpaint::routine_fail;
        }
    }

  if (m_hide_cursor.m_value)
    {
      SDL_ShowCursor(SDL_DISABLE);
    }

  return blendpaint::routine_success;
}

void
sdl_demo::
present(const blendpaint::RasterSurface &surface)
{
  SDL_Surface *window_surface, *src;
  std::vector<blendpaint::u8vec4> pixels;

  window_surface = SDL_GetWindowSurface(m_window);
  if (window_surface == nullptr)
    {
      std::cerr << "Unable to get window surface: " << SDL_GetError() << "\n";
      return;
    }

  /* SDL_PIXELFORMAT_RGBA32 is the byte order R, G, B, A
   * regardless of the endianness of the platform.
   */
  pixels = surface.to_rgba8();
  src = SDL_CreateRGBSurfaceWithFormatFrom(&pixels[0],
                                           surface.width(), surface.height(),
                                           32, 4 * surface.width(),
                                           SDL_PIXELFORMAT_RGBA32);
  if (src == nullptr)
    {
      std::cerr << "Unable to create surface: " << SDL_GetError() << "\n";
      return;
    }

  SDL_SetSurfaceBlendMode(src, SDL_BLENDMODE_NONE);
  SDL_BlitSurface(src, nullptr, window_surface, nullptr);
  SDL_FreeSurface(src);
  SDL_UpdateWindowSurface(m_window);
}

void
sdl_demo::
set_window_title(const std::string &title)
{
  BLENDPAINTassert(m_window);
  SDL_SetWindowTitle(m_window, title.c_str());
}

int
sdl_demo::
main(int argc, char **argv)
{
  simple_time render_time;
  unsigned int num_frames;
  blendpaint::RasterSurface *surface(nullptr);

  if (argc == 2 and is_help_request(argv[1]))
    {
      std::cout << m_about << "\n\nUsage: " << argv[0];
      print_help(std::cout);
      print_detailed_help(std::cout);
      return 0;
    }

  std::cout << "\n\nRunning: \"";
  for(int i = 0; i < argc; ++i)
    {
      std::cout << argv[i] << " ";
    }

  parse_command_line(argc, argv);
  std::cout << "\n\n" << std::flush;

  enum blendpaint::return_code R;
  R = init_sdl();

  if (R == blendpaint::routine_fail)
    {
      return -1;
    }

  blendpaint::ivec2 wh(dimensions());

  m_run_demo = true;
  init(wh.x(), wh.y());

  num_frames = 0;
  render_time.restart();
  while(m_run_demo)
    {
      if (m_redraw_requested)
        {
          wh = dimensions();
          if (!surface || surface->dimensions() != wh)
            {
              if (surface)
                {
                  BLENDPAINTdelete(surface);
                }
              surface = BLENDPAINTnew blendpaint::RasterSurface(wh.x(), wh.y());
            }

          m_redraw_requested = false;
          draw_frame(*surface);
          present(*surface);
          ++num_frames;
        }

      SDL_Event ev;
      if (m_run_demo && SDL_WaitEventTimeout(&ev, 16))
        {
          do
            {
              if (ev.type == SDL_WINDOWEVENT
                  && (ev.window.event == SDL_WINDOWEVENT_SIZE_CHANGED
                      || ev.window.event == SDL_WINDOWEVENT_EXPOSED))
                {
                  m_redraw_requested = true;
                }
              handle_event(ev);
            }
          while(m_run_demo && SDL_PollEvent(&ev));
        }
    }

  if (surface)
    {
      BLENDPAINTdelete(surface);
    }

  if (m_show_framerate.m_value)
    {
      int32_t ms;
      float msf, numf;

      ms = render_time.elapsed();
      numf = static_cast<float>(std::max(1u, num_frames));
      msf = static_cast<float>(std::max(1, ms));
      std::cout << "Rendered " << num_frames << " in " << ms << " ms.\n"
                << "ms/frame = " << msf / numf  << "\n"
                << "FPS = " << 1000.0f * numf / msf << "\n";
    }

  return m_return_value;
}

blendpaint::ivec2
sdl_demo::
dimensions(void)
{
  blendpaint::ivec2 return_value;

  BLENDPAINTassert(m_window);
  SDL_GetWindowSize(m_window, &return_value.x(), &return_value.y());
  return return_value;
}
