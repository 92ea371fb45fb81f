/*!
 * \file sdl_demo.hpp
 * \brief file sdl_demo.hpp
 *
 * Adapted from: sdl_demo.hpp of WRATH:
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

#include <iostream>
#include <string>

#include <SDL.h>

#include <blendpaint/util/util.hpp>
#include <blendpaint/util/vecN.hpp>
#include <blendpaint/painter/raster_surface.hpp>

#include "generic_command_line.hpp"

/*
  Notes:
    sdl_demo() DOES NOT create the window, so the
    dimensions of the window are not known there;
    rather, initialize in init().

    The window is drawn with software rendering:
    a frame is drawn to a blendpaint::RasterSurface
    which is then copied to the window surface.
    Frames are only drawn after request_redraw().
 */
class sdl_demo:public command_line_register
{
public:
  explicit
  sdl_demo(const std::string &about_text = std::string(),
           bool dimensions_must_match_default_value = false);

  virtual
  ~sdl_demo();

  /*
    call this as your main, at main exit, demo is over.
   */
  int
  main(int argc, char **argv);

protected:

  virtual
  void
  init(int w, int h)
  {
    (void)w;
    (void)h;
  }

  virtual
  void
  draw_frame(blendpaint::RasterSurface &surface)
  {
    (void)surface;
  }

  virtual
  void
  handle_event(const SDL_Event&)
  {}

  void
  end_demo(int return_value)
  {
    m_run_demo = false;
    m_return_value = return_value;
  }

  void
  request_redraw(void)
  {
    m_redraw_requested = true;
  }

  blendpaint::ivec2
  dimensions(void);

  void
  set_window_title(const std::string &title);

private:

  enum blendpaint::return_code
  init_sdl(void);

  void
  present(const blendpaint::RasterSurface &surface);

  std::string m_about;
  command_separator m_common_label;
  command_line_argument_value<bool> m_fullscreen;
  command_line_argument_value<bool> m_hide_cursor;
  command_line_argument_value<int> m_width;
  command_line_argument_value<int> m_height;
  command_line_argument_value<bool> m_dimensions_must_match;
  command_line_argument_value<bool> m_show_framerate;

  bool m_run_demo;
  bool m_redraw_requested;
  int m_return_value;

  SDL_Window *m_window;
};
