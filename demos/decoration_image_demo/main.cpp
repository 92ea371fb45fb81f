#include <iostream>
#include <sstream>
#include <vector>

#include <boost/bind/bind.hpp>

#include <blendpaint/util/vecN.hpp>
#include <blendpaint/util/math.hpp>
#include <blendpaint/util/rect.hpp>
#include <blendpaint/util/log.hpp>
#include <blendpaint/image.hpp>
#include <blendpaint/image/image_provider.hpp>
#include <blendpaint/image/image_configuration.hpp>
#include <blendpaint/painter/painter_enums.hpp>
#include <blendpaint/painter/alignment.hpp>
#include <blendpaint/painter/path.hpp>
#include <blendpaint/painter/paint.hpp>
#include <blendpaint/painter/raster_canvas.hpp>
#include <blendpaint/decoration/decoration_image.hpp>

#include "sdl_demo.hpp"
#include "ImageLoader.hpp"
#include "cycle_value.hpp"

using namespace blendpaint;

namespace
{
  template<typename T>
  enumerated_string_type<T>
  enum_labels(int count)
  {
    enumerated_string_type<T> return_value;
    return_value.add_entries(count, [](T v) { return PainterEnums::label(v); });
    return return_value;
  }

  reference_counted_ptr<Bitmap>
  create_checkerboard(int w, int h, int cell, u8vec4 color0, u8vec4 color1)
  {
    std::vector<u8vec4> pixels(w * h);
    for (int y = 0; y < h; ++y)
      {
        for (int x = 0; x < w; ++x)
          {
            bool odd(((x / cell) + (y / cell)) & 1);
            pixels[x + y * w] = (odd) ? color1 : color0;
          }
      }
    return Bitmap::create(w, h, c_array<const u8vec4>(pixels), Bitmap::rgba_format);
  }

  /* an image with a frame of width border around a
   * translucent gradient, suitable for nine-patch drawing
   */
  reference_counted_ptr<Bitmap>
  create_default_image(int w, int h, int border)
  {
    std::vector<u8vec4> pixels(w * h);
    for (int y = 0; y < h; ++y)
      {
        for (int x = 0; x < w; ++x)
          {
            bool frame(x < border || y < border || x >= w - border || y >= h - border);
            if (frame)
              {
                pixels[x + y * w] = u8vec4(40, 40, 200, 255);
              }
            else
              {
                uint8_t r, g;
                r = static_cast<uint8_t>((255 * x) / (w - 1));
                g = static_cast<uint8_t>((255 * y) / (h - 1));
                pixels[x + y * w] = u8vec4(r, g, 128, 200);
              }
          }
      }
    return Bitmap::create(w, h, c_array<const u8vec4>(pixels), Bitmap::rgba_format);
  }

  class NamedAlignment
  {
  public:
    NamedAlignment(c_string name, const AlignmentGeometry &v):
      m_name(name),
      m_value(v)
    {}

    c_string m_name;
    AlignmentGeometry m_value;
  };
}

class decoration_image_demo:public sdl_demo
{
public:
  decoration_image_demo(void);

  ~decoration_image_demo();

protected:
  virtual
  void
  init(int w, int h);

  virtual
  void
  draw_frame(RasterSurface &surface);

  virtual
  void
  handle_event(const SDL_Event &ev);

private:
  enum clip_mode_t
    {
      no_clip,
      clip_rounded_rect,
      clip_oval,

      number_clip_modes
    };

  void
  rebuild_painter(void);

  void
  on_painter_changed(void);

  void
  print_state(void);

  command_separator m_demo_options;
  command_line_argument_value<std::string> m_image_file;
  command_line_argument_value<float> m_image_scale;
  command_line_argument_value<float> m_device_pixel_ratio;
  enumerated_command_line_argument_value<enum PainterEnums::blend_mode_t> m_blend_mode;
  enumerated_command_line_argument_value<enum PainterEnums::box_fit_t> m_fit;
  enumerated_command_line_argument_value<enum PainterEnums::image_repeat_t> m_repeat;
  enumerated_command_line_argument_value<enum PainterEnums::filter_quality_t> m_filter_quality;
  enumerated_command_line_argument_value<enum PainterEnums::text_direction_t> m_text_direction;
  command_line_argument_value<float> m_opacity;
  command_line_argument_value<bool> m_match_text_direction;
  command_line_argument_value<bool> m_invert_colors;
  command_line_argument_value<bool> m_use_center_slice;
  command_line_argument_value<bool> m_use_fit;

  std::vector<NamedAlignment> m_alignments;
  unsigned int m_current_alignment;
  unsigned int m_clip_mode;

  reference_counted_ptr<Image> m_background;
  reference_counted_ptr<ImageProvider> m_provider;
  reference_counted_ptr<DecorationImagePainter> m_painter;
  Rect m_center_slice;
};

decoration_image_demo::
decoration_image_demo(void):
  sdl_demo("Paints an image into a rectangle with a DecorationImage "
           "composited with a blend mode over a checkerboard"),
  m_demo_options("Demo Options", *this),
  m_image_file("", "image", "If non-empty, image file to paint; otherwise "
               "a generated image is used", *this),
  m_image_scale(1.0f, "image_scale", "scale of the image, i.e. the number "
                "of image pixels per logical pixel", *this),
  m_device_pixel_ratio(1.0f, "device_pixel_ratio",
                       "device pixel ratio of the ImageConfiguration", *this),
  m_blend_mode(PainterEnums::blend_porter_duff_src_over,
               enum_labels<enum PainterEnums::blend_mode_t>(PainterEnums::number_blend_mode),
               "blend_mode", "initial blend mode", *this),
  m_fit(PainterEnums::box_fit_contain,
        enum_labels<enum PainterEnums::box_fit_t>(PainterEnums::number_box_fit),
        "fit", "initial box fit, used only if use_fit is true", *this),
  m_repeat(PainterEnums::image_no_repeat,
           enum_labels<enum PainterEnums::image_repeat_t>(PainterEnums::number_image_repeat),
           "repeat", "initial image repeat", *this),
  m_filter_quality(PainterEnums::filter_quality_low,
                   enum_labels<enum PainterEnums::filter_quality_t>(PainterEnums::number_filter_quality),
                   "filter_quality", "initial filter quality", *this),
  m_text_direction(PainterEnums::text_direction_ltr,
                   enum_labels<enum PainterEnums::text_direction_t>(PainterEnums::number_text_direction),
                   "text_direction", "initial text direction", *this),
  m_opacity(1.0f, "opacity", "initial opacity", *this),
  m_match_text_direction(false, "match_text_direction",
                         "if true, flip the image in right-to-left contexts", *this),
  m_invert_colors(false, "invert_colors", "if true, invert the colors of the image", *this),
  m_use_center_slice(false, "center_slice",
                     "if true, paint the image as a nine-patch", *this),
  m_use_fit(true, "use_fit", "if false, do not set a box fit", *this),
  m_current_alignment(0),
  m_clip_mode(no_clip)
{
  std::cout << "Controls:\n"
            << "\tb: cycle blend mode (shift reverses)\n"
            << "\tf: cycle box fit (shift reverses)\n"
            << "\tu: toggle using box fit\n"
            << "\tr: cycle image repeat (shift reverses)\n"
            << "\ta: cycle alignment (shift reverses)\n"
            << "\tq: cycle filter quality (shift reverses)\n"
            << "\td: toggle text direction\n"
            << "\tm: toggle match text direction\n"
            << "\ti: toggle invert colors\n"
            << "\ts: toggle center slice\n"
            << "\tc: cycle clip mode\n"
            << "\tup/down: increase/decrease opacity\n"
            << "\tp: print state\n"
            << "\tescape: quit\n";

  m_alignments.push_back(NamedAlignment("center", Alignment::center()));
  m_alignments.push_back(NamedAlignment("top_left", Alignment::top_left()));
  m_alignments.push_back(NamedAlignment("top_center", Alignment::top_center()));
  m_alignments.push_back(NamedAlignment("top_right", Alignment::top_right()));
  m_alignments.push_back(NamedAlignment("center_left", Alignment::center_left()));
  m_alignments.push_back(NamedAlignment("center_right", Alignment::center_right()));
  m_alignments.push_back(NamedAlignment("bottom_left", Alignment::bottom_left()));
  m_alignments.push_back(NamedAlignment("bottom_center", Alignment::bottom_center()));
  m_alignments.push_back(NamedAlignment("bottom_right", Alignment::bottom_right()));
  m_alignments.push_back(NamedAlignment("top_start", AlignmentDirectional::top_start()));
  m_alignments.push_back(NamedAlignment("center_end", AlignmentDirectional::center_end()));
  m_alignments.push_back(NamedAlignment("bottom_start", AlignmentDirectional::bottom_start()));
}

decoration_image_demo::
~decoration_image_demo()
{
  if (m_painter)
    {
      m_painter->dispose();
    }
}

void
decoration_image_demo::
init(int w, int h)
{
  reference_counted_ptr<const Bitmap> bitmap;
  std::string label;

  BLENDPAINTunused(w);
  BLENDPAINTunused(h);

  if (!m_image_file.m_value.empty())
    {
      bitmap = load_bitmap(m_image_file.m_value);
      label = m_image_file.m_value;
    }

  if (!bitmap)
    {
      bitmap = create_default_image(96, 64, 16);
      label = "generated";
    }

  /* the center slice leaves a quarter of each
   * dimension on each side of the image
   */
  m_center_slice = Rect::from_ltrb(0.25f * bitmap->width(), 0.25f * bitmap->height(),
                                   0.75f * bitmap->width(), 0.75f * bitmap->height());

  m_provider = BLENDPAINTnew MemoryImageProvider(bitmap, m_image_scale.m_value, label);
  m_background = Image::create(create_checkerboard(64, 64, 16,
                                                   u8vec4(230, 230, 230, 255),
                                                   u8vec4(160, 160, 160, 255)));
  rebuild_painter();
}

void
decoration_image_demo::
on_painter_changed(void)
{
  request_redraw();
}

void
decoration_image_demo::
rebuild_painter(void)
{
  DecorationImage details(m_provider);

  details
    .repeat(m_repeat.m_value)
    .alignment(m_alignments[m_current_alignment].m_value)
    .match_text_direction(m_match_text_direction.m_value)
    .opacity(m_opacity.m_value)
    .filter_quality(m_filter_quality.m_value)
    .invert_colors(m_invert_colors.m_value)
    .on_error([](const ImageErrorDetails &error) {
        BLENDPAINTlog_error("image failed: " << error);
      });

  if (m_use_fit.m_value)
    {
      details.fit(m_fit.m_value);
    }

  if (m_use_center_slice.m_value)
    {
      details.center_slice(m_center_slice);
    }

  if (m_painter)
    {
      m_painter->dispose();
    }

  m_painter = details.create_painter(boost::bind(&decoration_image_demo::on_painter_changed, this));
  set_window_title(PainterEnums::label(m_blend_mode.m_value));
  request_redraw();
}

void
decoration_image_demo::
draw_frame(RasterSurface &surface)
{
  RasterCanvas canvas(surface);
  ImageConfiguration configuration;
  Rect rect, background_src;
  boost::optional<Path> clip;
  vec2 wh(surface.width(), surface.height());
  enum return_code R;

  surface.clear(vec4(1.0f, 1.0f, 1.0f, 1.0f));
  background_src = Rect::from_ltrb(0.0f, 0.0f,
                                   static_cast<float>(m_background->width()),
                                   static_cast<float>(m_background->height()));

  /* tile the checkerboard over the entire surface */
  for (float y = 0.0f; y < wh.y(); y += background_src.height())
    {
      for (float x = 0.0f; x < wh.x(); x += background_src.width())
        {
          canvas.draw_image_rect(m_background, background_src,
                                 Rect::from_ltrb(x, y,
                                                 x + background_src.width(),
                                                 y + background_src.height()),
                                 Paint());
        }
    }

  rect = Rect::from_ltrb(0.1f * wh.x(), 0.1f * wh.y(), 0.9f * wh.x(), 0.9f * wh.y());
  switch (m_clip_mode)
    {
    case clip_rounded_rect:
      clip = Path().add_rounded_rect(rect, 0.1f * rect.width(), 0.1f * rect.height());
      break;

    case clip_oval:
      clip = Path().add_oval(rect);
      break;

    default:
      break;
    }

  configuration
    .device_pixel_ratio(m_device_pixel_ratio.m_value)
    .text_direction(m_text_direction.m_value)
    .size(rect.size());

  R = m_painter->paint(canvas, rect, clip, configuration, m_blend_mode.m_value);
  if (R == routine_fail)
    {
      BLENDPAINTlog_warning("Failed to paint image with fit " << PainterEnums::label(m_fit.m_value)
                            << " and repeat " << PainterEnums::label(m_repeat.m_value));
    }
}

void
decoration_image_demo::
print_state(void)
{
  std::cout << "blend_mode: " << PainterEnums::label(m_blend_mode.m_value)
            << "\nfit: ";
  if (m_use_fit.m_value)
    {
      std::cout << PainterEnums::label(m_fit.m_value);
    }
  else
    {
      std::cout << "none set";
    }
  std::cout << "\nrepeat: " << PainterEnums::label(m_repeat.m_value)
            << "\nalignment: " << m_alignments[m_current_alignment].m_name
            << "\nfilter_quality: " << PainterEnums::label(m_filter_quality.m_value)
            << "\ntext_direction: " << PainterEnums::label(m_text_direction.m_value)
            << "\nmatch_text_direction: " << m_match_text_direction.m_value
            << "\nopacity: " << m_opacity.m_value
            << "\ninvert_colors: " << m_invert_colors.m_value
            << "\ncenter_slice: " << m_use_center_slice.m_value
            << "\nclip_mode: " << m_clip_mode
            << "\nimage: " << m_painter->image()
            << "\n";
}

void
decoration_image_demo::
handle_event(const SDL_Event &ev)
{
  switch(ev.type)
    {
    case SDL_QUIT:
      end_demo(0);
      break;

    case SDL_KEYUP:
      {
        bool reverse(ev.key.keysym.mod & (KMOD_SHIFT | KMOD_CTRL | KMOD_ALT));
        bool rebuild(true);

        switch(ev.key.keysym.sym)
          {
          case SDLK_ESCAPE:
            end_demo(0);
            rebuild = false;
            break;

          case SDLK_b:
            cycle_value(m_blend_mode.m_value, reverse, PainterEnums::number_blend_mode);
            std::cout << "Blend mode set to: " << PainterEnums::label(m_blend_mode.m_value) << "\n";
            break;

          case SDLK_f:
            cycle_value(m_fit.m_value, reverse, PainterEnums::number_box_fit);
            std::cout << "Box fit set to: " << PainterEnums::label(m_fit.m_value) << "\n";
            break;

          case SDLK_u:
            m_use_fit.m_value = !m_use_fit.m_value;
            std::cout << "Use box fit: " << m_use_fit.m_value << "\n";
            break;

          case SDLK_r:
            cycle_value(m_repeat.m_value, reverse, PainterEnums::number_image_repeat);
            std::cout << "Repeat set to: " << PainterEnums::label(m_repeat.m_value) << "\n";
            break;

          case SDLK_a:
            cycle_value(m_current_alignment, reverse, m_alignments.size());
            std::cout << "Alignment set to: " << m_alignments[m_current_alignment].m_name << "\n";
            break;

          case SDLK_q:
            cycle_value(m_filter_quality.m_value, reverse, PainterEnums::number_filter_quality);
            std::cout << "Filter quality set to: "
                      << PainterEnums::label(m_filter_quality.m_value) << "\n";
            break;

          case SDLK_d:
            cycle_value(m_text_direction.m_value, false, PainterEnums::number_text_direction);
            std::cout << "Text direction set to: "
                      << PainterEnums::label(m_text_direction.m_value) << "\n";
            break;

          case SDLK_m:
            m_match_text_direction.m_value = !m_match_text_direction.m_value;
            std::cout << "Match text direction: " << m_match_text_direction.m_value << "\n";
            break;

          case SDLK_i:
            m_invert_colors.m_value = !m_invert_colors.m_value;
            std::cout << "Invert colors: " << m_invert_colors.m_value << "\n";
            break;

          case SDLK_s:
            m_use_center_slice.m_value = !m_use_center_slice.m_value;
            std::cout << "Center slice: " << m_use_center_slice.m_value << "\n";
            break;

          case SDLK_c:
            cycle_value(m_clip_mode, reverse, number_clip_modes);
            std::cout << "Clip mode set to: " << m_clip_mode << "\n";
            break;

          case SDLK_UP:
            m_opacity.m_value = t_min(1.0f, m_opacity.m_value + 0.1f);
            std::cout << "Opacity set to: " << m_opacity.m_value << "\n";
            break;

          case SDLK_DOWN:
            m_opacity.m_value = t_max(0.0f, m_opacity.m_value - 0.1f);
            std::cout << "Opacity set to: " << m_opacity.m_value << "\n";
            break;

          case SDLK_p:
            print_state();
            rebuild = false;
            break;

          default:
            rebuild = false;
          }

        if (rebuild)
          {
            rebuild_painter();
          }
      }
      break;
    }
}

int
main(int argc, char **argv)
{
  decoration_image_demo D;
  return D.main(argc, argv);
}
