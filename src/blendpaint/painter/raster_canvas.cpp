/*!
 * \file raster_canvas.cpp
 * \brief file raster_canvas.cpp
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

#include <vector>
#include <blendpaint/painter/raster_canvas.hpp>
#include <blendpaint/painter/blend.hpp>
#include <blendpaint/util/math.hpp>
#include <blendpaint/util/log.hpp>
#include "../private/util_private_ostream.hpp"

namespace
{
  class SamplePattern
  {
  public:
    explicit
    SamplePattern(bool anti_alias)
    {
      if (anti_alias)
        {
          m_offsets.push_back(blendpaint::vec2(0.25f, 0.25f));
          m_offsets.push_back(blendpaint::vec2(0.75f, 0.25f));
          m_offsets.push_back(blendpaint::vec2(0.25f, 0.75f));
          m_offsets.push_back(blendpaint::vec2(0.75f, 0.75f));
        }
      else
        {
          m_offsets.push_back(blendpaint::vec2(0.5f, 0.5f));
        }
      m_weight = 1.0f / static_cast<float>(m_offsets.size());
    }

    std::vector<blendpaint::vec2> m_offsets;
    float m_weight;
  };

  class State
  {
  public:
    State(void):
      m_layer(-1),
      m_owns_layer(false)
    {}

    blendpaint::float3x3 m_transform;

    /* empty indicates no clipping */
    std::vector<float> m_clip;

    /* index into RasterCanvasPrivate::m_layers,
     * -1 indicates to draw to the surface
     */
    int m_layer;
    bool m_owns_layer;
  };

  class Layer
  {
  public:
    std::vector<blendpaint::vec4> m_pixels;
    blendpaint::Paint m_paint;
    blendpaint::IRect m_bounds;
  };

  class RasterCanvasPrivate
  {
  public:
    explicit
    RasterCanvasPrivate(blendpaint::RasterSurface &surface);

    blendpaint::vec4&
    target_pixel(int layer, int x, int y);

    blendpaint::IRect
    device_box(const blendpaint::Rect &local_rect) const;

    blendpaint::IRect
    device_box_of_path(const blendpaint::Path &device_path) const;

    void
    intersect_clip(const blendpaint::Path &device_path);

    float
    clip_at(int x, int y) const;

    blendpaint::vec4
    sample(const blendpaint::Bitmap &bitmap,
           const blendpaint::vec2 &uv,
           const blendpaint::Rect &src,
           enum blendpaint::PainterEnums::filter_t filter) const;

    void
    draw_image_rect(const blendpaint::Bitmap &bitmap,
                    const blendpaint::Rect &src,
                    const blendpaint::Rect &dst,
                    const blendpaint::Paint &paint);

    void
    composite_layer(const Layer &layer, int target_layer,
                    const std::vector<float> &clip);

    blendpaint::RasterSurface &m_surface;
    blendpaint::ivec2 m_dims;
    std::vector<State> m_states;
    std::vector<Layer> m_layers;
  };

  blendpaint::vec4
  lerp(const blendpaint::vec4 &a, const blendpaint::vec4 &b, float t)
  {
    return a + (b - a) * t;
  }

  /* Mitchell-Netravali cubic with B = C = 1/3 */
  float
  cubic_weight(float x)
  {
    const float B(1.0f / 3.0f), C(1.0f / 3.0f);

    x = blendpaint::t_abs(x);
    if (x < 1.0f)
      {
        return ((12.0f - 9.0f * B - 6.0f * C) * x * x * x
                + (-18.0f + 12.0f * B + 6.0f * C) * x * x
                + (6.0f - 2.0f * B)) / 6.0f;
      }
    else if (x < 2.0f)
      {
        return ((-B - 6.0f * C) * x * x * x
                + (6.0f * B + 30.0f * C) * x * x
                + (-12.0f * B - 48.0f * C) * x
                + (8.0f * B + 24.0f * C)) / 6.0f;
      }
    return 0.0f;
  }

  /* Returns the x-coordinates of the lines of a nine-patch
   * destination along one axis; the unscaled edges shrink
   * proportionally if they do not fit.
   */
  blendpaint::vecN<float, 4>
  nine_patch_stops(float dst_min, float dst_max, float start_size, float end_size)
  {
    blendpaint::vecN<float, 4> R;
    float fixed(start_size + end_size);
    float avail(dst_max - dst_min);

    if (fixed > avail && fixed > 0.0f)
      {
        float s(avail / fixed);
        start_size *= s;
        end_size *= s;
      }

    R[0] = dst_min;
    R[1] = dst_min + start_size;
    R[2] = dst_max - end_size;
    R[3] = dst_max;
    return R;
  }
}

//////////////////////////////////////
// RasterCanvasPrivate methods
RasterCanvasPrivate::
RasterCanvasPrivate(blendpaint::RasterSurface &surface):
  m_surface(surface),
  m_dims(surface.dimensions())
{
  m_states.push_back(State());
}

blendpaint::vec4&
RasterCanvasPrivate::
target_pixel(int layer, int x, int y)
{
  if (layer < 0)
    {
      return m_surface.pixel(x, y);
    }
  return m_layers[layer].m_pixels[x + y * m_dims.x()];
}

blendpaint::IRect
RasterCanvasPrivate::
device_box_of_path(const blendpaint::Path &device_path) const
{
  using namespace blendpaint;

  Rect b(device_path.bounds());
  IRect R;

  R.m_min_point.x() = t_clamp(static_cast<int>(t_floor(b.min_x())), 0, m_dims.x());
  R.m_min_point.y() = t_clamp(static_cast<int>(t_floor(b.min_y())), 0, m_dims.y());
  R.m_max_point.x() = t_clamp(static_cast<int>(t_ceil(b.max_x())), 0, m_dims.x());
  R.m_max_point.y() = t_clamp(static_cast<int>(t_ceil(b.max_y())), 0, m_dims.y());
  return R;
}

blendpaint::IRect
RasterCanvasPrivate::
device_box(const blendpaint::Rect &local_rect) const
{
  blendpaint::Path P;

  P.add_rect(local_rect);
  return device_box_of_path(P.transformed(m_states.back().m_transform));
}

float
RasterCanvasPrivate::
clip_at(int x, int y) const
{
  const std::vector<float> &clip(m_states.back().m_clip);
  return (clip.empty()) ? 1.0f : clip[x + y * m_dims.x()];
}

void
RasterCanvasPrivate::
intersect_clip(const blendpaint::Path &device_path)
{
  using namespace blendpaint;

  std::vector<float> coverage(m_dims.x() * m_dims.y(), 0.0f);
  std::vector<float> &clip(m_states.back().m_clip);
  SamplePattern pattern(true);
  IRect box(device_box_of_path(device_path));

  for (int y = box.min_y(); y < box.max_y(); ++y)
    {
      for (int x = box.min_x(); x < box.max_x(); ++x)
        {
          float c(0.0f);
          for (const vec2 &offset : pattern.m_offsets)
            {
              vec2 p(static_cast<float>(x) + offset.x(),
                     static_cast<float>(y) + offset.y());
              if (device_path.contains(p))
                {
                  c += pattern.m_weight;
                }
            }
          coverage[x + y * m_dims.x()] = c;
        }
    }

  if (clip.empty())
    {
      clip.swap(coverage);
    }
  else
    {
      for (unsigned int i = 0, endi = clip.size(); i < endi; ++i)
        {
          clip[i] *= coverage[i];
        }
    }
}

blendpaint::vec4
RasterCanvasPrivate::
sample(const blendpaint::Bitmap &bitmap,
       const blendpaint::vec2 &uv,
       const blendpaint::Rect &src,
       enum blendpaint::PainterEnums::filter_t filter) const
{
  using namespace blendpaint;

  /* texels are restricted to those that intersect src */
  int min_x, min_y, max_x, max_y;
  min_x = t_clamp(static_cast<int>(t_floor(src.min_x())), 0, bitmap.width() - 1);
  min_y = t_clamp(static_cast<int>(t_floor(src.min_y())), 0, bitmap.height() - 1);
  max_x = t_clamp(static_cast<int>(t_ceil(src.max_x())) - 1, min_x, bitmap.width() - 1);
  max_y = t_clamp(static_cast<int>(t_ceil(src.max_y())) - 1, min_y, bitmap.height() - 1);

  switch (filter)
    {
    case PainterEnums::filter_nearest:
      {
        int x(t_clamp(static_cast<int>(t_floor(uv.x())), min_x, max_x));
        int y(t_clamp(static_cast<int>(t_floor(uv.y())), min_y, max_y));
        return bitmap.texel(x, y);
      }

    case PainterEnums::filter_linear:
      {
        float fx(uv.x() - 0.5f), fy(uv.y() - 0.5f);
        float x0f(t_floor(fx)), y0f(t_floor(fy));
        float tx(fx - x0f), ty(fy - y0f);
        int x0(static_cast<int>(x0f)), y0(static_cast<int>(y0f));
        int xa(t_clamp(x0, min_x, max_x)), xb(t_clamp(x0 + 1, min_x, max_x));
        int ya(t_clamp(y0, min_y, max_y)), yb(t_clamp(y0 + 1, min_y, max_y));
        vec4 top(lerp(bitmap.texel(xa, ya), bitmap.texel(xb, ya), tx));
        vec4 bottom(lerp(bitmap.texel(xa, yb), bitmap.texel(xb, yb), tx));
        return lerp(top, bottom, ty);
      }

    case PainterEnums::filter_cubic:
      {
        float fx(uv.x() - 0.5f), fy(uv.y() - 0.5f);
        float x0f(t_floor(fx)), y0f(t_floor(fy));
        float tx(fx - x0f), ty(fy - y0f);
        int x0(static_cast<int>(x0f)), y0(static_cast<int>(y0f));
        vec4 sum(0.0f);

        for (int j = -1; j <= 2; ++j)
          {
            float wy(cubic_weight(static_cast<float>(j) - ty));
            int y(t_clamp(y0 + j, min_y, max_y));
            for (int i = -1; i <= 2; ++i)
              {
                float wx(cubic_weight(static_cast<float>(i) - tx));
                int x(t_clamp(x0 + i, min_x, max_x));
                sum += bitmap.texel(x, y) * (wx * wy);
              }
          }

        /* keep the result a valid pre-multiplied color */
        sum.w() = t_clamp(sum.w(), 0.0f, 1.0f);
        for (unsigned int c = 0; c < 3; ++c)
          {
            sum[c] = t_clamp(sum[c], 0.0f, sum.w());
          }
        return sum;
      }
    }

  return bitmap.texel(min_x, min_y);
}

void
RasterCanvasPrivate::
draw_image_rect(const blendpaint::Bitmap &bitmap,
                const blendpaint::Rect &src,
                const blendpaint::Rect &dst,
                const blendpaint::Paint &paint)
{
  using namespace blendpaint;

  const State &state(m_states.back());
  float3x3 inverse;

  if (src.is_empty() || dst.is_empty())
    {
      return;
    }

  if (state.m_transform.inverse(inverse) == routine_fail)
    {
      return;
    }

  IRect box(device_box(dst));
  SamplePattern pattern(paint.anti_alias());
  enum PainterEnums::filter_t filter;
  vec2 uv_scale(src.width() / dst.width(), src.height() / dst.height());

  filter = PainterEnums::filter_for_quality(paint.filter_quality());
  for (int y = box.min_y(); y < box.max_y(); ++y)
    {
      for (int x = box.min_x(); x < box.max_x(); ++x)
        {
          float coverage(0.0f);
          vec2 pixel(static_cast<float>(x), static_cast<float>(y));

          for (const vec2 &offset : pattern.m_offsets)
            {
              if (dst.contains(inverse.apply_to_point(pixel + offset)))
                {
                  coverage += pattern.m_weight;
                }
            }

          coverage *= clip_at(x, y);
          if (coverage <= 0.0f)
            {
              continue;
            }

          vec2 local(inverse.apply_to_point(pixel + vec2(0.5f, 0.5f)));
          vec2 uv(src.m_min_point + (local - dst.m_min_point) * uv_scale);
          vec4 S, D, B;

          S = paint.filter_color(sample(bitmap, uv, src, filter));
          S *= paint.alpha();

          vec4 &target(target_pixel(state.m_layer, x, y));
          B = blend_colors(paint.blend_mode(), S, target);
          target = lerp(target, B, coverage);
        }
    }
}

void
RasterCanvasPrivate::
composite_layer(const Layer &layer, int target_layer,
                const std::vector<float> &clip)
{
  using namespace blendpaint;

  for (int y = layer.m_bounds.min_y(); y < layer.m_bounds.max_y(); ++y)
    {
      for (int x = layer.m_bounds.min_x(); x < layer.m_bounds.max_x(); ++x)
        {
          int idx(x + y * m_dims.x());
          float coverage(clip.empty() ? 1.0f : clip[idx]);

          if (coverage <= 0.0f)
            {
              continue;
            }

          vec4 S(layer.m_paint.filter_color(layer.m_pixels[idx]));
          S *= layer.m_paint.alpha();

          vec4 &target(target_pixel(target_layer, x, y));
          vec4 B(blend_colors(layer.m_paint.blend_mode(), S, target));
          target = lerp(target, B, coverage);
        }
    }
}

//////////////////////////////////////
// blendpaint::RasterCanvas methods
blendpaint::RasterCanvas::
RasterCanvas(RasterSurface &surface)
{
  m_d = BLENDPAINTnew RasterCanvasPrivate(surface);
}

blendpaint::RasterCanvas::
~RasterCanvas()
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);

  /* layers still open are composited as if restored */
  while (d->m_states.size() > 1)
    {
      restore();
    }

  BLENDPAINTdelete(d);
  m_d = nullptr;
}

void
blendpaint::RasterCanvas::
save(void)
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);

  State st(d->m_states.back());
  st.m_owns_layer = false;
  d->m_states.push_back(st);
}

void
blendpaint::RasterCanvas::
save_layer(const Rect &bounds, const Paint &paint)
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);

  State st(d->m_states.back());
  st.m_owns_layer = true;
  st.m_layer = static_cast<int>(d->m_layers.size());

  d->m_layers.push_back(Layer());
  d->m_layers.back().m_paint = paint;
  d->m_layers.back().m_bounds = d->device_box(bounds);
  d->m_layers.back().m_pixels.resize(d->m_dims.x() * d->m_dims.y(), vec4(0.0f));
  d->m_states.push_back(st);
}

void
blendpaint::RasterCanvas::
restore(void)
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);

  if (d->m_states.size() <= 1)
    {
      BLENDPAINTlog_warning("RasterCanvas::restore: restore without matching save ignored");
      return;
    }

  if (d->m_states.back().m_owns_layer)
    {
      const State &parent(d->m_states[d->m_states.size() - 2]);

      /* the layer is clipped by the clipping region
       * in effect when save_layer() was called
       */
      d->composite_layer(d->m_layers.back(), parent.m_layer, parent.m_clip);
      d->m_layers.pop_back();
    }
  d->m_states.pop_back();
}

int
blendpaint::RasterCanvas::
save_count(void) const
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);
  return d->m_states.size();
}

void
blendpaint::RasterCanvas::
translate(float dx, float dy)
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);
  d->m_states.back().m_transform.translate(dx, dy);
}

void
blendpaint::RasterCanvas::
scale(float sx, float sy)
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);
  d->m_states.back().m_transform.shear(sx, sy);
}

void
blendpaint::RasterCanvas::
concat(const float3x3 &m)
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);

  float3x3 &tr(d->m_states.back().m_transform);
  tr = tr * m;
}

void
blendpaint::RasterCanvas::
clip_rect(const Rect &r)
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);

  Path P;
  P.add_rect(r);
  d->intersect_clip(P.transformed(d->m_states.back().m_transform));
}

void
blendpaint::RasterCanvas::
clip_path(const Path &path)
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);
  d->intersect_clip(path.transformed(d->m_states.back().m_transform));
}

void
blendpaint::RasterCanvas::
draw_image_rect(const reference_counted_ptr<Image> &image,
                const Rect &src, const Rect &dst,
                const Paint &paint)
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);

  if (!image || image->disposed())
    {
      BLENDPAINTlog_warning("RasterCanvas::draw_image_rect: null or disposed image");
      return;
    }
  d->draw_image_rect(*image->bitmap(), src, dst, paint);
}

void
blendpaint::RasterCanvas::
draw_image_nine(const reference_counted_ptr<Image> &image,
                const Rect &center, const Rect &dst,
                const Paint &paint)
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);

  if (!image || image->disposed())
    {
      BLENDPAINTlog_warning("RasterCanvas::draw_image_nine: null or disposed image");
      return;
    }

  const Bitmap &bitmap(*image->bitmap());
  float W(bitmap.width()), H(bitmap.height());
  float cl(t_round(center.min_x())), ct(t_round(center.min_y()));
  float cr(t_round(center.max_x())), cb(t_round(center.max_y()));

  if (cl < 0.0f || ct < 0.0f || cr > W || cb > H || cl > cr || ct > cb)
    {
      BLENDPAINTlog_warning("RasterCanvas::draw_image_nine: center " << center
                            << " not within image of size " << bitmap.dimensions()
                            << ", drawing unsliced");
      d->draw_image_rect(bitmap, Rect::from_ltrb(0.0f, 0.0f, W, H), dst, paint);
      return;
    }

  /* a center with no texels has no band to stretch,
   * the whole image is stretched instead
   */
  if (cl >= cr || ct >= cb)
    {
      d->draw_image_rect(bitmap, Rect::from_ltrb(0.0f, 0.0f, W, H), dst, paint);
      return;
    }

  vecN<float, 4> src_x(0.0f, cl, cr, W), src_y(0.0f, ct, cb, H);
  vecN<float, 4> dst_x(nine_patch_stops(dst.min_x(), dst.max_x(), cl, W - cr));
  vecN<float, 4> dst_y(nine_patch_stops(dst.min_y(), dst.max_y(), ct, H - cb));

  for (unsigned int j = 0; j < 3; ++j)
    {
      for (unsigned int i = 0; i < 3; ++i)
        {
          Rect s(Rect::from_ltrb(src_x[i], src_y[j], src_x[i + 1], src_y[j + 1]));
          Rect t(Rect::from_ltrb(dst_x[i], dst_y[j], dst_x[i + 1], dst_y[j + 1]));
          d->draw_image_rect(bitmap, s, t, paint);
        }
    }
}

const blendpaint::float3x3&
blendpaint::RasterCanvas::
transformation(void) const
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);
  return d->m_states.back().m_transform;
}

float
blendpaint::RasterCanvas::
clip_coverage(int x, int y) const
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);

  if (x < 0 || y < 0 || x >= d->m_dims.x() || y >= d->m_dims.y())
    {
      return 0.0f;
    }
  return d->clip_at(x, y);
}

blendpaint::RasterSurface&
blendpaint::RasterCanvas::
surface(void) const
{
  RasterCanvasPrivate *d;
  d = static_cast<RasterCanvasPrivate*>(m_d);
  return d->m_surface;
}
