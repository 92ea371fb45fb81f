/*!
 * \file blend.cpp
 * \brief file blend.cpp
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

#include <blendpaint/painter/blend.hpp>
#include <blendpaint/util/math.hpp>

namespace
{
  typedef float (*separable_fcn)(float S, float D);

  blendpaint::vec3
  undo_alpha(const blendpaint::vec4 &C)
  {
    if (C.w() <= 0.0f)
      {
        return blendpaint::vec3(0.0f);
      }
    return blendpaint::vec3(C.x() / C.w(), C.y() / C.w(), C.z() / C.w());
  }

  float
  min_color_channel(const blendpaint::vec3 &C)
  {
    return blendpaint::t_min(C.x(), blendpaint::t_min(C.y(), C.z()));
  }

  float
  max_color_channel(const blendpaint::vec3 &C)
  {
    return blendpaint::t_max(C.x(), blendpaint::t_max(C.y(), C.z()));
  }

  float
  luminosity(const blendpaint::vec3 &C)
  {
    return C.dot(blendpaint::vec3(0.30f, 0.59f, 0.11f));
  }

  float
  saturation(const blendpaint::vec3 &C)
  {
    return max_color_channel(C) - min_color_channel(C);
  }

  blendpaint::vec3
  clip_color(blendpaint::vec3 C)
  {
    float L(luminosity(C));
    float MinC(min_color_channel(C));
    float MaxC(max_color_channel(C));
    blendpaint::vec3 vL(L);

    if (MinC < 0.0f)
      {
        C = vL + (C - vL) * (L / (L - MinC));
      }

    if (MaxC > 1.0f)
      {
        C = vL + (C - vL) * ((1.0f - L) / (MaxC - L));
      }
    return C;
  }

  blendpaint::vec3
  override_luminosity(const blendpaint::vec3 &C, const blendpaint::vec3 &L)
  {
    float delta(luminosity(L) - luminosity(C));
    return clip_color(C + blendpaint::vec3(delta));
  }

  blendpaint::vec3
  override_luminosity_and_saturation(blendpaint::vec3 C,
                                     const blendpaint::vec3 &S,
                                     const blendpaint::vec3 &L)
  {
    float Cmin(min_color_channel(C));
    float Csat(saturation(C));
    float Ssat(saturation(S));

    if (Csat > 0.0f)
      {
        C = (C - blendpaint::vec3(Cmin)) * (Ssat / Csat);
      }
    else
      {
        C = blendpaint::vec3(0.0f);
      }
    return override_luminosity(C, L);
  }

  float
  screen(float S, float D)
  {
    return S + D - S * D;
  }

  float
  multiply(float S, float D)
  {
    return S * D;
  }

  float
  hardlight(float S, float D)
  {
    return (S <= 0.5f) ?
      2.0f * S * D :
      1.0f - 2.0f * (1.0f - S) * (1.0f - D);
  }

  float
  overlay(float S, float D)
  {
    return hardlight(D, S);
  }

  float
  darken(float S, float D)
  {
    return blendpaint::t_min(S, D);
  }

  float
  lighten(float S, float D)
  {
    return blendpaint::t_max(S, D);
  }

  float
  color_dodge(float S, float D)
  {
    if (D <= 0.0f)
      {
        return 0.0f;
      }
    else if (S < 1.0f)
      {
        return blendpaint::t_min(1.0f, D / (1.0f - S));
      }
    return 1.0f;
  }

  float
  color_burn(float S, float D)
  {
    if (D >= 1.0f)
      {
        return 1.0f;
      }
    else if (S > 0.0f)
      {
        return 1.0f - blendpaint::t_min(1.0f, (1.0f - D) / S);
      }
    return 0.0f;
  }

  float
  softlight(float S, float D)
  {
    if (S <= 0.5f)
      {
        return D - (1.0f - 2.0f * S) * D * (1.0f - D);
      }
    else if (D <= 0.25f)
      {
        return D + (2.0f * S - 1.0f) * D * ((16.0f * D - 12.0f) * D + 3.0f);
      }
    return D + (2.0f * S - 1.0f) * (blendpaint::t_sqrt(D) - D);
  }

  float
  difference(float S, float D)
  {
    return blendpaint::t_abs(S - D);
  }

  float
  exclusion(float S, float D)
  {
    return S + D - 2.0f * S * D;
  }

  blendpaint::vec3
  apply_separable(separable_fcn f,
                  const blendpaint::vec3 &S,
                  const blendpaint::vec3 &D)
  {
    return blendpaint::vec3(f(S.x(), D.x()),
                            f(S.y(), D.y()),
                            f(S.z(), D.z()));
  }

  /* F.a = S.a + D.a * (1 - S.a)
   * F.rgb = f * S.a * D.a + S.rgb * (1 - D.a) + D.rgb * (1 - S.a)
   */
  blendpaint::vec4
  w3c_composite(const blendpaint::vec4 &S, const blendpaint::vec4 &D,
                const blendpaint::vec3 &f)
  {
    blendpaint::vec4 F;
    float sa(S.w()), da(D.w());

    F.w() = sa + da * (1.0f - sa);
    for (unsigned int c = 0; c < 3; ++c)
      {
        F[c] = f[c] * sa * da + S[c] * (1.0f - da) + D[c] * (1.0f - sa);
      }
    return F;
  }

  blendpaint::vec4
  clamp_color(const blendpaint::vec4 &C)
  {
    blendpaint::vec4 R;
    for (unsigned int c = 0; c < 4; ++c)
      {
        R[c] = blendpaint::t_clamp(C[c], 0.0f, 1.0f);
      }
    return R;
  }
}

blendpaint::vec4
blendpaint::
premultiply(const vec4 &c)
{
  return vec4(c.x() * c.w(), c.y() * c.w(), c.z() * c.w(), c.w());
}

blendpaint::vec4
blendpaint::
unpremultiply(const vec4 &c)
{
  if (c.w() <= 0.0f)
    {
      return vec4(0.0f);
    }
  return vec4(undo_alpha(c), c.w());
}

blendpaint::vec4
blendpaint::
blend_colors(enum PainterEnums::blend_mode_t mode,
             const vec4 &S, const vec4 &D)
{
  vec4 F;
  float sa(S.w()), da(D.w());

  switch (mode)
    {
    case PainterEnums::blend_porter_duff_clear:
      F = vec4(0.0f);
      break;

    case PainterEnums::blend_porter_duff_src:
      F = S;
      break;

    case PainterEnums::blend_porter_duff_dst:
      F = D;
      break;

    case PainterEnums::blend_porter_duff_src_over:
      F = S + D * (1.0f - sa);
      break;

    case PainterEnums::blend_porter_duff_dst_over:
      F = D + S * (1.0f - da);
      break;

    case PainterEnums::blend_porter_duff_src_in:
      F = S * da;
      break;

    case PainterEnums::blend_porter_duff_dst_in:
      F = D * sa;
      break;

    case PainterEnums::blend_porter_duff_src_out:
      F = S * (1.0f - da);
      break;

    case PainterEnums::blend_porter_duff_dst_out:
      F = D * (1.0f - sa);
      break;

    case PainterEnums::blend_porter_duff_src_atop:
      F = S * da + D * (1.0f - sa);
      F.w() = da;
      break;

    case PainterEnums::blend_porter_duff_dst_atop:
      F = D * sa + S * (1.0f - da);
      F.w() = sa;
      break;

    case PainterEnums::blend_porter_duff_xor:
      F = S * (1.0f - da) + D * (1.0f - sa);
      break;

    case PainterEnums::blend_porter_duff_plus:
      F = S + D;
      break;

    case PainterEnums::blend_porter_duff_modulate:
      F = S * D;
      break;

    case PainterEnums::blend_w3c_screen:
      F = w3c_composite(S, D, apply_separable(screen, undo_alpha(S), undo_alpha(D)));
      break;

    case PainterEnums::blend_w3c_overlay:
      F = w3c_composite(S, D, apply_separable(overlay, undo_alpha(S), undo_alpha(D)));
      break;

    case PainterEnums::blend_w3c_darken:
      F = w3c_composite(S, D, apply_separable(darken, undo_alpha(S), undo_alpha(D)));
      break;

    case PainterEnums::blend_w3c_lighten:
      F = w3c_composite(S, D, apply_separable(lighten, undo_alpha(S), undo_alpha(D)));
      break;

    case PainterEnums::blend_w3c_color_dodge:
      F = w3c_composite(S, D, apply_separable(color_dodge, undo_alpha(S), undo_alpha(D)));
      break;

    case PainterEnums::blend_w3c_color_burn:
      F = w3c_composite(S, D, apply_separable(color_burn, undo_alpha(S), undo_alpha(D)));
      break;

    case PainterEnums::blend_w3c_hardlight:
      F = w3c_composite(S, D, apply_separable(hardlight, undo_alpha(S), undo_alpha(D)));
      break;

    case PainterEnums::blend_w3c_softlight:
      F = w3c_composite(S, D, apply_separable(softlight, undo_alpha(S), undo_alpha(D)));
      break;

    case PainterEnums::blend_w3c_difference:
      F = w3c_composite(S, D, apply_separable(difference, undo_alpha(S), undo_alpha(D)));
      break;

    case PainterEnums::blend_w3c_exclusion:
      F = w3c_composite(S, D, apply_separable(exclusion, undo_alpha(S), undo_alpha(D)));
      break;

    case PainterEnums::blend_w3c_multiply:
      F = w3c_composite(S, D, apply_separable(multiply, undo_alpha(S), undo_alpha(D)));
      break;

    case PainterEnums::blend_w3c_hue:
      {
        vec3 s(undo_alpha(S)), d(undo_alpha(D));
        F = w3c_composite(S, D, override_luminosity_and_saturation(s, d, d));
      }
      break;

    case PainterEnums::blend_w3c_saturation:
      {
        vec3 s(undo_alpha(S)), d(undo_alpha(D));
        F = w3c_composite(S, D, override_luminosity_and_saturation(d, s, d));
      }
      break;

    case PainterEnums::blend_w3c_color:
      F = w3c_composite(S, D, override_luminosity(undo_alpha(S), undo_alpha(D)));
      break;

    case PainterEnums::blend_w3c_luminosity:
      F = w3c_composite(S, D, override_luminosity(undo_alpha(D), undo_alpha(S)));
      break;

    default:
      BLENDPAINTmessaged_assert(false, "Invalid blend_mode_t");
      F = S + D * (1.0f - sa);
    }

  return clamp_color(F);
}
