/*!
 * \file painter_enums.cpp
 * \brief file painter_enums.cpp
 *
 * Copyright 2016 by Intel.
 *
 * Contact: kevin.rogovin@gmail.com
 *
 * This Source Code Form is subject to the
 * terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with
 * this file, You can obtain one at
 * http://mozilla.org/MPL/2.0/.
 *
 * \author Kevin Rogovin <kevin.rogovin@gmail.com>
 *
 */


#include <blendpaint/painter/painter_enums.hpp>

enum blendpaint::PainterEnums::filter_t
blendpaint::PainterEnums::
filter_for_quality(enum filter_quality_t q)
{
  switch (q)
    {
    case filter_quality_none:
      return filter_nearest;

    case filter_quality_high:
      return filter_cubic;

    default:
      return filter_linear;
    }
}

blendpaint::c_string
blendpaint::PainterEnums::
label(enum filter_quality_t v)
{
  static const c_string labels[number_filter_quality] =
    {
      /* [filter_quality_none] */ "filter_quality_none",
      /* [filter_quality_low] */ "filter_quality_low",
      /* [filter_quality_medium] */ "filter_quality_medium",
      /* [filter_quality_high] */ "filter_quality_high",
    };
  return (v < number_filter_quality) ? labels[v] : "InvalidEnum";
}

blendpaint::c_string
blendpaint::PainterEnums::
label(enum filter_t v)
{
  switch (v)
    {
    case filter_nearest:
      return "filter_nearest";
    case filter_linear:
      return "filter_linear";
    case filter_cubic:
      return "filter_cubic";
    }
  return "InvalidEnum";
}

blendpaint::c_string
blendpaint::PainterEnums::
label(enum image_repeat_t v)
{
  static const c_string labels[number_image_repeat] =
    {
      /* [image_repeat] */ "image_repeat",
      /* [image_repeat_x] */ "image_repeat_x",
      /* [image_repeat_y] */ "image_repeat_y",
      /* [image_no_repeat] */ "image_no_repeat",
    };
  return (v < number_image_repeat) ? labels[v] : "InvalidEnum";
}

blendpaint::c_string
blendpaint::PainterEnums::
label(enum box_fit_t v)
{
  static const c_string labels[number_box_fit] =
    {
      /* [box_fit_fill] */ "box_fit_fill",
      /* [box_fit_contain] */ "box_fit_contain",
      /* [box_fit_cover] */ "box_fit_cover",
      /* [box_fit_fit_width] */ "box_fit_fit_width",
      /* [box_fit_fit_height] */ "box_fit_fit_height",
      /* [box_fit_none] */ "box_fit_none",
      /* [box_fit_scale_down] */ "box_fit_scale_down",
    };
  return (v < number_box_fit) ? labels[v] : "InvalidEnum";
}

blendpaint::c_string
blendpaint::PainterEnums::
label(enum text_direction_t v)
{
  static const c_string labels[number_text_direction] =
    {
      /* [text_direction_rtl] */ "text_direction_rtl",
      /* [text_direction_ltr] */ "text_direction_ltr",
    };
  return (v < number_text_direction) ? labels[v] : "InvalidEnum";
}

blendpaint::c_string
blendpaint::PainterEnums::
label(enum fill_rule_t v)
{
  static const c_string labels[number_fill_rule] =
    {
      /* [odd_even_fill_rule] */ "odd_even_fill_rule",
      /* [complement_odd_even_fill_rule] */ "complement_odd_even_fill_rule",
      /* [nonzero_fill_rule] */ "nonzero_fill_rule",
      /* [complement_nonzero_fill_rule] */ "complement_nonzero_fill_rule",
    };
  return (v < number_fill_rule) ? labels[v] : "InvalidEnum";
}

blendpaint::c_string
blendpaint::PainterEnums::
label(enum blend_mode_t v)
{
  static const c_string labels[number_blend_mode] =
    {
      /* [blend_porter_duff_clear] */ "blend_porter_duff_clear",
      /* [blend_porter_duff_src] */ "blend_porter_duff_src",
      /* [blend_porter_duff_dst] */ "blend_porter_duff_dst",
      /* [blend_porter_duff_src_over] */ "blend_porter_duff_src_over",
      /* [blend_porter_duff_dst_over] */ "blend_porter_duff_dst_over",
      /* [blend_porter_duff_src_in] */ "blend_porter_duff_src_in",
      /* [blend_porter_duff_dst_in] */ "blend_porter_duff_dst_in",
      /* [blend_porter_duff_src_out] */ "blend_porter_duff_src_out",
      /* [blend_porter_duff_dst_out] */ "blend_porter_duff_dst_out",
      /* [blend_porter_duff_src_atop] */ "blend_porter_duff_src_atop",
      /* [blend_porter_duff_dst_atop] */ "blend_porter_duff_dst_atop",
      /* [blend_porter_duff_xor] */ "blend_porter_duff_xor",
      /* [blend_porter_duff_plus] */ "blend_porter_duff_plus",
      /* [blend_porter_duff_modulate] */ "blend_porter_duff_modulate",
      /* [blend_w3c_screen] */ "blend_w3c_screen",
      /* [blend_w3c_overlay] */ "blend_w3c_overlay",
      /* [blend_w3c_darken] */ "blend_w3c_darken",
      /* [blend_w3c_lighten] */ "blend_w3c_lighten",
      /* [blend_w3c_color_dodge] */ "blend_w3c_color_dodge",
      /* [blend_w3c_color_burn] */ "blend_w3c_color_burn",
      /* [blend_w3c_hardlight] */ "blend_w3c_hardlight",
      /* [blend_w3c_softlight] */ "blend_w3c_softlight",
      /* [blend_w3c_difference] */ "blend_w3c_difference",
      /* [blend_w3c_exclusion] */ "blend_w3c_exclusion",
      /* [blend_w3c_multiply] */ "blend_w3c_multiply",
      /* [blend_w3c_hue] */ "blend_w3c_hue",
      /* [blend_w3c_saturation] */ "blend_w3c_saturation",
      /* [blend_w3c_color] */ "blend_w3c_color",
      /* [blend_w3c_luminosity] */ "blend_w3c_luminosity",
    };
  return (v < number_blend_mode) ? labels[v] : "InvalidEnum";
}
