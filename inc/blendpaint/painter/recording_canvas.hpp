/*!
 * \file recording_canvas.hpp
 * \brief file recording_canvas.hpp
 *
 * Copyright 2016 by Intel.
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

#include <vector>
#include <iosfwd>
#include <blendpaint/painter/canvas.hpp>

namespace blendpaint
{
/*!\addtogroup Painter
 * @{
 */

  /*!
   * \brief
   * A CanvasCommand is the record of a single call
   * made to a Canvas.
   */
  class CanvasCommand
  {
  public:
    /*!
     * \brief
     * Enumeration of the Canvas calls.
     */
    enum type_t
      {
        save_command, /*!< Canvas::save() */
        save_layer_command, /*!< Canvas::save_layer() */
        restore_command, /*!< Canvas::restore() */
        translate_command, /*!< Canvas::translate() */
        scale_command, /*!< Canvas::scale() */
        concat_command, /*!< Canvas::concat() */
        clip_rect_command, /*!< Canvas::clip_rect() */
        clip_path_command, /*!< Canvas::clip_path() */
        draw_image_rect_command, /*!< Canvas::draw_image_rect() */
        draw_image_nine_command, /*!< Canvas::draw_image_nine() */

        number_command_types
      };

    explicit
    CanvasCommand(enum type_t tp):
      m_type(tp),
      m_values(0.0f, 0.0f)
    {}

    /*!
     * Returns a string for a type_t value.
     */
    static
    c_string
    label(enum type_t v);

    /*!
     * The call made.
     */
    enum type_t m_type;

    /*!
     * The Rect of a call to save_layer() or clip_rect(),
     * the source rectangle of a call to draw_image_rect()
     * or the center of a call to draw_image_nine().
     */
    Rect m_rect;

    /*!
     * The destination of a call to draw_image_rect()
     * or draw_image_nine().
     */
    Rect m_dst;

    /*!
     * The arguments to translate() or scale().
     */
    vec2 m_values;

    /*!
     * The argument to concat().
     */
    float3x3 m_matrix;

    /*!
     * The argument to clip_path().
     */
    Path m_path;

    /*!
     * The Paint of a call to save_layer(),
     * draw_image_rect() or draw_image_nine().
     */
    Paint m_paint;

    /*!
     * The image of a call to draw_image_rect()
     * or draw_image_nine().
     */
    reference_counted_ptr<Image> m_image;
  };

  /*!
   * Print a CanvasCommand.
   */
  std::ostream&
  operator<<(std::ostream &str, const CanvasCommand &cmd);

  /*!
   * \brief
   * A RecordingCanvas records each call made to it
   * as a CanvasCommand; the calls can be replayed onto
   * another Canvas.
   */
  class RecordingCanvas:public Canvas
  {
  public:
    RecordingCanvas(void);

    virtual
    void
    save(void);

    virtual
    void
    save_layer(const Rect &bounds, const Paint &paint);

    virtual
    void
    restore(void);

    virtual
    int
    save_count(void) const;

    virtual
    void
    translate(float dx, float dy);

    virtual
    void
    scale(float sx, float sy);

    virtual
    void
    concat(const float3x3 &m);

    virtual
    void
    clip_rect(const Rect &r);

    virtual
    void
    clip_path(const Path &path);

    virtual
    void
    draw_image_rect(const reference_counted_ptr<Image> &image,
                    const Rect &src, const Rect &dst,
                    const Paint &paint);

    virtual
    void
    draw_image_nine(const reference_counted_ptr<Image> &image,
                    const Rect &center, const Rect &dst,
                    const Paint &paint);

    /*!
     * Returns the commands recorded.
     */
    const std::vector<CanvasCommand>&
    commands(void) const
    {
      return m_commands;
    }

    /*!
     * Returns the number of recorded commands of a type.
     */
    unsigned int
    count(enum CanvasCommand::type_t tp) const;

    /*!
     * Clear the recorded commands and reset the
     * save count to 1.
     */
    void
    clear(void);

    /*!
     * Make each recorded call onto another Canvas, in
     * order. Any saves not restored by the recording are
     * restored at the end, so the save count of dst is
     * unchanged.
     */
    void
    replay(Canvas &dst) const;

  private:
    std::vector<CanvasCommand> m_commands;
    int m_save_count;
  };

/*! @} */
}
