#pragma once
/*
 * IDrawingSurface
 *
 * Purpose: abstract immediate-mode page backend (rects, text, pages, link regions).
 * Goal: decouple layout from concrete impls (pdf/ncurses/recording), enable testing.
 * Note: carries its own page cursor; never share one surface across threads.
 */
#include <string>
#include "i_font_metrics.hpp"

class IDrawingSurface : public IFontMetrics {
public:
  virtual void set_fill_color(const Color& c) = 0;
  virtual void set_stroke_color(const Color& c) = 0;
  virtual void draw_rect(float x, float y, float w, float h, bool fill, bool stroke) = 0;
  virtual void draw_text(float x, float y, const std::string& text, Font font, float size) = 0;
  virtual void start_new_page() = 0;
  virtual void register_link(const std::string& url, float x, float y, float w, float h) = 0;
  virtual int page_count() const = 0;
};
