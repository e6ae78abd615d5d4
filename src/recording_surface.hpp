#pragma once
/*
 * RecordingSurface
 *
 * Purpose: headless surface that records every drawing call with its page.
 * Use: assertions in tests, --dump output, base of the terminal preview.
 */
#include <string>
#include <vector>
#include "i_drawing_surface.hpp"

struct DrawOp {
  enum class Kind { FillColor, StrokeColor, Rect, Text, NewPage, Link };
  Kind kind = Kind::Text;
  int page = 1;
  float x = 0.0f, y = 0.0f, w = 0.0f, h = 0.0f;
  bool fill = false;
  bool stroke = false;
  Font font = Font::Regular;
  float size = 0.0f;
  Color color{};
  std::string text; // text, or url for links
};

class RecordingSurface : public IDrawingSurface {
public:
  explicit RecordingSurface(const IFontMetrics& metrics) : metrics_(metrics) {}

  float measure_text(const std::string& text, Font font, float size) const override;
  float ascent(Font font, float size) const override;
  float descent(Font font, float size) const override;

  void set_fill_color(const Color& c) override;
  void set_stroke_color(const Color& c) override;
  void draw_rect(float x, float y, float w, float h, bool fill, bool stroke) override;
  void draw_text(float x, float y, const std::string& text, Font font, float size) override;
  void start_new_page() override;
  void register_link(const std::string& url, float x, float y, float w, float h) override;
  int page_count() const override { return page_; }

  const std::vector<DrawOp>& ops() const { return ops_; }
  std::vector<DrawOp> ops_of(DrawOp::Kind kind, int page = 0) const; // page 0: all pages
  std::vector<std::string> texts_on_page(int page) const;
  int count_text(const std::string& text, int page = 0) const;
  void set_fail_links(bool on) { fail_links_ = on; }
  std::string dump() const;

protected:
  const IFontMetrics& metrics_;
  std::vector<DrawOp> ops_;
  int page_ = 1;
  Color fill_{};
  Color stroke_{};
  bool fail_links_ = false;
};
