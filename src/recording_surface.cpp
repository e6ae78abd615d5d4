#include "recording_surface.hpp"
#include "word_wrap.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

float RecordingSurface::measure_text(const std::string& text, Font font, float size) const {
  return metrics_.measure_text(text, font, size);
}
float RecordingSurface::ascent(Font font, float size) const { return metrics_.ascent(font, size); }
float RecordingSurface::descent(Font font, float size) const { return metrics_.descent(font, size); }

void RecordingSurface::set_fill_color(const Color& c) {
  fill_ = c;
  DrawOp op; op.kind = DrawOp::Kind::FillColor; op.page = page_; op.color = c;
  ops_.push_back(std::move(op));
}

void RecordingSurface::set_stroke_color(const Color& c) {
  stroke_ = c;
  DrawOp op; op.kind = DrawOp::Kind::StrokeColor; op.page = page_; op.color = c;
  ops_.push_back(std::move(op));
}

void RecordingSurface::draw_rect(float x, float y, float w, float h, bool fill, bool stroke) {
  DrawOp op;
  op.kind = DrawOp::Kind::Rect; op.page = page_;
  op.x = x; op.y = y; op.w = w; op.h = h;
  op.fill = fill; op.stroke = stroke;
  op.color = fill ? fill_ : stroke_;
  ops_.push_back(std::move(op));
}

void RecordingSurface::draw_text(float x, float y, const std::string& text, Font font, float size) {
  DrawOp op;
  op.kind = DrawOp::Kind::Text; op.page = page_;
  op.x = x; op.y = y;
  bool degraded = false;
  op.w = measure_or_estimate(metrics_, text, font, size, degraded);
  op.font = font; op.size = size; op.color = fill_;
  op.text = text;
  ops_.push_back(std::move(op));
}

void RecordingSurface::start_new_page() {
  page_++;
  DrawOp op; op.kind = DrawOp::Kind::NewPage; op.page = page_;
  ops_.push_back(std::move(op));
}

void RecordingSurface::register_link(const std::string& url, float x, float y, float w, float h) {
  if (fail_links_) throw std::runtime_error("link annotations unavailable");
  DrawOp op;
  op.kind = DrawOp::Kind::Link; op.page = page_;
  op.x = x; op.y = y; op.w = w; op.h = h;
  op.text = url;
  ops_.push_back(std::move(op));
}

std::vector<DrawOp> RecordingSurface::ops_of(DrawOp::Kind kind, int page) const {
  std::vector<DrawOp> out;
  for (const auto& op : ops_) {
    if (op.kind == kind && (page == 0 || op.page == page)) out.push_back(op);
  }
  return out;
}

std::vector<std::string> RecordingSurface::texts_on_page(int page) const {
  std::vector<std::string> out;
  for (const auto& op : ops_) if (op.kind == DrawOp::Kind::Text && op.page == page) out.push_back(op.text);
  return out;
}

int RecordingSurface::count_text(const std::string& text, int page) const {
  int n = 0;
  for (const auto& op : ops_) {
    if (op.kind == DrawOp::Kind::Text && op.text == text && (page == 0 || op.page == page)) n++;
  }
  return n;
}

std::string RecordingSurface::dump() const {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2);
  for (const auto& op : ops_) {
    switch (op.kind) {
      case DrawOp::Kind::FillColor:
      case DrawOp::Kind::StrokeColor:
        break;
      case DrawOp::Kind::Rect:
        oss << "p" << op.page << " rect " << op.x << " " << op.y << " " << op.w << " " << op.h
            << (op.fill ? " fill" : "") << (op.stroke ? " stroke" : "") << "\n";
        break;
      case DrawOp::Kind::Text:
        oss << "p" << op.page << " text " << op.x << " " << op.y << " " << font_name(op.font) << "/" << op.size
            << " \"" << op.text << "\"\n";
        break;
      case DrawOp::Kind::NewPage:
        oss << "p" << op.page << " newpage\n";
        break;
      case DrawOp::Kind::Link:
        oss << "p" << op.page << " link " << op.x << " " << op.y << " " << op.w << " " << op.h << " " << op.text << "\n";
        break;
    }
  }
  return oss.str();
}
