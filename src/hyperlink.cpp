#include "hyperlink.hpp"
#include "word_wrap.hpp"
#include <algorithm>
#include <exception>

LinkZone text_hot_zone(const IFontMetrics& metrics, Font font, float size, float x, float baseline, float width) {
  float asc = 0.0f, desc = 0.0f;
  font_extents(metrics, font, size, asc, desc);
  return LinkZone{x, baseline - desc, width, asc + desc};
}

LinkZone union_zone(const LinkZone& a, const LinkZone& b) {
  if (a.empty()) return b;
  if (b.empty()) return a;
  float x0 = std::min(a.x, b.x), y0 = std::min(a.y, b.y);
  float x1 = std::max(a.x + a.w, b.x + b.w), y1 = std::max(a.y + a.h, b.y + b.h);
  return LinkZone{x0, y0, x1 - x0, y1 - y0};
}

bool register_link(RenderSession& session, const std::string& url, const LinkZone& zone) {
  if (url.empty()) { note(session, "link without url skipped"); return false; }
  if (zone.empty()) { note(session, "link has no visible text: " + url); return false; }
  try {
    session.surface.register_link(url, zone.x, zone.y, zone.w, zone.h);
  } catch (const std::exception& e) {
    if (!session.options.continue_on_error) throw;
    note(session, std::string("link registration failed: ") + e.what());
    return false;
  }
  return true;
}
