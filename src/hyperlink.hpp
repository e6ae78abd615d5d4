#pragma once
/*
 * Hyperlink
 *
 * Purpose: hot-zone of rendered link text and its registration on the surface.
 * Constraint: zone is the text's own box (x, baseline-descent, width, ascent+descent),
 * never the surrounding cell.
 */
#include <string>
#include "i_font_metrics.hpp"
#include "render_session.hpp"

struct LinkZone {
  float x = 0.0f;
  float y = 0.0f; // bottom edge
  float w = 0.0f;
  float h = 0.0f;
  bool empty() const { return w <= 0.0f || h <= 0.0f; }
};

LinkZone text_hot_zone(const IFontMetrics& metrics, Font font, float size, float x, float baseline, float width);
LinkZone union_zone(const LinkZone& a, const LinkZone& b);
bool register_link(RenderSession& session, const std::string& url, const LinkZone& zone);
