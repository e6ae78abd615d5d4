#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Color/Font/Cursor/PageGeometry).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 * Coordinates: bottom-up like PDF; y decreases as content is drawn.
 */
#include <string>
#include "config.hpp"

struct Color {
  float r = 0.0f;
  float g = 0.0f;
  float b = 0.0f;
  static Color from_hex(const std::string& hex, bool& ok);
  bool operator==(const Color&) const = default;
};

enum class Font { Regular, Bold, Italic };

struct Cursor { int page = 1; float y = 0.0f; };

struct PageGeometry {
  float width = PT_PAGE_WIDTH;
  float height = PT_PAGE_HEIGHT;
  float margin_top = 50.0f;
  float margin_bottom = 60.0f; // leaves room for the continuation note
  float margin_left = 40.0f;
  float margin_right = 40.0f;

  float top() const { return height - margin_top; }
  float bottom() const { return margin_bottom; }
  float usable_height() const { return top() - bottom(); }
  float content_width() const { return width - margin_left - margin_right; }
};

const char* font_name(Font f);
