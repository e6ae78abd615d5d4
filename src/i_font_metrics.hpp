#pragma once
/*
 * IFontMetrics
 *
 * Purpose: text measurement contract (advance width, ascent, descent).
 * Goal: injected into surfaces and layout code; no global metrics singleton.
 * Note: implementations may throw; layout code falls back to estimates.
 */
#include <string>
#include "types.hpp"

class IFontMetrics {
public:
  virtual ~IFontMetrics() = default;
  virtual float measure_text(const std::string& text, Font font, float size) const = 0;
  virtual float ascent(Font font, float size) const = 0;
  virtual float descent(Font font, float size) const = 0; // positive, below baseline
};
