#pragma once
/*
 * MonospaceMetrics
 *
 * Purpose: fixed-advance metrics; advance_ratio 0.6 matches PDF Courier.
 * Width counts UTF-8 code points, not bytes.
 */
#include <cstddef>
#include "i_font_metrics.hpp"

size_t utf8_length(const std::string& s);

class MonospaceMetrics : public IFontMetrics {
public:
  MonospaceMetrics() = default;
  explicit MonospaceMetrics(float advance_ratio) : advance_ratio_(advance_ratio) {}
  float measure_text(const std::string& text, Font font, float size) const override;
  float ascent(Font font, float size) const override;
  float descent(Font font, float size) const override;
private:
  float advance_ratio_ = 0.6f;
};
