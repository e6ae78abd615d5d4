#include "monospace_metrics.hpp"

size_t utf8_length(const std::string& s) {
  size_t n = 0;
  size_t i = 0;
  while (i < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    size_t step = 1;
    if (c >= 0xF0 && c <= 0xF7) step = 4;
    else if (c >= 0xE0) step = (c <= 0xEF) ? 3 : 1;
    else if (c >= 0xC2) step = 2;
    if (i + step > s.size()) step = 1;
    for (size_t k = 1; k < step; ++k) {
      if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) { step = 1; break; }
    }
    i += step;
    n++;
  }
  return n;
}

float MonospaceMetrics::measure_text(const std::string& text, Font, float size) const {
  return static_cast<float>(utf8_length(text)) * size * advance_ratio_;
}

float MonospaceMetrics::ascent(Font, float size) const { return size * 0.8f; }

float MonospaceMetrics::descent(Font, float size) const { return size * 0.2f; }
