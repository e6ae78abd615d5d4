#include "word_wrap.hpp"
#include "monospace_metrics.hpp"
#include <cctype>
#include <cmath>
#include <exception>
#include <algorithm>

static constexpr float FALLBACK_CHAR_RATIO = 0.5f;

static std::vector<std::string> split_paragraphs(const std::string& text) {
  std::vector<std::string> out;
  size_t st = 0;
  while (true) {
    size_t pos = text.find('\n', st);
    if (pos == std::string::npos) { out.emplace_back(text.substr(st)); break; }
    size_t end = pos;
    if (end > st && text[end - 1] == '\r') end--;
    out.emplace_back(text.substr(st, end - st));
    st = pos + 1;
  }
  return out;
}

std::vector<std::string> split_tokens(const std::string& text) {
  std::vector<std::string> tokens;
  size_t i = 0, n = text.size();
  while (i < n) {
    while (i < n && std::isspace(static_cast<unsigned char>(text[i]))) i++;
    size_t start = i;
    while (i < n && !std::isspace(static_cast<unsigned char>(text[i]))) i++;
    if (i > start) tokens.emplace_back(text.substr(start, i - start));
  }
  return tokens;
}

float estimate_width(const std::string& text, float size) {
  return static_cast<float>(utf8_length(text)) * size * FALLBACK_CHAR_RATIO;
}

float measure_or_estimate(const IFontMetrics& metrics,
                          const std::string& text,
                          Font font,
                          float size,
                          bool& degraded) {
  try {
    return metrics.measure_text(text, font, size);
  } catch (const std::exception&) {
    degraded = true;
    return estimate_width(text, size);
  } catch (...) {
    degraded = true;
    return estimate_width(text, size);
  }
}

template <typename Fits>
static void wrap_paragraph(const std::string& para, Fits fits, WrappedLines& out) {
  auto tokens = split_tokens(para);
  if (tokens.empty()) { out.emplace_back(); return; }
  std::string line;
  for (auto& tok : tokens) {
    if (line.empty()) { line = std::move(tok); continue; }
    std::string candidate = line + " " + tok;
    if (fits(candidate)) {
      line = std::move(candidate);
    } else {
      out.push_back(std::move(line));
      line = std::move(tok);
    }
  }
  out.push_back(std::move(line));
}

static WrappedLines wrap_by_chars(const std::vector<std::string>& paras, float size, float max_width) {
  size_t per_line = 1;
  if (size > 0.0f && max_width > 0.0f) {
    per_line = std::max<size_t>(1, static_cast<size_t>(std::floor(max_width / (size * FALLBACK_CHAR_RATIO))));
  }
  WrappedLines out;
  for (const auto& p : paras) {
    wrap_paragraph(p, [per_line](const std::string& s){ return utf8_length(s) <= per_line; }, out);
  }
  return out;
}

WrappedLines wrap_text(const std::string& text,
                       const IFontMetrics& metrics,
                       Font font,
                       float size,
                       float max_width,
                       std::string& msg) {
  auto paras = split_paragraphs(text);
  try {
    WrappedLines out;
    for (const auto& p : paras) {
      wrap_paragraph(p, [&](const std::string& s){ return metrics.measure_text(s, font, size) <= max_width; }, out);
    }
    return out;
  } catch (const std::exception& e) {
    msg = std::string("font metrics failed, estimating widths: ") + e.what();
    return wrap_by_chars(paras, size, max_width);
  } catch (...) {
    msg = "font metrics failed, estimating widths";
    return wrap_by_chars(paras, size, max_width);
  }
}

WrappedLines wrap_text(const std::string& text,
                       const IFontMetrics& metrics,
                       Font font,
                       float size,
                       float max_width) {
  std::string ignored;
  return wrap_text(text, metrics, font, size, max_width, ignored);
}

void font_extents(const IFontMetrics& metrics, Font font, float size, float& ascent, float& descent) {
  try {
    ascent = metrics.ascent(font, size);
    descent = metrics.descent(font, size);
  } catch (...) {
    ascent = size * 0.8f;
    descent = size * 0.2f;
  }
}
