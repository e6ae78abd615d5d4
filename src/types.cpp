#include "types.hpp"
#include <cctype>

static int hex_digit(unsigned char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = static_cast<unsigned char>(std::tolower(c));
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

Color Color::from_hex(const std::string& hex, bool& ok) {
  ok = false;
  std::string s = hex;
  if (!s.empty() && s[0] == '#') s.erase(s.begin());
  if (s.size() == 3) s = std::string{s[0], s[0], s[1], s[1], s[2], s[2]};
  if (s.size() != 6) return Color{};
  int v[6];
  for (int i = 0; i < 6; ++i) {
    v[i] = hex_digit(static_cast<unsigned char>(s[i]));
    if (v[i] < 0) return Color{};
  }
  ok = true;
  return Color{(v[0] * 16 + v[1]) / 255.0f, (v[2] * 16 + v[3]) / 255.0f, (v[4] * 16 + v[5]) / 255.0f};
}

const char* font_name(Font f) {
  switch (f) {
    case Font::Bold: return "bold";
    case Font::Italic: return "italic";
    default: return "regular";
  }
}
