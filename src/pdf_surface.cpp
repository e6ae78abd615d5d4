#include "pdf_surface.hpp"
#include "posix_fd.hpp"
#include <algorithm>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>

static const char* kFontResources[] = {"Courier", "Courier-Bold", "Courier-Oblique"};

static int font_index(Font f) {
  switch (f) {
    case Font::Bold: return 1;
    case Font::Italic: return 2;
    default: return 0;
  }
}

static std::string num(float v) {
  char b[32];
  std::snprintf(b, sizeof(b), "%.2f", static_cast<double>(v));
  return b;
}

static std::string color_op(const Color& c, const char* op) {
  return num(c.r) + " " + num(c.g) + " " + num(c.b) + " " + op + "\n";
}

// UTF-8 to single-byte Latin-1; escapes the PDF string delimiters.
std::string pdf_escape_text(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    unsigned cp = c;
    size_t step = 1;
    if (c >= 0xC2 && c <= 0xDF && i + 1 < s.size() && (static_cast<unsigned char>(s[i + 1]) & 0xC0) == 0x80) { cp = ((c & 0x1Fu) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3Fu); step = 2; }
    else if (c >= 0xE0 && c <= 0xEF) { cp = 0xFFFD; step = 3; }
    else if (c >= 0xF0 && c <= 0xF7) { cp = 0xFFFD; step = 4; }
    else if (c >= 0x80) { cp = 0xFFFD; }
    i += std::min(step, s.size() - i);
    if (cp > 0xFF) { out += '?'; continue; }
    if (cp < 0x20) continue;
    char ch = static_cast<char>(cp);
    if (ch == '(' || ch == ')' || ch == '\\') out += '\\';
    out += ch;
  }
  return out;
}

static std::string escape_literal(const std::string& s) {
  std::string out;
  for (char ch : s) {
    if (ch == '(' || ch == ')' || ch == '\\') out += '\\';
    out += ch;
  }
  return out;
}

PdfSurface::PdfSurface(const IFontMetrics& metrics, const PageGeometry& geometry)
  : metrics_(metrics), geometry_(geometry) {
  start_new_page();
}

float PdfSurface::measure_text(const std::string& text, Font font, float size) const {
  return metrics_.measure_text(text, font, size);
}
float PdfSurface::ascent(Font font, float size) const { return metrics_.ascent(font, size); }
float PdfSurface::descent(Font font, float size) const { return metrics_.descent(font, size); }

void PdfSurface::set_fill_color(const Color& c) { page().content += color_op(c, "rg"); }

void PdfSurface::set_stroke_color(const Color& c) { page().content += color_op(c, "RG"); }

void PdfSurface::draw_rect(float x, float y, float w, float h, bool fill, bool stroke) {
  if (!fill && !stroke) return;
  const char* paint = fill && stroke ? "B" : fill ? "f" : "S";
  page().content += num(x) + " " + num(y) + " " + num(w) + " " + num(h) + " re " + paint + "\n";
}

void PdfSurface::draw_text(float x, float y, const std::string& text, Font font, float size) {
  page().content += "BT /F" + std::to_string(font_index(font) + 1) + " " + num(size) + " Tf "
                  + num(x) + " " + num(y) + " Td (" + pdf_escape_text(text) + ") Tj ET\n";
}

void PdfSurface::start_new_page() {
  pages_.emplace_back();
  page().content = "0.5 w\n";
}

void PdfSurface::register_link(const std::string& url, float x, float y, float w, float h) {
  page().links.push_back(Annotation{url, x, y, w, h});
}

std::string PdfSurface::serialize() const {
  // ids: 1 catalog, 2 pages, 3..5 fonts, 6 info, then per page: content, annotations, page
  const int first_page_obj = 7;
  std::vector<int> content_ids, page_ids;
  std::vector<std::vector<int>> annot_ids(pages_.size());
  int next = first_page_obj;
  for (size_t i = 0; i < pages_.size(); ++i) {
    content_ids.push_back(next++);
    for (size_t k = 0; k < pages_[i].links.size(); ++k) annot_ids[i].push_back(next++);
    page_ids.push_back(next++);
  }
  std::vector<size_t> offsets(static_cast<size_t>(next), 0);
  std::string out = "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
  auto begin_obj = [&](int id) {
    offsets[static_cast<size_t>(id)] = out.size();
    out += std::to_string(id) + " 0 obj\n";
  };
  auto end_obj = [&]() { out += "endobj\n"; };

  begin_obj(1);
  out += "<< /Type /Catalog /Pages 2 0 R >>\n";
  end_obj();
  begin_obj(2);
  out += "<< /Type /Pages /Kids [";
  for (int id : page_ids) out += std::to_string(id) + " 0 R ";
  out += "] /Count " + std::to_string(page_ids.size()) + " >>\n";
  end_obj();
  for (int f = 0; f < 3; ++f) {
    begin_obj(3 + f);
    out += std::string("<< /Type /Font /Subtype /Type1 /BaseFont /") + kFontResources[f] + " /Encoding /WinAnsiEncoding >>\n";
    end_obj();
  }
  begin_obj(6);
  out += "<< /Producer (pagetab)";
  if (!title_.empty()) out += " /Title (" + pdf_escape_text(title_) + ")";
  out += " >>\n";
  end_obj();

  for (size_t i = 0; i < pages_.size(); ++i) {
    const Page& p = pages_[i];
    begin_obj(content_ids[i]);
    out += "<< /Length " + std::to_string(p.content.size()) + " >>\nstream\n" + p.content + "endstream\n";
    end_obj();
    for (size_t k = 0; k < p.links.size(); ++k) {
      const Annotation& a = p.links[k];
      begin_obj(annot_ids[i][k]);
      out += "<< /Type /Annot /Subtype /Link /Rect [" + num(a.x) + " " + num(a.y) + " " + num(a.x + a.w) + " " + num(a.y + a.h)
           + "] /Border [0 0 0] /A << /Type /Action /S /URI /URI (" + escape_literal(a.url) + ") >> >>\n";
      end_obj();
    }
    begin_obj(page_ids[i]);
    out += "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " + num(geometry_.width) + " " + num(geometry_.height) + "]"
         + " /Resources << /Font << /F1 3 0 R /F2 4 0 R /F3 5 0 R >> >>"
         + " /Contents " + std::to_string(content_ids[i]) + " 0 R";
    if (!annot_ids[i].empty()) {
      out += " /Annots [";
      for (int id : annot_ids[i]) out += std::to_string(id) + " 0 R ";
      out += "]";
    }
    out += " >>\n";
    end_obj();
  }

  size_t xref = out.size();
  out += "xref\n0 " + std::to_string(next) + "\n0000000000 65535 f \n";
  char line[32];
  for (int id = 1; id < next; ++id) {
    std::snprintf(line, sizeof(line), "%010zu 00000 n \n", offsets[static_cast<size_t>(id)]);
    out += line;
  }
  out += "trailer\n<< /Size " + std::to_string(next) + " /Root 1 0 R /Info 6 0 R >>\nstartxref\n" + std::to_string(xref) + "\n%%EOF\n";
  return out;
}

bool PdfSurface::write_file(const std::filesystem::path& path, std::string& msg) const {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  std::string doc = serialize();
  const size_t chunk = static_cast<size_t>(PT_WRITE_CHUNK_SIZE);
  for (size_t off = 0; off < doc.size(); off += chunk) {
    if (!write_all(ufd.get(), doc.data() + off, std::min(chunk, doc.size() - off))) {
      msg = std::string("write file failed: ") + tmp.string();
      return false;
    }
  }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#endif
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = std::string("write file failed: ") + path.string(); return false; }
  msg = "wrote " + std::to_string(pages_.size()) + " pages: " + path.string();
  return true;
}
