#pragma once
/*
 * PdfSurface
 *
 * Purpose: IDrawingSurface that emits a PDF 1.4 document (Courier base-14 fonts,
 * one content stream per page, URI link annotations).
 * Feature: safe writes (write .tmp -> fdatasync -> atomic rename).
 * Note: text outside Latin-1 is written as '?'.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "i_drawing_surface.hpp"

class PdfSurface : public IDrawingSurface {
public:
  PdfSurface(const IFontMetrics& metrics, const PageGeometry& geometry);

  float measure_text(const std::string& text, Font font, float size) const override;
  float ascent(Font font, float size) const override;
  float descent(Font font, float size) const override;

  void set_fill_color(const Color& c) override;
  void set_stroke_color(const Color& c) override;
  void draw_rect(float x, float y, float w, float h, bool fill, bool stroke) override;
  void draw_text(float x, float y, const std::string& text, Font font, float size) override;
  void start_new_page() override;
  void register_link(const std::string& url, float x, float y, float w, float h) override;
  int page_count() const override { return static_cast<int>(pages_.size()); }

  void set_title(const std::string& title) { title_ = title; }
  std::string serialize() const;
  bool write_file(const std::filesystem::path& path, std::string& msg) const;

private:
  struct Annotation {
    std::string url;
    float x, y, w, h;
  };
  struct Page {
    std::string content;
    std::vector<Annotation> links;
  };

  Page& page() { return pages_.back(); }

  const IFontMetrics& metrics_;
  PageGeometry geometry_;
  std::vector<Page> pages_;
  std::string title_;
};

std::string pdf_escape_text(const std::string& utf8);
