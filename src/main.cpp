#include "script.hpp"
#include "monospace_metrics.hpp"
#include "pdf_surface.hpp"
#include "recording_surface.hpp"
#include "ncurses_surface.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

static int usage() {
  std::cerr << "usage: pagetab <script> [-o out.pdf] [--preview] [--dump]\n";
  return 2;
}

static void report(const std::vector<std::string>& msgs) {
  for (const auto& m : msgs) std::cerr << "pagetab: " << m << "\n";
}

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> script;
  std::optional<std::filesystem::path> out;
  bool preview = false, dump = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-o") {
      if (i + 1 >= argc) return usage();
      out = std::filesystem::path(argv[++i]);
    } else if (a == "--preview") {
      preview = true;
    } else if (a == "--dump") {
      dump = true;
    } else if (a == "-h" || a == "--help") {
      return usage();
    } else if (!script) {
      script = std::filesystem::path(a);
    } else {
      return usage();
    }
  }
  if (!script) return usage();

  ScriptParser parser;
  std::string msg;
  if (!parser.load_rc(msg)) std::cerr << "pagetab: " << msg << "\n";
  if (!parser.parse_file(*script, msg)) {
    std::cerr << "pagetab: " << msg << "\n";
    return 1;
  }
  report(parser.messages());
  const ScriptDocument& doc = parser.document();
  std::string title = doc.title.empty() ? script->stem().string() : doc.title;
  MonospaceMetrics metrics;

  if (dump) {
    RecordingSurface surface(metrics);
    RenderSession session(surface, metrics, doc.geometry);
    compose(session, doc);
    std::cout << surface.dump();
    report(session.messages);
    return 0;
  }
  if (preview) {
    NcursesSurface surface(metrics, doc.geometry);
    RenderSession session(surface, metrics, doc.geometry);
    compose(session, doc);
    surface.show(title);
    report(session.messages);
    return 0;
  }

  PdfSurface surface(metrics, doc.geometry);
  surface.set_title(title);
  RenderSession session(surface, metrics, doc.geometry);
  compose(session, doc);
  report(session.messages);
  std::filesystem::path target = out ? *out : std::filesystem::path(script->stem().string() + ".pdf");
  if (!surface.write_file(target, msg)) {
    std::cerr << "pagetab: " << msg << "\n";
    return 1;
  }
  std::cerr << "pagetab: " << msg << "\n";
  return 0;
}
