#include "hyperlink.hpp"
#include "recording_surface.hpp"
#include "monospace_metrics.hpp"
#include "test_helpers.hpp"
#include <cassert>
#include <string>

static void zone_is_text_box() {
  MonospaceMetrics m;
  LinkZone z = text_hot_zone(m, Font::Regular, 8.0f, 144.0f, 89.6f, 19.2f);
  assert(near(z.x, 144.0f));
  assert(near(z.y, 88.0f));
  assert(near(z.w, 19.2f));
  assert(near(z.h, 8.0f));
  assert(!z.empty());
}

static void zone_without_metrics() {
  ThrowingMetrics bad;
  LinkZone z = text_hot_zone(bad, Font::Regular, 10.0f, 0.0f, 100.0f, 30.0f);
  assert(!z.empty());
  assert(z.y < 100.0f && z.y + z.h > 100.0f);
}

static void union_of_lines() {
  LinkZone a{10.0f, 80.0f, 40.0f, 8.0f};
  LinkZone b{10.0f, 70.0f, 25.0f, 8.0f};
  LinkZone u = union_zone(a, b);
  assert(near(u.x, 10.0f) && near(u.y, 70.0f));
  assert(near(u.w, 40.0f) && near(u.h, 18.0f));
  LinkZone e;
  assert(e.empty());
  LinkZone same = union_zone(e, a);
  assert(near(same.x, a.x) && near(same.w, a.w));
}

static void registration() {
  MonospaceMetrics m;
  RecordingSurface surf(m);
  RenderSession s(surf, m, PageGeometry{});
  assert(register_link(s, "https://example.org", LinkZone{1.0f, 2.0f, 3.0f, 4.0f}));
  auto links = surf.ops_of(DrawOp::Kind::Link);
  assert(links.size() == 1 && links[0].text == "https://example.org");
  assert(near(links[0].h, 4.0f));

  assert(!register_link(s, "", LinkZone{1.0f, 2.0f, 3.0f, 4.0f}));
  assert(!register_link(s, "https://example.org/empty", LinkZone{}));
  assert(surf.ops_of(DrawOp::Kind::Link).size() == 1);
  assert(s.messages.size() == 2);
  assert(s.messages[0].rfind("page 1: ", 0) == 0);
}

static void registration_failure() {
  MonospaceMetrics m;
  RecordingSurface surf(m);
  surf.set_fail_links(true);
  RenderSession s(surf, m, PageGeometry{});
  assert(!register_link(s, "https://example.org", LinkZone{1.0f, 2.0f, 3.0f, 4.0f}));
  assert(s.messages.size() == 1);
  assert(s.messages[0].find("link annotations unavailable") != std::string::npos);

  s.options.continue_on_error = false;
  bool threw = false;
  try {
    register_link(s, "https://example.org", LinkZone{1.0f, 2.0f, 3.0f, 4.0f});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

int main() {
  zone_is_text_box();
  zone_without_metrics();
  union_of_lines();
  registration();
  registration_failure();
  return 0;
}
