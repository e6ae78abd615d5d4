#pragma once
/*
 * NcursesSurface
 *
 * Purpose: record pages like RecordingSurface, then page through them in the terminal.
 * Mapping: page width scales to the terminal width; one text row per row_points.
 * Keys: n/space/right next page, p/b/left previous page, q quit.
 */
#include "recording_surface.hpp"

class NcursesSurface : public RecordingSurface {
public:
  NcursesSurface(const IFontMetrics& metrics, const PageGeometry& geometry, float row_points = 10.0f)
    : RecordingSurface(metrics), geometry_(geometry), row_points_(row_points) {}
  void show(const std::string& title);

private:
  void draw_page(int page, int rows, int cols, bool colors) const;
  PageGeometry geometry_;
  float row_points_;
};
