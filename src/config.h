#pragma once
#include <QSettings>

namespace tbx {

// Grid geometry and tuning knobs. Defaults match a fresh install;
// load() overlays whatever is stored under the "grid/" settings group.
struct GridConfig {
    int initialRows     = 500;
    int initialCols     = 260;

    int defaultColWidth  = 100;
    int defaultRowHeight = 30;
    int minColWidth      = 30;
    int minRowHeight     = 20;
    int rowHeaderWidth   = 50;
    int colHeaderHeight  = 30;

    int bufferCols = 5;
    int bufferRows = 10;

    // auto-fit heuristic
    int    minAutoFitWidth = 50;
    int    maxAutoFitWidth = 500;
    int    charWidth       = 7;
    int    headerCharWidth = 8;
    int    autoFitPadding  = 10;
    int    baseFontSize    = 12;
    double boldFactor      = 1.1;

    int scrollFrameMs = 16;

    static GridConfig load();
    static GridConfig load(const QSettings& s);
    void save() const;
    void save(QSettings& s) const;
};

} // namespace tbx
