#include "config.h"
#include <QDebug>

namespace tbx {

static int readInt(const QSettings& s, const char* key, int fallback, int floor) {
    bool ok = false;
    int v = s.value(QLatin1String(key), fallback).toInt(&ok);
    if (!ok || v < floor) {
        qWarning() << "GridConfig: ignoring invalid value for" << key << "-" << s.value(QLatin1String(key));
        return fallback;
    }
    return v;
}

GridConfig GridConfig::load() {
    return load(QSettings("Tabulix", "Tabulix"));
}

GridConfig GridConfig::load(const QSettings& s) {
    GridConfig c;
    c.initialRows      = readInt(s, "grid/initialRows",      c.initialRows, 1);
    c.initialCols      = readInt(s, "grid/initialCols",      c.initialCols, 1);
    c.minColWidth      = readInt(s, "grid/minColWidth",      c.minColWidth, 1);
    c.minRowHeight     = readInt(s, "grid/minRowHeight",     c.minRowHeight, 1);
    c.defaultColWidth  = readInt(s, "grid/defaultColWidth",  c.defaultColWidth, c.minColWidth);
    c.defaultRowHeight = readInt(s, "grid/defaultRowHeight", c.defaultRowHeight, c.minRowHeight);
    c.rowHeaderWidth   = readInt(s, "grid/rowHeaderWidth",   c.rowHeaderWidth, 0);
    c.colHeaderHeight  = readInt(s, "grid/colHeaderHeight",  c.colHeaderHeight, 0);
    c.bufferCols       = readInt(s, "grid/bufferCols",       c.bufferCols, 0);
    c.bufferRows       = readInt(s, "grid/bufferRows",       c.bufferRows, 0);
    c.minAutoFitWidth  = readInt(s, "grid/minAutoFitWidth",  c.minAutoFitWidth, c.minColWidth);
    c.maxAutoFitWidth  = readInt(s, "grid/maxAutoFitWidth",  c.maxAutoFitWidth, c.minAutoFitWidth);
    c.scrollFrameMs    = readInt(s, "grid/scrollFrameMs",    c.scrollFrameMs, 0);
    return c;
}

void GridConfig::save() const {
    QSettings s("Tabulix", "Tabulix");
    save(s);
}

void GridConfig::save(QSettings& s) const {
    s.setValue("grid/initialRows",      initialRows);
    s.setValue("grid/initialCols",      initialCols);
    s.setValue("grid/defaultColWidth",  defaultColWidth);
    s.setValue("grid/defaultRowHeight", defaultRowHeight);
    s.setValue("grid/minColWidth",      minColWidth);
    s.setValue("grid/minRowHeight",     minRowHeight);
    s.setValue("grid/rowHeaderWidth",   rowHeaderWidth);
    s.setValue("grid/colHeaderHeight",  colHeaderHeight);
    s.setValue("grid/bufferCols",       bufferCols);
    s.setValue("grid/bufferRows",       bufferRows);
    s.setValue("grid/minAutoFitWidth",  minAutoFitWidth);
    s.setValue("grid/maxAutoFitWidth",  maxAutoFitWidth);
    s.setValue("grid/scrollFrameMs",    scrollFrameMs);
}

} // namespace tbx
