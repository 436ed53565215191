#pragma once
#include "dimensionindex.h"
#include <QObject>
#include <QTimer>
#include <QMetaType>

namespace tbx {

// Visible rectangle in grid indices; end is exclusive.
struct Viewport {
    int startRow = 0;
    int endRow   = 0;
    int startCol = 0;
    int endCol   = 0;

    bool containsRow(int r) const { return r >= startRow && r < endRow; }
    bool containsCol(int c) const { return c >= startCol && c < endCol; }
    bool operator==(const Viewport& o) const {
        return startRow == o.startRow && endRow == o.endRow
            && startCol == o.startCol && endCol == o.endCol;
    }
    bool operator!=(const Viewport& o) const { return !(*this == o); }
};

// Scroll geometry in content pixels (header excluded).
struct ScrollState {
    qint64 x = 0;
    qint64 y = 0;
    int    width  = 0;
    int    height = 0;
};

// Turns scroll state into the row/column slice worth painting.
//
// Scroll notifications are coalesced: scheduleScroll() only records the
// latest state and arms a single-shot frame timer; the recompute runs
// once when it fires. viewportChanged is emitted only on actual change.
class ViewportResolver : public QObject {
    Q_OBJECT
public:
    ViewportResolver(const DimensionIndex& rows, const DimensionIndex& cols,
                     int bufferRows, int bufferCols, int frameMs,
                     QObject* parent = nullptr);

    Viewport resolve(const ScrollState& s) const;

    void scheduleScroll(const ScrollState& s);
    // Apply any pending scroll immediately.
    void flush();
    // Sizes or counts changed: recompute against the last scroll state.
    void invalidate();

    bool            isPending() const { return m_timer.isActive(); }
    const Viewport& current() const { return m_current; }
    const ScrollState& scrollState() const { return m_scroll; }

signals:
    void viewportChanged(const tbx::Viewport& vp);

private:
    void publish(const Viewport& vp);

    const DimensionIndex& m_rows;
    const DimensionIndex& m_cols;
    int         m_bufferRows;
    int         m_bufferCols;
    QTimer      m_timer;
    ScrollState m_scroll;
    Viewport    m_current;
    bool        m_hasCurrent = false;
};

} // namespace tbx

Q_DECLARE_METATYPE(tbx::Viewport)
