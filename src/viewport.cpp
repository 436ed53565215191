#include "viewport.h"

namespace tbx {

ViewportResolver::ViewportResolver(const DimensionIndex& rows, const DimensionIndex& cols,
                                   int bufferRows, int bufferCols, int frameMs,
                                   QObject* parent)
    : QObject(parent)
    , m_rows(rows)
    , m_cols(cols)
    , m_bufferRows(bufferRows)
    , m_bufferCols(bufferCols)
{
    m_timer.setSingleShot(true);
    m_timer.setInterval(frameMs);
    connect(&m_timer, &QTimer::timeout, this, &ViewportResolver::flush);
}

Viewport ViewportResolver::resolve(const ScrollState& s) const {
    IndexRange r = m_rows.resolve(s.y, s.height, m_bufferRows);
    IndexRange c = m_cols.resolve(s.x, s.width, m_bufferCols);
    return Viewport{r.start, r.end, c.start, c.end};
}

void ViewportResolver::scheduleScroll(const ScrollState& s) {
    m_scroll = s;
    if (!m_timer.isActive())
        m_timer.start();
}

void ViewportResolver::flush() {
    m_timer.stop();
    publish(resolve(m_scroll));
}

void ViewportResolver::invalidate() {
    // Let a pending frame pick it up
    if (m_timer.isActive()) return;
    publish(resolve(m_scroll));
}

void ViewportResolver::publish(const Viewport& vp) {
    if (m_hasCurrent && vp == m_current) return;
    m_current = vp;
    m_hasCurrent = true;
    emit viewportChanged(vp);
}

} // namespace tbx
