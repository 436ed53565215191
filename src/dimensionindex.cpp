#include "dimensionindex.h"
#include <algorithm>

namespace tbx {

DimensionIndex::DimensionIndex(int count, int defaultSize, int minSize)
    : m_count(qMax(0, count))
    , m_default(qMax(defaultSize, minSize))
    , m_min(minSize)
{}

void DimensionIndex::setCount(int count) {
    count = qMax(0, count);
    if (count == m_count) return;
    m_count = count;
    m_dirty = true;
}

int DimensionIndex::sizeOf(int index) const {
    return m_overrides.value(index, m_default);
}

int DimensionIndex::setSize(int index, int size) {
    size = qMax(size, m_min);
    auto it = m_overrides.find(index);
    if (it != m_overrides.end() && it.value() == size)
        return size;
    m_overrides.insert(index, size);
    m_dirty = true;
    return size;
}

bool DimensionIndex::resetSize(int index) {
    if (!m_overrides.remove(index))
        return false;
    m_dirty = true;
    return true;
}

void DimensionIndex::clearSizes() {
    if (m_overrides.isEmpty()) return;
    m_overrides.clear();
    m_dirty = true;
}

void DimensionIndex::rebuild() const {
    m_offsets.resize(m_count + 1);
    qint64 acc = 0;
    for (int i = 0; i < m_count; i++) {
        m_offsets[i] = acc;
        acc += sizeOf(i);
    }
    m_offsets[m_count] = acc;
    m_dirty = false;
}

qint64 DimensionIndex::positionOf(int index) const {
    if (m_dirty) rebuild();
    if (index <= 0) return 0;
    if (index >= m_count) {
        // Past the end: extrapolate with the default size
        return m_offsets[m_count] + qint64(index - m_count) * m_default;
    }
    return m_offsets[index];
}

qint64 DimensionIndex::totalSize() const {
    if (m_dirty) rebuild();
    return m_offsets[m_count];
}

int DimensionIndex::indexAt(qint64 offset) const {
    if (m_count == 0) return -1;
    if (m_dirty) rebuild();
    if (offset <= 0) return 0;
    // last i with offsets[i] <= offset
    auto first = m_offsets.constBegin();
    auto last  = first + m_count;
    auto it = std::upper_bound(first, last, offset);
    int idx = int(it - first) - 1;
    return qBound(0, idx, m_count - 1);
}

// Binary search for the last index starting at or before the scroll offset,
// back off one index of slack, extend while indices start inside the
// viewport, then add the trailing buffer.
IndexRange DimensionIndex::resolve(qint64 scrollOffset, int viewportSize, int buffer) const {
    IndexRange r;
    if (m_count == 0) return r;
    if (m_dirty) rebuild();

    scrollOffset = qMax<qint64>(0, scrollOffset);
    const int found = indexAt(scrollOffset);
    r.start = qMax(0, found - 1);

    const qint64 limit = scrollOffset + qMax(0, viewportSize);
    int end = found;
    while (end < m_count && m_offsets[end] <= limit)
        end++;

    r.end = qMin(end + qMax(0, buffer), m_count);
    return r;
}

} // namespace tbx
