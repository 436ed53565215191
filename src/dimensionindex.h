#pragma once
#include <QHash>
#include <QVector>

namespace tbx {

// Half-open index range [start, end) on one axis.
struct IndexRange {
    int start = 0;
    int end   = 0;

    bool operator==(const IndexRange& o) const { return start == o.start && end == o.end; }
    bool operator!=(const IndexRange& o) const { return !(*this == o); }
};

// Cumulative-offset lookup for one axis (rows or columns).
//
// Sizes are sparse overrides on top of a default. Prefix offsets are
// rebuilt lazily on the first query after any count or size change.
class DimensionIndex {
public:
    DimensionIndex(int count, int defaultSize, int minSize);

    int  count() const { return m_count; }
    void setCount(int count);

    int defaultSize() const { return m_default; }
    int minSize() const { return m_min; }

    int  sizeOf(int index) const;
    // Clamped to the floor. Returns the size actually stored.
    int  setSize(int index, int size);
    // Drops the override. False when |index| had none.
    bool resetSize(int index);
    void clearSizes();
    bool hasOverride(int index) const { return m_overrides.contains(index); }
    const QHash<int, int>& overrides() const { return m_overrides; }

    qint64 positionOf(int index) const;
    qint64 totalSize() const;
    // Index whose span contains |offset|, clamped to [0, count-1]. -1 when empty.
    int    indexAt(qint64 offset) const;

    IndexRange resolve(qint64 scrollOffset, int viewportSize, int buffer) const;

private:
    void rebuild() const;

    int             m_count;
    int             m_default;
    int             m_min;
    QHash<int, int> m_overrides;

    // offsets[i] = start of index i; offsets[count] = total
    mutable QVector<qint64> m_offsets;
    mutable bool            m_dirty = true;
};

} // namespace tbx
