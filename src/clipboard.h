#pragma once
#include "cellstore.h"

namespace tbx {

// Staged copy/cut snapshot with offsets relative to the copied block's
// top-left corner. A cut deletes its sources only when it is pasted.
class ClipboardEngine {
public:
    struct Entry {
        int                 dRow = 0;
        int                 dCol = 0;
        std::optional<Cell> cell;   // nullopt: source was empty
    };

    bool copy(const CellStore& store, const QVector<GridPos>& cells);
    bool cut(const CellStore& store, const QVector<GridPos>& cells);
    // Returns false when there is nothing to paste. Clears the snapshot.
    bool paste(CellStore& store, GridPos anchor);
    void cancel();

    bool hasData() const { return !m_entries.isEmpty(); }
    bool isCut() const { return m_cut; }
    bool isSource(int row, int col) const { return m_sources.contains(cellKey(row, col)); }
    const QVector<Entry>& entries() const { return m_entries; }
    GridPos origin() const { return m_origin; }
    int rowSpan() const { return m_rowSpan; }
    int colSpan() const { return m_colSpan; }

    // Tab separated, one line per row of the bounding block.
    QString toTsv(const ValueServices& svc) const;

private:
    bool snapshot(const CellStore& store, const QVector<GridPos>& cells, bool cut);

    QVector<Entry> m_entries;
    QSet<quint64>  m_sources;
    GridPos        m_origin;
    int            m_rowSpan = 0;
    int            m_colSpan = 0;
    bool           m_cut = false;
};

} // namespace tbx
