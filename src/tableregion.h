#pragma once
#include "cellstore.h"

namespace tbx {

// Named sub-rectangles with a header row, per-column display-string
// filters and one active sort.
//
// Regions only reference coordinates; cells never point back at them.
// The header-cell lookup and the per-region visible-row sets are derived
// and rebuilt when regions, filters or the store revision change.
class TableRegionEngine {
public:
    explicit TableRegionEngine(const ValueServices& svc);

    // Assigns a fresh "table-N" id and returns it.
    QString addRegion(TableRegion region);
    bool    removeRegion(const QString& id);
    void    clear();

    const QVector<TableRegion>& regions() const { return m_regions; }
    const TableRegion* region(const QString& id) const;
    const TableRegion* regionForHeader(int row, int col) const;
    // Region whose data rows and columns contain (row, col).
    const TableRegion* regionAt(int row, int col) const;

    // ── Sort ──

    // asc -> desc -> none on the same column; a new column starts at asc.
    SortDirection cycleSort(CellStore& store, const QString& id, int column);
    bool sort(CellStore& store, const QString& id, int column, SortDirection dir);

    // ── Filter ──

    // An empty set removes the column's filter.
    bool setFilter(const QString& id, int column, const QSet<QString>& values);
    bool clearFilter(const QString& id, int column);
    bool clearFilters(const QString& id);
    QStringList distinctValues(const CellStore& store, const QString& id, int column) const;

    bool isRowVisible(const CellStore& store, const QString& id, int row) const;
    // False when any region filtering |row| hides it.
    bool isRowVisible(const CellStore& store, int row) const;
    QSet<int> visibleRows(const CellStore& store, const QString& id) const;

private:
    TableRegion* findRegion(const QString& id);
    void rebuildHeaderIndex();
    void ensureVisibleRows(const CellStore& store) const;
    bool rowPassesFilters(const CellStore& store, const TableRegion& r, int row) const;

    const ValueServices& m_svc;
    QVector<TableRegion> m_regions;
    int                  m_nextId = 1;

    QHash<quint64, QString> m_headerIndex;

    // id -> visible data rows, only for regions with active filters
    mutable QHash<QString, QSet<int>> m_visibleRows;
    mutable quint64 m_visibleRevision = 0;
    mutable bool    m_visibleDirty    = true;
};

} // namespace tbx
