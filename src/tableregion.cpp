#include "tableregion.h"
#include <QDebug>
#include <algorithm>

namespace tbx {

TableRegionEngine::TableRegionEngine(const ValueServices& svc)
    : m_svc(svc)
{}

QString TableRegionEngine::addRegion(TableRegion region) {
    if (region.startRow > region.endRow) std::swap(region.startRow, region.endRow);
    if (region.startCol > region.endCol) std::swap(region.startCol, region.endCol);

    region.id = QStringLiteral("table-%1").arg(m_nextId++);
    m_regions.append(region);
    rebuildHeaderIndex();
    m_visibleDirty = true;
    qDebug() << "TableRegionEngine: added" << region.id
             << "rows" << region.startRow << "-" << region.endRow
             << "cols" << region.startCol << "-" << region.endCol;
    return region.id;
}

bool TableRegionEngine::removeRegion(const QString& id) {
    for (int i = 0; i < m_regions.size(); i++) {
        if (m_regions[i].id == id) {
            m_regions.remove(i);
            rebuildHeaderIndex();
            m_visibleDirty = true;
            return true;
        }
    }
    qWarning() << "TableRegionEngine: no region" << id;
    return false;
}

void TableRegionEngine::clear() {
    m_regions.clear();
    m_headerIndex.clear();
    m_visibleRows.clear();
    m_visibleDirty = true;
}

TableRegion* TableRegionEngine::findRegion(const QString& id) {
    for (auto& r : m_regions)
        if (r.id == id) return &r;
    return nullptr;
}

const TableRegion* TableRegionEngine::region(const QString& id) const {
    for (const auto& r : m_regions)
        if (r.id == id) return &r;
    return nullptr;
}

void TableRegionEngine::rebuildHeaderIndex() {
    m_headerIndex.clear();
    for (const auto& r : m_regions) {
        if (!r.hasHeader || r.headerRow < 0) continue;
        for (int col = r.startCol; col <= r.endCol; col++)
            m_headerIndex.insert(cellKey(r.headerRow, col), r.id);
    }
}

const TableRegion* TableRegionEngine::regionForHeader(int row, int col) const {
    auto it = m_headerIndex.constFind(cellKey(row, col));
    if (it == m_headerIndex.constEnd()) return nullptr;
    return region(it.value());
}

const TableRegion* TableRegionEngine::regionAt(int row, int col) const {
    for (const auto& r : m_regions)
        if (r.containsColumn(col) && r.containsDataRow(row)) return &r;
    return nullptr;
}

// ── Sort ──

SortDirection TableRegionEngine::cycleSort(CellStore& store, const QString& id, int column) {
    const TableRegion* r = region(id);
    if (!r || !r->hasHeader) return SortDirection::None;

    SortDirection next = SortDirection::Ascending;
    if (r->sortColumn == column) {
        if (r->sortDirection == SortDirection::Ascending)
            next = SortDirection::Descending;
        else if (r->sortDirection == SortDirection::Descending)
            next = SortDirection::None;
    }
    sort(store, id, column, next);
    return next;
}

// Type-aware ordering of two sort keys; missing cells are invalid variants.
static int compareKeys(const QVariant& a, const QVariant& b) {
    const int ta = a.userType();
    const int tb = b.userType();
    if (ta == QMetaType::QString && tb == QMetaType::QString)
        return QString::localeAwareCompare(a.toString(), b.toString());
    if (ta == QMetaType::Double && tb == QMetaType::Double) {
        const double da = a.toDouble(), db = b.toDouble();
        return da < db ? -1 : (da > db ? 1 : 0);
    }
    if (ta == QMetaType::QDateTime && tb == QMetaType::QDateTime) {
        const qint64 ma = a.toDateTime().toMSecsSinceEpoch();
        const qint64 mb = b.toDateTime().toMSecsSinceEpoch();
        return ma < mb ? -1 : (ma > mb ? 1 : 0);
    }
    return QString::localeAwareCompare(a.toString(), b.toString());
}

bool TableRegionEngine::sort(CellStore& store, const QString& id, int column, SortDirection dir) {
    TableRegion* r = findRegion(id);
    if (!r || !r->hasHeader) {
        qDebug() << "TableRegionEngine: sort ignored, region" << id << "has no header";
        return false;
    }
    if (!r->containsColumn(column)) {
        qWarning() << "TableRegionEngine: column" << column << "outside region" << id;
        return false;
    }

    r->sortColumn    = dir == SortDirection::None ? -1 : column;
    r->sortDirection = dir;
    m_visibleDirty   = true;
    // no stored original order to restore
    if (dir == SortDirection::None) return true;

    struct RowData {
        QVariant                 key;
        QVector<QPair<int, Cell>> cells;
    };
    QVector<RowData> rows;

    const int first = r->firstDataRow();
    for (int row = first; row <= r->endRow; row++) {
        RowData rd;
        for (int col = r->startCol; col <= r->endCol; col++) {
            if (const Cell* c = store.find(row, col)) {
                rd.cells.append({col, *c});
                if (col == column) rd.key = c->value.value;
            }
        }
        if (!rd.cells.isEmpty())
            rows.append(rd);
    }

    const bool desc = dir == SortDirection::Descending;
    std::stable_sort(rows.begin(), rows.end(), [desc](const RowData& a, const RowData& b) {
        int cmp = compareKeys(a.key, b.key);
        return desc ? cmp > 0 : cmp < 0;
    });

    // Rewrite the data rows in the new order, compacted to the top
    for (int row = first; row <= r->endRow; row++)
        for (int col = r->startCol; col <= r->endCol; col++)
            store.remove(row, col);
    for (int i = 0; i < rows.size(); i++)
        for (const auto& pc : rows[i].cells)
            store.set(first + i, pc.first, pc.second);

    qDebug() << "TableRegionEngine: sorted" << id << "column" << column
             << (desc ? "desc" : "asc") << "-" << rows.size() << "rows";
    return true;
}

// ── Filter ──

bool TableRegionEngine::setFilter(const QString& id, int column, const QSet<QString>& values) {
    TableRegion* r = findRegion(id);
    if (!r || !r->hasHeader) return false;
    if (!r->containsColumn(column)) {
        qWarning() << "TableRegionEngine: filter column" << column << "outside region" << id;
        return false;
    }
    if (values.isEmpty())
        r->filters.remove(column);
    else
        r->filters.insert(column, values);
    m_visibleDirty = true;
    return true;
}

bool TableRegionEngine::clearFilter(const QString& id, int column) {
    return setFilter(id, column, {});
}

bool TableRegionEngine::clearFilters(const QString& id) {
    TableRegion* r = findRegion(id);
    if (!r) return false;
    r->filters.clear();
    m_visibleDirty = true;
    return true;
}

QStringList TableRegionEngine::distinctValues(const CellStore& store, const QString& id, int column) const {
    const TableRegion* r = region(id);
    if (!r || !r->containsColumn(column)) return {};

    QSet<QString> seen;
    for (int row = r->firstDataRow(); row <= r->endRow; row++) {
        const Cell* c = store.find(row, column);
        seen.insert(c ? m_svc.displayOf(*c) : QString());
    }
    QStringList out(seen.begin(), seen.end());
    std::sort(out.begin(), out.end());
    return out;
}

bool TableRegionEngine::rowPassesFilters(const CellStore& store, const TableRegion& r, int row) const {
    for (auto it = r.filters.constBegin(); it != r.filters.constEnd(); ++it) {
        const Cell* c = store.find(row, it.key());
        const QString text = c ? m_svc.displayOf(*c) : QString();
        if (!it.value().contains(text))
            return false;
    }
    return true;
}

void TableRegionEngine::ensureVisibleRows(const CellStore& store) const {
    if (!m_visibleDirty && m_visibleRevision == store.revision())
        return;
    m_visibleRows.clear();
    for (const auto& r : m_regions) {
        if (r.filters.isEmpty()) continue;
        QSet<int> rows;
        for (int row = r.firstDataRow(); row <= r.endRow; row++)
            if (rowPassesFilters(store, r, row))
                rows.insert(row);
        m_visibleRows.insert(r.id, rows);
    }
    m_visibleRevision = store.revision();
    m_visibleDirty = false;
}

bool TableRegionEngine::isRowVisible(const CellStore& store, const QString& id, int row) const {
    const TableRegion* r = region(id);
    if (!r || !r->containsDataRow(row)) return true;
    ensureVisibleRows(store);
    auto it = m_visibleRows.constFind(id);
    return it == m_visibleRows.constEnd() || it->contains(row);
}

bool TableRegionEngine::isRowVisible(const CellStore& store, int row) const {
    ensureVisibleRows(store);
    for (const auto& r : m_regions) {
        if (!r.containsDataRow(row)) continue;
        auto it = m_visibleRows.constFind(r.id);
        if (it != m_visibleRows.constEnd() && !it->contains(row))
            return false;
    }
    return true;
}

QSet<int> TableRegionEngine::visibleRows(const CellStore& store, const QString& id) const {
    const TableRegion* r = region(id);
    if (!r) return {};
    ensureVisibleRows(store);
    auto it = m_visibleRows.constFind(id);
    if (it != m_visibleRows.constEnd()) return *it;
    QSet<int> all;
    for (int row = r->firstDataRow(); row <= r->endRow; row++)
        all.insert(row);
    return all;
}

} // namespace tbx
