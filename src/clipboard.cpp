#include "clipboard.h"
#include <QDebug>
#include <climits>

namespace tbx {

bool ClipboardEngine::copy(const CellStore& store, const QVector<GridPos>& cells) {
    return snapshot(store, cells, false);
}

bool ClipboardEngine::cut(const CellStore& store, const QVector<GridPos>& cells) {
    return snapshot(store, cells, true);
}

bool ClipboardEngine::snapshot(const CellStore& store, const QVector<GridPos>& cells, bool cut) {
    cancel();
    if (cells.isEmpty()) return false;

    int minRow = INT_MAX, minCol = INT_MAX, maxRow = 0, maxCol = 0;
    for (const auto& p : cells) {
        minRow = qMin(minRow, p.row);
        minCol = qMin(minCol, p.col);
        maxRow = qMax(maxRow, p.row);
        maxCol = qMax(maxCol, p.col);
    }

    m_entries.reserve(cells.size());
    for (const auto& p : cells) {
        Entry e;
        e.dRow = p.row - minRow;
        e.dCol = p.col - minCol;
        if (const Cell* c = store.find(p.row, p.col))
            e.cell = *c;
        m_entries.append(e);
        m_sources.insert(cellKey(p.row, p.col));
    }
    m_origin  = GridPos{minRow, minCol};
    m_rowSpan = maxRow - minRow + 1;
    m_colSpan = maxCol - minCol + 1;
    m_cut     = cut;
    return true;
}

bool ClipboardEngine::paste(CellStore& store, GridPos anchor) {
    if (m_entries.isEmpty()) return false;

    if (m_cut) {
        for (quint64 k : m_sources)
            store.remove(keyRow(k), keyCol(k));
    }

    for (const auto& e : m_entries) {
        const int row = anchor.row + e.dRow;
        const int col = anchor.col + e.dCol;
        if (e.cell)
            store.set(row, col, *e.cell);
        else
            store.remove(row, col);
    }

    qDebug() << "ClipboardEngine: pasted" << m_entries.size() << "cells at"
             << anchor.row << anchor.col << (m_cut ? "(cut)" : "");
    cancel();
    return true;
}

void ClipboardEngine::cancel() {
    m_entries.clear();
    m_sources.clear();
    m_origin  = GridPos{};
    m_rowSpan = 0;
    m_colSpan = 0;
    m_cut     = false;
}

QString ClipboardEngine::toTsv(const ValueServices& svc) const {
    if (m_entries.isEmpty()) return {};

    QVector<QStringList> rows(m_rowSpan, QStringList());
    for (auto& r : rows)
        for (int i = 0; i < m_colSpan; i++)
            r.append(QString());
    for (const auto& e : m_entries) {
        if (e.cell)
            rows[e.dRow][e.dCol] = svc.displayOf(*e.cell);
    }

    QStringList lines;
    for (const auto& r : rows)
        lines.append(r.join(QLatin1Char('\t')));
    return lines.join(QLatin1Char('\n'));
}

} // namespace tbx
