#include "cellstore.h"
#include <algorithm>

namespace tbx {

CellStore::CellStore(int rows, int cols)
    : m_rows(qMax(0, rows))
    , m_cols(qMax(0, cols))
{}

void CellStore::ensureSize(int rows, int cols) {
    if (rows <= m_rows && cols <= m_cols) return;
    m_rows = qMax(m_rows, rows);
    m_cols = qMax(m_cols, cols);
    m_revision++;
}

void CellStore::reset(int rows, int cols) {
    m_cells.clear();
    m_rows = qMax(0, rows);
    m_cols = qMax(0, cols);
    m_revision++;
}

const Cell* CellStore::find(int row, int col) const {
    auto it = m_cells.constFind(cellKey(row, col));
    return it == m_cells.constEnd() ? nullptr : &it.value();
}

void CellStore::set(int row, int col, const Cell& cell) {
    if (row < 0 || col < 0) return;
    m_cells.insert(cellKey(row, col), cell);
    m_rows = qMax(m_rows, row + 1);
    m_cols = qMax(m_cols, col + 1);
    m_revision++;
}

bool CellStore::remove(int row, int col) {
    if (!m_cells.remove(cellKey(row, col)))
        return false;
    m_revision++;
    return true;
}

void CellStore::clear() {
    if (m_cells.isEmpty()) return;
    m_cells.clear();
    m_revision++;
}

void CellStore::applyRawText(int row, int col, const QString& raw,
                             const ValueServices& svc, bool preserveFormatting) {
    if (raw.trimmed().isEmpty()) {
        remove(row, col);
        return;
    }

    Cell next;
    next.value = svc.parse(raw);
    if (preserveFormatting) {
        if (const Cell* prev = find(row, col))
            next.formatting = prev->formatting;
    }

    const bool isDate = next.value.type == CellType::Date
                     || next.value.type == CellType::DateTime;
    if (isDate && !next.value.detectedFormat.isEmpty()) {
        if (!next.formatting) next.formatting = CellFormatting{};
        next.formatting->dateFormat = next.value.detectedFormat;
    }
    set(row, col, next);
}

QVector<CellEntry> CellStore::columnCells(int col) const {
    QVector<CellEntry> out;
    for (auto it = m_cells.constBegin(); it != m_cells.constEnd(); ++it) {
        if (keyCol(it.key()) == col)
            out.append({keyRow(it.key()), col, it.value()});
    }
    std::sort(out.begin(), out.end(),
              [](const CellEntry& a, const CellEntry& b) { return a.row < b.row; });
    return out;
}

} // namespace tbx
