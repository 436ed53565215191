#pragma once
#include "core.h"

namespace tbx {

// Sparse associative cell storage plus the grid's row/column counts.
//
// Counts grow whenever a write lands outside them and only shrink on
// reset(). Every mutation bumps revision() so derived caches elsewhere
// can tell when to rebuild.
class CellStore {
public:
    CellStore(int rows, int cols);

    int rowCount() const { return m_rows; }
    int colCount() const { return m_cols; }
    // Grow only; smaller values are ignored.
    void ensureSize(int rows, int cols);
    void reset(int rows, int cols);

    bool        contains(int row, int col) const { return m_cells.contains(cellKey(row, col)); }
    const Cell* find(int row, int col) const;
    Cell        cell(int row, int col) const { return m_cells.value(cellKey(row, col)); }
    int         size() const { return m_cells.size(); }
    bool        isEmpty() const { return m_cells.isEmpty(); }

    void set(int row, int col, const Cell& cell);
    bool remove(int row, int col);
    void clear();

    // Parses |raw| and stores the result. Empty text deletes the cell.
    // With |preserveFormatting| the old cell's formatting survives. A
    // detected date format is always applied to date/datetime values.
    void applyRawText(int row, int col, const QString& raw,
                      const ValueServices& svc, bool preserveFormatting);

    // Stored cells of one column, keyed by row.
    QVector<CellEntry> columnCells(int col) const;
    const QHash<quint64, Cell>& cells() const { return m_cells; }

    quint64 revision() const { return m_revision; }

private:
    QHash<quint64, Cell> m_cells;
    int     m_rows;
    int     m_cols;
    quint64 m_revision = 0;
};

} // namespace tbx
