#pragma once
#include "core.h"
#include <QVector>
#include <QSet>

namespace tbx {

enum class SelectionState : uint8_t { Idle, Dragging, Committed };

// Selection shape state machine.
//
// A selection is one or more rectangles that all share one SelectionType.
// Row rectangles span every column and column rectangles every row; only
// the relevant coordinate of anchor/cursor is meaningful for them.
//
// Membership lookups go through derived sets rebuilt on every range change.
class SelectionModel {
public:
    SelectionModel(int rows, int cols);

    void setBounds(int rows, int cols);
    int  rowBound() const { return m_rows; }
    int  colBound() const { return m_cols; }

    // Pointer-down. Shift extends from the first rectangle's anchor,
    // Ctrl/Meta appends a one-unit rectangle. Returns false if ignored.
    bool press(SelectionType type, int row, int col, Qt::KeyboardModifiers mods);
    // Pointer-move while dragging: moves the latest rectangle's cursor.
    bool extendTo(int row, int col);
    void release();
    void cancelDrag();

    void selectCell(int row, int col);
    void setRanges(SelectionType type, const QVector<SelectionRange>& ranges);
    // Move a single-cell selection, clamped to bounds. Returns the new cell.
    GridPos moveBy(int dRow, int dCol);
    void clear();

    SelectionState state() const { return m_state; }
    bool isDragging() const { return m_state == SelectionState::Dragging; }
    SelectionType type() const { return m_type; }
    const QVector<SelectionRange>& ranges() const { return m_ranges; }
    bool isEmpty() const { return m_ranges.isEmpty(); }

    // Anchor of the latest rectangle, or nullopt when nothing is selected.
    std::optional<GridPos> activeCell() const;
    bool isSingleCell() const;

    bool isSelected(int row, int col) const;
    bool isRowSelected(int row) const;
    bool isColumnSelected(int col) const;

    // Row-major, deduplicated, clipped to bounds.
    QVector<GridPos> selectedCells() const;
    SelectionRange   boundingBox() const;
    // Sorted indices on the axis of |t|; empty unless the selection has that type.
    QVector<int>     selectedIndices(SelectionType t) const;

private:
    void normalize(SelectionRange& r) const;
    void rebuild();

    int                     m_rows;
    int                     m_cols;
    SelectionType           m_type  = SelectionType::Cell;
    SelectionState          m_state = SelectionState::Idle;
    QVector<SelectionRange> m_ranges;

    // derived
    QSet<quint64> m_cellKeys;   // Cell type
    QSet<int>     m_lines;      // Row or Column type
};

} // namespace tbx
