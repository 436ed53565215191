#include "selection.h"
#include <QDebug>
#include <algorithm>
#include <climits>

namespace tbx {

SelectionModel::SelectionModel(int rows, int cols)
    : m_rows(qMax(1, rows))
    , m_cols(qMax(1, cols))
{}

void SelectionModel::setBounds(int rows, int cols) {
    m_rows = qMax(1, rows);
    m_cols = qMax(1, cols);
}

// Row and column rectangles pin the unused coordinate to zero
void SelectionModel::normalize(SelectionRange& r) const {
    if (m_type == SelectionType::Row) {
        r.anchor.col = 0;
        r.cursor.col = 0;
    } else if (m_type == SelectionType::Column) {
        r.anchor.row = 0;
        r.cursor.row = 0;
    }
}

bool SelectionModel::press(SelectionType type, int row, int col, Qt::KeyboardModifiers mods) {
    const GridPos hit{qMax(0, row), qMax(0, col)};

    if (mods & (Qt::ControlModifier | Qt::MetaModifier)) {
        if (!m_ranges.isEmpty() && type != m_type) {
            qDebug() << "SelectionModel: ignoring multi-select of a different type";
            return false;
        }
        m_type = type;
        SelectionRange r{hit, hit};
        normalize(r);
        m_ranges.append(r);
        m_state = SelectionState::Dragging;
        rebuild();
        return true;
    }

    if ((mods & Qt::ShiftModifier) && !m_ranges.isEmpty() && type == m_type) {
        SelectionRange r{m_ranges.first().anchor, hit};
        normalize(r);
        m_ranges = {r};
        m_state = SelectionState::Dragging;
        rebuild();
        return true;
    }

    m_type = type;
    SelectionRange r{hit, hit};
    normalize(r);
    m_ranges = {r};
    m_state = SelectionState::Dragging;
    rebuild();
    return true;
}

bool SelectionModel::extendTo(int row, int col) {
    if (m_state != SelectionState::Dragging || m_ranges.isEmpty())
        return false;
    SelectionRange& r = m_ranges.last();
    SelectionRange next{r.anchor, GridPos{qMax(0, row), qMax(0, col)}};
    normalize(next);
    if (next == r) return false;
    r = next;
    rebuild();
    return true;
}

void SelectionModel::release() {
    if (m_state == SelectionState::Dragging)
        m_state = SelectionState::Committed;
}

void SelectionModel::cancelDrag() {
    if (m_state == SelectionState::Dragging)
        m_state = SelectionState::Committed;
}

void SelectionModel::selectCell(int row, int col) {
    row = qBound(0, row, m_rows - 1);
    col = qBound(0, col, m_cols - 1);
    m_type = SelectionType::Cell;
    m_ranges = {SelectionRange{{row, col}, {row, col}}};
    m_state = SelectionState::Committed;
    rebuild();
}

void SelectionModel::setRanges(SelectionType type, const QVector<SelectionRange>& ranges) {
    m_type = type;
    m_ranges.clear();
    for (SelectionRange r : ranges) {
        normalize(r);
        m_ranges.append(r);
    }
    m_state = m_ranges.isEmpty() ? SelectionState::Idle : SelectionState::Committed;
    rebuild();
}

GridPos SelectionModel::moveBy(int dRow, int dCol) {
    GridPos from = activeCell().value_or(GridPos{0, 0});
    if (m_type == SelectionType::Row) from.col = 0;
    if (m_type == SelectionType::Column) from.row = 0;
    selectCell(from.row + dRow, from.col + dCol);
    return m_ranges.first().anchor;
}

void SelectionModel::clear() {
    m_ranges.clear();
    m_state = SelectionState::Idle;
    rebuild();
}

std::optional<GridPos> SelectionModel::activeCell() const {
    if (m_ranges.isEmpty()) return std::nullopt;
    return m_ranges.last().anchor;
}

bool SelectionModel::isSingleCell() const {
    return m_type == SelectionType::Cell && m_ranges.size() == 1
        && m_ranges.first().anchor == m_ranges.first().cursor;
}

// ── Derived membership ──

void SelectionModel::rebuild() {
    m_cellKeys.clear();
    m_lines.clear();
    for (const auto& r : m_ranges) {
        switch (m_type) {
        case SelectionType::Cell:
            for (int row = r.top(); row <= r.bottom(); row++)
                for (int col = r.left(); col <= r.right(); col++)
                    m_cellKeys.insert(cellKey(row, col));
            break;
        case SelectionType::Row:
            for (int row = r.top(); row <= r.bottom(); row++)
                m_lines.insert(row);
            break;
        case SelectionType::Column:
            for (int col = r.left(); col <= r.right(); col++)
                m_lines.insert(col);
            break;
        }
    }
}

bool SelectionModel::isSelected(int row, int col) const {
    switch (m_type) {
    case SelectionType::Cell:   return m_cellKeys.contains(cellKey(row, col));
    case SelectionType::Row:    return m_lines.contains(row) && col >= 0 && col < m_cols;
    case SelectionType::Column: return m_lines.contains(col) && row >= 0 && row < m_rows;
    }
    return false;
}

bool SelectionModel::isRowSelected(int row) const {
    return m_type == SelectionType::Row && m_lines.contains(row);
}

bool SelectionModel::isColumnSelected(int col) const {
    return m_type == SelectionType::Column && m_lines.contains(col);
}

QVector<GridPos> SelectionModel::selectedCells() const {
    QVector<GridPos> out;
    switch (m_type) {
    case SelectionType::Cell: {
        out.reserve(m_cellKeys.size());
        for (quint64 k : m_cellKeys)
            out.append({keyRow(k), keyCol(k)});
        std::sort(out.begin(), out.end(), [](const GridPos& a, const GridPos& b) {
            return a.row != b.row ? a.row < b.row : a.col < b.col;
        });
        break;
    }
    case SelectionType::Row:
        for (int row : selectedIndices(SelectionType::Row))
            for (int col = 0; col < m_cols; col++)
                out.append({row, col});
        break;
    case SelectionType::Column: {
        QVector<int> cols = selectedIndices(SelectionType::Column);
        for (int row = 0; row < m_rows; row++)
            for (int col : cols)
                out.append({row, col});
        break;
    }
    }
    return out;
}

SelectionRange SelectionModel::boundingBox() const {
    if (m_ranges.isEmpty()) return {};
    int top = INT_MAX, left = INT_MAX, bottom = 0, right = 0;
    for (const auto& r : m_ranges) {
        top    = qMin(top, r.top());
        left   = qMin(left, r.left());
        bottom = qMax(bottom, r.bottom());
        right  = qMax(right, r.right());
    }
    if (m_type == SelectionType::Row)    { left = 0; right = m_cols - 1; }
    if (m_type == SelectionType::Column) { top = 0; bottom = m_rows - 1; }
    return SelectionRange{{top, left}, {bottom, right}};
}

QVector<int> SelectionModel::selectedIndices(SelectionType t) const {
    if (t != m_type || t == SelectionType::Cell) return {};
    QVector<int> out(m_lines.begin(), m_lines.end());
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace tbx
