#include "controller.h"
#include <QDebug>
#include <utility>

namespace tbx {

GridController::GridController(const GridConfig& cfg, QObject* parent)
    : QObject(parent)
    , m_cfg(cfg)
    , m_svc(ValueServices::defaults())
    , m_store(cfg.initialRows, cfg.initialCols)
    , m_rows(cfg.initialRows, cfg.defaultRowHeight, cfg.minRowHeight)
    , m_cols(cfg.initialCols, cfg.defaultColWidth, cfg.minColWidth)
    , m_selection(cfg.initialRows, cfg.initialCols)
    , m_edit(m_store, m_selection, m_svc)
    , m_tables(m_svc)
    , m_resize(m_rows, m_cols, m_cfg)
    , m_viewport(m_rows, m_cols, cfg.bufferRows, cfg.bufferCols, cfg.scrollFrameMs)
{
    connect(&m_viewport, &ViewportResolver::viewportChanged,
            this, &GridController::viewportChanged);
}

GridController::~GridController() {
    endDrag();
}

void GridController::setValueServices(const ValueServices& svc) {
    ValueServices fallback = ValueServices::defaults();
    m_svc.parse   = svc.parse   ? svc.parse   : fallback.parse;
    m_svc.display = svc.display ? svc.display : fallback.display;
}

// Counts only ever grow through the store; mirror them everywhere else.
void GridController::syncDimensions() {
    const int rows = m_store.rowCount();
    const int cols = m_store.colCount();
    if (rows == m_rows.count() && cols == m_cols.count())
        return;
    m_rows.setCount(rows);
    m_cols.setCount(cols);
    m_selection.setBounds(rows, cols);
    m_viewport.invalidate();
    emit dimensionsChanged();
}

QString GridController::displayText(int row, int col) const {
    const Cell* c = m_store.find(row, col);
    return c ? m_svc.displayOf(*c) : QString();
}

// ── Control surface ──

void GridController::clear() {
    endDrag();
    const bool wasEditing = m_edit.isActive();
    m_edit.cancel();
    m_clipboard.cancel();
    m_tables.clear();
    m_selection.clear();
    m_store.reset(m_cfg.initialRows, m_cfg.initialCols);
    m_rows.setCount(m_cfg.initialRows);
    m_cols.setCount(m_cfg.initialCols);
    m_selection.setBounds(m_cfg.initialRows, m_cfg.initialCols);
    m_viewport.invalidate();

    if (wasEditing) emit editEnded();
    emit clipboardChanged(false);
    emit tablesChanged();
    emit selectionChanged();
    emit dimensionsChanged();
    emit cellsChanged();
}

void GridController::setCell(int row, int col, const QString& rawText) {
    if (row < 0 || col < 0) {
        qWarning() << "GridController: setCell rejected negative coordinate" << row << col;
        return;
    }
    m_store.applyRawText(row, col, rawText, m_svc, false);
    syncDimensions();
    emit cellsChanged();
}

void GridController::setRange(int r0, int c0, int r1, int c1, const QString& rawText) {
    const int top = qMax(0, qMin(r0, r1)), bottom = qMax(r0, r1);
    const int left = qMax(0, qMin(c0, c1)), right = qMax(c0, c1);
    if (bottom < 0 || right < 0) return;

    for (int row = top; row <= bottom; row++)
        for (int col = left; col <= right; col++)
            m_store.applyRawText(row, col, rawText, m_svc, false);
    syncDimensions();
    emit cellsChanged();
}

void GridController::batchSet(const QVector<RawCellUpdate>& updates) {
    int rejected = 0;
    for (const auto& u : updates) {
        if (u.row < 0 || u.col < 0) { rejected++; continue; }
        m_store.ensureSize(u.row + 1, u.col + 1);
        m_store.applyRawText(u.row, u.col, u.text, m_svc, false);
    }
    if (rejected)
        qWarning() << "GridController: batchSet skipped" << rejected << "negative coordinate(s)";
    syncDimensions();
    emit cellsChanged();
}

// Without auto-expansion a region may not reach past the grid. A header row
// that falls outside leaves the region header-less.
static bool clipRegion(TableRegion& r, int rows, int cols) {
    if (r.startRow > r.endRow) std::swap(r.startRow, r.endRow);
    if (r.startCol > r.endCol) std::swap(r.startCol, r.endCol);
    if (r.startRow >= rows || r.startCol >= cols) return false;
    r.endRow = qMin(r.endRow, rows - 1);
    r.endCol = qMin(r.endCol, cols - 1);
    if (r.hasHeader && r.headerRow > r.endRow) {
        r.hasHeader = false;
        r.headerRow = -1;
    }
    if (r.sortColumn > r.endCol) {
        r.sortColumn = -1;
        r.sortDirection = SortDirection::None;
    }
    for (auto it = r.filters.begin(); it != r.filters.end();) {
        if (it.key() > r.endCol) it = r.filters.erase(it);
        else ++it;
    }
    return true;
}

QString GridController::importCells(const CellBatch& batch, bool autoExpand,
                                    const std::optional<TableRegion>& region) {
    int dropped = 0;
    for (const auto& e : batch) {
        const bool inside = e.row >= 0 && e.col >= 0
            && e.row < m_store.rowCount() && e.col < m_store.colCount();
        if (e.row < 0 || e.col < 0 || (!autoExpand && !inside)) {
            dropped++;
            continue;
        }
        m_store.set(e.row, e.col, e.cell);
    }
    if (dropped)
        qWarning() << "GridController: import dropped" << dropped << "cell(s) outside the grid";

    QString id;
    if (region) {
        TableRegion r = *region;
        if (autoExpand) {
            m_store.ensureSize(r.endRow + 1, r.endCol + 1);
            id = m_tables.addRegion(r);
        } else if (clipRegion(r, m_store.rowCount(), m_store.colCount())) {
            id = m_tables.addRegion(r);
        } else {
            qWarning() << "GridController: import table region lies outside the grid, skipped";
        }
    }
    qDebug() << "GridController: imported" << batch.size() - dropped << "cells";

    syncDimensions();
    emit cellsChanged();
    if (!id.isEmpty()) emit tablesChanged();
    return id;
}

bool GridController::format(const CellFormatting& patch) {
    const QVector<GridPos> cells = m_selection.selectedCells();
    if (cells.isEmpty()) return false;

    for (const auto& p : cells) {
        Cell c;
        if (const Cell* existing = m_store.find(p.row, p.col)) {
            c = *existing;
            if (!c.formatting) c.formatting = CellFormatting{};
            c.formatting->merge(patch);
        } else {
            c.value.type = CellType::Text;
            c.value.value = QString();
            c.formatting = patch;
        }
        m_store.set(p.row, p.col, c);
    }
    syncDimensions();
    emit cellsChanged();
    return true;
}

bool GridController::copy() {
    const bool ok = m_clipboard.copy(m_store, m_selection.selectedCells());
    emit clipboardChanged(ok);
    return ok;
}

bool GridController::cut() {
    const bool ok = m_clipboard.cut(m_store, m_selection.selectedCells());
    emit clipboardChanged(ok);
    return ok;
}

bool GridController::paste() {
    auto anchor = m_selection.activeCell();
    if (!anchor || !m_clipboard.hasData())
        return false;
    if (!m_clipboard.paste(m_store, *anchor))
        return false;
    syncDimensions();
    emit cellsChanged();
    emit clipboardChanged(false);
    return true;
}

void GridController::cancelClipboard() {
    if (!m_clipboard.hasData()) return;
    m_clipboard.cancel();
    emit clipboardChanged(false);
}

// Propagates the first row (down) or first column (right) of every
// selected rectangle across the rest of it. Empty sources clear targets.
bool GridController::fill(bool down) {
    if (m_selection.isEmpty()) return false;

    bool changed = false;
    for (const auto& rr : m_selection.ranges()) {
        int top = rr.top(), bottom = rr.bottom(), left = rr.left(), right = rr.right();
        if (m_selection.type() == SelectionType::Row) {
            left = 0;
            right = m_store.colCount() - 1;
        } else if (m_selection.type() == SelectionType::Column) {
            top = 0;
            bottom = m_store.rowCount() - 1;
        }

        if (down) {
            if (top == bottom) continue;
            for (int col = left; col <= right; col++) {
                const std::optional<Cell> src = m_store.contains(top, col)
                    ? std::optional<Cell>(m_store.cell(top, col)) : std::nullopt;
                for (int row = top + 1; row <= bottom; row++) {
                    if (src) m_store.set(row, col, *src);
                    else     m_store.remove(row, col);
                }
            }
        } else {
            if (left == right) continue;
            for (int row = top; row <= bottom; row++) {
                const std::optional<Cell> src = m_store.contains(row, left)
                    ? std::optional<Cell>(m_store.cell(row, left)) : std::nullopt;
                for (int col = left + 1; col <= right; col++) {
                    if (src) m_store.set(row, col, *src);
                    else     m_store.remove(row, col);
                }
            }
        }
        changed = true;
    }
    if (changed) emit cellsChanged();
    return changed;
}

bool GridController::fillDown()  { return fill(true); }
bool GridController::fillRight() { return fill(false); }

std::optional<CellFormatting> GridController::selectedFormatting() const {
    auto p = m_selection.activeCell();
    if (!p) return std::nullopt;
    const Cell* c = m_store.find(p->row, p->col);
    return c ? c->formatting : std::nullopt;
}

std::optional<CellType> GridController::selectedCellType() const {
    auto p = m_selection.activeCell();
    if (!p) return std::nullopt;
    const Cell* c = m_store.find(p->row, p->col);
    if (!c) return std::nullopt;
    return c->value.type;
}

// Relabels existing cells only; values are not reparsed.
bool GridController::setSelectedCellType(CellType type) {
    int changed = 0;
    for (const auto& p : m_selection.selectedCells()) {
        const Cell* existing = m_store.find(p.row, p.col);
        if (!existing || existing->value.type == type) continue;
        Cell c = *existing;
        c.value.type = type;
        m_store.set(p.row, p.col, c);
        changed++;
    }
    if (!changed) return false;
    qDebug() << "GridController: relabelled" << changed << "cell(s) as" << typeToString(type);
    emit cellsChanged();
    return true;
}

void GridController::addRows(int n) {
    if (n <= 0) return;
    m_store.ensureSize(m_store.rowCount() + n, m_store.colCount());
    syncDimensions();
}

void GridController::addColumns(int n) {
    if (n <= 0) return;
    m_store.ensureSize(m_store.rowCount(), m_store.colCount() + n);
    syncDimensions();
}

SortDirection GridController::sortTable(const QString& id, int column) {
    commitEdit();
    SortDirection dir = m_tables.cycleSort(m_store, id, column);
    emit tablesChanged();
    emit cellsChanged();
    return dir;
}

bool GridController::setTableSort(const QString& id, int column, SortDirection dir) {
    commitEdit();
    if (!m_tables.sort(m_store, id, column, dir))
        return false;
    emit tablesChanged();
    emit cellsChanged();
    return true;
}

bool GridController::applyFilter(const QString& id, int column, const QSet<QString>& values) {
    if (!m_tables.setFilter(id, column, values))
        return false;
    emit tablesChanged();
    return true;
}

bool GridController::removeTable(const QString& id) {
    if (!m_tables.removeRegion(id))
        return false;
    emit tablesChanged();
    return true;
}

// ── Drag capture ──

void GridController::setHitTester(HitTestFn hit, AxisPosFn axisPos) {
    m_hitTest = std::move(hit);
    m_axisPos = std::move(axisPos);
}

void GridController::beginDrag(DragSession::PointFn onMove, DragSession::PointFn onRelease) {
    endDrag();
    m_drag = new DragSession(std::move(onMove), std::move(onRelease), this);
}

void GridController::endDrag() {
    if (m_drag) {
        m_drag->stop();
        m_drag->deleteLater();
        m_drag = nullptr;
    }
}

// ── Selection input ──

void GridController::pointerPressed(SelectionType type, int row, int col, Qt::KeyboardModifiers mods) {
    commitEdit();
    if (!m_selection.press(type, row, col, mods))
        return;
    emit selectionChanged();

    beginDrag(
        [this](const QPoint& pos) {
            if (!m_hitTest) return;
            if (auto hit = m_hitTest(pos))
                pointerEntered(hit->row, hit->col);
        },
        [this](const QPoint&) { pointerReleased(); });
}

void GridController::pointerEntered(int row, int col) {
    row = qBound(0, row, m_store.rowCount() - 1);
    col = qBound(0, col, m_store.colCount() - 1);
    if (m_selection.extendTo(row, col))
        emit selectionChanged();
}

void GridController::pointerReleased() {
    if (m_resize.isActive()) {
        resizeHandleReleased();
        return;
    }
    endDrag();
    if (m_selection.isDragging()) {
        m_selection.release();
        emit selectionChanged();
    }
}

bool GridController::cellClicked(int row, int col) {
    const TableRegion* r = m_tables.regionForHeader(row, col);
    if (!r) return false;
    sortTable(r->id, col);
    return true;
}

void GridController::cellDoubleClicked(int row, int col) {
    endDrag();
    if (!m_edit.begin(row, col)) return;
    emit selectionChanged();
    emit editStarted(row, col, m_edit.buffer());
}

// ── Edit ──

bool GridController::commitEdit() {
    if (!m_edit.isActive()) return false;
    m_edit.commit();
    syncDimensions();
    emit cellsChanged();
    emit editEnded();
    return true;
}

void GridController::setEditBuffer(const QString& text) {
    m_edit.setBuffer(text);
}

void GridController::editorFocusLost() {
    commitEdit();
}

bool GridController::keyPressed(int key, Qt::KeyboardModifiers mods, const QString& text) {
    if (m_edit.isActive()) {
        switch (m_edit.handleKey(key)) {
        case EditKeyResult::Ignored:
            return false;
        case EditKeyResult::Cancelled:
            emit editEnded();
            return true;
        case EditKeyResult::Committed:
            emit cellsChanged();
            emit editEnded();
            emit selectionChanged();
            return true;
        case EditKeyResult::Moved:
            emit cellsChanged();
            emit selectionChanged();
            emit editStarted(m_edit.position().row, m_edit.position().col, m_edit.buffer());
            return true;
        }
        return false;
    }

    const bool ctrl = mods & (Qt::ControlModifier | Qt::MetaModifier);
    if (ctrl) {
        switch (key) {
        case Qt::Key_C: return copy();
        case Qt::Key_X: return cut();
        case Qt::Key_V: return paste();
        case Qt::Key_D: return fillDown();
        case Qt::Key_R: return fillRight();
        default: return false;
        }
    }

    int dRow = 0, dCol = 0;
    switch (key) {
    case Qt::Key_Escape:
        if (!m_clipboard.hasData()) return false;
        cancelClipboard();
        return true;
    case Qt::Key_F2: {
        auto p = m_selection.activeCell();
        if (!p || !m_selection.isSingleCell()) return false;
        cellDoubleClicked(p->row, p->col);
        return true;
    }
    case Qt::Key_Up:    dRow = -1; break;
    case Qt::Key_Down:  dRow =  1; break;
    case Qt::Key_Left:  dCol = -1; break;
    case Qt::Key_Right: dCol =  1; break;
    default:
        if (m_edit.beginFromKey(key, text)) {
            endDrag();
            emit editStarted(m_edit.position().row, m_edit.position().col, m_edit.buffer());
            return true;
        }
        return false;
    }

    // Shift+arrow grows the latest cell rectangle
    if ((mods & Qt::ShiftModifier) && m_selection.type() == SelectionType::Cell
        && !m_selection.isEmpty()) {
        SelectionRange r = m_selection.ranges().last();
        r.cursor.row = qBound(0, r.cursor.row + dRow, m_store.rowCount() - 1);
        r.cursor.col = qBound(0, r.cursor.col + dCol, m_store.colCount() - 1);
        m_selection.setRanges(SelectionType::Cell, {r});
    } else {
        m_selection.moveBy(dRow, dCol);
    }
    emit selectionChanged();
    return true;
}

// ── Resize input ──

bool GridController::resizeHandlePressed(Axis axis, int index, qint64 pointerPos) {
    commitEdit();
    if (!m_resize.begin(axis, index, pointerPos, m_selection))
        return false;
    beginDrag(
        [this](const QPoint& pos) {
            if (m_axisPos) resizeHandleMoved(m_axisPos(m_resize.axis(), pos));
        },
        [this](const QPoint&) { resizeHandleReleased(); });
    return true;
}

void GridController::resizeHandleMoved(qint64 pointerPos) {
    if (m_resize.update(pointerPos) < 0) return;
    m_viewport.invalidate();
    emit dimensionsChanged();
}

void GridController::resizeHandleReleased() {
    endDrag();
    if (!m_resize.isActive()) return;
    m_resize.end();
    emit dimensionsChanged();
}

void GridController::resizeHandleDoubleClicked(Axis axis, int index) {
    if (axis != Axis::Column) return;
    if (m_resize.autoFitColumn(m_store, m_svc, index, m_selection) < 0) return;
    m_viewport.invalidate();
    emit dimensionsChanged();
}

bool GridController::resetSize(Axis axis, int index) {
    if (m_resize.isActive()) return false;
    if (m_resize.resetToDefault(axis, index, m_selection) == 0) return false;
    m_viewport.invalidate();
    emit dimensionsChanged();
    return true;
}

void GridController::resetAllSizes() {
    if (m_resize.isActive()) return;
    m_rows.clearSizes();
    m_cols.clearSizes();
    m_viewport.invalidate();
    emit dimensionsChanged();
}

void GridController::scrolled(const ScrollState& s) {
    m_viewport.scheduleScroll(s);
}

} // namespace tbx
