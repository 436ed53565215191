#include "resize.h"
#include <QDebug>
#include <climits>
#include <cmath>

namespace tbx {

ResizeEngine::ResizeEngine(DimensionIndex& rows, DimensionIndex& cols, const GridConfig& cfg)
    : m_rows(rows)
    , m_cols(cols)
    , m_cfg(cfg)
{}

QVector<int> ResizeEngine::affectedIndices(Axis axis, int index, const SelectionModel& sel) {
    const SelectionType want = axis == Axis::Row ? SelectionType::Row : SelectionType::Column;
    QVector<int> selected = sel.selectedIndices(want);
    if (selected.contains(index))
        return selected;
    return {index};
}

bool ResizeEngine::begin(Axis axis, int index, qint64 pointerPos, const SelectionModel& sel) {
    DimensionIndex& d = dim(axis);
    if (index < 0 || index >= d.count()) {
        qWarning() << "ResizeEngine: handle index out of range" << index;
        return false;
    }
    m_active    = true;
    m_axis      = axis;
    m_index     = index;
    m_startPos  = pointerPos;
    m_startSize = d.sizeOf(index);
    m_affected  = affectedIndices(axis, index, sel);
    return true;
}

int ResizeEngine::update(qint64 pointerPos) {
    if (!m_active) return -1;
    DimensionIndex& d = dim(m_axis);
    const qint64 wanted = qint64(m_startSize) + (pointerPos - m_startPos);
    const int size = int(qBound<qint64>(d.minSize(), wanted, INT_MAX));
    for (int i : m_affected)
        d.setSize(i, size);
    return size;
}

void ResizeEngine::end() {
    if (!m_active) return;
    qDebug() << "ResizeEngine:" << (m_axis == Axis::Row ? "rows" : "columns") << m_affected
             << "->" << dim(m_axis).sizeOf(m_index);
    m_active = false;
    m_index  = -1;
    m_affected.clear();
}

int ResizeEngine::resetToDefault(Axis axis, int index, const SelectionModel& sel) {
    DimensionIndex& d = dim(axis);
    if (index < 0 || index >= d.count()) return 0;
    int reset = 0;
    for (int i : affectedIndices(axis, index, sel)) {
        if (d.resetSize(i)) reset++;
    }
    return reset;
}

// ── Auto-fit ──

int ResizeEngine::estimateColumnWidth(const CellStore& store, const ValueServices& svc, int col) const {
    double widest = m_cfg.minAutoFitWidth;

    const QString header = fmt::columnLabel(col);
    widest = qMax(widest, double(header.size() * m_cfg.headerCharWidth + m_cfg.autoFitPadding));

    for (const auto& e : store.columnCells(col)) {
        const QString text = svc.displayOf(e.cell);
        double charWidth = m_cfg.charWidth;
        double factor = 1.0;
        if (e.cell.formatting) {
            if (e.cell.formatting->fontSize && m_cfg.baseFontSize > 0)
                charWidth = charWidth * *e.cell.formatting->fontSize / m_cfg.baseFontSize;
            if (e.cell.formatting->isBold())
                factor = m_cfg.boldFactor;
        }
        widest = qMax(widest, text.size() * charWidth * factor + m_cfg.autoFitPadding);
    }

    const int width = int(std::ceil(widest));
    return qBound(m_cols.minSize(), width, m_cfg.maxAutoFitWidth);
}

int ResizeEngine::autoFitColumn(const CellStore& store, const ValueServices& svc, int col,
                                const SelectionModel& sel) {
    if (col < 0 || col >= m_cols.count()) return -1;
    const int width = estimateColumnWidth(store, svc, col);
    for (int c : affectedIndices(Axis::Column, col, sel))
        m_cols.setSize(c, width);
    return width;
}

} // namespace tbx
