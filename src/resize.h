#pragma once
#include "cellstore.h"
#include "config.h"
#include "dimensionindex.h"
#include "selection.h"

namespace tbx {

enum class Axis : uint8_t { Row, Column };

// Boundary-handle drags and column auto-fit.
//
// A drag started on an index that is part of a matching row/column
// selection resizes every selected index to the same size.
class ResizeEngine {
public:
    ResizeEngine(DimensionIndex& rows, DimensionIndex& cols, const GridConfig& cfg);

    bool begin(Axis axis, int index, qint64 pointerPos, const SelectionModel& sel);
    // Returns the size applied, floor included. -1 when no drag is active.
    int  update(qint64 pointerPos);
    void end();

    bool isActive() const { return m_active; }
    Axis axis() const { return m_axis; }
    int  index() const { return m_index; }
    const QVector<int>& affected() const { return m_affected; }

    // Indices a resize of |index| on |axis| should touch.
    static QVector<int> affectedIndices(Axis axis, int index, const SelectionModel& sel);

    int estimateColumnWidth(const CellStore& store, const ValueServices& svc, int col) const;
    // Applies the estimate to the column, or to the whole column selection
    // when it contains |col|. Returns the width applied.
    int autoFitColumn(const CellStore& store, const ValueServices& svc, int col,
                      const SelectionModel& sel);

    // Returns the affected indices to the default size. Returns how many
    // had an override.
    int resetToDefault(Axis axis, int index, const SelectionModel& sel);

private:
    DimensionIndex& dim(Axis a) { return a == Axis::Row ? m_rows : m_cols; }

    DimensionIndex&   m_rows;
    DimensionIndex&   m_cols;
    const GridConfig& m_cfg;

    bool         m_active = false;
    Axis         m_axis   = Axis::Column;
    int          m_index  = -1;
    qint64       m_startPos  = 0;
    int          m_startSize = 0;
    QVector<int> m_affected;
};

} // namespace tbx
