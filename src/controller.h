#pragma once
#include "core.h"
#include "config.h"
#include "cellstore.h"
#include "dimensionindex.h"
#include "viewport.h"
#include "selection.h"
#include "editsession.h"
#include "clipboard.h"
#include "tableregion.h"
#include "resize.h"
#include "dragsession.h"
#include <QObject>
#include <QPointer>

namespace tbx {

// ── Controller ──
//
// Owns the grid engines and exposes the host control surface plus the
// input entry points a rendering surface forwards its events to. Every
// mutation is synchronous; observers are told through signals.
class GridController : public QObject {
    Q_OBJECT
public:
    using HitTestFn  = std::function<std::optional<GridPos>(const QPoint& globalPos)>;
    using AxisPosFn  = std::function<qint64(Axis axis, const QPoint& globalPos)>;

    explicit GridController(const GridConfig& cfg = GridConfig{}, QObject* parent = nullptr);
    ~GridController() override;

    const GridConfig&    config() const { return m_cfg; }
    // Null members fall back to the built-in parser/formatter.
    void                 setValueServices(const ValueServices& svc);
    const ValueServices& valueServices() const { return m_svc; }

    const CellStore&         store() const { return m_store; }
    const DimensionIndex&    rowIndex() const { return m_rows; }
    const DimensionIndex&    colIndex() const { return m_cols; }
    const SelectionModel&    selection() const { return m_selection; }
    const EditSession&       editSession() const { return m_edit; }
    const ClipboardEngine&   clipboard() const { return m_clipboard; }
    const TableRegionEngine& tables() const { return m_tables; }
    const ResizeEngine&      resizer() const { return m_resize; }
    ViewportResolver*        viewport() { return &m_viewport; }

    int rowCount() const { return m_store.rowCount(); }
    int colCount() const { return m_store.colCount(); }

    // ── Control surface ──

    void clear();
    void setCell(int row, int col, const QString& rawText);
    void setRange(int r0, int c0, int r1, int c1, const QString& rawText);
    void batchSet(const QVector<RawCellUpdate>& updates);
    // Returns the new region id, or an empty string when no region was given.
    QString importCells(const CellBatch& batch, bool autoExpand = true,
                        const std::optional<TableRegion>& region = std::nullopt);
    bool format(const CellFormatting& patch);

    bool copy();
    bool cut();
    bool paste();
    void cancelClipboard();
    QString clipboardText() const { return m_clipboard.toTsv(m_svc); }

    bool fillDown();
    bool fillRight();

    std::optional<GridPos>        activeCell() const { return m_selection.activeCell(); }
    std::optional<CellFormatting> selectedFormatting() const;
    std::optional<CellType>       selectedCellType() const;
    bool setSelectedCellType(CellType type);

    void addRows(int n);
    void addColumns(int n);

    Cell    cell(int row, int col) const { return m_store.cell(row, col); }
    QString displayText(int row, int col) const;
    bool    isRowVisible(int row) const { return m_tables.isRowVisible(m_store, row); }

    // Cycles asc -> desc -> none on the column.
    SortDirection sortTable(const QString& id, int column);
    bool setTableSort(const QString& id, int column, SortDirection dir);
    bool applyFilter(const QString& id, int column, const QSet<QString>& values);
    bool removeTable(const QString& id);

    // ── Input ──

    void pointerPressed(SelectionType type, int row, int col, Qt::KeyboardModifiers mods);
    void pointerEntered(int row, int col);
    void pointerReleased();
    // True when (row, col) is a table header and its sort cycled.
    bool cellClicked(int row, int col);
    void cellDoubleClicked(int row, int col);
    // True when the key was consumed.
    bool keyPressed(int key, Qt::KeyboardModifiers mods, const QString& text = {});
    void setEditBuffer(const QString& text);
    void editorFocusLost();

    bool resizeHandlePressed(Axis axis, int index, qint64 pointerPos);
    void resizeHandleMoved(qint64 pointerPos);
    void resizeHandleReleased();
    void resizeHandleDoubleClicked(Axis axis, int index);
    bool resetSize(Axis axis, int index);
    void resetAllSizes();

    void scrolled(const ScrollState& s);

    // Maps global pointer positions back to grid coordinates while a drag
    // is captured outside the widget.
    void setHitTester(HitTestFn hit, AxisPosFn axisPos);
    bool isDragCaptured() const { return !m_drag.isNull(); }

signals:
    void cellsChanged();
    void selectionChanged();
    void clipboardChanged(bool hasData);
    void editStarted(int row, int col, const QString& text);
    void editEnded();
    void dimensionsChanged();
    void tablesChanged();
    void viewportChanged(const tbx::Viewport& vp);

private:
    void syncDimensions();
    void beginDrag(DragSession::PointFn onMove, DragSession::PointFn onRelease);
    void endDrag();
    bool commitEdit();
    bool fill(bool down);

    GridConfig        m_cfg;
    ValueServices     m_svc;
    CellStore         m_store;
    DimensionIndex    m_rows;
    DimensionIndex    m_cols;
    SelectionModel    m_selection;
    EditSession       m_edit;
    ClipboardEngine   m_clipboard;
    TableRegionEngine m_tables;
    ResizeEngine      m_resize;
    ViewportResolver  m_viewport;

    QPointer<DragSession> m_drag;
    HitTestFn m_hitTest;
    AxisPosFn m_axisPos;
};

} // namespace tbx
