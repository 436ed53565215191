#include <QtTest/QTest>
#include <QtTest/QSignalSpy>
#include "controller.h"

using namespace tbx;

static GridConfig smallConfig() {
    GridConfig cfg;
    cfg.initialRows = 20;
    cfg.initialCols = 10;
    cfg.scrollFrameMs = 0;
    return cfg;
}

static void select(GridController& ctrl, int r0, int c0, int r1, int c1) {
    ctrl.pointerPressed(SelectionType::Cell, r0, c0, Qt::NoModifier);
    ctrl.pointerEntered(r1, c1);
    ctrl.pointerReleased();
}

static CellEntry entry(int row, int col, const QString& text) {
    CellEntry e;
    e.row = row;
    e.col = col;
    e.cell.value = infer::inferValue(text);
    return e;
}

static QString rawAt(const GridController& ctrl, int row, int col) {
    const Cell* c = ctrl.store().find(row, col);
    return c ? c->value.rawText : QString();
}

// Single-column table: header at row 0, data rows 1..3.
static QString importLetters(GridController& ctrl) {
    CellBatch batch{entry(0, 0, "Letter"), entry(1, 0, "b"), entry(2, 0, "c"), entry(3, 0, "a")};
    TableRegion r;
    r.startRow = 0; r.endRow = 3;
    r.startCol = 0; r.endCol = 0;
    r.hasHeader = true;
    r.headerRow = 0;
    return ctrl.importCells(batch, true, r);
}

class TestController : public QObject {
    Q_OBJECT
private slots:
    void initTestCase() {
        qRegisterMetaType<tbx::Viewport>();
    }

    // ── Cell writes ──

    void testSetCellParsesNumber() {
        GridController ctrl(smallConfig());
        QSignalSpy cells(&ctrl, &GridController::cellsChanged);
        ctrl.setCell(1, 1, "42");
        QCOMPARE(cells.count(), 1);
        Cell c = ctrl.cell(1, 1);
        QCOMPARE(c.value.type, CellType::Number);
        QCOMPARE(c.value.value.toDouble(), 42.0);
        QCOMPARE(ctrl.displayText(1, 1), QString("42"));
    }

    void testSetCellGrowsGrid() {
        GridController ctrl(smallConfig());
        QSignalSpy dims(&ctrl, &GridController::dimensionsChanged);
        ctrl.setCell(30, 12, "x");
        QCOMPARE(ctrl.rowCount(), 31);
        QCOMPARE(ctrl.colCount(), 13);
        QCOMPARE(ctrl.rowIndex().count(), 31);
        QCOMPARE(ctrl.colIndex().count(), 13);
        QCOMPARE(ctrl.selection().rowBound(), 31);
        QCOMPARE(dims.count(), 1);
    }

    void testSetCellRejectsNegative() {
        GridController ctrl(smallConfig());
        ctrl.setCell(-1, 0, "x");
        QVERIFY(ctrl.store().isEmpty());
    }

    void testSetRangeAndBatch() {
        GridController ctrl(smallConfig());
        ctrl.setRange(1, 1, 0, 0, "x");
        QCOMPARE(ctrl.store().size(), 4);

        QVector<RawCellUpdate> updates;
        updates.append(RawCellUpdate{0, 5, "1"});
        updates.append(RawCellUpdate{40, 0, "y"});
        updates.append(RawCellUpdate{-1, 0, "z"});
        ctrl.batchSet(updates);
        QCOMPARE(ctrl.store().size(), 6);
        QCOMPARE(ctrl.rowCount(), 41);
    }

    void testImportStyledBatchGrows() {
        GridController ctrl(smallConfig());
        QSignalSpy tables(&ctrl, &GridController::tablesChanged);

        CellBatch batch;
        CellFormatting bold;
        bold.bold = true;
        for (int row = 18; row <= 20; row++) {
            for (int col = 9; col <= 10; col++) {
                CellEntry e = entry(row, col, QString::number(row * col));
                e.cell.formatting = bold;
                batch.append(e);
            }
        }
        TableRegion r;
        r.startRow = 18; r.endRow = 20;
        r.startCol = 9;  r.endCol = 10;
        r.hasHeader = true;
        r.headerRow = 18;

        const QString id = ctrl.importCells(batch, true, r);
        QCOMPARE(id, QString("table-1"));
        QCOMPARE(tables.count(), 1);
        QCOMPARE(ctrl.rowCount(), 21);
        QCOMPARE(ctrl.colCount(), 11);
        QVERIFY(ctrl.cell(20, 10).formatting->isBold());
        QVERIFY(ctrl.tables().regionForHeader(18, 10));
    }

    void testImportWithoutExpandDropsOutside() {
        GridController ctrl(smallConfig());
        CellBatch batch{entry(0, 0, "in"), entry(25, 0, "out"), entry(0, 12, "out")};
        QVERIFY(ctrl.importCells(batch, false).isEmpty());
        QCOMPARE(ctrl.store().size(), 1);
        QCOMPARE(ctrl.rowCount(), 20);
        QCOMPARE(ctrl.colCount(), 10);
    }

    void testImportWithoutExpandClipsRegion() {
        GridController ctrl(smallConfig());
        QSignalSpy tables(&ctrl, &GridController::tablesChanged);

        TableRegion r;
        r.startRow = 17; r.endRow = 24;
        r.startCol = 8;  r.endCol = 12;
        r.hasHeader = true;
        r.headerRow = 17;
        const QString id = ctrl.importCells({entry(17, 8, "Head")}, false, r);
        QVERIFY(!id.isEmpty());
        QCOMPARE(tables.count(), 1);

        const TableRegion* t = ctrl.tables().region(id);
        QVERIFY(t);
        QCOMPARE(t->endRow, ctrl.rowCount() - 1);
        QCOMPARE(t->endCol, ctrl.colCount() - 1);
        QVERIFY(ctrl.tables().regionForHeader(17, 9));
        QVERIFY(!ctrl.tables().regionForHeader(17, 12));

        // header below the last row: region kept without a header
        TableRegion low;
        low.startRow = 15; low.endRow = 30;
        low.startCol = 0;  low.endCol = 1;
        low.hasHeader = true;
        low.headerRow = 25;
        const QString lowId = ctrl.importCells({}, false, low);
        QVERIFY(!ctrl.tables().region(lowId)->hasHeader);

        // entirely outside: skipped
        TableRegion out;
        out.startRow = 40; out.endRow = 45;
        out.startCol = 0;  out.endCol = 2;
        QVERIFY(ctrl.importCells({}, false, out).isEmpty());
        QCOMPARE(ctrl.tables().regions().size(), 2);
        QCOMPARE(ctrl.rowCount(), 20);
    }

    void testCustomValueServices() {
        GridController ctrl(smallConfig());
        ValueServices svc;
        svc.parse = [](const QString& s) {
            CellValue v;
            v.value = s.toUpper();
            v.rawText = s;
            return v;
        };
        ctrl.setValueServices(svc);
        ctrl.setCell(0, 0, "abc");
        QCOMPARE(ctrl.displayText(0, 0), QString("ABC"));
        QVERIFY(ctrl.valueServices().display);
    }

    // ── Editing ──

    void testTypingThenEnterCommits() {
        GridController ctrl(smallConfig());
        QSignalSpy started(&ctrl, &GridController::editStarted);
        QSignalSpy ended(&ctrl, &GridController::editEnded);
        select(ctrl, 0, 0, 0, 0);

        QVERIFY(ctrl.keyPressed(Qt::Key_5, Qt::NoModifier, "5"));
        QCOMPARE(started.count(), 1);
        QCOMPARE(started.at(0).at(2).toString(), QString("5"));
        QVERIFY(ctrl.editSession().isActive());

        ctrl.setEditBuffer("57");
        QVERIFY(ctrl.keyPressed(Qt::Key_Return, Qt::NoModifier));
        QCOMPARE(ended.count(), 1);
        QCOMPARE(ctrl.cell(0, 0).value.value.toDouble(), 57.0);
        QCOMPARE(*ctrl.activeCell(), (GridPos{1, 0}));
    }

    void testDoubleClickLoadsRawText() {
        GridController ctrl(smallConfig());
        ctrl.setCell(2, 2, "hello");
        QSignalSpy started(&ctrl, &GridController::editStarted);
        ctrl.cellDoubleClicked(2, 2);
        QCOMPARE(started.count(), 1);
        QCOMPARE(started.at(0).at(0).toInt(), 2);
        QCOMPARE(started.at(0).at(1).toInt(), 2);
        QCOMPARE(started.at(0).at(2).toString(), QString("hello"));

        ctrl.setEditBuffer("changed");
        QVERIFY(ctrl.keyPressed(Qt::Key_Escape, Qt::NoModifier));
        QVERIFY(!ctrl.editSession().isActive());
        QCOMPARE(rawAt(ctrl, 2, 2), QString("hello"));
    }

    void testF2StartsEdit() {
        GridController ctrl(smallConfig());
        ctrl.setCell(1, 1, "abc");
        select(ctrl, 1, 1, 1, 1);
        QVERIFY(ctrl.keyPressed(Qt::Key_F2, Qt::NoModifier));
        QCOMPARE(ctrl.editSession().buffer(), QString("abc"));
    }

    void testPointerPressCommitsEdit() {
        GridController ctrl(smallConfig());
        ctrl.cellDoubleClicked(0, 0);
        ctrl.setEditBuffer("abc");
        ctrl.pointerPressed(SelectionType::Cell, 3, 3, Qt::NoModifier);
        ctrl.pointerReleased();
        QVERIFY(!ctrl.editSession().isActive());
        QCOMPARE(rawAt(ctrl, 0, 0), QString("abc"));
    }

    void testEditorFocusLostCommits() {
        GridController ctrl(smallConfig());
        ctrl.cellDoubleClicked(4, 4);
        ctrl.setEditBuffer("2024-01-02");
        ctrl.editorFocusLost();
        QCOMPARE(ctrl.cell(4, 4).value.type, CellType::Date);
        QCOMPARE(*ctrl.cell(4, 4).formatting->dateFormat, QString("YYYY-MM-DD"));
    }

    // ── Selection input ──

    void testPointerDragIsClamped() {
        GridController ctrl(smallConfig());
        ctrl.pointerPressed(SelectionType::Cell, 1, 1, Qt::NoModifier);
        QVERIFY(ctrl.isDragCaptured());
        ctrl.pointerEntered(3, 4);
        ctrl.pointerEntered(99, 99);
        ctrl.pointerReleased();
        QVERIFY(!ctrl.isDragCaptured());

        SelectionRange box = ctrl.selection().boundingBox();
        QCOMPARE(box.bottom(), 19);
        QCOMPARE(box.right(), 9);
        QCOMPARE(ctrl.selection().state(), SelectionState::Committed);
    }

    void testCtrlClickMixedTypeIgnored() {
        GridController ctrl(smallConfig());
        select(ctrl, 0, 0, 0, 0);
        QSignalSpy sel(&ctrl, &GridController::selectionChanged);
        ctrl.pointerPressed(SelectionType::Row, 3, 0, Qt::ControlModifier);
        QCOMPARE(sel.count(), 0);
        QCOMPARE(ctrl.selection().type(), SelectionType::Cell);
        QVERIFY(!ctrl.isDragCaptured());
    }

    void testArrowKeys() {
        GridController ctrl(smallConfig());
        select(ctrl, 2, 2, 2, 2);
        QVERIFY(ctrl.keyPressed(Qt::Key_Down, Qt::NoModifier));
        QCOMPARE(*ctrl.activeCell(), (GridPos{3, 2}));
        QVERIFY(ctrl.keyPressed(Qt::Key_Right, Qt::ShiftModifier));
        QCOMPARE(ctrl.selection().selectedCells().size(), 2);
        QCOMPARE(*ctrl.activeCell(), (GridPos{3, 2}));
        QVERIFY(ctrl.keyPressed(Qt::Key_Up, Qt::NoModifier));
        QVERIFY(ctrl.selection().isSingleCell());
        QCOMPARE(*ctrl.activeCell(), (GridPos{2, 2}));
    }

    // ── Clipboard ──

    void testCopyPasteKeys() {
        GridController ctrl(smallConfig());
        QSignalSpy clip(&ctrl, &GridController::clipboardChanged);
        ctrl.setCell(0, 0, "a");
        select(ctrl, 0, 0, 0, 0);
        QVERIFY(ctrl.keyPressed(Qt::Key_C, Qt::ControlModifier));
        QVERIFY(ctrl.clipboard().hasData());
        QCOMPARE(clip.last().at(0).toBool(), true);
        QCOMPARE(ctrl.clipboardText(), QString("a"));

        select(ctrl, 4, 4, 4, 4);
        QVERIFY(ctrl.keyPressed(Qt::Key_V, Qt::ControlModifier));
        QCOMPARE(rawAt(ctrl, 4, 4), QString("a"));
        QCOMPARE(rawAt(ctrl, 0, 0), QString("a"));
        QCOMPARE(clip.last().at(0).toBool(), false);
        QVERIFY(!ctrl.paste());
    }

    void testCutThenEscapeKeepsSource() {
        GridController ctrl(smallConfig());
        ctrl.setCell(0, 0, "a");
        select(ctrl, 0, 0, 0, 0);
        QVERIFY(ctrl.keyPressed(Qt::Key_X, Qt::ControlModifier));
        QVERIFY(ctrl.clipboard().isCut());
        QVERIFY(ctrl.keyPressed(Qt::Key_Escape, Qt::NoModifier));
        QVERIFY(!ctrl.clipboard().hasData());
        select(ctrl, 5, 5, 5, 5);
        QVERIFY(!ctrl.paste());
        QCOMPARE(rawAt(ctrl, 0, 0), QString("a"));
        QVERIFY(!ctrl.store().contains(5, 5));
    }

    void testCutPasteMoves() {
        GridController ctrl(smallConfig());
        ctrl.setCell(0, 0, "a");
        ctrl.setCell(0, 1, "b");
        select(ctrl, 0, 0, 0, 1);
        QVERIFY(ctrl.cut());
        select(ctrl, 6, 3, 6, 3);
        QVERIFY(ctrl.paste());
        QVERIFY(!ctrl.store().contains(0, 0));
        QCOMPARE(rawAt(ctrl, 6, 3), QString("a"));
        QCOMPARE(rawAt(ctrl, 6, 4), QString("b"));
    }

    // ── Fill / format / type ──

    void testFillDown() {
        GridController ctrl(smallConfig());
        ctrl.setCell(0, 0, "x");
        ctrl.setCell(2, 1, "old");
        select(ctrl, 0, 0, 3, 1);
        QVERIFY(ctrl.keyPressed(Qt::Key_D, Qt::ControlModifier));
        for (int row = 1; row <= 3; row++)
            QCOMPARE(rawAt(ctrl, row, 0), QString("x"));
        // empty source clears the column
        QVERIFY(!ctrl.store().contains(2, 1));
    }

    void testFillRight() {
        GridController ctrl(smallConfig());
        ctrl.setCell(5, 2, "7");
        select(ctrl, 5, 2, 5, 5);
        QVERIFY(ctrl.fillRight());
        QCOMPARE(ctrl.cell(5, 5).value.value.toDouble(), 7.0);
        select(ctrl, 8, 8, 8, 8);
        QVERIFY(!ctrl.fillRight());
    }

    void testFormatCreatesCells() {
        GridController ctrl(smallConfig());
        ctrl.setCell(5, 5, "1");
        select(ctrl, 5, 5, 5, 6);
        CellFormatting patch;
        patch.bold = true;
        QVERIFY(ctrl.format(patch));
        QVERIFY(ctrl.cell(5, 5).formatting->isBold());
        QCOMPARE(ctrl.cell(5, 5).value.type, CellType::Number);
        QVERIFY(ctrl.store().contains(5, 6));
        QVERIFY(ctrl.cell(5, 6).formatting->isBold());
        QVERIFY(ctrl.displayText(5, 6).isEmpty());
        QVERIFY(ctrl.selectedFormatting()->isBold());

        CellFormatting more;
        more.italic = true;
        ctrl.format(more);
        QVERIFY(ctrl.cell(5, 5).formatting->isBold());
        QCOMPARE(ctrl.cell(5, 5).formatting->italic, std::optional<bool>(true));
    }

    void testSetSelectedCellType() {
        GridController ctrl(smallConfig());
        ctrl.setCell(0, 0, "42");
        select(ctrl, 0, 0, 0, 1);
        QCOMPARE(*ctrl.selectedCellType(), CellType::Number);
        QVERIFY(ctrl.setSelectedCellType(CellType::Text));
        QCOMPARE(ctrl.cell(0, 0).value.type, CellType::Text);
        QVERIFY(!ctrl.store().contains(0, 1));
        QVERIFY(!ctrl.setSelectedCellType(CellType::Text));
    }

    // ── Tables ──

    void testHeaderClickCyclesSort() {
        GridController ctrl(smallConfig());
        importLetters(ctrl);
        QVERIFY(!ctrl.cellClicked(1, 0));

        QVERIFY(ctrl.cellClicked(0, 0));
        QCOMPARE(rawAt(ctrl, 1, 0), QString("a"));
        QCOMPARE(rawAt(ctrl, 3, 0), QString("c"));

        QVERIFY(ctrl.cellClicked(0, 0));
        QCOMPARE(rawAt(ctrl, 1, 0), QString("c"));
        QCOMPARE(rawAt(ctrl, 3, 0), QString("a"));

        QVERIFY(ctrl.cellClicked(0, 0));
        QCOMPARE(ctrl.tables().regions().first().sortDirection, SortDirection::None);
        QCOMPARE(rawAt(ctrl, 1, 0), QString("c"));
        QCOMPARE(rawAt(ctrl, 0, 0), QString("Letter"));
    }

    void testSortRegionWithoutHeaderRow() {
        GridController ctrl(smallConfig());
        CellBatch batch{entry(0, 0, "b"), entry(1, 0, "a")};
        TableRegion r;
        r.startRow = 0; r.endRow = 1;
        r.startCol = 0; r.endCol = 0;
        r.hasHeader = true;
        r.headerRow = -1;
        const QString id = ctrl.importCells(batch, true, r);
        QVERIFY(ctrl.setTableSort(id, 0, SortDirection::Ascending));
        QCOMPARE(rawAt(ctrl, 0, 0), QString("a"));
        QCOMPARE(rawAt(ctrl, 1, 0), QString("b"));
    }

    void testFilterAndRemoveTable() {
        GridController ctrl(smallConfig());
        const QString id = importLetters(ctrl);
        QVERIFY(ctrl.applyFilter(id, 0, {"a"}));
        QVERIFY(!ctrl.isRowVisible(1));
        QVERIFY(ctrl.isRowVisible(3));
        QVERIFY(ctrl.isRowVisible(0));

        QVERIFY(ctrl.applyFilter(id, 0, {}));
        QVERIFY(ctrl.isRowVisible(1));

        ctrl.applyFilter(id, 0, {"a"});
        QVERIFY(ctrl.removeTable(id));
        QVERIFY(ctrl.isRowVisible(1));
        QVERIFY(!ctrl.cellClicked(0, 0));
        QVERIFY(!ctrl.removeTable(id));
    }

    // ── Resize ──

    void testResizeHandleDrag() {
        GridController ctrl(smallConfig());
        QSignalSpy dims(&ctrl, &GridController::dimensionsChanged);
        QVERIFY(ctrl.resizeHandlePressed(Axis::Column, 2, 100));
        QVERIFY(ctrl.isDragCaptured());
        ctrl.resizeHandleMoved(150);
        QCOMPARE(ctrl.colIndex().sizeOf(2), 150);
        ctrl.resizeHandleMoved(0);
        QCOMPARE(ctrl.colIndex().sizeOf(2), 30);
        ctrl.resizeHandleReleased();
        QVERIFY(!ctrl.isDragCaptured());
        QVERIFY(!ctrl.resizer().isActive());
        QCOMPARE(dims.count(), 3);
    }

    void testAutoFitOnDoubleClick() {
        GridController ctrl(smallConfig());
        ctrl.setCell(0, 3, "Hello World!!");
        ctrl.resizeHandleDoubleClicked(Axis::Column, 3);
        QCOMPARE(ctrl.colIndex().sizeOf(3), 101);
        ctrl.resizeHandleDoubleClicked(Axis::Row, 0);
        QCOMPARE(ctrl.rowIndex().sizeOf(0), 30);
    }

    void testResetSize() {
        GridController ctrl(smallConfig());
        ctrl.resizeHandlePressed(Axis::Column, 2, 100);
        ctrl.resizeHandleMoved(150);
        ctrl.resizeHandleReleased();
        QSignalSpy dims(&ctrl, &GridController::dimensionsChanged);

        QVERIFY(ctrl.resetSize(Axis::Column, 2));
        QCOMPARE(ctrl.colIndex().sizeOf(2), ctrl.colIndex().defaultSize());
        QVERIFY(!ctrl.colIndex().hasOverride(2));
        QCOMPARE(dims.count(), 1);
        // nothing left to reset
        QVERIFY(!ctrl.resetSize(Axis::Column, 2));
        QCOMPARE(dims.count(), 1);
    }

    void testResetAllSizes() {
        GridController ctrl(smallConfig());
        ctrl.setCell(0, 3, "Hello World!!");
        ctrl.resizeHandleDoubleClicked(Axis::Column, 3);
        ctrl.resizeHandlePressed(Axis::Row, 1, 0);
        ctrl.resizeHandleMoved(40);
        ctrl.resizeHandleReleased();

        ctrl.resetAllSizes();
        QVERIFY(ctrl.colIndex().overrides().isEmpty());
        QVERIFY(ctrl.rowIndex().overrides().isEmpty());
        QCOMPARE(ctrl.colIndex().sizeOf(3), ctrl.colIndex().defaultSize());
    }

    // ── Viewport / lifecycle ──

    void testScrollPublishesViewport() {
        GridController ctrl(smallConfig());
        QSignalSpy vp(&ctrl, &GridController::viewportChanged);
        ScrollState s;
        s.y = 300;
        s.width = 500;
        s.height = 150;
        ctrl.scrolled(s);
        ctrl.viewport()->flush();
        QCOMPARE(vp.count(), 1);
        Viewport v = qvariant_cast<Viewport>(vp.at(0).at(0));
        QCOMPARE(v.startRow, 9);
        QCOMPARE(v.endRow, 20);
    }

    void testAddRowsAndColumns() {
        GridController ctrl(smallConfig());
        QSignalSpy dims(&ctrl, &GridController::dimensionsChanged);
        ctrl.addRows(5);
        ctrl.addColumns(2);
        ctrl.addRows(0);
        QCOMPARE(ctrl.rowCount(), 25);
        QCOMPARE(ctrl.colCount(), 12);
        QCOMPARE(dims.count(), 2);
    }

    void testClearResetsEverything() {
        GridController ctrl(smallConfig());
        ctrl.setCell(40, 0, "x");
        importLetters(ctrl);
        select(ctrl, 1, 0, 1, 0);
        ctrl.copy();

        ctrl.clear();
        QVERIFY(ctrl.store().isEmpty());
        QCOMPARE(ctrl.rowCount(), 20);
        QCOMPARE(ctrl.rowIndex().count(), 20);
        QVERIFY(ctrl.tables().regions().isEmpty());
        QVERIFY(!ctrl.clipboard().hasData());
        QVERIFY(ctrl.selection().isEmpty());
    }
};

QTEST_MAIN(TestController)
#include "test_controller.moc"
