#include "gridview.h"
#include <QPainter>
#include <QPaintEvent>
#include <QMouseEvent>
#include <QKeyEvent>
#include <QScrollBar>
#include <QMenu>
#include <QDialog>
#include <QDialogButtonBox>
#include <QListWidget>
#include <QVBoxLayout>
#include <QGuiApplication>
#include <QClipboard>
#include <QPushButton>
#include <climits>

namespace tbx {

static constexpr int kHandleSlop = 4;   // px either side of a boundary
static constexpr int kGlyphWidth = 16;  // sort/filter glyph area in table headers

static QPoint localPointOf(const QMouseEvent* me) {
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    return me->position().toPoint();
#else
    return me->pos();
#endif
}

GridView::GridView(GridController* ctrl, QWidget* parent)
    : QAbstractScrollArea(parent)
    , m_ctrl(ctrl)
{
    setFocusPolicy(Qt::StrongFocus);
    viewport()->setMouseTracking(true);
    horizontalScrollBar()->setSingleStep(20);
    verticalScrollBar()->setSingleStep(20);

    m_editor = new QLineEdit(viewport());
    m_editor->setFrame(false);
    m_editor->hide();
    m_editor->installEventFilter(this);
    connect(m_editor, &QLineEdit::textEdited, m_ctrl, &GridController::setEditBuffer);

    auto repaint = [this]() { viewport()->update(); };
    connect(m_ctrl, &GridController::cellsChanged,     this, repaint);
    connect(m_ctrl, &GridController::selectionChanged, this, repaint);
    connect(m_ctrl, &GridController::tablesChanged,    this, repaint);
    connect(m_ctrl, &GridController::viewportChanged,  this, repaint);
    connect(m_ctrl, &GridController::dimensionsChanged, this, [this]() {
        updateScrollBars();
        publishScroll();
        viewport()->update();
    });
    connect(m_ctrl, &GridController::clipboardChanged, this, [this](bool hasData) {
        if (hasData)
            QGuiApplication::clipboard()->setText(m_ctrl->clipboardText());
        viewport()->update();
    });
    connect(m_ctrl, &GridController::editStarted, this, &GridView::showEditor);
    connect(m_ctrl, &GridController::editEnded,   this, &GridView::hideEditor);

    m_ctrl->setHitTester(
        [this](const QPoint& globalPos) -> std::optional<GridPos> {
            const QPoint vp = viewport()->mapFromGlobal(globalPos);
            const auto& cfg = m_ctrl->config();
            const int x = qMax(vp.x(), cfg.rowHeaderWidth);
            const int y = qMax(vp.y(), cfg.colHeaderHeight);
            const int col = m_ctrl->colIndex().indexAt(contentX(x));
            const int row = m_ctrl->rowIndex().indexAt(contentY(y));
            if (row < 0 || col < 0) return std::nullopt;
            return GridPos{row, col};
        },
        [](Axis axis, const QPoint& globalPos) -> qint64 {
            return axis == Axis::Column ? globalPos.x() : globalPos.y();
        });

    updateScrollBars();
    publishScroll();
    m_ctrl->viewport()->flush();
}

// ── Geometry ──

int GridView::contentX(int viewportX) const {
    return viewportX - m_ctrl->config().rowHeaderWidth + horizontalScrollBar()->value();
}

int GridView::contentY(int viewportY) const {
    return viewportY - m_ctrl->config().colHeaderHeight + verticalScrollBar()->value();
}

QRect GridView::cellRect(int row, int col) const {
    const auto& cfg = m_ctrl->config();
    const qint64 x = cfg.rowHeaderWidth + m_ctrl->colIndex().positionOf(col) - horizontalScrollBar()->value();
    const qint64 y = cfg.colHeaderHeight + m_ctrl->rowIndex().positionOf(row) - verticalScrollBar()->value();
    return QRect(int(x), int(y), m_ctrl->colIndex().sizeOf(col), m_ctrl->rowIndex().sizeOf(row));
}

void GridView::updateScrollBars() {
    const auto& cfg = m_ctrl->config();
    const int visW = qMax(0, viewport()->width() - cfg.rowHeaderWidth);
    const int visH = qMax(0, viewport()->height() - cfg.colHeaderHeight);
    const qint64 maxX = qMax<qint64>(0, m_ctrl->colIndex().totalSize() - visW);
    const qint64 maxY = qMax<qint64>(0, m_ctrl->rowIndex().totalSize() - visH);
    horizontalScrollBar()->setRange(0, int(qMin<qint64>(maxX, INT_MAX)));
    verticalScrollBar()->setRange(0, int(qMin<qint64>(maxY, INT_MAX)));
    horizontalScrollBar()->setPageStep(visW);
    verticalScrollBar()->setPageStep(visH);
}

void GridView::publishScroll() {
    const auto& cfg = m_ctrl->config();
    ScrollState s;
    s.x      = horizontalScrollBar()->value();
    s.y      = verticalScrollBar()->value();
    s.width  = qMax(0, viewport()->width() - cfg.rowHeaderWidth);
    s.height = qMax(0, viewport()->height() - cfg.colHeaderHeight);
    m_ctrl->scrolled(s);
}

void GridView::resizeEvent(QResizeEvent* event) {
    QAbstractScrollArea::resizeEvent(event);
    updateScrollBars();
    publishScroll();
}

void GridView::scrollContentsBy(int, int) {
    if (m_ctrl->editSession().isActive()) {
        const GridPos p = m_ctrl->editSession().position();
        m_editor->setGeometry(cellRect(p.row, p.col).adjusted(1, 1, -1, -1));
    }
    publishScroll();
    viewport()->update();
}

GridView::Hit GridView::hitTest(const QPoint& pos) const {
    const auto& cfg = m_ctrl->config();
    Hit h;
    const bool inColHeader = pos.y() < cfg.colHeaderHeight;
    const bool inRowHeader = pos.x() < cfg.rowHeaderWidth;

    if (inColHeader && inRowHeader) {
        h.kind = HitKind::Corner;
        return h;
    }

    const int cx = contentX(pos.x());
    const int cy = contentY(pos.y());
    const auto& cols = m_ctrl->colIndex();
    const auto& rows = m_ctrl->rowIndex();

    if (inColHeader) {
        h.kind = HitKind::ColumnHeader;
        h.col = cols.indexAt(cx);
        if (h.col < 0) return Hit{};
        if (cols.positionOf(h.col + 1) - cx <= kHandleSlop) {
            h.colHandle = true;
        } else if (h.col > 0 && cx - cols.positionOf(h.col) <= kHandleSlop) {
            h.col -= 1;
            h.colHandle = true;
        }
        return h;
    }
    if (inRowHeader) {
        h.kind = HitKind::RowHeader;
        h.row = rows.indexAt(cy);
        if (h.row < 0) return Hit{};
        if (rows.positionOf(h.row + 1) - cy <= kHandleSlop) {
            h.rowHandle = true;
        } else if (h.row > 0 && cy - rows.positionOf(h.row) <= kHandleSlop) {
            h.row -= 1;
            h.rowHandle = true;
        }
        return h;
    }

    if (cx >= cols.totalSize() || cy >= rows.totalSize())
        return h;
    h.kind = HitKind::Cell;
    h.row = rows.indexAt(cy);
    h.col = cols.indexAt(cx);
    return h;
}

// ── Painting ──

void GridView::paintEvent(QPaintEvent*) {
    QPainter p(viewport());
    p.fillRect(viewport()->rect(), m_pal.background);

    const Viewport vp = m_ctrl->viewport()->current();
    const auto& cfg = m_ctrl->config();

    p.save();
    p.setClipRect(QRect(cfg.rowHeaderWidth, cfg.colHeaderHeight,
                        viewport()->width() - cfg.rowHeaderWidth,
                        viewport()->height() - cfg.colHeaderHeight));
    paintCells(p, vp);
    paintSelection(p, vp);
    paintClipboard(p);
    p.restore();

    paintHeaders(p, vp);
}

static Qt::PenStyle penStyleOf(BorderLineStyle s) {
    switch (s) {
    case BorderLineStyle::Dashed: return Qt::DashLine;
    case BorderLineStyle::Dotted: return Qt::DotLine;
    case BorderLineStyle::Solid:  break;
    }
    return Qt::SolidLine;
}

static void drawEdge(QPainter& p, const std::optional<BorderLine>& edge, QPoint a, QPoint b) {
    if (!edge || edge->width <= 0) return;
    QPen pen(edge->color.isValid() ? edge->color : QColor(Qt::black));
    pen.setWidth(edge->width);
    pen.setStyle(penStyleOf(edge->style));
    p.setPen(pen);
    p.drawLine(a, b);
}

void GridView::paintCells(QPainter& p, const Viewport& vp) {
    const QFont baseFont = font();
    const auto& store = m_ctrl->store();

    for (int row = vp.startRow; row < vp.endRow; row++) {
        const bool visible = m_ctrl->isRowVisible(row);
        for (int col = vp.startCol; col < vp.endCol; col++) {
            const QRect r = cellRect(row, col);
            p.setPen(m_pal.gridLine);
            p.drawRect(r.adjusted(0, 0, -1, -1));
            if (!visible) {
                p.fillRect(r.adjusted(1, 1, -1, -1), m_pal.filteredRow);
                continue;
            }

            const Cell* c = store.find(row, col);
            if (!c) {
                if (const TableRegion* t = m_ctrl->tables().regionForHeader(row, col))
                    paintSortGlyph(p, r, *t, col);
                continue;
            }
            const CellFormatting fmtg = c->formatting.value_or(CellFormatting{});

            if (fmtg.fillColor)
                p.fillRect(r.adjusted(1, 1, -1, -1), *fmtg.fillColor);

            QFont f = baseFont;
            if (fmtg.fontFamily) f.setFamily(*fmtg.fontFamily);
            if (fmtg.fontSize)   f.setPointSize(*fmtg.fontSize);
            f.setBold(fmtg.isBold());
            f.setItalic(fmtg.italic.value_or(false));
            f.setUnderline(fmtg.underline.value_or(false));
            p.setFont(f);
            p.setPen(fmtg.textColor.value_or(m_pal.text));

            Qt::Alignment align = isNumericType(c->value.type) ? Qt::AlignRight : Qt::AlignLeft;
            if (fmtg.textAlign) {
                switch (*fmtg.textAlign) {
                case TextAlign::Left:   align = Qt::AlignLeft; break;
                case TextAlign::Center: align = Qt::AlignHCenter; break;
                case TextAlign::Right:  align = Qt::AlignRight; break;
                }
            }
            const QRect textRect = r.adjusted(4, 0, -4, 0);
            const QString text = p.fontMetrics().elidedText(
                m_ctrl->valueServices().displayOf(*c), Qt::ElideRight, textRect.width());
            p.drawText(textRect, align | Qt::AlignVCenter, text);

            if (fmtg.border) {
                const BorderStyle& b = *fmtg.border;
                drawEdge(p, b.top,    r.topLeft(),    r.topRight());
                drawEdge(p, b.right,  r.topRight(),   r.bottomRight());
                drawEdge(p, b.bottom, r.bottomLeft(), r.bottomRight());
                drawEdge(p, b.left,   r.topLeft(),    r.bottomLeft());
            }

            if (const TableRegion* t = m_ctrl->tables().regionForHeader(row, col))
                paintSortGlyph(p, r, *t, col);
        }
    }
}

// Filled triangle for the sorted column, hollow diamond for the rest.
void GridView::paintSortGlyph(QPainter& p, const QRect& r, const TableRegion& t, int col) {
    const QRect g(r.right() - kGlyphWidth, r.top(), kGlyphWidth, r.height());
    const int cx = g.center().x(), cy = g.center().y();
    const bool sorted = t.sortColumn == col && t.sortDirection != SortDirection::None;

    QPolygon tri;
    if (!sorted)
        tri << QPoint(cx - 3, cy) << QPoint(cx, cy - 4) << QPoint(cx + 3, cy) << QPoint(cx, cy + 4);
    else if (t.sortDirection == SortDirection::Ascending)
        tri << QPoint(cx - 4, cy + 2) << QPoint(cx + 4, cy + 2) << QPoint(cx, cy - 3);
    else
        tri << QPoint(cx - 4, cy - 2) << QPoint(cx + 4, cy - 2) << QPoint(cx, cy + 3);

    p.setPen(sorted ? QPen(Qt::NoPen) : QPen(m_pal.headerText));
    p.setBrush(sorted ? QBrush(m_pal.sortGlyph) : QBrush(Qt::NoBrush));
    p.drawPolygon(tri);
    if (t.filters.contains(col)) {
        p.setPen(Qt::NoPen);
        p.setBrush(m_pal.sortGlyph);
        p.drawEllipse(QPoint(cx, g.bottom() - 5), 2, 2);
    }
    p.setBrush(Qt::NoBrush);
}

void GridView::paintSelection(QPainter& p, const Viewport&) {
    const auto& sel = m_ctrl->selection();
    if (sel.isEmpty()) return;

    for (const auto& rr : sel.ranges()) {
        int top = rr.top(), bottom = rr.bottom(), left = rr.left(), right = rr.right();
        if (sel.type() == SelectionType::Row)    { left = 0; right = m_ctrl->colCount() - 1; }
        if (sel.type() == SelectionType::Column) { top = 0; bottom = m_ctrl->rowCount() - 1; }
        const QRect a = cellRect(top, left);
        const QRect b = cellRect(bottom, right);
        const QRect box = a.united(b);
        p.fillRect(box, m_pal.selectionFill);
        p.setPen(QPen(m_pal.selectionEdge, 2));
        p.drawRect(box.adjusted(0, 0, -1, -1));
    }
}

void GridView::paintClipboard(QPainter& p) {
    const auto& clip = m_ctrl->clipboard();
    if (!clip.hasData()) return;
    const GridPos o = clip.origin();
    const QRect box = cellRect(o.row, o.col)
        .united(cellRect(o.row + clip.rowSpan() - 1, o.col + clip.colSpan() - 1));
    QPen pen(m_pal.clipboardEdge, 2, Qt::DashLine);
    p.setPen(pen);
    p.setBrush(Qt::NoBrush);
    p.drawRect(box.adjusted(1, 1, -2, -2));
}

void GridView::paintHeaders(QPainter& p, const Viewport& vp) {
    const auto& cfg = m_ctrl->config();
    const auto& sel = m_ctrl->selection();
    p.setFont(font());

    // Column header strip
    p.save();
    p.setClipRect(QRect(cfg.rowHeaderWidth, 0, viewport()->width(), cfg.colHeaderHeight));
    for (int col = vp.startCol; col < vp.endCol; col++) {
        QRect r = cellRect(0, col);
        r.setTop(0);
        r.setHeight(cfg.colHeaderHeight);
        p.fillRect(r, sel.isColumnSelected(col) ? m_pal.headerActive : m_pal.headerBg);
        p.setPen(m_pal.gridLine);
        p.drawRect(r.adjusted(0, 0, -1, -1));
        p.setPen(m_pal.headerText);
        p.drawText(r, Qt::AlignCenter, fmt::columnLabel(col));
    }
    p.restore();

    // Row header strip
    p.save();
    p.setClipRect(QRect(0, cfg.colHeaderHeight, cfg.rowHeaderWidth, viewport()->height()));
    for (int row = vp.startRow; row < vp.endRow; row++) {
        QRect r = cellRect(row, 0);
        r.setLeft(0);
        r.setWidth(cfg.rowHeaderWidth);
        p.fillRect(r, sel.isRowSelected(row) ? m_pal.headerActive : m_pal.headerBg);
        p.setPen(m_pal.gridLine);
        p.drawRect(r.adjusted(0, 0, -1, -1));
        p.setPen(m_pal.headerText);
        p.drawText(r, Qt::AlignCenter, QString::number(row + 1));
    }
    p.restore();

    p.fillRect(QRect(0, 0, cfg.rowHeaderWidth, cfg.colHeaderHeight), m_pal.headerBg);
}

// ── Pointer input ──

void GridView::mousePressEvent(QMouseEvent* event) {
    const Hit h = hitTest(localPointOf(event));
    const Qt::KeyboardModifiers mods = event->modifiers();
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    const QPoint global = event->globalPosition().toPoint();
#else
    const QPoint global = event->globalPos();
#endif

    if (event->button() == Qt::RightButton) {
        if (h.kind == HitKind::Cell) {
            const TableRegion* t = m_ctrl->tables().regionForHeader(h.row, h.col);
            if (!t) t = m_ctrl->tables().regionAt(h.row, h.col);
            if (t) showTableMenu(*t, h.col, global);
        } else if (h.kind == HitKind::ColumnHeader) {
            showDimensionMenu(Axis::Column, h.col, global);
        } else if (h.kind == HitKind::RowHeader) {
            showDimensionMenu(Axis::Row, h.row, global);
        }
        return;
    }
    if (event->button() != Qt::LeftButton) return;

    m_pressHit = Hit{};
    switch (h.kind) {
    case HitKind::ColumnHeader:
        if (h.colHandle) m_ctrl->resizeHandlePressed(Axis::Column, h.col, global.x());
        else             m_ctrl->pointerPressed(SelectionType::Column, 0, h.col, mods);
        break;
    case HitKind::RowHeader:
        if (h.rowHandle) m_ctrl->resizeHandlePressed(Axis::Row, h.row, global.y());
        else             m_ctrl->pointerPressed(SelectionType::Row, h.row, 0, mods);
        break;
    case HitKind::Cell:
        m_pressHit = h;
        m_ctrl->pointerPressed(SelectionType::Cell, h.row, h.col, mods);
        break;
    case HitKind::Corner:
    case HitKind::None:
        break;
    }
}

void GridView::mouseMoveEvent(QMouseEvent* event) {
    if (event->buttons() != Qt::NoButton) return;  // captured by the drag session
    const Hit h = hitTest(localPointOf(event));
    if (h.colHandle)      viewport()->setCursor(Qt::SplitHCursor);
    else if (h.rowHandle) viewport()->setCursor(Qt::SplitVCursor);
    else                  viewport()->unsetCursor();
}

// Press and release on the same cell is a click; table headers sort on click.
void GridView::mouseReleaseEvent(QMouseEvent* event) {
    m_ctrl->pointerReleased();
    const Hit pressed = m_pressHit;
    m_pressHit = Hit{};
    if (event->button() != Qt::LeftButton || pressed.kind != HitKind::Cell) return;

    const Hit h = hitTest(localPointOf(event));
    if (h.kind == HitKind::Cell && h.row == pressed.row && h.col == pressed.col)
        m_ctrl->cellClicked(h.row, h.col);
}

void GridView::mouseDoubleClickEvent(QMouseEvent* event) {
    const Hit h = hitTest(localPointOf(event));
    if (h.kind == HitKind::ColumnHeader && h.colHandle) {
        m_ctrl->resizeHandleDoubleClicked(Axis::Column, h.col);
        return;
    }
    if (h.kind == HitKind::Cell)
        m_ctrl->cellDoubleClicked(h.row, h.col);
}

// ── Keyboard / editor ──

void GridView::keyPressEvent(QKeyEvent* event) {
    if (m_ctrl->keyPressed(event->key(), event->modifiers(), event->text()))
        return;
    QAbstractScrollArea::keyPressEvent(event);
}

bool GridView::eventFilter(QObject* obj, QEvent* event) {
    if (obj == m_editor) {
        if (event->type() == QEvent::KeyPress) {
            auto* ke = static_cast<QKeyEvent*>(event);
            switch (ke->key()) {
            case Qt::Key_Return: case Qt::Key_Enter: case Qt::Key_Escape:
            case Qt::Key_Up: case Qt::Key_Down: case Qt::Key_Left: case Qt::Key_Right:
                m_ctrl->setEditBuffer(m_editor->text());
                return m_ctrl->keyPressed(ke->key(), ke->modifiers(), ke->text());
            default:
                break;
            }
        } else if (event->type() == QEvent::FocusOut) {
            if (m_ctrl->editSession().isActive()) {
                m_ctrl->setEditBuffer(m_editor->text());
                m_ctrl->editorFocusLost();
            }
        }
    }
    return QAbstractScrollArea::eventFilter(obj, event);
}

void GridView::showEditor(int row, int col, const QString& text) {
    m_editor->setGeometry(cellRect(row, col).adjusted(1, 1, -1, -1));
    m_editor->setText(text);
    m_editor->setCursorPosition(text.size());
    m_editor->show();
    m_editor->setFocus();
}

void GridView::hideEditor() {
    if (!m_editor->isVisible()) return;
    m_editor->hide();
    setFocus();
}

// ── Table header menu ──

// Sort and filter need a header row; header-less tables only offer removal.
void GridView::showTableMenu(const TableRegion& region, int col, const QPoint& globalPos) {
    const QString id = region.id;
    QMenu menu(this);
    if (region.hasHeader) {
        menu.addAction("Sort &Ascending", this, [this, id, col]() {
            m_ctrl->setTableSort(id, col, SortDirection::Ascending);
        });
        menu.addAction("Sort &Descending", this, [this, id, col]() {
            m_ctrl->setTableSort(id, col, SortDirection::Descending);
        });
        menu.addAction("&Clear Sort", this, [this, id, col]() {
            m_ctrl->setTableSort(id, col, SortDirection::None);
        });
        menu.addSeparator();
        menu.addAction("&Filter...", this, [this, id, col]() {
            if (const TableRegion* t = m_ctrl->tables().region(id))
                showFilterDialog(*t, col);
        });
        auto* clearFilter = menu.addAction("Clear F&ilter", this, [this, id, col]() {
            m_ctrl->applyFilter(id, col, {});
        });
        clearFilter->setEnabled(region.filters.contains(col));
        menu.addSeparator();
    }
    menu.addAction("&Remove Table", this, [this, id]() { m_ctrl->removeTable(id); });
    menu.exec(globalPos);
}

void GridView::showDimensionMenu(Axis axis, int index, const QPoint& globalPos) {
    QMenu menu(this);
    if (axis == Axis::Column) {
        menu.addAction("&Auto-fit Width", this, [this, index]() {
            m_ctrl->resizeHandleDoubleClicked(Axis::Column, index);
        });
    }
    auto* reset = menu.addAction(axis == Axis::Column ? "&Reset Width" : "&Reset Height", this,
                                 [this, axis, index]() { m_ctrl->resetSize(axis, index); });
    const DimensionIndex& d = axis == Axis::Column ? m_ctrl->colIndex() : m_ctrl->rowIndex();
    reset->setEnabled(d.hasOverride(index));
    menu.exec(globalPos);
}

void GridView::showFilterDialog(const TableRegion& region, int col) {
    const QString id = region.id;
    const QStringList values = m_ctrl->tables().distinctValues(m_ctrl->store(), id, col);
    const QSet<QString> active = region.filters.value(col);

    QDialog dlg(this);
    dlg.setWindowTitle(QStringLiteral("Filter %1").arg(m_ctrl->displayText(region.headerRow, col)));
    auto* layout = new QVBoxLayout(&dlg);
    auto* list = new QListWidget(&dlg);
    for (const QString& v : values) {
        auto* item = new QListWidgetItem(v.isEmpty() ? QStringLiteral("(Blanks)") : v, list);
        item->setData(Qt::UserRole, v);
        item->setFlags(item->flags() | Qt::ItemIsUserCheckable);
        item->setCheckState(active.isEmpty() || active.contains(v) ? Qt::Checked : Qt::Unchecked);
    }
    layout->addWidget(list);
    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, &dlg);
    layout->addWidget(buttons);
    connect(buttons, &QDialogButtonBox::accepted, &dlg, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, &dlg, &QDialog::reject);

    // Nothing checked would hide every row; require at least one value
    connect(list, &QListWidget::itemChanged, &dlg, [list, buttons]() {
        bool any = false;
        for (int i = 0; i < list->count() && !any; i++)
            any = list->item(i)->checkState() == Qt::Checked;
        buttons->button(QDialogButtonBox::Ok)->setEnabled(any);
    });

    if (dlg.exec() != QDialog::Accepted) return;

    QSet<QString> chosen;
    for (int i = 0; i < list->count(); i++) {
        if (list->item(i)->checkState() == Qt::Checked)
            chosen.insert(list->item(i)->data(Qt::UserRole).toString());
    }
    // Every value checked is the same as no filter
    if (chosen.size() == values.size())
        chosen.clear();
    m_ctrl->applyFilter(id, col, chosen);
}

} // namespace tbx
