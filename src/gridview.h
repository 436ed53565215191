#pragma once
#include "controller.h"
#include <QAbstractScrollArea>
#include <QLineEdit>
#include <QColor>

namespace tbx {

struct GridPalette {
    QColor background    = QColor(0xff, 0xff, 0xff);
    QColor gridLine      = QColor(0xe0, 0xe0, 0xe0);
    QColor headerBg      = QColor(0xf5, 0xf5, 0xf5);
    QColor headerText    = QColor(0x42, 0x42, 0x42);
    QColor headerActive  = QColor(0xd0, 0xe3, 0xf7);
    QColor text          = QColor(0x21, 0x21, 0x21);
    QColor selectionFill = QColor(25, 118, 210, 40);
    QColor selectionEdge = QColor(0x19, 0x76, 0xd2);
    QColor clipboardEdge = QColor(0x38, 0x8e, 0x3c);
    QColor filteredRow   = QColor(0xfa, 0xfa, 0xfa);
    QColor sortGlyph     = QColor(0x19, 0x76, 0xd2);
};

// Rendering surface for a GridController: paints only the resolved
// viewport slice, forwards pointer/keyboard input, and hosts the inline
// editor for the active edit session.
class GridView : public QAbstractScrollArea {
    Q_OBJECT
public:
    explicit GridView(GridController* ctrl, QWidget* parent = nullptr);

    GridController* controller() const { return m_ctrl; }
    void setPalette(const GridPalette& p) { m_pal = p; viewport()->update(); }

    enum class HitKind { None, Corner, ColumnHeader, RowHeader, Cell };
    struct Hit {
        HitKind kind = HitKind::None;
        int     row  = -1;
        int     col  = -1;
        bool    colHandle = false;  // on the right edge of a column header
        bool    rowHandle = false;  // on the bottom edge of a row header
    };
    Hit hitTest(const QPoint& viewportPos) const;

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void scrollContentsBy(int dx, int dy) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    bool eventFilter(QObject* obj, QEvent* event) override;

private:
    void updateScrollBars();
    void publishScroll();
    QRect cellRect(int row, int col) const;
    int   contentX(int viewportX) const;
    int   contentY(int viewportY) const;

    void paintCells(QPainter& p, const Viewport& vp);
    void paintSelection(QPainter& p, const Viewport& vp);
    void paintClipboard(QPainter& p);
    void paintHeaders(QPainter& p, const Viewport& vp);
    void paintSortGlyph(QPainter& p, const QRect& r, const TableRegion& t, int col);

    void showEditor(int row, int col, const QString& text);
    void hideEditor();
    void showTableMenu(const TableRegion& region, int col, const QPoint& globalPos);
    void showDimensionMenu(Axis axis, int index, const QPoint& globalPos);
    void showFilterDialog(const TableRegion& region, int col);

    GridController* m_ctrl;
    GridPalette     m_pal;
    QLineEdit*      m_editor = nullptr;
    Hit             m_pressHit;
};

} // namespace tbx
