#include "editsession.h"
#include <QDebug>

namespace tbx {

EditSession::EditSession(CellStore& store, SelectionModel& selection, const ValueServices& svc)
    : m_store(store)
    , m_selection(selection)
    , m_svc(svc)
{}

void EditSession::setBuffer(const QString& text) {
    if (m_active) m_buffer = text;
}

void EditSession::open(int row, int col, const QString& initial) {
    // editing and dragging are mutually exclusive
    m_selection.cancelDrag();
    m_active = true;
    m_pos    = GridPos{row, col};
    m_buffer = initial;
}

bool EditSession::begin(int row, int col) {
    if (row < 0 || col < 0 || row >= m_store.rowCount() || col >= m_store.colCount())
        return false;
    if (m_active) commit();
    const Cell* c = m_store.find(row, col);
    open(row, col, c ? c->value.rawText : QString());
    return true;
}

bool EditSession::beginFromKey(int key, const QString& text) {
    if (m_active || !m_selection.isSingleCell())
        return false;

    const GridPos p = *m_selection.activeCell();
    if (key == Qt::Key_Backspace || key == Qt::Key_Delete) {
        open(p.row, p.col, QString());
        return true;
    }
    if (text.isEmpty() || !text.at(0).isPrint())
        return false;
    open(p.row, p.col, text);
    return true;
}

EditKeyResult EditSession::handleKey(int key) {
    if (!m_active) return EditKeyResult::Ignored;

    int dRow = 0, dCol = 0;
    switch (key) {
    case Qt::Key_Return:
    case Qt::Key_Enter: {
        const GridPos p = m_pos;
        commit();
        m_selection.selectCell(qMin(p.row + 1, m_store.rowCount() - 1), p.col);
        return EditKeyResult::Committed;
    }
    case Qt::Key_Escape:
        cancel();
        return EditKeyResult::Cancelled;
    case Qt::Key_Up:    dRow = -1; break;
    case Qt::Key_Down:  dRow =  1; break;
    case Qt::Key_Left:  dCol = -1; break;
    case Qt::Key_Right: dCol =  1; break;
    default:
        return EditKeyResult::Ignored;
    }

    const int row = qBound(0, m_pos.row + dRow, m_store.rowCount() - 1);
    const int col = qBound(0, m_pos.col + dCol, m_store.colCount() - 1);
    commit();
    m_selection.selectCell(row, col);
    begin(row, col);
    return EditKeyResult::Moved;
}

bool EditSession::commit() {
    if (!m_active) return false;
    m_active = false;
    m_store.applyRawText(m_pos.row, m_pos.col, m_buffer, m_svc, true);
    m_buffer.clear();
    return true;
}

void EditSession::cancel() {
    if (!m_active) return;
    qDebug() << "EditSession: discarded edit at" << m_pos.row << m_pos.col;
    m_active = false;
    m_buffer.clear();
}

} // namespace tbx
