#pragma once
#include "cellstore.h"
#include "selection.h"

namespace tbx {

// What a key did to the edit session.
enum class EditKeyResult : uint8_t {
    Ignored,    // not an edit key, session unchanged
    Committed,  // Enter: committed, selection moved down
    Cancelled,  // Escape: buffer discarded
    Moved,      // arrow: committed, new session opened on the neighbour
};

// Transient single-cell edit buffer: none -> editing -> none.
class EditSession {
public:
    EditSession(CellStore& store, SelectionModel& selection, const ValueServices& svc);

    bool    isActive() const { return m_active; }
    GridPos position() const { return m_pos; }
    const QString& buffer() const { return m_buffer; }
    void    setBuffer(const QString& text);

    // Double activation: buffer starts as the cell's raw text.
    bool begin(int row, int col);
    // Typing entry on a single selected cell. Printable text replaces the
    // content; Backspace/Delete open with an empty buffer.
    bool beginFromKey(int key, const QString& text);

    EditKeyResult handleKey(int key);

    // Parse and store the buffer. Empty deletes the cell.
    bool commit();
    void cancel();

private:
    void open(int row, int col, const QString& initial);

    CellStore&           m_store;
    SelectionModel&      m_selection;
    const ValueServices& m_svc;

    bool    m_active = false;
    GridPos m_pos;
    QString m_buffer;
};

} // namespace tbx
