#pragma once
#include <QObject>
#include <QPoint>
#include <functional>

namespace tbx {

// Captures pointer motion and release application-wide for the length of
// one drag, so a drag that leaves the grid still ends on pointer-up.
//
// The event filter is installed by the constructor and removed by stop()
// or the destructor; one session == one drag.
class DragSession : public QObject {
    Q_OBJECT
public:
    using PointFn = std::function<void(const QPoint& globalPos)>;

    DragSession(PointFn onMove, PointFn onRelease, QObject* parent = nullptr);
    ~DragSession() override;

    bool isActive() const { return m_active; }
    void stop();

signals:
    void finished();

protected:
    bool eventFilter(QObject* obj, QEvent* event) override;

private:
    PointFn m_onMove;
    PointFn m_onRelease;
    bool    m_active = false;
};

} // namespace tbx
