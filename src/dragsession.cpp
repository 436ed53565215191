#include "dragsession.h"
#include <QCoreApplication>
#include <QMouseEvent>
#include <QDebug>

namespace tbx {

static QPoint globalPointOf(const QMouseEvent* me) {
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    return me->globalPosition().toPoint();
#else
    return me->globalPos();
#endif
}

DragSession::DragSession(PointFn onMove, PointFn onRelease, QObject* parent)
    : QObject(parent)
    , m_onMove(std::move(onMove))
    , m_onRelease(std::move(onRelease))
{
    if (auto* app = QCoreApplication::instance()) {
        app->installEventFilter(this);
        m_active = true;
    } else {
        qWarning() << "DragSession: no application instance, pointer capture disabled";
    }
}

DragSession::~DragSession() {
    if (m_active) {
        if (auto* app = QCoreApplication::instance())
            app->removeEventFilter(this);
    }
}

void DragSession::stop() {
    if (!m_active) return;
    m_active = false;
    if (auto* app = QCoreApplication::instance())
        app->removeEventFilter(this);
    emit finished();
}

bool DragSession::eventFilter(QObject* obj, QEvent* event) {
    if (!m_active) return QObject::eventFilter(obj, event);

    switch (event->type()) {
    case QEvent::MouseMove: {
        // Window and widget both see each move; handlers are idempotent
        auto* me = static_cast<QMouseEvent*>(event);
        if (m_onMove) m_onMove(globalPointOf(me));
        break;
    }
    case QEvent::MouseButtonRelease: {
        auto* me = static_cast<QMouseEvent*>(event);
        const QPoint pos = globalPointOf(me);
        if (m_onRelease) m_onRelease(pos);
        stop();
        break;
    }
    default:
        break;
    }
    return QObject::eventFilter(obj, event);
}

} // namespace tbx
