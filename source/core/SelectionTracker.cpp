#include "SelectionTracker.h"
#include "ViewportTransform.h"

#include <QDebug>

bool SelectionTracker::pointerDown(const QPointF& docPoint)
{
    const bool hadHighlight = !m_state.isIdle();

    m_state.phase = SelectionState::Phase::Dragging;
    m_state.anchor = docPoint;
    m_state.current = docPoint;
    m_state.rect = QRectF(docPoint, QSizeF(0, 0));

    return hadHighlight;
}

bool SelectionTracker::pointerMove(const QPointF& docPoint)
{
    if (!m_state.isDragging()) {
        return false;
    }
    if (docPoint == m_state.current) {
        return false;
    }

    m_state.current = docPoint;
    m_state.rect = ViewportTransform::normalizedRect(m_state.anchor, m_state.current);
    return true;
}

bool SelectionTracker::pointerUp(const QPointF& docPoint)
{
    if (!m_state.isDragging()) {
        return false;
    }

    const QRectF rect = ViewportTransform::normalizedRect(m_state.anchor, docPoint);
    if (!isLargeEnough(rect)) {
#ifdef PDFNOTES_DEBUG
        qDebug() << "[SelectionTracker] Rejected tiny selection" << rect;
#endif
        m_state = SelectionState();
        return false;
    }

    m_state.phase = SelectionState::Phase::Committed;
    m_state.current = docPoint;
    m_state.rect = rect;
    return true;
}

bool SelectionTracker::clear()
{
    if (m_state.isIdle()) {
        return false;
    }
    m_state = SelectionState();
    return true;
}

bool SelectionTracker::cancelDrag()
{
    if (!m_state.isDragging()) {
        return false;
    }
    m_state = SelectionState();
    return true;
}
