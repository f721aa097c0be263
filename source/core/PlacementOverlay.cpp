#include "PlacementOverlay.h"

#include <QDebug>
#include <QtMath>

bool PlacementOverlay::activate(const QSize& imageSize, const QRectF& surfaceBounds,
                                qreal insertionScale)
{
    if (m_state.isActive()) {
        return false;
    }
    if (imageSize.isEmpty()) {
        qWarning() << "[PlacementOverlay] Refusing to place an empty image";
        return false;
    }

    m_surface = surfaceBounds;
    m_insertionScale = insertionScale > 0 ? insertionScale : 1.0;
    m_grabOffset = QPointF();

    m_state = PlacementState();
    m_state.phase = PlacementState::Phase::Active;
    m_state.mode = PlacementState::Mode::Moving;
    m_state.rect = initialRect(imageSize, surfaceBounds);
    m_state.anchor = m_state.rect.center();
    return true;
}

QRectF PlacementOverlay::initialRect(const QSize& imageSize, const QRectF& surfaceBounds)
{
    QSizeF size(imageSize);

    if (size.width() > MAX_INITIAL_SIZE || size.height() > MAX_INITIAL_SIZE) {
        size.scale(MAX_INITIAL_SIZE, MAX_INITIAL_SIZE, Qt::KeepAspectRatio);
    }
    if (!surfaceBounds.isEmpty()
        && (size.width() > surfaceBounds.width() || size.height() > surfaceBounds.height())) {
        size.scale(surfaceBounds.size(), Qt::KeepAspectRatio);
    }
    size = size.expandedTo(QSizeF(MIN_SIZE, MIN_SIZE));

    QRectF rect(QPointF(0, 0), size);
    rect.moveCenter(surfaceBounds.center());
    return rect;
}

QPointF PlacementOverlay::cornerPoint(const QRectF& rect, PlacementState::Corner corner)
{
    switch (corner) {
        case PlacementState::Corner::TopLeft:     return rect.topLeft();
        case PlacementState::Corner::TopRight:    return rect.topRight();
        case PlacementState::Corner::BottomLeft:  return rect.bottomLeft();
        case PlacementState::Corner::BottomRight: return rect.bottomRight();
    }
    return rect.bottomRight();
}

QRectF PlacementOverlay::handleRect(const QRectF& rect, PlacementState::Corner corner)
{
    const qreal half = HANDLE_SIZE / 2.0;
    const QPointF c = cornerPoint(rect, corner);
    return QRectF(c.x() - half, c.y() - half, HANDLE_SIZE, HANDLE_SIZE);
}

PlacementOverlay::HitZone PlacementOverlay::hitTest(const QPointF& pos) const
{
    if (!m_state.isActive()) {
        return HitZone::Outside;
    }

    // Corners first, their hit squares overlap the body
    const QRectF& r = m_state.rect;
    if (handleRect(r, PlacementState::Corner::TopLeft).contains(pos))     return HitZone::TopLeft;
    if (handleRect(r, PlacementState::Corner::TopRight).contains(pos))    return HitZone::TopRight;
    if (handleRect(r, PlacementState::Corner::BottomLeft).contains(pos))  return HitZone::BottomLeft;
    if (handleRect(r, PlacementState::Corner::BottomRight).contains(pos)) return HitZone::BottomRight;

    if (r.contains(pos)) {
        return HitZone::Body;
    }
    return HitZone::Outside;
}

PlacementOverlay::PressResult PlacementOverlay::pointerDown(const QPointF& pos)
{
    if (!m_state.isActive()) {
        return PressResult::Ignored;
    }

    const HitZone zone = hitTest(pos);
    switch (zone) {
        case HitZone::Outside:
            return PressResult::CommitRequested;

        case HitZone::Body:
            m_state.mode = PlacementState::Mode::Moving;
            m_grabOffset = pos - m_state.rect.topLeft();
            break;

        case HitZone::TopLeft:
        case HitZone::TopRight:
        case HitZone::BottomLeft:
        case HitZone::BottomRight:
            m_state.mode = PlacementState::Mode::Resizing;
            m_state.corner = zone == HitZone::TopLeft    ? PlacementState::Corner::TopLeft
                           : zone == HitZone::TopRight   ? PlacementState::Corner::TopRight
                           : zone == HitZone::BottomLeft ? PlacementState::Corner::BottomLeft
                                                         : PlacementState::Corner::BottomRight;
            m_grabOffset = pos - cornerPoint(m_state.rect, m_state.corner);
            break;
    }

    m_state.anchor = pos;
    m_state.dragging = true;
    return PressResult::DragStarted;
}

bool PlacementOverlay::pointerMove(const QPointF& pos)
{
    if (!m_state.isActive() || !m_state.dragging) {
        return false;
    }

    QRectF next;
    if (m_state.mode == PlacementState::Mode::Moving) {
        QRectF moved = m_state.rect;
        moved.moveTopLeft(pos - m_grabOffset);
        next = clampMove(moved);
    } else {
        next = resizedRect(pos - m_grabOffset);
    }

    if (next == m_state.rect) {
        return false;
    }
    m_state.rect = next;
    return true;
}

bool PlacementOverlay::pointerUp(const QPointF& pos)
{
    if (!m_state.isActive() || !m_state.dragging) {
        return false;
    }
    pointerMove(pos);
    m_state.dragging = false;
    m_state.anchor = pos;
    return true;
}

QSize PlacementOverlay::commit()
{
    if (!m_state.isActive()) {
        return QSize();
    }
    const QSize size = insertionSize();
    m_state = PlacementState();
    return size;
}

bool PlacementOverlay::cancel()
{
    if (!m_state.isActive()) {
        return false;
    }
    m_state = PlacementState();
    return true;
}

void PlacementOverlay::setSurfaceBounds(const QRectF& bounds)
{
    m_surface = bounds;
    if (m_state.isActive()) {
        m_state.rect = clampMove(m_state.rect);
    }
}

QSize PlacementOverlay::insertionSize() const
{
    if (!m_state.isActive()) {
        return QSize();
    }
    return QSize(qMax(1, qRound(m_state.rect.width() * m_insertionScale)),
                 qMax(1, qRound(m_state.rect.height() * m_insertionScale)));
}

QRectF PlacementOverlay::clampMove(const QRectF& rect) const
{
    if (m_surface.isEmpty()) {
        return rect;
    }

    QRectF clamped = rect;
    // A proxy larger than the surface sticks to its top-left edge
    const qreal maxLeft = qMax(m_surface.left(), m_surface.right() - rect.width());
    const qreal maxTop = qMax(m_surface.top(), m_surface.bottom() - rect.height());
    clamped.moveLeft(qBound(m_surface.left(), rect.left(), maxLeft));
    clamped.moveTop(qBound(m_surface.top(), rect.top(), maxTop));
    return clamped;
}

QRectF PlacementOverlay::resizedRect(const QPointF& cornerPos) const
{
    QPointF p = cornerPos;
    if (!m_surface.isEmpty()) {
        p.setX(qBound(m_surface.left(), p.x(), m_surface.right()));
        p.setY(qBound(m_surface.top(), p.y(), m_surface.bottom()));
    }

    qreal left = m_state.rect.left();
    qreal top = m_state.rect.top();
    qreal right = m_state.rect.right();
    qreal bottom = m_state.rect.bottom();

    // The corner opposite the dragged one stays put
    switch (m_state.corner) {
        case PlacementState::Corner::TopLeft:
            left = qMin(p.x(), right - MIN_SIZE);
            top = qMin(p.y(), bottom - MIN_SIZE);
            break;
        case PlacementState::Corner::TopRight:
            right = qMax(p.x(), left + MIN_SIZE);
            top = qMin(p.y(), bottom - MIN_SIZE);
            break;
        case PlacementState::Corner::BottomLeft:
            left = qMin(p.x(), right - MIN_SIZE);
            bottom = qMax(p.y(), top + MIN_SIZE);
            break;
        case PlacementState::Corner::BottomRight:
            right = qMax(p.x(), left + MIN_SIZE);
            bottom = qMax(p.y(), top + MIN_SIZE);
            break;
    }

    return QRectF(QPointF(left, top), QPointF(right, bottom));
}
