#include "ViewportTransform.h"

#include <QtGlobal>

QPointF ViewportTransform::toDocumentSpace(const QPointF& screenPoint, const ViewState& view)
{
    // Unset zoom would divide by zero; fall back to identity scale
    const qreal zoom = view.zoom > 0 ? view.zoom : ViewState::DEFAULT_ZOOM;

    QPointF doc = (screenPoint + view.scrollOffset) / zoom;
    doc.setX(qBound<qreal>(0.0, doc.x(), qMax<qreal>(0.0, view.pageSize.width())));
    doc.setY(qBound<qreal>(0.0, doc.y(), qMax<qreal>(0.0, view.pageSize.height())));
    return doc;
}

QPointF ViewportTransform::toScreenSpace(const QPointF& docPoint, const ViewState& view)
{
    const qreal zoom = view.zoom > 0 ? view.zoom : ViewState::DEFAULT_ZOOM;
    return docPoint * zoom - view.scrollOffset;
}

QRectF ViewportTransform::toScreenSpace(const QRectF& docRect, const ViewState& view)
{
    return QRectF(toScreenSpace(docRect.topLeft(), view),
                  toScreenSpace(docRect.bottomRight(), view));
}

bool ViewportTransform::isOverPage(const QPointF& screenPoint, const ViewState& view)
{
    const QRectF pageOnScreen(-view.scrollOffset, view.scaledPageSize());
    return pageOnScreen.contains(screenPoint);
}

QRectF ViewportTransform::normalizedRect(const QPointF& a, const QPointF& b)
{
    return QRectF(QPointF(qMin(a.x(), b.x()), qMin(a.y(), b.y())),
                  QPointF(qMax(a.x(), b.x()), qMax(a.y(), b.y())));
}

QRectF ViewportTransform::clampToPage(const QRectF& docRect, const QSizeF& pageSize)
{
    const QRectF page(QPointF(0, 0), pageSize);
    QRectF clamped = docRect.normalized().intersected(page);
    if (clamped.width() <= 0 || clamped.height() <= 0) {
        return QRectF();
    }
    return clamped;
}
