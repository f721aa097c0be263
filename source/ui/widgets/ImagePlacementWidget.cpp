#include "ImagePlacementWidget.h"
#include "../../core/GestureCoordinator.h"

#include <QMouseEvent>
#include <QPainter>

static const QColor kBorderColor(0, 120, 215);

ImagePlacementWidget::ImagePlacementWidget(GestureCoordinator* coordinator, QWidget* parent)
    : QWidget(parent)
    , m_coordinator(coordinator)
{
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    hide();
}

void ImagePlacementWidget::syncWithPlacement()
{
    if (!m_coordinator->isPlacementActive()) {
        hide();
        return;
    }

    if (parentWidget()) {
        setGeometry(parentWidget()->rect());
    }
    if (!isVisible()) {
        show();
        raise();
        setFocus(Qt::OtherFocusReason);
    }
    update();
}

void ImagePlacementWidget::paintEvent(QPaintEvent* /*event*/)
{
    const PlacementState& state = m_coordinator->placement();
    if (!state.isActive()) {
        return;
    }

    QPainter painter(this);
    painter.setRenderHint(QPainter::SmoothPixmapTransform);

    const QImage& image = m_coordinator->payload().image;
    if (!image.isNull()) {
        painter.drawImage(state.rect, image);
    }

    QPen border(kBorderColor, 2, Qt::DashLine);
    painter.setPen(border);
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(state.rect);

    painter.setPen(QPen(Qt::white, 1));
    painter.setBrush(kBorderColor);
    for (PlacementState::Corner corner : {PlacementState::Corner::TopLeft,
                                          PlacementState::Corner::TopRight,
                                          PlacementState::Corner::BottomLeft,
                                          PlacementState::Corner::BottomRight}) {
        painter.drawRect(PlacementOverlay::handleRect(state.rect, corner));
    }
}

void ImagePlacementWidget::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        event->ignore();
        return;
    }

    const QPointF pos = event->position();
    if (m_coordinator->placementHitTest(pos) == PlacementOverlay::HitZone::Outside) {
        emit aboutToCommit(m_coordinator->placement().rect);
    }
    m_coordinator->placementPointerPressed(pos);
    event->accept();
}

void ImagePlacementWidget::mouseMoveEvent(QMouseEvent* event)
{
    if (event->buttons() & Qt::LeftButton) {
        m_coordinator->placementPointerMoved(event->position());
    } else {
        updateCursor(event->position());
    }
    event->accept();
}

void ImagePlacementWidget::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton) {
        m_coordinator->placementPointerReleased(event->position());
    }
    event->accept();
}

void ImagePlacementWidget::updateCursor(const QPointF& pos)
{
    switch (m_coordinator->placementHitTest(pos)) {
        case PlacementOverlay::HitZone::TopLeft:
        case PlacementOverlay::HitZone::BottomRight:
            setCursor(Qt::SizeFDiagCursor);
            break;
        case PlacementOverlay::HitZone::TopRight:
        case PlacementOverlay::HitZone::BottomLeft:
            setCursor(Qt::SizeBDiagCursor);
            break;
        case PlacementOverlay::HitZone::Body:
            setCursor(Qt::SizeAllCursor);
            break;
        case PlacementOverlay::HitZone::Outside:
            unsetCursor();
            break;
    }
}
