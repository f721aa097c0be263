#include "PageCanvas.h"

#include <QPainter>
#include <QPaintEvent>

static const QColor kHighlightFill(0, 120, 215, 50);
static const QColor kHighlightBorder(0, 120, 215);

PageCanvas::PageCanvas(QWidget* parent)
    : QWidget(parent)
{
    setAttribute(Qt::WA_OpaquePaintEvent);
    setCursor(Qt::CrossCursor);
}

void PageCanvas::setPagePixmap(const QPixmap& pixmap)
{
    m_pixmap = pixmap;
    update();
}

void PageCanvas::clearPage()
{
    m_pixmap = QPixmap();
    m_highlight = QRectF();
    update();
}

void PageCanvas::setHighlight(const QRectF& rect)
{
    if (rect == m_highlight) {
        return;
    }
    m_highlight = rect;
    update();
}

void PageCanvas::paintEvent(QPaintEvent* event)
{
    QPainter painter(this);
    painter.fillRect(event->rect(), Qt::white);

    if (!m_pixmap.isNull()) {
        painter.setRenderHint(QPainter::SmoothPixmapTransform);
        painter.drawPixmap(rect(), m_pixmap);
    }

    if (!m_highlight.isNull()) {
        painter.setPen(QPen(kHighlightBorder, 1));
        painter.setBrush(kHighlightFill);
        painter.drawRect(m_highlight);
    }
}

void PageCanvas::moveEvent(QMoveEvent* event)
{
    QWidget::moveEvent(event);
    emit moved();
}
