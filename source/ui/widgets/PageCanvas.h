#pragma once

// ============================================================================
// PageCanvas - Paints one rendered PDF page and the selection highlight
// ============================================================================
// Lives inside PdfPageView's scroll area. It holds no selection state; the
// page view pushes the highlight rectangle (canvas coordinates) into it.
// ============================================================================

#include <QPixmap>
#include <QRectF>
#include <QWidget>

class PageCanvas : public QWidget {
    Q_OBJECT

public:
    explicit PageCanvas(QWidget* parent = nullptr);

    /**
     * @brief Set the rendered page. An older pixmap at a different zoom is
     * stretched until a new one arrives.
     */
    void setPagePixmap(const QPixmap& pixmap);
    void clearPage();

    /**
     * @brief Rectangle to highlight in canvas coordinates; null hides it.
     */
    void setHighlight(const QRectF& rect);
    QRectF highlight() const { return m_highlight; }

signals:
    /**
     * @brief Position inside the scroll area changed (scroll or re-centre).
     */
    void moved();

protected:
    void paintEvent(QPaintEvent* event) override;
    void moveEvent(QMoveEvent* event) override;

private:
    QPixmap m_pixmap;
    QRectF m_highlight;
};
