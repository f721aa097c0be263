#pragma once

// ============================================================================
// ImagePlacementWidget - Draws the floating image proxy during placement
// ============================================================================
// Covers the notes editor's viewport while a placement is active so every
// press (inside the proxy or a click-away) reaches the coordinator.
// Geometry and state come from the GestureCoordinator; this widget only
// paints and forwards pointer input.
// ============================================================================

#include <QPointF>
#include <QRectF>
#include <QWidget>

class GestureCoordinator;

class ImagePlacementWidget : public QWidget {
    Q_OBJECT

public:
    explicit ImagePlacementWidget(GestureCoordinator* coordinator, QWidget* parent);

    /**
     * @brief Show/hide and repaint to match the coordinator.
     */
    void syncWithPlacement();

signals:
    /**
     * @brief A press outside the proxy is about to commit the placement.
     * @param proxyRect Proxy rectangle in viewport coordinates.
     */
    void aboutToCommit(const QRectF& proxyRect);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;

private:
    void updateCursor(const QPointF& pos);

    GestureCoordinator* m_coordinator = nullptr;  ///< Not owned
};
