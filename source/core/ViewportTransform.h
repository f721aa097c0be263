#pragma once

// ============================================================================
// ViewportTransform - Screen <-> document space mapping for the page view
// ============================================================================
// Screen space: pixel coordinates of the scroll area's visible viewport.
// Document space: PDF points of the current page, origin at its top-left.
//
// The rendered page is the page scaled uniformly by zoom about its
// top-left; scrollOffset is where the viewport's top-left sits inside that
// rendered page (negative when the page is centred in a larger viewport).
//
//   doc    = (screen + scrollOffset) / zoom
//   screen = doc * zoom - scrollOffset
//
// All functions are pure and O(1); they run on every pointer-move.
// ============================================================================

#include <QPointF>
#include <QRectF>
#include <QSizeF>

/**
 * @brief View configuration of the page view.
 *
 * Owned and mutated by the page view. Everything else receives a copy.
 */
struct ViewState {
    static constexpr qreal MIN_ZOOM = 0.25;
    static constexpr qreal MAX_ZOOM = 3.0;
    static constexpr qreal ZOOM_STEP = 0.25;
    static constexpr qreal DEFAULT_ZOOM = 1.0;

    int pageIndex = 0;              ///< 0-based index of the displayed page
    qreal zoom = DEFAULT_ZOOM;      ///< Uniform scale, 1.0 = one pixel per point
    QPointF scrollOffset;           ///< Viewport top-left in rendered-page pixels
    QSizeF pageSize;                ///< Current page size in points

    /**
     * @brief Clamp a zoom value to [MIN_ZOOM, MAX_ZOOM].
     */
    static qreal clampZoom(qreal zoom) { return qBound(MIN_ZOOM, zoom, MAX_ZOOM); }

    /**
     * @brief Rendered page size in pixels at the current zoom.
     */
    QSizeF scaledPageSize() const { return pageSize * zoom; }

    bool operator==(const ViewState& other) const
    {
        return pageIndex == other.pageIndex && qFuzzyCompare(zoom, other.zoom)
            && scrollOffset == other.scrollOffset && pageSize == other.pageSize;
    }
    bool operator!=(const ViewState& other) const { return !(*this == other); }
};

class ViewportTransform {
public:
    /**
     * @brief Map a screen point to document space.
     *
     * Points outside the page clamp to the nearest in-page coordinate, so the
     * result is always within [0, width] x [0, height].
     */
    static QPointF toDocumentSpace(const QPointF& screenPoint, const ViewState& view);

    /**
     * @brief Map a document point to screen space (inverse of toDocumentSpace).
     */
    static QPointF toScreenSpace(const QPointF& docPoint, const ViewState& view);

    static QRectF toScreenSpace(const QRectF& docRect, const ViewState& view);

    /**
     * @brief Whether a screen point lies over the rendered page.
     */
    static bool isOverPage(const QPointF& screenPoint, const ViewState& view);

    /**
     * @brief Build a rectangle with non-negative size from two corners.
     */
    static QRectF normalizedRect(const QPointF& a, const QPointF& b);

    /**
     * @brief Intersect a document rectangle with the page bounds.
     * @return Clamped rectangle; empty if there is no overlap.
     */
    static QRectF clampToPage(const QRectF& docRect, const QSizeF& pageSize);
};
