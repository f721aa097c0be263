#pragma once

// ============================================================================
// RichTextSurface - What the capture pipeline needs from the notes editor
// ============================================================================

#include <QImage>
#include <QRectF>
#include <QString>

class RichTextSurface {
public:
    virtual ~RichTextSurface() = default;

    virtual void insertTextAtCursor(const QString& text) = 0;

    /**
     * @brief Insert an image at the cursor, displayed at width x height.
     * The image keeps its native pixels.
     */
    virtual void insertImageAtCursor(const QImage& image, int width, int height) = 0;

    /**
     * @brief Visible area of the surface in its own pixel coordinates.
     * Placement proxies are kept inside it.
     */
    virtual QRectF visibleArea() const = 0;
};
