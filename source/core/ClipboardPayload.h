#pragma once

// ============================================================================
// ClipboardPayload - The single pending capture awaiting a paste
// ============================================================================
// Tagged value: either text or an image. The Gesture Coordinator owns the
// only instance; each capture overwrites it.
// ============================================================================

#include <QImage>
#include <QMetaType>
#include <QString>

struct ClipboardPayload {
    enum class Kind {
        Empty,  ///< Nothing captured (or cleared after placement)
        Text,   ///< text is valid
        Image   ///< image is valid
    };

    Kind kind = Kind::Empty;
    QString text;
    QImage image;

    static ClipboardPayload fromText(const QString& content)
    {
        ClipboardPayload payload;
        payload.kind = Kind::Text;
        payload.text = content;
        return payload;
    }

    /**
     * @brief Wrap an image. A null image yields an Empty payload.
     */
    static ClipboardPayload fromImage(const QImage& pixels)
    {
        ClipboardPayload payload;
        if (!pixels.isNull()) {
            payload.kind = Kind::Image;
            payload.image = pixels;
        }
        return payload;
    }

    bool isEmpty() const { return kind == Kind::Empty; }
    bool isText() const { return kind == Kind::Text; }
    bool isImage() const { return kind == Kind::Image; }

    int width() const { return image.width(); }
    int height() const { return image.height(); }
};

Q_DECLARE_METATYPE(ClipboardPayload)
