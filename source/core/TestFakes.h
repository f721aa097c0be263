#ifndef TESTFAKES_H
#define TESTFAKES_H

// ============================================================================
// TestFakes - In-memory stand-ins for the PDF renderer and the notes editor
// ============================================================================

#include "RichTextSurface.h"
#include "../pdf/PdfProvider.h"

#include <QAtomicInt>
#include <QColor>
#include <QImage>
#include <QList>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QStringList>
#include <QtMath>

/**
 * @brief PdfProvider with fixed page sizes, placed text spans and a solid
 * page raster.
 */
class FakePdfProvider : public PdfProvider {
public:
    struct TextSpan {
        int pageIndex;
        QRectF rect;
        QString text;
    };

    explicit FakePdfProvider(int pageCount = 3, const QSizeF& pageSize = QSizeF(612, 792))
        : m_pageCount(pageCount)
        , m_pageSize(pageSize)
    {
    }

    void addText(int pageIndex, const QRectF& rect, const QString& text)
    {
        m_spans.append({pageIndex, rect, text});
    }

    void setFailRasterize(bool fail) { m_failRasterize = fail; }
    int rasterizeCalls() const { return m_rasterizeCalls.loadRelaxed(); }
    QRectF lastRasterRect() const { return m_lastRasterRect; }

    bool isValid() const override { return m_pageCount > 0; }
    bool isLocked() const override { return false; }
    int pageCount() const override { return m_pageCount; }
    QString filePath() const override { return QStringLiteral("/tmp/fake.pdf"); }

    QSizeF pageSize(int pageIndex) const override
    {
        if (pageIndex < 0 || pageIndex >= m_pageCount) {
            return QSizeF();
        }
        return m_pageSize;
    }

    QImage renderPage(int pageIndex, qreal zoom) const override
    {
        return rasterizeRegion(pageIndex, QRectF(QPointF(0, 0), m_pageSize), zoom);
    }

    QImage rasterizeRegion(int pageIndex, const QRectF& docRect, qreal zoom) const override
    {
        m_rasterizeCalls.fetchAndAddRelaxed(1);
        m_lastRasterRect = docRect;
        if (m_failRasterize || pageIndex < 0 || pageIndex >= m_pageCount) {
            return QImage();
        }
        QImage image(qCeil(docRect.width() * zoom), qCeil(docRect.height() * zoom),
                     QImage::Format_ARGB32);
        image.fill(Qt::white);
        return image;
    }

    QString extractText(int pageIndex, const QRectF& docRect) const override
    {
        QStringList words;
        for (const TextSpan& span : m_spans) {
            if (span.pageIndex == pageIndex && docRect.contains(span.rect)) {
                words.append(span.text);
            }
        }
        return words.join(' ');
    }

private:
    int m_pageCount;
    QSizeF m_pageSize;
    QList<TextSpan> m_spans;
    bool m_failRasterize = false;
    mutable QAtomicInt m_rasterizeCalls;
    mutable QRectF m_lastRasterRect;
};

/**
 * @brief RichTextSurface that keeps a plain string with a cursor and records
 * every image insertion.
 */
class RecordingSurface : public RichTextSurface {
public:
    struct InsertedImage {
        QImage image;
        int width;
        int height;
    };

    explicit RecordingSurface(const QRectF& visible = QRectF(0, 0, 600, 400))
        : m_visible(visible)
    {
    }

    void insertTextAtCursor(const QString& text) override
    {
        content.insert(cursor, text);
        cursor += text.length();
        ++textInsertions;
    }

    void insertImageAtCursor(const QImage& image, int width, int height) override
    {
        images.append({image, width, height});
    }

    QRectF visibleArea() const override { return m_visible; }

    QString content;
    int cursor = 0;
    int textInsertions = 0;
    QList<InsertedImage> images;

private:
    QRectF m_visible;
};

#endif // TESTFAKES_H
