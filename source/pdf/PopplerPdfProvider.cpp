// ============================================================================
// PopplerPdfProvider - Implementation
// ============================================================================

#include "PopplerPdfProvider.h"

#include <QDebug>
#include <QtMath>

// ===== Constructor =====

PopplerPdfProvider::PopplerPdfProvider(const QString& pdfPath)
    : m_path(pdfPath)
{
    m_document = Poppler::Document::load(pdfPath);

    if (!m_document) {
        qWarning() << "PopplerPdfProvider: Failed to open" << pdfPath;
        return;
    }

    if (!m_document->isLocked()) {
        m_document->setRenderHint(Poppler::Document::Antialiasing, true);
        m_document->setRenderHint(Poppler::Document::TextAntialiasing, true);
        m_document->setRenderHint(Poppler::Document::TextHinting, true);
        m_document->setRenderHint(Poppler::Document::TextSlightHinting, true);
    }
}

// ===== Document Info =====

bool PopplerPdfProvider::isValid() const
{
    return m_document != nullptr && !m_document->isLocked() && m_document->numPages() > 0;
}

bool PopplerPdfProvider::isLocked() const
{
    return m_document != nullptr && m_document->isLocked();
}

int PopplerPdfProvider::pageCount() const
{
    return m_document ? m_document->numPages() : 0;
}

QString PopplerPdfProvider::filePath() const
{
    return m_path;
}

QSizeF PopplerPdfProvider::pageSize(int pageIndex) const
{
    auto page = getPage(pageIndex);
    if (!page) {
        return QSizeF();
    }
    return page->pageSizeF();
}

// ===== Rendering =====

QImage PopplerPdfProvider::renderPage(int pageIndex, qreal zoom) const
{
    auto page = getPage(pageIndex);
    if (!page || zoom <= 0) {
        return QImage();
    }

    const qreal dpi = BASE_DPI * zoom;
    QImage image = page->renderToImage(dpi, dpi);
    if (image.isNull()) {
        qWarning() << "PopplerPdfProvider: Render failed for page" << pageIndex;
    }
    return image;
}

QImage PopplerPdfProvider::rasterizeRegion(int pageIndex, const QRectF& docRect, qreal zoom) const
{
    auto page = getPage(pageIndex);
    if (!page || zoom <= 0 || docRect.isEmpty()) {
        return QImage();
    }

    // renderToImage takes the sub-rectangle in pixels at the requested DPI
    const qreal dpi = BASE_DPI * zoom;
    QRect pixelRect(qFloor(docRect.left() * zoom), qFloor(docRect.top() * zoom),
                    qMax(1, qRound(docRect.width() * zoom)),
                    qMax(1, qRound(docRect.height() * zoom)));

    QImage image = page->renderToImage(dpi, dpi, pixelRect.x(), pixelRect.y(),
                                       pixelRect.width(), pixelRect.height());
    if (image.isNull()) {
        qWarning() << "PopplerPdfProvider: Region render failed for page" << pageIndex << docRect;
    }
    return image;
}

// ===== Text =====

QString PopplerPdfProvider::extractText(int pageIndex, const QRectF& docRect) const
{
    auto page = getPage(pageIndex);
    if (!page || docRect.isEmpty()) {
        return QString();
    }
    return page->text(docRect).trimmed();
}

// ===== Private Helpers =====

std::unique_ptr<Poppler::Page> PopplerPdfProvider::getPage(int pageIndex) const
{
    if (!m_document || pageIndex < 0 || pageIndex >= m_document->numPages()) {
        return nullptr;
    }
    return m_document->page(pageIndex);
}
