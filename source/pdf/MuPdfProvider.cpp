// ============================================================================
// MuPdfProvider - MuPDF implementation of PdfProvider
// ============================================================================

#include "MuPdfProvider.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <cstring>

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfProvider::MuPdfProvider(const QString& pdfPath)
    : m_path(pdfPath)
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "MuPdfProvider: Failed to create MuPDF context";
        return;
    }

    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Failed to register document handlers";
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        return;
    }

    QByteArray pathUtf8 = pdfPath.toUtf8();
    fz_try(m_ctx) {
        m_doc = fz_open_document(m_ctx, pathUtf8.constData());
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Failed to open" << pdfPath
                   << "-" << fz_caught_message(m_ctx);
        return;
    }

    fz_try(m_ctx) {
        m_pageCount = fz_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Failed to get page count";
        m_pageCount = 0;
    }

#ifdef PDFNOTES_DEBUG
    qDebug() << "MuPdfProvider: Loaded" << pdfPath << "with" << m_pageCount << "pages";
#endif
}

MuPdfProvider::~MuPdfProvider()
{
    if (m_doc) {
        fz_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

// ============================================================================
// Document Info
// ============================================================================

bool MuPdfProvider::isValid() const
{
    return m_ctx != nullptr && m_doc != nullptr && m_pageCount > 0;
}

bool MuPdfProvider::isLocked() const
{
    if (!m_doc) return false;
    return fz_needs_password(m_ctx, m_doc) != 0;
}

int MuPdfProvider::pageCount() const
{
    return m_pageCount;
}

QString MuPdfProvider::filePath() const
{
    return m_path;
}

QSizeF MuPdfProvider::pageSize(int pageIndex) const
{
    if (!isPageInRange(pageIndex)) {
        return QSizeF();
    }

    fz_rect bounds = fz_empty_rect;
    fz_try(m_ctx) {
        fz_page* page = fz_load_page(m_ctx, m_doc, pageIndex);
        bounds = fz_bound_page(m_ctx, page);
        fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        return QSizeF();
    }

    return QSizeF(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0);
}

// ============================================================================
// Rendering
// ============================================================================

QImage MuPdfProvider::drawArea(fz_page* page, const QRectF& area, qreal zoom) const
{
    fz_pixmap* pix = nullptr;
    fz_device* dev = nullptr;
    QImage result;

    fz_var(pix);
    fz_var(dev);

    fz_try(m_ctx) {
        fz_matrix ctm = fz_scale(zoom, zoom);

        fz_rect r = fz_make_rect(area.left(), area.top(), area.right(), area.bottom());
        fz_irect bbox = fz_round_rect(fz_transform_rect(r, ctm));

        // BGRA matches QImage::Format_ARGB32 on little-endian
        pix = fz_new_pixmap_with_bbox(m_ctx, fz_device_bgr(m_ctx), bbox, nullptr, 1);
        fz_clear_pixmap_with_value(m_ctx, pix, 255);

        // The pixmap origin is bbox.x0/y0, so drawing with ctm lands the
        // requested area at (0,0) of the pixmap.
        dev = fz_new_draw_device(m_ctx, fz_identity, pix);
        fz_run_page(m_ctx, page, dev, ctm, nullptr);
        fz_close_device(m_ctx, dev);

        int width = fz_pixmap_width(m_ctx, pix);
        int height = fz_pixmap_height(m_ctx, pix);
        int stride = fz_pixmap_stride(m_ctx, pix);
        unsigned char* samples = fz_pixmap_samples(m_ctx, pix);

        result = QImage(width, height, QImage::Format_ARGB32);
        for (int y = 0; y < height; ++y) {
            memcpy(result.scanLine(y), samples + y * stride, width * 4);
        }
    }
    fz_always(m_ctx) {
        if (dev) fz_drop_device(m_ctx, dev);
        if (pix) fz_drop_pixmap(m_ctx, pix);
    }
    fz_catch(m_ctx) {
        fz_rethrow(m_ctx);
    }

    return result;
}

QImage MuPdfProvider::renderPage(int pageIndex, qreal zoom) const
{
    if (!isPageInRange(pageIndex) || zoom <= 0) {
        return QImage();
    }

    fz_page* page = nullptr;
    QImage result;

    fz_var(page);

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);
        fz_rect bounds = fz_bound_page(m_ctx, page);
        result = drawArea(page, QRectF(bounds.x0, bounds.y0,
                                       bounds.x1 - bounds.x0, bounds.y1 - bounds.y0), zoom);
    }
    fz_always(m_ctx) {
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Render failed for page" << pageIndex
                   << "-" << fz_caught_message(m_ctx);
        return QImage();
    }

    return result;
}

QImage MuPdfProvider::rasterizeRegion(int pageIndex, const QRectF& docRect, qreal zoom) const
{
    if (!isPageInRange(pageIndex) || zoom <= 0 || docRect.isEmpty()) {
        return QImage();
    }

    fz_page* page = nullptr;
    QImage result;

    fz_var(page);

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);
        // Document space starts at the page's top-left; MuPDF bounds may not.
        fz_rect bounds = fz_bound_page(m_ctx, page);
        result = drawArea(page, docRect.translated(bounds.x0, bounds.y0), zoom);
    }
    fz_always(m_ctx) {
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Region render failed for page" << pageIndex
                   << docRect << "-" << fz_caught_message(m_ctx);
        return QImage();
    }

    return result;
}

// ============================================================================
// Text
// ============================================================================

QString MuPdfProvider::extractText(int pageIndex, const QRectF& docRect) const
{
    if (!isPageInRange(pageIndex) || docRect.isEmpty()) {
        return QString();
    }

    fz_page* page = nullptr;
    fz_stext_page* textPage = nullptr;
    char* text = nullptr;
    QString result;

    fz_var(page);
    fz_var(textPage);
    fz_var(text);

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);
        fz_rect bounds = fz_bound_page(m_ctx, page);

        fz_stext_options opts = {0};
        textPage = fz_new_stext_page_from_page(m_ctx, page, &opts);

        fz_rect area = fz_make_rect(docRect.left() + bounds.x0, docRect.top() + bounds.y0,
                                    docRect.right() + bounds.x0, docRect.bottom() + bounds.y0);
        text = fz_copy_rectangle(m_ctx, textPage, area, 0);
        if (text) {
            result = QString::fromUtf8(text).trimmed();
        }
    }
    fz_always(m_ctx) {
        if (text) fz_free(m_ctx, text);
        if (textPage) fz_drop_stext_page(m_ctx, textPage);
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Text extraction failed for page" << pageIndex
                   << "-" << fz_caught_message(m_ctx);
        return QString();
    }

    return result;
}
