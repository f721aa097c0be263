#pragma once

// ============================================================================
// MuPdfProvider - MuPDF implementation of PdfProvider
// ============================================================================
// Used when the build is configured with PDFNOTES_USE_MUPDF.
// Every call loads the page it needs and drops it before returning, so a
// provider holds no per-page state between calls.
// ============================================================================

#include "PdfProvider.h"

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct fz_document;
struct fz_page;

/**
 * @brief PdfProvider implementation using MuPDF.
 *
 * A MuPDF context must not be shared across threads, so worker-thread
 * captures open their own MuPdfProvider through PdfProvider::create().
 */
class MuPdfProvider : public PdfProvider {
public:
    /**
     * @brief Construct a provider for the given PDF file.
     * @param pdfPath Path to the PDF file.
     *
     * Check isValid() after construction to verify the PDF loaded successfully.
     */
    explicit MuPdfProvider(const QString& pdfPath);
    ~MuPdfProvider() override;

    MuPdfProvider(const MuPdfProvider&) = delete;
    MuPdfProvider& operator=(const MuPdfProvider&) = delete;

    // ===== Document Info =====
    bool isValid() const override;
    bool isLocked() const override;
    int pageCount() const override;
    QString filePath() const override;
    QSizeF pageSize(int pageIndex) const override;

    // ===== Rendering =====
    QImage renderPage(int pageIndex, qreal zoom) const override;
    QImage rasterizeRegion(int pageIndex, const QRectF& docRect, qreal zoom) const override;

    // ===== Text =====
    QString extractText(int pageIndex, const QRectF& docRect) const override;

private:
    /**
     * @brief Render an area (in MuPDF page coordinates) into a QImage.
     * @param page Loaded page.
     * @param area Area to draw, in untransformed page units.
     * @param zoom Scale factor.
     *
     * Throws through fz_throw; call only inside fz_try.
     */
    QImage drawArea(fz_page* page, const QRectF& area, qreal zoom) const;

    bool isPageInRange(int pageIndex) const
    {
        return isValid() && pageIndex >= 0 && pageIndex < m_pageCount;
    }

    fz_context* m_ctx = nullptr;        ///< MuPDF context (owns all allocations)
    fz_document* m_doc = nullptr;       ///< The loaded PDF document
    QString m_path;                     ///< Path to the PDF file
    int m_pageCount = 0;                ///< Cached page count
};
