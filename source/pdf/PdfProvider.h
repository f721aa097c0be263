#pragma once

// ============================================================================
// PdfProvider - Abstract interface for the document renderer
// ============================================================================
// The capture pipeline and the page view only talk to this interface:
// - renderPage() for the on-screen page raster
// - extractText() for text capture inside a document-space rectangle
// - rasterizeRegion() for screenshot capture of a document-space rectangle
//
// Coordinates are PDF points (1/72 inch), origin at the page's top-left.
// A zoom of 1.0 corresponds to 72 DPI, so one point maps to one pixel.
//
// Two backends exist (MuPDF and Poppler); exactly one is compiled in and
// selected by create(). Tests substitute an in-memory implementation.
// ============================================================================

#include <QString>
#include <QSizeF>
#include <QRectF>
#include <QImage>
#include <memory>

/**
 * @brief Abstract interface for PDF document operations.
 *
 * Implementations must be usable from a worker thread as long as each
 * thread owns its own instance (see create()).
 */
class PdfProvider {
public:
    virtual ~PdfProvider() = default;

    /// DPI corresponding to zoom 1.0
    static constexpr qreal BASE_DPI = 72.0;

    // ===== Document Info =====

    /**
     * @brief Check if the PDF was loaded successfully.
     * @return True if a valid PDF is loaded.
     */
    virtual bool isValid() const = 0;

    /**
     * @brief Check if the PDF is password-protected and locked.
     */
    virtual bool isLocked() const = 0;

    /**
     * @brief Get the total number of pages.
     * @return Page count, or 0 if invalid.
     */
    virtual int pageCount() const = 0;

    /**
     * @brief Get the file path this provider was loaded from.
     */
    virtual QString filePath() const = 0;

    /**
     * @brief Get the size of a page in points (1/72 inch).
     * @param pageIndex 0-based page index.
     * @return Page size in points, or empty QSizeF if invalid.
     */
    virtual QSizeF pageSize(int pageIndex) const = 0;

    // ===== Rendering =====

    /**
     * @brief Render a full page.
     * @param pageIndex 0-based page index.
     * @param zoom Scale factor (1.0 = 72 DPI).
     * @return Rendered image, or null QImage on error.
     */
    virtual QImage renderPage(int pageIndex, qreal zoom) const = 0;

    /**
     * @brief Rasterize a document-space region of a page.
     * @param pageIndex 0-based page index.
     * @param docRect Region in points. Callers clamp it to the page first.
     * @param zoom Scale factor; the result is docRect.size() * zoom pixels.
     * @return Region image, or null QImage on error.
     */
    virtual QImage rasterizeRegion(int pageIndex, const QRectF& docRect, qreal zoom) const = 0;

    // ===== Text =====

    /**
     * @brief Extract the text whose glyphs fall inside a rectangle.
     * @param pageIndex 0-based page index.
     * @param docRect Region in points.
     * @return Trimmed text; empty if there is none or extraction failed.
     */
    virtual QString extractText(int pageIndex, const QRectF& docRect) const = 0;

    // ===== Factory =====

    /**
     * @brief Create a PdfProvider for the given file.
     * @param pdfPath Path to the PDF file.
     * @return Provider instance, or nullptr on failure.
     *
     * The backend is fixed at build time (PDFNOTES_USE_MUPDF or
     * PDFNOTES_USE_POPPLER).
     */
    static std::unique_ptr<PdfProvider> create(const QString& pdfPath);

    /**
     * @brief Name of the compiled-in backend ("MuPDF" or "Poppler").
     */
    static QString backendName();
};
