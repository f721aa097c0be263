// ============================================================================
// PdfProviderFactory - Backend selection for PdfProvider
// ============================================================================
// The backend is chosen at configure time:
//   - PDFNOTES_USE_MUPDF   -> MuPdfProvider
//   - PDFNOTES_USE_POPPLER -> PopplerPdfProvider (desktop default)
// With neither defined, MuPDF is used on Android and musl (Poppler and
// MuPDF both pull OpenJPEG there and must not be loaded together).
// ============================================================================

#include "PdfProvider.h"

#include <QDebug>
#include <memory>

#if !defined(PDFNOTES_USE_MUPDF) && !defined(PDFNOTES_USE_POPPLER)
  #if defined(Q_OS_ANDROID) || (defined(__linux__) && !defined(__GLIBC__))
    #define PDFNOTES_USE_MUPDF 1
  #else
    #define PDFNOTES_USE_POPPLER 1
  #endif
#endif

#ifdef PDFNOTES_USE_MUPDF
#include "MuPdfProvider.h"
using PdfProviderImpl = MuPdfProvider;
static const char* const kBackendName = "MuPDF";
#else
#include "PopplerPdfProvider.h"
using PdfProviderImpl = PopplerPdfProvider;
static const char* const kBackendName = "Poppler";
#endif

// ============================================================================
// Factory Methods
// ============================================================================

std::unique_ptr<PdfProvider> PdfProvider::create(const QString& pdfPath)
{
    if (pdfPath.isEmpty()) {
        return nullptr;
    }

    auto provider = std::make_unique<PdfProviderImpl>(pdfPath);
    if (provider->isValid()) {
        return provider;
    }

    if (provider->isLocked()) {
        qWarning() << "PdfProvider::create: Document is password protected:" << pdfPath;
    }
    return nullptr;
}

QString PdfProvider::backendName()
{
    return QString::fromLatin1(kBackendName);
}
