// ============================================================================
// CaptureEngine - Implementation
// ============================================================================

#include "CaptureEngine.h"
#include "../pdf/PdfProvider.h"

#include <QDebug>
#include <QtConcurrent>

CaptureEngine::CaptureEngine(QObject* parent)
    : QObject(parent)
    , m_providerFactory([](const QString& path) { return PdfProvider::create(path); })
{
}

CaptureEngine::~CaptureEngine()
{
    // The worker only touches its own provider, but its result handler
    // captures this; make sure it never fires after destruction.
    if (m_watcher) {
        m_watcher->disconnect(this);
        m_watcher->waitForFinished();
        delete m_watcher;
        m_watcher = nullptr;
    }
}

void CaptureEngine::setProvider(PdfProvider* provider)
{
    m_provider = provider;
}

void CaptureEngine::setProviderFactory(ProviderFactory factory)
{
    m_providerFactory = std::move(factory);
}

bool CaptureEngine::captureText(const SelectionState& selection, const ViewState& view,
                                quint64 generation)
{
    return submit(CaptureRequest::Kind::Text, selection, view, generation);
}

bool CaptureEngine::captureScreenshot(const SelectionState& selection, const ViewState& view,
                                      quint64 generation)
{
    return submit(CaptureRequest::Kind::Screenshot, selection, view, generation);
}

bool CaptureEngine::submit(CaptureRequest::Kind kind, const SelectionState& selection,
                           const ViewState& view, quint64 generation)
{
    if (!selection.isCommitted()) {
        return false;
    }
    if (!m_provider) {
        qWarning() << "[CaptureEngine] No document loaded";
        return false;
    }
    if (isBusy()) {
#ifdef PDFNOTES_DEBUG
        qDebug() << "[CaptureEngine] Request ignored, previous capture still running";
#endif
        return false;
    }

    // Prefer the renderer's page size; the view may not have it yet
    QSizeF pageSize = m_provider->pageSize(view.pageIndex);
    if (pageSize.isEmpty()) {
        pageSize = view.pageSize;
    }

    CaptureRequest request;
    request.kind = kind;
    request.pageIndex = view.pageIndex;
    request.docRect = ViewportTransform::clampToPage(selection.rect, pageSize);
    request.zoom = ViewState::clampZoom(view.zoom);
    request.generation = generation;

    if (request.docRect.isEmpty()) {
#ifdef PDFNOTES_DEBUG
        qDebug() << "[CaptureEngine] Selection" << selection.rect << "is outside the page";
#endif
        return false;
    }

    if (request.pixelArea() > m_asyncPixelThreshold) {
        runAsync(request);
        return true;
    }

    emit captureFinished(execute(*m_provider, request), request);
    return true;
}

void CaptureEngine::runAsync(const CaptureRequest& request)
{
    const QString path = m_provider->filePath();
    const ProviderFactory factory = m_providerFactory;

    m_watcher = new QFutureWatcher<ClipboardPayload>(this);

    // Result handler runs on the main thread
    connect(m_watcher, &QFutureWatcher<ClipboardPayload>::finished, this, [this, request]() {
        QFutureWatcher<ClipboardPayload>* watcher = m_watcher;
        m_watcher = nullptr;

        ClipboardPayload payload = watcher->result();
        watcher->deleteLater();

        emit captureFinished(payload, request);
    });

    QFuture<ClipboardPayload> future = QtConcurrent::run([request, path, factory]() -> ClipboardPayload {
        std::unique_ptr<PdfProvider> threadProvider = factory ? factory(path) : nullptr;
        if (!threadProvider) {
            qWarning() << "[CaptureEngine] Worker could not open" << path;
            return request.kind == CaptureRequest::Kind::Text
                ? ClipboardPayload::fromText(QString())
                : ClipboardPayload();
        }
        return execute(*threadProvider, request);
    });

    m_watcher->setFuture(future);

#ifdef PDFNOTES_DEBUG
    qDebug() << "[CaptureEngine] Dispatched async capture, page" << request.pageIndex
             << "pixels" << request.pixelArea();
#endif
}

ClipboardPayload CaptureEngine::execute(const PdfProvider& provider, const CaptureRequest& request)
{
    if (request.kind == CaptureRequest::Kind::Text) {
        // Empty text is a valid result
        return ClipboardPayload::fromText(provider.extractText(request.pageIndex, request.docRect));
    }

    QImage image = provider.rasterizeRegion(request.pageIndex, request.docRect, request.zoom);
    if (image.isNull()) {
        qWarning() << "[CaptureEngine] Rasterization failed for page" << request.pageIndex
                   << request.docRect;
    }
    return ClipboardPayload::fromImage(image);
}
