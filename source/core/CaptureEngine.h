#pragma once

// ============================================================================
// CaptureEngine - Turns a committed selection into a clipboard payload
// ============================================================================
// Two triggers:
// - captureText():       PdfProvider::extractText()     -> Text payload
// - captureScreenshot(): PdfProvider::rasterizeRegion() -> Image payload
//
// Small regions run synchronously on the calling thread. Regions whose pixel
// area at the request zoom exceeds asyncPixelThreshold() are run through
// QtConcurrent with a worker-owned provider and delivered back on the main
// thread. Only one request may be in flight; triggers while busy are ignored.
//
// Every request carries the caller's generation token. The engine does not
// judge staleness itself; captureFinished() hands the token back so the
// owner can drop results produced for an older page/zoom.
// ============================================================================

#include "ClipboardPayload.h"
#include "SelectionTracker.h"
#include "ViewportTransform.h"

#include <QFutureWatcher>
#include <QObject>
#include <QRectF>

#include <functional>
#include <memory>

class PdfProvider;

/**
 * @brief Parameters of a single capture, fixed at trigger time.
 */
struct CaptureRequest {
    enum class Kind { Text, Screenshot };

    Kind kind = Kind::Text;
    int pageIndex = 0;
    QRectF docRect;             ///< Already clamped to the page
    qreal zoom = 1.0;
    quint64 generation = 0;     ///< Owner's view generation at trigger time

    /**
     * @brief Pixel count the request touches at its zoom.
     */
    qreal pixelArea() const { return docRect.width() * docRect.height() * zoom * zoom; }
};

Q_DECLARE_METATYPE(CaptureRequest)

class CaptureEngine : public QObject {
    Q_OBJECT

public:
    /// Opens a provider for a worker thread (each thread needs its own)
    using ProviderFactory = std::function<std::unique_ptr<PdfProvider>(const QString& path)>;

    static constexpr qreal DEFAULT_ASYNC_PIXEL_THRESHOLD = 1000000.0;

    explicit CaptureEngine(QObject* parent = nullptr);
    ~CaptureEngine() override;

    /**
     * @brief Set the provider used for synchronous captures (not owned).
     *
     * Also used to learn the file path for worker-thread providers.
     */
    void setProvider(PdfProvider* provider);
    PdfProvider* provider() const { return m_provider; }

    /**
     * @brief Override how worker threads open their provider.
     * Defaults to PdfProvider::create().
     */
    void setProviderFactory(ProviderFactory factory);

    void setAsyncPixelThreshold(qreal pixels) { m_asyncPixelThreshold = pixels; }
    qreal asyncPixelThreshold() const { return m_asyncPixelThreshold; }

    /**
     * @brief True while an asynchronous request is pending.
     */
    bool isBusy() const { return m_watcher != nullptr; }

    /**
     * @brief Extract text inside the committed selection.
     * @return True if the request was accepted. False (no-op) if the
     *         selection is not Committed, there is no provider, the engine is
     *         busy or the selection misses the page.
     */
    bool captureText(const SelectionState& selection, const ViewState& view, quint64 generation);

    /**
     * @brief Rasterize the committed selection at the current zoom.
     * @return True if the request was accepted (same rules as captureText()).
     */
    bool captureScreenshot(const SelectionState& selection, const ViewState& view, quint64 generation);

    /**
     * @brief Execute a request against a provider.
     *
     * Text failures give an empty Text payload; image failures give an
     * Empty payload.
     */
    static ClipboardPayload execute(const PdfProvider& provider, const CaptureRequest& request);

signals:
    /**
     * @brief A request completed (synchronously or on the main thread after
     * a worker finished).
     * @param payload Result; Empty if rasterization failed.
     * @param request The request as issued, including its generation.
     */
    void captureFinished(const ClipboardPayload& payload, const CaptureRequest& request);

private:
    bool submit(CaptureRequest::Kind kind, const SelectionState& selection,
                const ViewState& view, quint64 generation);
    void runAsync(const CaptureRequest& request);

    PdfProvider* m_provider = nullptr;                      ///< Not owned
    ProviderFactory m_providerFactory;
    qreal m_asyncPixelThreshold = DEFAULT_ASYNC_PIXEL_THRESHOLD;
    QFutureWatcher<ClipboardPayload>* m_watcher = nullptr;  ///< Pending request
};
