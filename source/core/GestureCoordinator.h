#pragma once

// ============================================================================
// GestureCoordinator - Routes page/notes input to selection, capture and
// placement
// ============================================================================
// Owns the single SelectionTracker, PlacementOverlay, CaptureEngine and the
// clipboard payload for one document view. Widgets hold no gesture state;
// they forward input here and repaint on the change signals.
//
// Rules:
// - Page pointer input drives the selection only while no placement is
//   active. A page press during placement counts as a click-away and
//   commits it.
// - Capture actions are ignored while a placement is active.
// - Paste is ignored while a selection drag is in progress or a placement
//   is already active.
// - Page or zoom changes bump the generation; capture results carrying an
//   older generation are dropped.
// ============================================================================

#include "CaptureEngine.h"
#include "ClipboardPayload.h"
#include "PlacementOverlay.h"
#include "SelectionTracker.h"
#include "ViewportTransform.h"

#include <QObject>

class PdfProvider;
class RichTextSurface;

class GestureCoordinator : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Why an action did nothing (for status messages).
     */
    enum class IgnoredReason {
        NoDocument,
        NoSelection,
        CaptureBusy,
        CaptureFailed,
        PlacementActive,
        SelectionInProgress,
        NothingToPaste
    };
    Q_ENUM(IgnoredReason)

    explicit GestureCoordinator(QObject* parent = nullptr);
    ~GestureCoordinator() override;

    // ===== Collaborators =====

    /**
     * @brief Attach the document renderer (not owned). Resets the selection,
     * cancels any placement and invalidates pending captures.
     */
    void setProvider(PdfProvider* provider);

    /**
     * @brief Attach the notes surface (not owned).
     */
    void setRichTextSurface(RichTextSurface* surface);

    CaptureEngine* captureEngine() const { return m_captureEngine; }

    // ===== View =====

    /**
     * @brief Report the page view's current configuration.
     *
     * Page changes clear the selection, zoom changes cancel a drag; both
     * invalidate in-flight captures.
     */
    void setViewState(const ViewState& view);
    const ViewState& viewState() const { return m_view; }
    quint64 generation() const { return m_generation; }

    // ===== Page view pointer input (screen coordinates) =====
    void pagePointerPressed(const QPointF& screenPos);
    void pagePointerMoved(const QPointF& screenPos);
    void pagePointerReleased(const QPointF& screenPos);

    /**
     * @brief Drop the selection (Escape in the page view).
     */
    void clearSelection();

    // ===== Actions =====

    /**
     * @return True if a capture was started.
     */
    bool copySelectedText();
    bool captureScreenshot();

    /**
     * @brief Paste the clipboard payload into the notes surface.
     *
     * Text goes straight to the cursor; images open a placement, which is
     * refused (CaptureBusy) while a capture is still running.
     * @return True if text was inserted or a placement opened.
     */
    bool paste();

    /**
     * @brief Abandon the placement, keeping the payload for another try.
     */
    bool cancelPlacement();

    /**
     * @brief Insert the placed image at its current size and clear the payload.
     */
    bool commitPlacement();

    // ===== Notes surface pointer input during placement (surface coordinates) =====

    /**
     * @return True if the press was consumed by the placement.
     */
    bool placementPointerPressed(const QPointF& pos);
    bool placementPointerMoved(const QPointF& pos);
    bool placementPointerReleased(const QPointF& pos);

    /**
     * @brief Keep the proxy inside a resized surface.
     */
    void setPlacementBounds(const QRectF& bounds);

    // ===== State =====
    const SelectionState& selection() const { return m_selection.state(); }
    const PlacementState& placement() const { return m_placement.state(); }
    const ClipboardPayload& payload() const { return m_payload; }
    bool isPlacementActive() const { return m_placement.isActive(); }
    PlacementOverlay::HitZone placementHitTest(const QPointF& pos) const { return m_placement.hitTest(pos); }

    /**
     * @brief Selection highlight in screen coordinates, or a null rect.
     */
    QRectF selectionScreenRect() const;

signals:
    /**
     * @brief The selection highlight changed; repaint the page view.
     */
    void selectionChanged();

    /**
     * @brief A new payload replaced the old one, or it was cleared.
     */
    void payloadChanged();

    /**
     * @brief Placement opened, moved, resized or closed.
     */
    void placementChanged();

    /**
     * @brief Image was inserted into the notes.
     */
    void placementCommitted(const QSize& size);

    /**
     * @brief A capture finished for an outdated page/zoom and was dropped.
     */
    void captureDiscarded();

    void actionIgnored(GestureCoordinator::IgnoredReason reason);

private slots:
    void onCaptureFinished(const ClipboardPayload& payload, const CaptureRequest& request);

private:
    void invalidateCaptures();
    bool startCapture(CaptureRequest::Kind kind);
    void ignore(IgnoredReason reason);

    SelectionTracker m_selection;
    PlacementOverlay m_placement;
    CaptureEngine* m_captureEngine = nullptr;    ///< Child QObject
    ClipboardPayload m_payload;

    ViewState m_view;
    quint64 m_generation = 0;

    PdfProvider* m_provider = nullptr;           ///< Not owned
    RichTextSurface* m_surface = nullptr;        ///< Not owned
};
