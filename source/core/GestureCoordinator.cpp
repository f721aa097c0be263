// ============================================================================
// GestureCoordinator - Implementation
// ============================================================================

#include "GestureCoordinator.h"
#include "RichTextSurface.h"
#include "../pdf/PdfProvider.h"

#include <QDebug>

GestureCoordinator::GestureCoordinator(QObject* parent)
    : QObject(parent)
    , m_captureEngine(new CaptureEngine(this))
{
    connect(m_captureEngine, &CaptureEngine::captureFinished,
            this, &GestureCoordinator::onCaptureFinished);
}

GestureCoordinator::~GestureCoordinator() = default;

// ===== Collaborators =====

void GestureCoordinator::setProvider(PdfProvider* provider)
{
    m_provider = provider;
    m_captureEngine->setProvider(provider);

    m_view = ViewState();
    if (provider) {
        m_view.pageSize = provider->pageSize(0);
    }
    invalidateCaptures();

    if (m_selection.clear()) {
        emit selectionChanged();
    }
    if (m_placement.cancel()) {
        emit placementChanged();
    }
}

void GestureCoordinator::setRichTextSurface(RichTextSurface* surface)
{
    if (m_surface == surface) {
        return;
    }
    // A placement belongs to the surface it was opened on
    if (m_placement.cancel()) {
        emit placementChanged();
    }
    m_surface = surface;
}

// ===== View =====

void GestureCoordinator::setViewState(const ViewState& view)
{
    const bool pageChanged = view.pageIndex != m_view.pageIndex;
    const bool zoomChanged = !qFuzzyCompare(view.zoom, m_view.zoom);
    const bool scrolled = view.scrollOffset != m_view.scrollOffset;

    m_view = view;

    bool selectionAltered = false;
    if (pageChanged) {
        invalidateCaptures();
        selectionAltered = m_selection.clear();
    } else if (zoomChanged) {
        invalidateCaptures();
        selectionAltered = m_selection.cancelDrag();
    }

    // A scroll moves the highlight on screen even though it is unchanged
    if (selectionAltered || ((zoomChanged || scrolled) && !m_selection.state().isIdle())) {
        emit selectionChanged();
    }
}

void GestureCoordinator::invalidateCaptures()
{
    ++m_generation;
}

// ===== Page view pointer input =====

void GestureCoordinator::pagePointerPressed(const QPointF& screenPos)
{
    if (!m_provider) {
        return;
    }

    if (m_placement.isActive()) {
        // Click-away from the placement
        commitPlacement();
        return;
    }

    if (!ViewportTransform::isOverPage(screenPos, m_view)) {
        return;
    }

    const QPointF docPos = ViewportTransform::toDocumentSpace(screenPos, m_view);
    m_selection.pointerDown(docPos);
    emit selectionChanged();
}

void GestureCoordinator::pagePointerMoved(const QPointF& screenPos)
{
    if (m_placement.isActive() || !m_selection.state().isDragging()) {
        return;
    }

    const QPointF docPos = ViewportTransform::toDocumentSpace(screenPos, m_view);
    if (m_selection.pointerMove(docPos)) {
        emit selectionChanged();
    }
}

void GestureCoordinator::pagePointerReleased(const QPointF& screenPos)
{
    if (m_placement.isActive() || !m_selection.state().isDragging()) {
        return;
    }

    const QPointF docPos = ViewportTransform::toDocumentSpace(screenPos, m_view);
    m_selection.pointerUp(docPos);
    emit selectionChanged();
}

void GestureCoordinator::clearSelection()
{
    if (m_selection.clear()) {
        emit selectionChanged();
    }
}

QRectF GestureCoordinator::selectionScreenRect() const
{
    const QRectF docRect = m_selection.highlightRect();
    if (docRect.isNull()) {
        return QRectF();
    }
    return ViewportTransform::toScreenSpace(docRect, m_view);
}

// ===== Capture =====

bool GestureCoordinator::copySelectedText()
{
    return startCapture(CaptureRequest::Kind::Text);
}

bool GestureCoordinator::captureScreenshot()
{
    return startCapture(CaptureRequest::Kind::Screenshot);
}

bool GestureCoordinator::startCapture(CaptureRequest::Kind kind)
{
    if (!m_provider) {
        ignore(IgnoredReason::NoDocument);
        return false;
    }
    if (m_placement.isActive()) {
        ignore(IgnoredReason::PlacementActive);
        return false;
    }
    if (!m_selection.state().isCommitted()) {
        ignore(IgnoredReason::NoSelection);
        return false;
    }
    if (m_captureEngine->isBusy()) {
        ignore(IgnoredReason::CaptureBusy);
        return false;
    }

    const bool accepted = kind == CaptureRequest::Kind::Text
        ? m_captureEngine->captureText(m_selection.state(), m_view, m_generation)
        : m_captureEngine->captureScreenshot(m_selection.state(), m_view, m_generation);

    if (!accepted) {
        // Committed but entirely off the page
        ignore(IgnoredReason::NoSelection);
    }
    return accepted;
}

void GestureCoordinator::onCaptureFinished(const ClipboardPayload& payload,
                                           const CaptureRequest& request)
{
    if (request.generation != m_generation) {
#ifdef PDFNOTES_DEBUG
        qDebug() << "[GestureCoordinator] Dropping stale capture for page" << request.pageIndex
                 << "generation" << request.generation << "current" << m_generation;
#endif
        emit captureDiscarded();
        return;
    }

    if (payload.isEmpty()) {
        ignore(IgnoredReason::CaptureFailed);
        return;
    }

    m_payload = payload;
    emit payloadChanged();
}

// ===== Paste / Placement =====

bool GestureCoordinator::paste()
{
    if (!m_surface) {
        return false;
    }
    if (m_payload.isEmpty()) {
        ignore(IgnoredReason::NothingToPaste);
        return false;
    }
    if (m_selection.state().isDragging()) {
        ignore(IgnoredReason::SelectionInProgress);
        return false;
    }

    if (m_payload.isText()) {
        m_surface->insertTextAtCursor(m_payload.text);
        return true;
    }

    // A screenshot still in flight would replace the image being placed
    if (m_captureEngine->isBusy()) {
        ignore(IgnoredReason::CaptureBusy);
        return false;
    }

    if (!m_placement.activate(m_payload.image.size(), m_surface->visibleArea())) {
        ignore(IgnoredReason::PlacementActive);
        return false;
    }
    emit placementChanged();
    return true;
}

bool GestureCoordinator::cancelPlacement()
{
    if (!m_placement.cancel()) {
        return false;
    }
    emit placementChanged();
    return true;
}

bool GestureCoordinator::commitPlacement()
{
    if (!m_placement.isActive()) {
        return false;
    }

    const QSize size = m_placement.commit();
    if (m_surface && m_payload.isImage()) {
        m_surface->insertImageAtCursor(m_payload.image, size.width(), size.height());
    } else {
        qWarning() << "[GestureCoordinator] Placement committed without a surface or image";
    }

    m_payload = ClipboardPayload();

    emit placementChanged();
    emit placementCommitted(size);
    emit payloadChanged();
    return true;
}

bool GestureCoordinator::placementPointerPressed(const QPointF& pos)
{
    switch (m_placement.pointerDown(pos)) {
        case PlacementOverlay::PressResult::Ignored:
            return false;
        case PlacementOverlay::PressResult::CommitRequested:
            commitPlacement();
            return true;
        case PlacementOverlay::PressResult::DragStarted:
            emit placementChanged();
            return true;
    }
    return false;
}

bool GestureCoordinator::placementPointerMoved(const QPointF& pos)
{
    if (!m_placement.pointerMove(pos)) {
        return false;
    }
    emit placementChanged();
    return true;
}

bool GestureCoordinator::placementPointerReleased(const QPointF& pos)
{
    if (!m_placement.pointerUp(pos)) {
        return false;
    }
    emit placementChanged();
    return true;
}

void GestureCoordinator::setPlacementBounds(const QRectF& bounds)
{
    const QRectF before = m_placement.rect();
    m_placement.setSurfaceBounds(bounds);
    if (m_placement.isActive() && m_placement.rect() != before) {
        emit placementChanged();
    }
}

void GestureCoordinator::ignore(IgnoredReason reason)
{
#ifdef PDFNOTES_DEBUG
    qDebug() << "[GestureCoordinator] Action ignored:" << reason;
#endif
    emit actionIgnored(reason);
}
