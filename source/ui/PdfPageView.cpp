#include "PdfPageView.h"
#include "widgets/PageCanvas.h"
#include "../core/GestureCoordinator.h"
#include "../pdf/PdfProvider.h"

#include <QDebug>
#include <QHBoxLayout>
#include <QLabel>
#include <QMouseEvent>
#include <QScrollArea>
#include <QScrollBar>
#include <QToolButton>
#include <QVBoxLayout>
#include <QWheelEvent>
#include <QtConcurrent>
#include <QtMath>

// ============================================================================
// Constructor / Destructor
// ============================================================================

PdfPageView::PdfPageView(GestureCoordinator* coordinator, QWidget* parent)
    : QWidget(parent)
    , m_coordinator(coordinator)
{
    setupUi();
    setFocusPolicy(Qt::StrongFocus);

    connect(m_coordinator, &GestureCoordinator::selectionChanged,
            this, &PdfPageView::updateHighlight);

    updateNavigation();
}

PdfPageView::~PdfPageView()
{
    // Workers only touch their own provider; wait so none outlives us
    for (QFutureWatcher<QImage>* watcher : m_activeRenderWatchers) {
        watcher->disconnect(this);
        watcher->waitForFinished();
        delete watcher;
    }
    m_activeRenderWatchers.clear();
}

void PdfPageView::setupUi()
{
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(2);

    auto* navBar = new QHBoxLayout();
    navBar->setContentsMargins(4, 2, 4, 2);

    m_prevButton = new QToolButton(this);
    m_prevButton->setText(QStringLiteral("<"));
    m_prevButton->setToolTip(tr("Previous Page"));
    m_prevButton->setFocusPolicy(Qt::NoFocus);
    connect(m_prevButton, &QToolButton::clicked, this, &PdfPageView::previousPage);

    m_pageLabel = new QLabel(this);
    m_pageLabel->setMinimumWidth(110);
    m_pageLabel->setAlignment(Qt::AlignCenter);

    m_nextButton = new QToolButton(this);
    m_nextButton->setText(QStringLiteral(">"));
    m_nextButton->setToolTip(tr("Next Page"));
    m_nextButton->setFocusPolicy(Qt::NoFocus);
    connect(m_nextButton, &QToolButton::clicked, this, &PdfPageView::nextPage);

    m_zoomOutButton = new QToolButton(this);
    m_zoomOutButton->setText(QStringLiteral("-"));
    m_zoomOutButton->setToolTip(tr("Zoom Out"));
    m_zoomOutButton->setFocusPolicy(Qt::NoFocus);
    connect(m_zoomOutButton, &QToolButton::clicked, this, &PdfPageView::zoomOut);

    m_zoomLabel = new QLabel(this);
    m_zoomLabel->setMinimumWidth(50);
    m_zoomLabel->setAlignment(Qt::AlignCenter);

    m_zoomInButton = new QToolButton(this);
    m_zoomInButton->setText(QStringLiteral("+"));
    m_zoomInButton->setToolTip(tr("Zoom In"));
    m_zoomInButton->setFocusPolicy(Qt::NoFocus);
    connect(m_zoomInButton, &QToolButton::clicked, this, &PdfPageView::zoomIn);

    navBar->addWidget(m_prevButton);
    navBar->addWidget(m_pageLabel);
    navBar->addWidget(m_nextButton);
    navBar->addStretch();
    navBar->addWidget(m_zoomOutButton);
    navBar->addWidget(m_zoomLabel);
    navBar->addWidget(m_zoomInButton);
    layout->addLayout(navBar);

    m_scrollArea = new QScrollArea(this);
    m_scrollArea->setAlignment(Qt::AlignCenter);
    m_scrollArea->setBackgroundRole(QPalette::Dark);
    m_scrollArea->setWidgetResizable(false);
    m_scrollArea->setFocusPolicy(Qt::NoFocus);

    m_canvas = new PageCanvas();
    m_canvas->resize(0, 0);
    m_scrollArea->setWidget(m_canvas);
    layout->addWidget(m_scrollArea, 1);

    // The scroll area moves the canvas on scroll and on re-centring
    connect(m_canvas, &PageCanvas::moved, this, &PdfPageView::publishViewState);

    m_canvas->installEventFilter(this);
    m_scrollArea->viewport()->installEventFilter(this);
}

// ============================================================================
// Document
// ============================================================================

void PdfPageView::setProvider(PdfProvider* provider)
{
    m_provider = provider;
    m_pageIndex = 0;
    m_zoom = ViewState::DEFAULT_ZOOM;
    m_pageSize = m_provider ? m_provider->pageSize(0) : QSizeF();

    m_canvas->clearPage();
    updateCanvasSize();
    updateNavigation();
    publishViewState();
    requestRender();

    emit pageChanged(m_pageIndex, pageCount());
    emit zoomChanged(m_zoom);
}

int PdfPageView::pageCount() const
{
    return m_provider ? m_provider->pageCount() : 0;
}

ViewState PdfPageView::viewState() const
{
    ViewState view;
    view.pageIndex = m_pageIndex;
    view.zoom = m_zoom;
    view.pageSize = m_pageSize;
    // Canvas position inside the viewport is the negated scroll offset
    view.scrollOffset = -QPointF(m_canvas->pos());
    return view;
}

// ============================================================================
// Navigation
// ============================================================================

void PdfPageView::goToPage(int pageIndex)
{
    if (!m_provider || pageIndex < 0 || pageIndex >= pageCount() || pageIndex == m_pageIndex) {
        return;
    }

    m_pageIndex = pageIndex;
    m_pageSize = m_provider->pageSize(pageIndex);

    updateCanvasSize();
    m_scrollArea->verticalScrollBar()->setValue(0);
    updateNavigation();
    publishViewState();
    requestRender();

    emit pageChanged(m_pageIndex, pageCount());
}

void PdfPageView::nextPage()
{
    goToPage(m_pageIndex + 1);
}

void PdfPageView::previousPage()
{
    goToPage(m_pageIndex - 1);
}

void PdfPageView::setZoom(qreal zoom)
{
    zoom = ViewState::clampZoom(zoom);
    if (qFuzzyCompare(zoom, m_zoom)) {
        return;
    }

    m_zoom = zoom;
    updateCanvasSize();
    updateNavigation();
    publishViewState();
    requestRender();

    emit zoomChanged(m_zoom);
}

void PdfPageView::zoomIn()
{
    setZoom(m_zoom + ViewState::ZOOM_STEP);
}

void PdfPageView::zoomOut()
{
    setZoom(m_zoom - ViewState::ZOOM_STEP);
}

void PdfPageView::resetZoom()
{
    setZoom(ViewState::DEFAULT_ZOOM);
}

void PdfPageView::updateNavigation()
{
    const int count = pageCount();
    m_prevButton->setEnabled(m_provider && m_pageIndex > 0);
    m_nextButton->setEnabled(m_provider && m_pageIndex < count - 1);
    m_zoomOutButton->setEnabled(m_provider && m_zoom > ViewState::MIN_ZOOM);
    m_zoomInButton->setEnabled(m_provider && m_zoom < ViewState::MAX_ZOOM);

    m_pageLabel->setText(count > 0 ? tr("Page %1 of %2").arg(m_pageIndex + 1).arg(count)
                                   : tr("No document"));
    m_zoomLabel->setText(QStringLiteral("%1%").arg(qRound(m_zoom * 100)));
}

void PdfPageView::updateCanvasSize()
{
    const QSizeF scaled = m_pageSize * m_zoom;
    m_canvas->setFixedSize(qCeil(scaled.width()), qCeil(scaled.height()));
}

// ============================================================================
// Coordinator sync
// ============================================================================

void PdfPageView::publishViewState()
{
    m_coordinator->setViewState(viewState());
    updateHighlight();
}

void PdfPageView::updateHighlight()
{
    // Screen (viewport) space to canvas space
    const QRectF screenRect = m_coordinator->selectionScreenRect();
    m_canvas->setHighlight(screenRect.isNull() ? QRectF()
                                               : screenRect.translated(-QPointF(m_canvas->pos())));
}

// ============================================================================
// Rendering
// ============================================================================

void PdfPageView::requestRender()
{
    if (!m_provider) {
        return;
    }

    const quint64 serial = ++m_renderSerial;
    const int pageIndex = m_pageIndex;
    const qreal dpr = devicePixelRatioF();
    const qreal renderZoom = m_zoom * dpr;
    const QString path = m_provider->filePath();

    auto* watcher = new QFutureWatcher<QImage>(this);
    m_activeRenderWatchers.append(watcher);

    // QPixmap only on the main thread
    connect(watcher, &QFutureWatcher<QImage>::finished, this, [this, watcher, serial, dpr]() {
        m_activeRenderWatchers.removeOne(watcher);
        QImage image = watcher->result();
        watcher->deleteLater();

        if (serial != m_renderSerial) {
            return;  // Superseded by a newer page/zoom
        }
        if (image.isNull()) {
            qWarning() << "PdfPageView: Render failed for page" << m_pageIndex;
            return;
        }

        QPixmap pixmap = QPixmap::fromImage(image);
        pixmap.setDevicePixelRatio(dpr);
        m_canvas->setPagePixmap(pixmap);
    });

    watcher->setFuture(QtConcurrent::run([path, pageIndex, renderZoom]() -> QImage {
        std::unique_ptr<PdfProvider> threadPdf = PdfProvider::create(path);
        if (!threadPdf) {
            return QImage();
        }
        return threadPdf->renderPage(pageIndex, renderZoom);
    }));
}

// ============================================================================
// Input
// ============================================================================

QPointF PdfPageView::toViewport(QObject* source, const QPointF& pos) const
{
    if (source == m_canvas) {
        return pos + QPointF(m_canvas->pos());
    }
    return pos;
}

bool PdfPageView::eventFilter(QObject* watched, QEvent* event)
{
    if (watched != m_canvas && watched != m_scrollArea->viewport()) {
        return QWidget::eventFilter(watched, event);
    }

    switch (event->type()) {
        case QEvent::MouseButtonPress: {
            auto* me = static_cast<QMouseEvent*>(event);
            if (me->button() != Qt::LeftButton) {
                break;
            }
            setFocus(Qt::MouseFocusReason);
            m_coordinator->pagePointerPressed(toViewport(watched, me->position()));
            return true;
        }
        case QEvent::MouseMove: {
            auto* me = static_cast<QMouseEvent*>(event);
            if (!(me->buttons() & Qt::LeftButton)) {
                break;
            }
            m_coordinator->pagePointerMoved(toViewport(watched, me->position()));
            return true;
        }
        case QEvent::MouseButtonRelease: {
            auto* me = static_cast<QMouseEvent*>(event);
            if (me->button() != Qt::LeftButton) {
                break;
            }
            m_coordinator->pagePointerReleased(toViewport(watched, me->position()));
            return true;
        }
        case QEvent::Wheel: {
            auto* we = static_cast<QWheelEvent*>(event);
            if (!(we->modifiers() & Qt::ControlModifier)) {
                break;
            }
            if (we->angleDelta().y() > 0) {
                zoomIn();
            } else if (we->angleDelta().y() < 0) {
                zoomOut();
            }
            return true;
        }
        default:
            break;
    }

    return QWidget::eventFilter(watched, event);
}
