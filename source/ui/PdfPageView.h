#pragma once

// ============================================================================
// PdfPageView - Single-page PDF viewer with region selection
// ============================================================================
// Layout:
//   [<] Page 3 of 12 [>]            [-] 100% [+]
//   +---------------------------------------------+
//   | QScrollArea                                 |
//   |   PageCanvas (page pixmap + highlight)      |
//   +---------------------------------------------+
//
// Owns the ViewState (page, zoom, scroll) and reports every change to the
// GestureCoordinator. Pointer input over the page is forwarded to the
// coordinator in scroll-area viewport coordinates.
// ============================================================================

#include "../core/ViewportTransform.h"

#include <QFutureWatcher>
#include <QImage>
#include <QList>
#include <QWidget>

class GestureCoordinator;
class PageCanvas;
class PdfProvider;
class QLabel;
class QScrollArea;
class QToolButton;

class PdfPageView : public QWidget {
    Q_OBJECT

public:
    explicit PdfPageView(GestureCoordinator* coordinator, QWidget* parent = nullptr);
    ~PdfPageView() override;

    /**
     * @brief Show a document (not owned). nullptr shows an empty view.
     * Starts at the first page, zoom 1.0.
     */
    void setProvider(PdfProvider* provider);

    int currentPage() const { return m_pageIndex; }
    int pageCount() const;
    qreal zoom() const { return m_zoom; }

    /**
     * @brief Current view configuration as seen by the coordinator.
     */
    ViewState viewState() const;

public slots:
    void goToPage(int pageIndex);
    void nextPage();
    void previousPage();

    /**
     * @brief Set zoom, clamped to [ViewState::MIN_ZOOM, ViewState::MAX_ZOOM].
     */
    void setZoom(qreal zoom);
    void zoomIn();
    void zoomOut();
    void resetZoom();

signals:
    void pageChanged(int pageIndex, int pageCount);
    void zoomChanged(qreal zoom);

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private slots:
    void publishViewState();
    void updateHighlight();

private:
    void setupUi();
    void updateNavigation();
    void updateCanvasSize();

    /**
     * @brief Render the current page at the current zoom off the UI thread.
     */
    void requestRender();

    /**
     * @brief Map a position in @p source to viewport coordinates.
     */
    QPointF toViewport(QObject* source, const QPointF& pos) const;

    GestureCoordinator* m_coordinator = nullptr;  ///< Not owned
    PdfProvider* m_provider = nullptr;            ///< Not owned

    QToolButton* m_prevButton = nullptr;
    QToolButton* m_nextButton = nullptr;
    QLabel* m_pageLabel = nullptr;
    QToolButton* m_zoomOutButton = nullptr;
    QToolButton* m_zoomInButton = nullptr;
    QLabel* m_zoomLabel = nullptr;
    QScrollArea* m_scrollArea = nullptr;
    PageCanvas* m_canvas = nullptr;

    int m_pageIndex = 0;
    qreal m_zoom = ViewState::DEFAULT_ZOOM;
    QSizeF m_pageSize;                            ///< Current page, points

    quint64 m_renderSerial = 0;                   ///< Latest render request
    QList<QFutureWatcher<QImage>*> m_activeRenderWatchers;
};
