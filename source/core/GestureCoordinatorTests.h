#ifndef GESTURECOORDINATORTESTS_H
#define GESTURECOORDINATORTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include "GestureCoordinator.h"
#include "TestFakes.h"

/**
 * End-to-end tests of select -> capture -> paste -> place -> commit, driven
 * through GestureCoordinator with a fake renderer and notes surface.
 * Run with: pdfnotes --test-gesture
 */
class GestureCoordinatorTests : public QObject {
    Q_OBJECT

private:
    static ViewState viewAt(int page, qreal zoom, const QPointF& scroll = QPointF(0, 0))
    {
        ViewState view;
        view.pageIndex = page;
        view.zoom = zoom;
        view.scrollOffset = scroll;
        view.pageSize = QSizeF(612, 792);
        return view;
    }

    static void dragSelect(GestureCoordinator& coordinator, const QPointF& from, const QPointF& to)
    {
        coordinator.pagePointerPressed(from);
        coordinator.pagePointerMoved((from + to) / 2);
        coordinator.pagePointerMoved(to);
        coordinator.pagePointerReleased(to);
    }

    static GestureCoordinator::IgnoredReason lastReason(const QSignalSpy& spy)
    {
        return spy.last().at(0).value<GestureCoordinator::IgnoredReason>();
    }

private slots:
    void initTestCase() {
        qRegisterMetaType<ClipboardPayload>();
        qRegisterMetaType<CaptureRequest>();
        qRegisterMetaType<GestureCoordinator::IgnoredReason>();
    }

    void testScreenshotPlaceResizeCommit() {
        FakePdfProvider provider;
        RecordingSurface surface;
        GestureCoordinator coordinator;
        coordinator.setProvider(&provider);
        coordinator.setRichTextSurface(&surface);
        coordinator.setViewState(viewAt(0, 1.0));

        QSignalSpy committedSpy(&coordinator, &GestureCoordinator::placementCommitted);

        dragSelect(coordinator, QPointF(100, 100), QPointF(200, 150));
        QVERIFY(coordinator.selection().isCommitted());
        QCOMPARE(coordinator.selection().rect, QRectF(100, 100, 100, 50));

        QVERIFY(coordinator.captureScreenshot());
        QVERIFY(coordinator.payload().isImage());
        QCOMPARE(coordinator.payload().image.size(), QSize(100, 50));

        QVERIFY(coordinator.paste());
        QVERIFY(coordinator.isPlacementActive());
        QCOMPARE(coordinator.placement().mode, PlacementState::Mode::Moving);
        QCOMPARE(coordinator.placement().rect, QRectF(250, 175, 100, 50));

        // Drag the bottom-right corner by (+20, +10)
        QVERIFY(coordinator.placementPointerPressed(QPointF(350, 225)));
        QVERIFY(coordinator.placementPointerMoved(QPointF(370, 235)));
        QVERIFY(coordinator.placementPointerReleased(QPointF(370, 235)));
        QVERIFY(surface.images.isEmpty());

        // Click outside
        QVERIFY(coordinator.placementPointerPressed(QPointF(20, 20)));

        QCOMPARE(surface.images.size(), 1);
        QCOMPARE(surface.images.first().width, 120);
        QCOMPARE(surface.images.first().height, 60);
        QCOMPARE(surface.images.first().image.size(), QSize(100, 50));
        QVERIFY(coordinator.payload().isEmpty());
        QVERIFY(!coordinator.isPlacementActive());
        QCOMPARE(committedSpy.count(), 1);
        QCOMPARE(committedSpy.first().at(0).toSize(), QSize(120, 60));
    }

    void testTextCaptureInsertsAtCursor() {
        FakePdfProvider provider;
        provider.addText(0, QRectF(110, 110, 40, 12), "Hello");
        RecordingSurface surface;
        surface.content = "abcdef";
        surface.cursor = 3;

        GestureCoordinator coordinator;
        coordinator.setProvider(&provider);
        coordinator.setRichTextSurface(&surface);
        coordinator.setViewState(viewAt(0, 1.0));

        dragSelect(coordinator, QPointF(100, 100), QPointF(200, 150));
        QVERIFY(coordinator.copySelectedText());
        QVERIFY(coordinator.payload().isText());
        QCOMPARE(coordinator.payload().text, QString("Hello"));

        QVERIFY(coordinator.paste());
        QCOMPARE(surface.content, QString("abcHellodef"));
        QVERIFY(!coordinator.isPlacementActive());
        QVERIFY(surface.images.isEmpty());

        // Text stays available for another paste
        QVERIFY(coordinator.payload().isText());
    }

    void testPageChangeDropsSelection() {
        FakePdfProvider provider;
        GestureCoordinator coordinator;
        coordinator.setProvider(&provider);
        coordinator.setViewState(viewAt(0, 1.0));

        coordinator.pagePointerPressed(QPointF(100, 100));
        coordinator.pagePointerMoved(QPointF(200, 200));
        QVERIFY(coordinator.selection().isDragging());

        coordinator.setViewState(viewAt(1, 1.0));
        QVERIFY(coordinator.selection().isIdle());
        QVERIFY(coordinator.selectionScreenRect().isNull());

        // Release after the change does not resurrect it
        coordinator.pagePointerReleased(QPointF(250, 250));
        QVERIFY(coordinator.selection().isIdle());

        // Committed selections belong to their page too
        dragSelect(coordinator, QPointF(100, 100), QPointF(200, 200));
        QVERIFY(coordinator.selection().isCommitted());
        coordinator.setViewState(viewAt(2, 1.0));
        QVERIFY(coordinator.selection().isIdle());
    }

    void testZoomChangeCancelsDrag() {
        FakePdfProvider provider;
        GestureCoordinator coordinator;
        coordinator.setProvider(&provider);
        coordinator.setViewState(viewAt(0, 1.0));

        coordinator.pagePointerPressed(QPointF(100, 100));
        coordinator.pagePointerMoved(QPointF(200, 200));
        coordinator.setViewState(viewAt(0, 1.5));
        QVERIFY(coordinator.selection().isIdle());
    }

    void testCommittedSelectionFollowsZoomAndScroll() {
        FakePdfProvider provider;
        GestureCoordinator coordinator;
        coordinator.setProvider(&provider);
        coordinator.setViewState(viewAt(0, 1.0));

        dragSelect(coordinator, QPointF(100, 100), QPointF(200, 150));
        QSignalSpy spy(&coordinator, &GestureCoordinator::selectionChanged);

        coordinator.setViewState(viewAt(0, 2.0, QPointF(50, 20)));
        QVERIFY(coordinator.selection().isCommitted());
        QCOMPARE(coordinator.selection().rect, QRectF(100, 100, 100, 50));
        QCOMPARE(coordinator.selectionScreenRect(), QRectF(150, 180, 200, 100));
        QCOMPARE(spy.count(), 1);
    }

    void testStaleCaptureDiscarded() {
        FakePdfProvider provider;
        RecordingSurface surface;
        GestureCoordinator coordinator;
        coordinator.setProvider(&provider);
        coordinator.setRichTextSurface(&surface);
        coordinator.setViewState(viewAt(0, 1.0));

        coordinator.captureEngine()->setProviderFactory([](const QString&) {
            return std::unique_ptr<PdfProvider>(new FakePdfProvider());
        });
        coordinator.captureEngine()->setAsyncPixelThreshold(0);

        QSignalSpy discardedSpy(&coordinator, &GestureCoordinator::captureDiscarded);
        QSignalSpy payloadSpy(&coordinator, &GestureCoordinator::payloadChanged);

        dragSelect(coordinator, QPointF(100, 100), QPointF(300, 300));
        QVERIFY(coordinator.captureScreenshot());

        // Page turned while the worker runs
        coordinator.setViewState(viewAt(1, 1.0));

        QVERIFY(discardedSpy.wait(5000));
        QCOMPARE(payloadSpy.count(), 0);
        QVERIFY(coordinator.payload().isEmpty());
    }

    void testAsyncCaptureDelivered() {
        FakePdfProvider provider;
        GestureCoordinator coordinator;
        coordinator.setProvider(&provider);
        coordinator.setViewState(viewAt(0, 1.0));
        coordinator.captureEngine()->setProviderFactory([](const QString&) {
            return std::unique_ptr<PdfProvider>(new FakePdfProvider());
        });
        coordinator.captureEngine()->setAsyncPixelThreshold(0);

        QSignalSpy payloadSpy(&coordinator, &GestureCoordinator::payloadChanged);
        QSignalSpy ignoredSpy(&coordinator, &GestureCoordinator::actionIgnored);

        dragSelect(coordinator, QPointF(0, 0), QPointF(300, 300));
        QVERIFY(coordinator.captureScreenshot());
        QVERIFY(!coordinator.copySelectedText());
        QCOMPARE(lastReason(ignoredSpy), GestureCoordinator::IgnoredReason::CaptureBusy);

        QVERIFY(payloadSpy.wait(5000));
        QCOMPARE(coordinator.payload().image.size(), QSize(300, 300));
    }

    void testImagePasteWaitsForRunningCapture() {
        FakePdfProvider provider;
        RecordingSurface surface;
        GestureCoordinator coordinator;
        coordinator.setProvider(&provider);
        coordinator.setRichTextSurface(&surface);
        coordinator.setViewState(viewAt(0, 1.0));

        dragSelect(coordinator, QPointF(100, 100), QPointF(200, 150));
        QVERIFY(coordinator.captureScreenshot());
        QCOMPARE(coordinator.payload().image.size(), QSize(100, 50));

        coordinator.captureEngine()->setProviderFactory([](const QString&) {
            return std::unique_ptr<PdfProvider>(new FakePdfProvider());
        });
        coordinator.captureEngine()->setAsyncPixelThreshold(0);

        QSignalSpy payloadSpy(&coordinator, &GestureCoordinator::payloadChanged);
        QSignalSpy ignoredSpy(&coordinator, &GestureCoordinator::actionIgnored);

        dragSelect(coordinator, QPointF(0, 0), QPointF(300, 300));
        QVERIFY(coordinator.captureScreenshot());
        QVERIFY(coordinator.captureEngine()->isBusy());

        // The first image must not be placed while the second is on its way
        QVERIFY(!coordinator.paste());
        QCOMPARE(lastReason(ignoredSpy), GestureCoordinator::IgnoredReason::CaptureBusy);
        QVERIFY(!coordinator.isPlacementActive());

        QVERIFY(payloadSpy.wait(5000));
        QCOMPARE(coordinator.payload().image.size(), QSize(300, 300));

        QVERIFY(coordinator.paste());
        QVERIFY(coordinator.commitPlacement());
        QCOMPARE(surface.images.size(), 1);
        QCOMPARE(surface.images.first().image.size(), QSize(300, 300));
    }

    void testCancelKeepsPayload() {
        FakePdfProvider provider;
        RecordingSurface surface;
        GestureCoordinator coordinator;
        coordinator.setProvider(&provider);
        coordinator.setRichTextSurface(&surface);
        coordinator.setViewState(viewAt(0, 1.0));

        dragSelect(coordinator, QPointF(100, 100), QPointF(200, 150));
        QVERIFY(coordinator.captureScreenshot());
        QVERIFY(coordinator.paste());

        QVERIFY(coordinator.cancelPlacement());
        QVERIFY(!coordinator.isPlacementActive());
        QVERIFY(surface.images.isEmpty());
        QVERIFY(coordinator.payload().isImage());
        QCOMPARE(coordinator.payload().image.size(), QSize(100, 50));

        // Can be pasted again
        QVERIFY(coordinator.paste());
        QVERIFY(coordinator.isPlacementActive());
    }

    void testPlacementExcludesOtherActions() {
        FakePdfProvider provider;
        RecordingSurface surface;
        GestureCoordinator coordinator;
        coordinator.setProvider(&provider);
        coordinator.setRichTextSurface(&surface);
        coordinator.setViewState(viewAt(0, 1.0));
        QSignalSpy ignoredSpy(&coordinator, &GestureCoordinator::actionIgnored);

        dragSelect(coordinator, QPointF(100, 100), QPointF(200, 150));
        QVERIFY(coordinator.captureScreenshot());
        QVERIFY(coordinator.paste());

        QVERIFY(!coordinator.paste());
        QCOMPARE(lastReason(ignoredSpy), GestureCoordinator::IgnoredReason::PlacementActive);

        QVERIFY(!coordinator.captureScreenshot());
        QCOMPARE(lastReason(ignoredSpy), GestureCoordinator::IgnoredReason::PlacementActive);
        QVERIFY(!coordinator.copySelectedText());
        QVERIFY(coordinator.payload().isImage());

        // A press on the page counts as clicking away
        coordinator.pagePointerPressed(QPointF(400, 400));
        QVERIFY(!coordinator.isPlacementActive());
        QCOMPARE(surface.images.size(), 1);
        QCOMPARE(surface.images.first().width, 100);
        QVERIFY(coordinator.selection().isCommitted());
    }

    void testPasteWhileDraggingIgnored() {
        FakePdfProvider provider;
        RecordingSurface surface;
        GestureCoordinator coordinator;
        coordinator.setProvider(&provider);
        coordinator.setRichTextSurface(&surface);
        coordinator.setViewState(viewAt(0, 1.0));
        QSignalSpy ignoredSpy(&coordinator, &GestureCoordinator::actionIgnored);

        dragSelect(coordinator, QPointF(100, 100), QPointF(200, 150));
        QVERIFY(coordinator.captureScreenshot());

        coordinator.pagePointerPressed(QPointF(300, 300));
        coordinator.pagePointerMoved(QPointF(350, 350));
        QVERIFY(!coordinator.paste());
        QCOMPARE(lastReason(ignoredSpy), GestureCoordinator::IgnoredReason::SelectionInProgress);
        QVERIFY(!coordinator.isPlacementActive());
    }

    void testIgnoredReasons() {
        RecordingSurface surface;
        GestureCoordinator coordinator;
        coordinator.setRichTextSurface(&surface);
        QSignalSpy ignoredSpy(&coordinator, &GestureCoordinator::actionIgnored);

        QVERIFY(!coordinator.copySelectedText());
        QCOMPARE(lastReason(ignoredSpy), GestureCoordinator::IgnoredReason::NoDocument);

        QVERIFY(!coordinator.paste());
        QCOMPARE(lastReason(ignoredSpy), GestureCoordinator::IgnoredReason::NothingToPaste);

        FakePdfProvider provider;
        coordinator.setProvider(&provider);
        coordinator.setViewState(viewAt(0, 1.0));
        QVERIFY(!coordinator.captureScreenshot());
        QCOMPARE(lastReason(ignoredSpy), GestureCoordinator::IgnoredReason::NoSelection);

        provider.setFailRasterize(true);
        dragSelect(coordinator, QPointF(100, 100), QPointF(200, 150));
        QVERIFY(coordinator.captureScreenshot());
        QCOMPARE(lastReason(ignoredSpy), GestureCoordinator::IgnoredReason::CaptureFailed);
        QVERIFY(coordinator.payload().isEmpty());
    }

    void testPressBesideCentredPageIgnored() {
        FakePdfProvider provider;
        GestureCoordinator coordinator;
        coordinator.setProvider(&provider);
        coordinator.setViewState(viewAt(0, 1.0, QPointF(-40, -10)));

        coordinator.pagePointerPressed(QPointF(10, 5));
        QVERIFY(coordinator.selection().isIdle());

        // Drags may leave the page; the far corner is clamped
        coordinator.pagePointerPressed(QPointF(540, 700));
        coordinator.pagePointerReleased(QPointF(900, 900));
        QVERIFY(coordinator.selection().isCommitted());
        QCOMPARE(coordinator.selection().rect, QRectF(QPointF(500, 690), QPointF(612, 792)));
    }

    void testNewDocumentResets() {
        FakePdfProvider first;
        FakePdfProvider second;
        RecordingSurface surface;
        GestureCoordinator coordinator;
        coordinator.setProvider(&first);
        coordinator.setRichTextSurface(&surface);
        coordinator.setViewState(viewAt(0, 1.0));

        dragSelect(coordinator, QPointF(100, 100), QPointF(200, 150));
        QVERIFY(coordinator.captureScreenshot());
        QVERIFY(coordinator.paste());

        const quint64 generation = coordinator.generation();
        coordinator.setProvider(&second);
        QVERIFY(coordinator.selection().isIdle());
        QVERIFY(!coordinator.isPlacementActive());
        QVERIFY(coordinator.generation() > generation);
        QVERIFY(surface.images.isEmpty());
    }
};

inline int runGestureCoordinatorTests() {
    GestureCoordinatorTests tests;
    return QTest::qExec(&tests);
}

#endif // GESTURECOORDINATORTESTS_H
