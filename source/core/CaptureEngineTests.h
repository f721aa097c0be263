#ifndef CAPTUREENGINETESTS_H
#define CAPTUREENGINETESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include "CaptureEngine.h"
#include "TestFakes.h"

/**
 * Unit tests for CaptureEngine (sync and worker-thread paths).
 * Run with: pdfnotes --test-capture
 */
class CaptureEngineTests : public QObject {
    Q_OBJECT

private:
    static SelectionState committed(const QPointF& a, const QPointF& b)
    {
        SelectionTracker tracker;
        tracker.pointerDown(a);
        tracker.pointerUp(b);
        return tracker.state();
    }

    static ViewState viewAt(qreal zoom, int page = 0)
    {
        ViewState view;
        view.pageIndex = page;
        view.zoom = zoom;
        view.pageSize = QSizeF(612, 792);
        return view;
    }

    static ClipboardPayload payloadAt(const QSignalSpy& spy, int index)
    {
        return spy.at(index).at(0).value<ClipboardPayload>();
    }

    static CaptureRequest requestAt(const QSignalSpy& spy, int index)
    {
        return spy.at(index).at(1).value<CaptureRequest>();
    }

private slots:
    void initTestCase() {
        qRegisterMetaType<ClipboardPayload>();
        qRegisterMetaType<CaptureRequest>();
    }

    void testScreenshotSync() {
        FakePdfProvider provider;
        CaptureEngine engine;
        engine.setProvider(&provider);
        QSignalSpy spy(&engine, &CaptureEngine::captureFinished);

        QVERIFY(engine.captureScreenshot(committed(QPointF(100, 100), QPointF(200, 150)),
                                         viewAt(1.0), 7));
        QCOMPARE(spy.count(), 1);

        ClipboardPayload payload = payloadAt(spy, 0);
        QVERIFY(payload.isImage());
        QCOMPARE(payload.image.size(), QSize(100, 50));
        QCOMPARE(requestAt(spy, 0).generation, quint64(7));
        QVERIFY(!engine.isBusy());
    }

    void testScreenshotScalesWithZoom() {
        FakePdfProvider provider;
        CaptureEngine engine;
        engine.setProvider(&provider);
        QSignalSpy spy(&engine, &CaptureEngine::captureFinished);

        QVERIFY(engine.captureScreenshot(committed(QPointF(100, 100), QPointF(200, 150)),
                                         viewAt(2.0), 1));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(payloadAt(spy, 0).image.size(), QSize(200, 100));
    }

    void testTextCapture() {
        FakePdfProvider provider;
        provider.addText(0, QRectF(110, 110, 40, 12), "Hello");
        provider.addText(0, QRectF(400, 400, 40, 12), "Elsewhere");
        provider.addText(1, QRectF(110, 110, 40, 12), "OtherPage");

        CaptureEngine engine;
        engine.setProvider(&provider);
        QSignalSpy spy(&engine, &CaptureEngine::captureFinished);

        QVERIFY(engine.captureText(committed(QPointF(100, 100), QPointF(200, 150)), viewAt(1.0), 1));
        QCOMPARE(spy.count(), 1);

        ClipboardPayload payload = payloadAt(spy, 0);
        QVERIFY(payload.isText());
        QCOMPARE(payload.text, QString("Hello"));
    }

    void testNoTextGivesEmptyTextPayload() {
        FakePdfProvider provider;
        CaptureEngine engine;
        engine.setProvider(&provider);
        QSignalSpy spy(&engine, &CaptureEngine::captureFinished);

        QVERIFY(engine.captureText(committed(QPointF(10, 10), QPointF(60, 60)), viewAt(1.0), 1));
        QCOMPARE(spy.count(), 1);
        QVERIFY(payloadAt(spy, 0).isText());
        QVERIFY(payloadAt(spy, 0).text.isEmpty());
    }

    void testRejectsWithoutCommittedSelection() {
        FakePdfProvider provider;
        CaptureEngine engine;
        engine.setProvider(&provider);
        QSignalSpy spy(&engine, &CaptureEngine::captureFinished);

        SelectionTracker dragging;
        dragging.pointerDown(QPointF(10, 10));
        dragging.pointerMove(QPointF(100, 100));

        QVERIFY(!engine.captureScreenshot(SelectionState(), viewAt(1.0), 1));
        QVERIFY(!engine.captureText(dragging.state(), viewAt(1.0), 1));
        QCOMPARE(spy.count(), 0);
        QCOMPARE(provider.rasterizeCalls(), 0);
    }

    void testRejectsWithoutProvider() {
        CaptureEngine engine;
        QSignalSpy spy(&engine, &CaptureEngine::captureFinished);
        QVERIFY(!engine.captureScreenshot(committed(QPointF(0, 0), QPointF(50, 50)), viewAt(1.0), 1));
        QCOMPARE(spy.count(), 0);
    }

    void testClampsToPage() {
        FakePdfProvider provider(1, QSizeF(200, 200));
        CaptureEngine engine;
        engine.setProvider(&provider);
        QSignalSpy spy(&engine, &CaptureEngine::captureFinished);

        SelectionState selection;
        selection.phase = SelectionState::Phase::Committed;
        selection.rect = QRectF(150, 150, 100, 100);

        QVERIFY(engine.captureScreenshot(selection, viewAt(1.0), 1));
        QCOMPARE(provider.lastRasterRect(), QRectF(150, 150, 50, 50));
        QCOMPARE(requestAt(spy, 0).docRect, QRectF(150, 150, 50, 50));
        QCOMPARE(payloadAt(spy, 0).image.size(), QSize(50, 50));
    }

    void testRasterFailureGivesEmptyPayload() {
        FakePdfProvider provider;
        provider.setFailRasterize(true);
        CaptureEngine engine;
        engine.setProvider(&provider);
        QSignalSpy spy(&engine, &CaptureEngine::captureFinished);

        QVERIFY(engine.captureScreenshot(committed(QPointF(0, 0), QPointF(50, 50)), viewAt(1.0), 1));
        QCOMPARE(spy.count(), 1);
        QVERIFY(payloadAt(spy, 0).isEmpty());
    }

    void testLargeRegionRunsOnWorker() {
        FakePdfProvider provider;
        CaptureEngine engine;
        engine.setProvider(&provider);
        engine.setProviderFactory([](const QString&) {
            return std::unique_ptr<PdfProvider>(new FakePdfProvider());
        });
        engine.setAsyncPixelThreshold(0);
        QSignalSpy spy(&engine, &CaptureEngine::captureFinished);

        QVERIFY(engine.captureScreenshot(committed(QPointF(0, 0), QPointF(300, 200)), viewAt(1.0), 3));
        QVERIFY(engine.isBusy());
        QCOMPARE(spy.count(), 0);

        // One request at a time
        QVERIFY(!engine.captureText(committed(QPointF(0, 0), QPointF(300, 200)), viewAt(1.0), 3));

        QVERIFY(spy.wait(5000));
        QCOMPARE(spy.count(), 1);
        QVERIFY(!engine.isBusy());
        QCOMPARE(payloadAt(spy, 0).image.size(), QSize(300, 200));
        QCOMPARE(requestAt(spy, 0).generation, quint64(3));

        // The main-thread provider was not touched
        QCOMPARE(provider.rasterizeCalls(), 0);
    }

    void testWorkerWithoutProvider() {
        FakePdfProvider provider;
        CaptureEngine engine;
        engine.setProvider(&provider);
        engine.setProviderFactory([](const QString&) { return std::unique_ptr<PdfProvider>(); });
        engine.setAsyncPixelThreshold(0);
        QSignalSpy spy(&engine, &CaptureEngine::captureFinished);

        QVERIFY(engine.captureScreenshot(committed(QPointF(0, 0), QPointF(100, 100)), viewAt(1.0), 1));
        QVERIFY(spy.wait(5000));
        QVERIFY(payloadAt(spy, 0).isEmpty());
    }

    void testPixelArea() {
        CaptureRequest request;
        request.docRect = QRectF(0, 0, 100, 50);
        request.zoom = 2.0;
        QCOMPARE(request.pixelArea(), 20000.0);
    }
};

inline int runCaptureEngineTests() {
    CaptureEngineTests tests;
    return QTest::qExec(&tests);
}

#endif // CAPTUREENGINETESTS_H
