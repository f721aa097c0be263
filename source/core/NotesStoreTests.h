#ifndef NOTESSTORETESTS_H
#define NOTESSTORETESTS_H

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QObject>
#include <QTemporaryDir>
#include <QTest>
#include "NotesStore.h"

/**
 * Unit tests for JsonNotesStore and NoteDocument.
 * Run with: pdfnotes --test-notes-store
 */
class NotesStoreTests : public QObject {
    Q_OBJECT

private:
    static NoteDocument makeNotes(const QString& pdfPath)
    {
        NoteDocument doc;
        doc.pdfPath = pdfPath;
        doc.pdfFileName = QFileInfo(pdfPath).fileName();
        doc.content = "<p>Chapter <b>one</b> <img src=\"capture-1.png\"></p>";
        doc.lastModified = QDateTime(QDate(2024, 3, 1), QTime(9, 30));

        QImage image(20, 10, QImage::Format_ARGB32);
        image.fill(QColor(10, 200, 30));
        doc.images.insert("capture-1.png", image);
        return doc;
    }

private slots:
    void testSaveAndLoad() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        JsonNotesStore store(dir.path());

        const QString pdfPath = "/home/user/papers/Deep Learning.pdf";
        const LinkKey key = LinkResolver::resolve(pdfPath);
        QVERIFY(!store.exists(key));
        QVERIFY(!store.load(key).isValid());

        QVERIFY(store.save(key, makeNotes(pdfPath)));
        QVERIFY(store.exists(key));

        const NoteDocument loaded = store.load(key);
        QVERIFY(loaded.isValid());
        QCOMPARE(loaded.pdfPath, pdfPath);
        QCOMPARE(loaded.pdfFileName, QString("Deep Learning.pdf"));
        QVERIFY(loaded.content.contains("Chapter"));
        QCOMPARE(loaded.lastModified, QDateTime(QDate(2024, 3, 1), QTime(9, 30)));
        QCOMPARE(loaded.images.size(), 1);
        QCOMPARE(loaded.images.value("capture-1.png").size(), QSize(20, 10));
        QCOMPARE(loaded.images.value("capture-1.png").pixelColor(5, 5), QColor(10, 200, 30));
    }

    void testFileNameAndFormat() {
        QTemporaryDir dir;
        JsonNotesStore store(dir.path());

        const QString pdfPath = "/home/user/papers/Deep Learning.pdf";
        const LinkKey key = LinkResolver::resolve(pdfPath);
        QVERIFY(store.save(key, makeNotes(pdfPath)));

        const QString expectedName = "Deep_Learning_" + key.shortForm() + ".notes.json";
        QCOMPARE(JsonNotesStore::fileNameFor(key, "Deep Learning.pdf"), expectedName);

        QFile file(QDir(dir.path()).filePath(expectedName));
        QVERIFY(file.open(QIODevice::ReadOnly));
        const QJsonObject root = QJsonDocument::fromJson(file.readAll()).object();
        QCOMPARE(root.value("version").toInt(), JsonNotesStore::FORMAT_VERSION);
        QCOMPARE(root.value("link_key").toString(), key.toString());
        QCOMPARE(root.value("pdf_path").toString(), pdfPath);
        QVERIFY(root.value("images").toObject().contains("capture-1.png"));
    }

    void testDistinctDocumentsKeepSeparateNotes() {
        QTemporaryDir dir;
        JsonNotesStore store(dir.path());

        const LinkKey a = LinkResolver::resolve("/a/report.pdf");
        const LinkKey b = LinkResolver::resolve("/b/report.pdf");

        NoteDocument notesA = makeNotes("/a/report.pdf");
        notesA.content = "A";
        NoteDocument notesB = makeNotes("/b/report.pdf");
        notesB.content = "B";

        QVERIFY(store.save(a, notesA));
        QVERIFY(store.save(b, notesB));
        QCOMPARE(store.load(a).content, QString("A"));
        QCOMPARE(store.load(b).content, QString("B"));
    }

    void testOverwriteReplacesOldFile() {
        QTemporaryDir dir;
        JsonNotesStore store(dir.path());
        const LinkKey key = LinkResolver::resolve("/x/book.pdf");

        NoteDocument first = makeNotes("/x/book.pdf");
        first.content = "first";
        QVERIFY(store.save(key, first));

        // Same key stored under a different stem
        NoteDocument second = makeNotes("/x/book.pdf");
        second.pdfFileName = "renamed.pdf";
        second.content = "second";
        QVERIFY(store.save(key, second));

        QCOMPARE(QDir(dir.path()).entryList(QStringList() << "*.notes.json", QDir::Files).size(), 1);
        QCOMPARE(store.load(key).content, QString("second"));
    }

    void testSharedShortFormKeepsBothNotes() {
        QTemporaryDir dir;
        JsonNotesStore store(dir.path());

        const LinkKey a = LinkResolver::resolve("/a/report.pdf");
        const LinkKey b = LinkKey::fromHex(a.shortForm() + QString(LinkKey::LENGTH - LinkKey::SHORT_LENGTH, '0'));
        QVERIFY(!b.isNull());
        QVERIFY(a != b);
        QCOMPARE(b.shortForm(), a.shortForm());

        NoteDocument notesA = makeNotes("/a/report.pdf");
        notesA.content = "A";
        NoteDocument notesB = makeNotes("/b/other.pdf");
        notesB.content = "B";

        // "other_" sorts before "report_", so a name match alone would pick B
        QVERIFY(store.save(b, notesB));
        QVERIFY(store.save(a, notesA));
        QCOMPARE(QDir(dir.path()).entryList(QStringList() << "*.notes.json", QDir::Files).size(), 2);

        QCOMPARE(store.load(a).content, QString("A"));
        QCOMPARE(store.load(b).content, QString("B"));
        QVERIFY(store.exists(a));
        QVERIFY(store.exists(b));

        // Saving B again must not touch A's file either
        QVERIFY(store.save(b, notesB));
        QCOMPARE(store.load(a).content, QString("A"));
    }

    void testKeyMismatchRejected() {
        QTemporaryDir dir;
        JsonNotesStore store(dir.path());
        const LinkKey key = LinkResolver::resolve("/x/book.pdf");
        QVERIFY(store.save(key, makeNotes("/x/book.pdf")));

        // Corrupt the stored full key, keeping the file name
        const QString path = QDir(dir.path()).filePath(JsonNotesStore::fileNameFor(key, "book.pdf"));
        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QJsonObject root = QJsonDocument::fromJson(file.readAll()).object();
        file.close();
        root["link_key"] = QString(64, 'a');
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        file.write(QJsonDocument(root).toJson());
        file.close();

        QVERIFY(!store.load(key).isValid());
    }

    void testCorruptFile() {
        QTemporaryDir dir;
        JsonNotesStore store(dir.path());
        const LinkKey key = LinkResolver::resolve("/x/book.pdf");

        QFile file(QDir(dir.path()).filePath(JsonNotesStore::fileNameFor(key, "book.pdf")));
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{ not json");
        file.close();

        QVERIFY(!store.load(key).isValid());
    }

    void testSaveRejectsInvalid() {
        QTemporaryDir dir;
        JsonNotesStore store(dir.path());
        QVERIFY(!store.save(LinkKey(), makeNotes("/x/book.pdf")));
        QVERIFY(!store.save(LinkResolver::resolve("/x/book.pdf"), NoteDocument()));
    }

    void testCreatesMissingDirectory() {
        QTemporaryDir dir;
        const QString nested = QDir(dir.path()).filePath("deep/notes");
        JsonNotesStore store(nested);
        const LinkKey key = LinkResolver::resolve("/x/book.pdf");
        QVERIFY(store.save(key, makeNotes("/x/book.pdf")));
        QVERIFY(QDir(nested).exists());
        QVERIFY(store.load(key).isValid());
    }
};

inline int runNotesStoreTests() {
    NotesStoreTests tests;
    return QTest::qExec(&tests);
}

#endif // NOTESSTORETESTS_H
