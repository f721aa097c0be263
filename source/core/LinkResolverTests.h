#ifndef LINKRESOLVERTESTS_H
#define LINKRESOLVERTESTS_H

#include <QDir>
#include <QFile>
#include <QObject>
#include <QSet>
#include <QTemporaryDir>
#include <QTest>
#include "LinkResolver.h"

/**
 * Unit tests for LinkResolver / LinkKey.
 * Run with: pdfnotes --test-link
 */
class LinkResolverTests : public QObject {
    Q_OBJECT

private slots:
    void testDeterministic() {
        const LinkKey a = LinkResolver::resolve("/home/user/papers/paper.pdf");
        const LinkKey b = LinkResolver::resolve("/home/user/papers/paper.pdf");
        QVERIFY(!a.isNull());
        QCOMPARE(a, b);
        QCOMPARE(a.toString().length(), LinkKey::LENGTH);
        QCOMPARE(a.shortForm().length(), LinkKey::SHORT_LENGTH);
        QVERIFY(a.toString().startsWith(a.shortForm()));
    }

    void testEquivalentSpellings() {
        QCOMPARE(LinkResolver::resolve("/home/user/papers/./paper.pdf"),
                 LinkResolver::resolve("/home/user/papers/paper.pdf"));
        QCOMPARE(LinkResolver::resolve("/home/user/notes/../papers/paper.pdf"),
                 LinkResolver::resolve("/home/user/papers/paper.pdf"));
    }

    void testRelativePathIsAbsolutized() {
        const QString relative = "some-relative-file.pdf";
        QCOMPARE(LinkResolver::resolve(relative),
                 LinkResolver::resolve(QDir::current().absoluteFilePath(relative)));
    }

    void testSymlinkResolvesToTarget() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        const QString target = dir.filePath("real.pdf");
        QFile file(target);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("%PDF-1.4\n");
        file.close();

        const QString link = dir.filePath("alias.pdf");
        if (!QFile::link(target, link)) {
            QSKIP("Symlinks not supported here");
        }
        QCOMPARE(LinkResolver::resolve(link), LinkResolver::resolve(target));
    }

    void testEmptyPath() {
        QVERIFY(LinkResolver::resolve(QString()).isNull());
        QVERIFY(LinkResolver::resolve("   ").isNull());
    }

    void testNoCollisions() {
        QSet<QString> keys;
        const int count = 10000;
        for (int i = 0; i < count; ++i) {
            const QString path = QString("/data/set%1/chapter-%2/doc_%3.pdf")
                                     .arg(i % 17).arg(i / 17).arg(i);
            const LinkKey key = LinkResolver::resolve(path);
            QVERIFY(!key.isNull());
            keys.insert(key.toString());
        }
        QCOMPARE(keys.size(), count);
    }

    void testFromHex() {
        const LinkKey key = LinkResolver::resolve("/tmp/a.pdf");
        QCOMPARE(LinkKey::fromHex(key.toString()), key);
        QCOMPARE(LinkKey::fromHex(key.toString().toUpper()), key);

        QVERIFY(LinkKey::fromHex("abc").isNull());
        QVERIFY(LinkKey::fromHex(QString(64, 'g')).isNull());
        QVERIFY(LinkKey::fromHex(QString()).isNull());
    }
};

inline int runLinkResolverTests() {
    LinkResolverTests tests;
    return QTest::qExec(&tests);
}

#endif // LINKRESOLVERTESTS_H
