// ============================================================================
// JsonNotesStore - Implementation
// ============================================================================

#include "NotesStore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QSaveFile>
#include <QStandardPaths>

static const char* const kNotesSuffix = ".notes.json";

JsonNotesStore::JsonNotesStore(const QString& directory)
    : m_directory(directory.isEmpty() ? defaultDirectory() : directory)
{
}

QString JsonNotesStore::defaultDirectory()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + "/notes";
}

QString JsonNotesStore::fileNameFor(const LinkKey& key, const QString& pdfFileName)
{
    QString stem = QFileInfo(pdfFileName).completeBaseName();
    // Keep names portable
    stem.replace(QRegularExpression(QStringLiteral("[^A-Za-z0-9._-]")), QStringLiteral("_"));
    if (stem.isEmpty()) {
        stem = QStringLiteral("document");
    }
    return stem + "_" + key.shortForm() + kNotesSuffix;
}

bool JsonNotesStore::ensureDirectory() const
{
    QDir dir(m_directory);
    if (!dir.exists() && !dir.mkpath(".")) {
        qWarning() << "JsonNotesStore: Failed to create" << m_directory;
        return false;
    }
    QFile::setPermissions(m_directory, QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
    return true;
}

LinkKey JsonNotesStore::storedKey(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "JsonNotesStore: Failed to open" << path << file.errorString();
        return LinkKey();
    }

    QJsonParseError parseError;
    QJsonDocument json = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !json.isObject()) {
        qWarning() << "JsonNotesStore: JSON parse error in" << path << parseError.errorString();
        return LinkKey();
    }
    return LinkKey::fromHex(json.object().value("link_key").toString());
}

QString JsonNotesStore::findFile(const LinkKey& key) const
{
    QDir dir(m_directory);
    if (key.isNull() || !dir.exists()) {
        return QString();
    }

    // The short form can collide; only a file holding the full key counts
    const QStringList matches = dir.entryList(
        QStringList() << ("*_" + key.shortForm() + kNotesSuffix), QDir::Files, QDir::Name);
    for (const QString& name : matches) {
        const QString path = dir.filePath(name);
        if (storedKey(path) == key) {
            return path;
        }
    }
    if (!matches.isEmpty()) {
        qWarning() << "JsonNotesStore: No file among" << matches << "holds key" << key.toString();
    }
    return QString();
}

NoteDocument JsonNotesStore::load(const LinkKey& key) const
{
    const QString path = findFile(key);
    if (path.isEmpty()) {
        return NoteDocument();
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "JsonNotesStore::load: Failed to open" << path << file.errorString();
        return NoteDocument();
    }

    QJsonParseError parseError;
    QJsonDocument json = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !json.isObject()) {
        qWarning() << "JsonNotesStore::load: JSON parse error in" << path
                   << parseError.errorString();
        return NoteDocument();
    }

    QJsonObject root = json.object();

    int version = root.value("version").toInt(FORMAT_VERSION);
    if (version > FORMAT_VERSION) {
        qWarning() << "JsonNotesStore::load: Unsupported version" << version << "in" << path;
    }

    // Short form matched the file name, the full key must match too
    if (LinkKey::fromHex(root.value("link_key").toString()) != key) {
        qWarning() << "JsonNotesStore::load: Key mismatch in" << path;
        return NoteDocument();
    }

    return NoteDocument::fromJson(root);
}

bool JsonNotesStore::save(const LinkKey& key, const NoteDocument& doc)
{
    if (key.isNull() || !doc.isValid()) {
        qWarning() << "JsonNotesStore::save: Invalid key or document";
        return false;
    }
    if (!ensureDirectory()) {
        return false;
    }

    QJsonObject root = doc.toJson();
    root["version"] = FORMAT_VERSION;
    root["link_key"] = key.toString();

    const QString fileName = fileNameFor(key, doc.pdfFileName);
    const QString path = QDir(m_directory).filePath(fileName);

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "JsonNotesStore::save: Failed to open" << path << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "JsonNotesStore::save: Failed to write" << path << file.errorString();
        return false;
    }
    QFile::setPermissions(path, QFile::ReadOwner | QFile::WriteOwner);

    // A different stem for the same key (file replaced at the same path)
    // would otherwise shadow this save on the next load. Files of another
    // key that share the short form are left alone.
    QDir dir(m_directory);
    const QStringList stale = dir.entryList(
        QStringList() << ("*_" + key.shortForm() + kNotesSuffix), QDir::Files);
    for (const QString& name : stale) {
        if (name != fileName && storedKey(dir.filePath(name)) == key) {
            QFile::remove(dir.filePath(name));
        }
    }

#ifdef PDFNOTES_DEBUG
    qDebug() << "JsonNotesStore: Saved" << path;
#endif
    return true;
}

bool JsonNotesStore::exists(const LinkKey& key) const
{
    return !findFile(key).isEmpty();
}
