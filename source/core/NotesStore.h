#ifndef NOTESSTORE_H
#define NOTESSTORE_H

// ============================================================================
// NotesStore - Persistence of NoteDocuments keyed by LinkKey
// ============================================================================
// JsonNotesStore writes one file per PDF into a private directory:
//
//   <dir>/<pdf stem>_<key short form>.notes.json
//
//   {
//     "version": 1,
//     "link_key": "<64 hex>",
//     "pdf_path": "...", "pdf_filename": "...",
//     "content": "<html>", "images": { "<name>": "<base64 png>" },
//     "last_modified": "2024-01-01T12:00:00"
//   }
// ============================================================================

#include "LinkResolver.h"
#include "NoteDocument.h"

#include <QString>

/**
 * @brief Storage interface for notes.
 */
class NotesStore {
public:
    virtual ~NotesStore() = default;

    /**
     * @brief Load the notes for a key.
     * @return Invalid NoteDocument if none exist or they can't be read.
     */
    virtual NoteDocument load(const LinkKey& key) const = 0;

    /**
     * @brief Save notes for a key, replacing any previous version.
     * @return True on success.
     */
    virtual bool save(const LinkKey& key, const NoteDocument& doc) = 0;

    virtual bool exists(const LinkKey& key) const = 0;
};

class JsonNotesStore : public NotesStore {
public:
    static constexpr int FORMAT_VERSION = 1;

    /**
     * @param directory Storage directory; empty uses <AppDataLocation>/notes.
     */
    explicit JsonNotesStore(const QString& directory = QString());

    NoteDocument load(const LinkKey& key) const override;
    bool save(const LinkKey& key, const NoteDocument& doc) override;
    bool exists(const LinkKey& key) const override;

    QString directory() const { return m_directory; }

    /**
     * @brief File name used for a document.
     */
    static QString fileNameFor(const LinkKey& key, const QString& pdfFileName);

    static QString defaultDirectory();

private:
    /**
     * @brief Existing file for a key, or empty.
     */
    QString findFile(const LinkKey& key) const;

    /**
     * @brief Full key recorded in a notes file, or a null key if unreadable.
     */
    static LinkKey storedKey(const QString& path);
    bool ensureDirectory() const;

    QString m_directory;
};

#endif // NOTESSTORE_H
