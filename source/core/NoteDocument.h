#ifndef NOTEDOCUMENT_H
#define NOTEDOCUMENT_H

// ============================================================================
// NoteDocument - Rich text notes attached to one PDF
// ============================================================================

#include <QDateTime>
#include <QImage>
#include <QJsonObject>
#include <QMap>
#include <QString>

struct NoteDocument {
    QString pdfPath;                ///< Normalized path of the source PDF
    QString pdfFileName;            ///< File name only, for display and file naming
    QString content;                ///< Editor HTML
    QMap<QString, QImage> images;   ///< Embedded captures, keyed by resource name
    QDateTime lastModified;

    /**
     * @brief A document is valid once it is bound to a PDF.
     */
    bool isValid() const { return !pdfPath.isEmpty(); }

    /**
     * @brief Serialize (images become base64 PNG).
     */
    QJsonObject toJson() const;

    /**
     * @brief Parse a serialized document.
     * @return Invalid document if required fields are missing.
     */
    static NoteDocument fromJson(const QJsonObject& obj);
};

#endif // NOTEDOCUMENT_H
