#include "NoteDocument.h"

#include <QBuffer>
#include <QDebug>

QJsonObject NoteDocument::toJson() const
{
    QJsonObject obj;
    obj["pdf_path"] = pdfPath;
    obj["pdf_filename"] = pdfFileName;
    obj["content"] = content;
    obj["last_modified"] = lastModified.toString(Qt::ISODate);

    QJsonObject imageObj;
    for (auto it = images.constBegin(); it != images.constEnd(); ++it) {
        QByteArray bytes;
        QBuffer buffer(&bytes);
        buffer.open(QIODevice::WriteOnly);
        if (!it.value().save(&buffer, "PNG")) {
            qWarning() << "NoteDocument::toJson: Failed to encode image" << it.key();
            continue;
        }
        buffer.close();
        imageObj[it.key()] = QString::fromLatin1(bytes.toBase64());
    }
    obj["images"] = imageObj;

    return obj;
}

NoteDocument NoteDocument::fromJson(const QJsonObject& obj)
{
    NoteDocument doc;
    doc.pdfPath = obj["pdf_path"].toString();
    if (doc.pdfPath.isEmpty()) {
        return NoteDocument();
    }

    doc.pdfFileName = obj["pdf_filename"].toString();
    doc.content = obj["content"].toString();
    doc.lastModified = QDateTime::fromString(obj["last_modified"].toString(), Qt::ISODate);

    const QJsonObject imageObj = obj["images"].toObject();
    for (auto it = imageObj.constBegin(); it != imageObj.constEnd(); ++it) {
        QImage image;
        if (!image.loadFromData(QByteArray::fromBase64(it.value().toString().toLatin1()), "PNG")) {
            qWarning() << "NoteDocument::fromJson: Dropping unreadable image" << it.key();
            continue;
        }
        doc.images.insert(it.key(), image);
    }

    return doc;
}
