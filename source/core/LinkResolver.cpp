#include "LinkResolver.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

LinkKey LinkKey::fromHex(const QString& hex)
{
    static const QRegularExpression hexPattern(QStringLiteral("^[0-9a-f]{64}$"));
    const QString lower = hex.trimmed().toLower();
    if (!hexPattern.match(lower).hasMatch()) {
        return LinkKey();
    }
    return LinkKey(lower);
}

QString LinkResolver::normalizePath(const QString& path)
{
    if (path.trimmed().isEmpty()) {
        return QString();
    }

    QFileInfo info(path);
    if (info.exists()) {
        const QString canonical = info.canonicalFilePath();
        if (!canonical.isEmpty()) {
            return canonical;
        }
    }
    return QDir::cleanPath(info.absoluteFilePath());
}

LinkKey LinkResolver::resolve(const QString& path)
{
    const QString normalized = normalizePath(path);
    if (normalized.isEmpty()) {
        return LinkKey();
    }

    QByteArray hash = QCryptographicHash::hash(normalized.toUtf8(), QCryptographicHash::Sha256);
    return LinkKey(QString::fromLatin1(hash.toHex()));
}
