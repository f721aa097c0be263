#pragma once

// ============================================================================
// LinkResolver - Stable storage key for a PDF's notes
// ============================================================================
// The key is the lowercase hex SHA-256 of the normalized absolute path, so
// reopening the same file finds its notes and different files never share
// them. NotesStore uses shortForm() in file names.
// ============================================================================

#include <QString>
#include <QMetaType>

/**
 * @brief Fixed-length identifier of a source document.
 */
class LinkKey {
public:
    static constexpr int LENGTH = 64;       ///< Hex digits of SHA-256
    static constexpr int SHORT_LENGTH = 12; ///< Prefix used in file names

    LinkKey() = default;

    /**
     * @brief Wrap an existing hex key (e.g. read back from disk).
     * @return Null key if the text is not LENGTH hex digits.
     */
    static LinkKey fromHex(const QString& hex);

    bool isNull() const { return m_hex.isEmpty(); }
    QString toString() const { return m_hex; }
    QString shortForm() const { return m_hex.left(SHORT_LENGTH); }

    bool operator==(const LinkKey& other) const { return m_hex == other.m_hex; }
    bool operator!=(const LinkKey& other) const { return m_hex != other.m_hex; }

private:
    explicit LinkKey(const QString& hex) : m_hex(hex) {}

    QString m_hex;

    friend class LinkResolver;
};

inline size_t qHash(const LinkKey& key, size_t seed = 0)
{
    return qHash(key.toString(), seed);
}

Q_DECLARE_METATYPE(LinkKey)

class LinkResolver {
public:
    /**
     * @brief Derive the key for a document path.
     * @param path Absolute or relative file path.
     * @return Key of the normalized path; null key for an empty path.
     */
    static LinkKey resolve(const QString& path);

    /**
     * @brief Normalize a path: absolute, cleaned, symlinks resolved when
     * the file exists.
     */
    static QString normalizePath(const QString& path);
};
