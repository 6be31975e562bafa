#include "SecureFileReference.hpp"

#include <QDataStream>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QIODevice>
#include <sys/stat.h>
#include <utility>

namespace
{
constexpr quint32 BOOKMARK_MAGIC   = 0x4B4E5242; // "KNRB"
constexpr quint8 BOOKMARK_VERSION = 1;

struct FileIdentity
{
    quint64 device{0};
    quint64 inode{0};

    bool operator==(const FileIdentity &other) const noexcept
    {
        return device == other.device && inode == other.inode;
    }
};

struct Bookmark
{
    QString path;
    FileIdentity identity;
};

// Only regular files can be referenced
bool
statIdentity(const QString &path, FileIdentity *out) noexcept
{
    struct stat st;
    if (::stat(QFile::encodeName(path).constData(), &st) != 0)
        return false;
    if (!S_ISREG(st.st_mode))
        return false;
    out->device = static_cast<quint64>(st.st_dev);
    out->inode  = static_cast<quint64>(st.st_ino);
    return true;
}

QByteArray
encodeBookmark(const Bookmark &bookmark)
{
    QByteArray bytes;
    QDataStream out(&bytes, QIODevice::WriteOnly);
    out.setVersion(QDataStream::Qt_6_0);
    out << BOOKMARK_MAGIC << BOOKMARK_VERSION << bookmark.path
        << bookmark.identity.device << bookmark.identity.inode;
    return bytes;
}

bool
decodeBookmark(const QByteArray &bytes, Bookmark *out) noexcept
{
    if (bytes.isEmpty())
        return false;

    QDataStream in(bytes);
    in.setVersion(QDataStream::Qt_6_0);

    quint32 magic{0};
    quint8 version{0};
    in >> magic >> version;
    if (in.status() != QDataStream::Ok || magic != BOOKMARK_MAGIC
        || version != BOOKMARK_VERSION)
        return false;

    in >> out->path >> out->identity.device >> out->identity.inode;
    if (in.status() != QDataStream::Ok || out->path.isEmpty())
        return false;

    return true;
}

// Looks for a file with the given identity next to where it used to be.
// Covers in-place renames, which keep the inode.
QString
findRenamed(const QString &oldPath, const FileIdentity &identity) noexcept
{
    const QDir dir = QFileInfo(oldPath).absoluteDir();
    if (!dir.exists())
        return {};

    const QFileInfoList candidates
        = dir.entryInfoList(QDir::Files | QDir::Hidden | QDir::System);
    for (const QFileInfo &candidate : candidates)
    {
        FileIdentity candidateIdentity;
        if (!statIdentity(candidate.absoluteFilePath(), &candidateIdentity))
            continue;
        if (candidateIdentity == identity)
            return candidate.absoluteFilePath();
    }
    return {};
}

inline void
setError(ReferenceError *error, ReferenceError value) noexcept
{
    if (error)
        *error = value;
}
} // namespace

SecureFileReference::SecureFileReference(QByteArray bookmark) noexcept
    : m_bookmark(std::move(bookmark))
{
}

std::optional<SecureFileReference>
SecureFileReference::create(const QString &path, ReferenceError *error) noexcept
{
    setError(error, ReferenceError::Unsupported);

    if (path.isEmpty())
        return std::nullopt;

    const QFileInfo info(path);
    if (!info.exists() || !info.isFile() || !info.isReadable())
        return std::nullopt;

    Bookmark bookmark;
    bookmark.path = info.canonicalFilePath();
    if (bookmark.path.isEmpty())
        return std::nullopt;

    if (!statIdentity(bookmark.path, &bookmark.identity))
        return std::nullopt;

    setError(error, ReferenceError::None);
    return SecureFileReference(encodeBookmark(bookmark));
}

SecureFileReference
SecureFileReference::fromBookmark(const QByteArray &bytes) noexcept
{
    return SecureFileReference(bytes);
}

std::optional<ResolvedFile>
SecureFileReference::resolve(ReferenceError *error) const noexcept
{
    setError(error, ReferenceError::Unresolvable);

    Bookmark bookmark;
    if (!decodeBookmark(m_bookmark, &bookmark))
        return std::nullopt;

    ResolvedFile resolved;
    FileIdentity current;
    if (statIdentity(bookmark.path, &current))
    {
        // Same path but a different file behind it (e.g. replaced by a save)
        resolved.path  = bookmark.path;
        resolved.stale = !(current == bookmark.identity);
    }
    else
    {
        resolved.path = findRenamed(bookmark.path, bookmark.identity);
        if (resolved.path.isEmpty())
            return std::nullopt;
        resolved.stale = true;
    }

    if (!QFileInfo(resolved.path).isReadable())
        return std::nullopt;

    setError(error, ReferenceError::None);
    return resolved;
}

const char *
referenceErrorString(ReferenceError error) noexcept
{
    switch (error)
    {
        case ReferenceError::None:
            return "no error";
        case ReferenceError::Unsupported:
            return "file cannot be remembered";
        case ReferenceError::Unresolvable:
            return "file is no longer available";
    }
    return "unknown error";
}
