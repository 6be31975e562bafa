#include "RecentEntry.hpp"

#include <QDebug>
#include <QFileInfo>
#include <QJsonValue>

namespace
{
QDateTime
parseTimestamp(const QJsonValue &value)
{
    if (value.isString())
    {
        QDateTime ts
            = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
        if (ts.isValid())
            return ts.toUTC();
    }
    if (value.isDouble())
    {
        return QDateTime::fromMSecsSinceEpoch(
                   static_cast<qint64>(value.toDouble()))
            .toUTC();
    }
    return {};
}
} // namespace

RecentEntry::RecentEntry(const QUuid &id, SecureFileReference fileRef,
                         const QString &displayName,
                         const QDateTime &lastWatched) noexcept
    : m_id(id), m_file_ref(std::move(fileRef)), m_display_name(displayName),
      m_last_watched(lastWatched.toUTC())
{
}

std::optional<RecentEntry>
RecentEntry::fromPath(const QString &path, const QString &displayName,
                      const QDateTime &lastWatched,
                      ReferenceError *error) noexcept
{
    ReferenceError refError{ReferenceError::None};
    std::optional<SecureFileReference> ref
        = SecureFileReference::create(path, &refError);
    if (error)
        *error = refError;
    if (!ref)
    {
        qWarning() << "Error creating durable reference for" << path << ":"
                   << referenceErrorString(refError);
        return std::nullopt;
    }

    const QString name = displayName.isEmpty() ? QFileInfo(path).fileName()
                                               : displayName;
    const QDateTime when = lastWatched.isValid()
                               ? lastWatched
                               : QDateTime::currentDateTimeUtc();

    return RecentEntry(QUuid::createUuid(), std::move(*ref), name, when);
}

void
RecentEntry::setLastWatched(const QDateTime &when) noexcept
{
    m_last_watched = when.toUTC();
}

bool
RecentEntry::isSameItem(const RecentEntry &other) const noexcept
{
    if (m_id == other.m_id)
        return true;

    const std::optional<ResolvedFile> a = m_file_ref.resolve();
    if (!a)
        return false;

    const std::optional<ResolvedFile> b = other.m_file_ref.resolve();
    return b && a->path == b->path;
}

QJsonObject
RecentEntry::toJson() const
{
    QJsonObject obj;
    obj.insert("id", m_id.toString(QUuid::WithoutBraces));
    obj.insert("urlData", QString::fromLatin1(m_file_ref.bookmark().toBase64()));
    obj.insert("name", m_display_name);
    obj.insert("lastWatchedDate",
               m_last_watched.toUTC().toString(Qt::ISODateWithMs));
    return obj;
}

std::optional<RecentEntry>
RecentEntry::fromJson(const QJsonObject &obj) noexcept
{
    const QUuid id = QUuid::fromString(obj.value("id").toString());
    if (id.isNull())
        return std::nullopt;

    const QByteArray bookmark
        = QByteArray::fromBase64(obj.value("urlData").toString().toLatin1());
    if (bookmark.isEmpty())
        return std::nullopt;

    QDateTime lastWatched = parseTimestamp(obj.value("lastWatchedDate"));
    if (!lastWatched.isValid())
        lastWatched = QDateTime::fromMSecsSinceEpoch(0).toUTC();

    return RecentEntry(id, SecureFileReference::fromBookmark(bookmark),
                       obj.value("name").toString(), lastWatched);
}
