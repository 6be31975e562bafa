#pragma once

#include "SecureFileReference.hpp"

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QUuid>
#include <optional>

class RecentEntry
{
public:
    RecentEntry() = default;
    RecentEntry(const QUuid &id, SecureFileReference fileRef,
                const QString &displayName,
                const QDateTime &lastWatched) noexcept;

    // Mints a reference for `path`. An empty `displayName` falls back to the
    // file name, an invalid `lastWatched` to the current time.
    static std::optional<RecentEntry>
    fromPath(const QString &path, const QString &displayName = QString(),
             const QDateTime &lastWatched = QDateTime(),
             ReferenceError *error = nullptr) noexcept;

    inline const QUuid &id() const noexcept
    {
        return m_id;
    }

    inline const SecureFileReference &fileRef() const noexcept
    {
        return m_file_ref;
    }

    inline const QString &displayName() const noexcept
    {
        return m_display_name;
    }

    inline const QDateTime &lastWatched() const noexcept
    {
        return m_last_watched;
    }

    inline void setDisplayName(const QString &name) noexcept
    {
        m_display_name = name;
    }

    void setLastWatched(const QDateTime &when) noexcept;

    inline bool isValid() const noexcept
    {
        return !m_id.isNull() && !m_file_ref.isNull();
    }

    // Same id, or both references resolve to the same file
    bool isSameItem(const RecentEntry &other) const noexcept;

    QJsonObject toJson() const;
    static std::optional<RecentEntry> fromJson(const QJsonObject &obj) noexcept;

private:
    QUuid m_id;
    SecureFileReference m_file_ref;
    QString m_display_name;
    QDateTime m_last_watched;
};

inline bool
operator==(const RecentEntry &a, const RecentEntry &b)
{
    return a.id() == b.id() && a.fileRef() == b.fileRef()
           && a.displayName() == b.displayName()
           && a.lastWatched() == b.lastWatched();
}
