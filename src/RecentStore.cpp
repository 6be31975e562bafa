#include "RecentStore.hpp"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QMutexLocker>
#include <QSet>
#include <algorithm>

RecentStore::RecentStore(KeyValueStore *store, Clock clock) noexcept
    : m_store(store), m_clock(std::move(clock))
{
    if (!m_clock)
        m_clock = []() { return QDateTime::currentDateTimeUtc(); };
}

void
RecentStore::setMaxEntries(int maxEntries) noexcept
{
    QMutexLocker locker(&m_mutex);
    m_max_entries = std::clamp(maxEntries, 1, MAX_ENTRIES);
}

RecentList
RecentStore::load() const noexcept
{
    QMutexLocker locker(&m_mutex);

    RecentList list;
    for (ResolvedEntry &resolved : loadResolved())
        list.push_back(std::move(resolved.entry));
    return list;
}

StoreError
RecentStore::save(const RecentList &list) noexcept
{
    QMutexLocker locker(&m_mutex);
    return saveUnlocked(list);
}

RecentList
RecentStore::addOrPromote(const RecentEntry &entry) noexcept
{
    QMutexLocker locker(&m_mutex);

    std::vector<ResolvedEntry> current = loadResolved();

    // Resolve the incoming entry once; stored entries were resolved by the
    // load above.
    const std::optional<ResolvedFile> target = entry.fileRef().resolve();
    const QString targetPath = target ? target->path : QString();

    auto match = std::find_if(current.begin(), current.end(),
                              [&](const ResolvedEntry &existing)
    {
        return existing.entry.id() == entry.id()
               || (!targetPath.isEmpty() && existing.path == targetPath);
    });

    RecentList list;
    list.reserve(current.size() + 1);

    if (match != current.end())
    {
        RecentEntry promoted = match->entry;
        promoted.setLastWatched(m_clock());
        current.erase(match);
        list.push_back(std::move(promoted));
    }
    else
    {
        list.push_back(entry);
    }

    for (ResolvedEntry &resolved : current)
        list.push_back(std::move(resolved.entry));

    if (list.size() > static_cast<size_t>(m_max_entries))
        list.resize(m_max_entries);

#ifndef NDEBUG
    qDebug() << "Promoted recent video" << list.front().displayName()
             << "list size:" << list.size();
#endif

    const StoreError error = saveUnlocked(list);
    if (error != StoreError::None)
        qWarning() << "Failed to save recent videos:" << storeErrorString(error);

    return list;
}

RecentList
RecentStore::remove(RecentList list, int index) noexcept
{
    if (index < 0 || index >= static_cast<int>(list.size()))
        return list;

    list.erase(list.begin() + index);

    QMutexLocker locker(&m_mutex);
    const StoreError error = saveUnlocked(list);
    if (error != StoreError::None)
        qWarning() << "Failed to save recent videos:" << storeErrorString(error);
    return list;
}

RecentList
RecentStore::clear() noexcept
{
    QMutexLocker locker(&m_mutex);
    const StoreError error = saveUnlocked({});
    if (error != StoreError::None)
        qWarning() << "Failed to clear recent videos:"
                   << storeErrorString(error);
    return {};
}

std::vector<RecentStore::ResolvedEntry>
RecentStore::loadResolved() const noexcept
{
    std::vector<ResolvedEntry> result;

    if (!m_store)
        return result;

    const std::optional<QByteArray> bytes = m_store->value(STORAGE_KEY);
    if (!bytes)
        return result;

    std::optional<RecentList> list = deserialize(*bytes);
    if (!list)
    {
        qWarning() << "Failed to decode recent videos, starting empty";
        return result;
    }

    // The cap applies to entries that still resolve
    removeDuplicateIds(*list);

    for (RecentEntry &entry : *list)
    {
        std::optional<ResolvedFile> resolved = entry.fileRef().resolve();
        if (!resolved)
        {
#ifndef NDEBUG
            qDebug() << "Dropping unresolvable recent video"
                     << entry.displayName();
#endif
            continue;
        }

        if (resolved->stale)
            qWarning() << "Bookmark for" << entry.displayName()
                       << "is stale but resolved to" << resolved->path;

        result.push_back({std::move(entry), resolved->path});
    }

    if (result.size() > static_cast<size_t>(m_max_entries))
        result.erase(result.begin() + m_max_entries, result.end());

    return result;
}

StoreError
RecentStore::saveUnlocked(const RecentList &list) noexcept
{
    RecentList normalized = list;
    normalize(normalized);

    StoreError error{StoreError::None};
    const QByteArray bytes = serialize(normalized, &error);
    if (error != StoreError::None)
        return error;

    if (!m_store || !m_store->setValue(STORAGE_KEY, bytes))
        return StoreError::WriteFailed;

    return StoreError::None;
}

// Drops repeated ids, the first one wins
void
RecentStore::removeDuplicateIds(RecentList &list) noexcept
{
    QSet<QUuid> seen;
    auto last = std::remove_if(list.begin(), list.end(),
                               [&seen](const RecentEntry &entry)
    {
        if (seen.contains(entry.id()))
            return true;
        seen.insert(entry.id());
        return false;
    });
    list.erase(last, list.end());
}

void
RecentStore::normalize(RecentList &list) const noexcept
{
    removeDuplicateIds(list);
    if (list.size() > static_cast<size_t>(m_max_entries))
        list.resize(m_max_entries);
}

QByteArray
RecentStore::serialize(const RecentList &list, StoreError *error) noexcept
{
    if (error)
        *error = StoreError::None;

    QJsonArray array;
    for (const RecentEntry &entry : list)
    {
        if (!entry.isValid())
        {
            if (error)
                *error = StoreError::SerializationFailed;
            return {};
        }
        array.append(entry.toJson());
    }

    return QJsonDocument(array).toJson(QJsonDocument::Compact);
}

std::optional<RecentList>
RecentStore::deserialize(const QByteArray &bytes) noexcept
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray())
        return std::nullopt;

    RecentList list;
    for (const QJsonValue &value : doc.array())
    {
        if (!value.isObject())
            continue;
        std::optional<RecentEntry> entry = RecentEntry::fromJson(value.toObject());
        if (!entry)
            continue;
        list.push_back(std::move(*entry));
    }
    return list;
}

const char *
storeErrorString(StoreError error) noexcept
{
    switch (error)
    {
        case StoreError::None:
            return "no error";
        case StoreError::SerializationFailed:
            return "serialization failed";
        case StoreError::WriteFailed:
            return "write failed";
    }
    return "unknown error";
}
