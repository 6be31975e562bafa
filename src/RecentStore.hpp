#pragma once

#include "KeyValueStore.hpp"
#include "RecentEntry.hpp"

#include <QByteArray>
#include <QDateTime>
#include <QMutex>
#include <QString>
#include <functional>
#include <optional>
#include <vector>

enum class StoreError
{
    None = 0,
    SerializationFailed,
    WriteFailed,
};

const char *
storeErrorString(StoreError error) noexcept;

// Most recently watched first
using RecentList = std::vector<RecentEntry>;

// Owns every change to the persisted list of recently watched videos. Each
// call reads from the backing store, applies its change and writes the
// result back before returning.
class RecentStore
{
public:
    static constexpr int MAX_ENTRIES = 10;
    static constexpr const char *STORAGE_KEY = "recentVideos";

    using Clock = std::function<QDateTime()>;

    // `store` is not owned and must outlive this object
    explicit RecentStore(KeyValueStore *store, Clock clock = {}) noexcept;

    RecentList load() const noexcept;
    StoreError save(const RecentList &list) noexcept;
    RecentList addOrPromote(const RecentEntry &entry) noexcept;
    RecentList remove(RecentList list, int index) noexcept;
    RecentList clear() noexcept;

    void setMaxEntries(int maxEntries) noexcept;
    inline int maxEntries() const noexcept
    {
        return m_max_entries;
    }

    static QByteArray serialize(const RecentList &list,
                                StoreError *error = nullptr) noexcept;
    static std::optional<RecentList>
    deserialize(const QByteArray &bytes) noexcept;

private:
    struct ResolvedEntry
    {
        RecentEntry entry;
        QString path;
    };

    std::vector<ResolvedEntry> loadResolved() const noexcept;
    StoreError saveUnlocked(const RecentList &list) noexcept;
    void normalize(RecentList &list) const noexcept;
    static void removeDuplicateIds(RecentList &list) noexcept;

    KeyValueStore *m_store{nullptr};
    Clock m_clock;
    int m_max_entries{MAX_ENTRIES};
    mutable QMutex m_mutex;
};
