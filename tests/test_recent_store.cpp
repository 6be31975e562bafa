#include "MemoryStore.hpp"
#include "RecentStore.hpp"

#include <gtest/gtest.h>

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

namespace {

    class RecentStoreTest : public ::testing::Test {
    protected:
        void SetUp() override {
            ASSERT_TRUE(dir.isValid());
        }

        QString makeFile(const QString& name) {
            const QString path = dir.filePath(name);
            QFile file(path);
            EXPECT_TRUE(file.open(QIODevice::WriteOnly));
            file.write(name.toUtf8());
            file.close();
            return path;
        }

        RecentEntry makeEntry(const QString& name) {
            const QString path = QFile::exists(dir.filePath(name)) ? dir.filePath(name) : makeFile(name);
            auto entry = RecentEntry::fromPath(path, QString(), now);
            EXPECT_TRUE(entry.has_value());
            return entry.value_or(RecentEntry());
        }

        void tick() {
            now = now.addMSecs(1000);
        }

        QByteArray storedBytes() const {
            return memory.value(RecentStore::STORAGE_KEY).value_or(QByteArray());
        }

        QTemporaryDir dir;
        MemoryStore memory;
        QDateTime now = QDateTime::fromString("2026-01-01T00:00:00.000Z", Qt::ISODateWithMs);
        RecentStore store{&memory, [this]() { return now; }};
    };

    bool sameFile(const RecentEntry& entry, const QString& path) {
        auto resolved = entry.fileRef().resolve();
        return resolved && resolved->path == QFileInfo(path).canonicalFilePath();
    }

} // namespace

// ============================================================================
// Scenarios
// ============================================================================

TEST_F(RecentStoreTest, EmptyStoreLoadsEmptyList) {
    EXPECT_TRUE(store.load().empty());
}

TEST_F(RecentStoreTest, ReaddingFilePromotesItToFront) {
    const RecentEntry a = makeEntry("a.mp4");
    store.addOrPromote(a);
    tick();
    store.addOrPromote(makeEntry("b.mp4"));
    tick();

    // A fresh selection of the same file mints a new entry with a new id
    const RecentEntry againA = makeEntry("a.mp4");
    ASSERT_NE(againA.id(), a.id());
    tick();
    const QDateTime promotedAt = now;
    const RecentList returned = store.addOrPromote(againA);

    const RecentList list = store.load();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(returned, list);
    EXPECT_EQ(list[0].id(), a.id());
    EXPECT_TRUE(sameFile(list[0], dir.filePath("a.mp4")));
    EXPECT_TRUE(sameFile(list[1], dir.filePath("b.mp4")));
    EXPECT_EQ(list[0].lastWatched(), promotedAt);
}

TEST_F(RecentStoreTest, ElevenFilesKeepTheNewestTen) {
    for (int i = 0; i < 11; ++i) {
        store.addOrPromote(makeEntry(QString("clip%1.mp4").arg(i)));
        tick();
    }

    const RecentList list = store.load();
    ASSERT_EQ(list.size(), 10u);
    EXPECT_TRUE(sameFile(list.front(), dir.filePath("clip10.mp4")));
    EXPECT_TRUE(sameFile(list.back(), dir.filePath("clip1.mp4")));
    for (const RecentEntry& entry : list)
        EXPECT_FALSE(sameFile(entry, dir.filePath("clip0.mp4")));
}

TEST_F(RecentStoreTest, DeletedFileIsDroppedAndStaysDropped) {
    store.addOrPromote(makeEntry("a.mp4"));
    store.addOrPromote(makeEntry("b.mp4"));
    ASSERT_EQ(QJsonDocument::fromJson(storedBytes()).array().size(), 2);

    ASSERT_TRUE(QFile::remove(dir.filePath("a.mp4")));

    const RecentList cleaned = store.load();
    ASSERT_EQ(cleaned.size(), 1u);
    EXPECT_TRUE(sameFile(cleaned[0], dir.filePath("b.mp4")));

    ASSERT_EQ(store.save(cleaned), StoreError::None);
    EXPECT_EQ(QJsonDocument::fromJson(storedBytes()).array().size(), 1);

    // Even once a file shows up again under the old name
    makeFile("a.mp4");
    EXPECT_EQ(store.load().size(), 1u);
}

// ============================================================================
// Properties
// ============================================================================

TEST_F(RecentStoreTest, CapHoldsAfterEveryAdd) {
    for (int i = 0; i < 30; ++i) {
        // Revisit some earlier files along the way
        const int n = (i % 4 == 3) ? i / 2 : i;
        store.addOrPromote(makeEntry(QString("v%1.mp4").arg(n)));
        tick();
        EXPECT_LE(store.load().size(), static_cast<size_t>(RecentStore::MAX_ENTRIES));
    }
}

TEST_F(RecentStoreTest, PromotingNeverGrowsTheList) {
    store.addOrPromote(makeEntry("a.mp4"));
    store.addOrPromote(makeEntry("b.mp4"));
    store.addOrPromote(makeEntry("c.mp4"));
    const RecentList before = store.load();
    ASSERT_EQ(before.size(), 3u);

    tick();
    const RecentList after = store.addOrPromote(makeEntry("b.mp4"));
    ASSERT_EQ(after.size(), 3u);
    EXPECT_EQ(after[0].id(), before[1].id());
    EXPECT_EQ(after[0].lastWatched(), now);
    EXPECT_EQ(after[1].id(), before[0].id());
    EXPECT_EQ(after[2].id(), before[2].id());
}

TEST_F(RecentStoreTest, LastAddedIsAlwaysFirst) {
    const QStringList names{"a.mp4", "b.mp4", "a.mp4", "c.mp4", "b.mp4", "b.mp4"};
    for (const QString& name : names) {
        const RecentEntry entry = makeEntry(name);
        store.addOrPromote(entry);
        tick();
        const RecentList list = store.load();
        ASSERT_FALSE(list.empty());
        EXPECT_TRUE(list[0].isSameItem(entry)) << name.toStdString();
    }
}

TEST_F(RecentStoreTest, SaveThenLoadReturnsTheSameList) {
    RecentList list;
    for (int i = 0; i < 5; ++i) {
        RecentEntry entry = makeEntry(QString("r%1.mp4").arg(i));
        entry.setDisplayName(QString("Episode %1").arg(i));
        entry.setLastWatched(now.addSecs(-60 * i));
        list.push_back(entry);
    }

    ASSERT_EQ(store.save(list), StoreError::None);
    EXPECT_EQ(store.load(), list);
}

TEST_F(RecentStoreTest, StaleEntryIsKept) {
    store.addOrPromote(makeEntry("before.mp4"));
    ASSERT_TRUE(QFile::rename(dir.filePath("before.mp4"), dir.filePath("after.mp4")));

    const RecentList list = store.load();
    ASSERT_EQ(list.size(), 1u);
    auto resolved = list[0].fileRef().resolve();
    ASSERT_TRUE(resolved.has_value());
    EXPECT_TRUE(resolved->stale);
}

TEST_F(RecentStoreTest, RenamedFileIsRecognisedWhenOpenedAgain) {
    const RecentEntry original = makeEntry("before.mp4");
    store.addOrPromote(original);
    store.addOrPromote(makeEntry("other.mp4"));
    ASSERT_TRUE(QFile::rename(dir.filePath("before.mp4"), dir.filePath("after.mp4")));

    const RecentList list = store.addOrPromote(makeEntry("after.mp4"));
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].id(), original.id());
}

// ============================================================================
// Corrupt and partial state
// ============================================================================

TEST_F(RecentStoreTest, CorruptBytesLoadAsEmpty) {
    memory.setValue(RecentStore::STORAGE_KEY, "{ this is not json");
    EXPECT_TRUE(store.load().empty());

    memory.setValue(RecentStore::STORAGE_KEY, R"({"id": "not an array"})");
    EXPECT_TRUE(store.load().empty());
}

TEST_F(RecentStoreTest, MalformedElementsAreSkipped) {
    const RecentEntry good = makeEntry("good.mp4");

    QJsonObject noId = makeEntry("noid.mp4").toJson();
    noId.remove("id");

    QJsonArray array;
    array.append(42);
    array.append(noId);
    array.append(good.toJson());
    memory.setValue(RecentStore::STORAGE_KEY, QJsonDocument(array).toJson());

    const RecentList list = store.load();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0], good);
}

TEST_F(RecentStoreTest, DuplicateIdsKeepTheFirst) {
    const RecentEntry a = makeEntry("a.mp4");
    RecentEntry copy = a;
    copy.setDisplayName("copy");

    ASSERT_EQ(store.save({a, copy, makeEntry("b.mp4")}), StoreError::None);

    const RecentList list = store.load();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].displayName(), QString("a.mp4"));
}

TEST_F(RecentStoreTest, SaveTruncatesToCap) {
    RecentList list;
    for (int i = 0; i < 12; ++i)
        list.push_back(makeEntry(QString("t%1.mp4").arg(i)));

    ASSERT_EQ(store.save(list), StoreError::None);
    EXPECT_EQ(QJsonDocument::fromJson(storedBytes()).array().size(), RecentStore::MAX_ENTRIES);
}

TEST_F(RecentStoreTest, DeadEntriesDoNotUseUpTheCap) {
    RecentList list;
    for (const char* name : {"a.mp4", "b.mp4", "c.mp4", "d.mp4", "e.mp4"})
        list.push_back(makeEntry(name));
    ASSERT_EQ(store.save(list), StoreError::None);

    ASSERT_TRUE(QFile::remove(dir.filePath("a.mp4")));
    ASSERT_TRUE(QFile::remove(dir.filePath("b.mp4")));
    store.setMaxEntries(3);

    const RecentList loaded = store.load();
    ASSERT_EQ(loaded.size(), 3u);
    EXPECT_EQ(loaded[0], list[2]);
    EXPECT_EQ(loaded[1], list[3]);
    EXPECT_EQ(loaded[2], list[4]);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(RecentStoreTest, InvalidEntryFailsSerialization) {
    EXPECT_EQ(store.save({makeEntry("a.mp4"), RecentEntry()}), StoreError::SerializationFailed);
    EXPECT_EQ(memory.writes, 0);

    StoreError error{StoreError::None};
    EXPECT_TRUE(RecentStore::serialize({RecentEntry()}, &error).isEmpty());
    EXPECT_EQ(error, StoreError::SerializationFailed);
}

TEST_F(RecentStoreTest, WriteFailureIsReported) {
    memory.failWrites = true;
    EXPECT_EQ(store.save({makeEntry("a.mp4")}), StoreError::WriteFailed);
}

TEST_F(RecentStoreTest, AddReturnsListEvenWhenWriteFails) {
    memory.failWrites = true;
    const RecentEntry a = makeEntry("a.mp4");

    const RecentList list = store.addOrPromote(a);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0], a);
    EXPECT_TRUE(store.load().empty());
}

// ============================================================================
// Remove, clear and cap
// ============================================================================

TEST_F(RecentStoreTest, RemoveErasesAndPersists) {
    store.addOrPromote(makeEntry("a.mp4"));
    store.addOrPromote(makeEntry("b.mp4"));
    store.addOrPromote(makeEntry("c.mp4"));
    const RecentList before = store.load();

    const RecentList after = store.remove(before, 1);
    ASSERT_EQ(after.size(), 2u);
    EXPECT_EQ(after[0], before[0]);
    EXPECT_EQ(after[1], before[2]);
    EXPECT_EQ(store.load(), after);
}

TEST_F(RecentStoreTest, RemoveOutOfRangeIsNoop) {
    store.addOrPromote(makeEntry("a.mp4"));
    const RecentList list = store.load();
    const int writes = memory.writes;

    EXPECT_EQ(store.remove(list, 1), list);
    EXPECT_EQ(store.remove(list, -1), list);
    EXPECT_EQ(memory.writes, writes);
    EXPECT_EQ(store.load().size(), 1u);
}

TEST_F(RecentStoreTest, ClearForgetsEverything) {
    store.addOrPromote(makeEntry("a.mp4"));
    store.addOrPromote(makeEntry("b.mp4"));

    EXPECT_TRUE(store.clear().empty());
    EXPECT_TRUE(store.load().empty());
}

TEST_F(RecentStoreTest, MaxEntriesIsClamped) {
    store.setMaxEntries(3);
    EXPECT_EQ(store.maxEntries(), 3);
    for (int i = 0; i < 5; ++i)
        store.addOrPromote(makeEntry(QString("m%1.mp4").arg(i)));
    EXPECT_EQ(store.load().size(), 3u);

    store.setMaxEntries(50);
    EXPECT_EQ(store.maxEntries(), RecentStore::MAX_ENTRIES);
    store.setMaxEntries(0);
    EXPECT_EQ(store.maxEntries(), 1);
}

TEST(StoreErrorStringTest, DescribesEveryError) {
    EXPECT_STREQ(storeErrorString(StoreError::SerializationFailed), "serialization failed");
    EXPECT_STREQ(storeErrorString(StoreError::WriteFailed), "write failed");
}
