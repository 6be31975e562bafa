#pragma once

#include "KeyValueStore.hpp"

#include <QHash>
#include <QString>

// KeyValueStore kept in a single JSON file shared by every running kinora.
// Each read and write starts from what is on disk, and every write rewrites
// the file atomically.
class JsonFileStore : public KeyValueStore
{
public:
    explicit JsonFileStore(const QString &filePath = QString());

    void setFilePath(const QString &filePath) noexcept;
    inline const QString &filePath() const noexcept
    {
        return m_file_path;
    }

    bool load() noexcept;

    std::optional<QByteArray> value(const QString &key) const noexcept override;
    bool setValue(const QString &key, const QByteArray &value) noexcept override;
    bool remove(const QString &key) noexcept override;

private:
    bool readFile(QHash<QString, QByteArray> &values) const noexcept;
    void refresh() const noexcept;
    bool save() const noexcept;

    QString m_file_path;
    // Last good copy of the file, kept when the file turns unreadable
    mutable QHash<QString, QByteArray> m_values;
};
