#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

// Persistent key-value storage injected into RecentStore
class KeyValueStore
{
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<QByteArray> value(const QString &key) const noexcept
        = 0;
    virtual bool setValue(const QString &key, const QByteArray &value) noexcept
        = 0;
    virtual bool remove(const QString &key) noexcept = 0;
};
