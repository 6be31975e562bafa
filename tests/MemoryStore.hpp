#pragma once

#include "KeyValueStore.hpp"

#include <QHash>

// In-memory KeyValueStore for tests. Writes can be made to fail.
class MemoryStore : public KeyValueStore
{
public:
    std::optional<QByteArray> value(const QString &key) const noexcept override
    {
        auto it = m_values.constFind(key);
        if (it == m_values.constEnd())
            return std::nullopt;
        return it.value();
    }

    bool setValue(const QString &key, const QByteArray &value) noexcept override
    {
        ++writes;
        if (failWrites)
            return false;
        m_values.insert(key, value);
        return true;
    }

    bool remove(const QString &key) noexcept override
    {
        ++writes;
        if (failWrites)
            return false;
        m_values.remove(key);
        return true;
    }

    bool failWrites{false};
    int writes{0};

private:
    QHash<QString, QByteArray> m_values;
};
