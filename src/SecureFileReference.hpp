#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

enum class ReferenceError
{
    None = 0,
    Unsupported,  // no durable reference can be made for this path
    Unresolvable, // the referenced file can no longer be located
};

struct ResolvedFile
{
    QString path;
    bool stale{false}; // file moved or was replaced, re-mint when convenient
};

// Durable handle to a user-chosen file. The bookmark bytes survive process
// restarts and are turned back into a usable path with `resolve()`.
class SecureFileReference
{
public:
    SecureFileReference() = default;

    static std::optional<SecureFileReference>
    create(const QString &path, ReferenceError *error = nullptr) noexcept;

    static SecureFileReference fromBookmark(const QByteArray &bytes) noexcept;

    std::optional<ResolvedFile>
    resolve(ReferenceError *error = nullptr) const noexcept;

    inline const QByteArray &bookmark() const noexcept
    {
        return m_bookmark;
    }

    inline bool isNull() const noexcept
    {
        return m_bookmark.isEmpty();
    }

    inline bool operator==(const SecureFileReference &other) const noexcept
    {
        return m_bookmark == other.m_bookmark;
    }

private:
    explicit SecureFileReference(QByteArray bookmark) noexcept;

    QByteArray m_bookmark;
};

const char *
referenceErrorString(ReferenceError error) noexcept;
