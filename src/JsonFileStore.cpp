#include "JsonFileStore.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

JsonFileStore::JsonFileStore(const QString &filePath) : m_file_path(filePath)
{
}

void
JsonFileStore::setFilePath(const QString &filePath) noexcept
{
    m_file_path = filePath;
}

// Reads the backing file. A missing file is an empty store; an unreadable
// or corrupt one also leaves the store empty but reports failure.
bool
JsonFileStore::load() noexcept
{
    m_values.clear();
    return readFile(m_values);
}

bool
JsonFileStore::readFile(QHash<QString, QByteArray> &values) const noexcept
{
    if (m_file_path.isEmpty())
        return false;

    if (!QFile::exists(m_file_path))
    {
        values.clear();
        return true;
    }

    QFile file(m_file_path);
    if (!file.open(QIODevice::ReadOnly))
        return false;

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject())
        return false;

    QHash<QString, QByteArray> parsed;
    const QJsonObject object = doc.object().value("values").toObject();
    for (auto it = object.constBegin(); it != object.constEnd(); ++it)
    {
        if (!it.value().isString())
            continue;
        parsed.insert(it.key(),
                      QByteArray::fromBase64(it.value().toString().toLatin1()));
    }

    values = std::move(parsed);
    return true;
}

// Picks up writes made by other processes since the last read
void
JsonFileStore::refresh() const noexcept
{
    QHash<QString, QByteArray> current;
    if (readFile(current))
        m_values = std::move(current);
#ifndef NDEBUG
    else if (!m_file_path.isEmpty())
        qDebug() << "Keeping cached state, cannot read" << m_file_path;
#endif
}

std::optional<QByteArray>
JsonFileStore::value(const QString &key) const noexcept
{
    refresh();

    auto it = m_values.constFind(key);
    if (it == m_values.constEnd())
        return std::nullopt;
    return it.value();
}

bool
JsonFileStore::setValue(const QString &key, const QByteArray &value) noexcept
{
    const std::optional<QByteArray> previous = this->value(key);
    m_values.insert(key, value);
    if (save())
        return true;

    // Keep memory in step with what is on disk
    if (previous)
        m_values.insert(key, *previous);
    else
        m_values.remove(key);
    return false;
}

bool
JsonFileStore::remove(const QString &key) noexcept
{
    const std::optional<QByteArray> previous = value(key);
    if (!previous)
        return true;

    m_values.remove(key);
    if (save())
        return true;

    m_values.insert(key, *previous);
    return false;
}

bool
JsonFileStore::save() const noexcept
{
    if (m_file_path.isEmpty())
        return false;

    const QDir dir = QFileInfo(m_file_path).absoluteDir();
    if (!dir.exists() && !dir.mkpath("."))
        return false;

    QJsonObject values;
    for (auto it = m_values.constBegin(); it != m_values.constEnd(); ++it)
        values.insert(it.key(), QString::fromLatin1(it.value().toBase64()));

    QJsonObject root;
    root.insert("version", 1);
    root.insert("values", values);

    QSaveFile file(m_file_path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return file.commit();
}
