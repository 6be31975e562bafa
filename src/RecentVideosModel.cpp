#include "RecentVideosModel.hpp"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QLocale>

RecentVideosModel::RecentVideosModel(QObject *parent)
    : QAbstractTableModel(parent), m_home_path(QDir::homePath())
{
}

int
RecentVideosModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid())
        return 0;
    return static_cast<int>(m_entries.size());
}

int
RecentVideosModel::columnCount(const QModelIndex &parent) const
{
    if (parent.isValid())
        return 0;
    return ColumnType::COUNT;
}

QVariant
RecentVideosModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid())
        return {};

    if (index.row() < 0 || index.row() >= rowCount())
        return {};

    const RecentEntry &entry = m_entries.at(index.row());
    const QString &path      = m_paths.at(index.row());

    if (role == Qt::DisplayRole)
    {
        switch (index.column())
        {
            case ColumnType::Name:
                return entry.displayName();
            case ColumnType::Location:
                return displayPath(QFileInfo(path).absolutePath());
            case ColumnType::LastWatched:
                return QLocale().toString(entry.lastWatched().toLocalTime(),
                                          QLocale::ShortFormat);
            default:
                return {};
        }
    }

    if (role == Qt::ToolTipRole)
        return path;

    if (role == Qt::UserRole)
    {
        switch (index.column())
        {
            case ColumnType::Name:
                return entry.id();
            case ColumnType::Location:
                return path;
            case ColumnType::LastWatched:
                return entry.lastWatched();
            default:
                return {};
        }
    }

    return {};
}

QVariant
RecentVideosModel::headerData(int section, Qt::Orientation orientation,
                              int role) const
{
    if (role != Qt::DisplayRole || orientation != Qt::Horizontal)
        return {};

    switch (section)
    {
        case Name:
            return tr("Name");
        case Location:
            return tr("Location");
        case LastWatched:
            return tr("Last Watched");
        default:
            return {};
    }
}

Qt::ItemFlags
RecentVideosModel::flags(const QModelIndex &index) const
{
    if (!index.isValid())
        return Qt::NoItemFlags;

    return Qt::ItemIsSelectable | Qt::ItemIsEnabled;
}

void
RecentVideosModel::setEntries(RecentList entries)
{
    beginResetModel();
    m_entries = std::move(entries);
    m_paths.clear();
    for (const RecentEntry &entry : m_entries)
    {
        const std::optional<ResolvedFile> resolved = entry.fileRef().resolve();
        m_paths.push_back(resolved ? resolved->path : QString());
    }
    endResetModel();
}

RecentEntry
RecentVideosModel::entryAt(int row) const
{
    if (row < 0 || row >= rowCount())
        return {};
    return m_entries.at(row);
}

void
RecentVideosModel::setDisplayHomePath(bool enabled) noexcept
{
    m_use_tilde = enabled;
}

QString
RecentVideosModel::displayPath(const QString &path) const
{
    if (!m_use_tilde || m_home_path.isEmpty())
        return path;

    if (path.startsWith(m_home_path))
    {
        QString display = path;
        display.replace(0, m_home_path.size(), "~");
        return display;
    }

    return path;
}
