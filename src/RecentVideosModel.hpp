#pragma once

#include "RecentStore.hpp"

#include <QAbstractTableModel>
#include <QString>
#include <QStringList>

class RecentVideosModel : public QAbstractTableModel
{
    Q_OBJECT
public:
    enum ColumnType
    {
        Name = 0,
        Location,
        LastWatched,
        COUNT
    };

    explicit RecentVideosModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index,
                  int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation,
                        int role = Qt::DisplayRole) const override;
    Qt::ItemFlags flags(const QModelIndex &index) const override;

    void setEntries(RecentList entries);
    inline const RecentList &entries() const noexcept
    {
        return m_entries;
    }
    RecentEntry entryAt(int row) const;
    void setDisplayHomePath(bool enabled) noexcept;

private:
    QString displayPath(const QString &path) const;

    RecentList m_entries;
    QStringList m_paths; // resolved once per setEntries
    QString m_home_path;
    bool m_use_tilde{true};
};
