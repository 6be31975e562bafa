#pragma once

#include "RecentVideosModel.hpp"

#include <QDialog>
#include <QPushButton>
#include <QTableView>
#include <QUuid>

class RecentVideosDialog : public QDialog
{
    Q_OBJECT

public:
    explicit RecentVideosDialog(QWidget *parent = nullptr);

    void setEntries(RecentList entries) noexcept;
    inline const RecentList &entries() const noexcept
    {
        return m_model->entries();
    }
    inline void setDisplayHomePath(bool enabled) noexcept
    {
        m_model->setDisplayHomePath(enabled);
    }

signals:
    void openRequested(const QUuid &id);
    void removeRequested(int row);

private:
    int selectedRow() const noexcept;
    void updateButtons() noexcept;

    RecentVideosModel *m_model{nullptr};
    QTableView *m_view{nullptr};
    QPushButton *m_openButton{nullptr};
    QPushButton *m_removeButton{nullptr};
    QPushButton *m_closeButton{nullptr};
};
