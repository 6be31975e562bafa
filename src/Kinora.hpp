#pragma once

#include "Config.hpp"
#include "JsonFileStore.hpp"
#include "MessageBar.hpp"
#include "PlaybackSession.hpp"
#include "RecentStore.hpp"
#include "RecentVideosDialog.hpp"

#include <QActionGroup>
#include <QComboBox>
#include <QDir>
#include <QMainWindow>
#include <QMenu>
#include <QMenuBar>
#include <QPointer>
#include <QPushButton>
#include <QUuid>
#include <QVBoxLayout>
#include <QVideoWidget>
#include <argparse/argparse.hpp>
#include <memory>

class Kinora : public QMainWindow
{
    Q_OBJECT

public:
    Kinora() noexcept;

    void Read_args_parser(argparse::ArgumentParser &argparser) noexcept;

    bool OpenFile(const QString &filename = QString()) noexcept;
    bool OpenRecent(const QUuid &id) noexcept;
    void PlayPause() noexcept;
    void SeekBack() noexcept;
    void SeekForward() noexcept;
    void SetRate(float rate) noexcept;
    void Show_recent_videos() noexcept;
    void Clear_recent_videos() noexcept;

private:
    void construct() noexcept;
    void initConfig() noexcept;
    void initDB() noexcept;
    void initGui() noexcept;
    void initControls() noexcept;
    void initMenubar() noexcept;
    void initConnections() noexcept;

    void rememberFile(const QString &path) noexcept;
    void populateRecentVideos() noexcept;
    void populateRateActions() noexcept;
    void syncRateControls(float rate) noexcept;
    void openLastWatchedFile() noexcept;
    void updateWindowTitle() noexcept;
    void updateUiEnabledState() noexcept;
    void handleRemoveRequested(int row) noexcept;

    Config m_config;
    QDir m_config_dir;
    QString m_config_file_path;
    QString m_state_file_path;

    JsonFileStore m_state_store;
    std::unique_ptr<RecentStore> m_recent_store;

    PlaybackSession *m_session{nullptr};
    QVBoxLayout *m_layout{nullptr};
    QVideoWidget *m_video_widget{nullptr};
    MessageBar *m_message_bar{nullptr};
    QPointer<RecentVideosDialog> m_recent_dialog;

    QPushButton *m_openButton{nullptr};
    QPushButton *m_playButton{nullptr};
    QPushButton *m_pauseButton{nullptr};
    QPushButton *m_seekBackButton{nullptr};
    QPushButton *m_seekForwardButton{nullptr};
    QComboBox *m_rateCombo{nullptr};

    QMenuBar *m_menuBar{nullptr};
    QMenu *m_recentVideosMenu{nullptr};
    QMenu *m_rateMenu{nullptr};
    QActionGroup *m_rateActionGroup{nullptr};
    QAction *m_actionPlayPause{nullptr};
    QAction *m_actionSeekBack{nullptr};
    QAction *m_actionSeekForward{nullptr};
    QAction *m_actionManageRecent{nullptr};
    QAction *m_actionClearRecent{nullptr};
};
