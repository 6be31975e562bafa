#include "Kinora.hpp"

#include <QDebug>
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QMessageBox>
#include <QSignalBlocker>
#include <QStandardPaths>
#include <algorithm>

// Constructs the `Kinora` class
Kinora::Kinora() noexcept
{
    setAttribute(Qt::WA_NativeWindow, true);
}

// On-demand construction of `Kinora` (for use with argparse)
void
Kinora::construct() noexcept
{
    initConfig();
    initGui();
    initDB();
    populateRecentVideos();
    initConnections();
    syncRateControls(m_session->currentRate());
    updateUiEnabledState();
    updateWindowTitle();
    setMinimumSize(480, 320);
    this->show();

    const auto [width, height] = m_config.window.initial_size;
    if (width > 0 && height > 0)
        resize(width, height);
}

// Reads the arguments passed with `Kinora` from the
// commandline
void
Kinora::Read_args_parser(argparse::ArgumentParser &argparser) noexcept
{
    if (argparser.is_used("--config"))
    {
        m_config_file_path
            = QString::fromStdString(argparser.get<std::string>("--config"));
    }

    this->construct();

    bool opened{false};
    if (auto files = argparser.present<std::vector<std::string>>("files"))
    {
        if (!files->empty())
            opened = OpenFile(QString::fromStdString(files->front()));
    }

    if (!opened && m_config.recent.open_last_on_startup)
        openLastWatchedFile();
}

// Initialize the config related stuff
void
Kinora::initConfig() noexcept
{
    m_config_dir = configDirectory();

    // If config file path is not set, use the default one
    if (m_config_file_path.isEmpty())
        m_config_file_path = m_config_dir.filePath("config.toml");

    QString error;
    if (!loadConfig(m_config_file_path, m_config, &error))
    {
        qWarning() << "Error in configuration file:" << error;
        QMessageBox::critical(
            this, "Error in configuration file",
            QString("There are one or more error(s) in your config "
                    "file:\n%1\n\nLoading default config.")
                .arg(error));
    }
}

// Initialize the recent videos persistence
void
Kinora::initDB() noexcept
{
    m_state_file_path = m_config_dir.filePath("state.json");
    m_state_store.setFilePath(m_state_file_path);
    if (!m_state_store.load())
        qWarning() << "Failed to load state store" << m_state_file_path;

    m_recent_store = std::make_unique<RecentStore>(&m_state_store);
    m_recent_store->setMaxEntries(m_config.recent.max_entries);
}

// Initialize the GUI related Stuff
void
Kinora::initGui() noexcept
{
    QWidget *widget = new QWidget(this);
    this->setCentralWidget(widget);
    m_layout = new QVBoxLayout(widget);
    m_layout->setContentsMargins(0, 0, 0, 0);
    m_layout->setSpacing(0);
    widget->setLayout(m_layout);

    m_session      = new PlaybackSession(this);
    m_video_widget = new QVideoWidget(widget);
    m_video_widget->setMinimumSize(400, 300);
    m_video_widget->setSizePolicy(QSizePolicy::Expanding,
                                  QSizePolicy::Expanding);
    m_session->setVideoOutput(m_video_widget);
    m_session->setVolume(m_config.playback.volume);
    m_session->setRate(m_config.playback.default_rate);

    m_message_bar = new MessageBar(this);
    m_message_bar->setDefaultDuration(m_config.message_bar.duration);

    m_layout->addWidget(m_video_widget, 1);
    initControls();
    m_layout->addWidget(m_message_bar);

    m_menuBar = this->menuBar();
    m_menuBar->setVisible(m_config.window.menubar);
    initMenubar();
}

// Transport row under the video
void
Kinora::initControls() noexcept
{
    QWidget *controls  = new QWidget(centralWidget());
    QHBoxLayout *row   = new QHBoxLayout(controls);
    const QString step = QString::number(m_config.playback.seek_step);

    m_playButton        = new QPushButton("Play", controls);
    m_pauseButton       = new QPushButton("Pause", controls);
    m_seekBackButton    = new QPushButton(QString("-%1s").arg(step), controls);
    m_seekForwardButton = new QPushButton(QString("+%1s").arg(step), controls);
    m_openButton        = new QPushButton("Open Video...", controls);
    m_rateCombo         = new QComboBox(controls);

    for (float rate : m_config.playback.rates)
        m_rateCombo->addItem(QString("%1x").arg(rate), rate);

    int index = m_rateCombo->findData(m_config.playback.default_rate);
    if (index < 0)
    {
        m_rateCombo->addItem(QString("%1x").arg(m_config.playback.default_rate),
                             m_config.playback.default_rate);
        index = m_rateCombo->count() - 1;
    }
    m_rateCombo->setCurrentIndex(index);

    row->addWidget(m_playButton);
    row->addWidget(m_pauseButton);
    row->addStretch();
    row->addWidget(m_seekBackButton);
    row->addWidget(m_seekForwardButton);
    row->addWidget(m_rateCombo);
    row->addWidget(m_openButton);
    controls->setLayout(row);

    m_layout->addWidget(controls);
}

// Initialize the menubar related stuff
void
Kinora::initMenubar() noexcept
{
    // --- File Menu ---
    QMenu *fileMenu = m_menuBar->addMenu("&File");
    fileMenu->addAction("Open Video...", QKeySequence(QKeySequence::Open), this,
                        [this]() { OpenFile(); });

    m_recentVideosMenu   = fileMenu->addMenu("Open Recent");
    m_actionManageRecent = fileMenu->addAction(
        "Manage Recent Videos...", this, &Kinora::Show_recent_videos);
    m_actionClearRecent = fileMenu->addAction("Clear Recent Videos", this,
                                              &Kinora::Clear_recent_videos);

    fileMenu->addSeparator();
    fileMenu->addAction("Quit", QKeySequence(QKeySequence::Quit), this,
                        &QMainWindow::close);

    // --- Playback Menu ---
    QMenu *playbackMenu = m_menuBar->addMenu("&Playback");
    m_actionPlayPause   = playbackMenu->addAction(
        "Play/Pause", QKeySequence(Qt::Key_Space), this, &Kinora::PlayPause);
    m_actionSeekBack = playbackMenu->addAction(
        "Seek Back", QKeySequence(Qt::Key_Left), this, &Kinora::SeekBack);
    m_actionSeekForward = playbackMenu->addAction(
        "Seek Forward", QKeySequence(Qt::Key_Right), this, &Kinora::SeekForward);

    m_rateMenu        = playbackMenu->addMenu("Speed");
    m_rateActionGroup = new QActionGroup(this);
    m_rateActionGroup->setExclusive(true);
    populateRateActions();
}

void
Kinora::populateRateActions() noexcept
{
    for (int i = 0; i < m_rateCombo->count(); ++i)
    {
        const float rate = m_rateCombo->itemData(i).toFloat();
        QAction *action  = m_rateMenu->addAction(m_rateCombo->itemText(i));
        action->setCheckable(true);
        action->setData(rate);
        action->setChecked(i == m_rateCombo->currentIndex());
        m_rateActionGroup->addAction(action);
    }
}

void
Kinora::initConnections() noexcept
{
    connect(m_openButton, &QPushButton::clicked, this, [this]() { OpenFile(); });
    connect(m_playButton, &QPushButton::clicked, this, [this]()
    { m_session->play(m_rateCombo->currentData().toFloat()); });
    connect(m_pauseButton, &QPushButton::clicked, m_session,
            &PlaybackSession::pause);
    connect(m_seekBackButton, &QPushButton::clicked, this, &Kinora::SeekBack);
    connect(m_seekForwardButton, &QPushButton::clicked, this,
            &Kinora::SeekForward);

    connect(m_rateCombo, &QComboBox::currentIndexChanged, this,
            [this](int index)
    {
        if (index < 0)
            return;
        SetRate(m_rateCombo->itemData(index).toFloat());
    });

    connect(m_rateActionGroup, &QActionGroup::triggered, this,
            [this](QAction *action) { SetRate(action->data().toFloat()); });

    connect(m_session, &PlaybackSession::fileOpened, this,
            [this](const QString &) { updateWindowTitle(); });
    connect(m_session, &PlaybackSession::rateChanged, this,
            &Kinora::syncRateControls);
    connect(m_session, &PlaybackSession::playingChanged, this,
            [this](bool) { updateUiEnabledState(); });
    connect(m_session, &PlaybackSession::errorOccurred, this,
            [this](const QString &message)
    { m_message_bar->showMessage(QString("Playback error: %1").arg(message)); });
}

// Opens `filename`, or asks for one when it is empty. The file is added to
// the recent videos once playback accepted it.
bool
Kinora::OpenFile(const QString &filename) noexcept
{
    QString path = filename;
    if (path.isEmpty())
    {
        path = QFileDialog::getOpenFileName(
            this, "Open Video",
            QStandardPaths::writableLocation(QStandardPaths::MoviesLocation),
            "Video files (*.mp4 *.mkv *.mov *.avi *.webm *.m4v *.wmv *.flv);;"
            "All files (*)");
        if (path.isEmpty())
            return false;
    }

    if (!m_session->openFile(path))
    {
        m_message_bar->showMessage(
            QString("Unable to open %1").arg(QFileInfo(path).fileName()));
        return false;
    }

    if (m_config.playback.autoplay)
        m_session->play(m_rateCombo->currentData().toFloat());

    rememberFile(path);
    updateUiEnabledState();
    return true;
}

// Opens the recent entry with `id`, looked up in a fresh load so a list
// changed elsewhere is never used
bool
Kinora::OpenRecent(const QUuid &id) noexcept
{
    const RecentList list = m_recent_store->load();
    auto it = std::find_if(list.cbegin(), list.cend(),
                           [&id](const RecentEntry &entry)
    { return entry.id() == id; });

    if (it == list.cend())
    {
        m_message_bar->showMessage("This video is no longer available");
        populateRecentVideos();
        return false;
    }

    ReferenceError error{ReferenceError::None};
    const std::optional<ResolvedFile> resolved = it->fileRef().resolve(&error);
    if (!resolved)
    {
        qWarning() << "Cannot resolve recent video" << it->displayName() << ":"
                   << referenceErrorString(error);
        m_message_bar->showMessage(QString("%1: %2").arg(
            it->displayName(), referenceErrorString(error)));
        populateRecentVideos();
        return false;
    }

    if (!m_session->openFile(resolved->path))
    {
        m_message_bar->showMessage(
            QString("Unable to open %1").arg(it->displayName()));
        return false;
    }

    if (m_config.playback.autoplay)
        m_session->play(m_rateCombo->currentData().toFloat());

    if (m_config.recent.enabled)
        m_recent_store->addOrPromote(*it);
    populateRecentVideos();
    updateUiEnabledState();
    return true;
}

void
Kinora::rememberFile(const QString &path) noexcept
{
    if (!m_config.recent.enabled)
        return;

    ReferenceError error{ReferenceError::None};
    std::optional<RecentEntry> entry
        = RecentEntry::fromPath(path, QString(), QDateTime(), &error);
    if (!entry)
    {
        m_message_bar->showMessage(
            QString("Cannot remember this file: %1")
                .arg(referenceErrorString(error)));
        return;
    }

    m_recent_store->addOrPromote(*entry);
    populateRecentVideos();
}

// Rebuilds the recent videos menu (and the manage dialog, if open) from the
// store
void
Kinora::populateRecentVideos() noexcept
{
    if (!m_config.recent.enabled)
    {
        m_recentVideosMenu->setEnabled(false);
        m_actionManageRecent->setEnabled(false);
        m_actionClearRecent->setEnabled(false);
        return;
    }

    const RecentList list = m_recent_store->load();

    m_recentVideosMenu->clear();
    for (const RecentEntry &entry : list)
    {
        QString text = entry.displayName();
        if (m_config.recent.show_full_path)
        {
            if (auto resolved = entry.fileRef().resolve())
                text = resolved->path;
        }

        const QUuid id      = entry.id();
        QAction *fileAction = new QAction(text, m_recentVideosMenu);
        connect(fileAction, &QAction::triggered, this,
                [this, id]() { OpenRecent(id); });
        m_recentVideosMenu->addAction(fileAction);
    }

    m_recentVideosMenu->setEnabled(!m_recentVideosMenu->isEmpty());
    m_actionClearRecent->setEnabled(!list.empty());
    m_actionManageRecent->setEnabled(true);

    if (m_recent_dialog)
        m_recent_dialog->setEntries(list);
}

// Helper function to open last watched file
void
Kinora::openLastWatchedFile() noexcept
{
    if (!m_config.recent.enabled)
        return;

    const RecentList list = m_recent_store->load();
    if (list.empty())
        return;

    OpenRecent(list.front().id());
}

// Show a dialog with the recent videos, letting the user open or forget
// entries
void
Kinora::Show_recent_videos() noexcept
{
    if (!m_recent_dialog)
    {
        m_recent_dialog = new RecentVideosDialog(this);
        m_recent_dialog->setAttribute(Qt::WA_DeleteOnClose);
        m_recent_dialog->setDisplayHomePath(!m_config.recent.show_full_path);

        connect(m_recent_dialog, &RecentVideosDialog::openRequested, this,
                [this](const QUuid &id) { OpenRecent(id); });
        connect(m_recent_dialog, &RecentVideosDialog::removeRequested, this,
                &Kinora::handleRemoveRequested);
    }

    m_recent_dialog->setEntries(m_recent_store->load());
    m_recent_dialog->show();
    m_recent_dialog->raise();
    m_recent_dialog->activateWindow();
}

// `row` indexes the list the dialog is showing
void
Kinora::handleRemoveRequested(int row) noexcept
{
    if (!m_recent_dialog)
        return;

    m_recent_store->remove(m_recent_dialog->entries(), row);
    populateRecentVideos();
}

void
Kinora::Clear_recent_videos() noexcept
{
    const auto answer = QMessageBox::question(
        this, "Clear Recent Videos",
        "Forget all recently watched videos?",
        QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
    if (answer != QMessageBox::Yes)
        return;

    m_recent_store->clear();
    populateRecentVideos();
}

void
Kinora::PlayPause() noexcept
{
    m_session->togglePlayPause();
}

void
Kinora::SeekBack() noexcept
{
    m_session->seek(-m_config.playback.seek_step);
}

void
Kinora::SeekForward() noexcept
{
    m_session->seek(m_config.playback.seek_step);
}

void
Kinora::SetRate(float rate) noexcept
{
    m_session->setRate(rate);
}

// Keeps the speed combo box and the speed menu on the player's rate
void
Kinora::syncRateControls(float rate) noexcept
{
    const int index = m_rateCombo->findData(rate);
    if (index >= 0)
    {
        const QSignalBlocker blocker(m_rateCombo);
        m_rateCombo->setCurrentIndex(index);
    }

    for (QAction *action : m_rateActionGroup->actions())
    {
        if (qFuzzyCompare(action->data().toFloat(), rate))
            action->setChecked(true);
    }
}

void
Kinora::updateWindowTitle() noexcept
{
    const QString &file = m_session->currentFile();
    if (file.isEmpty())
    {
        this->setWindowTitle("kinora");
        return;
    }

    this->setWindowTitle(
        m_config.window.title_format.arg(QFileInfo(file).fileName()));
}

// Updates the UI elements checking if a
// video is open or not
void
Kinora::updateUiEnabledState() noexcept
{
    const bool hasFile = !m_session->currentFile().isEmpty();
    const bool playing = m_session->isPlaying();

    m_playButton->setEnabled(hasFile && !playing);
    m_pauseButton->setEnabled(hasFile && playing);
    m_seekBackButton->setEnabled(hasFile);
    m_seekForwardButton->setEnabled(hasFile);
    m_actionPlayPause->setEnabled(hasFile);
    m_actionSeekBack->setEnabled(hasFile);
    m_actionSeekForward->setEnabled(hasFile);
}
