#include "PlaybackSession.hpp"

#include <QAudioOutput>
#include <QDebug>
#include <QFileInfo>
#include <QUrl>
#include <QVideoWidget>

PlaybackSession::PlaybackSession(QObject *parent)
    : QObject(parent), m_player(new QMediaPlayer(this)),
      m_audio(new QAudioOutput(this))
{
    m_player->setAudioOutput(m_audio);

    connect(m_player, &QMediaPlayer::playbackStateChanged, this,
            [this](QMediaPlayer::PlaybackState state)
    { emit playingChanged(state == QMediaPlayer::PlayingState); });

    connect(m_player, &QMediaPlayer::playbackRateChanged, this,
            [this](qreal rate) { emit rateChanged(static_cast<float>(rate)); });

    connect(m_player, &QMediaPlayer::errorOccurred, this,
            [this](QMediaPlayer::Error error, const QString &errorString)
    {
        if (error == QMediaPlayer::NoError)
            return;
        qWarning() << "Playback error:" << errorString;
        emit errorOccurred(errorString);
    });
}

void
PlaybackSession::setVideoOutput(QVideoWidget *widget) noexcept
{
    m_player->setVideoOutput(widget);
}

void
PlaybackSession::setVolume(float volume) noexcept
{
    m_audio->setVolume(qBound(0.0f, volume, 1.0f));
}

bool
PlaybackSession::openFile(const QString &path) noexcept
{
    const QFileInfo info(path);
    if (!info.isFile() || !info.isReadable())
    {
        qWarning() << "Cannot open video file:" << path;
        return false;
    }

    m_player->stop();
    m_file = info.absoluteFilePath();
    m_player->setSource(QUrl::fromLocalFile(m_file));
    emit fileOpened(m_file);
    return true;
}

void
PlaybackSession::play(float rate) noexcept
{
    setRate(rate);
    play();
}

void
PlaybackSession::play() noexcept
{
    if (m_file.isEmpty())
        return;
    m_player->play();
}

void
PlaybackSession::pause() noexcept
{
    m_player->pause();
}

void
PlaybackSession::togglePlayPause() noexcept
{
    if (isPlaying())
        pause();
    else
        play();
}

// Relative seek, clamped to the media bounds
void
PlaybackSession::seek(double seconds) noexcept
{
    if (m_file.isEmpty() || !m_player->isSeekable())
        return;

    qint64 position
        = m_player->position() + static_cast<qint64>(seconds * 1000.0);
    const qint64 duration = m_player->duration();
    if (duration > 0)
        position = qMin(position, duration);
    m_player->setPosition(qMax<qint64>(0, position));
}

void
PlaybackSession::setRate(float rate) noexcept
{
    if (rate <= 0.0f)
    {
        qWarning() << "Invalid playback rate:" << rate;
        return;
    }
    m_player->setPlaybackRate(rate);
}

float
PlaybackSession::currentRate() const noexcept
{
    return static_cast<float>(m_player->playbackRate());
}

bool
PlaybackSession::isPlaying() const noexcept
{
    return m_player->playbackState() == QMediaPlayer::PlayingState;
}
