#pragma once

#include <QMediaPlayer>
#include <QObject>
#include <QString>

class QAudioOutput;
class QVideoWidget;

// Thin wrapper around QMediaPlayer: one open file, play/pause/seek/rate
class PlaybackSession : public QObject
{
    Q_OBJECT
public:
    explicit PlaybackSession(QObject *parent = nullptr);

    void setVideoOutput(QVideoWidget *widget) noexcept;
    void setVolume(float volume) noexcept;

    bool openFile(const QString &path) noexcept;
    void play(float rate) noexcept;
    void play() noexcept;
    void pause() noexcept;
    void togglePlayPause() noexcept;
    void seek(double seconds) noexcept;
    void setRate(float rate) noexcept;

    float currentRate() const noexcept;
    bool isPlaying() const noexcept;

    inline const QString &currentFile() const noexcept
    {
        return m_file;
    }

signals:
    void fileOpened(const QString &path);
    void playingChanged(bool playing);
    void rateChanged(float rate);
    void errorOccurred(const QString &message);

private:
    QMediaPlayer *m_player{nullptr};
    QAudioOutput *m_audio{nullptr};
    QString m_file;
};
