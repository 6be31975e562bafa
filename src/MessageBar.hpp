#pragma once

#include <QHBoxLayout>
#include <QLabel>
#include <QQueue>
#include <QWidget>

// Collapsed strip under the player that shows queued messages one at a time
class MessageBar : public QWidget
{
    Q_OBJECT
public:
    explicit MessageBar(QWidget *parent = nullptr);

    // A non-positive `sec` uses the default duration
    void showMessage(const QString &msg, float sec = 0.0f) noexcept;
    inline void setDefaultDuration(float sec) noexcept
    {
        m_default_duration = sec;
    }

private:
    struct Message
    {
        QString message;
        float duration;
    };

    void showNext() noexcept;

    QLabel *m_label{new QLabel(this)};
    QQueue<Message> m_queue;
    bool m_showing{false};
    float m_default_duration{3.0f};
};
