#include "MessageBar.hpp"

#include <QTimer>

MessageBar::MessageBar(QWidget *parent) : QWidget(parent)
{
    QHBoxLayout *layout = new QHBoxLayout(this);
    layout->setContentsMargins(8, 0, 8, 0);
    layout->addWidget(m_label);
    setLayout(layout);
    setFixedHeight(0);
}

void
MessageBar::showMessage(const QString &msg, float sec) noexcept
{
    if (sec <= 0.0f)
        sec = m_default_duration;

    m_queue.enqueue({.message = msg, .duration = sec});
    if (!m_showing)
        showNext();
}

void
MessageBar::showNext() noexcept
{
    if (m_queue.isEmpty())
    {
        m_showing = false;
        setFixedHeight(0);
        return;
    }

    m_showing             = true;
    const auto [msg, sec] = m_queue.dequeue();

    m_label->setText(msg);
    setFixedHeight(28);
    QTimer::singleShot(static_cast<int>(sec * 1000), this, [this]()
    {
        m_label->clear();
        showNext();
    });
}
