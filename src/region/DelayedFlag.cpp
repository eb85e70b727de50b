#include "region/DelayedFlag.h"

DelayedFlag::DelayedFlag(QObject* parent)
    : QObject(parent)
{
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &DelayedFlag::onTimeout);
}

void DelayedFlag::arm(int delayMs)
{
    if (delayMs <= 0) {
        cancel();
        return;
    }
    m_set = true;
    m_timer.start(delayMs);
}

void DelayedFlag::cancel()
{
    m_timer.stop();
    m_set = false;
}

void DelayedFlag::onTimeout()
{
    m_set = false;
    emit cleared();
}
