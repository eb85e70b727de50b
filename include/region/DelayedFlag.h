#ifndef DELAYEDFLAG_H
#define DELAYEDFLAG_H

#include <QObject>
#include <QTimer>

/**
 * @brief A boolean that clears itself after a delay.
 *
 * Re-arming replaces the deadline. cancel() clears the flag immediately
 * without emitting cleared().
 */
class DelayedFlag : public QObject
{
    Q_OBJECT

public:
    explicit DelayedFlag(QObject* parent = nullptr);

    // A non-positive delay leaves the flag unset
    void arm(int delayMs);
    void cancel();
    bool isSet() const { return m_set; }

signals:
    void cleared();

private slots:
    void onTimeout();

private:
    QTimer m_timer;
    bool m_set = false;
};

#endif // DELAYEDFLAG_H
