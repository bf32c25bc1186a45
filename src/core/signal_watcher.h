#pragma once
#include <QObject>

class QSocketNotifier;

// Turns SIGINT / SIGTERM into a queued Qt signal. The handler only writes
// one byte to a socket pair; everything else happens on the event loop.
class SignalWatcher : public QObject {
    Q_OBJECT
public:
    explicit SignalWatcher(QObject* parent = nullptr);
    ~SignalWatcher() override;

signals:
    void terminationRequested(int signalNumber);

private slots:
    void onNotifierActivated();

private:
    QSocketNotifier* m_notifier = nullptr;
};
