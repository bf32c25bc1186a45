#include "signal_watcher.h"
#include "log_manager.h"
#include <QSocketNotifier>

#ifdef Q_OS_UNIX
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace {

#ifdef Q_OS_UNIX
int g_signalFds[2] = {-1, -1};

void handleTermination(int sig)
{
    const unsigned char byte = static_cast<unsigned char>(sig);
    const ssize_t written = ::write(g_signalFds[0], &byte, sizeof(byte));
    (void)written;
}
#endif

} // namespace

SignalWatcher::SignalWatcher(QObject* parent)
    : QObject(parent)
{
#ifdef Q_OS_UNIX
    if (g_signalFds[0] != -1) {
        LOG_WARNING(QStringLiteral("SignalWatcher: handlers already installed"));
        return;
    }
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFds) != 0) {
        LOG_WARNING(QStringLiteral("SignalWatcher: socketpair failed: %1")
                        .arg(QString::fromLocal8Bit(std::strerror(errno))));
        return;
    }

    m_notifier = new QSocketNotifier(g_signalFds[1], QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated,
            this, &SignalWatcher::onNotifierActivated);

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handleTermination;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // A client that disconnects mid-write must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

SignalWatcher::~SignalWatcher()
{
#ifdef Q_OS_UNIX
    if (!m_notifier) {
        return;
    }
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    delete m_notifier;
    m_notifier = nullptr;
    ::close(g_signalFds[0]);
    ::close(g_signalFds[1]);
    g_signalFds[0] = g_signalFds[1] = -1;
#endif
}

void SignalWatcher::onNotifierActivated()
{
#ifdef Q_OS_UNIX
    unsigned char byte = 0;
    if (::read(g_signalFds[1], &byte, sizeof(byte)) != sizeof(byte)) {
        return;
    }
    const int sig = static_cast<int>(byte);
    LOG_INFO(QStringLiteral("Received signal %1, shutting down").arg(sig));
    emit terminationRequested(sig);
#endif
}
