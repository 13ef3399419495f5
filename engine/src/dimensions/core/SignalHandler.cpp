#include <dimensions/core/SignalHandler.hpp>

#include <cerrno>
#include <system_error>

namespace dimensions::core
{

namespace
{

volatile std::sig_atomic_t g_stopRequested = 0;
volatile std::sig_atomic_t g_reloadRequested = 0;
volatile std::sig_atomic_t g_lastSignal = 0;

} // namespace

SignalHandler::SignalHandler()
{
    installOrThrow();
}

SignalHandler::~SignalHandler() noexcept
{
    uninstall();
}

void SignalHandler::installOrThrow()
{
    if (installed_)
    {
        return;
    }

    // SA_RESTART 없이: epoll_wait 가 EINTR 로 깨어나 메인 루프가 바로 플래그를 본다.
    struct sigaction sa{};
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    for (std::size_t i = 0; i < kSignals.size(); ++i)
    {
        const int signo = kSignals[i];
        sa.sa_handler = (signo == SIGPIPE) ? SIG_IGN : &SignalHandler::handleSignal;

        if (::sigaction(signo, &sa, &oldActions_[i]) != 0)
        {
            const int e = errno;
            for (std::size_t j = 0; j < i; ++j)
            {
                (void)::sigaction(kSignals[j], &oldActions_[j], nullptr);
            }
            throw std::system_error(e, std::generic_category(), "SignalHandler: sigaction failed");
        }
    }

    installed_ = true;
}

void SignalHandler::uninstall() noexcept
{
    if (!installed_)
    {
        return;
    }

    for (std::size_t i = 0; i < kSignals.size(); ++i)
    {
        (void)::sigaction(kSignals[i], &oldActions_[i], nullptr);
    }
    installed_ = false;
}

void SignalHandler::handleSignal(int signo) noexcept
{
    // async-signal-safe: 플래그만 쓴다
    if (signo == SIGHUP)
    {
        g_reloadRequested = 1;
        return;
    }
    g_stopRequested = 1;
    g_lastSignal = signo;
}

bool SignalHandler::isStopRequested() const noexcept
{
    return g_stopRequested != 0;
}

bool SignalHandler::consumeStopRequest(int *outSignal) noexcept
{
    if (g_stopRequested == 0)
    {
        return false;
    }

    g_stopRequested = 0;
    const int signo = static_cast<int>(g_lastSignal);
    g_lastSignal = 0;

    if (outSignal)
    {
        *outSignal = signo;
    }
    return true;
}

bool SignalHandler::consumeReloadRequest() noexcept
{
    if (g_reloadRequested == 0)
    {
        return false;
    }
    g_reloadRequested = 0;
    return true;
}

void SignalHandler::reset() noexcept
{
    g_stopRequested = 0;
    g_reloadRequested = 0;
    g_lastSignal = 0;
}

std::string_view SignalHandler::signalName(int signo) noexcept
{
    switch (signo)
    {
    case SIGINT:
        return "SIGINT";
    case SIGTERM:
        return "SIGTERM";
    case SIGHUP:
        return "SIGHUP";
    default:
        return "UNKNOWN";
    }
}

} // namespace dimensions::core
