#include "CliSignal.h"

#include <QtGlobal>

#ifdef Q_OS_WIN
#include <windows.h>
#else
#include <csignal>
#include <initializer_list>
#endif

/**
 * @file CliSignal.cpp
 * @brief Staged interrupt handling.
 * 
 * @see CliSignal.h for API documentation
 */

namespace Cli {

namespace {

std::atomic<bool> g_stopGesture(false);
std::atomic<bool> g_skipSettle(false);
std::atomic<int> g_interrupts(0);

/**
 * @brief Advance the interrupt stage.
 * @return false when the caller should fall back to the default action
 */
bool escalate(int stages)
{
    const int count = g_interrupts.fetch_add(stages) + stages;
    g_stopGesture.store(true);
    if (count >= 2) {
        g_skipSettle.store(true);
    }
    return count < 3;
}

} // namespace

#ifdef Q_OS_WIN

static BOOL WINAPI consoleCtrlHandler(DWORD ctrlType)
{
    if (ctrlType != CTRL_C_EVENT && ctrlType != CTRL_BREAK_EVENT) {
        return FALSE;   // close/logoff/shutdown
    }
    // FALSE hands the event to the next handler, which terminates
    return escalate(ctrlType == CTRL_BREAK_EVENT ? 2 : 1) ? TRUE : FALSE;
}

void installSignalHandlers()
{
    SetConsoleCtrlHandler(consoleCtrlHandler, TRUE);
}

#else

static void interruptHandler(int sig)
{
    if (!escalate(sig == SIGTERM ? 2 : 1)) {
        std::signal(sig, SIG_DFL);
        std::raise(sig);
    }
}

void installSignalHandlers()
{
    struct sigaction action;
    action.sa_handler = interruptHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    for (int sig : { SIGINT, SIGTERM }) {
        sigaction(sig, &action, nullptr);
    }
}

#endif

std::atomic<bool>* stopGestureFlag()
{
    return &g_stopGesture;
}

std::atomic<bool>* skipSettleFlag()
{
    return &g_skipSettle;
}

int interruptCount()
{
    return g_interrupts.load();
}

void resetInterrupts()
{
    g_interrupts = 0;
    g_stopGesture = false;
    g_skipSettle = false;
}

} // namespace Cli
