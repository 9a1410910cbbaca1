#ifndef CLISIGNAL_H
#define CLISIGNAL_H

/**
 * @file CliSignal.h
 * @brief Staged Ctrl+C handling for tessera-stress.
 * 
 * A replay has two phases worth interrupting separately, so interrupts are
 * counted instead of treated as a single cancel:
 * 
 * 1. First Ctrl+C: stop feeding gesture samples, let the engine settle.
 * 2. Second Ctrl+C: stop waiting for the settle, report what is there.
 * 3. Third Ctrl+C: default disposition (the process terminates).
 * 
 * SIGTERM jumps straight to stage 2. The handlers only touch atomics.
 */

#include <atomic>

namespace Cli {

/**
 * @brief Install SIGINT/SIGTERM (console control on Windows) handlers.
 */
void installSignalHandlers();

/// Raised by the first interrupt; the replay stops the gesture loop.
std::atomic<bool>* stopGestureFlag();

/// Raised by the second interrupt; the replay stops waiting for settle.
std::atomic<bool>* skipSettleFlag();

/// Interrupts received since the last resetInterrupts().
int interruptCount();

void resetInterrupts();

} // namespace Cli

#endif // CLISIGNAL_H
