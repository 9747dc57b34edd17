#ifndef CREDSWEEP_INTERRUPTHANDLER_HPP
#define CREDSWEEP_INTERRUPTHANDLER_HPP

#include "Progress.hpp"

#include <csignal>

/// \brief Cancel a run when SIGINT or SIGTERM arrives
///
/// The handler only moves the given state from Progress::State::Normal to
/// Progress::State::Canceled, so an early exit already under way is kept.
/// The handlers in place before construction are restored on destruction.
///
/// \note There should exist at most one instance of this class at any time.
class InterruptHandler
{
public:
    /// Install the handler for SIGINT and SIGTERM
    explicit InterruptHandler(std::atomic<Progress::State>& destination);

    /// Restore the previous handlers
    ~InterruptHandler();

    InterruptHandler(const InterruptHandler& other)            = delete;
    InterruptHandler& operator=(const InterruptHandler& other) = delete;

private:
    using Handler = void (*)(int);

    Handler m_previousInterrupt;
    Handler m_previousTerminate;
};

#endif // CREDSWEEP_INTERRUPTHANDLER_HPP
