#ifndef CREDSWEEP_TRIALEXECUTOR_HPP
#define CREDSWEEP_TRIALEXECUTOR_HPP

#include "Progress.hpp"
#include "TrialPair.hpp"

#include <chrono>
#include <string>

/// \file TrialExecutor.hpp

/// Result of a single trial
struct Outcome
{
    /// Possible results of a trial
    enum class Kind
    {
        NoConnection, ///< The target could not be reached, or the trial was aborted
        AuthFailure,  ///< The target rejected the pair
        Success       ///< The target accepted the pair
    };

    Kind        kind;    ///< What happened
    std::string message; ///< Free-form report, meaningful on success
};

/// \brief Interface to try one pair against a target
///
/// Implementations are called concurrently from several worker threads.
class TrialExecutor
{
public:
    virtual ~TrialExecutor() = default;

    /// \brief Try to authenticate with the given pair
    /// \param pair Identity and secret to try
    /// \param state Cancellation signal. The trial must be abandoned promptly
    ///              once it is no longer Progress::State::Normal.
    /// \param timeout Upper bound on the time spent in this call
    virtual auto attempt(const TrialPair& pair, const std::atomic<Progress::State>& state,
                         std::chrono::milliseconds timeout) -> Outcome = 0;
};

#endif // CREDSWEEP_TRIALEXECUTOR_HPP
