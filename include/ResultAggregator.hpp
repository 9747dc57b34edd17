#ifndef CREDSWEEP_RESULTAGGREGATOR_HPP
#define CREDSWEEP_RESULTAGGREGATOR_HPP

#include "Progress.hpp"
#include "TrialPair.hpp"

#include <ostream>
#include <string>
#include <vector>

/// \file ResultAggregator.hpp

/// Successful trial surfaced to the user
struct Success
{
    TrialPair   pair;    ///< Pair accepted by the target
    std::string message; ///< Report given by the trial executor
};

/// \brief Collect successful trials and report them as they arrive
///
/// Only the thread running Scheduler::run() calls add().
class ResultAggregator
{
public:
    /// \brief Constructor
    /// \param progress Object giving access to the console
    /// \param output If not null, stream receiving one line per success
    explicit ResultAggregator(Progress& progress, std::ostream* output = nullptr);

    /// Record and report a success
    void add(Success success);

    /// Successes recorded so far, in completion order
    auto successes() const -> const std::vector<Success>& { return m_successes; }

private:
    Progress&            m_progress;
    std::ostream*        m_output;
    std::vector<Success> m_successes;
};

#endif // CREDSWEEP_RESULTAGGREGATOR_HPP
