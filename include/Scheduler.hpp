#ifndef CREDSWEEP_SCHEDULER_HPP
#define CREDSWEEP_SCHEDULER_HPP

#include "BoundedQueue.hpp"
#include "Checkpoint.hpp"
#include "PairGenerator.hpp"
#include "Progress.hpp"
#include "ResultAggregator.hpp"
#include "TrialExecutor.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

/// \file Scheduler.hpp

/// \brief Dispatch generated pairs to a trial executor with bounded concurrency
///
/// A dispatcher thread reads pairs in generation order and admits each one
/// once a slot is free among Options::workers slots. Worker threads carry out
/// admitted trials, save their pair as checkpoint and forward successes
/// through a bounded queue to the thread calling run(), which hands them to
/// the result aggregator. Completion order is unspecified.
///
/// Progress::state is the cancellation signal. Dispatch stops as soon as it
/// leaves Progress::State::Normal; trials already admitted run to completion.
class Scheduler
{
public:
    /// Settings of a run
    struct Options
    {
        /// Maximum number of trials in flight, at least 1
        int workers = 10;

        /// Stop after the first success and surface only that one
        bool firstOnly = false;

        /// Time allowed to each trial
        std::chrono::milliseconds timeout{10000};

        /// Report discarded successes and checkpoint failures in detail
        bool verbose = false;
    };

    /// Constructor. The arguments must outlive the scheduler.
    Scheduler(const Options& options, TrialExecutor& executor, CheckpointStore& checkpoint, Progress& progress);

    /// \brief Try every pair given by \a generator
    ///
    /// Returns once the generator is exhausted or the run is stopped,
    /// and every admitted trial has finished.
    void run(PairGenerator& generator, ResultAggregator& results);

    /// \return the number of trials actually carried out by the last run
    auto attempted() const -> std::uint64_t { return m_attempted; }

private:
    // carry out one admitted trial, return false if it was skipped after an early exit
    bool carryout(const TrialPair& pair, BoundedQueue<Success>& outcomes);

    // forward a success, or discard it if another one was already surfaced in first-only mode
    void report(const TrialPair& pair, std::string message, BoundedQueue<Success>& outcomes);

    const Options    m_options;
    TrialExecutor&   m_executor;
    CheckpointStore& m_checkpoint;
    Progress&        m_progress;

    std::uint64_t m_attempted = 0;

    // first-only mode bookkeeping
    std::mutex m_successMutex;
    bool       m_successFound = false;

    std::atomic<bool> m_checkpointFailed = false;
};

#endif // CREDSWEEP_SCHEDULER_HPP
