#ifndef CREDSWEEP_PROGRESS_HPP
#define CREDSWEEP_PROGRESS_HPP

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>

/// \brief Structure to report the progress of a run or to cancel it
///
/// The \ref state member is the single cancellation signal of a run.
/// It is shared by reference with the dispatch loop, every worker and every trial.
class Progress
{
public:
    /// Possible states of a run
    enum class State
    {
        Normal,   ///< The run is ongoing or is fully completed
        Canceled, ///< The run has been canceled externally
        EarlyExit ///< The run stopped after the first success was found
    };

    /// Constructor
    explicit Progress(std::ostream& os);

    /// Get exclusive access to the shared output stream and output progress
    /// information with the given function
    template <typename F>
    void log(F f)
    {
        const auto lock = std::scoped_lock{m_os_mutex};
        f(m_os);
    }

    /// \brief Move from Normal to the given state
    /// \return false if the state was not Normal anymore
    bool stop(State reason);

    std::atomic<State>         state = State::Normal; ///< State of the run
    std::atomic<std::uint64_t> done  = 0;             ///< Number of trials already done
    std::atomic<std::uint64_t> total = 0;             ///< Expected number of trials

private:
    std::mutex    m_os_mutex;
    std::ostream& m_os;
};

#endif // CREDSWEEP_PROGRESS_HPP
