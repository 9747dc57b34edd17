#ifndef CREDSWEEP_CONSOLEPROGRESS_HPP
#define CREDSWEEP_CONSOLEPROGRESS_HPP

#include "Progress.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

/// \brief Progress of a run, printed on one console line at regular time intervals
///
/// The line shows the number of trials done, the percentage of the estimated
/// total when it is known, and the average number of trials per second.
/// A last line is printed when the object is destroyed.
class ConsoleProgress : public Progress
{
public:
    /// Start a thread to print progress every \a interval
    explicit ConsoleProgress(std::ostream& os, std::chrono::milliseconds interval = std::chrono::milliseconds{200});

    /// Stop the printing thread after a final print
    ~ConsoleProgress();

private:
    using Clock = std::chrono::steady_clock;

    void run();
    void print(bool last);

    const std::chrono::milliseconds m_interval;
    const Clock::time_point         m_start;

    std::mutex              m_stopMutex;
    std::condition_variable m_stopCv;
    bool                    m_stopping = false;

    std::thread m_printer;
};

#endif // CREDSWEEP_CONSOLEPROGRESS_HPP
