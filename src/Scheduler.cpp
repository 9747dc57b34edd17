#include "Scheduler.hpp"

#include "file.hpp"
#include "log.hpp"

#include <algorithm>
#include <condition_variable>
#include <thread>
#include <vector>

namespace
{

/// Admission control allowing a fixed number of trials in flight
class Slots
{
public:
    Slots(int capacity, const std::atomic<Progress::State>& state)
    : m_free{capacity}
    , m_state{state}
    {
    }

    /// \brief Take a slot, waiting for one to be released if needed
    /// \return false if the run was stopped before a slot could be taken
    bool acquire()
    {
        auto lock = std::unique_lock{m_mutex};

        // the state may be changed by a signal handler which cannot notify, so poll it
        while (!m_cv.wait_for(lock, pollInterval,
                              [this] { return 0 < m_free || m_state != Progress::State::Normal; }))
            ;

        if (m_state != Progress::State::Normal)
            return false;

        m_free--;
        return true;
    }

    /// Give back a slot taken with acquire()
    void release()
    {
        {
            const auto lock = std::scoped_lock{m_mutex};
            m_free++;
        }

        m_cv.notify_one();
    }

private:
    static constexpr auto pollInterval = std::chrono::milliseconds{50};

    std::mutex                          m_mutex;
    std::condition_variable             m_cv;
    int                                 m_free;
    const std::atomic<Progress::State>& m_state;
};

} // namespace

Scheduler::Scheduler(const Options& options, TrialExecutor& executor, CheckpointStore& checkpoint,
                     Progress& progress)
: m_options{options}
, m_executor{executor}
, m_checkpoint{checkpoint}
, m_progress{progress}
{
}

void Scheduler::run(PairGenerator& generator, ResultAggregator& results)
{
    const auto workerCount = std::max(m_options.workers, 1);

    {
        const auto lock = std::scoped_lock{m_successMutex};
        m_successFound  = false;
    }
    m_checkpointFailed = false;

    auto attempted = std::atomic<std::uint64_t>{0};
    auto slots     = Slots{workerCount, m_progress.state};
    auto tasks     = BoundedQueue<TrialPair>{static_cast<std::size_t>(workerCount)};
    auto outcomes  = BoundedQueue<Success>{2 * static_cast<std::size_t>(workerCount)};

    auto workers = std::vector<std::thread>{};
    for (auto i = 0; i < workerCount; ++i)
        workers.emplace_back(
            [this, &tasks, &outcomes, &slots, &attempted]
            {
                while (const auto pair = tasks.pop())
                {
                    if (carryout(*pair, outcomes))
                        attempted++;
                    slots.release();
                }
            });

    auto dispatcher = std::thread{
        [this, &generator, &tasks, &outcomes, &slots, &workers]
        {
            // pairs are admitted one at a time, in generation order
            while (m_progress.state == Progress::State::Normal)
            {
                auto pair = generator.next();
                if (!pair || !slots.acquire())
                    break;

                tasks.push(std::move(*pair));
            }

            tasks.close();
            for (auto& worker : workers)
                worker.join();

            outcomes.close();
        }};

    while (auto success = outcomes.pop())
        results.add(std::move(*success));

    dispatcher.join();

    m_attempted = attempted;
}

bool Scheduler::carryout(const TrialPair& pair, BoundedQueue<Success>& outcomes)
{
    if (m_options.firstOnly)
    {
        const auto lock = std::scoped_lock{m_successMutex};
        if (m_successFound)
            return false;
    }

    auto outcome = Outcome{Outcome::Kind::NoConnection, {}};
    try
    {
        outcome = m_executor.attempt(pair, m_progress.state, m_options.timeout);
    }
    catch (const std::exception& e)
    {
        m_progress.log([&pair, &e](std::ostream& os) { os << "Trial " << pair << " failed: " << e.what() << std::endl; });
    }
    catch (...)
    {
        m_progress.log([&pair](std::ostream& os) { os << "Trial " << pair << " failed: unknown error" << std::endl; });
    }

    if (outcome.kind == Outcome::Kind::Success)
        report(pair, std::move(outcome.message), outcomes);

    m_progress.done++;

    try
    {
        m_checkpoint.save(pair);
    }
    catch (const FileError& e)
    {
        // reported once per run, further failures are only reported in verbose mode
        if (!m_checkpointFailed.exchange(true) || m_options.verbose)
            m_progress.log([&e](std::ostream& os) { os << e.what() << " Resuming may not be possible." << std::endl; });
    }

    return true;
}

void Scheduler::report(const TrialPair& pair, std::string message, BoundedQueue<Success>& outcomes)
{
    if (!m_options.firstOnly)
    {
        outcomes.push({pair, std::move(message)});
        return;
    }

    const auto lock = std::scoped_lock{m_successMutex};
    if (m_successFound)
    {
        if (m_options.verbose)
            m_progress.log([&pair](std::ostream& os)
                           { os << "Discarding success " << pair << " found after the first one" << std::endl; });
        return;
    }

    m_successFound = true;
    m_progress.stop(Progress::State::EarlyExit);
    outcomes.push({pair, std::move(message)});
}
