#include "ConsoleProgress.hpp"

#include <iomanip>

ConsoleProgress::ConsoleProgress(std::ostream& os, std::chrono::milliseconds interval)
: Progress{os}
, m_interval{interval}
, m_start{Clock::now()}
, m_printer{&ConsoleProgress::run, this}
{
}

ConsoleProgress::~ConsoleProgress()
{
    {
        const auto lock = std::scoped_lock{m_stopMutex};
        m_stopping      = true;
    }

    m_stopCv.notify_all();
    m_printer.join();
}

void ConsoleProgress::run()
{
    // first print after one interval
    for (auto lock = std::unique_lock{m_stopMutex};
         !m_stopCv.wait_for(lock, m_interval, [this] { return m_stopping; });)
    {
        lock.unlock();
        print(false);
        lock.lock();
    }

    if (done.load())
        print(true);
}

void ConsoleProgress::print(bool last)
{
    const auto elapsed = std::chrono::duration<double>{Clock::now() - m_start}.count();

    log(
        [done = done.load(), total = total.load(), elapsed, last](std::ostream& os)
        {
            const auto flagsBefore     = os.setf(std::ios::fixed, std::ios::floatfield);
            const auto precisionBefore = os.precision(1);

            if (total)
                os << std::setw(5) << (100.0 * done / total) << " % (" << done << " / " << total << ")";
            else
                os << done << " trials";

            if (0 < elapsed)
                os << ", " << done / elapsed << " trials/s";

            os.precision(precisionBefore);
            os.flags(flagsBefore);

            if (last)
                os << std::endl;
            else
                os << std::flush << "\033[1K\r";
        });
}
