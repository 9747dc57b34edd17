#include "InterruptHandler.hpp"

namespace
{

static_assert(std::atomic<Progress::State>::is_always_lock_free, "atomics must be lock-free to be signal-safe");

std::atomic<Progress::State>* destination = nullptr;

void onInterrupt(int sig)
{
    if (destination)
    {
        auto expected = Progress::State::Normal;
        destination->compare_exchange_strong(expected, Progress::State::Canceled);
    }

    // some platforms reset the disposition once the handler is called
    std::signal(sig, &onInterrupt);
}

} // namespace

InterruptHandler::InterruptHandler(std::atomic<Progress::State>& destination)
{
    ::destination       = &destination;
    m_previousInterrupt = std::signal(SIGINT, &onInterrupt);
    m_previousTerminate = std::signal(SIGTERM, &onInterrupt);
}

InterruptHandler::~InterruptHandler()
{
    std::signal(SIGINT, m_previousInterrupt == SIG_ERR ? SIG_DFL : m_previousInterrupt);
    std::signal(SIGTERM, m_previousTerminate == SIG_ERR ? SIG_DFL : m_previousTerminate);
    destination = nullptr;
}
