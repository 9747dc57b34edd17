#include "Progress.hpp"

Progress::Progress(std::ostream& os)
: m_os{os}
{
}

bool Progress::stop(State reason)
{
    auto expected = State::Normal;
    return state.compare_exchange_strong(expected, reason);
}
