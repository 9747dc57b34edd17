#include "ResultAggregator.hpp"

#include "log.hpp"

ResultAggregator::ResultAggregator(Progress& progress, std::ostream* output)
: m_progress{progress}
, m_output{output}
{
}

void ResultAggregator::add(Success success)
{
    m_progress.log(
        [&success](std::ostream& os)
        {
            os << "[" << put_time << "] Success: " << success.pair;
            if (!success.message.empty())
                os << " (" << success.message << ")";
            os << std::endl;
        });

    if (m_output)
        *m_output << success.pair.identity << ":" << success.pair.secret << std::endl;

    m_successes.push_back(std::move(success));
}
