#include "log.hpp"

#include "TrialPair.hpp"

#include <ctime>
#include <iomanip>

auto put_time(std::ostream& os) -> std::ostream&
{
    const std::time_t t = std::time(nullptr);
    return os << std::put_time(std::localtime(&t), "%T");
}

auto operator<<(std::ostream& os, const TrialPair& pair) -> std::ostream&
{
    os << pair.identity << " / ";
    if (pair.secret.empty())
        os << "(no secret)";
    else
        os << pair.secret;

    return os;
}
