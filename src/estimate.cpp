#include "estimate.hpp"

auto estimateTrials(const Source& identities, const Source& secrets) -> std::uint64_t
{
    return identities.count() * secrets.count();
}
