#ifndef CREDSWEEP_ESTIMATE_HPP
#define CREDSWEEP_ESTIMATE_HPP

#include "Source.hpp"

/// \file estimate.hpp

/// \brief Expected number of trials for the given sources
///
/// This is the product of the candidate counts of both sources, computed with
/// a separate pass over the files. It is meant for progress display only.
auto estimateTrials(const Source& identities, const Source& secrets) -> std::uint64_t;

#endif // CREDSWEEP_ESTIMATE_HPP
