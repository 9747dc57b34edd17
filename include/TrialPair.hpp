#ifndef CREDSWEEP_TRIALPAIR_HPP
#define CREDSWEEP_TRIALPAIR_HPP

#include <string>

/// \brief Identity and secret to try together
///
/// An empty secret means "no secret".
struct TrialPair
{
    std::string identity; ///< Candidate identity
    std::string secret;   ///< Candidate secret, possibly empty
};

inline bool operator==(const TrialPair& lhs, const TrialPair& rhs)
{
    return lhs.identity == rhs.identity && lhs.secret == rhs.secret;
}

inline bool operator!=(const TrialPair& lhs, const TrialPair& rhs)
{
    return !(lhs == rhs);
}

#endif // CREDSWEEP_TRIALPAIR_HPP
