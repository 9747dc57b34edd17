#ifndef CREDSWEEP_PAIRGENERATOR_HPP
#define CREDSWEEP_PAIRGENERATOR_HPP

#include "Source.hpp"
#include "TrialPair.hpp"

#include <memory>
#include <optional>
#include <vector>

/// \file PairGenerator.hpp

/// \brief Lazy Cartesian product of an identity source and a secret source
///
/// The whole identity set is always held in memory.
/// The secret set is held in memory only with Strategy::IdentityMajor,
/// so that Strategy::SecretMajor can stream arbitrarily large secret files.
///
/// A source that cannot be opened or read is reported once in errors()
/// and contributes no more candidates.
class PairGenerator
{
public:
    /// Enumeration order of pairs
    enum class Strategy
    {
        IdentityMajor, ///< For each identity, try every secret
        SecretMajor    ///< For each secret, try every identity
    };

    /// Constructor. The sources must outlive the generator.
    PairGenerator(const Source& identities, const Source& secrets, Strategy strategy);

    /// \return the next pair, or std::nullopt when all pairs have been generated
    auto next() -> std::optional<TrialPair>;

    /// Errors encountered while reading the sources
    auto errors() const -> const std::vector<std::string>& { return m_errors; }

private:
    void start();

    // read all remaining candidates from a source into a vector
    auto drain(const Source& source) -> std::vector<std::string>;

    // read the next secret from m_secretStream, or std::nullopt
    auto pullSecret() -> std::optional<std::string>;

    const Source&  m_identitySource;
    const Source&  m_secretSource;
    const Strategy m_strategy;

    bool m_started = false;

    std::vector<std::string>         m_identities;
    std::vector<std::string>         m_secrets; // IdentityMajor only
    std::unique_ptr<CandidateStream> m_secretStream; // SecretMajor only
    std::optional<std::string>       m_currentSecret; // SecretMajor only

    std::size_t m_outer = 0;
    std::size_t m_inner = 0;

    std::vector<std::string> m_errors;
};

#endif // CREDSWEEP_PAIRGENERATOR_HPP
