#ifndef CREDSWEEP_CREDENTIALTABLE_HPP
#define CREDSWEEP_CREDENTIALTABLE_HPP

#include "TrialExecutor.hpp"
#include "types.hpp"

#include <istream>
#include <set>
#include <string>
#include <utility>

/// \brief Trial executor checking pairs against a local table of valid credentials
///
/// The table file holds one "identity:secret" entry per line. The line is split
/// at the first colon, both parts are trimmed and blank lines are skipped.
/// An entry without colon is an identity with no secret.
class CredentialTable : public TrialExecutor
{
public:
    /// \brief Load a table from a file
    /// \exception FileError if the file cannot be opened
    explicit CredentialTable(const std::string& filename);

    /// Build a table from an input stream
    explicit CredentialTable(std::istream& is);

    auto attempt(const TrialPair& pair, const std::atomic<Progress::State>& state, std::chrono::milliseconds timeout)
        -> Outcome override;

    /// \return the number of entries in the table
    auto size() const -> std::size_t { return m_entries.size(); }

private:
    void load(std::istream& is);

    std::set<std::pair<std::string, std::string>> m_entries;
};

#endif // CREDSWEEP_CREDENTIALTABLE_HPP
