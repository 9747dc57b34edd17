#include "CredentialTable.hpp"

#include "file.hpp"

CredentialTable::CredentialTable(const std::string& filename)
{
    auto is = openInput(filename);
    load(is);
}

CredentialTable::CredentialTable(std::istream& is)
{
    load(is);
}

auto CredentialTable::attempt(const TrialPair& pair, const std::atomic<Progress::State>& state,
                              std::chrono::milliseconds) -> Outcome
{
    if (state == Progress::State::Canceled)
        return {Outcome::Kind::NoConnection, "canceled"};

    if (m_entries.count({pair.identity, pair.secret}))
        return {Outcome::Kind::Success, pair.identity + ":" + pair.secret};

    return {Outcome::Kind::AuthFailure, {}};
}

void CredentialTable::load(std::istream& is)
{
    for (auto line = std::string{}; std::getline(is, line);)
    {
        if (trim(line).empty())
            continue;

        if (const auto colon = line.find(':'); colon == std::string::npos)
            m_entries.emplace(trim(line), std::string{});
        else
            m_entries.emplace(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
    }
}
