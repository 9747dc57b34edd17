#include "PairGenerator.hpp"

#include "file.hpp"

PairGenerator::PairGenerator(const Source& identities, const Source& secrets, Strategy strategy)
: m_identitySource{identities}
, m_secretSource{secrets}
, m_strategy{strategy}
{
}

auto PairGenerator::next() -> std::optional<TrialPair>
{
    if (!m_started)
        start();

    if (m_strategy == Strategy::IdentityMajor)
    {
        if (m_inner == m_secrets.size())
        {
            m_inner = 0;
            m_outer++;
        }

        if (m_outer >= m_identities.size() || m_secrets.empty())
            return std::nullopt;

        return TrialPair{m_identities[m_outer], m_secrets[m_inner++]};
    }
    else
    {
        if (m_identities.empty())
        {
            m_secretStream.reset();
            return std::nullopt;
        }

        if (m_inner == m_identities.size())
        {
            m_inner         = 0;
            m_currentSecret = pullSecret();
        }

        if (!m_currentSecret)
            return std::nullopt;

        return TrialPair{m_identities[m_inner++], *m_currentSecret};
    }
}

void PairGenerator::start()
{
    m_started    = true;
    m_identities = drain(m_identitySource);

    if (m_strategy == Strategy::IdentityMajor)
        m_secrets = drain(m_secretSource);
    else
    {
        try
        {
            m_secretStream = m_secretSource.open();
        }
        catch (const FileError& e)
        {
            m_errors.push_back(e.what());
        }

        // without identities, the secret stream is only opened so that an open failure is reported
        if (!m_identities.empty())
            m_currentSecret = pullSecret();
    }
}

auto PairGenerator::drain(const Source& source) -> std::vector<std::string>
{
    auto candidates = std::vector<std::string>{};

    try
    {
        const auto stream = source.open();
        while (auto candidate = stream->next())
            candidates.push_back(std::move(*candidate));
    }
    catch (const FileError& e)
    {
        m_errors.push_back(e.what());
    }

    return candidates;
}

auto PairGenerator::pullSecret() -> std::optional<std::string>
{
    if (!m_secretStream)
        return std::nullopt;

    try
    {
        if (auto secret = m_secretStream->next())
            return secret;
    }
    catch (const FileError& e)
    {
        m_errors.push_back(e.what());
    }

    m_secretStream.reset();
    return std::nullopt;
}
