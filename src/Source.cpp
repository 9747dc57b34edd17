#include "Source.hpp"

#include "file.hpp"
#include "types.hpp"

namespace
{

class LiteralStream : public CandidateStream
{
public:
    explicit LiteralStream(std::string value)
    : m_value{std::move(value)}
    {
    }

    auto next() -> std::optional<std::string> override
    {
        auto value = std::move(m_value);
        m_value.reset();
        return value;
    }

private:
    std::optional<std::string> m_value;
};

class FileStream : public CandidateStream
{
public:
    FileStream(const std::string& filename, const std::string& resumeAfter)
    : m_filename{filename}
    , m_is{openInput(filename)}
    , m_skipping{!resumeAfter.empty()}
    , m_resumeAfter{resumeAfter}
    {
    }

    auto next() -> std::optional<std::string> override
    {
        for (auto line = std::string{}; std::getline(m_is, line);)
        {
            line = trim(line);
            if (line.empty())
                continue;

            if (m_skipping)
            {
                if (line == m_resumeAfter)
                    m_skipping = false;
                continue;
            }

            return line;
        }

        if (m_is.bad())
            throw FileError{"could not read input file " + m_filename};

        return std::nullopt;
    }

private:
    const std::string m_filename;
    std::ifstream     m_is;
    bool              m_skipping;
    const std::string m_resumeAfter;
};

} // namespace

LiteralSource::LiteralSource(std::string value)
: m_value{std::move(value)}
{
}

auto LiteralSource::open() const -> std::unique_ptr<CandidateStream>
{
    return std::make_unique<LiteralStream>(m_value);
}

auto LiteralSource::count() const -> std::uint64_t
{
    return 1;
}

auto LiteralSource::describe() const -> std::string
{
    return m_value.empty() ? "empty value" : "value " + m_value;
}

FileSource::FileSource(std::string filename, std::string resumeAfter)
: m_filename{std::move(filename)}
, m_resumeAfter{std::move(resumeAfter)}
{
}

auto FileSource::open() const -> std::unique_ptr<CandidateStream>
{
    return std::make_unique<FileStream>(m_filename, m_resumeAfter);
}

auto FileSource::count() const -> std::uint64_t
{
    auto is = std::ifstream{m_filename};

    auto count = std::uint64_t{};
    for (auto line = std::string{}; std::getline(is, line);)
        if (!trim(line).empty())
            count++;

    return count;
}

auto FileSource::describe() const -> std::string
{
    auto description = "file " + m_filename;
    if (!m_resumeAfter.empty())
        description += " after " + m_resumeAfter;

    return description;
}
