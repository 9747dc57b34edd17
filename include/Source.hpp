#ifndef CREDSWEEP_SOURCE_HPP
#define CREDSWEEP_SOURCE_HPP

/// \file Source.hpp
/// \brief Sources of candidate identities or secrets

#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <string>

/// Lazy, finite sequence of candidates
class CandidateStream
{
public:
    virtual ~CandidateStream() = default;

    /// \brief Get the next candidate
    /// \return the candidate or std::nullopt when the stream has ended
    /// \exception FileError if the underlying file cannot be read anymore
    virtual auto next() -> std::optional<std::string> = 0;
};

/// \brief Description of a candidate sequence
///
/// A source is restarted by opening it again.
class Source
{
public:
    virtual ~Source() = default;

    /// \brief Start a new pass over the candidates
    /// \exception FileError if the underlying file cannot be opened
    virtual auto open() const -> std::unique_ptr<CandidateStream> = 0;

    /// \return the number of candidates held by the whole source, 0 if it cannot be read
    virtual auto count() const -> std::uint64_t = 0;

    /// \return a short human readable description
    virtual auto describe() const -> std::string = 0;
};

/// Source yielding a single value given on the command line
class LiteralSource : public Source
{
public:
    /// Constructor. The value is used as is, and may be empty.
    explicit LiteralSource(std::string value);

    auto open() const -> std::unique_ptr<CandidateStream> override;
    auto count() const -> std::uint64_t override;
    auto describe() const -> std::string override;

private:
    std::string m_value;
};

/// \brief Source reading one candidate per line from a file
///
/// Lines are trimmed and blank lines are skipped.
class FileSource : public Source
{
public:
    /// \brief Constructor
    /// \param filename File to read
    /// \param resumeAfter If not empty, skip every line up to and including
    ///                    the first one equal to this value. If no line matches,
    ///                    the stream is empty.
    explicit FileSource(std::string filename, std::string resumeAfter = {});

    auto open() const -> std::unique_ptr<CandidateStream> override;

    /// Number of non-blank lines in the file, regardless of the resume point
    auto count() const -> std::uint64_t override;

    auto describe() const -> std::string override;

private:
    std::string m_filename;
    std::string m_resumeAfter;
};

#endif // CREDSWEEP_SOURCE_HPP
