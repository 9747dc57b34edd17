#ifndef CREDSWEEP_ARGUMENTS_HPP
#define CREDSWEEP_ARGUMENTS_HPP

#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

/// Parse and store arguments
class Arguments
{
public:
    /// Exception thrown if an argument is not valid
    class Error : public BaseError
    {
    public:
        /// Constructor
        Error(const std::string& description);
    };

    /// \brief Constructor parsing command line arguments
    /// \exception Error if an argument is not valid
    /// \exception FileError if the file given with --config cannot be opened
    Arguments(int argc, const char* argv[]);

    std::optional<std::string> identity;     ///< Single identity to try
    std::optional<std::string> identityFile; ///< File containing identities, one per line

    std::optional<std::string> secret;     ///< Single secret to try
    std::optional<std::string> secretFile; ///< File containing secrets, one per line

    /// Credential table against which pairs are checked
    std::optional<std::string> target;

    /// Tell whether to try every secret for an identity before moving to the next identity
    bool identityFirst = false;

    /// Tell whether to stop after the first success instead of trying all pairs
    bool firstOnly = false;

    /// Number of trials carried out concurrently
    int jobs = 10;

    /// Time allowed to each trial, in milliseconds
    int timeout = 10000;

    /// Tell whether to continue from the last saved checkpoint
    bool resume = false;

    /// File where the last attempted pair is saved
    std::string checkpointFile = "credsweep.state";

    /// File to which successes are appended
    std::optional<std::string> outputFile;

    /// Tell whether to print more details
    bool verbose = false;

    /// Tell whether version information is needed or not
    bool version = false;

    /// Tell whether help message is needed or not
    bool help = false;

private:
    std::vector<std::string>                 m_args;
    std::vector<std::string>::const_iterator m_current;

    bool finished() const;

    void parseArgument();

    // replace --config <file> by the options read from the file
    void expandConfig();

    enum class Option
    {
        identity,
        identityFile,
        secret,
        secretFile,
        target,
        identityFirst,
        firstOnly,
        jobs,
        timeout,
        resume,
        checkpointFile,
        outputFile,
        config,
        verbose,
        version,
        help
    };

    std::string readString(const std::string& description);
    Option      readOption(const std::string& description);
    int         readInt(const std::string& description);
};

#endif // CREDSWEEP_ARGUMENTS_HPP
