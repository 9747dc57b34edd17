#include "Arguments.hpp"

#include "file.hpp"

#include <algorithm>
#include <iterator>
#include <map>

namespace
{

template <typename F>
auto translateIntParseError(F&& f, const std::string& value)
{
    try
    {
        return f(value);
    }
    catch (const std::invalid_argument&)
    {
        throw Arguments::Error{"expected an integer, got \"" + value + "\""};
    }
    catch (const std::out_of_range&)
    {
        throw Arguments::Error{"integer value " + value + " is out of range"};
    }
}

auto parseInt(const std::string& value) -> int
{
    return translateIntParseError([](const std::string& value) { return std::stoi(value, nullptr, 0); }, value);
}

/// \brief Read options from a configuration file
///
/// Each non-blank line not starting with '#' holds an option, optionally
/// followed by whitespace and a value extending to the end of the line.
auto loadConfig(const std::string& filename) -> std::vector<std::string>
{
    auto is     = openInput(filename);
    auto tokens = std::vector<std::string>{};

    for (auto line = std::string{}; std::getline(is, line);)
    {
        line = trim(line);
        if (line.empty() || line.front() == '#')
            continue;

        const auto separator = line.find_first_of(" \t");
        tokens.push_back(line.substr(0, separator));
        if (separator != std::string::npos)
            tokens.push_back(trim(line.substr(separator)));
    }

    return tokens;
}

} // namespace

Arguments::Error::Error(const std::string& description)
: BaseError{"Arguments error", description}
{
}

Arguments::Arguments(int argc, const char* argv[])
: m_args(argv + 1, argv + argc)
{
    expandConfig();

    // parse arguments
    m_current = m_args.cbegin();
    while (!finished())
        parseArgument();

    if (help || version)
        return; // no further checks are needed for those options

    // check constraints on arguments
    if (identity && identityFile)
        throw Error{"-u and -U cannot be used at the same time"};
    if (!identity && !identityFile)
        throw Error{"-u or -U parameter is missing"};

    if (secret && secretFile)
        throw Error{"-p and -P cannot be used at the same time"};

    if (!target)
        throw Error{"-t parameter is missing"};

    if (jobs < 1)
        throw Error{"the number of jobs must be at least 1, got " + std::to_string(jobs)};
    if (timeout < 1)
        throw Error{"the timeout must be at least 1 millisecond, got " + std::to_string(timeout)};

    if (outputFile && (outputFile == identityFile || outputFile == secretFile || outputFile == target))
        throw Error{"-o parameter must not point to an input file"};
}

void Arguments::expandConfig()
{
    const auto it = std::find_if(m_args.begin(), m_args.end(),
                                 [](const std::string& arg) { return arg == "--config"; });
    if (it == m_args.end())
        return;

    if (std::next(it) == m_args.end())
        throw Error{"expected config file, got nothing"};

    // options from the file come first so that the command line takes precedence
    auto args = loadConfig(*std::next(it));
    if (std::find(args.begin(), args.end(), "--config") != args.end())
        throw Error{"--config cannot be used in a config file"};

    args.insert(args.end(), m_args.begin(), it);
    args.insert(args.end(), std::next(it, 2), m_args.end());
    m_args = std::move(args);
}

auto Arguments::finished() const -> bool
{
    return m_current == m_args.cend();
}

void Arguments::parseArgument()
{
    switch (readOption("an option"))
    {
    case Option::identity:
        identity = readString("identity");
        if (identity->empty())
            throw Error{"identity must not be empty"};
        break;
    case Option::identityFile:
        identityFile = readString("identityfile");
        break;
    case Option::secret:
        secret = readString("secret");
        break;
    case Option::secretFile:
        secretFile = readString("secretfile");
        break;
    case Option::target:
        target = readString("targetfile");
        break;
    case Option::identityFirst:
        identityFirst = true;
        break;
    case Option::firstOnly:
        firstOnly = true;
        break;
    case Option::jobs:
        jobs = readInt("count");
        break;
    case Option::timeout:
        timeout = readInt("milliseconds");
        break;
    case Option::resume:
        resume = true;
        break;
    case Option::checkpointFile:
        checkpointFile = readString("checkpointfile");
        break;
    case Option::outputFile:
        outputFile = readString("outputfile");
        break;
    case Option::config:
        throw Error{"--config can be used only once"};
    case Option::verbose:
        verbose = true;
        break;
    case Option::version:
        version = true;
        break;
    case Option::help:
        help = true;
        break;
    }
}

auto Arguments::readString(const std::string& description) -> std::string
{
    if (finished())
        throw Error{"expected " + description + ", got nothing"};

    return *m_current++;
}

auto Arguments::readOption(const std::string& description) -> Arguments::Option
{
    // clang-format off
#define PAIR(string, option) {#string, Option::option}
#define PAIRS(short, long, option) PAIR(short, option), PAIR(long, option)

    static const auto stringToOption = std::map<std::string, Option>{
        PAIRS(-u, --identity,       identity),
        PAIRS(-U, --identity-file,  identityFile),
        PAIRS(-p, --secret,         secret),
        PAIRS(-P, --secret-file,    secretFile),
        PAIRS(-t, --target,         target),
        PAIR (    --identity-first, identityFirst),
        PAIRS(-f, --first-only,     firstOnly),
        PAIRS(-j, --jobs,           jobs),
        PAIR (    --timeout,        timeout),
        PAIR (    --resume,         resume),
        PAIR (    --checkpoint,     checkpointFile),
        PAIRS(-o, --output,         outputFile),
        PAIR (    --config,         config),
        PAIRS(-v, --verbose,        verbose),
        PAIR (    --version,        version),
        PAIRS(-h, --help,           help),
    };
    // clang-format on

#undef PAIR
#undef PAIRS

    const auto str = readString(description);
    if (const auto it = stringToOption.find(str); it == stringToOption.end())
        throw Error{"unknown option " + str};
    else
        return it->second;
}

auto Arguments::readInt(const std::string& description) -> int
{
    return parseInt(readString(description));
}
