#include "Arguments.hpp"
#include "Checkpoint.hpp"
#include "ConsoleProgress.hpp"
#include "CredentialTable.hpp"
#include "PairGenerator.hpp"
#include "ResultAggregator.hpp"
#include "Scheduler.hpp"
#include "InterruptHandler.hpp"
#include "Source.hpp"
#include "estimate.hpp"
#include "file.hpp"
#include "log.hpp"
#include "version.hpp"

#include <memory>

namespace
{

const char* const usage = R"_(usage: credsweep [options]
Try pairs of identities and secrets against a credential table.

Sources of candidates:
 -u, --identity <value>        Single identity to try
 -U, --identity-file <file>    File containing identities, one per line
 -p, --secret <value>          Single secret to try
 -P, --secret-file <file>      File containing secrets, one per line
                                (without -p or -P, the empty secret is tried)

Target:
 -t, --target <file>           Credential table with one identity:secret
                                entry per line

Options to control the run:
     --identity-first          Try every secret for an identity before moving
                                to the next identity. Both files are loaded in
                                memory. By default, every identity is tried for
                                a secret before moving to the next secret and
                                the secret file is streamed.
 -f, --first-only              Stop after the first success
 -j, --jobs <count>            Number of trials carried out concurrently
                                (default: 10)
     --timeout <milliseconds>  Time allowed to each trial (default: 10000)

     --resume                  Continue after the pair saved in the checkpoint
                                file. Resuming is approximate: the saved pair is
                                the last one completed, not necessarily the last
                                one generated.
     --checkpoint <file>       Checkpoint file (default: credsweep.state)

Other options:
 -o, --output <file>           Append successful pairs to the given file
     --config <file>           Read options from a file, one option per line,
                                before the command line options
 -v, --verbose                 Print more details
     --version                 Show version information and exit
 -h, --help                    Show this help and exit)_";

auto makeIdentitySource(const Arguments& args, const Checkpoint& checkpoint) -> std::unique_ptr<Source>
{
    if (args.identity)
        return std::make_unique<LiteralSource>(*args.identity);
    else
        return std::make_unique<FileSource>(*args.identityFile, checkpoint.lastIdentity);
}

auto makeSecretSource(const Arguments& args, const Checkpoint& checkpoint) -> std::unique_ptr<Source>
{
    if (args.secretFile)
        return std::make_unique<FileSource>(*args.secretFile, checkpoint.lastSecret);
    else
        return std::make_unique<LiteralSource>(args.secret.value_or(""));
}

} // namespace

auto main(int argc, const char* argv[]) -> int
try
{
    // version information
    std::cout << "credsweep " << credsweepVersion << std::endl;

    const auto args = Arguments{argc, argv};
    if (args.help)
    {
        std::cout << usage << std::endl;
        return 0;
    }

    if (args.version)
    {
        // version information was already printed, nothing else to do
        return 0;
    }

    auto checkpointStore = CheckpointStore{args.checkpointFile};
    auto checkpoint      = Checkpoint{};
    if (args.resume)
    {
        if (checkpointStore.exists())
        {
            checkpoint = checkpointStore.load();
            std::cout << "Resuming after " << TrialPair{checkpoint.lastIdentity, checkpoint.lastSecret} << std::endl;
        }
        else
            std::cout << "No checkpoint file " << args.checkpointFile << ", starting from the beginning" << std::endl;
    }

    const auto identities = makeIdentitySource(args, checkpoint);
    const auto secrets    = makeSecretSource(args, checkpoint);

    auto table = CredentialTable{*args.target};

    auto output = std::ofstream{};
    if (args.outputFile)
        output = openAppend(*args.outputFile);

    if (args.verbose)
        std::cout << "Identities: " << identities->describe() << "\n"
                  << "Secrets: " << secrets->describe() << "\n"
                  << "Target: " << *args.target << " (" << table.size() << " entries)\n"
                  << "Jobs: " << args.jobs << "\n"
                  << "Timeout: " << args.timeout << " ms\n"
                  << "Strategy: " << (args.identityFirst ? "identity first" : "secret first") << "\n"
                  << "First only: " << (args.firstOnly ? "yes" : "no") << std::endl;

    const auto estimate = estimateTrials(*identities, *secrets);
    std::cout << "[" << put_time << "] Trying about " << estimate << " pairs" << std::endl;

    auto generator =
        PairGenerator{*identities, *secrets,
                      args.identityFirst ? PairGenerator::Strategy::IdentityMajor : PairGenerator::Strategy::SecretMajor};

    auto options      = Scheduler::Options{};
    options.workers   = args.jobs;
    options.firstOnly = args.firstOnly;
    options.timeout   = std::chrono::milliseconds{args.timeout};
    options.verbose   = args.verbose;

    auto       successes = std::vector<Success>{};
    const auto state     = [&]() -> Progress::State
    {
        auto       progress      = ConsoleProgress{std::cout};
        const auto interrupt     = InterruptHandler{progress.state};
        progress.total           = estimate;

        auto results   = ResultAggregator{progress, args.outputFile ? &output : nullptr};
        auto scheduler = Scheduler{options, table, checkpointStore, progress};
        scheduler.run(generator, results);

        successes = results.successes();
        return progress.state;
    }();

    for (const auto& error : generator.errors())
        std::cout << error << std::endl;

    if (state != Progress::State::Normal)
    {
        if (state == Progress::State::Canceled)
            std::cout << "Operation interrupted by user." << std::endl;
        else if (state == Progress::State::EarlyExit)
            std::cout << "Found a solution. Stopping." << std::endl;

        if (checkpointStore.exists())
            std::cout << "You may resume with the options: --resume --checkpoint " << args.checkpointFile
                      << std::endl;
    }

    std::cout << "[" << put_time << "] ";
    if (successes.empty())
    {
        std::cout << "No valid credentials found." << std::endl;
        return 1;
    }
    else
    {
        std::cout << "Valid credentials" << std::endl;
        for (const auto& success : successes)
            std::cout << success.pair << std::endl;
    }

    return 0;
}
catch (const Arguments::Error& e)
{
    std::cout << e.what() << std::endl;
    std::cout << "Run 'credsweep -h' for help." << std::endl;
    return 1;
}
catch (const BaseError& e)
{
    std::cout << e.what() << std::endl;
    return 1;
}
