#include "Checkpoint.hpp"

#include "file.hpp"

#include <filesystem>
#include <sstream>

namespace
{

auto readField(std::istream& is, const std::string& key) -> std::string
{
    auto line = std::string{};
    if (!std::getline(is, line))
        throw CheckpointStore::Error{"missing " + key + " field"};

    auto fields = std::istringstream{line};
    auto name   = std::string{};
    auto hex    = std::string{};
    fields >> name >> hex;
    if (name != key)
        throw CheckpointStore::Error{"expected " + key + " field, got \"" + line + "\""};

    try
    {
        return fromHex(hex);
    }
    catch (const std::invalid_argument&)
    {
        throw CheckpointStore::Error{"expected " + key + " in hexadecimal, got " + hex};
    }
}

} // namespace

CheckpointStore::Error::Error(const std::string& description)
: BaseError{"Checkpoint error", description}
{
}

CheckpointStore::CheckpointStore(std::string filename)
: m_filename{std::move(filename)}
{
}

void CheckpointStore::save(const TrialPair& pair)
{
    const auto lock = std::scoped_lock{m_mutex};

    // write a complete record aside, then replace the previous one at once
    const auto temporary = m_filename + ".tmp";
    {
        auto os = openOutput(temporary);
        os << "identity " << toHex(pair.identity) << "\n"
           << "secret " << toHex(pair.secret) << "\n";
        os.flush();
        if (!os)
            throw FileError{"could not write checkpoint file " + temporary};
    }

    auto ec = std::error_code{};
    std::filesystem::rename(temporary, m_filename, ec);
    if (ec)
        throw FileError{"could not replace checkpoint file " + m_filename + " (" + ec.message() + ")"};
}

auto CheckpointStore::load() const -> Checkpoint
{
    const auto lock = std::scoped_lock{m_mutex};

    if (!exists())
        return {};

    auto is         = openInput(m_filename);
    auto checkpoint = Checkpoint{};
    checkpoint.lastIdentity = readField(is, "identity");
    checkpoint.lastSecret   = readField(is, "secret");

    return checkpoint;
}

auto CheckpointStore::exists() const -> bool
{
    auto       ec     = std::error_code{};
    const auto result = std::filesystem::exists(m_filename, ec);
    if (ec)
        throw FileError{"could not access checkpoint file " + m_filename + " (" + ec.message() + ")"};

    return result;
}
