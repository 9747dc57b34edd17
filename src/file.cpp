#include "file.hpp"

FileError::FileError(const std::string& description)
: BaseError{"File error", description}
{
}

auto openInput(const std::string& filename) -> std::ifstream
{
    if (auto is = std::ifstream{filename})
        return is;
    else
        throw FileError{"could not open input file " + filename};
}

auto openOutput(const std::string& filename) -> std::ofstream
{
    if (auto os = std::ofstream{filename, std::ios::trunc})
        return os;
    else
        throw FileError{"could not open output file " + filename};
}

auto openAppend(const std::string& filename) -> std::ofstream
{
    if (auto os = std::ofstream{filename, std::ios::app})
        return os;
    else
        throw FileError{"could not open output file " + filename};
}
