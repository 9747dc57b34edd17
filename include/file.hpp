#ifndef CREDSWEEP_FILE_HPP
#define CREDSWEEP_FILE_HPP

/// \file file.hpp
/// \brief Opening files

#include "types.hpp"

#include <fstream>

/// Exception thrown if a file cannot be opened, read or written
class FileError : public BaseError
{
public:
    /// Constructor
    explicit FileError(const std::string& description);
};

/// \brief Open an input file stream
/// \exception FileError if the file cannot be opened
auto openInput(const std::string& filename) -> std::ifstream;

/// \brief Open an output file stream, truncating the file
/// \exception FileError if the file cannot be opened
auto openOutput(const std::string& filename) -> std::ofstream;

/// \brief Open an output file stream positioned at the end of the file
/// \exception FileError if the file cannot be opened
auto openAppend(const std::string& filename) -> std::ofstream;

#endif // CREDSWEEP_FILE_HPP
