#ifndef CREDSWEEP_TYPES_HPP
#define CREDSWEEP_TYPES_HPP

/// \file types.hpp
/// \brief Useful types and utility functions

#include <stdexcept>
#include <string>

/// Base exception type
class BaseError : public std::runtime_error
{
public:
    /// Constructor
    explicit BaseError(const std::string& type, const std::string& description);
};

// utility functions

/// \return a copy of \a str without leading and trailing ASCII whitespace
auto trim(const std::string& str) -> std::string;

/// \return \a str with every byte written as two lowercase hexadecimal digits
auto toHex(const std::string& str) -> std::string;

/// \brief Decode a string written by toHex
/// \exception std::invalid_argument if \a hex is not an even-length hexadecimal string
auto fromHex(const std::string& hex) -> std::string;

#endif // CREDSWEEP_TYPES_HPP
