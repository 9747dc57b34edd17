#include "types.hpp"

#include <algorithm>
#include <cctype>

BaseError::BaseError(const std::string& type, const std::string& description)
 : std::runtime_error(type + ": " + description + ".")
{}

auto trim(const std::string& str) -> std::string
{
    constexpr auto whitespace = " \t\n\v\f\r";

    const auto first = str.find_first_not_of(whitespace);
    if (first == std::string::npos)
        return {};

    const auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

auto toHex(const std::string& str) -> std::string
{
    constexpr auto digits = "0123456789abcdef";

    auto hex = std::string{};
    hex.reserve(2 * str.size());
    for (const auto c : str)
    {
        const auto b = static_cast<unsigned char>(c);
        hex.push_back(digits[b >> 4]);
        hex.push_back(digits[b & 0xf]);
    }

    return hex;
}

auto fromHex(const std::string& hex) -> std::string
{
    if (hex.size() % 2)
        throw std::invalid_argument{"odd-length hexadecimal string"};
    if (!std::all_of(hex.begin(), hex.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); }))
        throw std::invalid_argument{"invalid hexadecimal digit"};

    auto str = std::string{};
    str.reserve(hex.size() / 2);
    for (auto i = std::size_t{}; i < hex.size(); i += 2)
        str.push_back(static_cast<char>(std::stoul(hex.substr(i, 2), nullptr, 16)));

    return str;
}
