#ifndef CREDSWEEP_LOG_HPP
#define CREDSWEEP_LOG_HPP

#include <iostream>

/// \file log.hpp
/// \brief Output stream manipulators

/// Insert the current local time into the output stream
auto put_time(std::ostream& os) -> std::ostream&;

struct TrialPair; // forward declaration

/// \brief Insert a representation of a trial pair into the stream \a os
/// \relates TrialPair
auto operator<<(std::ostream& os, const TrialPair& pair) -> std::ostream&;

#endif // CREDSWEEP_LOG_HPP
