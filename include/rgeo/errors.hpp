#pragma once
#include <stdexcept>

namespace rgeo {

// Malformed route input (too short, mismatched arrays, bad lap size).
class ConfigurationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

} // namespace rgeo
