#pragma once

#include "vb/world_state.h"
#include <stdexcept>
#include <string>

namespace vb {

// Malformed JSON, a missing field or an unknown enum label
class StateFormatError : public std::runtime_error {
public:
    explicit StateFormatError(const std::string& what) : std::runtime_error(what) {}
};

std::string serializeWorldState(const WorldState& world);

// Throws StateFormatError
WorldState deserializeWorldState(const std::string& text);

} // namespace vb
