#pragma once
#include <string>

namespace agentflow {

// Identifier of every addressable entity (UUID4, lowercase hex)
using ElementId = std::string;

} // namespace agentflow

namespace agentflow::util {

// Generate a random UUID4 string
ElementId generate_id();

// Check the canonical 8-4-4-4-12 form with version nibble 4
bool is_valid_id(const std::string& id);

} // namespace agentflow::util
