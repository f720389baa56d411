#pragma once
#include <cstddef>
#include <string>

namespace chatviz {

// Node identity as carried by the payload. Selection and hover compare these, never object addresses.
using NodeId = std::string;

// Position of an edge inside its payload; stable for the lifetime of one payload identity.
using EdgeId = std::size_t;

// Slot of a node in the GraphModel arena.
using NodeIndex = std::size_t;

} // namespace chatviz
