#pragma once

#include <stdexcept>
#include <string>

namespace outline {

// Thrown on violation of an operation's contract: an end iterator where a
// node is required, an empty forest where a focus is required, or a
// relocation target that is missing or lies within the moved subtree.
//
// Structural absence (no parent, no next sibling, no match) is never
// reported by exception.

struct invalid_operation: std::invalid_argument {
    explicit invalid_operation(const std::string& what): std::invalid_argument(what) {}
};

} // namespace outline
