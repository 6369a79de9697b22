#pragma once
#include <stdexcept>

namespace loa {

// Caller broke a board or search precondition. Never recovered from.
struct PreconditionError : public std::logic_error {
    using std::logic_error::logic_error;
};

// Rejected setting; the object keeps its previous state.
struct ConfigError : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

} // namespace loa
