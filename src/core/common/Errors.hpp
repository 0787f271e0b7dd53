#pragma once
#include <stdexcept>
#include <string>

namespace sdi {

// Malformed ingestion attributes (missing or ill-typed key). Caller's bug.
struct InvalidInput : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// A gatherer could not read the header fields it needs from a file.
struct CorruptSourceFile : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Internal invariant broke (e.g. two live actions share type + destination).
struct ConsistencyViolation : std::logic_error {
  using std::logic_error::logic_error;
};

} // namespace sdi
