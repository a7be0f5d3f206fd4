#pragma once

#include <stdexcept>
#include <string>

namespace riverconn::core {

// Base for every error the connectivity engine raises on bad input.
struct Error : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A requested reach/link field does not exist or holds unusable values.
struct InvalidAttribute : public Error {
  using Error::Error;
};

// A kernel or passability parameter is missing, out of range, or of the wrong arity.
struct InvalidParameter : public Error {
  using Error::Error;
};

// Contradictory options (e.g. both contributions disabled).
struct InvalidConfiguration : public Error {
  using Error::Error;
};

// A single prioritization scenario could not be computed.
struct ScenarioFailure : public Error {
  using Error::Error;
};

} // namespace riverconn::core
