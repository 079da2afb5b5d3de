// core/errors.hpp - Error types surfaced to callers
#pragma once

#include <stdexcept>
#include <string>

namespace protonlink {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// A requested release tag could not be resolved to a directory
class DiscoveryError : public Error {
public:
  using Error::Error;
};

// An operation that needs at least one installed release found none
class NoCandidatesError : public Error {
public:
  using Error::Error;
};

// The root directory is unusable, or a release directory could not be removed
class LinkError : public Error {
public:
  using Error::Error;
};

} // namespace protonlink
