#pragma once

#include "types.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace collatio {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// A document lacks a substructure the transformation needs (lem, listWit, body, ...).
class StructuralViolation : public Error {
public:
    explicit StructuralViolation(const std::string& message) : Error(message) {}
};

// Raised after a full validation scan; carries every mismatch found.
class ResegmentationMismatch : public Error {
public:
    explicit ResegmentationMismatch(std::vector<SegmentMismatch> mismatches);

    const std::vector<SegmentMismatch>& mismatches() const { return mismatches_; }

private:
    std::vector<SegmentMismatch> mismatches_;
};

class UnknownWitnessMembership : public Error {
public:
    explicit UnknownWitnessMembership(const std::string& message) : Error(message) {}
};

// A witness is cited by more than one reading of the same apparatus.
class AmbiguousWitnessMembership : public Error {
public:
    explicit AmbiguousWitnessMembership(const std::string& message) : Error(message) {}
};

class ConfigurationConflict : public Error {
public:
    explicit ConfigurationConflict(const std::string& message) : Error(message) {}
};

} // namespace collatio
