// File: src/core/errors.hpp
//
// Exception types crossing component boundaries
//
// Backends throw TierUnavailableError; the tier router catches it and turns
// it into a TierStatus. Only InvalidIntentError and TierExhaustedError reach
// callers of the MemoryEngine.

#pragma once

#include "core/types.hpp"
#include <stdexcept>
#include <string>

namespace dpcm {

/// Malformed query parameters (negative radius, confidence outside [0, 1], ...)
class InvalidIntentError : public std::invalid_argument {
public:
    explicit InvalidIntentError(const std::string& what)
        : std::invalid_argument("Invalid query intent: " + what) {}
};

/// A backing tier could not be reached or failed an I/O operation
class TierUnavailableError : public std::runtime_error {
public:
    TierUnavailableError(StorageTier tier, const std::string& what)
        : std::runtime_error(std::string("Tier ") + ToString(tier) + " unavailable: " + what),
          tier_(tier) {}

    StorageTier tier() const { return tier_; }

private:
    StorageTier tier_;
};

/// Every queryable tier failed for one request
class TierExhaustedError : public std::runtime_error {
public:
    explicit TierExhaustedError(const std::string& what)
        : std::runtime_error("All storage tiers unavailable: " + what) {}
};

/// Work submitted to a pool that is shutting down
class TaskRejectedError : public std::runtime_error {
public:
    explicit TaskRejectedError(const std::string& what)
        : std::runtime_error("Task rejected: " + what) {}
};

/// Task exceeded its time budget
class TaskTimeoutError : public std::runtime_error {
public:
    explicit TaskTimeoutError(const std::string& what)
        : std::runtime_error("Task timed out: " + what) {}
};

} // namespace dpcm
