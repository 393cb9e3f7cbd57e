/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <stdexcept>
#include <string>

namespace snet {

/**
 * @brief Raised when a network/unit/stage configuration cannot produce a valid graph
 * (divisibility violations, non-positive sizes, unknown layout names, malformed JSON).
 * Always thrown before the offending graph nodes are created.
 */
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string &message) : std::invalid_argument(message) {}
};

/**
 * @brief Raised by a backend operation that cannot be carried out on its inputs
 * (shape mismatch, out-of-range slice, unknown handle).
 */
class BackendError : public std::runtime_error {
public:
  explicit BackendError(const std::string &message) : std::runtime_error(message) {}
};

}  // namespace snet
