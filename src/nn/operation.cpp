/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/operation.hpp"

#include "common/errors.hpp"

namespace snet {

void Operation::expect_inputs(const Vec<std::vector<size_t>> &input_shapes, size_t count) const {
  if (input_shapes.size() != count) {
    throw BackendError(type() + " '" + name_ + "' expects " + std::to_string(count) +
                       " input(s), got " + std::to_string(input_shapes.size()));
  }
}

void Operation::expect_rank(const std::vector<size_t> &shape, size_t rank) const {
  if (shape.size() != rank) {
    throw BackendError(type() + " '" + name_ + "' expects a rank-" + std::to_string(rank) +
                       " input, got " + format_shape(shape));
  }
}

}  // namespace snet
