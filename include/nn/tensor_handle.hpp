/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "tensor/layout.hpp"

namespace snet {

/**
 * @brief Opaque reference to a node of a graph under construction.
 *
 * Carries the node's static shape (batch axis 0 = dynamic) and the layout convention
 * the graph was started with. Handles are plain values; the graph builder owns the nodes.
 */
class TensorHandle {
public:
  TensorHandle() = default;
  TensorHandle(uint64_t graph_id, size_t node_id, std::vector<size_t> shape, Layout layout)
      : graph_id_(graph_id), node_id_(node_id), shape_(std::move(shape)), layout_(layout) {}

  bool valid() const { return graph_id_ != 0; }
  uint64_t graph_id() const { return graph_id_; }
  size_t node_id() const { return node_id_; }

  const std::vector<size_t> &shape() const { return shape_; }
  size_t rank() const { return shape_.size(); }
  Layout layout() const { return layout_; }

  // Rank 4: the layout's channel axis. Rank 2: the feature axis.
  size_t channel_axis() const;
  size_t channels() const;
  size_t height() const;
  size_t width() const;

private:
  uint64_t graph_id_ = 0;
  size_t node_id_ = 0;
  std::vector<size_t> shape_;
  Layout layout_ = Layout::NHWC;
};

}  // namespace snet
