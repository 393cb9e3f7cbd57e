/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/model.hpp"

#include <fmt/core.h>

#include "common/errors.hpp"

namespace snet {

Model::Model(std::string name, Layout layout, std::vector<Step> steps)
    : name_(std::move(name)), layout_(layout), steps_(std::move(steps)) {
  last_use_.assign(steps_.size(), 0);
  for (size_t i = 0; i < steps_.size(); ++i) {
    for (size_t in : steps_[i].inputs) {
      if (in >= i) {
        throw BackendError("Model step " + std::to_string(i) +
                           " consumes a later step; operations are not topologically ordered");
      }
      last_use_[in] = i;
    }
  }
}

const std::vector<size_t> &Model::input_shape() const {
  if (steps_.empty()) {
    throw BackendError("Model is empty");
  }
  return steps_.front().output_shape;
}

const std::vector<size_t> &Model::output_shape() const {
  if (steps_.empty()) {
    throw BackendError("Model is empty");
  }
  return steps_.back().output_shape;
}

size_t Model::count_operations(const std::string &type) const {
  size_t count = 0;
  for (const auto &step : steps_) {
    if (step.op->type() == type) {
      ++count;
    }
  }
  return count;
}

size_t Model::num_parameters() const {
  size_t total = 0;
  for (const auto &step : steps_) {
    for (const auto &param : step.params) {
      total += param.size();
    }
  }
  return total;
}

size_t Model::num_trainable_parameters() const {
  size_t total = 0;
  for (const auto &step : steps_) {
    for (size_t i = 0; i < step.params.size(); ++i) {
      if (step.param_descs[i].trainable) {
        total += step.params[i].size();
      }
    }
  }
  return total;
}

Vec<std::vector<size_t>> Model::static_input_shapes(size_t index, size_t batch) const {
  Vec<std::vector<size_t>> input_shapes;
  for (size_t in : steps_[index].inputs) {
    std::vector<size_t> shape = steps_[in].output_shape;
    if (!shape.empty() && shape[0] == 0) {
      shape[0] = batch;
    }
    input_shapes.push_back(std::move(shape));
  }
  return input_shapes;
}

uint64_t Model::forward_flops(size_t batch) const {
  uint64_t total = 0;
  for (size_t i = 1; i < steps_.size(); ++i) {
    total += steps_[i].op->forward_flops(static_input_shapes(i, batch));
  }
  return total;
}

void Model::check_input(const Tensor &input) const {
  const auto &expected = input_shape();
  const auto &actual = input.shape();
  bool matches = expected.size() == actual.size();
  for (size_t i = 0; matches && i < expected.size(); ++i) {
    matches = (i == 0 && expected[0] == 0) || expected[i] == actual[i];
  }
  if (!matches || actual.empty() || actual[0] == 0) {
    throw BackendError("Model '" + name_ + "' expects input " + format_shape(expected) +
                       ", got " + format_shape(actual));
  }
}

Tensor Model::forward(const Tensor &input) const {
  check_input(input);

  std::vector<Tensor> values(steps_.size());
  values[0] = input;
  const size_t last = steps_.size() - 1;

  for (size_t i = 1; i < steps_.size(); ++i) {
    const Step &step = steps_[i];
    Vec<const Tensor *> inputs;
    Vec<std::vector<size_t>> input_shapes;
    inputs.reserve(step.inputs.size());
    input_shapes.reserve(step.inputs.size());
    for (size_t in : step.inputs) {
      inputs.push_back(&values[in]);
      input_shapes.push_back(values[in].shape());
    }

    values[i].ensure(step.op->compute_output_shape(input_shapes));
    step.op->forward(inputs, step.params, values[i]);

    // release activations nobody reads anymore
    for (size_t in : step.inputs) {
      if (last_use_[in] == i && in != last) {
        values[in] = Tensor();
      }
    }
  }
  return std::move(values[last]);
}

void Model::print_summary(std::ostream &os) const {
  if (steps_.empty()) {
    os << "Empty model.\n";
    return;
  }

  os << std::string(100, '=') << "\n";
  os << fmt::format("Model Summary: {} ({})\n", name_, to_string(layout_));
  os << std::string(100, '=') << "\n";
  os << fmt::format("{:<32}{:<20}{:<22}{:<12}{:<14}\n", "Op", "Type", "Output Shape",
                    "Params", "Forward Flops");

  for (size_t i = 0; i < steps_.size(); ++i) {
    const Step &step = steps_[i];
    size_t params = 0;
    for (const auto &param : step.params) {
      params += param.size();
    }
    uint64_t flops = 0;
    if (i > 0) {
      flops = step.op->forward_flops(static_input_shapes(i, 1));
    }
    os << fmt::format("{:<32}{:<20}{:<22}{:<12}{:<14}\n", step.op->name(), step.op->type(),
                      format_shape(step.output_shape), params, flops);
  }
  os << std::string(100, '-') << "\n";
  os << fmt::format("Total params: {}\n", num_parameters());
  os << fmt::format("Trainable params: {}\n", num_trainable_parameters());
  os << fmt::format("Non-trainable params: {}\n", num_parameters() - num_trainable_parameters());
  os << fmt::format("Forward FLOPs (per sample): {}\n", forward_flops());
  os << std::string(100, '-') << "\n";
}

}  // namespace snet
