/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */

#include "common/config.hpp"

#include <fstream>
#include <limits>
#include <type_traits>

#include "common/errors.hpp"

namespace snet {

namespace {

template <typename T = size_t>
T get_unsigned(const nlohmann::json &j, const std::string &key,
               std::type_identity_t<T> default_value) {
  if (!j.contains(key)) {
    return default_value;
  }
  const auto &value = j.at(key);
  if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<long long>() < 0)) {
    throw ConfigurationError("Config key '" + key + "' must be a non-negative integer, got " +
                             value.dump());
  }
  const auto raw = value.get<unsigned long long>();
  if (raw > std::numeric_limits<T>::max()) {
    throw ConfigurationError("Config key '" + key + "' is out of range, got " + value.dump());
  }
  return static_cast<T>(raw);
}

Size2 parse_kernel(const nlohmann::json &value) {
  if (value.is_number_integer() && value.get<long long>() > 0) {
    size_t k = value.get<size_t>();
    return {k, k};
  }
  if (value.is_array() && value.size() == 2 && value[0].is_number_integer() &&
      value[1].is_number_integer() && value[0].get<long long>() > 0 &&
      value[1].get<long long>() > 0) {
    return {value[0].get<size_t>(), value[1].get<size_t>()};
  }
  throw ConfigurationError("kernel_size must be a positive integer or [kh, kw], got " +
                           value.dump());
}

StageConfig parse_stage(const nlohmann::json &j, int default_stage) {
  if (!j.is_object()) {
    throw ConfigurationError("Each stage must be a JSON object, got " + j.dump());
  }
  if (!j.contains("filters")) {
    throw ConfigurationError("Stage " + j.dump() + " is missing 'filters'");
  }
  StageConfig stage;
  stage.filters = get_unsigned(j, "filters", 0);
  stage.kernel_size = j.contains("kernel_size") ? parse_kernel(j.at("kernel_size")) : Size2{3, 3};
  stage.groups = get_unsigned(j, "groups", 8);
  stage.repeat = get_unsigned(j, "repeat", 1);
  if (j.contains("stage")) {
    if (!j.at("stage").is_number_integer()) {
      throw ConfigurationError("Stage number must be an integer, got " + j.at("stage").dump());
    }
    const auto &value = j.at("stage");
    if (value.is_number_unsigned() ? value.get<unsigned long long>() >
                                         static_cast<unsigned long long>(
                                             std::numeric_limits<int>::max())
                                   : (value.get<long long>() < std::numeric_limits<int>::min() ||
                                      value.get<long long>() > std::numeric_limits<int>::max())) {
      throw ConfigurationError("Stage number is out of range, got " + value.dump());
    }
    stage.stage = static_cast<int>(value.get<long long>());
  } else {
    stage.stage = default_stage;
  }
  return stage;
}

std::vector<StageConfig> make_stages(size_t w2, size_t w3, size_t w4, size_t groups) {
  return {
      {w2, {3, 3}, groups, 4, 2},
      {w3, {3, 3}, groups, 8, 3},
      {w4, {3, 3}, groups, 4, 4},
  };
}

} // namespace

std::vector<StageConfig> default_stages() { return make_stages(384, 768, 1536, 8); }

std::vector<StageConfig> preset_stages(size_t groups) {
  switch (groups) {
  case 1:
    return make_stages(144, 288, 576, 1);
  case 2:
    return make_stages(200, 400, 800, 2);
  case 3:
    return make_stages(240, 480, 960, 3);
  case 4:
    return make_stages(272, 544, 1088, 4);
  case 8:
    return default_stages();
  default:
    throw ConfigurationError("No preset stage table for " + std::to_string(groups) +
                             " groups (expected 1, 2, 3, 4 or 8)");
  }
}

NetworkConfig default_network_config() { return NetworkConfig(); }

nlohmann::json NetworkConfig::to_json() const {
  nlohmann::json j;
  j["input_shape"] = input_shape;
  j["num_classes"] = num_classes;
  j["layout"] = to_string(layout);
  j["stem_filters"] = stem_filters;
  j["bottleneck_ratio"] = bottleneck_ratio;
  j["seed"] = seed;

  nlohmann::json stage_array = nlohmann::json::array();
  for (const auto &stage : stages) {
    stage_array.push_back({{"filters", stage.filters},
                           {"kernel_size", {stage.kernel_size.h, stage.kernel_size.w}},
                           {"groups", stage.groups},
                           {"repeat", stage.repeat},
                           {"stage", stage.stage}});
  }
  j["stages"] = stage_array;
  return j;
}

NetworkConfig NetworkConfig::from_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw ConfigurationError("Network config must be a JSON object");
  }
  NetworkConfig config;

  if (j.contains("input_shape")) {
    const auto &shape = j.at("input_shape");
    if (!shape.is_array() || shape.size() != 3) {
      throw ConfigurationError("input_shape must be [height, width, channels], got " +
                               shape.dump());
    }
    config.input_shape.clear();
    for (const auto &dim : shape) {
      if (!dim.is_number_integer() || dim.get<long long>() <= 0) {
        throw ConfigurationError("input_shape entries must be positive integers, got " +
                                 shape.dump());
      }
      config.input_shape.push_back(dim.get<size_t>());
    }
  }

  config.num_classes = get_unsigned(j, "num_classes", config.num_classes);
  config.stem_filters = get_unsigned(j, "stem_filters", config.stem_filters);
  config.seed = get_unsigned<unsigned long long>(j, "seed", 0);

  if (j.contains("layout")) {
    if (!j.at("layout").is_string()) {
      throw ConfigurationError("layout must be a string, got " + j.at("layout").dump());
    }
    config.layout = layout_from_string(j.at("layout").get<std::string>());
  }

  if (j.contains("bottleneck_ratio")) {
    if (!j.at("bottleneck_ratio").is_number()) {
      throw ConfigurationError("bottleneck_ratio must be a number, got " +
                               j.at("bottleneck_ratio").dump());
    }
    config.bottleneck_ratio = j.at("bottleneck_ratio").get<double>();
    if (!(config.bottleneck_ratio > 0.0 && config.bottleneck_ratio <= 1.0)) {
      throw ConfigurationError("bottleneck_ratio must be in (0, 1], got " +
                               j.at("bottleneck_ratio").dump());
    }
  }

  if (j.contains("stages")) {
    const auto &stages = j.at("stages");
    if (!stages.is_array()) {
      throw ConfigurationError("stages must be an array, got " + stages.dump());
    }
    config.stages.clear();
    int next_stage = 2;
    for (const auto &stage : stages) {
      config.stages.push_back(parse_stage(stage, next_stage));
      next_stage = config.stages.back().stage + 1;
    }
  } else {
    config.stages = preset_stages(get_unsigned(j, "groups", 8));
  }
  return config;
}

NetworkConfig load_from_json(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigurationError("Cannot open config file: " + path);
  }
  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error &e) {
    throw ConfigurationError("Invalid JSON in " + path + ": " + e.what());
  }
  return NetworkConfig::from_json(j);
}

}  // namespace snet
