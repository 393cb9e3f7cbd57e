/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "common/config.hpp"
#include "common/errors.hpp"
#include "logging/logger.hpp"
#include "nn/graph_builder.hpp"
#include "shufflenet/network_builder.hpp"
#include "tensor/tensor.hpp"

#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace snet;
using namespace std;

struct Options {
  string config_path;
  size_t groups = 8;
  bool groups_set = false;
  size_t num_classes = 0;
  vector<size_t> input_shape;
  string layout;
  size_t run_batch = 0;
  string log_level = "info";
  bool show_help = false;
};

void print_usage(const char *program_name) {
  cout << "Usage: " << program_name << " [options]" << endl;
  cout << endl;
  cout << "Options:" << endl;
  cout << "  --config <file>     JSON network configuration" << endl;
  cout << "  --groups <G>        Preset stage table for 1, 2, 3, 4 or 8 groups (default: 8)"
       << endl;
  cout << "  --classes <N>       Number of output classes (default: 1000)" << endl;
  cout << "  --input <HxWxC>     Input shape (default: 224x224x3)" << endl;
  cout << "  --layout <L>        nhwc or nchw (default: nhwc)" << endl;
  cout << "  --run <B>           Run a random batch of B samples through the model" << endl;
  cout << "  --log-level <L>     trace, debug, info, warn, error (default: info)" << endl;
  cout << "  -h, --help          Show this help message" << endl;
  cout << endl;
  cout << "Examples:" << endl;
  cout << "  " << program_name << " --groups 3" << endl;
  cout << "  " << program_name << " --input 64x64x3 --classes 10 --run 2" << endl;
}

size_t parse_count(const char *arg, const string &option) {
  const string message = "--" + option + " requires a positive integer, got '" + arg + "'";
  long long value = 0;
  try {
    value = stoll(arg);
  } catch (const std::exception &) {
    throw ConfigurationError(message);
  }
  if (value <= 0) {
    throw ConfigurationError(message);
  }
  return static_cast<size_t>(value);
}

vector<size_t> parse_input_shape(const string &arg) {
  vector<size_t> shape;
  stringstream ss(arg);
  string item;
  while (getline(ss, item, 'x')) {
    shape.push_back(parse_count(item.c_str(), "input"));
  }
  if (shape.size() != 3) {
    throw ConfigurationError("--input expects HxWxC, got '" + arg + "'");
  }
  return shape;
}

bool parse_arguments(int argc, char *argv[], Options &opts) {
  int c;

  static struct option long_options[] = {{"config", required_argument, 0, 'f'},
                                         {"groups", required_argument, 0, 'g'},
                                         {"classes", required_argument, 0, 'c'},
                                         {"input", required_argument, 0, 'i'},
                                         {"layout", required_argument, 0, 'l'},
                                         {"run", required_argument, 0, 'r'},
                                         {"log-level", required_argument, 0, 'v'},
                                         {"help", no_argument, 0, 'h'},
                                         {0, 0, 0, 0}};

  optind = 1;

  while ((c = getopt_long(argc, argv, "h", long_options, nullptr)) != -1) {
    switch (c) {
    case 'f':
      opts.config_path = optarg;
      break;
    case 'g':
      opts.groups = parse_count(optarg, "groups");
      opts.groups_set = true;
      break;
    case 'c':
      opts.num_classes = parse_count(optarg, "classes");
      break;
    case 'i':
      opts.input_shape = parse_input_shape(optarg);
      break;
    case 'l':
      opts.layout = optarg;
      break;
    case 'r':
      opts.run_batch = parse_count(optarg, "run");
      break;
    case 'v':
      opts.log_level = optarg;
      break;
    case 'h':
      print_usage(argv[0]);
      opts.show_help = true;
      return true;
    case '?':
    default:
      print_usage(argv[0]);
      return false;
    }
  }

  return true;
}

NetworkConfig make_config(const Options &opts) {
  NetworkConfig config =
      opts.config_path.empty() ? default_network_config() : load_from_json(opts.config_path);
  if (opts.groups_set) {
    config.stages = preset_stages(opts.groups);
  }
  if (opts.num_classes > 0) {
    config.num_classes = opts.num_classes;
  }
  if (!opts.input_shape.empty()) {
    config.input_shape = opts.input_shape;
  }
  if (!opts.layout.empty()) {
    config.layout = layout_from_string(opts.layout);
  }
  return config;
}

void run_random_batch(const Model &model, const NetworkConfig &config, size_t batch) {
  const auto &shape = config.input_shape;
  Tensor input(make_image_shape(config.layout, batch, shape[0], shape[1], shape[2]));
  input.fill_random_uniform(0.0f, 1.0f, config.seed + 1);

  Tensor output = model.forward(input);
  const size_t classes = output.dimension(1);
  for (size_t b = 0; b < batch; ++b) {
    const float *row = output.data() + b * classes;
    float sum = 0.0f;
    size_t top = 0;
    for (size_t k = 0; k < classes; ++k) {
      sum += row[k];
      if (row[k] > row[top]) {
        top = k;
      }
    }
    GlobalLogger::info("sample {}: probability sum {:.6f}, top class {} ({:.6f})", b, sum, top,
                       row[top]);
  }
}

int main(int argc, char *argv[]) {
  Options opts;

  try {
    if (!parse_arguments(argc, argv, opts)) {
      return 1;
    }
    if (opts.show_help) {
      return 0;
    }
    GlobalLogger::set_level(log_level_from_string(opts.log_level));

    NetworkConfig config = make_config(opts);
    Model model = create_shufflenet(config);
    model.print_summary(cout);

    if (opts.run_batch > 0) {
      run_random_batch(model, config, opts.run_batch);
    }
  } catch (const ConfigurationError &e) {
    GlobalLogger::error("Configuration error: {}", e.what());
    return 1;
  } catch (const BackendError &e) {
    GlobalLogger::error("Backend error: {}", e.what());
    return 2;
  }

  return 0;
}
