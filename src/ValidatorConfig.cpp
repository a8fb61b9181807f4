#include "dataset-validator/ValidatorConfig.hpp"
#include "dataset-validator/Logger.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace dsvalidator {

namespace {

template <typename T>
void read_scalar(const YAML::Node &section, const char *key,
                 const std::string &path, T &out) {
  if (!section || !section[key])
    return;
  try {
    out = section[key].as<T>();
  } catch (const YAML::Exception &e) {
    throw std::invalid_argument("Invalid value for '" + path + "." + key +
                                "': " + e.what());
  }
}

} // namespace

std::string to_string(UniquenessStrategy strategy) {
  return strategy == UniquenessStrategy::Bloom ? "bloom" : "exact";
}

ValidatorConfig ValidatorConfig::from_yaml(const YAML::Node &root) {
  ValidatorConfig config;
  if (!root || root.IsNull())
    return config;
  if (!root.IsMap())
    throw std::invalid_argument("Configuration root must be a map");

  const YAML::Node engine = root["engine"];
  read_scalar(engine, "chunk_size", "engine", config.chunk_size);
  read_scalar(engine, "violation_cap", "engine", config.violation_cap);
  read_scalar(engine, "timeout_seconds", "engine", config.timeout_seconds);

  const YAML::Node uniqueness = root["uniqueness"];
  if (uniqueness && uniqueness["strategy"]) {
    std::string strategy;
    read_scalar(uniqueness, "strategy", "uniqueness", strategy);
    if (strategy == "exact") {
      config.uniqueness_strategy = UniquenessStrategy::Exact;
    } else if (strategy == "bloom") {
      config.uniqueness_strategy = UniquenessStrategy::Bloom;
    } else {
      throw std::invalid_argument(
          "Invalid value for 'uniqueness.strategy': expected exact or bloom, "
          "got '" +
          strategy + "'");
    }
  }
  read_scalar(uniqueness, "expected_items", "uniqueness",
              config.bloom_expected_items);
  read_scalar(uniqueness, "false_positive_rate", "uniqueness",
              config.bloom_false_positive_rate);

  const YAML::Node logging = root["logging"];
  read_scalar(logging, "level", "logging", config.log_level);
  read_scalar(logging, "file", "logging", config.log_file);

  const YAML::Node templates = root["templates"];
  if (templates && templates["search_dirs"]) {
    const YAML::Node dirs = templates["search_dirs"];
    if (!dirs.IsSequence())
      throw std::invalid_argument(
          "Invalid value for 'templates.search_dirs': must be a sequence");
    for (const auto &dir : dirs) {
      config.template_dirs.push_back(dir.as<std::string>());
    }
  }

  config.validate();
  return config;
}

ValidatorConfig ValidatorConfig::load_yaml(const std::string &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::BadFile &) {
    throw std::runtime_error("Cannot read configuration file: " + path);
  } catch (const YAML::Exception &e) {
    throw std::invalid_argument(std::string("YAML parse error: ") + e.what());
  }
  auto config = from_yaml(root);
  LOG_DEBUG("CONFIG", "LOAD", "Loaded {} (chunk_size={}, cap={}, unique={})",
            path, config.chunk_size, config.violation_cap,
            to_string(config.uniqueness_strategy));
  return config;
}

void ValidatorConfig::validate() const {
  if (chunk_size == 0)
    throw std::invalid_argument(
        "Invalid value for 'engine.chunk_size': must be > 0");
  if (violation_cap == 0)
    throw std::invalid_argument(
        "Invalid value for 'engine.violation_cap': must be > 0");
  if (timeout_seconds < 0)
    throw std::invalid_argument(
        "Invalid value for 'engine.timeout_seconds': must be >= 0");
  if (bloom_expected_items == 0)
    throw std::invalid_argument(
        "Invalid value for 'uniqueness.expected_items': must be > 0");
  if (!(bloom_false_positive_rate > 0.0 && bloom_false_positive_rate < 1.0))
    throw std::invalid_argument(
        "Invalid value for 'uniqueness.false_positive_rate': must be in (0, 1)");
  for (const char *level : {"trace", "debug", "info", "warn", "warning",
                            "error", "off"}) {
    if (log_level == level)
      return;
  }
  throw std::invalid_argument("Invalid value for 'logging.level': '" +
                              log_level + "'");
}

} // namespace dsvalidator
