// pkgindex/project/corpus_config.cpp - Index configuration (pkgindex.yaml)
//
#include "pkgindex/project/corpus_config.hpp"

#include <chrono>
#include <cstdint>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "pkgindex/basic/logging.hpp"
#include "pkgindex/build/known_platforms.hpp"

namespace pkgindex
{

namespace
{

/// Read a list of strings; fails unless node is a sequence
bool parse_string_list(
  const YAML::Node & node, const char * key, std::vector<std::string> & out, std::string & error)
{
  if (!node.IsSequence()) {
    error = fmt::format("environment.{} must be a list", key);
    return false;
  }
  out.clear();
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return true;
}

std::optional<std::string> parse_corpus_section(const YAML::Node & node, CorpusOptions & opts)
{
  if (!node.IsMap()) {
    return std::string("corpus must be a map");
  }

  if (node["max_open_files"]) {
    opts.max_open_files = node["max_open_files"].as<int>();
  }
  if (node["max_open_dirs"]) {
    opts.max_open_dirs = node["max_open_dirs"].as<int>();
  }
  if (node["max_depth"]) {
    opts.max_depth = node["max_depth"].as<int>();
  }
  if (node["index_identifiers"]) {
    opts.index_identifiers = node["index_identifiers"].as<bool>();
  }
  if (node["log_events"]) {
    opts.log_events = node["log_events"].as<bool>();
  }
  if (node["update_interval_ms"]) {
    const auto ms = node["update_interval_ms"].as<int64_t>();
    if (ms < 0) {
      return fmt::format("corpus.update_interval_ms must not be negative (got {})", ms);
    }
    opts.update_interval = std::chrono::milliseconds(ms);
  }
  return std::nullopt;
}

std::optional<std::string> parse_environment_section(
  const YAML::Node & node, build::EnvironmentOptions & env)
{
  if (!node.IsMap()) {
    return std::string("environment must be a map");
  }

  std::string error;
  if (node["goroot"]) {
    env.goroot = node["goroot"].as<std::string>();
  }
  if (node["gopath"]) {
    if (!parse_string_list(node["gopath"], "gopath", env.gopath, error)) {
      return error;
    }
  }
  if (node["goos"]) {
    env.goos = node["goos"].as<std::string>();
    if (!build::is_known_os(env.goos)) {
      return fmt::format("invalid environment.goos: '{}'", env.goos);
    }
  }
  if (node["goarch"]) {
    env.goarch = node["goarch"].as<std::string>();
    if (!build::is_known_arch(env.goarch)) {
      return fmt::format("invalid environment.goarch: '{}'", env.goarch);
    }
  }
  if (node["build_tags"]) {
    if (!parse_string_list(node["build_tags"], "build_tags", env.build_tags, error)) {
      return error;
    }
  }
  if (node["cgo_enabled"]) {
    env.cgo_enabled = node["cgo_enabled"].as<bool>();
  }
  if (node["compiler"]) {
    env.compiler = node["compiler"].as<std::string>();
  }
  if (node["install_suffix"]) {
    env.install_suffix = node["install_suffix"].as<std::string>();
  }
  return std::nullopt;
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  CorpusConfig config;
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration must be a map");
  }

  try {
    if (root["corpus"]) {
      if (auto err = parse_corpus_section(root["corpus"], config.corpus)) {
        return ConfigLoadResult::fail(std::move(*err));
      }
    }
    if (root["environment"]) {
      if (auto err = parse_environment_section(root["environment"], config.environment)) {
        return ConfigLoadResult::fail(std::move(*err));
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_corpus_config(const std::string & yaml)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root);
}

ConfigLoadResult load_corpus_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  auto result = parse_root(root);
  if (result.success) {
    result.config.config_root = fs::absolute(config_path).parent_path();
  }
  return result;
}

std::optional<std::filesystem::path> find_corpus_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_corpus_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::unique_ptr<Corpus> make_corpus(
  const CorpusConfig & config, std::shared_ptr<spdlog::logger> logger)
{
  if (!logger) {
    logger = make_logger();
  }
  auto env = std::make_shared<build::BuildContext>(
    config.environment, config.corpus.update_interval, logger);
  return std::make_unique<Corpus>(std::move(env), config.corpus, std::move(logger));
}

}  // namespace pkgindex
