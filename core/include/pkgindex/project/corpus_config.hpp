// pkgindex/project/corpus_config.hpp - Index configuration (pkgindex.yaml)
//
// Parses and validates pkgindex.yaml files into CorpusOptions and
// EnvironmentOptions.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/logger.h>

#include "pkgindex/build/build_context.hpp"
#include "pkgindex/index/corpus.hpp"

namespace pkgindex
{

/// Default configuration file name
inline constexpr const char * k_corpus_config_file_name = "pkgindex.yaml";

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete index configuration (pkgindex.yaml).
 */
struct CorpusConfig
{
  CorpusOptions corpus;
  build::EnvironmentOptions environment;

  /// Directory containing pkgindex.yaml
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  CorpusConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(CorpusConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load an index configuration from a pkgindex.yaml file.
 *
 * Missing sections and keys keep their defaults.
 */
[[nodiscard]] ConfigLoadResult load_corpus_config(const std::filesystem::path & config_path);

/// Parse configuration text; config_root is left empty.
[[nodiscard]] ConfigLoadResult parse_corpus_config(const std::string & yaml);

/**
 * Find pkgindex.yaml by searching upward from start_dir (or the directory
 * of start_dir when it names a file).
 */
[[nodiscard]] std::optional<std::filesystem::path> find_corpus_config(
  const std::filesystem::path & start_dir);

/// Construct a Corpus backed by a BuildContext built from config.
[[nodiscard]] std::unique_ptr<Corpus> make_corpus(
  const CorpusConfig & config, std::shared_ptr<spdlog::logger> logger = nullptr);

}  // namespace pkgindex
