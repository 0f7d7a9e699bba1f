// s2sql/project/project_config.hpp - Project configuration (s2sql.yaml)
//
// Parses and validates s2sql.yaml. Command line flags override every value
// read here.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace s2sql
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class ColorMode {
  Auto,    ///< Color when stderr is a terminal
  Always,
  Never,
};

/**
 * Transpile defaults section.
 */
struct TranspileConfig
{
  /// Dialect the input is written in
  std::string read = "singlestore";

  /// Dialect to generate
  std::string write = "singlestore";

  /// Quote every identifier
  bool identify = false;
};

/**
 * Output section.
 */
struct OutputConfig
{
  ColorMode color = ColorMode::Auto;
};

/**
 * Complete project configuration (s2sql.yaml).
 */
struct ProjectConfig
{
  TranspileConfig transpile;
  OutputConfig output;

  /// Directory containing s2sql.yaml
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
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
 * Load a project configuration from an s2sql.yaml file.
 *
 * Dialect names are checked against the dialect registry.
 *
 * @param config_path Path to s2sql.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find s2sql.yaml by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to s2sql.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Contents written by `s2sql init`.
[[nodiscard]] std::string default_project_config_text();

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "s2sql.yaml";

}  // namespace s2sql
