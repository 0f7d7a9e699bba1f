// s2sql/project/project_config.cpp - Project configuration implementation
//
#include "s2sql/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include "s2sql/dialect/dialect_registry.hpp"

namespace s2sql
{

namespace
{

/// Read a dialect name and check that it is registered
bool parse_dialect(
  const YAML::Node & node, std::string_view key, std::string & out, std::string & error)
{
  if (!node) {
    return true;
  }
  if (!node.IsScalar()) {
    error = "transpile." + std::string(key) + " must be a string";
    return false;
  }
  const auto name = node.as<std::string>();
  if (!dialect::DialectRegistry::instance().find(name)) {
    error = "invalid transpile." + std::string(key) + ": unknown dialect '" + name + "'";
    return false;
  }
  out = name;
  return true;
}

std::optional<ColorMode> parse_color(const std::string & text)
{
  if (text == "auto") return ColorMode::Auto;
  if (text == "always") return ColorMode::Always;
  if (text == "never") return ColorMode::Never;
  return std::nullopt;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  // An empty file is a valid configuration
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail(
      "top level of " + config_path.filename().string() + " must be a map");
  }

  try {
    // Parse 'transpile' section
    if (root["transpile"]) {
      const auto & tr = root["transpile"];
      if (!tr.IsMap()) {
        return ConfigLoadResult::fail("transpile must be a map");
      }

      std::string error;
      if (
        !parse_dialect(tr["read"], "read", config.transpile.read, error) ||
        !parse_dialect(tr["write"], "write", config.transpile.write, error)) {
        return ConfigLoadResult::fail(error);
      }

      if (tr["identify"]) {
        config.transpile.identify = tr["identify"].as<bool>();
      }
    }

    // Parse 'output' section
    if (root["output"]) {
      const auto & out = root["output"];
      if (!out.IsMap()) {
        return ConfigLoadResult::fail("output must be a map");
      }
      if (out["color"]) {
        const auto text = out["color"].as<std::string>();
        const auto mode = parse_color(text);
        if (!mode) {
          return ConfigLoadResult::fail(
            "invalid output.color: '" + text + "' (must be 'auto', 'always' or 'never')");
        }
        config.output.color = *mode;
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string default_project_config_text()
{
  return "transpile:\n"
         "  read: singlestore\n"
         "  write: singlestore\n"
         "  identify: false\n"
         "\n"
         "output:\n"
         "  color: auto\n";
}

}  // namespace s2sql
