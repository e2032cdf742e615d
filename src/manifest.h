#pragma once

#include "util.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

struct artifact_cfg {
  std::string source;                 // URL or local path
  std::optional<std::string> sha256;  // lowercase hex
  bool archive{ false };
  int strip_components{ 0 };
};

// Canonical relative layout of the bundle. Directory names are joined below
// "runtime/".
struct layout_cfg {
  std::string interpreter_dir{ "python" };
  std::string interpreter_binary{ "python.exe" };
  std::string vcs_dir{ "git" };
  std::string vcs_binary{ "git.exe" };
  std::string launcher{ "Localis.exe" };
  std::string config_template{ "localis_runtime_config.json" };
  std::string archive_basename{ "localis-runtime" };

  std::string interpreter_entry() const;  // runtime/python/python.exe
  std::string vcs_entry() const;          // runtime/git/bin/git.exe
};

struct isolated_package_cfg {
  std::string name{ "llama-cpp-python" };
  std::string module{ "llama_cpp" };
};

struct dependencies_cfg {
  std::string requirements{ "requirements.txt" };  // relative to the app repo
  isolated_package_cfg isolated;
  std::vector<std::string> critical_modules{ "llama_cpp", "fastapi", "uvicorn" };
  std::string package_dir{ "Lib/site-packages" };  // relative to the interpreter dir
};

struct interpreter_cfg {
  std::string version{ "3.11.9" };
  std::string python_version{ "311" };  // major+minor without dot
  std::optional<std::string> platform;  // pip --platform tag for preflight

  std::string path_file_name() const;    // python311._pth
  std::string stdlib_zip_name() const;   // python311.zip
};

struct wheel_index_cfg {
  std::string cpu{ "https://abetlen.github.io/llama-cpp-python/whl/cpu" };
  std::string accelerated_base{ "https://abetlen.github.io/llama-cpp-python/whl" };
  std::vector<std::string> accelerated_tags{ "cu121", "cu122", "cu123", "cu124", "metal" };
};

struct prerequisite_cfg {
  std::string name{ "Microsoft Visual C++ Redistributable (x64)" };
  std::filesystem::path marker;
  std::vector<std::string> args{ "/install", "/quiet", "/norestart" };
  std::vector<int> success_codes{ 0, 1638 };
  std::vector<int> restart_codes{ 3010, 1641 };
};

struct network_cfg {
  int attempts{ 3 };
  std::chrono::seconds timeout{ 120 };
};

struct manifest : unmovable {
  std::filesystem::path manifest_path;

  artifact_cfg interpreter_artifact;
  artifact_cfg vcs_artifact;
  std::optional<artifact_cfg> pip_bootstrap;
  std::optional<artifact_cfg> prerequisite_installer;

  layout_cfg layout;
  dependencies_cfg dependencies;
  interpreter_cfg interpreter;
  wheel_index_cfg wheel_index;
  std::optional<prerequisite_cfg> prerequisite;
  network_cfg network;
  std::optional<std::filesystem::path> app_repo;  // absolute

  manifest() = default;

  // Use the provided path if given, otherwise discover from the current directory.
  // Returns an absolute path or throws if not found.
  static std::filesystem::path find_manifest_path(
      std::optional<std::filesystem::path> const &explicit_path);

  // Walk up from the current directory looking for rtpack.lua; stops at a
  // directory containing .git.
  static std::optional<std::filesystem::path> discover();

  static std::unique_ptr<manifest> load(std::filesystem::path const &manifest_path);
  static std::unique_ptr<manifest> load(std::string_view script,
                                        std::filesystem::path const &manifest_path);
};

}  // namespace rtpack
