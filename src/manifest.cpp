#include "manifest.h"

#include "extract.h"
#include "sha256.h"
#include "sol_util.h"
#include "tui.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rtpack {

namespace {

constexpr char kManifestFilename[]{ "rtpack.lua" };

std::optional<sol::table> get_global_table(sol::state &lua, char const *name) {
  sol::object obj = lua[name];
  if (!obj.valid() || obj.get_type() == sol::type::lua_nil) { return std::nullopt; }
  if (obj.get_type() != sol::type::table) {
    throw std::runtime_error(std::string("Manifest global '") + name + "' must be a table");
  }
  return obj.as<sol::table>();
}

std::string normalize_digest(std::string value, std::string const &context) {
  if (!sha256_is_hex_digest(value)) {
    throw std::runtime_error(context + ": sha256 must be 64 hex characters, got '" + value +
                             "'");
  }
  std::ranges::transform(value, value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

artifact_cfg parse_artifact(sol::table const &table,
                            std::string const &context,
                            bool default_archive) {
  artifact_cfg cfg;
  cfg.source = sol_util_get_required<std::string>(table, "source", context);
  if (cfg.source.empty()) { throw std::runtime_error(context + ": source is empty"); }

  if (auto digest{ sol_util_get_optional<std::string>(table, "sha256", context) }) {
    cfg.sha256 = normalize_digest(std::move(*digest), context);
  }
  cfg.archive = sol_util_get_or_default<bool>(table, "archive", default_archive, context);
  cfg.strip_components = sol_util_get_or_default<int>(table, "strip", 0, context);
  if (cfg.strip_components < 0) {
    throw std::runtime_error(context + ": strip must be non-negative");
  }
  return cfg;
}

std::optional<artifact_cfg> parse_optional_artifact(sol::table const &artifacts,
                                                    char const *key,
                                                    bool default_archive) {
  auto const entry{ sol_util_get_optional<sol::table>(artifacts, key, "ARTIFACTS") };
  if (!entry) { return std::nullopt; }
  return parse_artifact(*entry, std::string{ "ARTIFACTS." } + key, default_archive);
}

void require_relative_name(std::string const &value, char const *field) {
  if (!extract_entry_name_is_safe(value)) {
    throw std::runtime_error(std::string("LAYOUT.") + field +
                             " must be a relative path without '..': '" + value + "'");
  }
}

void parse_layout(sol::table const &t, layout_cfg &layout) {
  auto const read{ [&t](char const *key, std::string &field) {
    field = sol_util_get_or_default<std::string>(t, key, field, "LAYOUT");
    require_relative_name(field, key);
  } };

  read("interpreter_dir", layout.interpreter_dir);
  read("interpreter_binary", layout.interpreter_binary);
  read("vcs_dir", layout.vcs_dir);
  read("vcs_binary", layout.vcs_binary);
  read("launcher", layout.launcher);
  read("config_template", layout.config_template);
  read("archive_basename", layout.archive_basename);
}

void parse_dependencies(sol::table const &t, dependencies_cfg &deps) {
  deps.requirements =
      sol_util_get_or_default<std::string>(t, "requirements", deps.requirements, "DEPENDENCIES");
  deps.package_dir =
      sol_util_get_or_default<std::string>(t, "package_dir", deps.package_dir, "DEPENDENCIES");

  if (auto const isolated{ sol_util_get_optional<sol::table>(t, "isolated", "DEPENDENCIES") }) {
    deps.isolated.name =
        sol_util_get_required<std::string>(*isolated, "name", "DEPENDENCIES.isolated");
    deps.isolated.module =
        sol_util_get_required<std::string>(*isolated, "module", "DEPENDENCIES.isolated");
  }

  if (auto modules{ sol_util_get_array<std::string>(t, "critical_modules", "DEPENDENCIES") }) {
    deps.critical_modules = std::move(*modules);
  }

  if (std::ranges::find(deps.critical_modules, deps.isolated.module) ==
      deps.critical_modules.end()) {
    deps.critical_modules.insert(deps.critical_modules.begin(), deps.isolated.module);
  }
}

void parse_interpreter(sol::table const &t, interpreter_cfg &interp) {
  interp.version = sol_util_get_or_default<std::string>(t, "version", interp.version, "INTERPRETER");
  interp.python_version = sol_util_get_or_default<std::string>(t,
                                                               "python_version",
                                                               interp.python_version,
                                                               "INTERPRETER");
  interp.platform = sol_util_get_optional<std::string>(t, "platform", "INTERPRETER");

  if (interp.python_version.empty() ||
      !std::ranges::all_of(interp.python_version,
                           [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw std::runtime_error("INTERPRETER: python_version must be digits, e.g. \"311\"");
  }
}

void parse_wheel_index(sol::table const &t, wheel_index_cfg &index) {
  index.cpu = sol_util_get_or_default<std::string>(t, "cpu", index.cpu, "WHEEL_INDEX");
  index.accelerated_base = sol_util_get_or_default<std::string>(t,
                                                                "accelerated_base",
                                                                index.accelerated_base,
                                                                "WHEEL_INDEX");
  if (auto tags{ sol_util_get_array<std::string>(t, "accelerated_tags", "WHEEL_INDEX") }) {
    index.accelerated_tags = std::move(*tags);
  }
}

prerequisite_cfg parse_prerequisite(sol::table const &t) {
  prerequisite_cfg cfg;
  cfg.name = sol_util_get_or_default<std::string>(t, "name", cfg.name, "PREREQUISITE");
  cfg.marker = sol_util_get_required<std::string>(t, "marker", "PREREQUISITE");
  if (auto args{ sol_util_get_array<std::string>(t, "args", "PREREQUISITE") }) {
    cfg.args = std::move(*args);
  }
  if (auto codes{ sol_util_get_array<int>(t, "success_codes", "PREREQUISITE") }) {
    cfg.success_codes = std::move(*codes);
  }
  if (auto codes{ sol_util_get_array<int>(t, "restart_codes", "PREREQUISITE") }) {
    cfg.restart_codes = std::move(*codes);
  }

  for (int const code : cfg.restart_codes) {
    if (std::ranges::find(cfg.success_codes, code) != cfg.success_codes.end()) {
      throw std::runtime_error("PREREQUISITE: exit code " + std::to_string(code) +
                               " listed as both success and restart");
    }
  }
  return cfg;
}

void parse_network(sol::table const &t, network_cfg &net) {
  net.attempts = sol_util_get_or_default<int>(t, "attempts", net.attempts, "NETWORK");
  net.timeout = std::chrono::seconds{ sol_util_get_or_default<int>(
      t, "timeout_seconds", static_cast<int>(net.timeout.count()), "NETWORK") };

  if (net.attempts < 1 || net.attempts > 10) {
    throw std::runtime_error("NETWORK: attempts must be between 1 and 10");
  }
  if (net.timeout.count() < 1) {
    throw std::runtime_error("NETWORK: timeout_seconds must be positive");
  }
}

}  // namespace

std::string layout_cfg::interpreter_entry() const {
  return "runtime/" + interpreter_dir + "/" + interpreter_binary;
}

std::string layout_cfg::vcs_entry() const {
  return "runtime/" + vcs_dir + "/bin/" + vcs_binary;
}

std::string interpreter_cfg::path_file_name() const {
  return "python" + python_version + "._pth";
}

std::string interpreter_cfg::stdlib_zip_name() const {
  return "python" + python_version + ".zip";
}

std::optional<std::filesystem::path> manifest::discover() {
  namespace fs = std::filesystem;

  auto cur{ fs::current_path() };

  for (;;) {
    auto const manifest_path{ cur / kManifestFilename };
    if (fs::exists(manifest_path)) { return manifest_path; }

    auto const git_path{ cur / ".git" };
    if (fs::exists(git_path) && fs::is_directory(git_path)) { return std::nullopt; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { return std::nullopt; }

    cur = parent;
  }
}

std::filesystem::path manifest::find_manifest_path(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path) {
    auto const path{ std::filesystem::absolute(*explicit_path) };
    if (!std::filesystem::exists(path)) {
      throw std::runtime_error("manifest not found: " + path.string());
    }
    return path;
  }

  if (auto const discovered{ discover() }) { return *discovered; }
  throw std::runtime_error(std::string("manifest not found: no ") + kManifestFilename +
                           " in the current directory or its parents");
}

std::unique_ptr<manifest> manifest::load(std::filesystem::path const &manifest_path) {
  tui::debug("Loading manifest from file: %s", manifest_path.string().c_str());
  auto const content{ util_load_file(manifest_path) };
  return load(std::string_view{ reinterpret_cast<char const *>(content.data()), content.size() },
              manifest_path);
}

std::unique_ptr<manifest> manifest::load(std::string_view script,
                                         std::filesystem::path const &manifest_path) {
  auto state{ sol_util_make_lua_state() };

  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error(std::string("Failed to execute manifest script: ") + err.what());
  }

  auto m{ std::make_unique<manifest>() };
  m->manifest_path = manifest_path;

  auto const artifacts{ get_global_table(*state, "ARTIFACTS") };
  if (!artifacts) { throw std::runtime_error("Manifest must define 'ARTIFACTS' global as a table"); }

  auto const interpreter_artifact{ parse_optional_artifact(*artifacts, "interpreter", true) };
  auto const vcs_artifact{ parse_optional_artifact(*artifacts, "vcs", true) };
  if (!interpreter_artifact || !vcs_artifact) {
    throw std::runtime_error("ARTIFACTS must define both 'interpreter' and 'vcs'");
  }
  m->interpreter_artifact = *interpreter_artifact;
  m->vcs_artifact = *vcs_artifact;
  m->pip_bootstrap = parse_optional_artifact(*artifacts, "pip_bootstrap", false);
  m->prerequisite_installer = parse_optional_artifact(*artifacts, "prerequisite", false);

  if (auto const t{ get_global_table(*state, "LAYOUT") }) { parse_layout(*t, m->layout); }
  if (auto const t{ get_global_table(*state, "DEPENDENCIES") }) {
    parse_dependencies(*t, m->dependencies);
  }
  if (auto const t{ get_global_table(*state, "INTERPRETER") }) {
    parse_interpreter(*t, m->interpreter);
  }
  if (auto const t{ get_global_table(*state, "WHEEL_INDEX") }) {
    parse_wheel_index(*t, m->wheel_index);
  }
  if (auto const t{ get_global_table(*state, "PREREQUISITE") }) {
    m->prerequisite = parse_prerequisite(*t);
    if (!m->prerequisite_installer) {
      throw std::runtime_error("PREREQUISITE requires ARTIFACTS.prerequisite (the installer)");
    }
  }
  if (auto const t{ get_global_table(*state, "NETWORK") }) { parse_network(*t, m->network); }

  if (auto const t{ get_global_table(*state, "APP") }) {
    if (auto repo{ sol_util_get_optional<std::string>(*t, "repo", "APP") }) {
      std::filesystem::path p{ *repo };
      if (p.is_relative()) { p = manifest_path.parent_path() / p; }
      m->app_repo = std::filesystem::absolute(p).lexically_normal();
    }
  }

  tui::debug("Manifest loaded: interpreter=%s vcs=%s",
             m->interpreter_artifact.source.c_str(),
             m->vcs_artifact.source.c_str());
  return m;
}

}  // namespace rtpack
