#include "verifier.h"

#include "extract.h"
#include "pth_patch.h"
#include "smoke_probe.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <string_view>
#include <utility>

namespace rtpack {
namespace {

char const *status_tag(check_status status) {
  switch (status) {
    case check_status::passed: return "PASS";
    case check_status::failed: return "FAIL";
    case check_status::skipped: return "SKIP";
  }
  return "????";
}

std::string first_line(command_output const &out) {
  for (auto const &line : out.lines) {
    auto const trimmed{ util_trim(line) };
    if (!trimmed.empty()) { return std::string{ trimmed }; }
  }
  return {};
}

void check_entry_names(verification_report &report, std::vector<std::string> const &names) {
  std::string unsafe;
  for (auto const &name : names) {
    if (!extract_entry_name_is_safe(name)) { unsafe += (unsafe.empty() ? "" : ", ") + name; }
  }

  if (unsafe.empty()) {
    report.add("entry names are relative",
               check_status::passed,
               std::to_string(names.size()) + " entries");
  } else {
    report.add("entry names are relative", check_status::failed, "absolute-like: " + unsafe);
  }
}

bool check_required_file(verification_report &report,
                         std::filesystem::path const &root,
                         std::string const &entry) {
  bool const present{ std::filesystem::is_regular_file(root / entry) };
  report.add("required file " + entry,
             present ? check_status::passed : check_status::failed,
             present ? "" : "missing from extracted archive");
  return present;
}

void check_path_file(verification_report &report,
                     std::filesystem::path const &root,
                     verify_options const &options) {
  auto const rel{ "runtime/" + options.layout.interpreter_dir + "/" +
                  options.interpreter.path_file_name() };
  std::string const name{ "path file " + rel + " has no byte-order mark" };
  auto const file{ root / rel };

  if (!std::filesystem::is_regular_file(file)) {
    report.add(name, check_status::failed, "missing from extracted archive");
  } else if (pth_starts_with_bom(file)) {
    report.add(name, check_status::failed, "starts with EF BB BF; the interpreter will not start");
  } else {
    report.add(name, check_status::passed);
  }
}

// Whitespace-separated token match, so "3.11.9" does not accept "3.11.90".
bool line_has_token(std::string_view line, std::string_view token) {
  std::size_t pos{ 0 };
  while (pos < line.size()) {
    auto const start{ line.find_first_not_of(" \t\r", pos) };
    if (start == std::string_view::npos) { break; }
    auto end{ line.find_first_of(" \t\r", start) };
    if (end == std::string_view::npos) { end = line.size(); }
    if (line.substr(start, end - start) == token) { return true; }
    pos = end;
  }
  return false;
}

void check_interpreter_version(verification_report &report,
                               command_runner &runner,
                               std::optional<std::filesystem::path> const &interpreter,
                               verify_options const &options) {
  std::string const name{ "interpreter version " + options.interpreter.version };
  if (!interpreter) {
    report.add(name, check_status::skipped, "interpreter binary missing");
    return;
  }

  auto const out{ runner.run({ interpreter->string(), "--version" },
                             command_options{ .timeout = options.timeout }) };
  auto const reported{ first_line(out) };
  bool const matches{ out.ok() &&
                      std::ranges::any_of(out.lines, [&](std::string const &line) {
                        return line_has_token(line, options.interpreter.version);
                      }) };

  if (matches) {
    report.add(name, check_status::passed, reported);
  } else {
    report.add(name,
               check_status::failed,
               out.ok() ? "reported '" + reported + "'"
                        : "interpreter did not run (exit " + std::to_string(out.exit_code) + ")");
  }
}

void check_vcs(verification_report &report,
               command_runner &runner,
               std::optional<std::filesystem::path> const &vcs,
               verify_options const &options) {
  std::string const name{ "version control binary runs" };
  if (!vcs) {
    report.add(name, check_status::skipped, "binary missing");
    return;
  }

  auto const out{ runner.run({ vcs->string(), "--version" },
                             command_options{ .timeout = options.timeout }) };
  if (out.ok()) {
    report.add(name, check_status::passed, first_line(out));
  } else {
    report.add(name,
               check_status::failed,
               out.timed_out ? "timed out" : "exit " + std::to_string(out.exit_code));
  }
}

void check_imports(verification_report &report,
                   command_runner &runner,
                   std::optional<std::filesystem::path> const &interpreter,
                   verify_options const &options) {
  for (auto const &module : options.dependencies.critical_modules) {
    std::string const name{ "import " + module };
    if (!interpreter) {
      report.add(name, check_status::skipped, "interpreter binary missing");
      continue;
    }

    auto const probe{ smoke_probe_run(runner, *interpreter, module, std::nullopt, options.timeout) };
    if (probe.status == probe_status::ok) {
      report.add(name, check_status::passed);
    } else {
      report.add(name, check_status::failed, probe_status_hint(probe.status, module));
    }
  }
}

}  // namespace

void verification_report::add(std::string name, check_status status, std::string detail) {
  checks_.push_back(check_result{ .name = std::move(name),
                                  .status = status,
                                  .detail = std::move(detail) });
}

check_result const *verification_report::first_failure() const {
  auto const it{ std::ranges::find(checks_, check_status::failed, &check_result::status) };
  return it == checks_.end() ? nullptr : &*it;
}

std::size_t verification_report::failure_count() const {
  return static_cast<std::size_t>(
      std::ranges::count(checks_, check_status::failed, &check_result::status));
}

std::string verification_report::render() const {
  std::string out;
  for (auto const &check : checks_) {
    out += "[";
    out += status_tag(check.status);
    out += "] " + check.name;
    if (!check.detail.empty()) { out += ": " + check.detail; }
    out += "\n";
  }

  out += "Summary: " + std::to_string(checks_.size()) + " checks, " +
         std::to_string(failure_count()) + " failed";
  if (auto const *first{ first_failure() }) {
    out += "; first failure: " + first->name;
    if (!first->detail.empty()) { out += " (" + first->detail + ")"; }
  }
  out += "\n";
  return out;
}

char const *verify_outcome_name(verify_outcome outcome) {
  switch (outcome) {
    case verify_outcome::passed: return "passed";
    case verify_outcome::checks_failed: return "checks failed";
    case verify_outcome::archive_not_found: return "archive not found";
    case verify_outcome::extraction_failed: return "extraction failed";
  }
  return "unknown";
}

verify_options verify_options_from(manifest const &m) {
  return verify_options{ .layout = m.layout,
                         .interpreter = m.interpreter,
                         .dependencies = m.dependencies,
                         .timeout = m.network.timeout,
                         .keep = false };
}

verify_result verifier_run(std::filesystem::path const &archive,
                           verify_options const &options,
                           command_runner &runner) {
  if (!std::filesystem::is_regular_file(archive)) {
    return verify_result{ .outcome = verify_outcome::archive_not_found,
                          .report = {},
                          .extracted_dir = std::nullopt,
                          .error = "archive not found: " + archive.string() };
  }

  std::vector<std::string> names;
  try {
    names = extract_list_entries(archive);
  } catch (std::exception const &ex) {
    return verify_result{ .outcome = verify_outcome::extraction_failed,
                          .report = {},
                          .extracted_dir = std::nullopt,
                          .error = ex.what() };
  }

  auto const root{ util_make_temp_dir("rtpack-verify") };
  scoped_path_cleanup root_guard{ root };
  tui::info("Verifying %s in %s", archive.string().c_str(), root.string().c_str());

  try {
    extract(archive, root, extract_options{ .strip_components = 0, .skip_unsafe = true });
  } catch (std::exception const &ex) {
    auto kept{ root_guard.release() };
    tui::warn("Partially extracted archive kept for inspection: %s", kept.string().c_str());
    return verify_result{ .outcome = verify_outcome::extraction_failed,
                          .report = {},
                          .extracted_dir = std::move(kept),
                          .error = ex.what() };
  }

  verify_result result{ .outcome = verify_outcome::passed,
                        .report = {},
                        .extracted_dir = std::nullopt,
                        .error = {} };
  auto &report{ result.report };

  check_entry_names(report, names);

  auto const &layout{ options.layout };
  bool const has_interpreter{ check_required_file(report, root, layout.interpreter_entry()) };
  bool const has_vcs{ check_required_file(report, root, layout.vcs_entry()) };
  check_required_file(report, root, layout.launcher);
  check_required_file(report, root, layout.config_template);

  check_path_file(report, root, options);

  std::optional<std::filesystem::path> interpreter;
  if (has_interpreter) { interpreter = root / layout.interpreter_entry(); }
  std::optional<std::filesystem::path> vcs;
  if (has_vcs) { vcs = root / layout.vcs_entry(); }

  check_interpreter_version(report, runner, interpreter, options);
  check_vcs(report, runner, vcs, options);
  check_imports(report, runner, interpreter, options);

  if (!report.passed()) { result.outcome = verify_outcome::checks_failed; }

  if (!report.passed() || options.keep) {
    result.extracted_dir = root_guard.release();
    if (!report.passed()) {
      tui::warn("Extracted archive kept for inspection: %s",
                result.extracted_dir->string().c_str());
    }
  }

  return result;
}

}  // namespace rtpack
