#include "version.h"

#include "libgit2_util.h"
#include "pipeline_error.h"
#include "tui.h"
#include "util.h"

#include "git2.h"
#include "semver.hpp"

#include <memory>

namespace rtpack {

std::optional<std::string> version_normalize(std::string_view candidate) {
  candidate = util_trim(candidate);
  if (candidate.starts_with('v') || candidate.starts_with('V')) { candidate.remove_prefix(1); }
  if (candidate.empty()) { return std::nullopt; }

  semver::version<> parsed;
  if (!semver::parse(candidate, parsed)) { return std::nullopt; }
  return std::string{ candidate };
}

std::optional<std::string> version_from_repository(std::filesystem::path const &repo_dir) {
  libgit2_scope const git_guard;

  git_repository *repo_raw{ nullptr };
  if (git_repository_open_ext(&repo_raw, repo_dir.c_str(), 0, nullptr) != 0) {
    tui::debug("version: %s is not inside a git repository", repo_dir.string().c_str());
    return std::nullopt;
  }
  std::unique_ptr<git_repository, decltype(&git_repository_free)> repo{ repo_raw,
                                                                        git_repository_free };

  git_describe_options opts;
  git_describe_options_init(&opts, GIT_DESCRIBE_OPTIONS_VERSION);
  opts.describe_strategy = GIT_DESCRIBE_TAGS;

  git_describe_result *result_raw{ nullptr };
  if (git_describe_workdir(&result_raw, repo.get(), &opts) != 0) {
    git_error const *err{ git_error_last() };
    tui::debug("version: describe failed: %s", err ? err->message : "unknown error");
    return std::nullopt;
  }
  std::unique_ptr<git_describe_result, decltype(&git_describe_result_free)> result{
    result_raw,
    git_describe_result_free
  };

  git_describe_format_options fmt;
  git_describe_format_options_init(&fmt, GIT_DESCRIBE_FORMAT_OPTIONS_VERSION);

  git_buf buf{};
  if (git_describe_format(&buf, result.get(), &fmt) != 0) {
    git_buf_dispose(&buf);
    return std::nullopt;
  }
  std::string const described{ buf.ptr ? buf.ptr : "" };
  git_buf_dispose(&buf);

  auto normalized{ version_normalize(described) };
  if (!normalized) {
    tui::warn("version: tag description '%s' is not a semantic version", described.c_str());
  }
  return normalized;
}

std::string version_resolve(std::optional<std::string> const &override_version,
                            std::optional<std::filesystem::path> const &repo_dir) {
  if (override_version) {
    if (auto normalized{ version_normalize(*override_version) }) { return *normalized; }
    throw pipeline_error(error_kind::config,
                         *override_version,
                         "version override is not a semantic version",
                         "use MAJOR.MINOR.PATCH, e.g. --version 1.4.0");
  }

  if (repo_dir) {
    if (auto from_tags{ version_from_repository(*repo_dir) }) { return *from_tags; }
  }

  tui::warn("version: no override and no usable tag, using %s", kVersionPlaceholder);
  return kVersionPlaceholder;
}

}  // namespace rtpack
