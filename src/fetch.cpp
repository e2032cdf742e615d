#include "fetch.h"

#include "libcurl_util.h"
#include "pipeline_error.h"
#include "platform.h"
#include "sha256.h"
#include "tui.h"
#include "uri.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace rtpack {
namespace {

constexpr std::string_view kZipMagic{ "PK" };
constexpr std::string_view kGzipMagic{ "\x1f\x8b" };

std::string to_lower(std::string value) {
  std::ranges::transform(value, value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string hex_prefix(std::vector<unsigned char> const &bytes) {
  if (bytes.empty()) { return "(empty file)"; }
  std::string out;
  for (auto const b : bytes) {
    char buf[4];
    std::snprintf(buf, sizeof(buf), "%02X ", b);
    out += buf;
  }
  out.pop_back();
  return out;
}

std::string join(std::vector<std::string> const &items, std::string_view sep) {
  std::string out;
  for (auto const &item : items) {
    if (!out.empty()) { out += sep; }
    out += item;
  }
  return out;
}

void remove_quietly(std::filesystem::path const &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // namespace

void libcurl_transport::download(std::string const &url,
                                 std::filesystem::path const &destination,
                                 std::chrono::seconds timeout) {
  libcurl_download(url,
                   destination,
                   libcurl_options{ .timeout = timeout,
                                    .connect_timeout =
                                        std::min(timeout, std::chrono::seconds{ 30 }) });
}

command_transport::command_transport(command_runner &runner) : runner_{ runner } {
  if (platform::find_on_path("curl")) {
    program_ = "curl";
  } else if (platform::find_on_path("wget")) {
    program_ = "wget";
  }
}

std::string command_transport::name() const {
  return program_.empty() ? "external downloader" : program_;
}

void command_transport::download(std::string const &url,
                                 std::filesystem::path const &destination,
                                 std::chrono::seconds timeout) {
  if (program_.empty()) { throw std::runtime_error("neither curl nor wget found on PATH"); }

  std::vector<std::string> argv;
  if (program_ == "curl") {
    argv = { "curl",
             "--fail",
             "--location",
             "--silent",
             "--show-error",
             "--max-time",
             std::to_string(timeout.count()),
             "--output",
             destination.string(),
             url };
  } else {
    argv = { "wget",
             "--quiet",
             "--tries=1",
             "--timeout=" + std::to_string(timeout.count()),
             "--output-document=" + destination.string(),
             url };
  }

  auto const out{ runner_.run(argv,
                              command_options{ .timeout = timeout + std::chrono::seconds{ 5 } }) };
  if (!out.ok()) {
    throw std::runtime_error(program_ +
                             (out.timed_out ? " timed out"
                                            : " exited with " + std::to_string(out.exit_code)) +
                             (out.lines.empty() ? "" : ": " + out.tail(5)));
  }
}

std::string_view fetch_archive_magic(std::filesystem::path const &name) {
  auto const ext{ to_lower(name.extension().string()) };
  if (ext == ".gz" || ext == ".tgz") { return kGzipMagic; }
  return kZipMagic;
}

fetcher::fetcher(std::vector<fetch_transport *> transports,
                 fetch_policy policy,
                 std::optional<std::filesystem::path> cache_dir,
                 std::optional<std::filesystem::path> file_root)
    : transports_{ std::move(transports) },
      policy_{ policy },
      cache_dir_{ std::move(cache_dir) },
      file_root_{ std::move(file_root) },
      sleep_{ [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); } } {}

fetch_result fetcher::fetch(artifact_spec const &spec) {
  auto const info{ uri_classify(spec.source) };
  if (info.scheme == uri_scheme::UNKNOWN) {
    throw pipeline_error(error_kind::download,
                         spec.source,
                         "unsupported source for artifact '" + spec.name + "'",
                         "use an http(s) or ftp URL, or a local path");
  }

  if (spec.destination.empty()) {
    throw std::invalid_argument("fetch: destination path is empty");
  }
  auto const destination{ std::filesystem::absolute(spec.destination).lexically_normal() };
  std::filesystem::create_directories(destination.parent_path());

  remove_quietly(destination);

  auto part{ destination };
  part += ".part";
  remove_quietly(part);
  scoped_path_cleanup part_guard{ part };

  fetch_result result{ .resolved_source = info.canonical,
                       .destination = destination,
                       .sha256 = {},
                       .from_cache = false };

  if (try_restore_from_cache(spec, part)) {
    result.from_cache = true;
  } else if (uri_is_remote(info.scheme)) {
    download_with_fallback(spec, info.canonical, part);
  } else {
    auto const source{ uri_resolve_local_file_relative(spec.source, file_root_) };
    result.resolved_source = source;
    if (!std::filesystem::is_regular_file(source)) {
      throw pipeline_error(error_kind::download,
                           source.string(),
                           "local artifact '" + spec.name + "' not found",
                           "check ARTIFACTS." + spec.name + ".source in rtpack.lua");
    }
    std::filesystem::copy_file(source, part, std::filesystem::copy_options::overwrite_existing);
  }

  if (spec.archive) {
    auto const expected_magic{ fetch_archive_magic(uri_extract_filename(spec.source)) };
    auto const prefix{ util_read_prefix(part, expected_magic.size()) };
    if (!std::equal(prefix.begin(),
                    prefix.end(),
                    expected_magic.begin(),
                    expected_magic.end(),
                    [](unsigned char a, char b) { return a == static_cast<unsigned char>(b); })) {
      throw pipeline_error(
          error_kind::integrity,
          result.resolved_source.string(),
          "archive signature mismatch for '" + spec.name + "': expected " +
              hex_prefix({ expected_magic.begin(), expected_magic.end() }) + ", got " +
              hex_prefix(prefix),
          "the download is corrupt or not an archive (often an HTML error page); retry "
          "or pin a different source");
    }
  }

  result.sha256 = sha256_hex(part);
  if (spec.sha256 && to_lower(*spec.sha256) != result.sha256) {
    throw pipeline_error(error_kind::integrity,
                         result.resolved_source.string(),
                         "sha256 mismatch for '" + spec.name + "': expected " +
                             to_lower(*spec.sha256) + ", got " + result.sha256,
                         "the artifact changed upstream or was corrupted; verify the source "
                         "and update the pinned sha256 (rtpack hash <file>)");
  }

  if (!result.from_cache) { store_in_cache(spec, part); }

  platform::atomic_rename(part, destination);
  part_guard.release();

  tui::info("Fetched %s%s -> %s",
            spec.name.c_str(),
            result.from_cache ? " (cached)" : "",
            destination.string().c_str());
  return result;
}

void fetcher::download_with_fallback(artifact_spec const &spec,
                                     std::string const &url,
                                     std::filesystem::path const &part) {
  std::vector<std::string> failures;

  for (auto *transport : transports_) {
    if (!transport->available()) {
      failures.push_back(transport->name() + ": not available on this host");
      tui::debug("fetch: skipping %s, not available", transport->name().c_str());
      continue;
    }

    for (int attempt{ 1 }; attempt <= policy_.attempts; ++attempt) {
      try {
        tui::debug("fetch: %s via %s (attempt %d/%d)",
                   url.c_str(),
                   transport->name().c_str(),
                   attempt,
                   policy_.attempts);
        transport->download(url, part, policy_.timeout);
        return;
      } catch (std::exception const &ex) {
        remove_quietly(part);
        failures.push_back(transport->name() + " #" + std::to_string(attempt) + ": " +
                           ex.what());
        tui::warn("Download of %s failed (%s attempt %d/%d): %s",
                  spec.name.c_str(),
                  transport->name().c_str(),
                  attempt,
                  policy_.attempts,
                  ex.what());
      }

      if (attempt < policy_.attempts) { sleep_(policy_.retry_delay); }
    }
  }

  throw pipeline_error(error_kind::download,
                       url,
                       failures.empty()
                           ? "no download transport configured"
                           : "all transports failed: " + join(failures, "; "),
                       "check network connectivity and proxy settings, or point ARTIFACTS." +
                           spec.name + ".source at a local copy");
}

std::optional<std::filesystem::path> fetcher::cache_path(artifact_spec const &spec) const {
  if (!cache_dir_ || !spec.sha256) { return std::nullopt; }
  return *cache_dir_ / "downloads" / to_lower(*spec.sha256);
}

bool fetcher::try_restore_from_cache(artifact_spec const &spec,
                                     std::filesystem::path const &part) {
  auto const cached{ cache_path(spec) };
  if (!cached || !std::filesystem::is_regular_file(*cached)) { return false; }

  if (sha256_hex(*cached) != to_lower(*spec.sha256)) {
    tui::warn("Discarding corrupt cache entry %s", cached->string().c_str());
    remove_quietly(*cached);
    return false;
  }

  std::filesystem::copy_file(*cached, part, std::filesystem::copy_options::overwrite_existing);
  return true;
}

void fetcher::store_in_cache(artifact_spec const &spec, std::filesystem::path const &verified) {
  auto const cached{ cache_path(spec) };
  if (!cached) { return; }

  auto tmp{ *cached };
  tmp += ".tmp";

  std::error_code ec;
  std::filesystem::create_directories(cached->parent_path(), ec);
  if (!ec) {
    std::filesystem::copy_file(verified,
                               tmp,
                               std::filesystem::copy_options::overwrite_existing,
                               ec);
  }
  if (ec) {
    tui::warn("Could not cache %s: %s", spec.name.c_str(), ec.message().c_str());
    remove_quietly(tmp);
    return;
  }
  platform::atomic_rename(tmp, *cached);
}

}  // namespace rtpack
