#pragma once

#include "command_runner.h"
#include "util.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

// One external file to retrieve. Constructed per run from the manifest.
struct artifact_spec {
  std::string name;                   // label used in diagnostics
  std::string source;                 // URL or local path
  std::filesystem::path destination;
  std::optional<std::string> sha256;  // lowercase hex
  bool archive{ false };              // validate the magic signature
};

// Shared by every transport: each transport gets `attempts` tries, each try is
// bounded by `timeout`.
struct fetch_policy {
  int attempts{ 3 };
  std::chrono::seconds timeout{ 120 };
  std::chrono::milliseconds retry_delay{ 2000 };
};

// A way of moving one remote URL to a local file. Implementations throw
// std::runtime_error on failure.
class fetch_transport : unmovable {
 public:
  virtual ~fetch_transport() = default;
  virtual std::string name() const = 0;
  // False when the transport cannot work on this host at all; it is skipped
  // without spending attempts.
  virtual bool available() const { return true; }
  virtual void download(std::string const &url,
                        std::filesystem::path const &destination,
                        std::chrono::seconds timeout) = 0;

 protected:
  fetch_transport() = default;
};

class libcurl_transport : public fetch_transport {
 public:
  std::string name() const override { return "libcurl"; }
  void download(std::string const &url,
                std::filesystem::path const &destination,
                std::chrono::seconds timeout) override;
};

// Secondary transport: an external curl or wget found on PATH.
class command_transport : public fetch_transport {
 public:
  explicit command_transport(command_runner &runner);

  std::string name() const override;
  bool available() const override { return !program_.empty(); }
  void download(std::string const &url,
                std::filesystem::path const &destination,
                std::chrono::seconds timeout) override;

 private:
  command_runner &runner_;
  std::string program_;  // empty when neither tool is installed
};

struct fetch_result {
  std::filesystem::path resolved_source;
  std::filesystem::path destination;
  std::string sha256;
  bool from_cache{ false };
};

// Archive magic for a file name: "PK" for zip, 1F 8B for gzip. Zip otherwise.
std::string_view fetch_archive_magic(std::filesystem::path const &name);

class fetcher : unmovable {
 public:
  using sleep_fn = std::function<void(std::chrono::milliseconds)>;

  // Transports are tried in order. `cache_dir` holds verified downloads keyed by
  // digest; `file_root` anchors relative local sources.
  fetcher(std::vector<fetch_transport *> transports,
          fetch_policy policy,
          std::optional<std::filesystem::path> cache_dir,
          std::optional<std::filesystem::path> file_root);

  // Produces the artifact at spec.destination or throws pipeline_error
  // (download or integrity). Unverified bytes never reach the destination.
  fetch_result fetch(artifact_spec const &spec);

  void set_sleep(sleep_fn fn) { sleep_ = std::move(fn); }

 private:
  void download_with_fallback(artifact_spec const &spec,
                              std::string const &url,
                              std::filesystem::path const &part);
  std::optional<std::filesystem::path> cache_path(artifact_spec const &spec) const;
  bool try_restore_from_cache(artifact_spec const &spec, std::filesystem::path const &part);
  void store_in_cache(artifact_spec const &spec, std::filesystem::path const &verified);

  std::vector<fetch_transport *> transports_;
  fetch_policy policy_;
  std::optional<std::filesystem::path> cache_dir_;
  std::optional<std::filesystem::path> file_root_;
  sleep_fn sleep_;
};

}  // namespace rtpack
