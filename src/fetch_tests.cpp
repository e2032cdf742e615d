#include "fetch.h"

#include "sha256.h"
#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr char kZipBytes[]{ "PK\x03\x04 pretend zip body" };

std::string digest_of(std::string_view content) {
  auto const d{ rtpack::sha256(content) };
  return rtpack::util_bytes_to_hex(d.data(), d.size());
}

// Writes `content` on success, or throws `failures` times first.
class fake_transport : public rtpack::fetch_transport {
 public:
  fake_transport(std::string name, std::string content, int failures = 0)
      : name_{ std::move(name) }, content_{ std::move(content) }, failures_{ failures } {}

  std::string name() const override { return name_; }

  void download(std::string const &url,
                std::filesystem::path const &destination,
                std::chrono::seconds timeout) override {
    ++calls;
    last_url = url;
    last_timeout = timeout;
    if (failures_ < 0 || calls <= failures_) {
      rtpack::util_write_file(destination, "partial");
      throw std::runtime_error(name_ + " unreachable");
    }
    rtpack::util_write_file(destination, content_);
  }

  int calls{ 0 };
  std::string last_url;
  std::chrono::seconds last_timeout{ 0 };

 private:
  std::string name_;
  std::string content_;
  int failures_;  // negative: always fail
};

struct fetch_fixture {
  rtpack::test::temp_dir tmp;
  std::vector<std::chrono::milliseconds> sleeps;

  rtpack::fetch_policy policy{ .attempts = 2,
                               .timeout = std::chrono::seconds{ 7 },
                               .retry_delay = std::chrono::milliseconds{ 50 } };

  std::unique_ptr<rtpack::fetcher> make(std::vector<rtpack::fetch_transport *> transports,
                                        bool with_cache = false) {
    auto f{ std::make_unique<rtpack::fetcher>(
        std::move(transports),
        policy,
        with_cache ? std::optional{ tmp / "cache" } : std::nullopt,
        tmp.path()) };
    f->set_sleep([this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    return f;
  }

  rtpack::artifact_spec remote(std::string const &content, bool archive = true) const {
    return rtpack::artifact_spec{ .name = "interpreter",
                                  .source = "https://example.invalid/python-embed.zip",
                                  .destination = tmp / "downloads" / "python-embed.zip",
                                  .sha256 = digest_of(content),
                                  .archive = archive };
  }
};

}  // namespace

TEST_CASE_FIXTURE(fetch_fixture, "fetch copies a verified local artifact") {
  rtpack::util_write_file(tmp / "dist" / "get-pip.py", "print('bootstrap')");
  auto f{ make({}) };

  auto const result{ f->fetch(rtpack::artifact_spec{ .name = "pip_bootstrap",
                                                     .source = "dist/get-pip.py",
                                                     .destination = tmp / "dl" / "get-pip.py",
                                                     .sha256 = digest_of("print('bootstrap')"),
                                                     .archive = false }) };

  CHECK(result.sha256 == digest_of("print('bootstrap')"));
  CHECK_FALSE(result.from_cache);
  CHECK(rtpack::test::read_text(tmp / "dl" / "get-pip.py") == "print('bootstrap')");
  CHECK_FALSE(std::filesystem::exists(tmp / "dl" / "get-pip.py.part"));
}

TEST_CASE_FIXTURE(fetch_fixture, "fetch reports a missing local artifact") {
  auto f{ make({}) };
  auto const err{ rtpack::test::catch_pipeline_error([&] {
    f->fetch(rtpack::artifact_spec{ .name = "vcs",
                                    .source = "dist/missing.zip",
                                    .destination = tmp / "dl" / "git.zip",
                                    .sha256 = std::nullopt,
                                    .archive = true });
  }) };

  REQUIRE(err);
  CHECK(err->kind() == rtpack::error_kind::download);
  CHECK(err->subject().find("missing.zip") != std::string::npos);
}

TEST_CASE_FIXTURE(fetch_fixture, "fetch uses the primary transport when it works") {
  fake_transport primary{ "primary", kZipBytes };
  fake_transport secondary{ "secondary", kZipBytes };
  auto f{ make({ &primary, &secondary }) };

  auto const spec{ remote(kZipBytes) };
  auto const result{ f->fetch(spec) };

  CHECK(primary.calls == 1);
  CHECK(secondary.calls == 0);
  CHECK(primary.last_url == spec.source);
  CHECK(primary.last_timeout == std::chrono::seconds{ 7 });
  CHECK(rtpack::test::read_text(spec.destination) == kZipBytes);
  CHECK(sleeps.empty());
}

TEST_CASE_FIXTURE(fetch_fixture, "fetch retries then falls back to the secondary transport") {
  fake_transport primary{ "primary", kZipBytes, -1 };
  fake_transport secondary{ "secondary", kZipBytes };
  auto f{ make({ &primary, &secondary }) };

  auto const spec{ remote(kZipBytes) };
  f->fetch(spec);

  CHECK(primary.calls == 2);
  CHECK(secondary.calls == 1);
  CHECK(sleeps == std::vector<std::chrono::milliseconds>{ std::chrono::milliseconds{ 50 } });
  CHECK(rtpack::test::read_text(spec.destination) == kZipBytes);
}

TEST_CASE_FIXTURE(fetch_fixture, "fetch recovers on a later attempt of the same transport") {
  fake_transport primary{ "primary", kZipBytes, 1 };
  fake_transport secondary{ "secondary", kZipBytes };
  auto f{ make({ &primary, &secondary }) };

  f->fetch(remote(kZipBytes));

  CHECK(primary.calls == 2);
  CHECK(secondary.calls == 0);
}

TEST_CASE_FIXTURE(fetch_fixture, "fetch fails with a download error when every transport fails") {
  fake_transport primary{ "primary", kZipBytes, -1 };
  fake_transport secondary{ "secondary", kZipBytes, -1 };
  auto f{ make({ &primary, &secondary }) };

  auto const spec{ remote(kZipBytes) };
  auto const err{ rtpack::test::catch_pipeline_error([&] { f->fetch(spec); }) };

  REQUIRE(err);
  CHECK(err->kind() == rtpack::error_kind::download);
  CHECK(err->subject() == spec.source);
  CHECK(err->detail().find("primary unreachable") != std::string::npos);
  CHECK(err->detail().find("secondary unreachable") != std::string::npos);
  CHECK_FALSE(err->hint().empty());
  CHECK(primary.calls == 2);
  CHECK(secondary.calls == 2);
  CHECK_FALSE(std::filesystem::exists(spec.destination));
}

TEST_CASE_FIXTURE(fetch_fixture, "fetch rejects a digest mismatch and leaves no destination") {
  fake_transport primary{ "primary", "PK tampered" };
  auto f{ make({ &primary }) };

  auto spec{ remote(kZipBytes) };
  rtpack::util_write_file(spec.destination, "stale content from an earlier run");

  auto const err{ rtpack::test::catch_pipeline_error([&] { f->fetch(spec); }) };

  REQUIRE(err);
  CHECK(err->kind() == rtpack::error_kind::integrity);
  CHECK(err->detail().find(digest_of("PK tampered")) != std::string::npos);
  CHECK_FALSE(std::filesystem::exists(spec.destination));
  CHECK_FALSE(std::filesystem::exists(spec.destination.string() + ".part"));
}

TEST_CASE_FIXTURE(fetch_fixture, "fetch rejects an archive with the wrong signature") {
  std::string const html{ "<html>rate limited</html>" };
  fake_transport primary{ "primary", html };
  auto f{ make({ &primary }) };

  auto const spec{ remote(html) };  // digest matches; the signature does not
  auto const err{ rtpack::test::catch_pipeline_error([&] { f->fetch(spec); }) };

  REQUIRE(err);
  CHECK(err->kind() == rtpack::error_kind::integrity);
  CHECK(err->detail().find("signature") != std::string::npos);
  CHECK_FALSE(std::filesystem::exists(spec.destination));
}

TEST_CASE_FIXTURE(fetch_fixture, "fetch skips the signature check for non-archives") {
  std::string const script{ "#!/usr/bin/env python\n" };
  fake_transport primary{ "primary", script };
  auto f{ make({ &primary }) };

  auto spec{ remote(script, false) };
  spec.destination = tmp / "downloads" / "get-pip.py";
  CHECK_NOTHROW(f->fetch(spec));
}

TEST_CASE("fetch_archive_magic follows the file extension") {
  CHECK(rtpack::fetch_archive_magic("python.zip") == "PK");
  CHECK(rtpack::fetch_archive_magic("git.tar.gz") == "\x1f\x8b");
  CHECK(rtpack::fetch_archive_magic("git.TGZ") == "\x1f\x8b");
  CHECK(rtpack::fetch_archive_magic("noext") == "PK");
}

TEST_CASE_FIXTURE(fetch_fixture, "fetch reuses verified downloads from the cache") {
  fake_transport primary{ "primary", kZipBytes };
  auto const spec{ remote(kZipBytes) };

  {
    auto f{ make({ &primary }, true) };
    CHECK_FALSE(f->fetch(spec).from_cache);
  }
  CHECK(std::filesystem::exists(tmp / "cache" / "downloads" / *spec.sha256));

  fake_transport offline{ "offline", "", -1 };
  auto f{ make({ &offline }, true) };
  auto const result{ f->fetch(spec) };

  CHECK(result.from_cache);
  CHECK(offline.calls == 0);
  CHECK(rtpack::test::read_text(spec.destination) == kZipBytes);
}

TEST_CASE_FIXTURE(fetch_fixture, "fetch discards a corrupt cache entry") {
  auto const spec{ remote(kZipBytes) };
  rtpack::util_write_file(tmp / "cache" / "downloads" / *spec.sha256, "bit rot");

  fake_transport primary{ "primary", kZipBytes };
  auto f{ make({ &primary }, true) };
  auto const result{ f->fetch(spec) };

  CHECK_FALSE(result.from_cache);
  CHECK(primary.calls == 1);
  CHECK(rtpack::test::read_text(tmp / "cache" / "downloads" / *spec.sha256) == kZipBytes);
}

TEST_CASE_FIXTURE(fetch_fixture, "fetch rejects unsupported schemes") {
  auto f{ make({}) };
  auto spec{ remote(kZipBytes) };
  spec.source = "s3://bucket/python.zip";

  auto const err{ rtpack::test::catch_pipeline_error([&] { f->fetch(spec); }) };
  REQUIRE(err);
  CHECK(err->kind() == rtpack::error_kind::download);
}

TEST_CASE_FIXTURE(fetch_fixture, "fetch skips an external downloader that is not installed") {
  std::optional<std::string> saved_path;
  if (char const *p{ std::getenv("PATH") }) { saved_path = p; }
  ::setenv("PATH", (tmp / "empty-bin").c_str(), 1);
  rtpack::test::scripted_runner runner;
  rtpack::command_transport external{ runner };
  if (saved_path) {
    ::setenv("PATH", saved_path->c_str(), 1);
  } else {
    ::unsetenv("PATH");
  }

  fake_transport primary{ "primary", kZipBytes, -1 };
  auto f{ make({ &primary, &external }) };

  auto const err{ rtpack::test::catch_pipeline_error([&] { f->fetch(remote(kZipBytes)); }) };

  REQUIRE(err);
  CHECK(err->kind() == rtpack::error_kind::download);
  CHECK(err->detail().find("not available on this host") != std::string::npos);
  CHECK_FALSE(external.available());
  CHECK(primary.calls == 2);
  CHECK(sleeps.size() == 1);
  CHECK(runner.calls().empty());
}
