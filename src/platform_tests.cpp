#include "platform.h"

#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace rtpack {
namespace {

// Sets (or unsets) an environment variable and restores it on destruction.
class scoped_env : unmovable {
 public:
  scoped_env(char const *name, char const *value) : name_{ name } {
    if (char const *old{ std::getenv(name) }) { old_ = old; }
    if (value) {
      ::setenv(name, value, 1);
    } else {
      ::unsetenv(name);
    }
  }

  ~scoped_env() {
    if (old_) {
      ::setenv(name_.c_str(), old_->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

 private:
  std::string name_;
  std::optional<std::string> old_;
};

}  // namespace

TEST_CASE("platform::get_exe_path returns valid path") {
  auto const path{ platform::get_exe_path() };

  CHECK(!path.empty());
  CHECK(path.is_absolute());
  CHECK(std::filesystem::is_regular_file(path));
  CHECK(path.filename().string().find("rtpack") != std::string::npos);
}

TEST_CASE("platform::get_default_cache_root honors RTPACK_CACHE_ROOT") {
  scoped_env const root{ "RTPACK_CACHE_ROOT", "/srv/rtpack-cache" };
  CHECK(platform::get_default_cache_root() == std::filesystem::path{ "/srv/rtpack-cache" });
}

#ifndef __APPLE__
TEST_CASE("platform::get_default_cache_root falls back to XDG then HOME") {
  scoped_env const root{ "RTPACK_CACHE_ROOT", nullptr };

  {
    scoped_env const xdg{ "XDG_CACHE_HOME", "/xdg" };
    CHECK(platform::get_default_cache_root() == std::filesystem::path{ "/xdg/rtpack" });
  }

  scoped_env const xdg{ "XDG_CACHE_HOME", nullptr };
  scoped_env const home{ "HOME", "/home/builder" };
  CHECK(platform::get_default_cache_root() ==
        std::filesystem::path{ "/home/builder/.cache/rtpack" });

  scoped_env const no_home{ "HOME", nullptr };
  CHECK_FALSE(platform::get_default_cache_root());
}
#endif

TEST_CASE("platform::find_on_path") {
  auto const sh{ platform::find_on_path("sh") };
  REQUIRE(sh);
  CHECK(sh->filename() == "sh");

  CHECK(platform::find_on_path("/bin/sh") == std::filesystem::path{ "/bin/sh" });
  CHECK_FALSE(platform::find_on_path("rtpack-definitely-not-installed"));
  CHECK_FALSE(platform::find_on_path(""));

  scoped_env const empty_path{ "PATH", nullptr };
  CHECK_FALSE(platform::find_on_path("sh"));
}

TEST_CASE("platform::atomic_rename replaces the destination") {
  test::temp_dir tmp;
  util_write_file(tmp / "a.part", "new");
  util_write_file(tmp / "a", "old");

  platform::atomic_rename(tmp / "a.part", tmp / "a");

  CHECK(test::read_text(tmp / "a") == "new");
  CHECK_FALSE(std::filesystem::exists(tmp / "a.part"));
  CHECK_THROWS_AS(platform::atomic_rename(tmp / "missing", tmp / "b"), std::system_error);
}

}  // namespace rtpack
