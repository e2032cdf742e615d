#if defined(_WIN32)
#error "platform_posix.cpp should not be compiled on Windows builds"
#else

#include "platform.h"

#include <unistd.h>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rtpack::platform {

std::optional<std::filesystem::path> get_default_cache_root() {
  // RTPACK_CACHE_ROOT takes precedence
  if (char const *env_root{ std::getenv("RTPACK_CACHE_ROOT") }) {
    return std::filesystem::path{ env_root };
  }

#ifdef __APPLE__
  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / "Library" / "Caches" / "rtpack";
  }
#else
  if (char const *xdg_cache{ std::getenv("XDG_CACHE_HOME") }) {
    return std::filesystem::path{ xdg_cache } / "rtpack";
  }

  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / ".cache" / "rtpack";
  }
#endif

  return std::nullopt;
}

char const *get_default_cache_root_env_vars() {
#ifdef __APPLE__
  return "RTPACK_CACHE_ROOT or HOME";
#else
  return "RTPACK_CACHE_ROOT, XDG_CACHE_HOME or HOME";
#endif
}

std::filesystem::path get_exe_path() {
#ifdef __APPLE__
  uint32_t size{ 0 };
  _NSGetExecutablePath(nullptr, &size);
  std::vector<char> buf(size);
  if (_NSGetExecutablePath(buf.data(), &size) != 0) {
    throw std::runtime_error("_NSGetExecutablePath failed");
  }
  return std::filesystem::canonical(buf.data());
#else
  std::vector<char> buf(4096);
  ssize_t const len{ ::readlink("/proc/self/exe", buf.data(), buf.size() - 1) };
  if (len == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "readlink /proc/self/exe failed");
  }
  buf[static_cast<size_t>(len)] = '\0';
  return std::filesystem::path{ buf.data() };
#endif
}

std::optional<std::filesystem::path> find_on_path(std::string const &program) {
  if (program.empty()) { return std::nullopt; }

  if (program.find('/') != std::string::npos) {
    std::filesystem::path candidate{ program };
    if (::access(candidate.c_str(), X_OK) == 0) { return candidate; }
    return std::nullopt;
  }

  char const *path_env{ std::getenv("PATH") };
  if (!path_env) { return std::nullopt; }

  for (std::string_view sv{ path_env }; !sv.empty();) {
    auto const pos{ sv.find(':') };
    auto const dir{ sv.substr(0, pos) };
    if (!dir.empty()) {
      auto const candidate{ std::filesystem::path{ dir } / program };
      if (::access(candidate.c_str(), X_OK) == 0) { return candidate; }
    }
    sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
  }

  return std::nullopt;
}

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

}  // namespace rtpack::platform

#endif  // POSIX implementation
