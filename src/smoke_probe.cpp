#include "smoke_probe.h"

#include "tui.h"

namespace rtpack {
namespace {

constexpr char kProbeScript[]{ R"py(
import importlib, importlib.util, sys
name = sys.argv[1]
if len(sys.argv) > 2:
    sys.path.insert(0, sys.argv[2])
try:
    spec = importlib.util.find_spec(name)
except Exception as exc:
    print("probe: lookup of %s raised %r" % (name, exc))
    sys.exit(4)
if spec is None:
    print("probe: %s not found on sys.path" % name)
    sys.exit(3)
try:
    importlib.import_module(name)
except BaseException as exc:
    print("probe: import %s failed: %r" % (name, exc))
    sys.exit(4)
print("probe: %s OK" % name)
)py" };

}  // namespace

probe_result smoke_probe_run(command_runner &runner,
                             std::filesystem::path const &interpreter,
                             std::string const &module,
                             std::optional<std::filesystem::path> const &extra_path,
                             std::chrono::seconds timeout) {
  std::vector<std::string> argv{ interpreter.string(), "-c", kProbeScript, module };
  if (extra_path) { argv.push_back(extra_path->string()); }

  auto const out{ runner.run(argv, command_options{ .timeout = timeout }) };

  probe_status status{ probe_status::probe_failed };
  if (!out.timed_out) {
    switch (out.exit_code) {
      case kProbeExitOk: status = probe_status::ok; break;
      case kProbeExitNotFound: status = probe_status::not_installed; break;
      case kProbeExitLoadFailed: status = probe_status::load_failed; break;
      default: break;
    }
  }

  tui::debug("probe %s: %s (exit %d)", module.c_str(), probe_status_name(status), out.exit_code);
  return probe_result{ .status = status, .exit_code = out.exit_code, .output = out.tail(10) };
}

char const *probe_status_name(probe_status status) {
  switch (status) {
    case probe_status::ok: return "ok";
    case probe_status::not_installed: return "not installed";
    case probe_status::load_failed: return "installed but failed to load";
    case probe_status::probe_failed: return "probe failed";
  }
  return "unknown";
}

std::string probe_status_hint(probe_status status, std::string_view module) {
  std::string const name{ module };
  switch (status) {
    case probe_status::ok: return {};
    case probe_status::not_installed:
      return "binary missing: " + name +
             " is not in the package directory; check the install step and the path file";
    case probe_status::load_failed:
      return "binary present but failed to load: " + name +
             " is installed, a native dependency is likely missing (install the runtime "
             "prerequisite, or pick a different --wheel-source)";
    case probe_status::probe_failed:
      return "the interpreter could not run the import probe; check that it starts at all";
  }
  return {};
}

}  // namespace rtpack
