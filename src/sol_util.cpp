#include "sol_util.h"

namespace rtpack {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::string,
                      sol::lib::table,
                      sol::lib::math,
                      sol::lib::debug);

  // error() includes a stack trace
  lua->script(R"lua(
do
  local orig_error = error
  _G.error = function(message, level)
    level = (level or 1) + 1
    return orig_error(debug.traceback(tostring(message), level), 0)
  end
end
)lua");

  return lua;
}

}  // namespace rtpack
