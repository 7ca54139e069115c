#include "sol_util.h"

namespace tfx {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::math);
  return lua;
}

void sol_util_run_script(sol::state &lua,
                         std::string_view script,
                         std::string const &chunk_name) {
  sol::protected_function_result result{
    lua.safe_script(script, sol::script_pass_on_error, chunk_name)
  };
  if (!result.valid()) {
    sol::error err = result;
    throw std::runtime_error(chunk_name + ": " + err.what());
  }
}

}  // namespace tfx
