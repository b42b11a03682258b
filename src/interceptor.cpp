#include "interceptor.hpp"
#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>

#include "util.hpp"

namespace ilweave {

std::any Wrapper::operator()(void* instance, std::span<void* const> slots) const {
  auto const& method = *state->method;
  auto const& info = method.info();
  if (slots.size() != info.parameters.size()) {
    throw std::invalid_argument(
        fmt::format("{} takes {} arguments but was given {}", info.name, info.parameters.size(), slots.size()));
  }
  auto const snapshot = method.Snapshot(slots);
  auto const& hooks = state->hooks;
  try {
    if (hooks.on_enter) hooks.on_enter(*state, instance, snapshot);
    auto result = method.Invoke(instance, slots);
    if (hooks.on_exit) hooks.on_exit(*state, instance, result, snapshot);
    return result;
  } catch (...) {
    if (hooks.on_exception) hooks.on_exception(*state, instance, std::current_exception(), snapshot);
    throw;
  }
}

interception::Result Wrap(std::shared_ptr<MethodHandle const> method, Hooks hooks, std::any tag) {
  using ResultT = interception::Result;
  using interception::NullMethod;
  using interception::TooManyParameters;
  using interception::UnsupportedMethod;
  if (!method) {
    return ResultT::ErrAt<NullMethod>();
  }
  auto const& info = method->info();
  if (info.is_generic_definition) {
    return ResultT::ErrAt<UnsupportedMethod>(UnsupportedMethod{ info.name, "open generic method definition" });
  }
  if (!info.is_static && info.declaring_type.is_value_type) {
    return ResultT::ErrAt<UnsupportedMethod>(UnsupportedMethod{ info.name, "instance method on a value type" });
  }
  if (info.ShapeSlots() > kMaxShapeSlots) {
    return ResultT::ErrAt<TooManyParameters>(TooManyParameters{ info.name, info.ShapeSlots() });
  }
  ILWEAVE_DEBUG("Wrapping {}", info);
  auto state = std::make_shared<InterceptorState const>(
      InterceptorState{ .method = std::move(method), .tag = std::move(tag), .hooks = std::move(hooks) });
  return ResultT::Ok(Wrapper{ .state = std::move(state) });
}

}  // namespace ilweave
