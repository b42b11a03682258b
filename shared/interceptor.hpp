#pragma once

#include <any>
#include <array>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <fmt/format.h>

#include "type-info.hpp"
#include "util.hpp"

namespace ilweave {

/// @brief The most slots a wrapper shape can hold: parameters, the instance (if any) and the result (if non-void).
constexpr static std::size_t kMaxShapeSlots = 16;

/// @brief Describes a live method: what it is declared on and the shape of its signature.
struct MethodInfo {
  std::string name;
  TypeInfo declaring_type{};
  bool is_static{ true };
  /// @brief An open generic definition that has not been instantiated; cannot be invoked.
  bool is_generic_definition{ false };
  std::vector<TypeInfo> parameters{};
  TypeInfo return_type{};

  [[nodiscard]] std::size_t ShapeSlots() const {
    return parameters.size() + (is_static ? 0 : 1) + (return_type.is_void ? 0 : 1);
  }
};

/// @brief Boxed copies of the arguments of one call, captured before the original runs.
/// By-reference arguments are captured by value; later writes through the reference are not reflected.
using ArgumentSnapshot = std::vector<std::any>;

/// @brief A live, invocable method.
/// Arguments are passed as slots: one pointer per parameter, pointing at the argument's storage. For by-reference
/// parameters the slot points at the referenced object, which the original may write through.
struct MethodHandle {
  virtual ~MethodHandle() = default;

  [[nodiscard]] virtual MethodInfo const& info() const = 0;
  /// @brief Boxes a copy of every argument.
  [[nodiscard]] virtual ArgumentSnapshot Snapshot(std::span<void* const> slots) const = 0;
  /// @brief Calls the method. instance is ignored for static methods. Returns the boxed result, or an empty any for
  /// void. Reference returns are boxed as a pointer to the referenced object.
  virtual std::any Invoke(void* instance, std::span<void* const> slots) const = 0;
};

struct InterceptorState;

/// @brief Callbacks fired around an intercepted call. Any of them may be empty.
struct Hooks {
  std::function<void(InterceptorState const& state, void* instance, ArgumentSnapshot const& args)> on_enter;
  std::function<void(InterceptorState const& state, void* instance, std::any const& result,
                     ArgumentSnapshot const& args)>
      on_exit;
  std::function<void(InterceptorState const& state, void* instance, std::exception_ptr fault,
                     ArgumentSnapshot const& args)>
      on_exception;
};

/// @brief Everything a wrapper closes over. Immutable once the wrapper is built.
struct InterceptorState {
  std::shared_ptr<MethodHandle const> method;
  /// @brief Caller supplied value handed back to every hook.
  std::any tag;
  Hooks hooks;
};

/// @brief A callable that forwards to the wrapped method while firing the hooks.
/// on_enter, the original call and on_exit share one guarded region: a fault in any of them is reported to
/// on_exception and then rethrown unchanged.
struct Wrapper {
  std::shared_ptr<InterceptorState const> state;

  /// @brief Invokes the wrapped method. Throws std::invalid_argument if the slot count does not match the parameters.
  std::any operator()(void* instance, std::span<void* const> slots) const;

  [[nodiscard]] MethodInfo const& info() const {
    return state->method->info();
  }
};

namespace interception {

struct NullMethod {};
/// @brief The method is an open generic definition, or an instance method of a value type.
struct UnsupportedMethod {
  std::string method;
  std::string reason;
};
struct TooManyParameters {
  std::string method;
  std::size_t slots;
};

using Error = std::variant<NullMethod, UnsupportedMethod, TooManyParameters>;

using Result = ilweave::Result<Wrapper, Error>;

}  // namespace interception

/// @brief Builds a wrapper around method that fires hooks with the provided tag.
[[nodiscard]] interception::Result Wrap(std::shared_ptr<MethodHandle const> method, Hooks hooks, std::any tag = {});

namespace detail {

template <class T>
struct function_traits;

template <class R, class... Args>
struct function_traits<R (*)(Args...)> {
  using return_type = R;
  using instance_type = void;
  using params = std::tuple<Args...>;
  using function_type = std::function<R(Args...)>;
  constexpr static bool is_static = true;
};

template <class R, class C, class... Args>
struct function_traits<R (C::*)(Args...)> {
  using return_type = R;
  using instance_type = C;
  using params = std::tuple<Args...>;
  using function_type = std::function<R(C*, Args...)>;
  constexpr static bool is_static = false;
};

template <class R, class C, class... Args>
struct function_traits<R (C::*)(Args...) const> {
  using return_type = R;
  using instance_type = C const;
  using params = std::tuple<Args...>;
  using function_type = std::function<R(C const*, Args...)>;
  constexpr static bool is_static = false;
};

template <class R, class... Args>
struct function_traits<R (*)(Args...) noexcept> : function_traits<R (*)(Args...)> {};
template <class R, class C, class... Args>
struct function_traits<R (C::*)(Args...) noexcept> : function_traits<R (C::*)(Args...)> {};
template <class R, class C, class... Args>
struct function_traits<R (C::*)(Args...) const noexcept> : function_traits<R (C::*)(Args...) const> {};

template <class P>
using storage_t = std::remove_cvref_t<P>;

/// @brief Turns a slot back into the argument the original expects. References bind to the caller's storage.
template <class P>
decltype(auto) FromSlot(void* slot) {
  if constexpr (std::is_lvalue_reference_v<P>) {
    return *static_cast<std::remove_reference_t<P>*>(slot);
  } else if constexpr (std::is_rvalue_reference_v<P>) {
    return std::move(*static_cast<std::remove_reference_t<P>*>(slot));
  } else {
    return storage_t<P>(*static_cast<storage_t<P> const*>(slot));
  }
}

template <class T>
void* ToSlot(T& value) {
  return const_cast<void*>(static_cast<void const*>(std::addressof(value)));
}

template <class R>
R Unbox(std::any&& result) {
  if constexpr (std::is_void_v<R>) {
    return;
  } else if constexpr (std::is_reference_v<R>) {
    return static_cast<R>(*std::any_cast<std::remove_reference_t<R>*>(result));
  } else {
    return std::any_cast<R>(std::move(result));
  }
}

/// @brief A MethodHandle over a function or member function pointer known at compile time.
template <auto Fn>
class FunctionHandle final : public MethodHandle {
  using traits = function_traits<decltype(Fn)>;
  using R = typename traits::return_type;
  using params = typename traits::params;
  constexpr static std::size_t kArity = std::tuple_size_v<params>;

 public:
  explicit FunctionHandle(std::string name) {
    info_.name = std::move(name);
    info_.is_static = traits::is_static;
    if constexpr (!traits::is_static) {
      info_.declaring_type = TypeInfo::from<std::remove_cv_t<typename traits::instance_type>>();
    }
    info_.return_type = TypeInfo::from<R>();
    [this]<std::size_t... I>(std::index_sequence<I...>) {
      (info_.parameters.push_back(TypeInfo::from<std::tuple_element_t<I, params>>()), ...);
    }(std::make_index_sequence<kArity>{});
  }

  [[nodiscard]] MethodInfo const& info() const override {
    return info_;
  }

  [[nodiscard]] ArgumentSnapshot Snapshot(std::span<void* const> slots) const override {
    ArgumentSnapshot snapshot;
    snapshot.reserve(kArity);
    [&]<std::size_t... I>(std::index_sequence<I...>) {
      (snapshot.emplace_back(*static_cast<storage_t<std::tuple_element_t<I, params>> const*>(slots[I])), ...);
    }(std::make_index_sequence<kArity>{});
    return snapshot;
  }

  std::any Invoke(void* instance, std::span<void* const> slots) const override {
    return [&]<std::size_t... I>(std::index_sequence<I...>) -> std::any {
      auto call = [&]() -> R {
        if constexpr (traits::is_static) {
          return std::invoke(Fn, FromSlot<std::tuple_element_t<I, params>>(slots[I])...);
        } else {
          return std::invoke(Fn, static_cast<typename traits::instance_type*>(instance),
                             FromSlot<std::tuple_element_t<I, params>>(slots[I])...);
        }
      };
      if constexpr (std::is_void_v<R>) {
        call();
        return {};
      } else if constexpr (std::is_reference_v<R>) {
        return std::any(std::addressof(call()));
      } else {
        return std::any(call());
      }
    }(std::make_index_sequence<kArity>{});
  }

 private:
  MethodInfo info_;
};

template <class R, class... Args>
auto BindStatic(Wrapper wrapper, std::tuple<Args...>*) {
  return std::function<R(Args...)>([wrapper = std::move(wrapper)](Args... args) -> R {
    std::array<void*, sizeof...(Args)> slots{ ToSlot(args)... };
    return Unbox<R>(wrapper(nullptr, slots));
  });
}

template <class R, class C, class... Args>
auto BindMember(Wrapper wrapper, std::tuple<Args...>*) {
  return std::function<R(C*, Args...)>([wrapper = std::move(wrapper)](C* self, Args... args) -> R {
    std::array<void*, sizeof...(Args)> slots{ ToSlot(args)... };
    return Unbox<R>(wrapper(const_cast<void*>(static_cast<void const*>(self)), slots));
  });
}

}  // namespace detail

/// @brief Builds a MethodHandle for a free function or member function pointer.
/// Parameter and return types must be copy constructible so they can be boxed.
template <auto Fn>
[[nodiscard]] std::shared_ptr<MethodHandle const> MakeMethodHandle(std::string name) {
  return std::make_shared<detail::FunctionHandle<Fn> const>(std::move(name));
}

/// @brief Wraps a function or member function pointer and returns a std::function with its open signature:
/// the instance pointer first for member functions, then the original parameters.
template <auto Fn>
[[nodiscard]] auto WrapTyped(std::string name, Hooks hooks, std::any tag = {})
    -> Result<typename detail::function_traits<decltype(Fn)>::function_type, interception::Error> {
  using traits = detail::function_traits<decltype(Fn)>;
  using ResultT = Result<typename traits::function_type, interception::Error>;
  auto wrapped = Wrap(MakeMethodHandle<Fn>(std::move(name)), std::move(hooks), std::move(tag));
  if (!wrapped.has_value()) {
    return ResultT::Err(wrapped.error());
  }
  typename traits::params* params_tag = nullptr;
  if constexpr (traits::is_static) {
    return ResultT::Ok(detail::BindStatic<typename traits::return_type>(std::move(wrapped).value(), params_tag));
  } else {
    return ResultT::Ok(detail::BindMember<typename traits::return_type, typename traits::instance_type>(
        std::move(wrapped).value(), params_tag));
  }
}

}  // namespace ilweave

template <>
class fmt::formatter<ilweave::MethodInfo> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(ilweave::MethodInfo const& info, Context& ctx) const {
    return fmt::format_to(ctx.out(), "{} ({}, params: {}, returns: {})", info.name,
                          info.is_static ? "static" : "instance", info.parameters.size(), info.return_type);
  }
};

// Custom formatter for ilweave::interception::Error
template <>
class fmt::formatter<ilweave::interception::Error> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(ilweave::interception::Error const& error, Context& ctx) const {
    using namespace ilweave::interception;
    return std::visit(
        ilweave::util::overload{
          [&ctx](NullMethod const&) { return fmt::format_to(ctx.out(), "Null method handle"); },
          [&ctx](UnsupportedMethod const& unsupported) {
            return fmt::format_to(ctx.out(), "Cannot intercept: {}: {}", unsupported.method, unsupported.reason);
          },
          [&ctx](TooManyParameters const& too_many) {
            return fmt::format_to(ctx.out(), "Cannot intercept: {}: needs {} slots but at most {} are supported",
                                  too_many.method, too_many.slots, ilweave::kMaxShapeSlots);
          } },
        error);
  }
};
