#pragma once

#include <memory>
#include <type_traits>

namespace librtlife {

// ---------------------------------------------------------------
// Core concepts
// ---------------------------------------------------------------

/// Services are class types handed out through std::shared_ptr.
template <typename T>
concept reference_service = std::is_class_v<T>;

/// TImpl is a concrete class publicly convertible to TService
/// (or TImpl == TService for self-registration).
template <typename TImpl, typename TService>
concept implementation_of =
    std::is_class_v<TImpl>
    && !std::is_abstract_v<TImpl>
    && std::is_convertible_v<TImpl*, TService*>;

/// T is default-constructible (for zero-dependency registrations).
template <typename T>
concept default_constructible = std::is_default_constructible_v<T>;

// ---------------------------------------------------------------
// Dependency declaration
// ---------------------------------------------------------------

/// A zero-size tag type that carries a compile-time dependency type list.
/// Each dependency D is injected into the constructor as std::shared_ptr<D>.
template <typename... Deps>
struct deps_tag {};

template <typename... Deps>
inline constexpr deps_tag<Deps...> deps{};

/// TImpl must be constructible from shared pointers to all declared deps.
template <typename TImpl, typename... Deps>
concept constructible_from_deps =
    std::is_constructible_v<TImpl, std::shared_ptr<Deps>...>;

} // namespace librtlife
