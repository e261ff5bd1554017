#pragma once

/// @file fwd.hpp
/// Forward declarations for all public librtlife symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

#include <functional>
#include <memory>

namespace librtlife {

/// Zero-argument producer of a service instance.  The pointer always refers
/// to the service sub-object, so `std::static_pointer_cast<TService>` is exact.
using instance_factory = std::function<std::shared_ptr<void>()>;

// exceptions.hpp
class di_error;
class argument_error;
class cyclic_dependency;
class lifestyle_mismatch;
class not_found;
class duplicate_registration;

// cycle_guard.hpp
class cycle_guard;

// registration.hpp
struct overridden_parameter;
struct registration_request;
class registration;
class instance_producer;

// lifestyle.hpp
class lifestyle;
class scoped_lifestyle;

// scope.hpp
class scope;

// container.hpp
struct container_options;
struct verify_options;
class container;

// type_traits.hpp
template <typename... Deps>
struct deps_tag;

} // namespace librtlife
