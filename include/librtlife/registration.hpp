#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "cycle_guard.hpp"

#include <any>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <typeindex>
#include <vector>

namespace librtlife {

namespace internal {
/// Capture the current call stack (empty when stacktrace support is off).
LIBRTLIFE_EXPORT std::any capture_stacktrace();
} // namespace internal

// ---------------------------------------------------------------
// overridden_parameter: replaces one declared dependency
// ---------------------------------------------------------------

struct overridden_parameter {
    std::type_index type;
    instance_factory value;
};

namespace detail {

/// Parameter overrides shared between a registration and its raw factory.
class LIBRTLIFE_EXPORT override_table {
public:
    /// Returns the override factory for `type`, or an empty function.
    instance_factory find(std::type_index type) const;

    void assign(std::vector<overridden_parameter> parameters);

private:
    mutable std::mutex mutex_;
    std::vector<overridden_parameter> parameters_;
};

/// Resolve a declared dependency through the owning container.
LIBRTLIFE_EXPORT std::shared_ptr<void> resolve_dependency(container& owner,
                                                          std::type_index type);

} // namespace detail

// ---------------------------------------------------------------
// registration_request: input handed to lifestyle cores
// ---------------------------------------------------------------

struct registration_request {
    std::type_index service_type;
    std::optional<std::type_index> implementation_type;
    instance_factory raw_factory;
    container* owner = nullptr;
    std::vector<std::type_index> dependencies;
    std::shared_ptr<detail::override_table> overrides;
    bool wraps_instance_creator = false;
    std::source_location location;
    std::any stacktrace;
};

// ---------------------------------------------------------------
// registration: one service bound to a lifestyle in a container
// ---------------------------------------------------------------

class LIBRTLIFE_EXPORT registration {
public:
    /// Turns the guarded raw factory into the lifestyle's caching factory.
    using factory_applier = std::function<instance_factory(instance_factory guarded)>;

    /// Creates the cycle guard, wraps the request's raw factory with it and
    /// passes the result to `apply`.  `apply` runs exactly once.
    registration(std::shared_ptr<const lifestyle> owner_lifestyle,
                 const registration_request& request,
                 const factory_applier& apply);

    registration(const registration&) = delete;
    registration& operator=(const registration&) = delete;

    std::type_index service_type() const noexcept { return service_type_; }
    const std::optional<std::type_index>& implementation_type() const noexcept {
        return implementation_type_;
    }

    container& owner() const noexcept { return *owner_; }
    const lifestyle& get_lifestyle() const noexcept { return *lifestyle_; }

    /// Declared dependency types of the implementation.
    const std::vector<std::type_index>& dependencies() const noexcept { return dependencies_; }

    /// True when built from a caller-supplied instance creator.
    bool wraps_instance_creator() const noexcept { return wraps_instance_creator_; }

    bool suppress_disposal() const noexcept { return suppress_disposal_; }
    void set_suppress_disposal(bool value) noexcept { suppress_disposal_ = value; }

    /// Set once, before the first instance is produced.  A construction
    /// that throws does not count as produced.
    void set_parameter_overrides(std::vector<overridden_parameter> parameters);

    const std::source_location& location() const noexcept { return location_; }
    const std::any& stacktrace() const noexcept { return stacktrace_; }

    const cycle_guard& guard() const noexcept { return guard_; }

    /// Run the caching factory.  Failures propagate unchanged.
    std::shared_ptr<void> create_instance() const;

private:
    std::shared_ptr<const lifestyle> lifestyle_;
    std::type_index service_type_;
    std::optional<std::type_index> implementation_type_;
    container* owner_;
    std::vector<std::type_index> dependencies_;
    std::shared_ptr<detail::override_table> overrides_;
    bool wraps_instance_creator_;
    bool suppress_disposal_ = false;
    std::source_location location_;
    std::any stacktrace_;
    std::atomic<bool> overrides_set_{false};
    mutable std::atomic<bool> produced_{false};

    // Declared after the fields above: the factory captures the guard.
    cycle_guard guard_;
    instance_factory factory_;
};

// ---------------------------------------------------------------
// instance_producer: what clients call to obtain an instance
// ---------------------------------------------------------------

class LIBRTLIFE_EXPORT instance_producer {
public:
    instance_producer(std::type_index service_type,
                      std::shared_ptr<registration> reg,
                      std::source_location loc = std::source_location::current());

    std::type_index service_type() const noexcept { return service_type_; }
    const registration& get_registration() const noexcept { return *registration_; }
    const std::shared_ptr<registration>& registration_ptr() const noexcept { return registration_; }

    std::shared_ptr<void> get_instance() const { return registration_->create_instance(); }

    /// Typed access.  T must be the service type of this producer.
    template <typename T>
    std::shared_ptr<T> get_instance() const {
        if (std::type_index(typeid(T)) != service_type_) {
            throw_type_mismatch(typeid(T));
        }
        return std::static_pointer_cast<T>(get_instance());
    }

private:
    [[noreturn]] void throw_type_mismatch(std::type_index requested) const;

    std::type_index service_type_;
    std::shared_ptr<registration> registration_;
};

} // namespace librtlife
