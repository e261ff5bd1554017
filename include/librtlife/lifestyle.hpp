#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "exceptions.hpp"
#include "registration.hpp"
#include "type_traits.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <typeindex>
#include <utility>

namespace librtlife {

namespace detail {

/// Resolve one declared dependency, preferring a parameter override.
template <typename D>
std::shared_ptr<D> resolve_dep(container& owner, const override_table& overrides) {
    if (auto overridden = overrides.find(typeid(D))) {
        return std::static_pointer_cast<D>(overridden());
    }
    return std::static_pointer_cast<D>(resolve_dependency(owner, typeid(D)));
}

} // namespace detail

// ---------------------------------------------------------------
// lifestyle: caching policy applied to registrations
// ---------------------------------------------------------------

/// A lifestyle decides how many instances of a registration exist and when
/// they are created.  Lifestyles are immutable and shared; obtain them from
/// the static accessors or factory functions below.
class LIBRTLIFE_EXPORT lifestyle : public std::enable_shared_from_this<lifestyle> {
public:
    /// Turns the guarded raw factory of one registration into a caching
    /// factory.  Called once per registration.
    using applier_factory = std::function<instance_factory(instance_factory transient_creator)>;

    virtual ~lifestyle();

    lifestyle(const lifestyle&) = delete;
    lifestyle& operator=(const lifestyle&) = delete;

    const std::string& name() const noexcept { return name_; }

    /// How long components with this lifestyle live (diagnostics only).
    virtual int component_length() const { return length(); }

    /// How long this lifestyle keeps its dependencies (diagnostics only).
    virtual int dependency_length() const { return length(); }

    /// A component should not outlive the consumer it is injected into.
    static bool is_compatible(const lifestyle& dependent, const lifestyle& dependency);

    // ===============================================================
    // Built-in lifestyles
    // ===============================================================

    static std::shared_ptr<const lifestyle> transient();
    static std::shared_ptr<const lifestyle> singleton();
    static std::shared_ptr<const scoped_lifestyle> lifetime_scope();

    static std::shared_ptr<const lifestyle> create_hybrid(
        std::function<bool()> lifestyle_selector,
        std::shared_ptr<const lifestyle> true_lifestyle,
        std::shared_ptr<const lifestyle> false_lifestyle);

    static std::shared_ptr<const scoped_lifestyle> create_scoped_hybrid(
        std::function<bool()> lifestyle_selector,
        std::shared_ptr<const scoped_lifestyle> true_lifestyle,
        std::shared_ptr<const scoped_lifestyle> false_lifestyle);

    /// `length` feeds the mismatch diagnostics; 1 ranks like transient.
    static std::shared_ptr<const lifestyle> create_custom(
        std::string name, applier_factory lifestyle_applier_factory, int length = 1);

    // ===============================================================
    // Registration creation
    // ===============================================================

    /// Concrete self-registration.
    template <typename TConcrete>
        requires reference_service<TConcrete>
              && implementation_of<TConcrete, TConcrete>
              && default_constructible<TConcrete>
    std::shared_ptr<registration> create_registration(
            container& owner,
            std::source_location loc = std::source_location::current()) const {
        return create_registration<TConcrete, TConcrete>(owner, deps<>, loc);
    }

    /// Zero-dep implementation.
    template <typename TService, typename TImpl>
        requires reference_service<TService>
              && implementation_of<TImpl, TService>
              && default_constructible<TImpl>
    std::shared_ptr<registration> create_registration(
            container& owner,
            std::source_location loc = std::source_location::current()) const {
        return create_registration<TService, TImpl>(owner, deps<>, loc);
    }

    /// Implementation constructed from std::shared_ptr<Deps>... resolved
    /// through the container (or parameter overrides).
    template <typename TService, typename TImpl, typename... Deps>
        requires reference_service<TService>
              && implementation_of<TImpl, TService>
              && constructible_from_deps<TImpl, Deps...>
    std::shared_ptr<registration> create_registration(
            container& owner, deps_tag<Deps...>,
            std::source_location loc = std::source_location::current()) const {
        auto overrides = std::make_shared<detail::override_table>();
        container* c = &owner;
        instance_factory raw = [c, overrides]() -> std::shared_ptr<void> {
            std::shared_ptr<TService> instance =
                std::make_shared<TImpl>(detail::resolve_dep<Deps>(*c, *overrides)...);
            return instance;
        };
        return create_registration_impl(registration_request{
            .service_type = typeid(TService),
            .implementation_type = std::type_index(typeid(TImpl)),
            .raw_factory = std::move(raw),
            .owner = c,
            .dependencies = { std::type_index(typeid(Deps))... },
            .overrides = std::move(overrides),
            .wraps_instance_creator = false,
            .location = loc,
            .stacktrace = {},
        });
    }

    /// Registration around a caller-supplied creator.
    template <typename TService>
        requires reference_service<TService>
    std::shared_ptr<registration> create_registration(
            std::function<std::shared_ptr<TService>()> instance_creator,
            container& owner,
            std::source_location loc = std::source_location::current()) const {
        if (!instance_creator) {
            throw argument_error("instance_creator", "instance creator cannot be empty", loc);
        }
        instance_factory raw =
            [creator = std::move(instance_creator)]() -> std::shared_ptr<void> {
                return creator();
            };
        return create_registration(typeid(TService), std::move(raw), owner, loc);
    }

    /// Type-erased creator registration.  The creator must return a pointer
    /// to the `service_type` sub-object.
    std::shared_ptr<registration> create_registration(
        std::type_index service_type, instance_factory instance_creator,
        container& owner,
        std::source_location loc = std::source_location::current()) const;

    // ===============================================================
    // Producer creation
    // ===============================================================

    template <typename TConcrete>
        requires reference_service<TConcrete>
              && implementation_of<TConcrete, TConcrete>
              && default_constructible<TConcrete>
    std::shared_ptr<instance_producer> create_producer(
            container& owner,
            std::source_location loc = std::source_location::current()) const {
        return std::make_shared<instance_producer>(
            typeid(TConcrete), create_registration<TConcrete>(owner, loc), loc);
    }

    template <typename TService, typename TImpl>
        requires reference_service<TService>
              && implementation_of<TImpl, TService>
              && default_constructible<TImpl>
    std::shared_ptr<instance_producer> create_producer(
            container& owner,
            std::source_location loc = std::source_location::current()) const {
        return std::make_shared<instance_producer>(
            typeid(TService), create_registration<TService, TImpl>(owner, loc), loc);
    }

    template <typename TService, typename TImpl, typename... Deps>
        requires reference_service<TService>
              && implementation_of<TImpl, TService>
              && constructible_from_deps<TImpl, Deps...>
    std::shared_ptr<instance_producer> create_producer(
            container& owner, deps_tag<Deps...> d,
            std::source_location loc = std::source_location::current()) const {
        return std::make_shared<instance_producer>(
            typeid(TService), create_registration<TService, TImpl>(owner, d, loc), loc);
    }

    template <typename TService>
        requires reference_service<TService>
    std::shared_ptr<instance_producer> create_producer(
            std::function<std::shared_ptr<TService>()> instance_creator,
            container& owner,
            std::source_location loc = std::source_location::current()) const {
        return std::make_shared<instance_producer>(
            typeid(TService),
            create_registration<TService>(std::move(instance_creator), owner, loc), loc);
    }

    std::shared_ptr<instance_producer> create_producer(
        std::type_index service_type, instance_factory instance_creator,
        container& owner,
        std::source_location loc = std::source_location::current()) const;

protected:
    explicit lifestyle(std::string name);

    virtual int length() const = 0;

    /// Build a new registration for `request`.  Implementations must return
    /// a fresh registration on every call; only the instances it produces
    /// may be cached.
    virtual std::shared_ptr<registration> create_registration_core(
        const registration_request& request) const = 0;

    /// Invoke another lifestyle's core.  Used by composite lifestyles.
    static std::shared_ptr<registration> create_inner_registration(
        const lifestyle& inner, const registration_request& request);

    /// Registration owned by this lifestyle, with the given caching policy.
    std::shared_ptr<registration> make_registration(
        const registration_request& request,
        const registration::factory_applier& apply) const;

private:
    std::shared_ptr<registration> create_registration_impl(registration_request request) const;

    std::string name_;
};

// ---------------------------------------------------------------
// scoped_lifestyle: lifestyles that cache per scope
// ---------------------------------------------------------------

class LIBRTLIFE_EXPORT scoped_lifestyle : public lifestyle {
public:
    /// Scope that instances of `owner` are cached in on the calling thread,
    /// or nullptr when none is active.
    virtual scope* current_scope(const container& owner) const = 0;

protected:
    using lifestyle::lifestyle;
};

} // namespace librtlife
