#pragma once

#include "export.hpp"
#include "exceptions.hpp"
#include "lifestyle.hpp"
#include "registration.hpp"
#include "scope.hpp"
#include "type_traits.hpp"

#include <functional>
#include <memory>
#include <source_location>
#include <typeindex>
#include <vector>

namespace librtlife {

struct container_options {
    /// Reject registrations once the container served its first instance.
    bool lock_on_first_resolve = true;
};

struct verify_options {
    /// Check every declared dependency edge with lifestyle::is_compatible.
    bool check_lifestyle_mismatches = true;
    /// Resolve every producer once, inside a temporary lifetime scope.
    bool construct_all = true;
};

/// Maps service types to producers.  Lifestyles use the container as the
/// identity their caches are keyed on; producers resolve declared
/// dependencies through it.
class LIBRTLIFE_EXPORT container {
public:
    explicit container(container_options options = {});
    ~container();

    container(const container&) = delete;
    container& operator=(const container&) = delete;

    // ===============================================================
    // Registration
    // ===============================================================

    template <typename TService, typename TImpl>
        requires reference_service<TService>
              && implementation_of<TImpl, TService>
              && default_constructible<TImpl>
    container& register_service(std::shared_ptr<const lifestyle> ls,
                                std::source_location loc = std::source_location::current()) {
        require_lifestyle(ls, loc);
        return register_producer(ls->create_producer<TService, TImpl>(*this, loc));
    }

    template <typename TService, typename TImpl, typename... Deps>
        requires reference_service<TService>
              && implementation_of<TImpl, TService>
              && constructible_from_deps<TImpl, Deps...>
    container& register_service(std::shared_ptr<const lifestyle> ls, deps_tag<Deps...> d,
                                std::source_location loc = std::source_location::current()) {
        require_lifestyle(ls, loc);
        return register_producer(ls->create_producer<TService, TImpl>(*this, d, loc));
    }

    template <typename TService>
        requires reference_service<TService>
    container& register_service(std::shared_ptr<const lifestyle> ls,
                                std::function<std::shared_ptr<TService>()> instance_creator,
                                std::source_location loc = std::source_location::current()) {
        require_lifestyle(ls, loc);
        return register_producer(
            ls->create_producer<TService>(std::move(instance_creator), *this, loc));
    }

    /// Add a producer built by a lifestyle for this container.
    container& register_producer(std::shared_ptr<instance_producer> producer);

    // ===============================================================
    // Resolution
    // ===============================================================

    /// Throws not_found if T is not registered.
    template <typename T>
    std::shared_ptr<T> get_instance() {
        return std::static_pointer_cast<T>(get_instance_impl(typeid(T)));
    }

    /// Producer for `type`, or nullptr.
    std::shared_ptr<instance_producer> get_producer(std::type_index type) const;

    /// All producers in registration order.
    std::vector<std::shared_ptr<instance_producer>> producers() const;

    /// Begin a lifetime scope on the calling thread.
    std::unique_ptr<scope> begin_lifetime_scope();

    /// Check lifestyle compatibility and construct every registration once.
    void verify(verify_options options = {},
                std::source_location loc = std::source_location::current());

    bool is_locked() const noexcept;
    const container_options& options() const noexcept;

private:
    friend std::shared_ptr<void> detail::resolve_dependency(container&, std::type_index);

    std::shared_ptr<void> get_instance_impl(std::type_index type);

    static void require_lifestyle(const std::shared_ptr<const lifestyle>& ls,
                                  std::source_location loc);

    struct impl;
    std::unique_ptr<impl> impl_;
};

} // namespace librtlife
