#include "librtlife/container.hpp"
#include "librtlife/log.hpp"
#include "stacktrace_utils.hpp"

#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

namespace librtlife {

void validate_lifestyles(const container& owner, std::source_location loc);

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct container::impl {
    container_options options;

    mutable std::shared_mutex mutex;
    std::vector<std::shared_ptr<instance_producer>> ordered;
    std::unordered_map<std::type_index, std::shared_ptr<instance_producer>> by_type;

    std::atomic<bool> locked{false};

    explicit impl(container_options opts) : options(opts) {}
};

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

container::container(container_options options)
    : impl_(std::make_unique<impl>(options))
{}

container::~container() = default;

// ---------------------------------------------------------------
// Registration
// ---------------------------------------------------------------

void container::require_lifestyle(const std::shared_ptr<const lifestyle>& ls,
                                  std::source_location loc) {
    if (!ls) {
        throw argument_error("lifestyle", "lifestyle cannot be null", loc);
    }
}

container& container::register_producer(std::shared_ptr<instance_producer> producer) {
    if (!producer) {
        throw argument_error("producer", "producer cannot be null");
    }
    const auto& reg = producer->get_registration();
    if (&reg.owner() != this) {
        throw argument_error("producer", "producer for "
                             + internal::describe(reg)
                             + " was created for another container", reg.location());
    }

    std::unique_lock lock(impl_->mutex);
    if (impl_->locked.load(std::memory_order_acquire)) {
        throw di_error("The container is locked: " + internal::describe(reg)
                       + " cannot be registered after the first instance was resolved",
                       reg.location());
    }

    auto type = producer->service_type();
    if (impl_->by_type.contains(type)) {
        throw duplicate_registration(type, reg.location());
    }

    log::get()->debug("registered {} as {}", internal::describe(reg),
                      reg.get_lifestyle().name());
    impl_->by_type.emplace(type, producer);
    impl_->ordered.push_back(std::move(producer));
    return *this;
}

// ---------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------

std::shared_ptr<instance_producer> container::get_producer(std::type_index type) const {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->by_type.find(type);
    if (it == impl_->by_type.end()) return nullptr;
    return it->second;
}

std::vector<std::shared_ptr<instance_producer>> container::producers() const {
    std::shared_lock lock(impl_->mutex);
    return impl_->ordered;
}

std::shared_ptr<void> container::get_instance_impl(std::type_index type) {
    auto producer = get_producer(type);
    if (!producer) {
        throw not_found(type);
    }

    if (impl_->options.lock_on_first_resolve) {
        impl_->locked.store(true, std::memory_order_release);
    }

    try {
        return producer->get_instance();
    } catch (di_error& e) {
        // Enrich our own errors with the resolution chain and rethrow the
        // same object; factory exceptions pass through untouched.
        const auto& reg = producer->get_registration();
        e.append_resolution_context(internal::describe(reg));
        if (e.diagnostic_detail().empty()) {
            auto trace = internal::format_registration_trace(reg);
            if (!trace.empty()) e.set_diagnostic_detail(trace);
        }
        throw;
    }
}

namespace detail {

std::shared_ptr<void> resolve_dependency(container& owner, std::type_index type) {
    return owner.get_instance_impl(type);
}

} // namespace detail

std::unique_ptr<scope> container::begin_lifetime_scope() {
    return std::unique_ptr<scope>(new scope(*this));
}

// ---------------------------------------------------------------
// Verification
// ---------------------------------------------------------------

void container::verify(verify_options options, std::source_location loc) {
    if (options.check_lifestyle_mismatches) {
        validate_lifestyles(*this, loc);
    }

    if (options.construct_all) {
        auto verification_scope = begin_lifetime_scope();
        for (const auto& producer : producers()) {
            get_instance_impl(producer->service_type());
        }
    }
}

bool container::is_locked() const noexcept {
    return impl_->locked.load(std::memory_order_acquire);
}

const container_options& container::options() const noexcept {
    return impl_->options;
}

} // namespace librtlife
