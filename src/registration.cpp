#include "librtlife/registration.hpp"
#include "librtlife/exceptions.hpp"
#include "librtlife/lifestyle.hpp"

#include <algorithm>
#include <utility>

namespace librtlife {

// ---------------------------------------------------------------
// override_table
// ---------------------------------------------------------------

namespace detail {

instance_factory override_table::find(std::type_index type) const {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(parameters_.begin(), parameters_.end(),
        [&](const overridden_parameter& p) { return p.type == type; });
    if (it == parameters_.end()) return {};
    return it->value;
}

void override_table::assign(std::vector<overridden_parameter> parameters) {
    std::lock_guard lock(mutex_);
    parameters_ = std::move(parameters);
}

} // namespace detail

// ---------------------------------------------------------------
// registration
// ---------------------------------------------------------------

registration::registration(std::shared_ptr<const lifestyle> owner_lifestyle,
                           const registration_request& request,
                           const factory_applier& apply)
    : lifestyle_(std::move(owner_lifestyle))
    , service_type_(request.service_type)
    , implementation_type_(request.implementation_type)
    , owner_(request.owner)
    , dependencies_(request.dependencies)
    , overrides_(request.overrides ? request.overrides
                                   : std::make_shared<detail::override_table>())
    , wraps_instance_creator_(request.wraps_instance_creator)
    , location_(request.location)
    , stacktrace_(request.stacktrace)
    , guard_(request.implementation_type.value_or(request.service_type))
{
    if (!lifestyle_) {
        throw argument_error("lifestyle", "lifestyle cannot be null", request.location);
    }
    if (!owner_) {
        throw argument_error("container", "container cannot be null", request.location);
    }
    if (!request.raw_factory) {
        throw argument_error("instance_creator", "instance creator cannot be empty",
                             request.location);
    }

    factory_ = apply(guard_.wrap(request.raw_factory));
    if (!factory_) {
        throw di_error("Lifestyle '" + lifestyle_->name()
                       + "' produced an empty factory for "
                       + internal::demangle(service_type_), request.location);
    }
}

void registration::set_parameter_overrides(std::vector<overridden_parameter> parameters) {
    for (const auto& p : parameters) {
        if (!p.value) {
            throw argument_error("parameters", "overridden parameter factory cannot be empty");
        }
    }
    if (produced_.load(std::memory_order_acquire)) {
        throw di_error("Parameter overrides of " + internal::demangle(service_type_)
                       + " cannot be changed after it produced an instance");
    }
    if (overrides_set_.exchange(true, std::memory_order_acq_rel)) {
        throw di_error("Parameter overrides of " + internal::demangle(service_type_)
                       + " can only be set once");
    }
    overrides_->assign(std::move(parameters));
}

std::shared_ptr<void> registration::create_instance() const {
    auto instance = factory_();
    produced_.store(true, std::memory_order_release);
    return instance;
}

// ---------------------------------------------------------------
// instance_producer
// ---------------------------------------------------------------

instance_producer::instance_producer(std::type_index service_type,
                                     std::shared_ptr<registration> reg,
                                     std::source_location loc)
    : service_type_(service_type)
    , registration_(std::move(reg))
{
    if (!registration_) {
        throw argument_error("registration", "registration cannot be null", loc);
    }
    if (registration_->service_type() != service_type_) {
        throw argument_error("registration",
            "registration for " + internal::demangle(registration_->service_type())
            + " cannot produce " + internal::demangle(service_type_), loc);
    }
}

void instance_producer::throw_type_mismatch(std::type_index requested) const {
    throw di_error("Producer for " + internal::demangle(service_type_)
                   + " cannot return " + internal::demangle(requested));
}

} // namespace librtlife
