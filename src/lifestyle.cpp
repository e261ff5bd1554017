#include "librtlife/lifestyle.hpp"
#include "librtlife/exceptions.hpp"
#include "librtlife/log.hpp"

#include <utility>

namespace librtlife {

lifestyle::lifestyle(std::string name)
    : name_(std::move(name))
{
    if (name_.empty()) {
        throw argument_error("name", "lifestyle name cannot be empty");
    }
}

lifestyle::~lifestyle() = default;

bool lifestyle::is_compatible(const lifestyle& dependent, const lifestyle& dependency) {
    return dependent.component_length() <= dependency.dependency_length();
}

// ---------------------------------------------------------------
// Registration creation
// ---------------------------------------------------------------

std::shared_ptr<registration> lifestyle::create_registration(
        std::type_index service_type, instance_factory instance_creator,
        container& owner, std::source_location loc) const {
    if (!instance_creator) {
        throw argument_error("instance_creator", "instance creator cannot be empty", loc);
    }
    return create_registration_impl(registration_request{
        .service_type = service_type,
        .implementation_type = std::nullopt,
        .raw_factory = std::move(instance_creator),
        .owner = &owner,
        .dependencies = {},
        .overrides = std::make_shared<detail::override_table>(),
        .wraps_instance_creator = true,
        .location = loc,
        .stacktrace = {},
    });
}

std::shared_ptr<instance_producer> lifestyle::create_producer(
        std::type_index service_type, instance_factory instance_creator,
        container& owner, std::source_location loc) const {
    return std::make_shared<instance_producer>(
        service_type,
        create_registration(service_type, std::move(instance_creator), owner, loc),
        loc);
}

std::shared_ptr<registration> lifestyle::create_registration_impl(
        registration_request request) const {
    request.stacktrace = internal::capture_stacktrace();

    auto reg = create_registration_core(request);
    if (!reg) {
        throw di_error("Lifestyle '" + name_ + "' returned no registration for "
                       + internal::demangle(request.service_type), request.location);
    }

    log::get()->debug("created {} registration for {}", name_,
                      internal::demangle(request.service_type));
    return reg;
}

std::shared_ptr<registration> lifestyle::create_inner_registration(
        const lifestyle& inner, const registration_request& request) {
    return inner.create_registration_core(request);
}

std::shared_ptr<registration> lifestyle::make_registration(
        const registration_request& request,
        const registration::factory_applier& apply) const {
    auto self = weak_from_this().lock();
    if (!self) {
        throw di_error("Lifestyle '" + name_ + "' must be owned by a std::shared_ptr",
                       request.location);
    }
    return std::make_shared<registration>(std::move(self), request, apply);
}

} // namespace librtlife
