#include "librtlife/container.hpp"
#include "librtlife/exceptions.hpp"
#include "librtlife/log.hpp"
#include "stacktrace_utils.hpp"

#include <source_location>
#include <string>

namespace librtlife {

namespace {

// ------------------------------------------------------------------
// Check that every declared dependency has a producer
// ------------------------------------------------------------------
[[noreturn]] void throw_missing_dependency(const registration& consumer,
                                           std::type_index dependency,
                                           std::source_location loc) {
    // Tell the user which consumer requires the missing dependency.
    std::string hint = "required by " + internal::describe(consumer)
                       + " (" + consumer.get_lifestyle().name() + ")";
    if (consumer.location().file_name()[0]) {
        hint += " registered at " + std::string(consumer.location().file_name())
                + ":" + std::to_string(consumer.location().line());
    }
    auto ex = not_found(dependency, hint, loc);
    ex.set_diagnostic_detail(internal::format_registration_trace(consumer));
    throw ex;
}

// ------------------------------------------------------------------
// Lifestyle validation (captive dependency check)
// ------------------------------------------------------------------
void check_lifestyle_rules(const registration& consumer,
                           const registration& dependency,
                           std::source_location loc) {
    const auto& consumer_ls = consumer.get_lifestyle();
    const auto& dependency_ls = dependency.get_lifestyle();
    if (lifestyle::is_compatible(consumer_ls, dependency_ls)) return;

    // A longer-lived consumer captures the shorter-lived dependency and
    // keeps it past its intended lifetime.
    log::get()->warn("lifestyle mismatch: {} ({}) depends on {} ({})",
                     internal::describe(consumer), consumer_ls.name(),
                     internal::describe(dependency), dependency_ls.name());
    auto ex = lifestyle_mismatch(consumer.service_type(), consumer_ls.name(),
                                 dependency.service_type(), dependency_ls.name(),
                                 consumer.implementation_type(), loc);
    ex.set_diagnostic_detail(internal::format_registration_trace(consumer));
    throw ex;
}

} // anonymous namespace

// ------------------------------------------------------------------
// Entry point called by container::verify
// ------------------------------------------------------------------
void validate_lifestyles(const container& owner, std::source_location loc) {
    for (const auto& producer : owner.producers()) {
        const auto& consumer = producer->get_registration();
        for (auto dep_type : consumer.dependencies()) {
            auto dep = owner.get_producer(dep_type);
            if (!dep) {
                throw_missing_dependency(consumer, dep_type, loc);
            }
            check_lifestyle_rules(consumer, dep->get_registration(), loc);
        }
    }
}

} // namespace librtlife
