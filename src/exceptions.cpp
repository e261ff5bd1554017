#include "librtlife/exceptions.hpp"

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace librtlife {

namespace internal {

std::string demangle(std::type_index type) {
#if defined(__GNUC__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
        &std::free);
    if (status == 0 && demangled) {
        return std::string(demangled.get());
    }
#endif
    return std::string(type.name());
}

} // namespace internal

std::string di_error::format_message(const std::string& msg,
                                     const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":"
           + std::to_string(loc.line()) + "]";
}

di_error::di_error(const std::string& message, std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , location_(loc)
{}

void di_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

void di_error::append_resolution_context(const std::string& component_info) {
    if (!resolution_context_.empty()) {
        resolution_context_ += " -> ";
    }
    resolution_context_ += component_info;
    cached_what_.clear();
}

const char* di_error::what() const noexcept {
    if (resolution_context_.empty()) {
        return std::runtime_error::what();
    }
    if (cached_what_.empty()) {
        try {
            cached_what_ = std::string(std::runtime_error::what())
                           + " (while resolving " + resolution_context_ + ")";
        } catch (const std::exception&) {
            return std::runtime_error::what();
        }
    }
    return cached_what_.c_str();
}

std::string di_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return what();
    }
    return std::string(what()) + "\n" + diagnostic_detail_;
}

argument_error::argument_error(std::string_view param_name,
                               std::string_view message,
                               std::source_location loc)
    : di_error(std::string(message) + " (parameter '" + std::string(param_name) + "')", loc)
    , param_name_(param_name)
{}

cyclic_dependency::cyclic_dependency(std::type_index type, std::source_location loc)
    : di_error("The type " + internal::demangle(type)
               + " is directly or indirectly depending on itself", loc)
    , component_type_(type)
{}

std::string lifestyle_mismatch::build_message(std::type_index consumer,
                                              std::string_view consumer_ls,
                                              std::type_index dependency,
                                              std::string_view dep_ls,
                                              std::optional<std::type_index> consumer_impl) {
    std::string msg = "Lifestyle mismatch: " + internal::demangle(consumer);
    if (consumer_impl.has_value()) {
        msg += " [impl: " + internal::demangle(consumer_impl.value()) + "]";
    }
    msg += " (" + std::string(consumer_ls) + ") depends on "
           + internal::demangle(dependency) + " (" + std::string(dep_ls) + ")";
    return msg;
}

lifestyle_mismatch::lifestyle_mismatch(std::type_index consumer,
                                       std::string_view consumer_lifestyle,
                                       std::type_index dependency,
                                       std::string_view dependency_lifestyle,
                                       std::optional<std::type_index> consumer_impl,
                                       std::source_location loc)
    : di_error(build_message(consumer, consumer_lifestyle,
                             dependency, dependency_lifestyle, consumer_impl), loc)
    , consumer_(consumer)
    , dependency_(dependency)
{}

not_found::not_found(std::type_index type, std::source_location loc)
    : di_error("Component not found: " + internal::demangle(type), loc)
    , component_type_(type)
{}

not_found::not_found(std::type_index type, std::string_view hint,
                     std::source_location loc)
    : di_error([&]() {
          std::string msg = "Component not found: " + internal::demangle(type);
          if (!hint.empty())
              msg += "; " + std::string(hint);
          return msg;
      }(), loc)
    , component_type_(type)
{}

duplicate_registration::duplicate_registration(std::type_index type,
                                               std::source_location loc)
    : di_error("Duplicate registration for: " + internal::demangle(type), loc)
    , component_type_(type)
{}

} // namespace librtlife
