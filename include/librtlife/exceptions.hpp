#pragma once

#include "export.hpp"

#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>

namespace librtlife {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
LIBRTLIFE_EXPORT std::string demangle(std::type_index type);
} // namespace internal

class LIBRTLIFE_EXPORT di_error : public std::runtime_error {
public:
    explicit di_error(const std::string& message,
                      std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

    /// Append resolution context to this exception.  Each producer that the
    /// error unwinds through appends its component, so the final what()
    /// shows the chain, e.g.:
    ///   "... (while resolving B [impl: BImpl] -> A [impl: AImpl])"
    void append_resolution_context(const std::string& component_info);

    /// Override to append resolution context (if any) to the base message.
    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string resolution_context_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

/// Null, empty or otherwise invalid argument passed to a public entry point.
class LIBRTLIFE_EXPORT argument_error : public di_error {
public:
    argument_error(std::string_view param_name, std::string_view message,
                   std::source_location loc = std::source_location::current());

    const std::string& param_name() const noexcept { return param_name_; }

private:
    std::string param_name_;
};

/// A construction call chain re-entered its own in-progress construction.
class LIBRTLIFE_EXPORT cyclic_dependency : public di_error {
public:
    explicit cyclic_dependency(std::type_index type,
                               std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

class LIBRTLIFE_EXPORT lifestyle_mismatch : public di_error {
public:
    lifestyle_mismatch(std::type_index consumer, std::string_view consumer_lifestyle,
                       std::type_index dependency, std::string_view dependency_lifestyle,
                       std::optional<std::type_index> consumer_impl = std::nullopt,
                       std::source_location loc = std::source_location::current());

    std::type_index consumer() const noexcept { return consumer_; }
    std::type_index dependency() const noexcept { return dependency_; }

private:
    std::type_index consumer_;
    std::type_index dependency_;

    static std::string build_message(std::type_index consumer, std::string_view consumer_ls,
                                     std::type_index dependency, std::string_view dep_ls,
                                     std::optional<std::type_index> consumer_impl);
};

class LIBRTLIFE_EXPORT not_found : public di_error {
public:
    explicit not_found(std::type_index type,
                       std::source_location loc = std::source_location::current());

    /// Construct with an additional diagnostic hint (appended to the message).
    not_found(std::type_index type, std::string_view hint,
              std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

class LIBRTLIFE_EXPORT duplicate_registration : public di_error {
public:
    explicit duplicate_registration(std::type_index type,
                                    std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

} // namespace librtlife
