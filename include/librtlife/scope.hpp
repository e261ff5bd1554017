#pragma once

#include "export.hpp"
#include "fwd.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace librtlife {

/// RAII lifetime scope.  While alive it is the innermost scope of its
/// container on the creating thread; lifetime-scoped registrations cache
/// one instance per scope.  Scopes must be destroyed on the thread that
/// created them.  When destroyed, all cached instances are released in
/// reverse creation order.
class LIBRTLIFE_EXPORT scope {
public:
    ~scope();

    scope(const scope&) = delete;
    scope& operator=(const scope&) = delete;

    container& owner() const noexcept { return owner_; }

    /// Number of instances cached in this scope.
    std::size_t size() const;

    /// Instance cached under `key`, created with `create` on first request.
    std::shared_ptr<void> get_or_create(const void* key, const instance_factory& create);

    /// Innermost scope of `owner` active on the calling thread, or nullptr.
    static scope* current(const container& owner) noexcept;

private:
    friend class container;
    explicit scope(container& owner);

    container& owner_;
    scope* parent_;
    mutable std::recursive_mutex mutex_;
    std::unordered_map<const void*, std::size_t> index_;
    std::vector<std::shared_ptr<void>> instances_;
};

} // namespace librtlife
