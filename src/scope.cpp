#include "librtlife/scope.hpp"
#include "librtlife/exceptions.hpp"
#include "librtlife/lifestyle.hpp"
#include "librtlife/log.hpp"

#include <utility>

namespace librtlife {

namespace {

// Innermost active scope on this thread, regardless of container.
thread_local scope* innermost_scope = nullptr;

// ---------------------------------------------------------------
// Lifetime scope: one instance per active scope
// ---------------------------------------------------------------

class lifetime_scope_lifestyle final : public scoped_lifestyle {
public:
    lifetime_scope_lifestyle() : scoped_lifestyle("Lifetime Scope") {}

    scope* current_scope(const container& owner) const override {
        return scope::current(owner);
    }

protected:
    int length() const override { return 500; }

    std::shared_ptr<registration> create_registration_core(
            const registration_request& request) const override {
        container* owner = request.owner;
        std::type_index type = request.service_type;
        return make_registration(request, [this, owner, type](instance_factory guarded)
                -> instance_factory {
            // The key's address identifies this registration inside a scope.
            auto key = std::make_shared<const char>('\0');
            auto self = std::static_pointer_cast<const scoped_lifestyle>(shared_from_this());
            return [self, owner, type, key, guarded = std::move(guarded)]() {
                scope* active = self->current_scope(*owner);
                if (!active) {
                    throw di_error("No lifetime scope is active for "
                                   + internal::demangle(type)
                                   + "; resolve it inside container::begin_lifetime_scope()");
                }
                return active->get_or_create(key.get(), guarded);
            };
        });
    }
};

} // namespace

std::shared_ptr<const scoped_lifestyle> lifestyle::lifetime_scope() {
    static const std::shared_ptr<const scoped_lifestyle> instance =
        std::make_shared<lifetime_scope_lifestyle>();
    return instance;
}

// ---------------------------------------------------------------
// scope
// ---------------------------------------------------------------

scope::scope(container& owner)
    : owner_(owner)
    , parent_(innermost_scope)
{
    innermost_scope = this;
    log::get()->debug("lifetime scope begun");
}

scope::~scope() {
    if (innermost_scope == this) {
        innermost_scope = parent_;
    } else {
        // Destroyed out of order: unlink from the middle of the chain.
        for (scope* s = innermost_scope; s != nullptr; s = s->parent_) {
            if (s->parent_ == this) {
                s->parent_ = parent_;
                break;
            }
        }
    }

    std::lock_guard lock(mutex_);
    log::get()->debug("lifetime scope ended, releasing {} instance(s)", instances_.size());
    while (!instances_.empty()) {
        instances_.pop_back();
    }
}

std::size_t scope::size() const {
    std::lock_guard lock(mutex_);
    return instances_.size();
}

std::shared_ptr<void> scope::get_or_create(const void* key, const instance_factory& create) {
    std::lock_guard lock(mutex_);
    auto it = index_.find(key);
    if (it != index_.end()) {
        return instances_[it->second];
    }

    auto instance = create();
    index_.emplace(key, instances_.size());
    instances_.push_back(instance);
    return instance;
}

scope* scope::current(const container& owner) noexcept {
    for (scope* s = innermost_scope; s != nullptr; s = s->parent_) {
        if (&s->owner_ == &owner) return s;
    }
    return nullptr;
}

} // namespace librtlife
