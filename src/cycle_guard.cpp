#include "librtlife/cycle_guard.hpp"
#include "librtlife/exceptions.hpp"
#include "librtlife/log.hpp"

#include <algorithm>
#include <utility>

namespace librtlife {

cycle_guard::cycle_guard(std::type_index type) noexcept
    : type_(type)
{}

void cycle_guard::enter(std::thread::id chain) {
    std::lock_guard lock(mutex_);
    if (!chains_) {
        // Usually a single chain constructs a registration at a time.
        chains_ = std::make_unique<std::vector<std::thread::id>>();
        chains_->reserve(1);
    }

    if (std::find(chains_->begin(), chains_->end(), chain) != chains_->end()) {
        log::get()->warn("cyclic dependency detected while constructing {}",
                         internal::demangle(type_));
        throw cyclic_dependency(type_);
    }

    chains_->push_back(chain);
}

void cycle_guard::exit(std::thread::id chain) noexcept {
    std::lock_guard lock(mutex_);
    if (!chains_) return;

    auto it = std::find(chains_->begin(), chains_->end(), chain);
    if (it != chains_->end()) {
        chains_->erase(it);
    }

    // Registrations live as long as their container; drop the storage so
    // idle guards cost one null pointer.
    if (chains_->empty()) {
        chains_.reset();
    }
}

instance_factory cycle_guard::wrap(instance_factory raw) {
    return [this, raw = std::move(raw)]() -> std::shared_ptr<void> {
        entry guard_entry(*this);
        return raw();
    };
}

std::size_t cycle_guard::in_flight() const {
    std::lock_guard lock(mutex_);
    return chains_ ? chains_->size() : 0;
}

bool cycle_guard::holds_storage() const {
    std::lock_guard lock(mutex_);
    return chains_ != nullptr;
}

} // namespace librtlife
