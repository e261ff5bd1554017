#include "librtlife/lifestyle.hpp"
#include "librtlife/exceptions.hpp"
#include "librtlife/log.hpp"

#include <atomic>
#include <mutex>
#include <utility>

namespace librtlife {

namespace {

// ---------------------------------------------------------------
// Transient: every call constructs
// ---------------------------------------------------------------

class transient_lifestyle final : public lifestyle {
public:
    transient_lifestyle() : lifestyle("Transient") {}

protected:
    int length() const override { return 1; }

    std::shared_ptr<registration> create_registration_core(
            const registration_request& request) const override {
        return make_registration(request, [](instance_factory guarded) {
            return guarded;
        });
    }
};

// ---------------------------------------------------------------
// Singleton: one instance per registration
// ---------------------------------------------------------------

/// Compute-once cell owned by a single registration.  A failed construction
/// leaves the cell empty so a later call retries.
class singleton_cell {
public:
    std::shared_ptr<void> get(const instance_factory& create, std::type_index type) {
        if (computed_.load(std::memory_order_acquire)) {
            return value_;
        }

        // Recursive: a chain that re-enters its own construction must reach
        // the cycle guard instead of deadlocking here.
        std::lock_guard lock(mutex_);
        if (!computed_.load(std::memory_order_relaxed)) {
            log::get()->trace("constructing singleton {}", internal::demangle(type));
            value_ = create();
            computed_.store(true, std::memory_order_release);
        }
        return value_;
    }

private:
    std::recursive_mutex mutex_;
    std::atomic<bool> computed_{false};
    std::shared_ptr<void> value_;
};

class singleton_lifestyle final : public lifestyle {
public:
    singleton_lifestyle() : lifestyle("Singleton") {}

protected:
    int length() const override { return 1000; }

    std::shared_ptr<registration> create_registration_core(
            const registration_request& request) const override {
        std::type_index type = request.implementation_type.value_or(request.service_type);
        return make_registration(request, [type](instance_factory guarded) -> instance_factory {
            auto cell = std::make_shared<singleton_cell>();
            return [cell, type, guarded = std::move(guarded)]() {
                return cell->get(guarded, type);
            };
        });
    }
};

// ---------------------------------------------------------------
// Custom: policy supplied by the embedder
// ---------------------------------------------------------------

class custom_lifestyle final : public lifestyle {
public:
    custom_lifestyle(std::string name, applier_factory applier, int length)
        : lifestyle(std::move(name))
        , applier_(std::move(applier))
        , length_(length)
    {}

protected:
    int length() const override { return length_; }

    std::shared_ptr<registration> create_registration_core(
            const registration_request& request) const override {
        // One applier call per registration keeps the state it captures private.
        return make_registration(request, [this](instance_factory guarded) {
            return applier_(std::move(guarded));
        });
    }

private:
    applier_factory applier_;
    int length_;
};

} // namespace

std::shared_ptr<const lifestyle> lifestyle::transient() {
    static const std::shared_ptr<const lifestyle> instance =
        std::make_shared<transient_lifestyle>();
    return instance;
}

std::shared_ptr<const lifestyle> lifestyle::singleton() {
    static const std::shared_ptr<const lifestyle> instance =
        std::make_shared<singleton_lifestyle>();
    return instance;
}

std::shared_ptr<const lifestyle> lifestyle::create_custom(
        std::string name, applier_factory lifestyle_applier_factory, int length) {
    if (name.empty()) {
        throw argument_error("name", "lifestyle name cannot be empty");
    }
    if (!lifestyle_applier_factory) {
        throw argument_error("lifestyle_applier_factory",
                             "lifestyle applier factory cannot be empty");
    }
    return std::make_shared<custom_lifestyle>(
        std::move(name), std::move(lifestyle_applier_factory), length);
}

} // namespace librtlife
