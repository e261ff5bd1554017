/// basic_usage.cpp: librtlife introductory example.
///
/// Demonstrates how lifestyles decide instance reuse:
///   1. Register services with transient, singleton and lifetime-scope lifestyles.
///   2. Combine two lifestyles with a hybrid selected at call time.
///   3. Verify the container, then resolve through producers and scopes.

#include <librtlife.hpp>
#include <iostream>
#include <memory>
#include <string>

using namespace librtlife;

// -----------------------------------------------------------------------
// Domain interfaces
// -----------------------------------------------------------------------

struct i_clock {
    virtual ~i_clock() = default;
    virtual long now() const = 0;
};

struct i_unit_of_work {
    virtual ~i_unit_of_work() = default;
    virtual int id() const = 0;
};

struct i_report {
    virtual ~i_report() = default;
    virtual std::string render() const = 0;
};

// -----------------------------------------------------------------------
// Implementations
// -----------------------------------------------------------------------

struct fixed_clock : i_clock {
    long now() const override { return 42; }
};

struct unit_of_work : i_unit_of_work {
    inline static int counter = 0;
    int id_ = ++counter;
    int id() const override { return id_; }
};

struct report : i_report {
    report(std::shared_ptr<i_clock> clock, std::shared_ptr<i_unit_of_work> work)
        : clock_(std::move(clock)), work_(std::move(work)) {}

    std::string render() const override {
        return "report at " + std::to_string(clock_->now())
               + " in unit of work " + std::to_string(work_->id());
    }

private:
    std::shared_ptr<i_clock> clock_;
    std::shared_ptr<i_unit_of_work> work_;
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    container c;

    // One clock for the container's lifetime.
    c.register_service<i_clock, fixed_clock>(lifestyle::singleton());

    // Scoped inside a lifetime scope, a fresh instance per call otherwise.
    auto scoped_or_transient = lifestyle::create_hybrid(
        [&c] { return scope::current(c) != nullptr; },
        lifestyle::lifetime_scope(),
        lifestyle::transient());
    c.register_service<i_unit_of_work, unit_of_work>(scoped_or_transient);

    c.register_service<i_report, report>(lifestyle::transient(),
                                         deps<i_clock, i_unit_of_work>);

    try {
        c.verify({.check_lifestyle_mismatches = true, .construct_all = true});
    } catch (const di_error& e) {
        std::cerr << e.full_diagnostic() << '\n';
        return 1;
    }

    {
        auto request = c.begin_lifetime_scope();
        std::cout << c.get_instance<i_report>()->render() << '\n';
        std::cout << c.get_instance<i_report>()->render() << '\n';
    }

    // Outside a scope the hybrid falls back to transient.
    std::cout << c.get_instance<i_report>()->render() << '\n';

    std::cout << "Done.\n";
    return 0;
}
