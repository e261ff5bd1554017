#include <catch2/catch_test_macros.hpp>
#include <librtlife.hpp>

#include <memory>
#include <stdexcept>
#include <thread>

namespace {

struct Guarded {};

} // namespace

TEST_CASE("cycle guard starts idle without storage", "[cycle_guard]") {
    librtlife::cycle_guard guard(typeid(Guarded));
    REQUIRE(guard.in_flight() == 0);
    REQUIRE_FALSE(guard.holds_storage());
    REQUIRE(guard.component_type() == std::type_index(typeid(Guarded)));
}

TEST_CASE("cycle guard rejects re-entry of the same chain", "[cycle_guard]") {
    librtlife::cycle_guard guard(typeid(Guarded));
    guard.enter();
    REQUIRE(guard.in_flight() == 1);
    REQUIRE_THROWS_AS(guard.enter(), librtlife::cyclic_dependency);
    // The failed enter must not record the chain twice.
    REQUIRE(guard.in_flight() == 1);
    guard.exit();
    REQUIRE(guard.in_flight() == 0);
}

TEST_CASE("cycle guard tracks distinct chains independently", "[cycle_guard]") {
    librtlife::cycle_guard guard(typeid(Guarded));
    std::thread::id other;
    std::thread([&] { other = std::this_thread::get_id(); }).join();

    guard.enter();
    REQUIRE_NOTHROW(guard.enter(other));
    REQUIRE(guard.in_flight() == 2);

    guard.exit(other);
    REQUIRE(guard.in_flight() == 1);
    REQUIRE(guard.holds_storage());
}

TEST_CASE("cycle guard releases storage when the last chain exits", "[cycle_guard]") {
    librtlife::cycle_guard guard(typeid(Guarded));
    guard.enter();
    REQUIRE(guard.holds_storage());
    guard.exit();
    REQUIRE_FALSE(guard.holds_storage());

    // Usable again after returning to idle.
    REQUIRE_NOTHROW(guard.enter());
    guard.exit();
}

TEST_CASE("cycle guard exit without enter is harmless", "[cycle_guard]") {
    librtlife::cycle_guard guard(typeid(Guarded));
    guard.exit();
    REQUIRE(guard.in_flight() == 0);
    REQUIRE_FALSE(guard.holds_storage());
}

TEST_CASE("cycle guard entry exits on exception", "[cycle_guard]") {
    librtlife::cycle_guard guard(typeid(Guarded));
    try {
        librtlife::cycle_guard::entry e(guard);
        REQUIRE(guard.in_flight() == 1);
        throw std::runtime_error("construction failed");
    } catch (const std::runtime_error&) {
    }
    REQUIRE(guard.in_flight() == 0);
    REQUIRE_NOTHROW(guard.enter());
    guard.exit();
}

TEST_CASE("wrapped factory detects recursion into itself", "[cycle_guard]") {
    librtlife::cycle_guard guard(typeid(Guarded));
    librtlife::instance_factory wrapped;
    int depth = 0;
    wrapped = guard.wrap([&]() -> std::shared_ptr<void> {
        ++depth;
        return wrapped();
    });

    REQUIRE_THROWS_AS(wrapped(), librtlife::cyclic_dependency);
    REQUIRE(depth == 1);
    REQUIRE(guard.in_flight() == 0);
}

TEST_CASE("wrapped factory passes results and errors through", "[cycle_guard]") {
    librtlife::cycle_guard guard(typeid(Guarded));
    auto value = std::make_shared<Guarded>();

    auto ok = guard.wrap([value]() -> std::shared_ptr<void> { return value; });
    REQUIRE(ok().get() == value.get());

    auto failing = guard.wrap([]() -> std::shared_ptr<void> {
        throw std::logic_error("boom");
    });
    REQUIRE_THROWS_AS(failing(), std::logic_error);
    REQUIRE(guard.in_flight() == 0);
}
