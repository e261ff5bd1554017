#include <catch2/catch_test_macros.hpp>
#include <librtlife.hpp>

#include <memory>
#include <mutex>

using namespace librtlife;

namespace {

struct IWidget {
    virtual ~IWidget() = default;
};

struct Widget : IWidget {};

/// Reuses an instance for `uses` calls, then constructs a new one.
std::shared_ptr<const lifestyle> make_recycling_lifestyle(int uses, int& applier_calls) {
    return lifestyle::create_custom("Recycling",
        [uses, &applier_calls](instance_factory create) -> instance_factory {
            ++applier_calls;
            struct state {
                std::mutex mutex;
                std::shared_ptr<void> current;
                int remaining = 0;
            };
            auto s = std::make_shared<state>();
            return [s, uses, create = std::move(create)]() {
                std::lock_guard lock(s->mutex);
                if (s->remaining == 0) {
                    s->current = create();
                    s->remaining = uses;
                }
                --s->remaining;
                return s->current;
            };
        });
}

} // namespace

TEST_CASE("custom applier runs once per registration at creation", "[custom]") {
    container c;
    int applier_calls = 0;
    auto ls = make_recycling_lifestyle(2, applier_calls);

    auto producer = ls->create_producer<IWidget, Widget>(c);
    REQUIRE(applier_calls == 1);

    for (int i = 0; i < 10; ++i) {
        producer->get_instance();
    }
    REQUIRE(applier_calls == 1);
}

TEST_CASE("custom policy decides reuse", "[custom]") {
    container c;
    int applier_calls = 0;
    int constructed = 0;
    auto ls = make_recycling_lifestyle(2, applier_calls);
    auto producer = ls->create_producer<IWidget>(
        [&] { ++constructed; return std::make_shared<Widget>(); }, c);

    auto a = producer->get_instance();
    auto b = producer->get_instance();
    auto d = producer->get_instance();

    REQUIRE(a == b);
    REQUIRE(a != d);
    REQUIRE(constructed == 2);
}

TEST_CASE("custom policy state is private per registration", "[custom]") {
    container c;
    int applier_calls = 0;
    auto ls = make_recycling_lifestyle(100, applier_calls);

    auto first = ls->create_producer<IWidget, Widget>(c);
    auto second = ls->create_producer<IWidget, Widget>(c);
    REQUIRE(applier_calls == 2);
    REQUIRE(first->get_instance() != second->get_instance());
}

TEST_CASE("custom factory is wrapped by the cycle guard", "[custom]") {
    container c;
    std::shared_ptr<instance_producer> producer;
    auto passthrough = lifestyle::create_custom("Passthrough",
        [](instance_factory create) { return create; });

    producer = passthrough->create_producer<IWidget>(
        [&]() -> std::shared_ptr<IWidget> {
            return producer->get_instance<IWidget>();
        }, c);

    REQUIRE_THROWS_AS(producer->get_instance(), cyclic_dependency);
    REQUIRE(producer->get_registration().guard().in_flight() == 0);
}

TEST_CASE("custom applier returning an empty factory is rejected", "[custom]") {
    container c;
    auto broken = lifestyle::create_custom("Broken",
        [](instance_factory) { return instance_factory{}; });

    REQUIRE_THROWS_AS((broken->create_registration<IWidget, Widget>(c)), di_error);
}

TEST_CASE("custom lifestyle reports its length", "[custom]") {
    auto identity = [](instance_factory f) { return f; };
    auto long_lived = lifestyle::create_custom("Long", identity, 750);
    auto short_lived = lifestyle::create_custom("Short", identity);

    REQUIRE(long_lived->name() == "Long");
    REQUIRE(long_lived->component_length() == 750);
    REQUIRE(short_lived->component_length() == lifestyle::transient()->component_length());
    REQUIRE_FALSE(lifestyle::is_compatible(*long_lived, *lifestyle::lifetime_scope()));
}
