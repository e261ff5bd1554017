#include <catch2/catch_test_macros.hpp>
#include <librtlife.hpp>

#include <atomic>
#include <chrono>
#include <latch>
#include <memory>
#include <set>
#include <thread>
#include <vector>

using namespace librtlife;

namespace {

struct IService {
    virtual ~IService() = default;
};

struct SlowService : IService {
    inline static std::atomic<int> constructed{0};
    SlowService() {
        ++constructed;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
};

struct IWorker {
    virtual ~IWorker() = default;
};

struct Worker : IWorker {};

void resolve_singleton_from(std::size_t thread_count) {
    container c;
    SlowService::constructed = 0;
    c.register_service<IService, SlowService>(lifestyle::singleton());

    std::latch start(static_cast<std::ptrdiff_t>(thread_count));
    std::vector<std::shared_ptr<IService>> seen(thread_count);
    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 0; i < thread_count; ++i) {
            threads.emplace_back([&, i] {
                start.arrive_and_wait();
                seen[i] = c.get_instance<IService>();
            });
        }
    }

    REQUIRE(SlowService::constructed == 1);
    for (const auto& instance : seen) {
        REQUIRE(instance != nullptr);
        REQUIRE(instance == seen.front());
    }
}

} // namespace

TEST_CASE("singleton constructs once under contention", "[concurrency]") {
    SECTION("5 threads") { resolve_singleton_from(5); }
    SECTION("32 threads") { resolve_singleton_from(32); }
}

TEST_CASE("concurrent chains in one registration are not cycles", "[concurrency]") {
    container c;
    std::latch both_inside(2);
    std::latch both_observed(2);
    std::atomic<int> failures{0};
    std::atomic<std::size_t> observed_in_flight{0};
    std::shared_ptr<instance_producer> producer;

    producer = lifestyle::transient()->create_producer<IWorker>(
        [&]() -> std::shared_ptr<IWorker> {
            both_inside.arrive_and_wait();
            observed_in_flight = producer->get_registration().guard().in_flight();
            both_observed.arrive_and_wait();
            return std::make_shared<Worker>();
        }, c);

    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < 2; ++i) {
            threads.emplace_back([&] {
                try {
                    producer->get_instance();
                } catch (const cyclic_dependency&) {
                    ++failures;
                    // Release the other chain so the test fails instead of hanging.
                    both_inside.count_down();
                    both_observed.count_down();
                }
            });
        }
    }

    REQUIRE(failures == 0);
    REQUIRE(observed_in_flight == 2);
    REQUIRE(producer->get_registration().guard().in_flight() == 0);
    REQUIRE_FALSE(producer->get_registration().guard().holds_storage());
}

TEST_CASE("each thread sees its own lifetime scope", "[concurrency]") {
    container c;
    c.register_service<IWorker, Worker>(lifestyle::lifetime_scope());

    constexpr std::size_t thread_count = 8;
    std::latch start(thread_count);
    std::vector<std::shared_ptr<IWorker>> first(thread_count);
    std::vector<std::shared_ptr<IWorker>> second(thread_count);
    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 0; i < thread_count; ++i) {
            threads.emplace_back([&, i] {
                auto s = c.begin_lifetime_scope();
                start.arrive_and_wait();
                first[i] = c.get_instance<IWorker>();
                second[i] = c.get_instance<IWorker>();
            });
        }
    }

    std::set<IWorker*> distinct;
    for (std::size_t i = 0; i < thread_count; ++i) {
        REQUIRE(first[i] == second[i]);
        distinct.insert(first[i].get());
    }
    REQUIRE(distinct.size() == thread_count);
    REQUIRE(scope::current(c) == nullptr);
}

TEST_CASE("cycle guard tracks chains from many threads", "[concurrency]") {
    cycle_guard guard(typeid(Worker));
    constexpr int thread_count = 16;
    std::latch inside(thread_count);
    std::latch leave(1);
    std::atomic<int> failures{0};
    std::size_t peak = 0;

    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < thread_count; ++i) {
            threads.emplace_back([&] {
                try {
                    cycle_guard::entry e(guard);
                    inside.count_down();
                    leave.wait();
                } catch (const cyclic_dependency&) {
                    ++failures;
                    inside.count_down();
                }
            });
        }
        inside.wait();
        peak = guard.in_flight();
        leave.count_down();
    }

    REQUIRE(failures == 0);
    REQUIRE(peak == static_cast<std::size_t>(thread_count));
    REQUIRE(guard.in_flight() == 0);
    REQUIRE_FALSE(guard.holds_storage());
}
