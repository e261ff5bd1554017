#include <catch2/catch_test_macros.hpp>
#include <librtlife.hpp>

#include <memory>
#include <string>

using namespace librtlife;

namespace {

struct IRepo {
    virtual ~IRepo() = default;
};

struct Repo : IRepo {
    inline static int constructed = 0;
    Repo() { ++constructed; }
};

struct IHandler {
    virtual ~IHandler() = default;
    virtual std::shared_ptr<IRepo> repo() const = 0;
};

struct Handler : IHandler {
    explicit Handler(std::shared_ptr<IRepo> r) : repo_(std::move(r)) {}
    std::shared_ptr<IRepo> repo() const override { return repo_; }
    std::shared_ptr<IRepo> repo_;
};

struct IUnregistered {
    virtual ~IUnregistered() = default;
};

} // namespace

TEST_CASE("container resolves declared dependencies", "[container]") {
    container c;
    c.register_service<IRepo, Repo>(lifestyle::singleton());
    c.register_service<IHandler, Handler>(lifestyle::transient(), deps<IRepo>);

    auto h1 = c.get_instance<IHandler>();
    auto h2 = c.get_instance<IHandler>();
    REQUIRE(h1 != h2);
    REQUIRE(h1->repo() == h2->repo());
    REQUIRE(h1->repo() == c.get_instance<IRepo>());
}

TEST_CASE("container registration keeps order", "[container]") {
    container c;
    c.register_service<IRepo, Repo>(lifestyle::singleton())
     .register_service<IHandler, Handler>(lifestyle::transient(), deps<IRepo>);

    auto all = c.producers();
    REQUIRE(all.size() == 2);
    REQUIRE(all[0]->service_type() == typeid(IRepo));
    REQUIRE(all[1]->service_type() == typeid(IHandler));
    REQUIRE(c.get_producer(typeid(IRepo)) == all[0]);
    REQUIRE(c.get_producer(typeid(IUnregistered)) == nullptr);
}

TEST_CASE("container reports unregistered services", "[container]") {
    container c;
    try {
        c.get_instance<IUnregistered>();
        FAIL("expected not_found");
    } catch (const not_found& e) {
        REQUIRE(e.component_type() == typeid(IUnregistered));
    }
}

TEST_CASE("container rejects duplicate registrations", "[container]") {
    container c;
    c.register_service<IRepo, Repo>(lifestyle::singleton());
    REQUIRE_THROWS_AS((c.register_service<IRepo, Repo>(lifestyle::transient())),
                      duplicate_registration);
}

TEST_CASE("container rejects a null lifestyle", "[container]") {
    container c;
    try {
        c.register_service<IRepo, Repo>(nullptr);
        FAIL("expected argument_error");
    } catch (const argument_error& e) {
        REQUIRE(e.param_name() == "lifestyle");
    }
}

TEST_CASE("container locks after the first resolve", "[container]") {
    container c;
    c.register_service<IRepo, Repo>(lifestyle::singleton());
    REQUIRE_FALSE(c.is_locked());

    c.get_instance<IRepo>();
    REQUIRE(c.is_locked());
    REQUIRE_THROWS_AS(
        (c.register_service<IHandler, Handler>(lifestyle::transient(), deps<IRepo>)),
        di_error);
}

TEST_CASE("container lock can be disabled", "[container]") {
    container c({.lock_on_first_resolve = false});
    c.register_service<IRepo, Repo>(lifestyle::singleton());
    c.get_instance<IRepo>();
    REQUIRE_FALSE(c.is_locked());
    REQUIRE_NOTHROW(
        (c.register_service<IHandler, Handler>(lifestyle::transient(), deps<IRepo>)));
    REQUIRE_FALSE(c.options().lock_on_first_resolve);
}

TEST_CASE("container rejects producers built for another container", "[container]") {
    container c;
    container other;
    auto producer = lifestyle::transient()->create_producer<IRepo, Repo>(other);
    REQUIRE_THROWS_AS(c.register_producer(producer), argument_error);
    REQUIRE_THROWS_AS(c.register_producer(nullptr), argument_error);

    REQUIRE_NOTHROW(other.register_producer(producer));
    REQUIRE(other.get_producer(typeid(IRepo)) == producer);
}

TEST_CASE("verify reports a captive dependency", "[container]") {
    container c;
    c.register_service<IRepo, Repo>(lifestyle::transient());
    c.register_service<IHandler, Handler>(lifestyle::singleton(), deps<IRepo>);

    try {
        c.verify();
        FAIL("expected lifestyle_mismatch");
    } catch (const lifestyle_mismatch& e) {
        REQUIRE(e.consumer() == typeid(IHandler));
        REQUIRE(e.dependency() == typeid(IRepo));
        std::string msg = e.what();
        REQUIRE(msg.find("Singleton") != std::string::npos);
        REQUIRE(msg.find("Transient") != std::string::npos);
    }
}

TEST_CASE("verify reports missing dependencies", "[container]") {
    container c;
    c.register_service<IHandler, Handler>(lifestyle::transient(), deps<IRepo>);

    try {
        c.verify();
        FAIL("expected not_found");
    } catch (const not_found& e) {
        REQUIRE(e.component_type() == typeid(IRepo));
        REQUIRE(std::string(e.what()).find("required by") != std::string::npos);
    }
}

TEST_CASE("verify can skip the lifestyle check", "[container]") {
    container c;
    c.register_service<IRepo, Repo>(lifestyle::transient());
    c.register_service<IHandler, Handler>(lifestyle::singleton(), deps<IRepo>);
    REQUIRE_NOTHROW(c.verify({.check_lifestyle_mismatches = false, .construct_all = false}));
}

TEST_CASE("verify constructs every registration once", "[container]") {
    container c;
    Repo::constructed = 0;
    c.register_service<IRepo, Repo>(lifestyle::singleton());
    c.register_service<IHandler, Handler>(lifestyle::lifetime_scope(), deps<IRepo>);

    c.verify();
    REQUIRE(Repo::constructed == 1);
    REQUIRE(c.is_locked());
}

TEST_CASE("verify surfaces construction failures", "[container]") {
    container c;
    c.register_service<IRepo>(lifestyle::transient(),
        std::function<std::shared_ptr<IRepo>()>([]() -> std::shared_ptr<IRepo> {
            throw std::runtime_error("database offline");
        }));
    REQUIRE_THROWS_AS(c.verify(), std::runtime_error);
}
