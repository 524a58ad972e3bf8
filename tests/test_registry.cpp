#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <librtboot.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <typeindex>
#include <vector>

namespace {

std::vector<std::string> events;

struct C {
    void on_initialize() { events.push_back("init C"); }
    void on_dispose() { events.push_back("dispose C"); }
};

struct B {
    explicit B(std::shared_ptr<C> c) : c(std::move(c)) {}
    void on_initialize() { events.push_back("init B"); }
    void on_dependencies_resolved() { events.push_back("resolved B"); }
    void on_dispose() { events.push_back("dispose B"); }
    std::shared_ptr<C> c;
};

struct A {
    explicit A(std::shared_ptr<B> b) : b(std::move(b)) {}
    void on_dependencies_resolved() { events.push_back("resolved A"); }
    void on_dispose() { events.push_back("dispose A"); }
    std::shared_ptr<B> b;
};

/// Depends on C for ordering only; built with its default constructor.
struct OrderedAfterC {
    void on_dependencies_resolved() {}
};

struct Broken {
    Broken() { throw std::runtime_error("cannot start"); }
};

struct NeedsBroken {
    explicit NeedsBroken(std::shared_ptr<Broken>) {}
    void on_dependencies_resolved() { events.push_back("resolved NeedsBroken"); }
};

struct Independent {
    void on_initialize() { events.push_back("init Independent"); }
};

struct FailingHook {
    void on_initialize() { throw std::runtime_error("hook"); }
};

struct X {
    explicit X(std::shared_ptr<struct Y>) {}
    void on_dependencies_resolved() {}
};
struct Y {
    explicit Y(std::shared_ptr<X>) {}
    void on_dependencies_resolved() {}
};

struct Missing {};
struct WantsMissing {
    explicit WantsMissing(std::shared_ptr<Missing>) {}
    void on_dependencies_resolved() {}
};

struct ThrowsInt {
    ThrowsInt() { throw 7; }
};

struct NeedsCThrowsInt {
    explicit NeedsCThrowsInt(std::shared_ptr<C>) { throw 7; }
    void on_dependencies_resolved() {}
};

struct IntHook {
    void on_initialize() { throw 42; }
};

struct IntDispose {
    void on_dispose() { throw 42; }
};

struct UsesC {
    std::shared_ptr<C> c;
};

std::vector<std::type_index> types(std::initializer_list<std::type_index> list) {
    return list;
}

} // namespace

// ---------------------------------------------------------------
// Ordering and initialization
// ---------------------------------------------------------------

TEST_CASE("chain registered backwards initializes as C, B, A", "[registry]") {
    librtboot::registry reg;
    reg.register_component<A>(0, librtboot::deps<B>);
    reg.register_component<B>(0, librtboot::deps<C>);
    reg.register_component<C>(0);

    REQUIRE(reg.initialization_order() == types({typeid(C), typeid(B), typeid(A)}));

    events.clear();
    reg.initialize_all();
    std::vector<std::string> expected{"init C", "init B", "resolved B", "resolved A"};
    REQUIRE(events == expected);
    REQUIRE(reg.is_initialized());

    auto a = reg.get_manager<A>();
    REQUIRE(a != nullptr);
    REQUIRE(a->b == reg.get_manager<B>());
    REQUIRE(a->b->c == reg.get_manager<C>());
    reg.dispose();
}

TEST_CASE("dependency declared only for ordering", "[registry]") {
    librtboot::registry reg;
    reg.register_component<OrderedAfterC>(10, librtboot::deps<C>);
    reg.register_component<C>(0);

    REQUIRE(reg.initialization_order() == types({typeid(C), typeid(OrderedAfterC)}));
    reg.initialize_all();
    REQUIRE(reg.get_manager<OrderedAfterC>() != nullptr);
    reg.dispose();
}

TEST_CASE("initialize_all is one-shot", "[registry]") {
    librtboot::registry reg;
    reg.register_component<C>();

    events.clear();
    reg.initialize_all();
    reg.initialize_all();
    REQUIRE(events == std::vector<std::string>{"init C"});
    reg.dispose();
}

TEST_CASE("registration after initialization is ignored", "[registry]") {
    librtboot::registry reg;
    reg.register_component<C>();
    reg.initialize_all();

    reg.register_component<Independent>();
    REQUIRE_FALSE(reg.is_registered<Independent>());
    REQUIRE(reg.registered_count() == 1);
    reg.dispose();
}

TEST_CASE("duplicate registration replaces the earlier one", "[registry]") {
    librtboot::registry reg;
    reg.register_component<C>(1);
    reg.register_component<C>(9);

    REQUIRE(reg.registered_count() == 1);
    REQUIRE(reg.graph().node(typeid(C))->priority == 9);
}

TEST_CASE("register_instance is used as-is", "[registry]") {
    auto c = std::make_shared<C>();
    librtboot::registry reg;
    reg.register_instance(c, 5);
    reg.register_component<B>(0, librtboot::deps<C>);

    events.clear();
    reg.initialize_all();
    REQUIRE(reg.get_manager<C>() == c);
    REQUIRE(reg.get_manager<B>()->c == c);
    // The pre-built instance's on_initialize is not run again.
    REQUIRE(events == std::vector<std::string>{"init B", "resolved B"});
    reg.dispose();
}

// ---------------------------------------------------------------
// Validation before initialization
// ---------------------------------------------------------------

TEST_CASE("cycle aborts initialize_all", "[registry]") {
    librtboot::registry reg;
    reg.register_component<X>(0, librtboot::deps<Y>);
    reg.register_component<Y>(0, librtboot::deps<X>);

    auto result = reg.validate_dependencies();
    REQUIRE(result.has_circular_dependencies);
    REQUIRE(result.cycle == types({typeid(X), typeid(Y), typeid(X)}));

    REQUIRE_THROWS_AS(reg.initialize_all(), librtboot::cyclic_dependency);
    REQUIRE_FALSE(reg.is_initialized());
}

TEST_CASE("missing dependency aborts initialize_all", "[registry]") {
    librtboot::registry reg;
    reg.register_component<WantsMissing>(0, librtboot::deps<Missing>);

    try {
        reg.initialize_all();
        FAIL("Expected missing_dependency");
    } catch (const librtboot::missing_dependency& e) {
        REQUIRE(e.dependent() == std::type_index(typeid(WantsMissing)));
        REQUIRE(e.dependency() == std::type_index(typeid(Missing)));
    }
}

// ---------------------------------------------------------------
// Failure policies
// ---------------------------------------------------------------

TEST_CASE("strict initialization rolls back on failure", "[registry]") {
    librtboot::registry reg;
    reg.register_component<C>(10);
    reg.register_component<Broken>(0);

    events.clear();
    REQUIRE_THROWS_AS(reg.initialize_all(), librtboot::instance_creation_error);
    REQUIRE_FALSE(reg.is_initialized());
    REQUIRE(events == std::vector<std::string>{"init C", "dispose C"});
    REQUIRE(reg.last_report().failed == types({typeid(Broken)}));
}

TEST_CASE("lenient initialization blocks dependents of a failure", "[registry]") {
    librtboot::registry reg({.strict_initialization = false});
    reg.register_component<Broken>(5);
    reg.register_component<NeedsBroken>(4, librtboot::deps<Broken>);
    reg.register_component<Independent>(0);

    events.clear();
    REQUIRE_NOTHROW(reg.initialize_all());
    REQUIRE(reg.is_initialized());

    auto report = reg.last_report();
    REQUIRE(report.failed == types({typeid(Broken)}));
    REQUIRE(report.blocked == types({typeid(NeedsBroken)}));
    REQUIRE(report.initialized == types({typeid(Independent)}));
    REQUIRE(events == std::vector<std::string>{"init Independent"});

    REQUIRE(reg.get_manager<NeedsBroken>() == nullptr);
    reg.dispose();
}

TEST_CASE("hook failure aborts lenient initialization too", "[registry]") {
    librtboot::registry reg({.strict_initialization = false});
    reg.register_component<FailingHook>();
    REQUIRE_THROWS_AS(reg.initialize_all(), librtboot::lifecycle_hook_error);
    REQUIRE_FALSE(reg.is_initialized());
}

// ---------------------------------------------------------------
// get_manager
// ---------------------------------------------------------------

TEST_CASE("get_manager builds lazily before initialize_all", "[registry]") {
    librtboot::registry reg;
    reg.register_component<B>(0, librtboot::deps<C>);
    reg.register_component<C>(0);

    events.clear();
    auto b = reg.get_manager<B>();
    REQUIRE(b != nullptr);
    REQUIRE(events == std::vector<std::string>{"init C", "init B", "resolved B"});

    // initialize_all does not build them again.
    reg.initialize_all();
    REQUIRE(reg.get_manager<B>() == b);
    REQUIRE(events.size() == 3);
    reg.dispose();
}

TEST_CASE("get_manager never throws", "[registry]") {
    librtboot::registry reg;
    reg.register_component<Broken>();

    std::shared_ptr<Broken> broken;
    REQUIRE_NOTHROW(broken = reg.get_manager<Broken>());
    REQUIRE(broken == nullptr);
    REQUIRE(reg.get_manager<Missing>() == nullptr);
}

// ---------------------------------------------------------------
// Container integration
// ---------------------------------------------------------------

TEST_CASE("initialized components are published to the container", "[registry]") {
    librtboot::service_container services;
    librtboot::registry reg(&services);
    reg.register_component<C>();
    reg.register_component<B>(0, librtboot::deps<C>);
    reg.initialize_all();

    REQUIRE(services.resolve<B>() == reg.get_manager<B>());
    REQUIRE(services.singleton_count() == 2);

    reg.dispose();
    REQUIRE_FALSE(services.is_registered<B>());
    REQUIRE_FALSE(services.is_registered<C>());
}

TEST_CASE("get_manager falls back to the container", "[registry]") {
    librtboot::service_container services;
    auto missing = std::make_shared<Missing>();
    services.register_singleton<Missing>(missing);

    librtboot::registry reg(&services);
    REQUIRE(reg.get_manager<Missing>() == missing);
}

TEST_CASE("publishing can be switched off", "[registry]") {
    librtboot::service_container services;
    librtboot::registry reg(&services, {.publish_to_container = false});
    reg.register_component<C>();
    reg.initialize_all();
    REQUIRE_FALSE(services.is_registered<C>());
    reg.dispose();
}

// ---------------------------------------------------------------
// Teardown
// ---------------------------------------------------------------

TEST_CASE("dispose runs in reverse initialization order", "[registry]") {
    librtboot::registry reg;
    reg.register_component<A>(0, librtboot::deps<B>);
    reg.register_component<B>(0, librtboot::deps<C>);
    reg.register_component<C>(0);
    reg.initialize_all();

    events.clear();
    reg.dispose();
    std::vector<std::string> expected{"dispose A", "dispose B", "dispose C"};
    REQUIRE(events == expected);
    REQUIRE(reg.registered_count() == 0);
    REQUIRE_FALSE(reg.is_initialized());
}

TEST_CASE("dispose is idempotent", "[registry]") {
    librtboot::registry reg;
    reg.register_component<C>();
    reg.initialize_all();

    events.clear();
    reg.dispose();
    reg.dispose();
    REQUIRE(events == std::vector<std::string>{"dispose C"});
}

TEST_CASE("registry can be reused after dispose", "[registry]") {
    librtboot::registry reg;
    reg.register_component<C>();
    reg.initialize_all();
    reg.dispose();

    reg.register_component<Independent>();
    REQUIRE(reg.is_registered<Independent>());
    REQUIRE_NOTHROW(reg.initialize_all());
    reg.dispose();
}

// ---------------------------------------------------------------
// Non-standard exceptions from components
// ---------------------------------------------------------------

TEST_CASE("get_manager survives a non-standard exception", "[registry]") {
    librtboot::registry reg;
    reg.register_component<ThrowsInt>();

    std::shared_ptr<ThrowsInt> instance;
    REQUIRE_NOTHROW(instance = reg.get_manager<ThrowsInt>());
    REQUIRE(instance == nullptr);
}

TEST_CASE("strict rollback runs for a non-standard exception", "[registry]") {
    librtboot::registry reg;
    reg.register_component<C>(10);
    reg.register_component<NeedsCThrowsInt>(0, librtboot::deps<C>);

    events.clear();
    try {
        reg.initialize_all();
        FAIL("Expected instance_creation_error");
    } catch (const librtboot::instance_creation_error& e) {
        REQUIRE(e.component_type() == std::type_index(typeid(NeedsCThrowsInt)));
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("unknown exception"));
    }
    REQUIRE(events == std::vector<std::string>{"init C", "dispose C"});
    REQUIRE_FALSE(reg.is_initialized());
    REQUIRE(reg.get_manager<C>() != nullptr);  // rebuilt lazily after the rollback
}

TEST_CASE("hook throwing a non-standard exception aborts initialization", "[registry]") {
    librtboot::registry reg({.strict_initialization = false});
    reg.register_component<IntHook>();
    REQUIRE_THROWS_AS(reg.initialize_all(), librtboot::lifecycle_hook_error);
    REQUIRE_FALSE(reg.is_initialized());
}

TEST_CASE("dispose continues past a non-standard exception", "[registry]") {
    librtboot::registry reg;
    reg.register_component<C>();
    reg.register_component<IntDispose>();
    reg.initialize_all();

    events.clear();
    REQUIRE_NOTHROW(reg.dispose());
    REQUIRE(events == std::vector<std::string>{"dispose C"});
    REQUIRE(reg.registered_count() == 0);
}

// ---------------------------------------------------------------
// Lock ordering with the container
// ---------------------------------------------------------------

TEST_CASE("container factories may call back into the registry", "[registry]") {
    librtboot::service_container services;
    librtboot::registry reg(&services);
    reg.register_component<C>();
    services.register_factory<UsesC>([&reg](librtboot::service_container&) {
        auto uses = std::make_shared<UsesC>();
        uses->c = reg.get_manager<C>();
        return uses;
    });

    reg.initialize_all();
    REQUIRE(services.resolve<UsesC>()->c == reg.get_manager<C>());
    reg.dispose();
}

TEST_CASE("registry fallback and container callbacks run concurrently", "[registry][concurrency]") {
    librtboot::service_container services;
    librtboot::registry reg(&services);
    reg.register_component<C>();
    services.register_singleton<Missing>(std::make_shared<Missing>());
    services.register_factory<UsesC>([&reg](librtboot::service_container&) {
        auto uses = std::make_shared<UsesC>();
        uses->c = reg.get_manager<C>();
        return uses;
    });

    constexpr int iterations = 500;
    // Registry lock then container lock on one thread; the reverse on the other.
    {
        std::jthread via_registry([&] {
            for (int i = 0; i < iterations; ++i) {
                (void)reg.get_manager<Missing>();
            }
        });
        std::jthread via_container([&] {
            for (int i = 0; i < iterations; ++i) {
                (void)services.resolve<UsesC>();
            }
        });
    }

    REQUIRE(services.resolve<UsesC>()->c == reg.get_manager<C>());
    reg.dispose();
}
