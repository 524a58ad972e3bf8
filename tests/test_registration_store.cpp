#include <catch2/catch_test_macros.hpp>
#include <librtboot.hpp>

#include <memory>
#include <typeindex>

namespace {

struct A {};
struct B {};
struct C {};

librtboot::component_registration make_reg(std::type_index type, int priority = 0) {
    librtboot::component_registration reg;
    reg.component_type = type;
    reg.name = librtboot::internal::demangle(type);
    reg.priority = priority;
    return reg;
}

} // namespace

TEST_CASE("registrations are kept in registration order", "[store]") {
    librtboot::registration_store store;
    store.add(make_reg(typeid(B)));
    store.add(make_reg(typeid(A)));
    store.add(make_reg(typeid(C)));

    auto types = store.types();
    REQUIRE(types.size() == 3);
    REQUIRE(types[0] == std::type_index(typeid(B)));
    REQUIRE(types[1] == std::type_index(typeid(A)));
    REQUIRE(types[2] == std::type_index(typeid(C)));
}

TEST_CASE("sequence numbers strictly increase", "[store]") {
    librtboot::registration_store store;
    store.add(make_reg(typeid(A)));
    store.add(make_reg(typeid(B)));

    REQUIRE(store.find(typeid(A))->sequence < store.find(typeid(B))->sequence);
    REQUIRE(store.find(typeid(A))->sequence > 0);
}

TEST_CASE("re-adding a type replaces it and moves it to the back", "[store]") {
    librtboot::registration_store store;
    REQUIRE_FALSE(store.add(make_reg(typeid(A), 1)));
    store.add(make_reg(typeid(B)));
    REQUIRE(store.add(make_reg(typeid(A), 7)));

    REQUIRE(store.size() == 2);
    REQUIRE(store.find(typeid(A))->priority == 7);
    REQUIRE(store.types().back() == std::type_index(typeid(A)));
    REQUIRE(store.find(typeid(A))->sequence > store.find(typeid(B))->sequence);
}

TEST_CASE("find returns nullptr for unknown types", "[store]") {
    librtboot::registration_store store;
    REQUIRE(store.find(typeid(A)) == nullptr);
    REQUIRE_FALSE(store.contains(typeid(A)));
    REQUIRE(store.instance_of(typeid(A)) == nullptr);
}

TEST_CASE("instances can be attached and detached", "[store]") {
    librtboot::registration_store store;
    store.add(make_reg(typeid(A)));

    auto a = std::make_shared<A>();
    store.attach_instance(typeid(A), a);
    REQUIRE(store.instance_of(typeid(A)) == a);

    store.detach_instance(typeid(A));
    REQUIRE(store.instance_of(typeid(A)) == nullptr);
    REQUIRE(store.contains(typeid(A)));
}

TEST_CASE("attaching to an unknown type is ignored", "[store]") {
    librtboot::registration_store store;
    store.attach_instance(typeid(A), std::make_shared<A>());
    REQUIRE(store.empty());
}

TEST_CASE("graph mirrors registrations and their edges", "[store]") {
    librtboot::registration_store store;
    auto a = make_reg(typeid(A), 3);
    a.dependencies = {typeid(B), typeid(C)};
    store.add(std::move(a));
    store.add(make_reg(typeid(B)));

    auto graph = store.graph();
    REQUIRE(graph.size() == 2);
    REQUIRE(graph.contains(typeid(A)));
    REQUIRE_FALSE(graph.contains(typeid(C)));
    REQUIRE(graph.node(typeid(A))->priority == 3);

    const auto& deps = graph.dependencies_of(typeid(A));
    REQUIRE(deps.size() == 2);
    REQUIRE(deps[0] == std::type_index(typeid(B)));
    REQUIRE(deps[1] == std::type_index(typeid(C)));
}

TEST_CASE("clear removes everything", "[store]") {
    librtboot::registration_store store;
    store.add(make_reg(typeid(A)));
    store.add(make_reg(typeid(B)));
    store.clear();
    REQUIRE(store.empty());
    REQUIRE_FALSE(store.contains(typeid(A)));
}
