#include <catch2/catch_test_macros.hpp>
#include <librtboot.hpp>

#include <algorithm>
#include <typeindex>
#include <vector>

namespace {

struct A {};
struct B {};
struct C {};
struct D {};
struct E {};
struct X {};
struct Y {};
struct External {};

class graph_builder {
public:
    graph_builder& node(std::type_index type, int priority = 0,
                        std::vector<std::type_index> deps = {}) {
        graph_.add_node(librtboot::graph_node{type, librtboot::internal::demangle(type),
                                              priority, ++seq_, true},
                        std::move(deps));
        return *this;
    }

    const librtboot::dependency_graph& graph() const { return graph_; }

private:
    librtboot::dependency_graph graph_;
    std::uint64_t seq_ = 0;
};

std::size_t position(const std::vector<std::type_index>& order, std::type_index t) {
    return static_cast<std::size_t>(
        std::find(order.begin(), order.end(), t) - order.begin());
}

} // namespace

TEST_CASE("chain is ordered dependencies first", "[scheduler]") {
    graph_builder b;
    b.node(typeid(A), 0, {typeid(B)})
     .node(typeid(B), 0, {typeid(C)})
     .node(typeid(C), 0);

    auto order = librtboot::compute_order(b.graph());
    std::vector<std::type_index> expected{typeid(C), typeid(B), typeid(A)};
    REQUIRE(order == expected);
}

TEST_CASE("higher priority goes first among ready components", "[scheduler]") {
    graph_builder b;
    b.node(typeid(A), 1)
     .node(typeid(B), 10)
     .node(typeid(C), 5);

    auto order = librtboot::compute_order(b.graph());
    std::vector<std::type_index> expected{typeid(B), typeid(C), typeid(A)};
    REQUIRE(order == expected);
}

TEST_CASE("equal priorities keep registration order", "[scheduler]") {
    graph_builder b;
    b.node(typeid(B), 3)
     .node(typeid(A), 3)
     .node(typeid(C), 3);

    auto order = librtboot::compute_order(b.graph());
    std::vector<std::type_index> expected{typeid(B), typeid(A), typeid(C)};
    REQUIRE(order == expected);
}

TEST_CASE("dependencies win over priority", "[scheduler]") {
    graph_builder b;
    b.node(typeid(A), 100, {typeid(B)})
     .node(typeid(B), -5);

    auto order = librtboot::compute_order(b.graph());
    REQUIRE(position(order, typeid(B)) < position(order, typeid(A)));
}

TEST_CASE("unblocked high-priority component jumps the queue", "[scheduler]") {
    // A (prio 9) waits on B (prio 6); C and D (prio 5) are ready at once.
    // Once B is placed, A outranks both of them.
    graph_builder b;
    b.node(typeid(A), 9, {typeid(B)})
     .node(typeid(C), 5)
     .node(typeid(D), 5)
     .node(typeid(B), 6);

    auto order = librtboot::compute_order(b.graph());
    std::vector<std::type_index> expected{typeid(B), typeid(A), typeid(C), typeid(D)};
    REQUIRE(order == expected);
}

TEST_CASE("every dependency precedes its dependent in a diamond", "[scheduler]") {
    graph_builder b;
    b.node(typeid(A), 0, {typeid(B), typeid(C)})
     .node(typeid(B), 7, {typeid(D)})
     .node(typeid(C), 3, {typeid(D)})
     .node(typeid(D), 0)
     .node(typeid(E), 4, {typeid(A)});

    auto order = librtboot::compute_order(b.graph());
    REQUIRE(order.size() == 5);
    for (const auto& n : b.graph().nodes()) {
        for (const auto& dep : b.graph().dependencies_of(n.type)) {
            REQUIRE(position(order, dep) < position(order, n.type));
        }
    }
}

TEST_CASE("dependencies outside the graph do not block", "[scheduler]") {
    graph_builder b;
    b.node(typeid(A), 0, {typeid(External)});

    auto order = librtboot::compute_order(b.graph());
    REQUIRE(order.size() == 1);
    REQUIRE(order[0] == std::type_index(typeid(A)));
}

TEST_CASE("cycle stops ordering with cyclic_dependency", "[scheduler]") {
    graph_builder b;
    b.node(typeid(C))
     .node(typeid(X), 0, {typeid(Y)})
     .node(typeid(Y), 0, {typeid(X)});

    try {
        (void)librtboot::compute_order(b.graph());
        FAIL("Expected cyclic_dependency");
    } catch (const librtboot::cyclic_dependency& e) {
        std::vector<std::type_index> expected{typeid(X), typeid(Y), typeid(X)};
        REQUIRE(e.cycle() == expected);
    }
}

TEST_CASE("self-dependency cannot be ordered", "[scheduler]") {
    graph_builder b;
    b.node(typeid(A), 0, {typeid(A)});
    REQUIRE_THROWS_AS(librtboot::compute_order(b.graph()), librtboot::cyclic_dependency);
}

TEST_CASE("empty graph gives an empty order", "[scheduler]") {
    librtboot::dependency_graph g;
    REQUIRE(librtboot::compute_order(g).empty());
}
