#include <catch2/catch_test_macros.hpp>
#include <librtboot.hpp>

#include <memory>
#include <stdexcept>

namespace {

struct IRenderer {
    virtual ~IRenderer() = default;
    virtual int id() const = 0;
};
struct BrokenRenderer : IRenderer {
    BrokenRenderer() { throw std::runtime_error("no device"); }
    int id() const override { return 0; }
};
struct SoftwareRenderer : IRenderer {
    inline static int constructed = 0;
    SoftwareRenderer() { ++constructed; }
    int id() const override { return 1; }
};
struct GpuRenderer : IRenderer {
    int id() const override { return 2; }
};

struct PanickingRenderer : IRenderer {
    PanickingRenderer() { throw 42; }
    int id() const override { return 3; }
};

struct IUnknown {
    virtual ~IUnknown() = default;
};

} // namespace

TEST_CASE("first constructible candidate wins", "[discovery]") {
    librtboot::implementation_catalog catalog;
    catalog.add<IRenderer, BrokenRenderer>();
    catalog.add<IRenderer, SoftwareRenderer>();
    catalog.add<IRenderer, GpuRenderer>();
    REQUIRE(catalog.size() == 3);

    librtboot::discovery finder(std::move(catalog));
    auto found = std::static_pointer_cast<IRenderer>(finder.try_discover(typeid(IRenderer)));
    REQUIRE(found != nullptr);
    REQUIRE(found->id() == 1);
    REQUIRE(finder.discovered_count() == 1);
}

TEST_CASE("each type is attempted only once", "[discovery]") {
    SoftwareRenderer::constructed = 0;
    librtboot::implementation_catalog catalog;
    catalog.add<IRenderer, SoftwareRenderer>();
    librtboot::discovery finder(std::move(catalog));

    auto first = finder.try_discover(typeid(IRenderer));
    auto second = finder.try_discover(typeid(IRenderer));
    REQUIRE(first == second);
    REQUIRE(SoftwareRenderer::constructed == 1);
    REQUIRE(finder.attempts() == 1);
}

TEST_CASE("absence is remembered and is not an error", "[discovery]") {
    librtboot::discovery finder;
    REQUIRE_FALSE(finder.attempted(typeid(IUnknown)));
    REQUIRE(finder.try_discover(typeid(IUnknown)) == nullptr);
    REQUIRE(finder.attempted(typeid(IUnknown)));

    // A candidate added afterwards is not tried for the remembered type.
    finder.catalog().add_candidate(typeid(IUnknown), typeid(IUnknown),
        [] { return std::static_pointer_cast<void>(std::make_shared<int>(1)); });
    REQUIRE(finder.try_discover(typeid(IUnknown)) == nullptr);

    finder.clear();
    REQUIRE(finder.try_discover(typeid(IUnknown)) != nullptr);
}

TEST_CASE("all candidates failing gives not found", "[discovery]") {
    librtboot::implementation_catalog catalog;
    catalog.add<IRenderer, BrokenRenderer>();
    librtboot::discovery finder(std::move(catalog));

    REQUIRE(finder.try_discover(typeid(IRenderer)) == nullptr);
    REQUIRE(finder.discovered_count() == 0);
}

TEST_CASE("candidate without a create function is rejected", "[discovery]") {
    librtboot::implementation_catalog catalog;
    REQUIRE_THROWS_AS(catalog.add_candidate(typeid(IRenderer), typeid(GpuRenderer), {}),
                      librtboot::bootstrap_error);
}

TEST_CASE("candidate throwing a non-standard exception is skipped", "[discovery]") {
    librtboot::implementation_catalog catalog;
    catalog.add<IRenderer, PanickingRenderer>();
    catalog.add<IRenderer, GpuRenderer>();
    librtboot::discovery finder(std::move(catalog));

    std::shared_ptr<void> found;
    REQUIRE_NOTHROW(found = finder.try_discover(typeid(IRenderer)));
    REQUIRE(found != nullptr);
    REQUIRE(std::static_pointer_cast<IRenderer>(found)->id() == 2);
}

TEST_CASE("added candidates reopen a remembered absence", "[discovery]") {
    librtboot::discovery finder;
    REQUIRE(finder.try_discover(typeid(IRenderer)) == nullptr);

    librtboot::implementation_catalog extra;
    extra.add<IRenderer, GpuRenderer>();
    finder.add_candidates(std::move(extra));

    REQUIRE_FALSE(finder.attempted(typeid(IRenderer)));
    REQUIRE(finder.catalog().candidates_for(typeid(IRenderer)).size() == 1);
    REQUIRE(finder.try_discover(typeid(IRenderer)) != nullptr);
}
