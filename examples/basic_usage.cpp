/// basic_usage.cpp: librtboot introductory example.
///
/// Walks through a small application start-up:
///   1. Register managers with a priority and the managers they depend on.
///   2. Validate the graph and print the initialization order.
///   3. initialize_all() builds everything and publishes it to a container.
///   4. Services registered in the container resolve against the managers.
///   5. dispose() tears everything down in reverse.

#include <librtboot.hpp>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

using namespace librtboot;

// -----------------------------------------------------------------------
// Managers
// -----------------------------------------------------------------------

struct config_manager {
    std::string data_dir = "/var/lib/app";

    void on_initialize() { std::cout << "[init] config\n"; }
    void on_dispose() { std::cout << "[dispose] config\n"; }
};

struct asset_manager {
    explicit asset_manager(std::shared_ptr<config_manager> config)
        : config_(std::move(config)) {}

    void on_dependencies_resolved() {
        std::cout << "[init] assets from " << config_->data_dir << '\n';
    }
    void on_dispose() { std::cout << "[dispose] assets\n"; }

private:
    std::shared_ptr<config_manager> config_;
};

struct audio_manager {
    void on_initialize() { std::cout << "[init] audio\n"; }
    void on_dispose() { std::cout << "[dispose] audio\n"; }
};

// -----------------------------------------------------------------------
// Container services
// -----------------------------------------------------------------------

struct i_clock {
    virtual ~i_clock() = default;
    virtual long ticks() const = 0;
};

struct frame_clock : i_clock {
    long ticks() const override { return 42; }
};

struct scene_loader {
    scene_loader(std::shared_ptr<asset_manager> assets, std::shared_ptr<i_clock> clock)
        : assets_(std::move(assets)), clock_(std::move(clock)) {}

    std::string load(const std::string& name) const {
        return name + " loaded at tick " + std::to_string(clock_->ticks());
    }

private:
    std::shared_ptr<asset_manager> assets_;
    std::shared_ptr<i_clock> clock_;
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    service_container services;
    registry managers(&services);

    // ── Registration phase ────────────────────────────────────────────
    managers.register_component<audio_manager>(10);
    managers.register_component<asset_manager>(0, deps<config_manager>);
    managers.register_component<config_manager>(0);

    services.register_singleton<i_clock, frame_clock>();
    services.register_transient<scene_loader>(deps<asset_manager, i_clock>);

    // ── Validation phase ──────────────────────────────────────────────
    auto result = managers.validate_dependencies();
    std::cout << "Graph: " << result.summary() << '\n';
    for (const auto& w : result.warnings) {
        std::cout << "  warning: " << w << '\n';
    }

    auto analysis = managers.analyze_dependencies();
    std::cout << "Complexity: " << to_string(analysis.complexity)
              << " (longest chain " << analysis.longest_chain << ")\n";

    std::cout << "Order:";
    for (const auto& type : managers.initialization_order()) {
        std::cout << ' ' << internal::demangle(type);
    }
    std::cout << '\n';

    // ── Initialization phase ──────────────────────────────────────────
    managers.initialize_all();

    // Managers are now container singletons as well.
    auto loader = services.resolve<scene_loader>();
    std::cout << loader->load("intro") << '\n';

    auto assets_a = managers.get_manager<asset_manager>();
    auto assets_b = services.resolve<asset_manager>();
    assert(assets_a == assets_b && "published manager must be the same instance");

    // Unknown types: the throwing and non-throwing variants.
    struct not_registered {};
    assert(services.try_resolve<not_registered>() == nullptr);
    try {
        services.resolve<not_registered>();
    } catch (const unregistered_service& e) {
        std::cout << "Expected: " << e.what() << '\n';
    }

    std::cout << services.statistics().report() << '\n';

    // ── Teardown ──────────────────────────────────────────────────────
    managers.dispose();

    std::cout << "Done.\n";
    return 0;
}
