/**
 * @file workshop_example.cpp
 * @brief Minimal end‑to‑end demonstration of an alewife network.
 *
 * Setup wires three participants:
 *
 *   1. **assembler** — subscribes to `widgets` only.
 *   2. **inspector** — subscribes to `widgets` and `gears`.
 *   3. **two suppliers** — each holds its own copy of the Publisher and
 *      emits parts from a separate thread.
 *
 * After `build()` the topology is frozen; the suppliers publish while the
 * main thread polls both subscribers until every part has been seen.
 */

#include <alewife/alewife.hpp>

#include <string>
#include <thread>
#include <vector>

int main() {
    // Quill uses a dedicated backend thread. Start it once per process.
    alewife::logging::start_backend();
    auto logger = alewife::logging::create_logger("workshop");
    alewife::logging::set_log_level(logger, alewife::logging::level::Info);

    auto builder = alewife::make_network<std::string, std::string>();
    auto assembler = builder.add_subscriber({"widgets"});
    auto inspector = builder.add_subscriber({"widgets", "gears"});
    auto publisher = std::move(builder).build();

    constexpr size_t n_parts = 10;

    std::vector<std::thread> suppliers;
    suppliers.emplace_back([widgets = publisher]() {
        for (size_t i = 0; i < n_parts; ++i) {
            widgets.publish("widgets", "sprocket-" + std::to_string(i));
        }
    });
    suppliers.emplace_back([gears = publisher]() {
        for (size_t i = 0; i < n_parts; ++i) {
            gears.publish("gears", "cog-" + std::to_string(i));
        }
        gears.publish("bolts", "nobody listens to bolts");
    });

    size_t assembled = 0;
    size_t inspected = 0;
    while (assembled < n_parts || inspected < 2 * n_parts) {
        assembled += assembler.fetch(
            [&](const std::string& topic, const std::string& content) {
                ALEWIFE_LOG_INFO(logger, "assembler <- {}: {}", topic,
                                 content);
            });
        inspected += inspector.fetch(
            [&](const std::string& topic, const std::string& content) {
                ALEWIFE_LOG_INFO(logger, "inspector <- {}: {}", topic,
                                 content);
            });
        std::this_thread::yield();
    }

    for (auto& supplier : suppliers) {
        supplier.join();
    }
    return 0;
}
