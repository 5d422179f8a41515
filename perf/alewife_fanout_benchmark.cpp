#include <benchmark/benchmark.h>

#include <alewife/alewife.hpp>

#include <optional>
#include <string>
#include <vector>

using config = alewife::NetworkConfig<std::string, size_t>;

// Publish one message to N subscribers and drain every mailbox.
static void fanout(benchmark::State& st) {
    alewife::NetworkBuilder<config> builder;
    std::vector<alewife::Subscriber<config>> subscribers;
    for (int64_t i = 0; i < st.range(0); ++i) {
        subscribers.push_back(builder.add_subscriber({"fanout"}));
    }
    auto publisher = std::move(builder).build();

    size_t iteration = 0;
    for (auto _ : st) {
        publisher.publish("fanout", iteration++);
        for (auto& subscriber : subscribers) {
            benchmark::DoNotOptimize(subscriber.fetch());
        }
    }

    st.SetItemsProcessed(st.iterations() * st.range(0));
}

// Publishing to a topic nobody listens to.
static void unknown_topic(benchmark::State& st) {
    alewife::NetworkBuilder<config> builder;
    auto subscriber = builder.add_subscriber({"known"});
    auto publisher = std::move(builder).build();

    for (auto _ : st) {
        publisher.publish("unknown", 0);
    }

    st.SetItemsProcessed(st.iterations());
}

// Fill a mailbox past its lock-free ring, then drain it in one go.
static void burst(benchmark::State& st) {
    alewife::NetworkBuilder<config> builder;
    auto subscriber = builder.add_subscriber({"burst"});
    auto publisher = std::move(builder).build();

    for (auto _ : st) {
        for (int64_t i = 0; i < st.range(0); ++i) {
            publisher.publish("burst", static_cast<size_t>(i));
        }
        benchmark::DoNotOptimize(subscriber.fetch());
    }

    st.SetItemsProcessed(st.iterations() * st.range(0));
}

// Several threads share copies of one publisher.
static void contended_publish(benchmark::State& st) {
    static std::optional<alewife::Subscriber<config>> subscriber;
    static std::optional<alewife::Publisher<config>> publisher;

    if (st.thread_index() == 0) {
        alewife::NetworkBuilder<config> builder;
        subscriber.emplace(builder.add_subscriber({"shared"}));
        publisher.emplace(std::move(builder).build());
    }

    for (auto _ : st) {
        publisher->publish("shared", 1);
    }

    if (st.thread_index() == 0) {
        publisher.reset();
        subscriber.reset();
    }

    st.SetItemsProcessed(st.iterations());
}

BENCHMARK(fanout)->Arg(1)->Arg(8)->Arg(64);
BENCHMARK(unknown_topic);
BENCHMARK(burst)->Arg(512)->Arg(4096);
BENCHMARK(contended_publish)->Threads(1)->Threads(4);

BENCHMARK_MAIN();
