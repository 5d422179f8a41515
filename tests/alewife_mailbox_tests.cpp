#include <gtest/gtest.h>

#include <alewife/alewife.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {
using config = alewife::NetworkConfig<std::string, int>;

struct tiny_cfg {
    using topic_type = std::string;
    using content_type = int;
    using hasher = std::hash<std::string>;
    using Message = std::pair<std::string, int>;
    static constexpr size_t fast_queue_size = 4; // <= 4 → overflow easier
};

// Message whose move throws on demand, to fail a push half way through.
struct fragile_message {
    int value;
    bool explode = false;

    fragile_message(int v, bool e = false) : value(v), explode(e) {}
    fragile_message(fragile_message&& other)
        : value(other.value), explode(other.explode) {
        if (explode) {
            throw std::runtime_error("fragile message");
        }
    }
};

struct fragile_cfg {
    using Message = fragile_message;
    static constexpr size_t fast_queue_size = 2;
};
} // anonymous namespace

TEST(alewife_mailbox_tests, push_pop_fast_path) {
    alewife::Mailbox<config> q;

    q.push({"answer", 42});
    EXPECT_EQ(q.size(), 1u);

    auto popped = q.pop();
    ASSERT_TRUE(popped);
    EXPECT_EQ(popped->first, "answer");
    EXPECT_EQ(popped->second, 42);

    EXPECT_FALSE(q.pop()); // queue now empty
    EXPECT_EQ(q.size(), 0u);
}

TEST(alewife_mailbox_tests, push_pop_overflow) {
    alewife::Mailbox<tiny_cfg> q;

    constexpr int N = 20; // 16 will overflow the 4-slot ring
    for (int i = 0; i < N; ++i) {
        q.push({"t", i});
    }
    EXPECT_EQ(q.size(), static_cast<size_t>(N));

    int cnt = 0;
    while (auto m = q.pop()) {
        EXPECT_EQ(m->second, cnt++); // FIFO across fast+slow path
    }
    EXPECT_EQ(cnt, N);
}

TEST(alewife_mailbox_tests, interleaved_overflow_keeps_order) {
    alewife::Mailbox<tiny_cfg> q;

    int next_push = 0;
    int next_pop = 0;
    for (int round = 0; round < 10; ++round) {
        for (int i = 0; i < 7; ++i) {
            q.push({"t", next_push++});
        }
        // Pop fewer than pushed so the overflow queue never empties.
        for (int i = 0; i < 3; ++i) {
            auto m = q.pop();
            ASSERT_TRUE(m);
            EXPECT_EQ(m->second, next_pop++);
        }
    }
    while (auto m = q.pop()) {
        EXPECT_EQ(m->second, next_pop++);
    }
    EXPECT_EQ(next_pop, next_push);
}

TEST(alewife_mailbox_tests, drain_takes_snapshot) {
    alewife::Mailbox<config> q;
    q.push({"t", 1});
    q.push({"t", 2});

    std::vector<int> seen;
    auto n = q.drain([&](config::Message& m) {
        seen.push_back(m.second);
        q.push({"t", m.second + 10}); // arrives during the drain
    });

    EXPECT_EQ(n, 2u);
    EXPECT_EQ(seen, (std::vector<int>{1, 2}));
    EXPECT_EQ(q.size(), 2u);
}

TEST(alewife_mailbox_tests, destructor_releases_queued_messages) {
    auto content = std::make_shared<int>(7);
    using shared_cfg = alewife::NetworkConfig<int, std::shared_ptr<int>>;
    {
        alewife::Mailbox<shared_cfg> q;
        q.push({1, content});
        q.push({2, content});
        EXPECT_EQ(content.use_count(), 3);
    }
    EXPECT_EQ(content.use_count(), 1);
}

TEST(alewife_mailbox_tests, failed_push_leaves_mailbox_unchanged) {
    alewife::Mailbox<fragile_cfg> q;

    EXPECT_THROW(q.push(fragile_message(-1, true)), std::runtime_error);
    EXPECT_EQ(q.size(), 0u);

    q.push(fragile_message(0));
    q.push(fragile_message(1)); // ring now full
    q.push(fragile_message(2)); // overflow path

    EXPECT_THROW(q.push(fragile_message(-1, true)), std::runtime_error);
    EXPECT_EQ(q.size(), 3u);

    q.push(fragile_message(3));

    std::vector<int> seen;
    auto n = q.drain([&](fragile_message& m) { seen.push_back(m.value); });
    EXPECT_EQ(n, 4u);
    EXPECT_EQ(seen, (std::vector<int>{0, 1, 2, 3}));
    EXPECT_EQ(q.size(), 0u);
    EXPECT_FALSE(q.pop());
}

TEST(alewife_mailbox_tests, concurrent_producers_fifo_per_producer) {
    alewife::Mailbox<tiny_cfg> q;

    constexpr int n_producers = 4;
    constexpr int per_producer = 2000;

    std::vector<std::thread> producers;
    for (int p = 0; p < n_producers; ++p) {
        producers.emplace_back([&q, p]() {
            for (int i = 0; i < per_producer; ++i) {
                q.push({std::to_string(p), i});
            }
        });
    }

    std::vector<int> last(n_producers, -1);
    int received = 0;
    while (received < n_producers * per_producer) {
        if (auto m = q.pop()) {
            int producer = std::stoi(m->first);
            EXPECT_EQ(m->second, last[producer] + 1);
            last[producer] = m->second;
            ++received;
        }
    }
    for (auto& t : producers) {
        t.join();
    }

    EXPECT_FALSE(q.pop());
    EXPECT_EQ(received, n_producers * per_producer);
}

TEST(alewife_sender_tests, send_reaches_live_mailbox) {
    auto inbox = std::make_shared<alewife::Mailbox<config>>();
    alewife::MailboxSender<config> sender(inbox);

    EXPECT_TRUE(sender.send({"t", 3}));
    EXPECT_EQ(inbox->size(), 1u);
}

TEST(alewife_sender_tests, send_to_dropped_mailbox_fails_quietly) {
    auto inbox = std::make_shared<alewife::Mailbox<config>>();
    alewife::MailboxSender<config> sender(inbox);
    inbox.reset();

    EXPECT_FALSE(sender.send({"t", 3}));
}
