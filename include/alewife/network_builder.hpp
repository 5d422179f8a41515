/**
 * @file network_builder.hpp
 * @brief Setup‑phase object that assembles a network's topology.
 */

#pragma once

#include <alewife/logging.hpp>
#include <alewife/mailbox.hpp>
#include <alewife/publisher.hpp>
#include <alewife/registry.hpp>
#include <alewife/subscriber.hpp>

#include <initializer_list>
#include <memory>
#include <ranges>
#include <utility>

namespace alewife {

/**
 * @brief Helper for building networks.  Call `build()` to complete
 *        initialization.
 *
 * The builder is move‑only and `build()` may only be invoked on an
 * rvalue, so finishing setup reads `std::move(builder).build()` and no
 * usable handle able to register subscribers survives the freeze.
 */
template <typename config> class NetworkBuilder {
  public:
    using Topic = typename config::topic_type;

  private:
    std::unique_ptr<Registry<config>> m_registry;
    size_t m_subscriber_count = 0;
    logging::Logger m_logger;

    template <typename Iterator, typename Sentinel>
    Subscriber<config> register_inbox(Iterator first, Sentinel last) {
        auto inbox = std::make_shared<Mailbox<config>>();
        size_t n_topics = 0;
        for (; first != last; ++first) {
            m_registry->attach(*first, MailboxSender<config>(inbox));
            ++n_topics;
        }
        ++m_subscriber_count;
        ALEWIFE_LOG_DEBUG(m_logger, "added subscriber {} with {} topics",
                          m_subscriber_count, n_topics);
        return Subscriber<config>(std::move(inbox));
    }

  public:
    NetworkBuilder()
        : m_registry(std::make_unique<Registry<config>>()),
          m_logger(logging::create_logger("network-builder")) {}

    NetworkBuilder(const NetworkBuilder&) = delete;
    NetworkBuilder& operator=(const NetworkBuilder&) = delete;
    NetworkBuilder(NetworkBuilder&&) noexcept = default;
    NetworkBuilder& operator=(NetworkBuilder&&) noexcept = default;

    /**
     * @brief Adds a subscriber to the network, with a complete list of the
     *        Topics it expects to receive.  This list cannot be modified
     *        later.
     *
     * Listing a topic twice registers the subscriber twice under it, and
     * every message on that topic is then delivered twice.
     */
    Subscriber<config> add_subscriber(std::initializer_list<Topic> topics) & {
        return register_inbox(topics.begin(), topics.end());
    }

    /// @copydoc add_subscriber(std::initializer_list<Topic>)
    template <std::ranges::input_range Topics>
    Subscriber<config> add_subscriber(Topics&& topics) & {
        return register_inbox(std::ranges::begin(topics),
                              std::ranges::end(topics));
    }

    /// Finishes network setup. No more subscribers can be added after this.
    Publisher<config> build() && {
        ALEWIFE_LOG_INFO(m_logger, "network built: {} subscribers, {} topics",
                         m_subscriber_count, m_registry->size());
        return Publisher<config>(
            std::shared_ptr<const Registry<config>>(std::move(m_registry)));
    }
};

} // namespace alewife
