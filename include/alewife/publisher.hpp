/**
 * @file publisher.hpp
 * @brief Open‑phase handle used to send messages into a network.
 */

#pragma once

#include <alewife/logging.hpp>
#include <alewife/registry.hpp>

#include <memory>
#include <utility>
#include <vector>

namespace alewife {

/**
 * @brief Interface for sending messages to the network.
 *
 * Obtained from NetworkBuilder::build().  To add more publishers, copy
 * this object and hand the copies to your clients: every copy shares the
 * same frozen Registry, which is released when the last copy goes away.
 * Copies may publish concurrently from different threads.
 */
template <typename config> class Publisher {
  public:
    using Topic = typename config::topic_type;
    using Content = typename config::content_type;
    using Message = typename config::Message;

  private:
    std::shared_ptr<const Registry<config>> m_registry;
    logging::Logger m_logger;

  public:
    explicit Publisher(std::shared_ptr<const Registry<config>> registry)
        : m_registry(std::move(registry)),
          m_logger(logging::create_logger("publisher")) {}

    /**
     * @brief Sends a message to every subscriber of @p topic, in
     *        registration order.  All topic filtering is done in the
     *        calling thread.
     *
     * Each subscriber gets its own copy of @p topic and @p content.  A
     * topic nobody subscribed to is silently ignored, and a subscriber
     * that has been dropped is skipped without disturbing the others.
     * A moved‑from Publisher publishes to nobody.
     */
    void publish(const Topic& topic, const Content& content) const {
        if (!m_registry) {
            return;
        }
        const auto* outbox = m_registry->find(topic);
        if (!outbox) {
            return;
        }

        for (const auto& subscriber : *outbox) {
            if (!subscriber.send(Message(topic, content))) {
                ALEWIFE_LOG_DEBUG(m_logger,
                                  "subscriber dropped, delivery skipped");
            }
        }
    }

    /// @return Every topic at least one subscriber registered for.
    std::vector<Topic> topics() const {
        if (!m_registry) {
            return {};
        }
        return m_registry->topics();
    }

    /// @return Registrations for @p topic, duplicates included.
    size_t subscriber_count(const Topic& topic) const {
        return m_registry ? m_registry->subscriber_count(topic) : 0;
    }
};

} // namespace alewife
