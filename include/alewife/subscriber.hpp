/**
 * @file subscriber.hpp
 * @brief Consuming handle of a subscriber's mailbox.
 */

#pragma once

#include <alewife/mailbox.hpp>

#include <memory>
#include <utility>
#include <vector>

namespace alewife {

/**
 * @brief Interface for receiving messages from the network.
 *
 * Created by NetworkBuilder::add_subscriber() during setup.  The
 * subscriber is the sole owner of its mailbox; dropping it makes every
 * later publish to its topics skip it.  Move‑only.
 */
template <typename config> class Subscriber {
  public:
    using Topic = typename config::topic_type;
    using Content = typename config::content_type;
    using Message = typename config::Message;

  private:
    std::shared_ptr<Mailbox<config>> m_inbox;

  public:
    explicit Subscriber(std::shared_ptr<Mailbox<config>> inbox)
        : m_inbox(std::move(inbox)) {}

    Subscriber(const Subscriber&) = delete;
    Subscriber& operator=(const Subscriber&) = delete;
    Subscriber(Subscriber&&) noexcept = default;
    Subscriber& operator=(Subscriber&&) noexcept = default;

    /// Consumes all pending messages, oldest first. Never blocks.
    std::vector<Message> fetch() {
        std::vector<Message> messages;
        if (!m_inbox) {
            return messages;
        }
        messages.reserve(m_inbox->size());
        m_inbox->drain(
            [&](Message& message) { messages.push_back(std::move(message)); });
        return messages;
    }

    /**
     * @brief Consumes all pending messages without collecting them.
     *
     * @tparam Visitor Functor with signature
     *                 `void(const Topic&, Content&)`.
     * @return Number of messages handed to @p visitor.
     */
    template <typename Visitor> size_t fetch(Visitor&& visitor) {
        if (!m_inbox) {
            return 0;
        }
        return m_inbox->drain([&](Message& message) {
            visitor(std::as_const(message.first), message.second);
        });
    }
};

} // namespace alewife
