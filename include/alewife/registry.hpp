/**
 * @file registry.hpp
 * @brief Topic → subscriber mailbox routing table.
 */

#pragma once

#include <alewife/mailbox.hpp>

#include <unordered_map>
#include <utility>
#include <vector>

namespace alewife {

/**
 * @brief Maps each topic to the ordered list of mailboxes interested in it.
 *
 * Filled in by NetworkBuilder during setup, then shared read‑only by all
 * Publisher copies.  The order of a topic's list is registration order
 * and is the order in which a publish fans out.
 */
template <typename config> class Registry {
  public:
    using Topic = typename config::topic_type;
    using Sender = MailboxSender<config>;
    using SenderList = std::vector<Sender>;

  private:
    std::unordered_map<Topic, SenderList, typename config::hasher> m_routes;

  public:
    /// Append @p sender to @p topic's list, creating the list if absent.
    void attach(const Topic& topic, Sender sender) {
        m_routes[topic].push_back(std::move(sender));
    }

    /// @return The senders registered for @p topic, or nullptr if none.
    const SenderList* find(const Topic& topic) const {
        auto it = m_routes.find(topic);
        if (it == m_routes.end()) {
            return nullptr;
        }
        return &it->second;
    }

    /// Registrations for @p topic, duplicates included.
    size_t subscriber_count(const Topic& topic) const {
        const auto* senders = find(topic);
        return senders ? senders->size() : 0;
    }

    std::vector<Topic> topics() const {
        std::vector<Topic> result;
        result.reserve(m_routes.size());
        for (const auto& [topic, senders] : m_routes) {
            result.push_back(topic);
        }
        return result;
    }

    size_t size() const { return m_routes.size(); } ///< Number of topics.
};

} // namespace alewife
