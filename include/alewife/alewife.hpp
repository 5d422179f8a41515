/**
 * @file alewife.hpp
 * @brief Header‑only, in‑process publish/subscribe message bus.
 *
 * Each message carries one Topic value and one Content value.  Clients
 * are registered as subscribers during initial network setup, providing
 * the list of Topics they want.  Subscribers only ever receive messages
 * carrying one of those Topics.  After setup the network is frozen, and
 * any number of publishers can be added by copying the Publisher.
 *
 *   * **Mailbox**        – unbounded MPSC queue (Boost.Lockfree ring plus
 *     a locked overflow path) owned by one subscriber.
 *   * **Subscriber**     – consuming end of a mailbox; `fetch()` drains it.
 *   * **Registry**       – topic → ordered list of mailbox senders.
 *   * **NetworkBuilder** – setup phase; owns the registry until `build()`.
 *   * **Publisher**      – open phase; copyable, shares the frozen registry.
 *
 * Not supported, on purpose:
 *
 *   * adding publishers during setup,
 *   * adding subscribers after setup,
 *   * removing subscribers at any time,
 *   * detecting or handling the disappearance of parts of the network.
 *
 * @code
 * auto builder = alewife::make_network<std::string, std::string>();
 * auto subscriber = builder.add_subscriber({"widgets"});
 * auto publisher = std::move(builder).build();
 *
 * publisher.publish("widgets", "sprocket");
 * for (auto& [topic, content] : subscriber.fetch()) { ... }
 * @endcode
 *
 * @note All public types live inside the `alewife` namespace.
 */

#pragma once

#include <alewife/config.hpp>
#include <alewife/logging.hpp>
#include <alewife/mailbox.hpp>
#include <alewife/network_builder.hpp>
#include <alewife/publisher.hpp>
#include <alewife/registry.hpp>
#include <alewife/subscriber.hpp>

namespace alewife {

/// Called to initialize a network carrying @p Topic / @p Content pairs.
template <typename Topic, typename Content>
NetworkBuilder<NetworkConfig<Topic, Content>> make_network() {
    return NetworkBuilder<NetworkConfig<Topic, Content>>();
}

} // namespace alewife
