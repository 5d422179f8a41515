/**
 * @file config.hpp
 * @brief Compile‑time configuration bundle for one message network.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <utility>

namespace alewife {

/**
 * @brief Describes the message set and queue sizing of a network.
 *
 * Every alewife component is templated on a config type.  Any struct
 * exposing the same members works, which is how the tests shrink the
 * mailbox ring to force the overflow path.
 *
 * @tparam Topic   Hashable, equality comparable, copyable routing key.
 * @tparam Content Copyable payload, copied once per matching subscriber.
 * @tparam Hash    Hash functor used by the registry.
 */
template <typename Topic, typename Content, typename Hash = std::hash<Topic>>
struct NetworkConfig {
    using topic_type = Topic;
    using content_type = Content;
    using hasher = Hash;
    using Message = std::pair<Topic, Content>; ///< What a mailbox stores.

    static constexpr size_t fast_queue_size = 1024; ///< Lock‑free ring size.
};

} // namespace alewife
