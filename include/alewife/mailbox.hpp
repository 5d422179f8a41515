/**
 * @file mailbox.hpp
 * @brief Per‑subscriber message queue and its producing handle.
 */

#pragma once

#include <alewife/logging.hpp>

#include <boost/lockfree/queue.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <queue>
#include <utility>

namespace alewife {

// ==========================================================================
// Mailbox – lock‑free fast path + locked overflow path
// ==========================================================================

/**
 * @brief Unbounded multi‑producer / single‑consumer FIFO of messages.
 *
 * A bounded lock‑free ring (Boost.Lockfree) constitutes the *fast path*.
 * If the ring is full, writers push to a secondary std::queue protected
 * by a mutex, so a push never fails and never waits on the consumer.
 * Once the overflow queue holds anything, writers keep appending to it
 * until the consumer has moved it back into the ring; this keeps every
 * producer's messages in the order it pushed them.
 *
 * Messages are heap allocated on push and handed to the consumer by
 * ownership transfer.  Anything still queued when the mailbox dies is
 * released by the destructor.
 *
 * @tparam config NetworkConfig (or compatible) describing `Message` and
 *         `fast_queue_size`.
 */
template <typename config> class Mailbox {
  public:
    using Message = typename config::Message;

  private:
    // Slow overflow path
    std::queue<std::unique_ptr<Message>> m_slow_queue;
    std::mutex m_mutex;
    std::atomic<size_t> m_slow_size{0};

    // Fast lock‑free ring
    boost::lockfree::queue<Message*,
                           boost::lockfree::capacity<config::fast_queue_size>>
        m_fast_queue;

    std::atomic<size_t> m_pending{0}; ///< Messages pushed and not yet popped.
    logging::Logger m_logger;

    void push_slow(std::unique_ptr<Message> message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_slow_queue.push(std::move(message));
        // Still invisible to the consumer until the lock is released.
        m_pending.fetch_add(1, std::memory_order_relaxed);
        m_slow_size.fetch_add(1, std::memory_order_release);
        ALEWIFE_LOG_WARNING(m_logger,
                            "pushed to slow queue: slow queue size={}",
                            m_slow_size.load(std::memory_order_relaxed));
    }

    // Move overflow messages back to the ring. Consumer side only.
    void drain_slow() {
        if (m_slow_size.load(std::memory_order_acquire) > 0) {
            std::lock_guard<std::mutex> lock(m_mutex);
            while (!m_slow_queue.empty()) {
                Message* msg = m_slow_queue.front().get();
                if (!m_fast_queue.push(msg)) {
                    break;
                }
                m_slow_queue.front().release();
                m_slow_queue.pop();
            }
            m_slow_size.store(m_slow_queue.size(), std::memory_order_release);
        }
    }

  public:
    Mailbox() : m_logger(logging::create_logger("mailbox")) {}

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    ~Mailbox() {
        Message* msg = nullptr;
        while (m_fast_queue.pop(msg)) {
            delete msg;
        }
    }

    /**
     * @brief Non‑blocking push usable from *any* thread.
     *
     * If copying the message or allocating throws, the exception reaches
     * the caller and the mailbox is left as it was.
     */
    void push(Message message) {
        auto owned = std::make_unique<Message>(std::move(message));
        if (m_slow_size.load(std::memory_order_acquire) == 0) {
            // Counted before it becomes visible, so pop() never underflows.
            m_pending.fetch_add(1, std::memory_order_relaxed);
            if (m_fast_queue.push(owned.get())) {
                owned.release();
                return;
            }
            m_pending.fetch_sub(1, std::memory_order_relaxed);
        }
        push_slow(std::move(owned));
    }

    /**
     * @return Next message or `nullptr` when the queue is empty.
     * @note Consumer side only.
     */
    std::unique_ptr<Message> pop() {
        drain_slow(); // Give overflow messages a chance first.

        Message* msg = nullptr;
        if (m_fast_queue.pop(msg)) {
            m_pending.fetch_sub(1, std::memory_order_acq_rel);
            return std::unique_ptr<Message>(msg);
        }
        return nullptr;
    }

    /**
     * @brief Pop every message queued when the call starts and hand each
     *        one to @p visitor as a `Message&`.
     *
     * Messages pushed while the drain runs (even by @p visitor itself)
     * stay queued for the next call.  A push still in flight when the
     * call starts may be left for the next call as well.
     *
     * @return Number of messages visited.
     * @note Consumer side only.
     */
    template <typename Visitor> size_t drain(Visitor&& visitor) {
        const size_t snapshot = m_pending.load(std::memory_order_acquire);
        size_t taken = 0;
        while (taken < snapshot) {
            auto msg = pop();
            if (!msg) {
                break;
            }
            ++taken;
            visitor(*msg);
        }
        return taken;
    }

    /// @return Approximate number of queued messages.
    size_t size() const { return m_pending.load(std::memory_order_acquire); }
};

// ==========================================================================
// MailboxSender – producing handle stored in the registry
// ==========================================================================

/**
 * @brief Producing side of a Mailbox.
 *
 * Holds a weak reference only: the Subscriber owning the mailbox decides
 * its lifetime.  Sending to a mailbox whose subscriber is gone fails
 * quietly and the message is discarded.
 */
template <typename config> class MailboxSender {
  public:
    using Message = typename config::Message;

  private:
    std::weak_ptr<Mailbox<config>> m_mailbox;

  public:
    explicit MailboxSender(std::weak_ptr<Mailbox<config>> mailbox)
        : m_mailbox(std::move(mailbox)) {}

    /// @return `false` if the owning subscriber has been dropped.
    bool send(Message message) const {
        auto mailbox = m_mailbox.lock();
        if (!mailbox) {
            return false;
        }
        mailbox->push(std::move(message));
        return true;
    }
};

} // namespace alewife
