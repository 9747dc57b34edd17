#ifndef CREDSWEEP_BOUNDEDQUEUE_HPP
#define CREDSWEEP_BOUNDEDQUEUE_HPP

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

/// \brief FIFO queue shared between threads, holding at most a fixed number of elements
///
/// push() blocks while the queue is full, pop() blocks while it is empty.
/// Once close() is called, push() is refused and pop() returns the remaining
/// elements, then std::nullopt.
template <typename T>
class BoundedQueue
{
public:
    /// Constructor
    explicit BoundedQueue(std::size_t capacity)
    : m_capacity{capacity ? capacity : 1}
    {
    }

    /// \brief Add an element, waiting for room if needed
    /// \return false if the queue was closed
    bool push(T value)
    {
        {
            auto lock = std::unique_lock{m_mutex};
            m_not_full.wait(lock, [this] { return m_closed || m_queue.size() < m_capacity; });
            if (m_closed)
                return false;

            m_queue.push(std::move(value));
        }

        m_not_empty.notify_one();
        return true;
    }

    /// \brief Remove the oldest element, waiting for one if needed
    /// \return the element, or std::nullopt if the queue is closed and empty
    auto pop() -> std::optional<T>
    {
        auto value = std::optional<T>{};
        {
            auto lock = std::unique_lock{m_mutex};
            m_not_empty.wait(lock, [this] { return m_closed || !m_queue.empty(); });
            if (m_queue.empty())
                return std::nullopt;

            value = std::move(m_queue.front());
            m_queue.pop();
        }

        m_not_full.notify_one();
        return value;
    }

    /// Refuse further elements and wake up every waiting thread
    void close()
    {
        {
            const auto lock = std::scoped_lock{m_mutex};
            m_closed        = true;
        }

        m_not_empty.notify_all();
        m_not_full.notify_all();
    }

private:
    const std::size_t m_capacity;

    std::mutex              m_mutex;
    std::condition_variable m_not_empty;
    std::condition_variable m_not_full;
    std::queue<T>           m_queue;
    bool                    m_closed = false;
};

#endif // CREDSWEEP_BOUNDEDQUEUE_HPP
