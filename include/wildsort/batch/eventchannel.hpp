#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace wildsort {

// One-way, ordered, unbounded queue between a producer thread and a consumer.
template <typename T>
class event_channel {
public:
    void push(T event)
    {
        {
            std::lock_guard<std::mutex> lock(m_mtx);
            if (m_closed)
                return;

            m_queue.emplace_back(std::move(event));
        }
        m_cv.notify_one();
    }

    // Blocks until an event arrives. std::nullopt once closed and drained.
    std::optional<T> next()
    {
        std::unique_lock<std::mutex> lock(m_mtx);
        m_cv.wait(lock, [this] { return m_closed || !m_queue.empty(); });
        return pop_locked();
    }

    std::optional<T> try_next()
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        return pop_locked();
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(m_mtx);
            m_closed = true;
        }
        m_cv.notify_all();
    }

    // Drops pending events and reopens the channel
    void reset()
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        m_queue.clear();
        m_closed = false;
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        return m_closed;
    }

private:
    std::optional<T> pop_locked()
    {
        if (m_queue.empty())
            return std::nullopt;

        T event = std::move(m_queue.front());
        m_queue.pop_front();
        return event;
    }

    std::deque<T> m_queue;
    bool m_closed = false;
    mutable std::mutex m_mtx;
    std::condition_variable m_cv;
};

}
