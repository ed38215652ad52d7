#ifndef BOUNDEDQUEUE_H
#define BOUNDEDQUEUE_H

#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>
#include <deque>
#include <stdexcept>
#include <utility>

/**
 * Fixed-capacity FIFO handing items from one producer thread to one consumer
 * thread. Items leave in the order they were pushed.
 *
 * close() marks the end of production: the consumer drains what is left and
 * then pop() returns false. abort() additionally discards queued items and
 * releases a producer blocked on a full queue, for use on error paths.
 */
template <typename T>
class BoundedQueue
{
public:
    explicit BoundedQueue(int capacity)
        : m_capacity(capacity)
    {
        if (capacity < 1) {
            throw std::invalid_argument("BoundedQueue: capacity must be at least 1");
        }
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * Append an item, waiting while the queue is full
     * @return false if the queue was closed or aborted and the item was dropped
     */
    bool push(T item)
    {
        QMutexLocker locker(&m_mutex);
        while (static_cast<int>(m_items.size()) >= m_capacity && !m_closed) {
            m_notFull.wait(&m_mutex);
        }
        if (m_closed) {
            return false;
        }

        m_items.push_back(std::move(item));
        m_notEmpty.wakeOne();
        return true;
    }

    /**
     * Take the oldest item, waiting while the queue is empty and still open
     * @return false once the queue is closed and drained, or aborted
     */
    bool pop(T& item)
    {
        QMutexLocker locker(&m_mutex);
        while (m_items.empty() && !m_closed) {
            m_notEmpty.wait(&m_mutex);
        }
        if (m_items.empty()) {
            return false;
        }

        item = std::move(m_items.front());
        m_items.pop_front();
        m_notFull.wakeOne();
        return true;
    }

    void close()
    {
        QMutexLocker locker(&m_mutex);
        m_closed = true;
        m_notEmpty.wakeAll();
        m_notFull.wakeAll();
    }

    void abort()
    {
        QMutexLocker locker(&m_mutex);
        m_closed = true;
        m_items.clear();
        m_notEmpty.wakeAll();
        m_notFull.wakeAll();
    }

    int size() const
    {
        QMutexLocker locker(&m_mutex);
        return static_cast<int>(m_items.size());
    }

    int capacity() const { return m_capacity; }

    bool isClosed() const
    {
        QMutexLocker locker(&m_mutex);
        return m_closed;
    }

private:
    const int m_capacity;
    mutable QMutex m_mutex;
    QWaitCondition m_notFull;
    QWaitCondition m_notEmpty;
    std::deque<T> m_items;
    bool m_closed = false;
};

#endif // BOUNDEDQUEUE_H
