#ifndef KFCLI_BOUNDED_QUEUE_H
#define KFCLI_BOUNDED_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

// Thread-safe bounded FIFO between partition fetchers and the single writer.
// Producers block while it is full; close() wakes everybody up, rejects
// further pushes and lets the consumer drain what is left.
template <typename T>
class BoundedQueue
{
public:
	enum class PopResult
	{
		Item,
		Timeout,
		Closed
	};

	explicit BoundedQueue(size_t capacity)
		: capacity(capacity == 0 ? 1 : capacity), closed(false) {}

	BoundedQueue(const BoundedQueue&) = delete;
	BoundedQueue& operator=(const BoundedQueue&) = delete;

	// blocking; false once the queue is closed
	bool push(T item)
	{
		std::unique_lock<std::mutex> lock(mutex);
		notFull.wait(lock, [this] { return closed || items.size() < capacity; });
		if (closed)
			return false;
		items.push(std::move(item));
		notEmpty.notify_one();
		return true;
	}

	// blocking; false when closed and drained
	bool pop(T& out)
	{
		std::unique_lock<std::mutex> lock(mutex);
		notEmpty.wait(lock, [this] { return closed || !items.empty(); });
		return takeFront(out);
	}

	template <typename Rep, typename Period>
	PopResult popFor(T& out, const std::chrono::duration<Rep, Period>& timeout)
	{
		std::unique_lock<std::mutex> lock(mutex);
		if (!notEmpty.wait_for(lock, timeout, [this] { return closed || !items.empty(); }))
			return PopResult::Timeout;
		return takeFront(out) ? PopResult::Item : PopResult::Closed;
	}

	void close()
	{
		std::lock_guard<std::mutex> lock(mutex);
		closed = true;
		notEmpty.notify_all();
		notFull.notify_all();
	}

	bool isClosed() const
	{
		std::lock_guard<std::mutex> lock(mutex);
		return closed;
	}

	size_t size() const
	{
		std::lock_guard<std::mutex> lock(mutex);
		return items.size();
	}

private:
	// caller holds the lock
	bool takeFront(T& out)
	{
		if (items.empty())
			return false;
		out = std::move(items.front());
		items.pop();
		notFull.notify_one();
		return true;
	}

	const size_t capacity;
	std::queue<T> items;
	bool closed;
	mutable std::mutex mutex;
	std::condition_variable notEmpty;
	std::condition_variable notFull;
};

#endif // KFCLI_BOUNDED_QUEUE_H
