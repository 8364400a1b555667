#ifndef KFCLI_CANCELLATION_TOKEN_H
#define KFCLI_CANCELLATION_TOKEN_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Cooperative stop signal handed to long running operations. Checked at
// every poll boundary; waitFor() doubles as an interruptible sleep.
class CancellationToken
{
public:
	CancellationToken() : cancelledFlag(false) {}

	CancellationToken(const CancellationToken&) = delete;
	CancellationToken& operator=(const CancellationToken&) = delete;

	void cancel()
	{
		{
			std::lock_guard<std::mutex> lock(mutex);
			cancelledFlag.store(true);
		}
		wakeup.notify_all();
	}

	bool cancelled() const { return cancelledFlag.load(); }

	// true when cancelled before the timeout elapsed
	template <typename Rep, typename Period>
	bool waitFor(const std::chrono::duration<Rep, Period>& timeout)
	{
		std::unique_lock<std::mutex> lock(mutex);
		return wakeup.wait_for(lock, timeout, [this] { return cancelledFlag.load(); });
	}

private:
	std::atomic<bool> cancelledFlag;
	std::mutex mutex;
	std::condition_variable wakeup;
};

#endif // KFCLI_CANCELLATION_TOKEN_H
