#ifndef KFCLI_SIGNAL_WATCHER_H
#define KFCLI_SIGNAL_WATCHER_H

#include <pthread.h>
#include <signal.h>

#include <thread>

#include "CancellationToken.h"

// Turns SIGINT/SIGTERM into a cancellation request while it is alive. The
// signals are blocked in the creating thread (and every thread it starts
// afterwards) and collected by one sigwait() thread, so the token is never
// touched from a signal handler. A second signal after the token is
// cancelled terminates the process the default way. The previous signal
// mask is restored on destruction.
class SignalWatcher
{
public:
	explicit SignalWatcher(CancellationToken& token) : token(token)
	{
		sigemptyset(&signals);
		sigaddset(&signals, SIGINT);
		sigaddset(&signals, SIGTERM);
		sigaddset(&signals, SIGUSR2);
		pthread_sigmask(SIG_BLOCK, &signals, &previousMask);

		watcher = std::thread([this]() { watch(); });
	}

	~SignalWatcher()
	{
		pthread_kill(watcher.native_handle(), SIGUSR2);
		watcher.join();
		pthread_sigmask(SIG_SETMASK, &previousMask, nullptr);
	}

	SignalWatcher(const SignalWatcher&) = delete;
	SignalWatcher& operator=(const SignalWatcher&) = delete;

	// writes to a closed pipe fail with EPIPE instead of killing the process
	static void ignoreBrokenPipe()
	{
		signal(SIGPIPE, SIG_IGN);
	}

private:
	void watch()
	{
		for (;;)
		{
			int sig = 0;
			if (sigwait(&signals, &sig) != 0 || sig == SIGUSR2)
				return;

			if (!token.cancelled())
			{
				token.cancel();
				continue;
			}

			// the operation did not stop on the first one
			sigset_t single;
			sigemptyset(&single);
			sigaddset(&single, sig);
			signal(sig, SIG_DFL);
			pthread_sigmask(SIG_UNBLOCK, &single, nullptr);
			raise(sig);
		}
	}

	CancellationToken& token;
	sigset_t signals;
	sigset_t previousMask;
	std::thread watcher;
};

#endif // KFCLI_SIGNAL_WATCHER_H
