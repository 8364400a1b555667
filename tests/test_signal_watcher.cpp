#include <gtest/gtest.h>

#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

#include "CancellationToken.h"
#include "MessageSink.h"
#include "SignalWatcher.h"
#include "errors.h"

// every case runs in a child process: signals go to the whole process
class SignalWatcherTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		::testing::GTEST_FLAG(death_test_style) = "threadsafe";
	}
};

namespace {

bool isBlocked(int sig)
{
	sigset_t current;
	sigemptyset(&current);
	pthread_sigmask(SIG_BLOCK, nullptr, &current);
	return sigismember(&current, sig) == 1;
}

}

TEST_F(SignalWatcherTest, FirstSignalCancelsTheToken)
{
	EXPECT_EXIT(
		{
			CancellationToken token;
			{
				SignalWatcher watcher(token);
				kill(getpid(), SIGTERM);
				if (!token.waitFor(std::chrono::seconds(5)))
					std::exit(1);
			}
			// the caller's mask is back
			std::exit(isBlocked(SIGTERM) || isBlocked(SIGINT) ? 2 : 0);
		},
		::testing::ExitedWithCode(0), "");
}

TEST_F(SignalWatcherTest, SecondSignalTerminates)
{
	EXPECT_EXIT(
		{
			CancellationToken token;
			SignalWatcher watcher(token);
			kill(getpid(), SIGINT);
			if (!token.waitFor(std::chrono::seconds(5)))
				std::exit(1);

			kill(getpid(), SIGINT);
			std::this_thread::sleep_for(std::chrono::seconds(10));
			std::exit(0);
		},
		::testing::KilledBySignal(SIGINT), "");
}

TEST_F(SignalWatcherTest, DefaultHandlingOutsideTheWatcher)
{
	EXPECT_EXIT(
		{
			CancellationToken token;
			{
				SignalWatcher watcher(token);
			}
			kill(getpid(), SIGTERM);
			std::this_thread::sleep_for(std::chrono::seconds(10));
			std::exit(0);
		},
		::testing::KilledBySignal(SIGTERM), "");
}

TEST_F(SignalWatcherTest, ClosedPipeFailsTheWrite)
{
	EXPECT_EXIT(
		{
			SignalWatcher::ignoreBrokenPipe();

			int fds[2];
			if (pipe(fds) != 0)
				std::exit(1);
			close(fds[0]);
			dup2(fds[1], STDOUT_FILENO);

			StreamSink sink(std::cout, false);
			TailMatch match;
			match.message.payload = "x";
			try
			{
				sink.write(match);
			}
			catch (const KafkaCliError&)
			{
				std::exit(3);
			}
			std::exit(0);
		},
		::testing::ExitedWithCode(3), "");
}
