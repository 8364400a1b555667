/*
 *  kfcli - Tail Stream Controller
 *  Partition fan-out, filter gate and the single ordered writer
 */

#include "TailController.h"
#include "BoundedQueue.h"
#include "MessageFilter.h"
#include "PathAccessor.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <mutex>
#include <thread>

namespace {

constexpr auto writerWakeup = std::chrono::milliseconds(100);

}

const char* tailStateName(TailState state)
{
	switch (state)
	{
	case TailState::Idle: return "Idle";
	case TailState::Subscribed: return "Subscribed";
	case TailState::Polling: return "Polling";
	case TailState::Emitting: return "Emitting";
	case TailState::Stopped: return "Stopped";
	}
	return "Unknown";
}

//================================== Start Offsets ==========================================

int64_t computeStartOffset(const Watermarks& watermarks, std::optional<int64_t> before)
{
	if (!before)
		return watermarks.high;

	int64_t start = std::max<int64_t>(0, watermarks.high - *before);
	if (start < watermarks.low)
		start = watermarks.low;
	return start;
}

std::vector<PartitionStart> resolveStartOffsets(BrokerClient& client, const std::string& topic,
	std::optional<int64_t> before, const std::vector<int32_t>& selection)
{
	std::vector<int32_t> ids = client.partitionIds(topic);

	if (!selection.empty())
	{
		std::vector<int32_t> chosen = selection;
		std::sort(chosen.begin(), chosen.end());
		chosen.erase(std::unique(chosen.begin(), chosen.end()), chosen.end());

		for (int32_t p : chosen)
		{
			if (!std::binary_search(ids.begin(), ids.end(), p))
			{
				throw KafkaCliError("partition " + std::to_string(p) + " does not exist in topic " + topic);
			}
		}
		ids = chosen;
	}

	std::vector<PartitionStart> starts;
	for (int32_t p : ids)
	{
		Watermarks wm = client.queryWatermarks(topic, p);

		PartitionStart start;
		start.partition = p;
		start.lowWatermark = wm.low;
		start.endOffset = wm.high;
		start.startOffset = computeStartOffset(wm, before);
		starts.push_back(start);
	}
	return starts;
}

//================================== Controller ==========================================

struct TailController::Session
{
	explicit Session(const TailOptions& opts)
		: options(opts), filter(opts.filter), queue(opts.queueCapacity), activeFetchers(0),
		  consumed(0), matched(0), decodeFailures(0)
	{
	}

	const TailOptions& options;
	const MessageFilter filter;
	BoundedQueue<TailMatch> queue;
	CancellationToken stop;

	std::atomic<size_t> activeFetchers;
	std::atomic<uint64_t> consumed;
	std::atomic<uint64_t> matched;
	std::atomic<uint64_t> decodeFailures;

	std::mutex mutex;	// nextOffsets, failure
	std::map<int32_t, int64_t> nextOffsets;
	std::exception_ptr failure;

	void fetcherFinished()
	{
		if (--activeFetchers == 0)
			queue.close();
	}
};

TailController::TailController(BrokerClient& client, MessageSink& sink, EventLog& eventLog)
	: client(client), sink(sink), eventLog(eventLog), currentState(TailState::Idle)
{
}

void TailController::setState(TailState state)
{
	TailState previous = currentState.exchange(state);
	if (previous != state && state != TailState::Emitting && previous != TailState::Emitting)
	{
		eventLog.debug(EventLog::tailLogName, std::string("state ") + tailStateName(previous) + " -> " + tailStateName(state));
	}
}

void TailController::fetchLoop(Session& session, PartitionReader& reader, int64_t startOffset)
{
	const TailOptions& options = session.options;
	const auto pollInterval = std::chrono::milliseconds(options.pollIntervalMs);
	int64_t next = startOffset;

	try
	{
		while (!session.stop.cancelled())
		{
			auto started = std::chrono::steady_clock::now();
			std::vector<ConsumedMessage> batch = reader.fetch(next, options.batchSize, options.pollIntervalMs);

			if (batch.empty())
			{
				auto elapsed = std::chrono::steady_clock::now() - started;
				if (elapsed < pollInterval)
					session.stop.waitFor(pollInterval - elapsed);
				continue;
			}

			// the whole batch is filtered and queued, even when a stop arrives meanwhile
			for (auto& message : batch)
			{
				if (message.offset < next)
					continue;
				next = message.offset + 1;
				session.consumed++;

				boost::json::value document;
				std::string errorMsg;
				bool decoded = tryDecodePayload(message.payload, document, errorMsg);
				if (!decoded)
				{
					session.decodeFailures++;
					if (!session.filter.passThrough())
					{
						eventLog.debug(EventLog::tailLogName, "message " + std::to_string(message.partition) + ":"
							+ std::to_string(message.offset) + " skipped, " + errorMsg);
					}
				}

				if (!session.filter.matches(decoded ? &document : nullptr))
					continue;
				session.matched++;

				TailMatch match;
				match.message = std::move(message);
				if (decoded)
					match.document = std::move(document);

				if (!session.queue.push(std::move(match)))
					break;
			}

			std::lock_guard<std::mutex> lock(session.mutex);
			session.nextOffsets[reader.partition()] = next;
		}
	}
	catch (const std::exception& e)
	{
		eventLog.error(EventLog::tailLogName, "partition " + std::to_string(reader.partition()) + " stopped: " + e.what());
		{
			std::lock_guard<std::mutex> lock(session.mutex);
			session.nextOffsets[reader.partition()] = next;
			if (!session.failure)
				session.failure = std::current_exception();
		}
		session.stop.cancel();
	}

	session.fetcherFinished();
}

TailStats TailController::run(const TailOptions& options, CancellationToken& cancel)
{
	std::string errorMsg;
	if (!isValidTopicName(options.topic, errorMsg))
		throw ValidationError(errorMsg);
	if (options.before && *options.before < 0)
		throw ValidationError("--before must be >= 0");
	if (options.batchSize == 0 || options.pollIntervalMs <= 0)
		throw ValidationError("batch size and poll interval must be positive");

	setState(TailState::Idle);
	TailStats stats;

	std::vector<std::unique_ptr<PartitionReader>> readers;
	try
	{
		stats.starts = resolveStartOffsets(client, options.topic, options.before, options.partitions);

		for (const auto& start : stats.starts)
		{
			eventLog.info(EventLog::tailLogName, "tail " + options.topic + "/" + std::to_string(start.partition)
				+ " end=" + std::to_string(start.endOffset) + " start=" + std::to_string(start.startOffset));
			readers.push_back(client.openPartition(options.topic, start.partition, start.startOffset));
		}
	}
	catch (...)
	{
		readers.clear();
		setState(TailState::Stopped);
		throw;
	}
	setState(TailState::Subscribed);

	Session session(options);
	for (const auto& start : stats.starts)
		session.nextOffsets[start.partition] = start.startOffset;

	std::vector<std::thread> fetchers;
	std::exception_ptr writerFailure;

	try
	{
		for (size_t i = 0; i < readers.size(); i++)
		{
			session.activeFetchers++;
			try
			{
				fetchers.emplace_back(&TailController::fetchLoop, this, std::ref(session), std::ref(*readers[i]), stats.starts[i].startOffset);
			}
			catch (...)
			{
				session.activeFetchers--;
				throw;
			}
		}
	}
	catch (...)
	{
		writerFailure = std::current_exception();
		session.stop.cancel();
	}

	if (fetchers.empty())
		session.queue.close();

	setState(TailState::Polling);
	bool draining = static_cast<bool>(writerFailure);

	for (;;)
	{
		if (cancel.cancelled() && !session.stop.cancelled())
		{
			eventLog.info(EventLog::tailLogName, "cancellation requested, finishing in-flight batches");
			session.stop.cancel();
		}

		TailMatch match;
		auto result = session.queue.popFor(match, writerWakeup);
		if (result == BoundedQueue<TailMatch>::PopResult::Closed)
			break;
		if (result == BoundedQueue<TailMatch>::PopResult::Timeout || draining)
			continue;

		setState(TailState::Emitting);
		try
		{
			sink.write(match);
			stats.emitted++;
		}
		catch (...)
		{
			writerFailure = std::current_exception();
			draining = true;
			session.stop.cancel();
		}
		setState(TailState::Polling);

		if (options.maxMessages > 0 && stats.emitted >= options.maxMessages && !draining)
		{
			stats.limitReached = true;
			draining = true;
			session.stop.cancel();
		}
	}

	for (auto& fetcher : fetchers)
		fetcher.join();
	readers.clear();

	stats.consumed = session.consumed.load();
	stats.matched = session.matched.load();
	stats.decodeFailures = session.decodeFailures.load();
	stats.nextOffsets = session.nextOffsets;
	stats.cancelled = cancel.cancelled();

	setState(TailState::Stopped);
	eventLog.info(EventLog::tailLogName, "tail " + options.topic + " stopped: consumed=" + std::to_string(stats.consumed)
		+ " matched=" + std::to_string(stats.matched) + " emitted=" + std::to_string(stats.emitted)
		+ " undecodable=" + std::to_string(stats.decodeFailures));

	if (writerFailure)
		std::rethrow_exception(writerFailure);
	if (session.failure)
		std::rethrow_exception(session.failure);

	return stats;
}
