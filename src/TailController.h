#ifndef KFCLI_TAIL_CONTROLLER_H
#define KFCLI_TAIL_CONTROLLER_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "BrokerClient.h"
#include "CancellationToken.h"
#include "EventLog.h"
#include "FilterExpression.h"
#include "MessageSink.h"

enum class TailState
{
	Idle,
	Subscribed,
	Polling,
	Emitting,
	Stopped
};

const char* tailStateName(TailState state);

struct PartitionStart
{
	int32_t partition = 0;
	int64_t lowWatermark = 0;
	int64_t endOffset = 0;
	int64_t startOffset = 0;
};

// Without "before" the tail starts at the live end. With it, at
// max(0, end - before), raised to the low watermark when retention already
// removed that range.
int64_t computeStartOffset(const Watermarks& watermarks, std::optional<int64_t> before);

// Start offset of every partition, each resolved independently. An empty
// selection means all partitions of the topic.
std::vector<PartitionStart> resolveStartOffsets(BrokerClient& client, const std::string& topic,
	std::optional<int64_t> before, const std::vector<int32_t>& selection = {});

struct TailOptions
{
	std::string topic;
	std::optional<int64_t> before;
	std::optional<FilterExpression> filter;
	std::vector<int32_t> partitions;	// empty = all
	uint64_t maxMessages = 0;			// 0 = until cancelled
	int pollIntervalMs = 500;
	size_t batchSize = 100;
	size_t queueCapacity = 1024;
};

struct TailStats
{
	std::vector<PartitionStart> starts;
	std::map<int32_t, int64_t> nextOffsets;
	uint64_t consumed = 0;
	uint64_t matched = 0;
	uint64_t emitted = 0;
	uint64_t decodeFailures = 0;
	bool cancelled = false;
	bool limitReached = false;
};

// Continuous, read-only consumption of one topic. One fetcher thread per
// partition feeds a bounded queue; the calling thread is the only writer to
// the sink. Order is kept within a partition, never across partitions.
class TailController
{
public:
	TailController(BrokerClient& client, MessageSink& sink, EventLog& eventLog);

	TailController(const TailController&) = delete;
	TailController& operator=(const TailController&) = delete;

	// Blocks until cancelled, the message limit is reached or a fetcher
	// fails. Batches already fetched are filtered and written before it
	// returns. Broker errors are rethrown after every fetcher has stopped.
	TailStats run(const TailOptions& options, CancellationToken& cancel);

	TailState state() const { return currentState.load(); }

private:
	struct Session;

	void fetchLoop(Session& session, PartitionReader& reader, int64_t startOffset);
	void setState(TailState state);

	BrokerClient& client;
	MessageSink& sink;
	EventLog& eventLog;
	std::atomic<TailState> currentState;
};

#endif // KFCLI_TAIL_CONTROLLER_H
