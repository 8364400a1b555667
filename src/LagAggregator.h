#ifndef KFCLI_LAG_AGGREGATOR_H
#define KFCLI_LAG_AGGREGATOR_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "BrokerClient.h"
#include "EventLog.h"

struct LagEntry
{
	std::string topic;
	int32_t partition = 0;
	std::optional<int64_t> endOffset;		// absent when the watermark query failed
	std::optional<int64_t> committedOffset;	// absent when the group never committed here
	std::optional<int64_t> lag;				// absent = unknown

	bool lagKnown() const { return lag.has_value(); }
};

struct LagReport
{
	std::string group;
	std::vector<LagEntry> entries;	// sorted by (topic, partition)
	int64_t totalLag = 0;			// sum of known lags only
	size_t unknownCount = 0;

	bool totalIsLowerBound() const { return unknownCount > 0; }

	// "N", or ">=N" when some partitions are unknown
	std::string totalText() const;
};

// Builds the lag entry of one partition. Negative lag (committed beyond a
// stale end offset) is reported as 0.
LagEntry makeLagEntry(const std::string& topic, int32_t partition,
	std::optional<int64_t> endOffset, std::optional<int64_t> committedOffset);

// Sorts entries and computes the total.
LagReport summarizeLag(const std::string& group, std::vector<LagEntry> entries);

class LagAggregator
{
public:
	LagAggregator(BrokerClient& client, EventLog& eventLog);

	// Read-only. Fails only when the group's committed offsets cannot be
	// listed; a partition whose end offset is unavailable becomes unknown.
	LagReport aggregate(const std::string& group);

private:
	BrokerClient& client;
	EventLog& eventLog;
};

#endif // KFCLI_LAG_AGGREGATOR_H
