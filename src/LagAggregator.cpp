/*
 *  kfcli - Consumer Lag Aggregator
 */

#include "LagAggregator.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <tuple>

std::string LagReport::totalText() const
{
	std::string text = std::to_string(totalLag);
	if (totalIsLowerBound())
	{
		text = ">=" + text;
	}
	return text;
}

LagEntry makeLagEntry(const std::string& topic, int32_t partition,
	std::optional<int64_t> endOffset, std::optional<int64_t> committedOffset)
{
	LagEntry entry;
	entry.topic = topic;
	entry.partition = partition;
	entry.endOffset = endOffset;
	entry.committedOffset = committedOffset;

	if (endOffset && committedOffset)
	{
		int64_t lag = *endOffset - *committedOffset;
		if (lag < 0) lag = 0;
		entry.lag = lag;
	}
	return entry;
}

LagReport summarizeLag(const std::string& group, std::vector<LagEntry> entries)
{
	std::sort(entries.begin(), entries.end(), [](const LagEntry& a, const LagEntry& b) {
		return std::tie(a.topic, a.partition) < std::tie(b.topic, b.partition);
	});

	LagReport report;
	report.group = group;
	for (const auto& entry : entries)
	{
		if (entry.lag)
			report.totalLag += *entry.lag;
		else
			report.unknownCount++;
	}
	report.entries = std::move(entries);
	return report;
}

LagAggregator::LagAggregator(BrokerClient& client, EventLog& eventLog)
	: client(client), eventLog(eventLog)
{
}

LagReport LagAggregator::aggregate(const std::string& group)
{
	std::string errorMsg;
	if (!isValidConsumerGroupId(group, errorMsg))
	{
		throw ValidationError(errorMsg);
	}

	std::vector<CommittedOffset> committed = client.committedOffsets(group);
	eventLog.debug(EventLog::lagLogName, "group " + group + ": " + std::to_string(committed.size()) + " partition(s)");

	std::vector<LagEntry> entries;
	entries.reserve(committed.size());

	for (const auto& c : committed)
	{
		std::optional<int64_t> endOffset;
		try
		{
			endOffset = client.queryWatermarks(c.topic, c.partition).high;
		}
		catch (const OffsetUnavailableError& e)
		{
			eventLog.warn(EventLog::lagLogName, e.what());
		}

		if (!c.offset)
		{
			eventLog.debug(EventLog::lagLogName, "group " + group + " has no commit on " + c.topic + "/" + std::to_string(c.partition));
		}
		entries.push_back(makeLagEntry(c.topic, c.partition, endOffset, c.offset));
	}

	LagReport report = summarizeLag(group, std::move(entries));
	eventLog.info(EventLog::lagLogName, "group " + group + " total lag " + report.totalText()
		+ ", unknown partitions " + std::to_string(report.unknownCount));
	return report;
}
