#ifndef KFCLI_KAFKA_TYPES_H
#define KFCLI_KAFKA_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One record read from a partition. Read-only once produced.
struct ConsumedMessage
{
	std::string topic;
	int32_t partition = 0;
	int64_t offset = 0;
	std::optional<std::string> key;
	std::string payload;
	int64_t timestamp = -1;	// ms since epoch, -1 when the broker did not provide one
};

struct TopicSummary
{
	std::string name;
	int32_t partitionCount = 0;
};

struct Watermarks
{
	int64_t low = 0;
	int64_t high = 0;	// offset of the next message to be written
};

struct PartitionInfo
{
	int32_t id = 0;
	int32_t leader = -1;
	std::vector<int32_t> replicas;
	std::vector<int32_t> isrs;
	std::optional<Watermarks> watermarks;
	std::string error;
};

struct TopicDetails
{
	std::string name;
	std::vector<PartitionInfo> partitions;

	// sum of (high - low) over partitions with known watermarks
	int64_t totalMessages() const
	{
		int64_t total = 0;
		for (const auto& p : partitions)
		{
			if (p.watermarks)
				total += p.watermarks->high - p.watermarks->low;
		}
		return total;
	}
};

struct BrokerInfo
{
	int32_t id = 0;
	std::string host;
	int port = 0;
	bool controller = false;
};

struct TopicAssignment
{
	std::string topic;
	std::vector<int32_t> partitions;
};

struct GroupSummary
{
	std::string groupId;
	std::string state;
	std::string protocolType;
	std::string protocol;
};

struct GroupMember
{
	std::string memberId;
	std::string clientId;
	std::string clientHost;
	std::vector<TopicAssignment> assignment;
};

struct GroupDetails
{
	GroupSummary summary;
	std::vector<GroupMember> members;
};

// Committed position of a consumer group on one partition; absent when the
// group consumes the topic but never committed on this partition.
struct CommittedOffset
{
	std::string topic;
	int32_t partition = 0;
	std::optional<int64_t> offset;
};

#endif // KFCLI_KAFKA_TYPES_H
