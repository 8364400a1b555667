#ifndef KFCLI_BROKER_CLIENT_H
#define KFCLI_BROKER_CLIENT_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "KafkaTypes.h"

// Read position on one partition. Destroying the reader releases the
// underlying fetch; readers never join a consumer group and never commit.
class PartitionReader
{
public:
	virtual ~PartitionReader() = default;

	virtual const std::string& topic() const = 0;
	virtual int32_t partition() const = 0;

	// Next batch starting at fromOffset, at most maxMessages, waiting up to
	// timeoutMs for data. An empty batch means nothing new arrived.
	// Throws BrokerUnavailableError on unrecoverable errors.
	virtual std::vector<ConsumedMessage> fetch(int64_t fromOffset, size_t maxMessages, int timeoutMs) = 0;
};

// Capabilities kfcli needs from a broker cluster. One instance may be shared
// by several partition fetchers; none of the read operations mutate broker
// state. Failures are raised as BrokerUnavailableError unless stated otherwise.
class BrokerClient
{
public:
	virtual ~BrokerClient() = default;

	virtual std::vector<TopicSummary> listTopics(bool includeInternal) = 0;
	virtual TopicDetails describeTopic(const std::string& topic) = 0;

	// sorted partition indices of the topic
	virtual std::vector<int32_t> partitionIds(const std::string& topic) = 0;

	// throws OffsetUnavailableError
	virtual Watermarks queryWatermarks(const std::string& topic, int32_t partition) = 0;

	virtual std::unique_ptr<PartitionReader> openPartition(const std::string& topic, int32_t partition, int64_t startOffset) = 0;

	// every partition of every topic the group has committed to
	virtual std::vector<CommittedOffset> committedOffsets(const std::string& group) = 0;

	virtual std::vector<GroupSummary> listGroups() = 0;
	virtual GroupDetails describeGroup(const std::string& group) = 0;
	virtual std::vector<BrokerInfo> listBrokers() = 0;

	virtual void createTopic(const std::string& topic, int32_t partitions, int32_t replicationFactor) = 0;
	virtual void deleteTopic(const std::string& topic) = 0;
};

#endif // KFCLI_BROKER_CLIENT_H
