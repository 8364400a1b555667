#ifndef KFCLI_FAKE_BROKER_CLIENT_H
#define KFCLI_FAKE_BROKER_CLIENT_H

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "BrokerClient.h"

// In-memory cluster for tests. Topics hold per-partition logs addressed by
// offset; appending while a tail runs is allowed.
class FakeBrokerClient : public BrokerClient
{
public:
	void addTopic(const std::string& topic, int32_t partitions);

	// returns the offset of the appended message
	int64_t append(const std::string& topic, int32_t partition, const std::string& payload,
		std::optional<std::string> key = std::nullopt);

	// advances the end offset without storing messages (sparse log)
	void setEndOffset(const std::string& topic, int32_t partition, int64_t endOffset);
	void setLowWatermark(const std::string& topic, int32_t partition, int64_t lowWatermark);
	void failWatermarks(const std::string& topic, int32_t partition);
	void failFetch(const std::string& topic, int32_t partition, const std::string& cause);

	void setCommitted(const std::string& group, const std::string& topic, int32_t partition, std::optional<int64_t> offset);
	void failCommittedOffsets(const std::string& cause) { committedFailure = cause; }

	void addGroup(const GroupDetails& details) { groups.push_back(details); }
	void addBroker(const BrokerInfo& broker) { brokers.push_back(broker); }

	// calls of the broker, for assertions
	std::atomic<int> openReaders{ 0 };
	std::atomic<int> fetchCalls{ 0 };
	std::atomic<int> brokerCalls{ 0 };

	std::vector<TopicSummary> listTopics(bool includeInternal) override;
	TopicDetails describeTopic(const std::string& topic) override;
	std::vector<int32_t> partitionIds(const std::string& topic) override;
	Watermarks queryWatermarks(const std::string& topic, int32_t partition) override;
	std::unique_ptr<PartitionReader> openPartition(const std::string& topic, int32_t partition, int64_t startOffset) override;
	std::vector<CommittedOffset> committedOffsets(const std::string& group) override;
	std::vector<GroupSummary> listGroups() override;
	GroupDetails describeGroup(const std::string& group) override;
	std::vector<BrokerInfo> listBrokers() override;
	void createTopic(const std::string& topic, int32_t partitions, int32_t replicationFactor) override;
	void deleteTopic(const std::string& topic) override;

private:
	friend class FakePartitionReader;

	struct PartitionData
	{
		int64_t low = 0;
		int64_t high = 0;
		std::map<int64_t, ConsumedMessage> messages;
		bool watermarkFails = false;
		std::string fetchError;
	};

	PartitionData& partitionData(const std::string& topic, int32_t partition);
	std::vector<ConsumedMessage> read(const std::string& topic, int32_t partition, int64_t fromOffset, size_t maxMessages);

	std::mutex mutex;
	std::map<std::string, std::vector<PartitionData>> topics;
	std::map<std::string, std::vector<CommittedOffset>> commits;
	std::optional<std::string> committedFailure;
	std::vector<GroupDetails> groups;
	std::vector<BrokerInfo> brokers;
};

#endif // KFCLI_FAKE_BROKER_CLIENT_H
