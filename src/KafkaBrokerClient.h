#ifndef KFCLI_KAFKA_BROKER_CLIENT_H
#define KFCLI_KAFKA_BROKER_CLIENT_H

#include <librdkafka/rdkafka.h>
#include <librdkafka/rdkafkacpp.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "BrokerClient.h"
#include "EnvironmentStore.h"
#include "EventLog.h"

using RdKafkaConfPtr = std::unique_ptr<RdKafka::Conf>;
using RdKafkaMetadataPtr = std::unique_ptr<RdKafka::Metadata>;

// BrokerClient over librdkafka. Metadata and watermarks go through one
// lazily created producer handle, partition reads through one legacy
// (group-less) consumer handle shared by every reader, admin requests
// through short lived AdminClientScope handles.
class KafkaBrokerClient final : public BrokerClient
{
public:
	KafkaBrokerClient(const std::string& brokers, const std::vector<KafkaSettings>& settings,
		EventLog& eventLog, int requestTimeoutMs);
	~KafkaBrokerClient() override;

	KafkaBrokerClient(const KafkaBrokerClient&) = delete;
	KafkaBrokerClient& operator=(const KafkaBrokerClient&) = delete;

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

	static std::string librdkafkaVersion() { return RdKafka::version_str(); }

	// librdkafka client events into the event log
	class ClientEventCb : public RdKafka::EventCb
	{
	public:
		EventLog* eventLog = nullptr;
		std::string logName;
		bool statisticsOn = false;

		void event_cb(RdKafka::Event& event) override;
	};

private:
	// RAII over a C API client handle and its result queue
	class AdminClientScope
	{
	public:
		AdminClientScope(const std::string& brokers, const std::vector<KafkaSettings>& settings, rd_kafka_type_t type);
		~AdminClientScope();

		AdminClientScope(const AdminClientScope&) = delete;
		AdminClientScope& operator=(const AdminClientScope&) = delete;

		bool isValid() const { return rk != nullptr && rkqu != nullptr; }
		const std::string& error() const { return errstr_msg; }

		rd_kafka_t* get() const { return rk; }
		rd_kafka_queue_t* queue() const { return rkqu; }

	private:
		rd_kafka_t* rk = nullptr;
		rd_kafka_queue_t* rkqu = nullptr;
		std::string errstr_msg;
	};

	RdKafkaConfPtr makeConf(const char* context);
	RdKafka::Producer& metadataHandle();
	RdKafka::Consumer& consumerHandle();
	RdKafkaMetadataPtr fetchMetadata();
	void serveEvents(RdKafka::Handle& handle);
	rd_kafka_event_t* waitAdminResult(AdminClientScope& admin, const char* context);

	std::string brokers;
	std::vector<KafkaSettings> settings;
	EventLog& eventLog;
	int requestTimeoutMs;

	ClientEventCb cl_event_cb;

	std::mutex handleMutex;
	std::unique_ptr<RdKafka::Producer> hProducer;
	std::unique_ptr<RdKafka::Consumer> hConsumer;
};

#endif // KFCLI_KAFKA_BROKER_CLIENT_H
