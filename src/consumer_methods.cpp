/*
 *  kfcli - Broker Client Consumer Methods
 *  Group-less per-partition reads for the tail
 */

#include "KafkaBrokerClient.h"
#include "errors.h"
#include "utils.h"

namespace {

class KafkaPartitionReader final : public PartitionReader
{
public:
	KafkaPartitionReader(RdKafka::Consumer& consumer, std::unique_ptr<RdKafka::Topic> topicHandle,
		int32_t partition, int64_t startOffset, EventLog& eventLog)
		: consumer(consumer), topicHandle(std::move(topicHandle)), topicName(this->topicHandle->name()),
		  partitionId(partition), position(startOffset), eventLog(eventLog)
	{
		RdKafka::ErrorCode err = consumer.start(this->topicHandle.get(), partitionId, startOffset);
		if (err != RdKafka::ERR_NO_ERROR)
		{
			throw BrokerUnavailableError("start fetching " + where(), RdKafka::err2str(err));
		}
	}

	~KafkaPartitionReader() override
	{
		RdKafka::ErrorCode err = consumer.stop(topicHandle.get(), partitionId);
		if (err != RdKafka::ERR_NO_ERROR)
		{
			eventLog.warn(EventLog::tailLogName, "stop fetching " + where() + ": " + RdKafka::err2str(err));
		}
	}

	const std::string& topic() const override { return topicName; }
	int32_t partition() const override { return partitionId; }

	std::vector<ConsumedMessage> fetch(int64_t fromOffset, size_t maxMessages, int timeoutMs) override;

private:
	std::string where() const { return topicName + "/" + std::to_string(partitionId); }

	RdKafka::Consumer& consumer;
	std::unique_ptr<RdKafka::Topic> topicHandle;
	std::string topicName;
	int32_t partitionId;
	int64_t position;	// offset the fetcher queue is positioned at
	EventLog& eventLog;
};

std::vector<ConsumedMessage> KafkaPartitionReader::fetch(int64_t fromOffset, size_t maxMessages, int timeoutMs)
{
	std::vector<ConsumedMessage> batch;

	// consume() only reads this partition's fetch queue; client events wait on the main one
	consumer.poll(0);

	if (fromOffset != position)
	{
		RdKafka::ErrorCode err = consumer.seek(topicHandle.get(), partitionId, fromOffset, timeoutMs);
		if (err != RdKafka::ERR_NO_ERROR)
		{
			throw BrokerUnavailableError("seek " + where() + " to " + std::to_string(fromOffset), RdKafka::err2str(err));
		}
		position = fromOffset;
	}

	// only the first read waits, the rest drains what is already fetched
	int wait = timeoutMs;
	while (batch.size() < maxMessages)
	{
		std::unique_ptr<RdKafka::Message> msg(consumer.consume(topicHandle.get(), partitionId, wait));
		wait = 0;
		if (!msg)
			break;

		RdKafka::ErrorCode resultConsume = msg->err();
		if (resultConsume == RdKafka::ERR__TIMED_OUT || resultConsume == RdKafka::ERR__PARTITION_EOF)
			break;

		if (resultConsume == RdKafka::ERR__TRANSPORT)
		{
			// librdkafka reconnects by itself
			eventLog.warn(EventLog::tailLogName, where() + ": " + msg->errstr());
			break;
		}

		if (resultConsume != RdKafka::ERR_NO_ERROR)
		{
			throw BrokerUnavailableError("fetch " + where(), msg->errstr());
		}

		ConsumedMessage m;
		m.topic = topicName;
		m.partition = msg->partition();
		m.offset = msg->offset();
		if (msg->key())
		{
			m.key = *msg->key();
		}
		if (msg->payload())
		{
			m.payload.assign(static_cast<const char*>(msg->payload()), msg->len());
		}

		RdKafka::MessageTimestamp ts = msg->timestamp();
		m.timestamp = (ts.type == RdKafka::MessageTimestamp::MSG_TIMESTAMP_NOT_AVAILABLE) ? -1 : ts.timestamp;

		position = m.offset + 1;
		batch.push_back(std::move(m));
	}

	return batch;
}

}

//================================== Consumer ==========================================

RdKafka::Consumer& KafkaBrokerClient::consumerHandle()
{
	std::lock_guard<std::mutex> lock(handleMutex);
	if (hConsumer)
		return *hConsumer;

	RdKafkaConfPtr conf = makeConf("consumer");
	std::string errstr;

	// no group.id: nothing is ever committed; EOF ends a batch early
	if (conf->set("enable.partition.eof", "true", errstr) != RdKafka::Conf::CONF_OK
		|| conf->set("enable.auto.offset.store", "false", errstr) != RdKafka::Conf::CONF_OK)
	{
		throw ConfigError("consumer: " + errstr);
	}

	hConsumer.reset(RdKafka::Consumer::create(conf.get(), errstr));
	if (!hConsumer)
	{
		throw BrokerUnavailableError("cannot create consumer", errstr);
	}
	return *hConsumer;
}

std::unique_ptr<PartitionReader> KafkaBrokerClient::openPartition(const std::string& topic, int32_t partition, int64_t startOffset)
{
	RdKafka::Consumer& consumer = consumerHandle();

	RdKafkaConfPtr tconf(RdKafka::Conf::create(RdKafka::Conf::CONF_TOPIC));
	std::string errstr;

	// start offsets below the low watermark are clamped by the caller; this covers retention racing the tail
	if (tconf->set("auto.offset.reset", "earliest", errstr) != RdKafka::Conf::CONF_OK)
	{
		throw ConfigError("topic " + topic + ": " + errstr);
	}

	std::unique_ptr<RdKafka::Topic> topicHandle(RdKafka::Topic::create(&consumer, topic, tconf.get(), errstr));
	if (!topicHandle)
	{
		throw BrokerUnavailableError("topic " + topic, errstr);
	}

	eventLog.debug(EventLog::tailLogName, "open " + topic + "/" + std::to_string(partition) + " at " + std::to_string(startOffset));
	return std::unique_ptr<PartitionReader>(new KafkaPartitionReader(consumer, std::move(topicHandle), partition, startOffset, eventLog));
}
