/*
 *  kfcli - Broker Client Metadata Methods
 *  Client handles, cluster and broker information, topic metadata, partition watermarks
 */

#include "KafkaBrokerClient.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <cstdio>

//================================== Client Handles ==========================================

KafkaBrokerClient::KafkaBrokerClient(const std::string& brokers, const std::vector<KafkaSettings>& settings,
	EventLog& eventLog, int requestTimeoutMs)
	: brokers(brokers), settings(settings), eventLog(eventLog), requestTimeoutMs(requestTimeoutMs)
{
	cl_event_cb.eventLog = &eventLog;
	cl_event_cb.logName = EventLog::adminLogName;

	for (const auto& s : settings)
	{
		if (s.Key == "statistics.interval.ms") cl_event_cb.statisticsOn = true;
		if (s.Key == "client.id") eventLog.setClientId(s.Value);
	}
}

KafkaBrokerClient::~KafkaBrokerClient()
{
	// readers are gone by now; the consumer handle goes first
	hConsumer.reset();
	hProducer.reset();
}

void KafkaBrokerClient::ClientEventCb::event_cb(RdKafka::Event& event)
{
	if (!eventLog)
		return;

	switch (event.type())
	{
	case RdKafka::Event::EVENT_ERROR:
		eventLog->error(logName, std::string(event.fatal() ? "FATAL " : "") + "(" + RdKafka::err2str(event.err()) + "): " + event.str());
		break;

	case RdKafka::Event::EVENT_STATS:
		if (statisticsOn) eventLog->writeRaw(EventLog::statLogName, "\"STATS\": " + event.str());
		break;

	case RdKafka::Event::EVENT_LOG:
	{
		char buf[512];
		std::snprintf(buf, sizeof(buf), "LOG-%i-%s: %s", event.severity(), event.fac().c_str(), event.str().c_str());
		eventLog->debug(logName, buf);
		break;
	}

	case RdKafka::Event::EVENT_THROTTLE:
		eventLog->warn(logName, "THROTTLED: " + std::to_string(event.throttle_time()) + "ms by "
			+ event.broker_name() + " id " + std::to_string(event.broker_id()));
		break;

	default:
		eventLog->info(logName, "EVENT: " + std::to_string(event.type()) + " (" + RdKafka::err2str(event.err()) + "): " + event.str());
		break;
	}
}

RdKafkaConfPtr KafkaBrokerClient::makeConf(const char* context)
{
	RdKafkaConfPtr conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));
	std::string errstr;

	// extra librdkafka properties of the environment
	for (const auto& s : settings)
	{
		if (conf->set(s.Key, s.Value, errstr) != RdKafka::Conf::CONF_OK)
		{
			throw ConfigError(std::string(context) + ": " + s.Key + ": " + errstr);
		}
	}

	if (conf->set("bootstrap.servers", brokers, errstr) != RdKafka::Conf::CONF_OK)
	{
		throw ConfigError(std::string(context) + ": " + errstr);
	}

	if (conf->set("event_cb", static_cast<RdKafka::EventCb*>(&cl_event_cb), errstr) != RdKafka::Conf::CONF_OK)
	{
		throw ConfigError(std::string(context) + ": " + errstr);
	}
	return conf;
}

RdKafka::Producer& KafkaBrokerClient::metadataHandle()
{
	std::lock_guard<std::mutex> lock(handleMutex);
	if (hProducer)
		return *hProducer;

	RdKafkaConfPtr conf = makeConf("metadata client");
	std::string errstr;

	hProducer.reset(RdKafka::Producer::create(conf.get(), errstr));
	if (!hProducer)
	{
		throw BrokerUnavailableError("cannot create client", errstr);
	}

	eventLog.info(EventLog::adminLogName, "connected to " + brokers + " (librdkafka version: " + RdKafka::version_str() + ")");
	return *hProducer;
}

// Nothing else polls the handles' main queues: error, throttle, log and
// stats events only reach cl_event_cb from here.
void KafkaBrokerClient::serveEvents(RdKafka::Handle& handle)
{
	handle.poll(0);
}

// Always a full cluster request: asking for a single topic makes brokers
// with auto.create.topics.enable create it.
RdKafkaMetadataPtr KafkaBrokerClient::fetchMetadata()
{
	RdKafka::Producer& producer = metadataHandle();

	RdKafka::Metadata* metadata = nullptr;
	RdKafka::ErrorCode err = producer.metadata(true, nullptr, &metadata, requestTimeoutMs);
	serveEvents(producer);
	if (err != RdKafka::ERR_NO_ERROR)
	{
		throw BrokerUnavailableError("metadata request to " + brokers, RdKafka::err2str(err));
	}
	return RdKafkaMetadataPtr(metadata);
}

//================================== Cluster and Broker Information ==========================================

std::vector<BrokerInfo> KafkaBrokerClient::listBrokers()
{
	RdKafkaMetadataPtr metadata = fetchMetadata();

	// controller id is only exposed by the C API
	int32_t controller = rd_kafka_controllerid(metadataHandle().c_ptr(), requestTimeoutMs);
	serveEvents(metadataHandle());

	std::vector<BrokerInfo> result;
	for (const auto* broker : *metadata->brokers())
	{
		BrokerInfo info;
		info.id = broker->id();
		info.host = broker->host();
		info.port = broker->port();
		info.controller = (broker->id() == controller);
		result.push_back(info);
	}

	std::sort(result.begin(), result.end(), [](const BrokerInfo& a, const BrokerInfo& b) { return a.id < b.id; });
	return result;
}

//================================== Topic Metadata ==========================================

std::vector<TopicSummary> KafkaBrokerClient::listTopics(bool includeInternal)
{
	RdKafkaMetadataPtr metadata = fetchMetadata();

	std::vector<TopicSummary> result;
	for (const auto* topic : *metadata->topics())
	{
		if (!includeInternal && topic->topic().compare(0, 2, "__") == 0)
			continue;

		TopicSummary summary;
		summary.name = topic->topic();
		summary.partitionCount = static_cast<int32_t>(topic->partitions()->size());
		result.push_back(summary);
	}

	std::sort(result.begin(), result.end(), [](const TopicSummary& a, const TopicSummary& b) { return a.name < b.name; });
	return result;
}

TopicDetails KafkaBrokerClient::describeTopic(const std::string& topic)
{
	std::string errorMsg;
	if (!isValidTopicName(topic, errorMsg))
	{
		throw ValidationError(errorMsg);
	}

	RdKafkaMetadataPtr metadata = fetchMetadata();

	const RdKafka::TopicMetadata* found = nullptr;
	for (const auto* t : *metadata->topics())
	{
		if (t->topic() == topic)
		{
			found = t;
			break;
		}
	}

	if (!found || found->err() == RdKafka::ERR_UNKNOWN_TOPIC_OR_PART)
	{
		throw BrokerUnavailableError(topic, "topic not found");
	}
	if (found->err() != RdKafka::ERR_NO_ERROR)
	{
		throw BrokerUnavailableError(topic, RdKafka::err2str(found->err()));
	}

	TopicDetails details;
	details.name = topic;

	for (const auto* part : *found->partitions())
	{
		PartitionInfo info;
		info.id = part->id();
		info.leader = part->leader();
		info.replicas = *part->replicas();
		info.isrs = *part->isrs();

		if (part->err() != RdKafka::ERR_NO_ERROR)
		{
			info.error = RdKafka::err2str(part->err());
		}

		try
		{
			info.watermarks = queryWatermarks(topic, part->id());
		}
		catch (const OffsetUnavailableError& e)
		{
			eventLog.warn(EventLog::adminLogName, e.what());
			if (info.error.empty())
				info.error = e.what();
		}

		details.partitions.push_back(std::move(info));
	}

	std::sort(details.partitions.begin(), details.partitions.end(),
		[](const PartitionInfo& a, const PartitionInfo& b) { return a.id < b.id; });
	return details;
}

std::vector<int32_t> KafkaBrokerClient::partitionIds(const std::string& topic)
{
	RdKafkaMetadataPtr metadata = fetchMetadata();

	for (const auto* t : *metadata->topics())
	{
		if (t->topic() != topic)
			continue;

		if (t->err() == RdKafka::ERR_UNKNOWN_TOPIC_OR_PART)
			break;
		if (t->err() != RdKafka::ERR_NO_ERROR)
			throw BrokerUnavailableError(topic, RdKafka::err2str(t->err()));

		std::vector<int32_t> ids;
		for (const auto* part : *t->partitions())
		{
			ids.push_back(part->id());
		}
		std::sort(ids.begin(), ids.end());
		return ids;
	}

	throw BrokerUnavailableError(topic, "topic not found");
}

Watermarks KafkaBrokerClient::queryWatermarks(const std::string& topic, int32_t partition)
{
	RdKafka::Producer* producer = nullptr;
	try
	{
		producer = &metadataHandle();
	}
	catch (const BrokerUnavailableError& e)
	{
		throw OffsetUnavailableError(topic, partition, e.cause());
	}

	Watermarks wm;
	RdKafka::ErrorCode err = producer->query_watermark_offsets(topic, partition, &wm.low, &wm.high, requestTimeoutMs);
	serveEvents(*producer);
	if (err != RdKafka::ERR_NO_ERROR)
	{
		throw OffsetUnavailableError(topic, partition, RdKafka::err2str(err));
	}
	return wm;
}
