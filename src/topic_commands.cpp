/*
 *  kfcli - Topic and cluster commands
 */

#include "KafkaCli.h"
#include "FilterExpression.h"
#include "MessageSink.h"
#include "Reports.h"
#include "TailController.h"
#include "errors.h"
#include "utils.h"

//================================== Topic List / Details ==========================================

bool KafkaCli::listTopics(bool json, bool includeInternal)
{
	return runCommand("topics list", [&]() {
		std::vector<TopicSummary> topics = client().listTopics(includeInternal);

		if (json)
			writeJson(out, topicsToJson(topics));
		else
			printTopics(out, topics);
	});
}

bool KafkaCli::topicDetails(const std::string& topic, bool json)
{
	return runCommand("topics details", [&]() {
		TopicDetails details = client().describeTopic(topic);

		if (json)
			writeJson(out, topicDetailsToJson(details));
		else
			printTopicDetails(out, details);
	});
}

//================================== Topic Create/Delete ==========================================

bool KafkaCli::createTopic(const std::string& topic, int32_t partitions, int32_t replicationFactor)
{
	return runCommand("topics create", [&]() {
		client().createTopic(topic, partitions, replicationFactor);
		out << "Topic " << topic << " created" << '\n';
	});
}

bool KafkaCli::deleteTopic(const std::string& topic)
{
	return runCommand("topics delete", [&]() {
		client().deleteTopic(topic);
		out << "Topic " << topic << " deleted" << '\n';
	});
}

//================================== Tail ==========================================

bool KafkaCli::tailTopic(const TailRequest& request, CancellationToken& cancel)
{
	return runCommand("topics tail", [&]() {
		const ToolSettings& tool = environments->toolSettings();

		TailOptions tailOptions;
		tailOptions.topic = request.topic;
		tailOptions.before = request.before;
		tailOptions.partitions = request.partitions;
		tailOptions.maxMessages = request.maxMessages;
		tailOptions.pollIntervalMs = tool.pollIntervalMs;
		tailOptions.batchSize = tool.batchSize;
		tailOptions.queueCapacity = tool.queueCapacity;

		// a bad expression is reported before any broker is contacted
		if (!request.filter.empty())
		{
			tailOptions.filter = parseFilterExpression(request.filter);
			eventLog.info(EventLog::tailLogName, "filter " + tailOptions.filter->toString());
		}

		StreamSink sink(out, request.showMetadata);
		TailController controller(client(), sink, eventLog);
		TailStats stats = controller.run(tailOptions, cancel);

		if (stats.decodeFailures > 0 && tailOptions.filter)
		{
			eventLog.warn(EventLog::tailLogName, std::to_string(stats.decodeFailures) + " message(s) were not structured documents and never matched");
		}
	});
}

//================================== Brokers ==========================================

bool KafkaCli::listBrokers(bool json)
{
	return runCommand("brokers", [&]() {
		std::vector<BrokerInfo> brokers = client().listBrokers();

		if (json)
			writeJson(out, brokersToJson(brokers));
		else
			printBrokers(out, brokers);
	});
}
