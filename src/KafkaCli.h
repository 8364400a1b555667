#ifndef KFCLI_KAFKA_CLI_H
#define KFCLI_KAFKA_CLI_H

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "BrokerClient.h"
#include "CancellationToken.h"
#include "EnvironmentStore.h"
#include "EventLog.h"

// Where the brokers of one invocation come from
struct ConnectionOptions
{
	std::string configPath;		// empty = EnvironmentStore::defaultPath()
	std::string brokers;		// -b, bypasses the store
	std::string environment;	// -e, instead of the active one
	std::string logDirectory;	// overrides [kfcli] log_directory
	bool verbose = false;
};

struct TailRequest
{
	std::string topic;
	std::optional<int64_t> before;
	std::string filter;			// empty = no filter
	std::vector<int32_t> partitions;
	uint64_t maxMessages = 0;
	bool showMetadata = false;
};

// Command facade behind the kfcli executable. Every command returns false on
// failure and leaves the reason in getLastError().
class KafkaCli final
{
public:
	static constexpr char Version[] = "1.0.0";

	KafkaCli(std::ostream& out, const ConnectionOptions& options);
	~KafkaCli();

	KafkaCli(const KafkaCli&) = delete;
	KafkaCli& operator=(const KafkaCli&) = delete;

	// reads the environment store and applies its tool settings
	bool init();

	// replaces the librdkafka client, used by tests
	void setBrokerClient(std::unique_ptr<BrokerClient> client);

	// config
	bool addEnvironment(const std::string& name, const std::string& brokers);
	bool activateEnvironment(const std::string& name);
	bool listEnvironments();
	bool removeEnvironment(const std::string& name);

	// topics
	bool listTopics(bool json, bool includeInternal);
	bool topicDetails(const std::string& topic, bool json);
	bool createTopic(const std::string& topic, int32_t partitions, int32_t replicationFactor);
	bool deleteTopic(const std::string& topic);
	bool tailTopic(const TailRequest& request, CancellationToken& cancel);

	// cluster
	bool listBrokers(bool json);

	// consumer groups
	bool listGroups(bool json);
	bool describeGroup(const std::string& group, bool pending, bool json);

	std::string getLastError() { return msg_err; }
	EventLog& log() { return eventLog; }
	const EnvironmentStore& store() const { return *environments; }

private:
	BrokerClient& client();

	template <typename Body>
	bool runCommand(const char* name, Body&& body);

	std::ostream& out;
	ConnectionOptions options;
	EventLog eventLog;
	std::unique_ptr<EnvironmentStore> environments;
	std::unique_ptr<BrokerClient> brokerClient;
	std::string msg_err;
};

template <typename Body>
bool KafkaCli::runCommand(const char* name, Body&& body)
{
	msg_err.clear();
	try
	{
		body();
		return true;
	}
	catch (const std::exception& e)
	{
		msg_err = e.what();
		eventLog.error(EventLog::adminLogName, std::string(name) + ": " + msg_err);
	}
	return false;
}

#endif // KFCLI_KAFKA_CLI_H
