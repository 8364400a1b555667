#ifndef KFCLI_ENVIRONMENT_STORE_H
#define KFCLI_ENVIRONMENT_STORE_H

#include <cstddef>
#include <string>
#include <vector>

#include "EventLog.h"

// librdkafka property, applied verbatim
struct KafkaSettings
{
	std::string Key;
	std::string Value;
};

// Named broker cluster connection profile
struct Environment
{
	std::string name;
	std::string brokers;
	bool active = false;
	std::vector<KafkaSettings> settings;
};

// Contents of the reserved [kfcli] section
struct ToolSettings
{
	std::string logDirectory;
	std::string logFileFormat = "%Y%m%d";
	LogLevel logLevel = LogLevel::Info;
	int pollIntervalMs = 500;
	size_t batchSize = 100;
	size_t queueCapacity = 1024;
	int requestTimeoutMs = 10000;
};

// INI backed list of environments; one section per environment, the
// "kfcli" section holds tool settings. Throws ConfigError.
class EnvironmentStore
{
public:
	static constexpr char toolSection[] = "kfcli";
	static constexpr char kafkaPrefix[] = "kafka.";

	explicit EnvironmentStore(std::string path);

	// $KFCLI_CONFIG, else $HOME/.config/kfcli/config.ini
	static std::string defaultPath();

	const std::string& path() const { return filePath; }

	// a missing file is an empty store
	void load();
	void save() const;

	const std::vector<Environment>& list() const { return environments; }
	const ToolSettings& toolSettings() const { return tool; }

	void addEnvironment(const std::string& name, const std::string& brokers);
	void activate(const std::string& name);
	void removeEnvironment(const std::string& name);

	const Environment& activeEnvironment() const;
	const Environment& environment(const std::string& name) const;

private:
	Environment* find(const std::string& name);

	std::string filePath;
	std::vector<Environment> environments;
	ToolSettings tool;
};

#endif // KFCLI_ENVIRONMENT_STORE_H
