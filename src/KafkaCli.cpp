/*
 *  kfcli - Command facade
 *  Setup, broker connection, environment commands
 */

#include "KafkaCli.h"
#include "KafkaBrokerClient.h"
#include "Reports.h"
#include "errors.h"
#include "utils.h"

KafkaCli::KafkaCli(std::ostream& out, const ConnectionOptions& options)
	: out(out), options(options), environments(new EnvironmentStore(options.configPath))
{
}

KafkaCli::~KafkaCli()
{
	brokerClient.reset();
}

bool KafkaCli::init()
{
	return runCommand("init", [this]() {
		std::string path = options.configPath;
		if (path.empty())
		{
			try
			{
				path = EnvironmentStore::defaultPath();
			}
			catch (const ConfigError&)
			{
				// -b works without any store
				if (options.brokers.empty())
					throw;
			}
		}

		environments.reset(new EnvironmentStore(path));
		if (!path.empty())
		{
			environments->load();
		}

		const ToolSettings& tool = environments->toolSettings();
		eventLog.setLogDirectory(options.logDirectory.empty() ? tool.logDirectory : options.logDirectory);
		eventLog.setFormatLogFiles(tool.logFileFormat);
		eventLog.setLevel(options.verbose ? LogLevel::Debug : tool.logLevel);
		eventLog.setMirrorToStderr(options.verbose);

		eventLog.debug(EventLog::adminLogName, std::string("kfcli version: ") + Version + ", config: " + path);
	});
}

void KafkaCli::setBrokerClient(std::unique_ptr<BrokerClient> client)
{
	brokerClient = std::move(client);
}

BrokerClient& KafkaCli::client()
{
	if (brokerClient)
		return *brokerClient;

	std::string brokers = options.brokers;
	std::vector<KafkaSettings> settings;

	if (brokers.empty())
	{
		const Environment& env = options.environment.empty()
			? environments->activeEnvironment()
			: environments->environment(options.environment);

		brokers = env.brokers;
		settings = env.settings;
		eventLog.info(EventLog::adminLogName, "environment " + env.name + ", brokers " + brokers);
	}

	std::string errorMsg;
	if (!isValidBrokerList(brokers, errorMsg))
	{
		throw ValidationError(errorMsg);
	}

	brokerClient.reset(new KafkaBrokerClient(brokers, settings, eventLog, environments->toolSettings().requestTimeoutMs));
	return *brokerClient;
}

//================================== Environments ==========================================

bool KafkaCli::addEnvironment(const std::string& name, const std::string& brokers)
{
	return runCommand("config add", [&]() {
		environments->addEnvironment(name, brokers);
		environments->save();

		eventLog.info(EventLog::adminLogName, "environment " + name + " saved, brokers " + brokers);
		out << "Environment " << name << " saved to " << environments->path() << '\n';
	});
}

bool KafkaCli::activateEnvironment(const std::string& name)
{
	return runCommand("config activate", [&]() {
		environments->activate(name);
		environments->save();

		eventLog.info(EventLog::adminLogName, "environment " + name + " activated");
		out << "Environment " << name << " activated" << '\n';
	});
}

bool KafkaCli::listEnvironments()
{
	return runCommand("config list", [&]() {
		if (environments->list().empty())
		{
			out << "No environments configured, use: kfcli config add <name> <brokers>" << '\n';
			return;
		}
		printEnvironments(out, environments->list());
	});
}

bool KafkaCli::removeEnvironment(const std::string& name)
{
	return runCommand("config remove", [&]() {
		environments->removeEnvironment(name);
		environments->save();

		eventLog.info(EventLog::adminLogName, "environment " + name + " removed");
		out << "Environment " << name << " removed" << '\n';
	});
}
