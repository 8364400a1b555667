/*
 *  kfcli - command line entry point
 */

#include "KafkaCli.h"
#include "KafkaBrokerClient.h"
#include "SignalWatcher.h"
#include "utils.h"

#include <getopt.h>

#include <cstdint>
#include <cstring>
#include <iostream>

namespace {

constexpr int exitOk = 0;
constexpr int exitFailure = 1;
constexpr int exitUsage = 2;

struct UsageError
{
	std::string message;
};

void usage(std::ostream& out)
{
	out << "Usage: kfcli [global options] <command> [args]\n"
		"\nGlobal options:\n"
		"  -b, --brokers <list>    comma separated host:port list, bypasses the environment store\n"
		"  -e, --env <name>        use this environment instead of the active one\n"
		"  -c, --config <file>     environment store (default $KFCLI_CONFIG or ~/.config/kfcli/config.ini)\n"
		"      --log-dir <dir>     write event logs into <dir>\n"
		"  -v, --verbose           mirror event log lines to stderr\n"
		"  -h, --help              show this help\n"
		"      --version           print version\n"
		"\nCommands:\n"
		"  config add <name> <brokers>       store or replace an environment\n"
		"  config activate <name>            switch the active environment\n"
		"  config list                       list environments (* marks the active one)\n"
		"  config remove <name>              delete an environment\n"
		"  topics list [--json] [--internal]\n"
		"  topics details --topic <name> [--json]\n"
		"  topics create --topic <name> --partitions <n> --replication <n>\n"
		"  topics delete --topic <name>\n"
		"  topics tail --topic <name> [--before <n>] [--filter <expr>]\n"
		"              [--partition <n>]... [--max-messages <n>] [--meta]\n"
		"  brokers [--json]\n"
		"  consumer --list [--json]\n"
		"  consumer --consumer <group> [--pending] [--json]\n"
		"\nFilter expressions: <path> <op> <value>, e.g. data.attributes.name=19,\n"
		"  items[0].id!='x', amount>=100. Operators: = != < <= > >=\n";
}

int64_t numberArg(const char* option, const char* text, int64_t minValue)
{
	int64_t value = 0;
	if (!parseInt64(text, value) || value < minValue)
	{
		throw UsageError{ std::string("invalid value for ") + option + ": '" + text + "'" };
	}
	return value;
}

void rejectExtraArgs(int argc, char* argv[])
{
	if (optind < argc)
	{
		throw UsageError{ std::string("unexpected argument '") + argv[optind] + "'" };
	}
}

//================================== config ==========================================

bool runConfig(KafkaCli& cli, int argc, char* argv[])
{
	if (argc < 2)
		throw UsageError{ "config: missing action (add, activate, list, remove)" };

	std::string action = argv[1];
	if (action == "add")
	{
		if (argc != 4)
			throw UsageError{ "usage: kfcli config add <name> <brokers>" };
		return cli.addEnvironment(argv[2], argv[3]);
	}
	if (action == "activate")
	{
		if (argc != 3)
			throw UsageError{ "usage: kfcli config activate <name>" };
		return cli.activateEnvironment(argv[2]);
	}
	if (action == "list")
	{
		if (argc != 2)
			throw UsageError{ "usage: kfcli config list" };
		return cli.listEnvironments();
	}
	if (action == "remove")
	{
		if (argc != 3)
			throw UsageError{ "usage: kfcli config remove <name>" };
		return cli.removeEnvironment(argv[2]);
	}
	throw UsageError{ "config: unknown action '" + action + "'" };
}

//================================== topics ==========================================

enum TopicOption
{
	optTopic = 1000,
	optJson,
	optInternal,
	optPartitions,
	optReplication,
	optBefore,
	optFilter,
	optPartition,
	optMaxMessages,
	optMeta
};

bool runTopics(KafkaCli& cli, int argc, char* argv[], CancellationToken& cancel)
{
	if (argc < 2)
		throw UsageError{ "topics: missing action (list, details, create, delete, tail)" };

	static const struct option longOptions[] = {
		{ "topic", required_argument, nullptr, optTopic },
		{ "json", no_argument, nullptr, optJson },
		{ "internal", no_argument, nullptr, optInternal },
		{ "partitions", required_argument, nullptr, optPartitions },
		{ "replication", required_argument, nullptr, optReplication },
		{ "before", required_argument, nullptr, optBefore },
		{ "filter", required_argument, nullptr, optFilter },
		{ "partition", required_argument, nullptr, optPartition },
		{ "max-messages", required_argument, nullptr, optMaxMessages },
		{ "meta", no_argument, nullptr, optMeta },
		{ nullptr, 0, nullptr, 0 }
	};

	std::string action = argv[1];
	if (action != "list" && action != "details" && action != "create" && action != "delete" && action != "tail")
		throw UsageError{ "topics: unknown action '" + action + "'" };

	bool json = false, internal = false;
	int64_t partitions = 0, replication = 0, partition = 0;
	TailRequest tail;

	// the action is argv[0] of the option scan
	argc--;
	argv++;
	optind = 0;
	int r;
	while ((r = getopt_long(argc, argv, "+", longOptions, nullptr)) != -1)
	{
		switch (r)
		{
		case optTopic: tail.topic = optarg; break;
		case optJson: json = true; break;
		case optInternal: internal = true; break;
		case optPartitions: partitions = numberArg("--partitions", optarg, 1); break;
		case optReplication: replication = numberArg("--replication", optarg, 1); break;
		case optBefore: tail.before = numberArg("--before", optarg, 0); break;
		case optFilter: tail.filter = optarg; break;
		case optPartition:
			partition = numberArg("--partition", optarg, 0);
			if (partition > INT32_MAX)
				throw UsageError{ "invalid value for --partition: '" + std::string(optarg) + "'" };
			tail.partitions.push_back(static_cast<int32_t>(partition));
			break;
		case optMaxMessages: tail.maxMessages = static_cast<uint64_t>(numberArg("--max-messages", optarg, 0)); break;
		case optMeta: tail.showMetadata = true; break;
		default:
			throw UsageError{ "topics " + action + ": invalid option" };
		}
	}
	rejectExtraArgs(argc, argv);

	if (action == "list")
		return cli.listTopics(json, internal);

	if (tail.topic.empty())
		throw UsageError{ "topics " + action + ": --topic is required" };

	if (action == "details")
		return cli.topicDetails(tail.topic, json);
	if (action == "create")
	{
		if (partitions == 0 || replication == 0)
			throw UsageError{ "topics create: --partitions and --replication are required" };
		if (partitions > INT32_MAX || replication > INT32_MAX)
			throw UsageError{ "topics create: value out of range" };
		return cli.createTopic(tail.topic, static_cast<int32_t>(partitions), static_cast<int32_t>(replication));
	}
	if (action == "delete")
		return cli.deleteTopic(tail.topic);

	// only the tail stops on the token; other commands keep the default signal handling
	SignalWatcher signalWatcher(cancel);
	return cli.tailTopic(tail, cancel);
}

//================================== brokers / consumer ==========================================

bool runBrokers(KafkaCli& cli, int argc, char* argv[])
{
	static const struct option longOptions[] = {
		{ "json", no_argument, nullptr, optJson },
		{ nullptr, 0, nullptr, 0 }
	};

	bool json = false;
	optind = 0;
	int r;
	while ((r = getopt_long(argc, argv, "+", longOptions, nullptr)) != -1)
	{
		if (r != optJson)
			throw UsageError{ "brokers: invalid option" };
		json = true;
	}
	rejectExtraArgs(argc, argv);

	return cli.listBrokers(json);
}

bool runConsumer(KafkaCli& cli, int argc, char* argv[])
{
	enum { optList = 2000, optConsumer, optPending };

	static const struct option longOptions[] = {
		{ "list", no_argument, nullptr, optList },
		{ "consumer", required_argument, nullptr, optConsumer },
		{ "pending", no_argument, nullptr, optPending },
		{ "json", no_argument, nullptr, optJson },
		{ nullptr, 0, nullptr, 0 }
	};

	bool list = false, pending = false, json = false;
	std::string group;

	optind = 0;
	int r;
	while ((r = getopt_long(argc, argv, "+", longOptions, nullptr)) != -1)
	{
		switch (r)
		{
		case optList: list = true; break;
		case optConsumer: group = optarg; break;
		case optPending: pending = true; break;
		case optJson: json = true; break;
		default:
			throw UsageError{ "consumer: invalid option" };
		}
	}
	rejectExtraArgs(argc, argv);

	if (list == !group.empty())
		throw UsageError{ "consumer: use either --list or --consumer <group>" };
	if (list)
	{
		if (pending)
			throw UsageError{ "consumer: --pending needs --consumer <group>" };
		return cli.listGroups(json);
	}
	return cli.describeGroup(group, pending, json);
}

}

int main(int argc, char* argv[])
{
	enum { optLogDir = 3000, optVersion };

	static const struct option longOptions[] = {
		{ "brokers", required_argument, nullptr, 'b' },
		{ "env", required_argument, nullptr, 'e' },
		{ "config", required_argument, nullptr, 'c' },
		{ "log-dir", required_argument, nullptr, optLogDir },
		{ "verbose", no_argument, nullptr, 'v' },
		{ "help", no_argument, nullptr, 'h' },
		{ "version", no_argument, nullptr, optVersion },
		{ nullptr, 0, nullptr, 0 }
	};

	SignalWatcher::ignoreBrokenPipe();

	ConnectionOptions options;
	int r;

	// '+' stops at the command name, see GETOPT(3)
	while ((r = getopt_long(argc, argv, "+b:e:c:vh", longOptions, nullptr)) != -1)
	{
		switch (r)
		{
		case 'b': options.brokers = optarg; break;
		case 'e': options.environment = optarg; break;
		case 'c': options.configPath = optarg; break;
		case optLogDir: options.logDirectory = optarg; break;
		case 'v': options.verbose = true; break;
		case 'h':
			usage(std::cout);
			return exitOk;
		case optVersion:
			std::cout << "kfcli " << KafkaCli::Version << " (librdkafka " << KafkaBrokerClient::librdkafkaVersion() << ")" << std::endl;
			return exitOk;
		default:
			usage(std::cerr);
			return exitUsage;
		}
	}

	if (optind >= argc)
	{
		usage(std::cerr);
		return exitUsage;
	}

	CancellationToken cancel;

	KafkaCli cli(std::cout, options);
	int cmdArgc = argc - optind;
	char** cmdArgv = argv + optind;
	std::string command = cmdArgv[0];

	bool ok = false;
	try
	{
		if (command == "help")
		{
			usage(std::cout);
			return exitOk;
		}

		if (!cli.init())
		{
			std::cerr << "kfcli: " << cli.getLastError() << std::endl;
			return exitFailure;
		}

		if (command == "config")
			ok = runConfig(cli, cmdArgc, cmdArgv);
		else if (command == "topics")
			ok = runTopics(cli, cmdArgc, cmdArgv, cancel);
		else if (command == "brokers")
			ok = runBrokers(cli, cmdArgc, cmdArgv);
		else if (command == "consumer")
			ok = runConsumer(cli, cmdArgc, cmdArgv);
		else
			throw UsageError{ "unknown command '" + command + "'" };
	}
	catch (const UsageError& e)
	{
		std::cerr << "kfcli: " << e.message << "\n(see kfcli --help)" << std::endl;
		return exitUsage;
	}

	if (!ok)
	{
		std::cerr << "kfcli: " << cli.getLastError() << std::endl;
		return exitFailure;
	}
	return exitOk;
}
