/*
 *  kfcli - Environment Store
 */

#include "EnvironmentStore.h"
#include "errors.h"
#include "utils.h"

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sys/stat.h>

namespace pt = boost::property_tree;

namespace {

bool parseFlag(const std::string& text)
{
	std::string value = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));
	return value == "true" || value == "1" || value == "yes";
}

int64_t parseSetting(const std::string& key, const std::string& text, int64_t minValue)
{
	int64_t value = 0;
	if (!parseInt64(boost::algorithm::trim_copy(text), value) || value < minValue)
	{
		throw ConfigError("invalid value for " + key + ": '" + text + "'");
	}
	return value;
}

void readToolSettings(const pt::ptree& section, ToolSettings& tool)
{
	for (const auto& item : section)
	{
		const std::string& key = item.first;
		const std::string value = item.second.data();

		if (key == "log_directory")
		{
			tool.logDirectory = value;
		}
		else if (key == "log_file_format")
		{
			tool.logFileFormat = value;
		}
		else if (key == "log_level")
		{
			if (!parseLogLevel(value, tool.logLevel))
				throw ConfigError("invalid value for log_level: '" + value + "'");
		}
		else if (key == "poll_interval_ms")
		{
			tool.pollIntervalMs = static_cast<int>(parseSetting(key, value, 1));
		}
		else if (key == "batch_size")
		{
			tool.batchSize = static_cast<size_t>(parseSetting(key, value, 1));
		}
		else if (key == "queue_capacity")
		{
			tool.queueCapacity = static_cast<size_t>(parseSetting(key, value, 1));
		}
		else if (key == "request_timeout_ms")
		{
			tool.requestTimeoutMs = static_cast<int>(parseSetting(key, value, 1));
		}
		else
		{
			throw ConfigError("unknown setting [" + std::string(EnvironmentStore::toolSection) + "] " + key);
		}
	}
}

// mkdir -p
void createDirectories(const std::string& dir)
{
	std::string current;
	for (const auto& part : splitList(dir, "/"))
	{
		if (part.empty())
			continue;
		current += (current.empty() && dir[0] != '/') ? part : "/" + part;
		if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST)
		{
			throw ConfigError("cannot create directory " + current + ": " + std::strerror(errno));
		}
	}
}

}

EnvironmentStore::EnvironmentStore(std::string path)
	: filePath(std::move(path))
{
}

std::string EnvironmentStore::defaultPath()
{
	const char* explicitPath = std::getenv("KFCLI_CONFIG");
	if (explicitPath && *explicitPath)
		return explicitPath;

	const char* home = std::getenv("HOME");
	if (!home || !*home)
	{
		throw ConfigError("HOME is not set, use --config or KFCLI_CONFIG");
	}
	return std::string(home) + "/.config/kfcli/config.ini";
}

void EnvironmentStore::load()
{
	environments.clear();
	tool = ToolSettings();

	std::ifstream in(filePath);
	if (!in.is_open())
		return;

	pt::ptree root;
	try
	{
		pt::read_ini(in, root);
	}
	catch (const pt::ini_parser_error& e)
	{
		throw ConfigError("cannot parse " + filePath + ": " + e.message() + " (line " + std::to_string(e.line()) + ")");
	}

	// keys are dotted, so sections are walked rather than queried by path
	for (const auto& section : root)
	{
		if (section.second.empty() && !section.second.data().empty())
		{
			throw ConfigError("key outside of a section in " + filePath + ": " + section.first);
		}

		if (section.first == toolSection)
		{
			readToolSettings(section.second, tool);
			continue;
		}

		Environment env;
		env.name = section.first;
		for (const auto& item : section.second)
		{
			const std::string& key = item.first;
			const std::string value = item.second.data();

			if (key == "brokers")
				env.brokers = value;
			else if (key == "active")
				env.active = parseFlag(value);
			else if (boost::algorithm::starts_with(key, kafkaPrefix))
				env.settings.push_back({ key.substr(std::strlen(kafkaPrefix)), value });
			else
				throw ConfigError("unknown key in [" + env.name + "]: " + key);
		}

		if (env.brokers.empty())
		{
			throw ConfigError("environment " + env.name + " has no brokers");
		}
		environments.push_back(std::move(env));
	}
}

void EnvironmentStore::save() const
{
	pt::ptree root;

	for (const auto& env : environments)
	{
		pt::ptree section;
		section.push_back(pt::ptree::value_type("brokers", pt::ptree(env.brokers)));
		section.push_back(pt::ptree::value_type("active", pt::ptree(env.active ? "true" : "false")));
		for (const auto& s : env.settings)
		{
			section.push_back(pt::ptree::value_type(kafkaPrefix + s.Key, pt::ptree(s.Value)));
		}
		root.push_back(pt::ptree::value_type(env.name, section));
	}

	const ToolSettings defaults;
	pt::ptree toolNode;
	if (tool.logDirectory != defaults.logDirectory)
		toolNode.push_back(pt::ptree::value_type("log_directory", pt::ptree(tool.logDirectory)));
	if (tool.logFileFormat != defaults.logFileFormat)
		toolNode.push_back(pt::ptree::value_type("log_file_format", pt::ptree(tool.logFileFormat)));
	if (tool.logLevel != defaults.logLevel)
		toolNode.push_back(pt::ptree::value_type("log_level", pt::ptree(logLevelName(tool.logLevel))));
	if (tool.pollIntervalMs != defaults.pollIntervalMs)
		toolNode.push_back(pt::ptree::value_type("poll_interval_ms", pt::ptree(std::to_string(tool.pollIntervalMs))));
	if (tool.batchSize != defaults.batchSize)
		toolNode.push_back(pt::ptree::value_type("batch_size", pt::ptree(std::to_string(tool.batchSize))));
	if (tool.queueCapacity != defaults.queueCapacity)
		toolNode.push_back(pt::ptree::value_type("queue_capacity", pt::ptree(std::to_string(tool.queueCapacity))));
	if (tool.requestTimeoutMs != defaults.requestTimeoutMs)
		toolNode.push_back(pt::ptree::value_type("request_timeout_ms", pt::ptree(std::to_string(tool.requestTimeoutMs))));
	if (!toolNode.empty())
		root.push_back(pt::ptree::value_type(toolSection, toolNode));

	std::string::size_type slash = filePath.rfind('/');
	if (slash != std::string::npos && slash > 0)
	{
		createDirectories(filePath.substr(0, slash));
	}

	std::ofstream out(filePath, std::ios_base::trunc);
	if (!out.is_open())
	{
		throw ConfigError("cannot write " + filePath + ": " + std::strerror(errno));
	}

	try
	{
		pt::write_ini(out, root);
	}
	catch (const pt::ini_parser_error& e)
	{
		throw ConfigError("cannot write " + filePath + ": " + e.message());
	}

	out.flush();
	if (!out)
	{
		throw ConfigError("cannot write " + filePath);
	}
}

Environment* EnvironmentStore::find(const std::string& name)
{
	auto it = std::find_if(environments.begin(), environments.end(),
		[&name](const Environment& env) { return env.name == name; });
	return it == environments.end() ? nullptr : &*it;
}

void EnvironmentStore::addEnvironment(const std::string& name, const std::string& brokers)
{
	if (name.empty() || name == toolSection || name.find_first_of("[]=;# \t") != std::string::npos)
	{
		throw ValidationError("invalid environment name '" + name + "'");
	}

	std::string errorMsg;
	if (!isValidBrokerList(brokers, errorMsg))
	{
		throw ValidationError(errorMsg);
	}

	if (Environment* existing = find(name))
	{
		existing->brokers = brokers;
		return;
	}

	Environment env;
	env.name = name;
	env.brokers = brokers;
	// the first environment becomes the active one
	env.active = environments.empty();
	environments.push_back(std::move(env));
}

void EnvironmentStore::activate(const std::string& name)
{
	if (!find(name))
	{
		throw ConfigError("unknown environment '" + name + "'");
	}

	for (auto& env : environments)
	{
		env.active = (env.name == name);
	}
}

void EnvironmentStore::removeEnvironment(const std::string& name)
{
	auto it = std::find_if(environments.begin(), environments.end(),
		[&name](const Environment& env) { return env.name == name; });
	if (it == environments.end())
	{
		throw ConfigError("unknown environment '" + name + "'");
	}
	environments.erase(it);
}

const Environment& EnvironmentStore::activeEnvironment() const
{
	for (const auto& env : environments)
	{
		if (env.active)
			return env;
	}
	throw ConfigError("No active environment");
}

const Environment& EnvironmentStore::environment(const std::string& name) const
{
	for (const auto& env : environments)
	{
		if (env.name == name)
			return env;
	}
	throw ConfigError("unknown environment '" + name + "'");
}
