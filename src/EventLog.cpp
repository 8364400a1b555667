#include "EventLog.h"
#include "utils.h"

#include <boost/algorithm/string/case_conv.hpp>

#include <iostream>
#include <unistd.h>

const char* logLevelName(LogLevel level)
{
	switch (level)
	{
	case LogLevel::Debug: return "DEBUG";
	case LogLevel::Info: return "INFO";
	case LogLevel::Warn: return "WARN";
	case LogLevel::Error: return "ERROR";
	}
	return "UNKNOWN";
}

bool parseLogLevel(const std::string& text, LogLevel& level)
{
	std::string lowered = boost::algorithm::to_lower_copy(text);

	if (lowered == "debug") level = LogLevel::Debug;
	else if (lowered == "info") level = LogLevel::Info;
	else if (lowered == "warn" || lowered == "warning") level = LogLevel::Warn;
	else if (lowered == "error") level = LogLevel::Error;
	else return false;

	return true;
}

EventLog::EventLog()
	: formatLogFiles("%Y%m%d"), minLevel(LogLevel::Info), mirrorToStderr(false)
{
	pid = static_cast<unsigned>(getpid());
}

void EventLog::setLogDirectory(const std::string& dir)
{
	std::lock_guard<std::mutex> lock(mutex);
	logDir = dir;
	if (!logDir.empty() && logDir.back() != '/')
	{
		logDir += '/';
	}
}

void EventLog::setFormatLogFiles(const std::string& format)
{
	std::lock_guard<std::mutex> lock(mutex);
	formatLogFiles = format.empty() ? std::string("%Y%m%d") : format;
}

void EventLog::setClientId(const std::string& id)
{
	std::lock_guard<std::mutex> lock(mutex);
	clientid = id;
}

void EventLog::setLevel(LogLevel level)
{
	std::lock_guard<std::mutex> lock(mutex);
	minLevel = level;
}

void EventLog::setMirrorToStderr(bool mirror)
{
	std::lock_guard<std::mutex> lock(mutex);
	mirrorToStderr = mirror;
}

void EventLog::write(LogLevel level, const std::string& logName, const std::string& text)
{
	std::lock_guard<std::mutex> lock(mutex);

	if (static_cast<int>(level) < static_cast<int>(minLevel))
		return;

	std::string line = currentDateTime() + " " + logLevelName(level) + ": " + text;

	if (mirrorToStderr)
	{
		std::cerr << line << std::endl;
	}

	std::ofstream eventFile{};
	openEventFile(logName, eventFile);
	if (eventFile.is_open()) eventFile << line << std::endl;
}

void EventLog::writeRaw(const std::string& logName, const std::string& line)
{
	std::lock_guard<std::mutex> lock(mutex);

	std::ofstream eventFile{};
	openEventFile(logName, eventFile);
	if (eventFile.is_open()) eventFile << currentDateTime() << " " << line << std::endl;
}

void EventLog::openEventFile(const std::string& logName, std::ofstream& eventFile)
{
	if (!logDir.empty())
	{
		std::string bufname = logName;
		if (!clientid.empty())
		{
			bufname = bufname + clientid + "_";
		}
		eventFile.open(logDir + bufname + std::to_string(pid) + "_" + currentDateTime(formatLogFiles.c_str()) + ".log", std::ios_base::app);
	}
}
