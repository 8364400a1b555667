#ifndef KFCLI_EVENT_LOG_H
#define KFCLI_EVENT_LOG_H

#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel
{
	Debug,
	Info,
	Warn,
	Error
};

const char* logLevelName(LogLevel level);
bool parseLogLevel(const std::string& text, LogLevel& level);

// Timestamped event log. Every write appends one line to
// <dir>/<logName><clientId_><pid>_<date>.log; an empty directory disables
// file output. Safe to call from several threads.
class EventLog
{
public:
	static constexpr char tailLogName[] = "tail_";
	static constexpr char adminLogName[] = "admin_";
	static constexpr char lagLogName[] = "lag_";
	static constexpr char statLogName[] = "statistics_";

	EventLog();

	void setLogDirectory(const std::string& logDir);
	void setFormatLogFiles(const std::string& format);
	void setClientId(const std::string& id);
	void setLevel(LogLevel level);
	void setMirrorToStderr(bool mirror);

	const std::string& logDirectory() const { return logDir; }
	bool enabled() const { return !logDir.empty() || mirrorToStderr; }

	void write(LogLevel level, const std::string& logName, const std::string& text);

	void debug(const std::string& logName, const std::string& text) { write(LogLevel::Debug, logName, text); }
	void info(const std::string& logName, const std::string& text) { write(LogLevel::Info, logName, text); }
	void warn(const std::string& logName, const std::string& text) { write(LogLevel::Warn, logName, text); }
	void error(const std::string& logName, const std::string& text) { write(LogLevel::Error, logName, text); }

	// raw line without level filtering, used for librdkafka statistics
	void writeRaw(const std::string& logName, const std::string& line);

private:
	void openEventFile(const std::string& logName, std::ofstream& eventFile);

	std::mutex mutex;
	std::string logDir;
	std::string formatLogFiles;
	std::string clientid;
	LogLevel minLevel;
	bool mirrorToStderr;
	unsigned pid;
};

#endif // KFCLI_EVENT_LOG_H
