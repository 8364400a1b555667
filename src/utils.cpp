#include "utils.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

std::string currentDateTime()
{
	auto now = std::chrono::system_clock::now();
	tm current{};

	auto time = std::chrono::system_clock::to_time_t(now);
	gmtime_r(&time, &current);

	auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count() % 1000000000;

	std::ostringstream oss{};
	oss << std::put_time(&current, "%Y-%m-%d %T.") << std::setw(9) << std::setfill('0') << ns;
	return oss.str();
}

std::string currentDateTime(const char* format)
{
	tm current{};
	auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	gmtime_r(&time, &current);

	std::ostringstream oss{};
	oss << std::put_time(&current, format);
	return oss.str();
}

std::string formatTimestampMs(int64_t timestampMs)
{
	if (timestampMs < 0)
		return "-";

	time_t seconds = static_cast<time_t>(timestampMs / 1000);
	tm utc{};
	gmtime_r(&seconds, &utc);

	char buf[32];
	std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
		utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
		utc.tm_hour, utc.tm_min, utc.tm_sec,
		static_cast<int>(timestampMs % 1000));
	return std::string(buf);
}

std::vector<std::string> splitList(const std::string& list, const char* separators)
{
	std::vector<std::string> parts;
	boost::algorithm::split(parts, list, boost::is_any_of(separators));

	for (auto& part : parts)
	{
		boost::algorithm::trim(part);
	}
	return parts;
}

bool parseInt64(const std::string& text, int64_t& value)
{
	if (text.empty() || std::isspace(static_cast<unsigned char>(text[0])))
		return false;

	char* end = nullptr;
	errno = 0;
	long long parsed = std::strtoll(text.c_str(), &end, 10);
	if (errno == ERANGE || end == text.c_str() || *end != '\0')
		return false;

	value = static_cast<int64_t>(parsed);
	return true;
}

//================================== Input Validation ==========================================

namespace {

// topics and groups share the legal alphabet
bool isKafkaNameChar(char c)
{
	return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
}

bool checkKafkaName(const std::string& kind, const std::string& name, size_t maxLength, std::string& errorMsg)
{
	if (name.empty())
	{
		errorMsg = kind + " cannot be empty";
		return false;
	}

	if (name.length() > maxLength)
	{
		errorMsg = kind + " exceeds maximum length of " + std::to_string(maxLength) + " characters";
		return false;
	}

	auto bad = std::find_if_not(name.begin(), name.end(), isKafkaNameChar);
	if (bad != name.end())
	{
		errorMsg = kind + " contains invalid character '" + std::string(1, *bad) + "'. Allowed: a-z, A-Z, 0-9, '.', '_', '-'";
		return false;
	}

	return true;
}

}

bool isValidTopicName(const std::string& topicName, std::string& errorMsg)
{
	if (topicName == "." || topicName == "..")
	{
		errorMsg = "Topic name cannot be '.' or '..'";
		return false;
	}

	return checkKafkaName("Topic name", topicName, 249, errorMsg);
}

bool isValidConsumerGroupId(const std::string& groupId, std::string& errorMsg)
{
	return checkKafkaName("Consumer group ID", groupId, 255, errorMsg);
}

bool isValidBrokerAddress(const std::string& address, std::string& errorMsg)
{
	if (address.empty())
	{
		errorMsg = "Broker address cannot be empty";
		return false;
	}

	// host can be hostname, IPv4, or IPv6 (in brackets)
	static const std::regex brokerPattern(
		R"(^([a-zA-Z0-9\-._]+|\[[:0-9a-fA-F]+\])(:(\d{1,5}))?$)"
	);

	std::smatch match;
	if (!std::regex_match(address, match, brokerPattern))
	{
		errorMsg = "Invalid broker address '" + address + "'. Expected: host:port or host";
		return false;
	}

	if (match[3].matched)
	{
		int port = std::stoi(match[3].str());
		if (port < 1 || port > 65535)
		{
			errorMsg = "Port must be between 1 and 65535";
			return false;
		}
	}

	return true;
}

bool isValidBrokerList(const std::string& brokerList, std::string& errorMsg)
{
	if (brokerList.empty())
	{
		errorMsg = "Broker list cannot be empty";
		return false;
	}

	for (const auto& broker : splitList(brokerList))
	{
		if (broker.empty())
		{
			errorMsg = "Empty broker address in list";
			return false;
		}

		if (!isValidBrokerAddress(broker, errorMsg))
		{
			return false;
		}
	}

	return true;
}

bool isValidPartitionCount(int32_t partitions, std::string& errorMsg)
{
	if (partitions < 1)
	{
		errorMsg = "Partition count must be >= 1";
		return false;
	}

	return true;
}

bool isValidReplicationFactor(int32_t replicationFactor, std::string& errorMsg)
{
	if (replicationFactor < 1)
	{
		errorMsg = "Replication factor must be >= 1";
		return false;
	}

	if (replicationFactor > 32767)
	{
		errorMsg = "Replication factor exceeds maximum (32767)";
		return false;
	}

	return true;
}

//================================== Consumer Protocol ==========================================

namespace {

class BigEndianReader
{
public:
	BigEndianReader(const void* data, size_t size)
		: cursor(static_cast<const unsigned char*>(data)), remaining(size) {}

	bool readInt16(int16_t& out)
	{
		if (remaining < 2) return false;
		out = static_cast<int16_t>((cursor[0] << 8) | cursor[1]);
		skip(2);
		return true;
	}

	bool readInt32(int32_t& out)
	{
		if (remaining < 4) return false;
		uint32_t v = (uint32_t(cursor[0]) << 24) | (uint32_t(cursor[1]) << 16) | (uint32_t(cursor[2]) << 8) | uint32_t(cursor[3]);
		out = static_cast<int32_t>(v);
		skip(4);
		return true;
	}

	bool readString(std::string& out)
	{
		int16_t len = 0;
		if (!readInt16(len) || len < 0 || static_cast<size_t>(len) > remaining) return false;
		out.assign(reinterpret_cast<const char*>(cursor), static_cast<size_t>(len));
		skip(static_cast<size_t>(len));
		return true;
	}

private:
	void skip(size_t n)
	{
		cursor += n;
		remaining -= n;
	}

	const unsigned char* cursor;
	size_t remaining;
};

}

bool decodeConsumerAssignment(const void* data, size_t size, std::vector<TopicAssignment>& assignment)
{
	assignment.clear();
	if (data == nullptr || size == 0)
		return true;	// member without assignment

	BigEndianReader reader(data, size);
	int16_t version = 0;
	int32_t topicCount = 0;

	if (!reader.readInt16(version) || !reader.readInt32(topicCount) || topicCount < 0)
		return false;

	for (int32_t t = 0; t < topicCount; t++)
	{
		TopicAssignment entry;
		int32_t partitionCount = 0;

		if (!reader.readString(entry.topic) || !reader.readInt32(partitionCount) || partitionCount < 0)
			return false;

		for (int32_t p = 0; p < partitionCount; p++)
		{
			int32_t partition = 0;
			if (!reader.readInt32(partition))
				return false;
			entry.partitions.push_back(partition);
		}

		assignment.push_back(std::move(entry));
	}

	// trailing user data is not interpreted
	return true;
}
