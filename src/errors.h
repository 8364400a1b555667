#ifndef KFCLI_ERRORS_H
#define KFCLI_ERRORS_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// Base of every error raised by kfcli components. Command handlers catch
// std::exception at their boundary and turn it into the last-error text.
class KafkaCliError : public std::runtime_error
{
public:
	explicit KafkaCliError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed --filter expression. The tail never starts.
class FilterSyntaxError : public KafkaCliError
{
public:
	FilterSyntaxError(const std::string& message, const std::string& token, size_t position)
		: KafkaCliError(describe(message, token, position)), badToken(token), tokenPosition(position)
	{
	}

	const std::string& token() const { return badToken; }
	size_t position() const { return tokenPosition; }

private:
	static std::string describe(const std::string& message, const std::string& token, size_t position)
	{
		std::string text = "filter syntax error at position " + std::to_string(position) + ": " + message;
		if (!token.empty())
		{
			text += " near '" + token + "'";
		}
		return text;
	}

	std::string badToken;
	size_t tokenPosition;
};

// Connection, metadata or admin request failure. Fatal for the invocation.
class BrokerUnavailableError : public KafkaCliError
{
public:
	BrokerUnavailableError(const std::string& context, const std::string& cause)
		: KafkaCliError(context + ": " + cause), underlying(cause)
	{
	}

	const std::string& cause() const { return underlying; }

private:
	std::string underlying;
};

// Payload of one message is not a structured document.
class DecodeError : public KafkaCliError
{
public:
	explicit DecodeError(const std::string& message) : KafkaCliError("payload decode failed: " + message) {}
};

// Offsets of one partition could not be retrieved.
class OffsetUnavailableError : public KafkaCliError
{
public:
	OffsetUnavailableError(const std::string& topic, int32_t partition, const std::string& cause)
		: KafkaCliError("offsets unavailable for " + topic + "/" + std::to_string(partition) + ": " + cause),
		  topicName(topic), partitionId(partition)
	{
	}

	const std::string& topic() const { return topicName; }
	int32_t partition() const { return partitionId; }

private:
	std::string topicName;
	int32_t partitionId;
};

// Environment store could not be read, written or does not hold what was asked for.
class ConfigError : public KafkaCliError
{
public:
	explicit ConfigError(const std::string& message) : KafkaCliError(message) {}
};

// Rejected user input (topic name, group id, broker list, counts).
class ValidationError : public KafkaCliError
{
public:
	explicit ValidationError(const std::string& message) : KafkaCliError(message) {}
};

#endif // KFCLI_ERRORS_H
