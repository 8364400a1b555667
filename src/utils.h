#ifndef KFCLI_UTILS_H
#define KFCLI_UTILS_H

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

#include "KafkaTypes.h"

// Date/time utilities
std::string currentDateTime();
std::string currentDateTime(const char* format);
std::string formatTimestampMs(int64_t timestampMs);

// String utilities
std::vector<std::string> splitList(const std::string& list, const char* separators = ",");
bool parseInt64(const std::string& text, int64_t& value);

//================================== Input Validation ==========================================

// Topic name validation (Kafka topic naming rules)
bool isValidTopicName(const std::string& topicName, std::string& errorMsg);

// Broker address validation (host:port format)
bool isValidBrokerAddress(const std::string& address, std::string& errorMsg);

// Broker list validation (comma-separated list of host:port)
bool isValidBrokerList(const std::string& brokerList, std::string& errorMsg);

// Consumer group ID validation
bool isValidConsumerGroupId(const std::string& groupId, std::string& errorMsg);

// Partition count for a new topic
bool isValidPartitionCount(int32_t partitions, std::string& errorMsg);

// Replication factor validation
bool isValidReplicationFactor(int32_t replicationFactor, std::string& errorMsg);

//================================== Consumer Protocol ==========================================

// Decodes a member assignment blob of the "consumer" protocol
// (version, [topic, [partition]], user data). Returns false on truncated input.
bool decodeConsumerAssignment(const void* data, size_t size, std::vector<TopicAssignment>& assignment);

#endif // KFCLI_UTILS_H
