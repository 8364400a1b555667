#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "utils.h"

TEST(UtilsTest, SplitListTrimsParts)
{
	std::vector<std::string> parts = splitList(" a:9092, b:9093 ,c:9094");
	ASSERT_EQ(parts.size(), 3u);
	EXPECT_EQ(parts[0], "a:9092");
	EXPECT_EQ(parts[1], "b:9093");
	EXPECT_EQ(parts[2], "c:9094");
}

TEST(UtilsTest, ParseInt64)
{
	int64_t value = 0;
	EXPECT_TRUE(parseInt64("42", value));
	EXPECT_EQ(value, 42);
	EXPECT_TRUE(parseInt64("-7", value));
	EXPECT_EQ(value, -7);

	EXPECT_FALSE(parseInt64("", value));
	EXPECT_FALSE(parseInt64(" 1", value));
	EXPECT_FALSE(parseInt64("12abc", value));
	EXPECT_FALSE(parseInt64("99999999999999999999", value));
}

TEST(UtilsTest, FormatTimestampMs)
{
	EXPECT_EQ(formatTimestampMs(-1), "-");
	EXPECT_EQ(formatTimestampMs(0), "1970-01-01T00:00:00.000Z");
	EXPECT_EQ(formatTimestampMs(1700000000123), "2023-11-14T22:13:20.123Z");
}

TEST(UtilsTest, TopicNameValidation)
{
	std::string errorMsg;
	EXPECT_TRUE(isValidTopicName("orders.v1_test-2", errorMsg));

	EXPECT_FALSE(isValidTopicName("", errorMsg));
	EXPECT_FALSE(isValidTopicName(".", errorMsg));
	EXPECT_FALSE(isValidTopicName("..", errorMsg));
	EXPECT_FALSE(isValidTopicName(std::string(250, 'a'), errorMsg));

	EXPECT_FALSE(isValidTopicName("bad topic", errorMsg));
	EXPECT_NE(errorMsg.find("invalid character ' '"), std::string::npos);
}

TEST(UtilsTest, BrokerListValidation)
{
	std::string errorMsg;
	EXPECT_TRUE(isValidBrokerList("localhost:9092", errorMsg));
	EXPECT_TRUE(isValidBrokerList("kafka1:9092,kafka2:9092", errorMsg));
	EXPECT_TRUE(isValidBrokerList("[::1]:9092", errorMsg));
	EXPECT_TRUE(isValidBrokerList("broker", errorMsg));

	EXPECT_FALSE(isValidBrokerList("", errorMsg));
	EXPECT_FALSE(isValidBrokerList("a:9092,,b:9092", errorMsg));
	EXPECT_EQ(errorMsg, "Empty broker address in list");
	EXPECT_FALSE(isValidBrokerList("a:70000", errorMsg));
	EXPECT_FALSE(isValidBrokerList("a b:9092", errorMsg));
}

TEST(UtilsTest, GroupIdAndCountsValidation)
{
	std::string errorMsg;
	EXPECT_TRUE(isValidConsumerGroupId("billing-consumers", errorMsg));
	EXPECT_FALSE(isValidConsumerGroupId("", errorMsg));
	EXPECT_FALSE(isValidConsumerGroupId("a/b", errorMsg));

	EXPECT_TRUE(isValidPartitionCount(1, errorMsg));
	EXPECT_FALSE(isValidPartitionCount(0, errorMsg));

	EXPECT_TRUE(isValidReplicationFactor(3, errorMsg));
	EXPECT_FALSE(isValidReplicationFactor(0, errorMsg));
	EXPECT_FALSE(isValidReplicationFactor(40000, errorMsg));
}

TEST(UtilsTest, DecodeConsumerAssignment)
{
	// version 0, one topic "t1" with partitions 0 and 3, no user data
	const unsigned char blob[] = {
		0x00, 0x00,
		0x00, 0x00, 0x00, 0x01,
		0x00, 0x02, 't', '1',
		0x00, 0x00, 0x00, 0x02,
		0x00, 0x00, 0x00, 0x00,
		0x00, 0x00, 0x00, 0x03,
		0xff, 0xff, 0xff, 0xff
	};

	std::vector<TopicAssignment> assignment;
	ASSERT_TRUE(decodeConsumerAssignment(blob, sizeof(blob), assignment));
	ASSERT_EQ(assignment.size(), 1u);
	EXPECT_EQ(assignment[0].topic, "t1");
	EXPECT_EQ(assignment[0].partitions, (std::vector<int32_t>{ 0, 3 }));

	EXPECT_FALSE(decodeConsumerAssignment(blob, 12, assignment));

	EXPECT_TRUE(decodeConsumerAssignment(nullptr, 0, assignment));
	EXPECT_TRUE(assignment.empty());
}
