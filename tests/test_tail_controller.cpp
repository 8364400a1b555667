#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <map>
#include <thread>
#include <vector>

#include "FakeBrokerClient.h"
#include "TailController.h"
#include "errors.h"

namespace {

class CollectingSink : public MessageSink
{
public:
	void write(const TailMatch& match) override
	{
		matches.push_back(match);
		if (onWrite)
			onWrite(match);
	}

	std::map<int32_t, std::vector<int64_t>> offsetsByPartition() const
	{
		std::map<int32_t, std::vector<int64_t>> result;
		for (const auto& m : matches)
			result[m.message.partition].push_back(m.message.offset);
		return result;
	}

	std::vector<TailMatch> matches;
	std::function<void(const TailMatch&)> onWrite;
};

std::vector<int64_t> range(int64_t from, int64_t to)
{
	std::vector<int64_t> values;
	for (int64_t v = from; v < to; v++)
		values.push_back(v);
	return values;
}

}

class TailControllerTest : public ::testing::Test
{
protected:
	void fill(const std::string& topic, int32_t partition, int count)
	{
		for (int i = 0; i < count; i++)
			broker.append(topic, partition, "{\"p\":" + std::to_string(partition) + ",\"n\":" + std::to_string(i) + "}");
	}

	TailOptions options(const std::string& topic)
	{
		TailOptions opts;
		opts.topic = topic;
		opts.pollIntervalMs = 10;
		return opts;
	}

	FakeBrokerClient broker;
	CollectingSink sink;
	EventLog eventLog;
	CancellationToken cancel;
};

//================================== Start Offsets ==========================================

TEST(StartOffsetTest, ComputeStartOffset)
{
	EXPECT_EQ(computeStartOffset(Watermarks{ 0, 10 }, std::nullopt), 10);
	EXPECT_EQ(computeStartOffset(Watermarks{ 0, 10 }, 3), 7);
	EXPECT_EQ(computeStartOffset(Watermarks{ 0, 10 }, 0), 10);
	EXPECT_EQ(computeStartOffset(Watermarks{ 0, 2 }, 5), 0);
	EXPECT_EQ(computeStartOffset(Watermarks{ 8, 10 }, 5), 8);
	EXPECT_EQ(computeStartOffset(Watermarks{ 0, 0 }, 100), 0);
}

TEST_F(TailControllerTest, ResolvesEachPartitionIndependently)
{
	broker.addTopic("orders", 3);
	broker.setEndOffset("orders", 0, 10);
	broker.setEndOffset("orders", 1, 20);
	broker.setEndOffset("orders", 2, 5);

	std::vector<PartitionStart> starts = resolveStartOffsets(broker, "orders", 3);
	ASSERT_EQ(starts.size(), 3u);
	EXPECT_EQ(starts[0].startOffset, 7);
	EXPECT_EQ(starts[1].startOffset, 17);
	EXPECT_EQ(starts[2].startOffset, 2);
	EXPECT_EQ(starts[1].endOffset, 20);
}

TEST_F(TailControllerTest, ResolvesSelectedPartitions)
{
	broker.addTopic("orders", 3);
	broker.setEndOffset("orders", 2, 4);

	std::vector<PartitionStart> starts = resolveStartOffsets(broker, "orders", std::nullopt, { 2, 0, 2 });
	ASSERT_EQ(starts.size(), 2u);
	EXPECT_EQ(starts[0].partition, 0);
	EXPECT_EQ(starts[1].partition, 2);
	EXPECT_EQ(starts[1].startOffset, 4);

	EXPECT_THROW(resolveStartOffsets(broker, "orders", std::nullopt, { 3 }), KafkaCliError);
}

//================================== Tail ==========================================

TEST_F(TailControllerTest, BeforeEmitsTheLastMessagesOfEveryPartition)
{
	broker.addTopic("orders", 3);
	fill("orders", 0, 10);
	fill("orders", 1, 20);
	fill("orders", 2, 5);

	TailOptions opts = options("orders");
	opts.before = 3;
	opts.maxMessages = 9;

	TailController controller(broker, sink, eventLog);
	TailStats stats = controller.run(opts, cancel);

	EXPECT_TRUE(stats.limitReached);
	EXPECT_EQ(stats.emitted, 9u);

	auto offsets = sink.offsetsByPartition();
	EXPECT_EQ(offsets[0], range(7, 10));
	EXPECT_EQ(offsets[1], range(17, 20));
	EXPECT_EQ(offsets[2], range(2, 5));

	EXPECT_EQ(stats.nextOffsets[0], 10);
	EXPECT_EQ(stats.nextOffsets[1], 20);
	EXPECT_EQ(stats.nextOffsets[2], 5);
	EXPECT_EQ(controller.state(), TailState::Stopped);
}

TEST_F(TailControllerTest, BeforeIsClampedToTheLowWatermark)
{
	broker.addTopic("orders", 1);
	fill("orders", 0, 10);
	broker.setLowWatermark("orders", 0, 8);

	TailOptions opts = options("orders");
	opts.before = 5;
	opts.maxMessages = 2;

	TailController controller(broker, sink, eventLog);
	TailStats stats = controller.run(opts, cancel);

	ASSERT_EQ(stats.starts.size(), 1u);
	EXPECT_EQ(stats.starts[0].startOffset, 8);
	EXPECT_EQ(sink.offsetsByPartition()[0], range(8, 10));
}

TEST_F(TailControllerTest, FollowsNewMessagesFromTheLiveEnd)
{
	broker.addTopic("events", 1);
	fill("events", 0, 5);

	sink.onWrite = [this](const TailMatch&) {
		if (sink.matches.size() == 2)
			cancel.cancel();
	};

	std::thread producer([this]() {
		while (broker.openReaders.load() == 0)
			std::this_thread::sleep_for(std::chrono::milliseconds(1));
		broker.append("events", 0, "{\"live\":1}");
		broker.append("events", 0, "{\"live\":2}");
	});

	TailController controller(broker, sink, eventLog);
	TailStats stats = controller.run(options("events"), cancel);
	producer.join();

	EXPECT_TRUE(stats.cancelled);
	ASSERT_EQ(sink.matches.size(), 2u);
	EXPECT_EQ(sink.matches[0].message.offset, 5);
	EXPECT_EQ(sink.matches[1].message.offset, 6);
	ASSERT_TRUE(sink.matches[0].document.has_value());
	EXPECT_EQ(sink.matches[0].document->as_object().at("live").as_int64(), 1);
}

TEST_F(TailControllerTest, FilterSelectsMatchingDocuments)
{
	broker.addTopic("people", 1);
	broker.append("people", 0, "{\"name\":19}");
	broker.append("people", 0, "{\"name\":20}");
	broker.append("people", 0, "not json");
	broker.append("people", 0, "{\"other\":19}");
	broker.append("people", 0, "{\"name\":\"19\"}");

	TailOptions opts = options("people");
	opts.before = 5;
	opts.filter = parseFilterExpression("name=19");
	opts.maxMessages = 2;

	TailController controller(broker, sink, eventLog);
	TailStats stats = controller.run(opts, cancel);

	EXPECT_EQ(sink.offsetsByPartition()[0], (std::vector<int64_t>{ 0, 4 }));
	EXPECT_EQ(stats.consumed, 5u);
	EXPECT_EQ(stats.matched, 2u);
	EXPECT_EQ(stats.decodeFailures, 1u);
}

TEST_F(TailControllerTest, WithoutFilterRawPayloadsPassThrough)
{
	broker.addTopic("logs", 1);
	broker.append("logs", 0, "plain line");
	broker.append("logs", 0, "{\"a\":1}");

	TailOptions opts = options("logs");
	opts.before = 2;
	opts.maxMessages = 2;

	TailController controller(broker, sink, eventLog);
	TailStats stats = controller.run(opts, cancel);

	ASSERT_EQ(sink.matches.size(), 2u);
	EXPECT_FALSE(sink.matches[0].document.has_value());
	EXPECT_EQ(sink.matches[0].message.payload, "plain line");
	EXPECT_TRUE(sink.matches[1].document.has_value());
	EXPECT_EQ(stats.decodeFailures, 1u);
}

TEST_F(TailControllerTest, CancellationFinishesInFlightBatches)
{
	broker.addTopic("orders", 2);
	fill("orders", 0, 50);
	fill("orders", 1, 50);

	sink.onWrite = [this](const TailMatch&) {
		if (sink.matches.size() == 10)
			cancel.cancel();
	};

	TailOptions opts = options("orders");
	opts.before = 50;
	opts.batchSize = 5;
	opts.queueCapacity = 4;

	TailController controller(broker, sink, eventLog);
	TailStats stats = controller.run(opts, cancel);

	EXPECT_TRUE(stats.cancelled);
	EXPECT_FALSE(stats.limitReached);
	EXPECT_GE(stats.emitted, 10u);
	EXPECT_EQ(stats.emitted, stats.consumed);
	EXPECT_EQ(stats.emitted, sink.matches.size());

	// nothing fetched is lost, nothing is reordered within a partition
	for (const auto& entry : sink.offsetsByPartition())
	{
		const std::vector<int64_t>& offsets = entry.second;
		EXPECT_EQ(offsets, range(0, static_cast<int64_t>(offsets.size())));
		EXPECT_EQ(stats.nextOffsets[entry.first], static_cast<int64_t>(offsets.size()));
	}
}

TEST_F(TailControllerTest, ExternalCancellationStopsAnIdleTail)
{
	broker.addTopic("quiet", 2);

	std::thread canceller([this]() {
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
		cancel.cancel();
	});

	TailController controller(broker, sink, eventLog);
	TailStats stats = controller.run(options("quiet"), cancel);
	canceller.join();

	EXPECT_TRUE(stats.cancelled);
	EXPECT_EQ(stats.emitted, 0u);
	EXPECT_EQ(broker.openReaders.load(), 0);
}

TEST_F(TailControllerTest, EmptyPollsAreSpacedByThePollInterval)
{
	broker.addTopic("quiet", 1);

	TailOptions opts = options("quiet");
	opts.pollIntervalMs = 50;

	std::thread canceller([this]() {
		std::this_thread::sleep_for(std::chrono::milliseconds(300));
		cancel.cancel();
	});

	TailController controller(broker, sink, eventLog);
	controller.run(opts, cancel);
	canceller.join();

	EXPECT_GE(broker.fetchCalls.load(), 2);
	EXPECT_LE(broker.fetchCalls.load(), 20);
}

TEST_F(TailControllerTest, RunCanBeRepeated)
{
	broker.addTopic("orders", 2);
	fill("orders", 0, 3);
	fill("orders", 1, 5);

	TailOptions opts = options("orders");
	opts.before = 2;
	opts.maxMessages = 4;

	TailController controller(broker, sink, eventLog);
	TailStats first = controller.run(opts, cancel);
	EXPECT_EQ(broker.openReaders.load(), 0);
	auto firstOffsets = sink.offsetsByPartition();
	sink.matches.clear();

	TailStats second = controller.run(opts, cancel);
	EXPECT_EQ(broker.openReaders.load(), 0);
	auto secondOffsets = sink.offsetsByPartition();

	ASSERT_EQ(first.starts.size(), 2u);
	ASSERT_EQ(second.starts.size(), 2u);
	for (size_t i = 0; i < first.starts.size(); i++)
	{
		EXPECT_EQ(first.starts[i].partition, second.starts[i].partition);
		EXPECT_EQ(first.starts[i].startOffset, second.starts[i].startOffset);
	}
	EXPECT_EQ(first.starts[0].startOffset, 1);
	EXPECT_EQ(first.starts[1].startOffset, 3);

	EXPECT_EQ(first.emitted, 4u);
	EXPECT_EQ(second.emitted, 4u);
	EXPECT_EQ(firstOffsets[0], range(1, 3));
	EXPECT_EQ(firstOffsets[1], range(3, 5));
	EXPECT_EQ(firstOffsets, secondOffsets);
	EXPECT_EQ(first.nextOffsets, second.nextOffsets);
	EXPECT_EQ(controller.state(), TailState::Stopped);
}

//================================== Failures ==========================================

TEST_F(TailControllerTest, FetchFailureStopsTheTail)
{
	broker.addTopic("orders", 2);
	broker.failFetch("orders", 1, "Broker: Not leader for partition");

	TailController controller(broker, sink, eventLog);
	EXPECT_THROW(controller.run(options("orders"), cancel), BrokerUnavailableError);

	EXPECT_EQ(controller.state(), TailState::Stopped);
	EXPECT_EQ(broker.openReaders.load(), 0);
}

TEST_F(TailControllerTest, SinkFailureIsRethrown)
{
	broker.addTopic("orders", 1);
	fill("orders", 0, 5);

	sink.onWrite = [](const TailMatch&) { throw KafkaCliError("output stream closed"); };

	TailOptions opts = options("orders");
	opts.before = 5;

	TailController controller(broker, sink, eventLog);
	EXPECT_THROW(controller.run(opts, cancel), KafkaCliError);
	EXPECT_EQ(sink.matches.size(), 1u);
	EXPECT_EQ(broker.openReaders.load(), 0);
}

TEST_F(TailControllerTest, RejectsInvalidOptions)
{
	broker.addTopic("orders", 1);
	TailController controller(broker, sink, eventLog);

	TailOptions badTopic = options("bad topic");
	EXPECT_THROW(controller.run(badTopic, cancel), ValidationError);

	TailOptions negative = options("orders");
	negative.before = -1;
	EXPECT_THROW(controller.run(negative, cancel), ValidationError);

	TailOptions noBatch = options("orders");
	noBatch.batchSize = 0;
	EXPECT_THROW(controller.run(noBatch, cancel), ValidationError);

	EXPECT_EQ(broker.brokerCalls.load(), 0);
}

TEST_F(TailControllerTest, UnknownTopicOrPartitionFailsBeforeReading)
{
	broker.addTopic("orders", 2);
	TailController controller(broker, sink, eventLog);

	EXPECT_THROW(controller.run(options("missing"), cancel), BrokerUnavailableError);
	EXPECT_EQ(controller.state(), TailState::Stopped);

	TailOptions opts = options("orders");
	opts.partitions = { 5 };
	EXPECT_THROW(controller.run(opts, cancel), KafkaCliError);
	EXPECT_EQ(broker.openReaders.load(), 0);
	EXPECT_EQ(broker.fetchCalls.load(), 0);
}
