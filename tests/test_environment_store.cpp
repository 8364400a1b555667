#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "EnvironmentStore.h"
#include "errors.h"

namespace fs = std::filesystem;

class EnvironmentStoreTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		dir = fs::temp_directory_path() / ("kfcli_store_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed())
			+ "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
		fs::remove_all(dir);
		fs::create_directories(dir);
		path = (dir / "config.ini").string();
	}

	void TearDown() override
	{
		fs::remove_all(dir);
	}

	void writeFile(const std::string& content)
	{
		std::ofstream file(path);
		file << content;
	}

	std::string readFile()
	{
		std::ifstream file(path);
		std::stringstream buffer;
		buffer << file.rdbuf();
		return buffer.str();
	}

	fs::path dir;
	std::string path;
};

TEST_F(EnvironmentStoreTest, MissingFileIsAnEmptyStore)
{
	EnvironmentStore store(path);
	store.load();

	EXPECT_TRUE(store.list().empty());
	EXPECT_EQ(store.toolSettings().pollIntervalMs, 500);
	EXPECT_THROW(store.activeEnvironment(), ConfigError);
}

TEST_F(EnvironmentStoreTest, FirstEnvironmentBecomesActive)
{
	EnvironmentStore store(path);
	store.addEnvironment("dev", "localhost:9092");
	store.addEnvironment("prod", "kafka1:9092,kafka2:9092");

	EXPECT_EQ(store.activeEnvironment().name, "dev");
	ASSERT_EQ(store.list().size(), 2u);
	EXPECT_FALSE(store.list()[1].active);
}

TEST_F(EnvironmentStoreTest, ActivateKeepsExactlyOneActive)
{
	EnvironmentStore store(path);
	store.addEnvironment("dev", "localhost:9092");
	store.addEnvironment("prod", "kafka1:9092");
	store.activate("prod");

	int active = 0;
	for (const auto& env : store.list())
		active += env.active ? 1 : 0;
	EXPECT_EQ(active, 1);
	EXPECT_EQ(store.activeEnvironment().name, "prod");

	EXPECT_THROW(store.activate("staging"), ConfigError);
	EXPECT_EQ(store.activeEnvironment().name, "prod");
}

TEST_F(EnvironmentStoreTest, AddingExistingEnvironmentReplacesBrokers)
{
	EnvironmentStore store(path);
	store.addEnvironment("dev", "localhost:9092");
	store.addEnvironment("prod", "kafka1:9092");
	store.activate("prod");
	store.addEnvironment("prod", "kafka9:9092");

	ASSERT_EQ(store.list().size(), 2u);
	EXPECT_EQ(store.environment("prod").brokers, "kafka9:9092");
	EXPECT_TRUE(store.environment("prod").active);
}

TEST_F(EnvironmentStoreTest, RejectsInvalidInput)
{
	EnvironmentStore store(path);
	EXPECT_THROW(store.addEnvironment("", "localhost:9092"), ValidationError);
	EXPECT_THROW(store.addEnvironment("kfcli", "localhost:9092"), ValidationError);
	EXPECT_THROW(store.addEnvironment("my env", "localhost:9092"), ValidationError);
	EXPECT_THROW(store.addEnvironment("dev", ""), ValidationError);
	EXPECT_THROW(store.addEnvironment("dev", "host:99999"), ValidationError);
	EXPECT_TRUE(store.list().empty());
}

TEST_F(EnvironmentStoreTest, SaveAndLoadRoundTrip)
{
	{
		EnvironmentStore store(path);
		store.addEnvironment("dev", "localhost:9092");
		store.addEnvironment("prod", "kafka1:9092,kafka2:9092");
		store.activate("prod");
		store.save();
	}

	EnvironmentStore reloaded(path);
	reloaded.load();

	ASSERT_EQ(reloaded.list().size(), 2u);
	EXPECT_EQ(reloaded.list()[0].name, "dev");
	EXPECT_EQ(reloaded.list()[1].brokers, "kafka1:9092,kafka2:9092");
	EXPECT_EQ(reloaded.activeEnvironment().name, "prod");

	// defaults are not written
	EXPECT_EQ(readFile().find("[kfcli]"), std::string::npos);
}

TEST_F(EnvironmentStoreTest, RemoveEnvironment)
{
	EnvironmentStore store(path);
	store.addEnvironment("dev", "localhost:9092");
	store.addEnvironment("prod", "kafka1:9092");
	store.removeEnvironment("dev");

	ASSERT_EQ(store.list().size(), 1u);
	EXPECT_EQ(store.list()[0].name, "prod");
	EXPECT_THROW(store.activeEnvironment(), ConfigError);
	EXPECT_THROW(store.removeEnvironment("dev"), ConfigError);
}

TEST_F(EnvironmentStoreTest, ReadsKafkaPropertiesAndToolSettings)
{
	writeFile(
		"[kfcli]\n"
		"log_directory=/var/log/kfcli\n"
		"log_level=debug\n"
		"poll_interval_ms=250\n"
		"batch_size=500\n"
		"\n"
		"[secure]\n"
		"brokers=kafka1:9093\n"
		"active=true\n"
		"kafka.security.protocol=SASL_SSL\n"
		"kafka.sasl.mechanism=PLAIN\n");

	EnvironmentStore store(path);
	store.load();

	const ToolSettings& tool = store.toolSettings();
	EXPECT_EQ(tool.logDirectory, "/var/log/kfcli");
	EXPECT_EQ(tool.logLevel, LogLevel::Debug);
	EXPECT_EQ(tool.pollIntervalMs, 250);
	EXPECT_EQ(tool.batchSize, 500u);
	EXPECT_EQ(tool.queueCapacity, 1024u);

	const Environment& env = store.activeEnvironment();
	EXPECT_EQ(env.name, "secure");
	ASSERT_EQ(env.settings.size(), 2u);
	EXPECT_EQ(env.settings[0].Key, "security.protocol");
	EXPECT_EQ(env.settings[0].Value, "SASL_SSL");
	EXPECT_EQ(env.settings[1].Key, "sasl.mechanism");
}

TEST_F(EnvironmentStoreTest, KafkaPropertiesSurviveSave)
{
	writeFile(
		"[secure]\n"
		"brokers=kafka1:9093\n"
		"active=true\n"
		"kafka.security.protocol=SASL_SSL\n"
		"[kfcli]\n"
		"request_timeout_ms=3000\n");

	EnvironmentStore store(path);
	store.load();
	store.addEnvironment("dev", "localhost:9092");
	store.save();

	EnvironmentStore reloaded(path);
	reloaded.load();
	ASSERT_EQ(reloaded.environment("secure").settings.size(), 1u);
	EXPECT_EQ(reloaded.environment("secure").settings[0].Key, "security.protocol");
	EXPECT_EQ(reloaded.toolSettings().requestTimeoutMs, 3000);
	EXPECT_EQ(reloaded.activeEnvironment().name, "secure");
}

TEST_F(EnvironmentStoreTest, MalformedFilesAreConfigErrors)
{
	EnvironmentStore store(path);

	writeFile("[dev\nbrokers=a:1\n");
	EXPECT_THROW(store.load(), ConfigError);

	writeFile("brokers=a:1\n[dev]\nbrokers=a:1\n");
	EXPECT_THROW(store.load(), ConfigError);

	writeFile("[dev]\nactive=true\n");
	EXPECT_THROW(store.load(), ConfigError);

	writeFile("[dev]\nbrokers=a:1\ncolour=blue\n");
	EXPECT_THROW(store.load(), ConfigError);

	writeFile("[kfcli]\npoll_interval_ms=0\n");
	EXPECT_THROW(store.load(), ConfigError);

	writeFile("[kfcli]\nlog_level=loud\n");
	EXPECT_THROW(store.load(), ConfigError);
}

TEST_F(EnvironmentStoreTest, SaveCreatesParentDirectories)
{
	std::string nested = (dir / "a" / "b" / "config.ini").string();

	EnvironmentStore store(nested);
	store.addEnvironment("dev", "localhost:9092");
	store.save();

	EXPECT_TRUE(fs::exists(nested));

	EnvironmentStore reloaded(nested);
	reloaded.load();
	EXPECT_EQ(reloaded.activeEnvironment().brokers, "localhost:9092");
}
