/*
 *  kfcli - Broker Client Admin Topic Methods
 *  Topic management: create, delete
 */

#include "KafkaBrokerClient.h"
#include "errors.h"
#include "utils.h"

//================================== AdminClientScope =========================================

KafkaBrokerClient::AdminClientScope::AdminClientScope(const std::string& brokers,
                                                      const std::vector<KafkaSettings>& settings,
                                                      rd_kafka_type_t type)
{
	char errstr[512];

	rd_kafka_conf_t* conf = rd_kafka_conf_new();

	for (const auto& setting : settings)
	{
		if (rd_kafka_conf_set(conf, setting.Key.c_str(), setting.Value.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK)
		{
			errstr_msg = setting.Key + ": " + errstr;
			rd_kafka_conf_destroy(conf);
			return;
		}
	}

	if (rd_kafka_conf_set(conf, "bootstrap.servers", brokers.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK)
	{
		errstr_msg = errstr;
		rd_kafka_conf_destroy(conf);
		return;
	}

	// rd_kafka_new takes ownership of conf on success only
	rk = rd_kafka_new(type, conf, errstr, sizeof(errstr));
	if (!rk)
	{
		errstr_msg = std::string("cannot create admin client: ") + errstr;
		rd_kafka_conf_destroy(conf);
		return;
	}

	rkqu = rd_kafka_queue_new(rk);
}

KafkaBrokerClient::AdminClientScope::~AdminClientScope()
{
	if (rkqu)
	{
		rd_kafka_queue_destroy(rkqu);
	}
	if (rk)
	{
		rd_kafka_destroy(rk);
	}
}

// Waits for the single result event of an admin request. The caller owns
// the returned event.
rd_kafka_event_t* KafkaBrokerClient::waitAdminResult(AdminClientScope& admin, const char* context)
{
	rd_kafka_event_t* rkev = rd_kafka_queue_poll(admin.queue(), requestTimeoutMs + 2000);
	if (!rkev)
	{
		throw BrokerUnavailableError(context, "timed out waiting for the broker response");
	}

	if (rd_kafka_event_error(rkev))
	{
		std::string cause = rd_kafka_event_error_string(rkev);
		rd_kafka_event_destroy(rkev);
		throw BrokerUnavailableError(context, cause);
	}
	return rkev;
}

//================================== Topic Create/Delete =========================================

void KafkaBrokerClient::createTopic(const std::string& topic, int32_t partitions, int32_t replicationFactor)
{
	char errstr[512];
	std::string errorMsg;

	if (!isValidTopicName(topic, errorMsg) || !isValidPartitionCount(partitions, errorMsg)
		|| !isValidReplicationFactor(replicationFactor, errorMsg))
	{
		throw ValidationError(errorMsg);
	}

	AdminClientScope admin(brokers, settings, RD_KAFKA_PRODUCER);
	if (!admin.isValid())
	{
		throw BrokerUnavailableError("create topic " + topic, admin.error());
	}

	rd_kafka_NewTopic_t* newt = rd_kafka_NewTopic_new(topic.c_str(), partitions, replicationFactor, errstr, sizeof(errstr));
	if (!newt)
	{
		throw ValidationError("create topic " + topic + ": " + errstr);
	}

	rd_kafka_AdminOptions_t* options = rd_kafka_AdminOptions_new(admin.get(), RD_KAFKA_ADMIN_OP_CREATETOPICS);
	rd_kafka_AdminOptions_set_operation_timeout(options, requestTimeoutMs, errstr, sizeof(errstr));

	rd_kafka_NewTopic_t* newt_arr[1] = { newt };
	rd_kafka_CreateTopics(admin.get(), newt_arr, 1, options, admin.queue());

	rd_kafka_AdminOptions_destroy(options);
	rd_kafka_NewTopic_destroy(newt);

	rd_kafka_event_t* rkev = waitAdminResult(admin, "create topic");

	std::string failure;
	const rd_kafka_CreateTopics_result_t* res = rd_kafka_event_CreateTopics_result(rkev);
	if (res)
	{
		size_t res_cnt = 0;
		const rd_kafka_topic_result_t** terr = rd_kafka_CreateTopics_result_topics(res, &res_cnt);

		if (res_cnt > 0 && terr[0] && rd_kafka_topic_result_error(terr[0]) != RD_KAFKA_RESP_ERR_NO_ERROR)
		{
			failure = rd_kafka_topic_result_error_string(terr[0]);
		}
	}
	else
	{
		failure = "unexpected admin result";
	}
	rd_kafka_event_destroy(rkev);

	if (!failure.empty())
	{
		throw BrokerUnavailableError("create topic " + topic, failure);
	}

	eventLog.info(EventLog::adminLogName, "topic " + topic + " created, partitions=" + std::to_string(partitions)
		+ " replication=" + std::to_string(replicationFactor));
}

void KafkaBrokerClient::deleteTopic(const std::string& topic)
{
	char errstr[512];
	std::string errorMsg;

	if (!isValidTopicName(topic, errorMsg))
	{
		throw ValidationError(errorMsg);
	}

	AdminClientScope admin(brokers, settings, RD_KAFKA_PRODUCER);
	if (!admin.isValid())
	{
		throw BrokerUnavailableError("delete topic " + topic, admin.error());
	}

	rd_kafka_DeleteTopic_t* delt = rd_kafka_DeleteTopic_new(topic.c_str());

	rd_kafka_AdminOptions_t* options = rd_kafka_AdminOptions_new(admin.get(), RD_KAFKA_ADMIN_OP_DELETETOPICS);
	rd_kafka_AdminOptions_set_operation_timeout(options, requestTimeoutMs, errstr, sizeof(errstr));

	rd_kafka_DeleteTopic_t* delt_arr[1] = { delt };
	rd_kafka_DeleteTopics(admin.get(), delt_arr, 1, options, admin.queue());

	rd_kafka_AdminOptions_destroy(options);
	rd_kafka_DeleteTopic_destroy(delt);

	rd_kafka_event_t* rkev = waitAdminResult(admin, "delete topic");

	std::string failure;
	const rd_kafka_DeleteTopics_result_t* res = rd_kafka_event_DeleteTopics_result(rkev);
	if (res)
	{
		size_t res_cnt = 0;
		const rd_kafka_topic_result_t** terr = rd_kafka_DeleteTopics_result_topics(res, &res_cnt);

		if (res_cnt > 0 && terr[0] && rd_kafka_topic_result_error(terr[0]) != RD_KAFKA_RESP_ERR_NO_ERROR)
		{
			failure = rd_kafka_topic_result_error_string(terr[0]);
		}
	}
	else
	{
		failure = "unexpected admin result";
	}
	rd_kafka_event_destroy(rkev);

	if (!failure.empty())
	{
		throw BrokerUnavailableError("delete topic " + topic, failure);
	}

	eventLog.info(EventLog::adminLogName, "topic " + topic + " deleted");
}
