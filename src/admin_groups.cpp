/*
 *  kfcli - Broker Client Consumer Group Methods
 *  Group listing and description, committed offsets
 */

#include "KafkaBrokerClient.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <map>
#include <optional>

namespace {

GroupSummary makeSummary(const rd_kafka_group_info& info)
{
	GroupSummary summary;
	summary.groupId = info.group ? info.group : "";
	summary.state = info.state ? info.state : "";
	summary.protocolType = info.protocol_type ? info.protocol_type : "";
	summary.protocol = info.protocol ? info.protocol : "";
	return summary;
}

// rd_kafka_list_groups with RAII over the returned list
struct GroupListScope
{
	const rd_kafka_group_list* list = nullptr;

	~GroupListScope()
	{
		if (list)
			rd_kafka_group_list_destroy(list);
	}
};

}

//================================== Committed Offsets ==========================================

std::vector<CommittedOffset> KafkaBrokerClient::committedOffsets(const std::string& group)
{
	char errstr[512];
	std::string errorMsg;

	if (!isValidConsumerGroupId(group, errorMsg))
	{
		throw ValidationError(errorMsg);
	}

	AdminClientScope admin(brokers, settings, RD_KAFKA_PRODUCER);
	if (!admin.isValid())
	{
		throw BrokerUnavailableError("committed offsets of " + group, admin.error());
	}

	// no partition list = every partition the group has committed to
	rd_kafka_ListConsumerGroupOffsets_t* grp_offsets = rd_kafka_ListConsumerGroupOffsets_new(group.c_str(), nullptr);
	rd_kafka_ListConsumerGroupOffsets_t* grp_offsets_arr[1] = { grp_offsets };

	rd_kafka_AdminOptions_t* options = rd_kafka_AdminOptions_new(admin.get(), RD_KAFKA_ADMIN_OP_LISTCONSUMERGROUPOFFSETS);
	rd_kafka_AdminOptions_set_request_timeout(options, requestTimeoutMs, errstr, sizeof(errstr));

	rd_kafka_ListConsumerGroupOffsets(admin.get(), grp_offsets_arr, 1, options, admin.queue());

	rd_kafka_AdminOptions_destroy(options);
	rd_kafka_ListConsumerGroupOffsets_destroy(grp_offsets);

	rd_kafka_event_t* rkev = waitAdminResult(admin, "committed offsets");

	std::map<std::string, std::map<int32_t, std::optional<int64_t>>> byTopic;
	std::string failure;

	const rd_kafka_ListConsumerGroupOffsets_result_t* offset_result = rd_kafka_event_ListConsumerGroupOffsets_result(rkev);
	size_t res_cnt = 0;
	const rd_kafka_group_result_t** group_results = offset_result
		? rd_kafka_ListConsumerGroupOffsets_result_groups(offset_result, &res_cnt)
		: nullptr;

	if (res_cnt > 0 && group_results[0])
	{
		const rd_kafka_error_t* gerr = rd_kafka_group_result_error(group_results[0]);
		if (gerr)
		{
			failure = rd_kafka_error_string(gerr);
		}
		else if (const rd_kafka_topic_partition_list_t* parts = rd_kafka_group_result_partitions(group_results[0]))
		{
			for (int i = 0; i < parts->cnt; i++)
			{
				const rd_kafka_topic_partition_t& tp = parts->elems[i];
				std::optional<int64_t> offset;

				if (tp.err != RD_KAFKA_RESP_ERR_NO_ERROR)
				{
					eventLog.warn(EventLog::lagLogName, std::string(tp.topic) + "/" + std::to_string(tp.partition)
						+ ": " + rd_kafka_err2str(tp.err));
				}
				else if (tp.offset >= 0)
				{
					offset = tp.offset;
				}
				byTopic[tp.topic][tp.partition] = offset;
			}
		}
	}
	else
	{
		failure = "empty admin result";
	}
	rd_kafka_event_destroy(rkev);

	if (!failure.empty())
	{
		throw BrokerUnavailableError("committed offsets of " + group, failure);
	}

	// partitions of a consumed topic without a commit are reported as absent
	for (auto& topic : byTopic)
	{
		try
		{
			for (int32_t p : partitionIds(topic.first))
			{
				topic.second.emplace(p, std::nullopt);
			}
		}
		catch (const BrokerUnavailableError& e)
		{
			eventLog.warn(EventLog::lagLogName, e.what());
		}
	}

	std::vector<CommittedOffset> result;
	for (const auto& topic : byTopic)
	{
		for (const auto& part : topic.second)
		{
			result.push_back({ topic.first, part.first, part.second });
		}
	}
	return result;
}

//================================== Group Info ==========================================

std::vector<GroupSummary> KafkaBrokerClient::listGroups()
{
	GroupListScope groups;
	rd_kafka_resp_err_t err = rd_kafka_list_groups(metadataHandle().c_ptr(), nullptr, &groups.list, requestTimeoutMs);
	serveEvents(metadataHandle());
	if (err != RD_KAFKA_RESP_ERR_NO_ERROR)
	{
		throw BrokerUnavailableError("list consumer groups", rd_kafka_err2str(err));
	}

	std::vector<GroupSummary> result;
	for (int i = 0; i < groups.list->group_cnt; i++)
	{
		result.push_back(makeSummary(groups.list->groups[i]));
	}

	std::sort(result.begin(), result.end(), [](const GroupSummary& a, const GroupSummary& b) { return a.groupId < b.groupId; });
	return result;
}

GroupDetails KafkaBrokerClient::describeGroup(const std::string& group)
{
	std::string errorMsg;
	if (!isValidConsumerGroupId(group, errorMsg))
	{
		throw ValidationError(errorMsg);
	}

	GroupListScope groups;
	rd_kafka_resp_err_t err = rd_kafka_list_groups(metadataHandle().c_ptr(), group.c_str(), &groups.list, requestTimeoutMs);
	serveEvents(metadataHandle());
	if (err != RD_KAFKA_RESP_ERR_NO_ERROR)
	{
		throw BrokerUnavailableError("describe group " + group, rd_kafka_err2str(err));
	}

	if (groups.list->group_cnt < 1)
	{
		throw BrokerUnavailableError("describe group " + group, "group not found");
	}

	const rd_kafka_group_info& info = groups.list->groups[0];
	if (info.err != RD_KAFKA_RESP_ERR_NO_ERROR)
	{
		throw BrokerUnavailableError("describe group " + group, rd_kafka_err2str(info.err));
	}

	GroupDetails details;
	details.summary = makeSummary(info);

	for (int m = 0; m < info.member_cnt; m++)
	{
		const rd_kafka_group_member_info& member = info.members[m];

		GroupMember gm;
		gm.memberId = member.member_id ? member.member_id : "";
		gm.clientId = member.client_id ? member.client_id : "";
		gm.clientHost = member.client_host ? member.client_host : "";

		// other protocol types carry opaque assignments
		if (details.summary.protocolType == "consumer"
			&& !decodeConsumerAssignment(member.member_assignment, static_cast<size_t>(member.member_assignment_size), gm.assignment))
		{
			eventLog.warn(EventLog::adminLogName, "group " + group + ": cannot decode assignment of member " + gm.memberId);
			gm.assignment.clear();
		}
		details.members.push_back(std::move(gm));
	}

	std::sort(details.members.begin(), details.members.end(),
		[](const GroupMember& a, const GroupMember& b) { return a.memberId < b.memberId; });
	return details;
}
