/*
 *  kfcli - Command output: text tables and JSON documents
 */

#include "Reports.h"

#include <boost/property_tree/json_parser.hpp>

#include <algorithm>

namespace pt = boost::property_tree;

namespace {

std::string joinIds(const std::vector<int32_t>& ids)
{
	std::string text;
	for (size_t i = 0; i < ids.size(); i++)
	{
		if (i) text += ",";
		text += std::to_string(ids[i]);
	}
	return text;
}

pt::ptree idArray(const std::vector<int32_t>& ids)
{
	pt::ptree children;
	for (int32_t id : ids)
	{
		pt::ptree node;
		node.put("", id);
		children.push_back(pt::ptree::value_type("", node));
	}
	return children;
}

std::string optionalText(const std::optional<int64_t>& value)
{
	return value ? std::to_string(*value) : std::string("-");
}

std::string assignmentText(const std::vector<TopicAssignment>& assignment)
{
	std::string text;
	for (const auto& a : assignment)
	{
		if (!text.empty()) text += " ";
		text += a.topic + ":" + joinIds(a.partitions);
	}
	return text.empty() ? std::string("-") : text;
}

}

//================================== TextTable ==========================================

TextTable::TextTable(std::vector<std::string> header)
{
	rows.push_back(std::move(header));
}

void TextTable::addRow(std::vector<std::string> row)
{
	row.resize(rows.front().size());
	rows.push_back(std::move(row));
}

void TextTable::print(std::ostream& out) const
{
	std::vector<size_t> widths(rows.front().size(), 0);
	for (const auto& row : rows)
	{
		for (size_t c = 0; c < row.size(); c++)
			widths[c] = std::max(widths[c], row[c].size());
	}

	for (const auto& row : rows)
	{
		std::string line;
		for (size_t c = 0; c < row.size(); c++)
		{
			line += row[c];
			if (c + 1 < row.size())
				line += std::string(widths[c] - row[c].size() + 2, ' ');
		}
		out << line << '\n';
	}
}

void writeJson(std::ostream& out, const pt::ptree& jsonObj)
{
	pt::write_json(out, jsonObj, true);
}

//================================== Environments ==========================================

void printEnvironments(std::ostream& out, const std::vector<Environment>& environments)
{
	TextTable table({ "", "ENVIRONMENT", "BROKERS" });
	for (const auto& env : environments)
	{
		table.addRow({ env.active ? "*" : "", env.name, env.brokers });
	}
	table.print(out);
}

//================================== Topics ==========================================

void printTopics(std::ostream& out, const std::vector<TopicSummary>& topics)
{
	TextTable table({ "TOPIC", "PARTITIONS" });
	for (const auto& t : topics)
	{
		table.addRow({ t.name, std::to_string(t.partitionCount) });
	}
	table.print(out);
}

pt::ptree topicsToJson(const std::vector<TopicSummary>& topics)
{
	pt::ptree jsonObj;
	pt::ptree topicsChildren;

	for (const auto& t : topics)
	{
		pt::ptree node;
		node.put("topic", t.name);
		node.put("partitions", t.partitionCount);
		topicsChildren.push_back(pt::ptree::value_type("", node));
	}

	jsonObj.put("topics_count", topics.size());
	jsonObj.put_child("topics", topicsChildren);
	return jsonObj;
}

void printTopicDetails(std::ostream& out, const TopicDetails& details)
{
	TextTable overall({ "TOPIC", "PARTITIONS", "TOTAL MESSAGES" });
	overall.addRow({ details.name, std::to_string(details.partitions.size()), std::to_string(details.totalMessages()) });
	overall.print(out);
	out << '\n';

	TextTable table({ "PARTITION", "LEADER", "REPLICAS", "ISR", "LOW", "HIGH", "MESSAGES", "ERROR" });
	for (const auto& p : details.partitions)
	{
		std::string low = "-", high = "-", count = "-";
		if (p.watermarks)
		{
			low = std::to_string(p.watermarks->low);
			high = std::to_string(p.watermarks->high);
			count = std::to_string(p.watermarks->high - p.watermarks->low);
		}
		table.addRow({ std::to_string(p.id), std::to_string(p.leader), joinIds(p.replicas), joinIds(p.isrs),
			low, high, count, p.error });
	}
	table.print(out);
}

pt::ptree topicDetailsToJson(const TopicDetails& details)
{
	pt::ptree jsonObj;
	pt::ptree partitionsChildren;

	jsonObj.put("topic", details.name);
	jsonObj.put("partitions_count", details.partitions.size());
	jsonObj.put("total_messages", details.totalMessages());

	for (const auto& p : details.partitions)
	{
		pt::ptree partNode;
		partNode.put("id", p.id);
		partNode.put("leader", p.leader);
		partNode.put_child("replicas", idArray(p.replicas));
		partNode.put_child("isrs", idArray(p.isrs));

		if (p.watermarks)
		{
			partNode.put("low_watermark", p.watermarks->low);
			partNode.put("high_watermark", p.watermarks->high);
			partNode.put("message_count", p.watermarks->high - p.watermarks->low);
		}
		if (!p.error.empty())
		{
			partNode.put("error", p.error);
		}
		partitionsChildren.push_back(pt::ptree::value_type("", partNode));
	}

	jsonObj.put_child("partitions", partitionsChildren);
	return jsonObj;
}

//================================== Brokers ==========================================

void printBrokers(std::ostream& out, const std::vector<BrokerInfo>& brokers)
{
	TextTable table({ "BROKER ID", "HOST", "PORT", "" });
	for (const auto& b : brokers)
	{
		table.addRow({ std::to_string(b.id), b.host, std::to_string(b.port), b.controller ? "controller" : "" });
	}
	table.print(out);
}

pt::ptree brokersToJson(const std::vector<BrokerInfo>& brokers)
{
	pt::ptree jsonObj;
	pt::ptree brokersChildren;

	for (const auto& b : brokers)
	{
		pt::ptree brokerInfo;
		brokerInfo.put("id", b.id);
		brokerInfo.put("host", b.host);
		brokerInfo.put("port", b.port);
		brokerInfo.put("controller", b.controller);
		brokersChildren.push_back(pt::ptree::value_type("", brokerInfo));
	}

	jsonObj.put("brokers_count", brokers.size());
	jsonObj.put_child("brokers", brokersChildren);
	return jsonObj;
}

//================================== Consumer Groups ==========================================

void printGroups(std::ostream& out, const std::vector<GroupSummary>& groups)
{
	TextTable table({ "GROUP ID", "STATE", "PROTOCOL TYPE", "PROTOCOL" });
	for (const auto& g : groups)
	{
		table.addRow({ g.groupId, g.state, g.protocolType, g.protocol });
	}
	table.print(out);
}

pt::ptree groupsToJson(const std::vector<GroupSummary>& groups)
{
	pt::ptree jsonObj;
	pt::ptree groupsChildren;

	for (const auto& g : groups)
	{
		pt::ptree groupNode;
		groupNode.put("group_id", g.groupId);
		groupNode.put("state", g.state);
		groupNode.put("protocol_type", g.protocolType);
		groupNode.put("protocol", g.protocol);
		groupsChildren.push_back(pt::ptree::value_type("", groupNode));
	}

	jsonObj.put("groups_count", groups.size());
	jsonObj.put_child("consumer_groups", groupsChildren);
	return jsonObj;
}

void printGroupDetails(std::ostream& out, const GroupDetails& details)
{
	printGroups(out, { details.summary });
	out << '\n';

	TextTable members({ "MEMBER ID", "CLIENT ID", "HOST", "ASSIGNMENT" });
	for (const auto& m : details.members)
	{
		members.addRow({ m.memberId, m.clientId, m.clientHost, assignmentText(m.assignment) });
	}
	members.print(out);
}

pt::ptree groupDetailsToJson(const GroupDetails& details)
{
	pt::ptree jsonObj;
	pt::ptree membersChildren;

	jsonObj.put("group_id", details.summary.groupId);
	jsonObj.put("state", details.summary.state);
	jsonObj.put("protocol_type", details.summary.protocolType);
	jsonObj.put("protocol", details.summary.protocol);

	for (const auto& m : details.members)
	{
		pt::ptree memberNode;
		memberNode.put("member_id", m.memberId);
		memberNode.put("client_id", m.clientId);
		memberNode.put("client_host", m.clientHost);

		pt::ptree assignmentChildren;
		for (const auto& a : m.assignment)
		{
			pt::ptree node;
			node.put("topic", a.topic);
			node.put_child("partitions", idArray(a.partitions));
			assignmentChildren.push_back(pt::ptree::value_type("", node));
		}
		memberNode.put_child("assignment", assignmentChildren);
		membersChildren.push_back(pt::ptree::value_type("", memberNode));
	}

	jsonObj.put_child("members", membersChildren);
	return jsonObj;
}

//================================== Lag ==========================================

std::string lagTotalLine(const LagReport& report)
{
	std::string line = "total lag: " + report.totalText();
	if (report.totalIsLowerBound())
	{
		line += " (lower bound, " + std::to_string(report.unknownCount) + " partition(s) unknown)";
	}
	return line;
}

void printLagReport(std::ostream& out, const LagReport& report)
{
	TextTable table({ "TOPIC", "PARTITION", "END", "COMMITTED", "LAG" });
	for (const auto& e : report.entries)
	{
		table.addRow({ e.topic, std::to_string(e.partition), optionalText(e.endOffset),
			optionalText(e.committedOffset), e.lag ? std::to_string(*e.lag) : std::string("unknown") });
	}
	table.print(out);
	out << lagTotalLine(report) << '\n';
}

pt::ptree lagReportToJson(const LagReport& report)
{
	pt::ptree jsonObj;
	pt::ptree partitionsChildren;

	jsonObj.put("consumer_group", report.group);

	for (const auto& e : report.entries)
	{
		pt::ptree partNode;
		partNode.put("topic", e.topic);
		partNode.put("partition", e.partition);
		partNode.put("end_offset", e.endOffset ? std::to_string(*e.endOffset) : std::string("unknown"));
		partNode.put("committed_offset", e.committedOffset ? std::to_string(*e.committedOffset) : std::string("none"));
		partNode.put("lag", e.lag ? std::to_string(*e.lag) : std::string("unknown"));
		partitionsChildren.push_back(pt::ptree::value_type("", partNode));
	}

	jsonObj.put("total_lag", report.totalLag);
	jsonObj.put("total_is_lower_bound", report.totalIsLowerBound());
	jsonObj.put("unknown_partitions", report.unknownCount);
	jsonObj.put_child("partitions", partitionsChildren);
	return jsonObj;
}
