#ifndef KFCLI_REPORTS_H
#define KFCLI_REPORTS_H

#include <ostream>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include "EnvironmentStore.h"
#include "KafkaTypes.h"
#include "LagAggregator.h"

// Left aligned plain text table; the first row is the header.
class TextTable
{
public:
	explicit TextTable(std::vector<std::string> header);

	void addRow(std::vector<std::string> row);
	void print(std::ostream& out) const;

	size_t rowCount() const { return rows.size() - 1; }

private:
	std::vector<std::vector<std::string>> rows;
};

// Command output. The table form goes to the terminal, the ptree form is
// written with write_json for --json.
void printEnvironments(std::ostream& out, const std::vector<Environment>& environments);

void printTopics(std::ostream& out, const std::vector<TopicSummary>& topics);
boost::property_tree::ptree topicsToJson(const std::vector<TopicSummary>& topics);

void printTopicDetails(std::ostream& out, const TopicDetails& details);
boost::property_tree::ptree topicDetailsToJson(const TopicDetails& details);

void printBrokers(std::ostream& out, const std::vector<BrokerInfo>& brokers);
boost::property_tree::ptree brokersToJson(const std::vector<BrokerInfo>& brokers);

void printGroups(std::ostream& out, const std::vector<GroupSummary>& groups);
boost::property_tree::ptree groupsToJson(const std::vector<GroupSummary>& groups);

void printGroupDetails(std::ostream& out, const GroupDetails& details);
boost::property_tree::ptree groupDetailsToJson(const GroupDetails& details);

void printLagReport(std::ostream& out, const LagReport& report);
boost::property_tree::ptree lagReportToJson(const LagReport& report);

// "total lag: N" or "total lag: >=N (lower bound, K partition(s) unknown)"
std::string lagTotalLine(const LagReport& report);

void writeJson(std::ostream& out, const boost::property_tree::ptree& jsonObj);

#endif // KFCLI_REPORTS_H
