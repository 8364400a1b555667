/*
 *  kfcli - Consumer group commands
 */

#include "KafkaCli.h"
#include "LagAggregator.h"
#include "Reports.h"

bool KafkaCli::listGroups(bool json)
{
	return runCommand("consumer --list", [&]() {
		std::vector<GroupSummary> groups = client().listGroups();

		if (json)
			writeJson(out, groupsToJson(groups));
		else
			printGroups(out, groups);
	});
}

bool KafkaCli::describeGroup(const std::string& group, bool pending, bool json)
{
	return runCommand("consumer --consumer", [&]() {
		GroupDetails details = client().describeGroup(group);

		std::optional<LagReport> report;
		if (pending)
		{
			LagAggregator aggregator(client(), eventLog);
			report = aggregator.aggregate(group);
		}

		if (json)
		{
			boost::property_tree::ptree jsonObj = groupDetailsToJson(details);
			if (report)
			{
				jsonObj.put_child("lag", lagReportToJson(*report));
			}
			writeJson(out, jsonObj);
			return;
		}

		printGroupDetails(out, details);
		if (report)
		{
			out << '\n';
			printLagReport(out, *report);
		}
	});
}
