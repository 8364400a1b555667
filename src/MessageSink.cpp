#include "MessageSink.h"
#include "errors.h"
#include "utils.h"

StreamSink::StreamSink(std::ostream& out, bool showMetadata)
	: out(out), showMetadata(showMetadata)
{
}

std::string StreamSink::formatLine(const TailMatch& match, bool showMetadata)
{
	std::string line;

	if (showMetadata)
	{
		const ConsumedMessage& m = match.message;
		line = "[" + std::to_string(m.partition) + ":" + std::to_string(m.offset) + "] "
			+ formatTimestampMs(m.timestamp) + " key=" + (m.key ? *m.key : std::string("-")) + " ";
	}

	if (match.document)
	{
		line += boost::json::serialize(*match.document);
	}
	else
	{
		// keep one message per line
		for (char c : match.message.payload)
			line += (c == '\n' || c == '\r') ? ' ' : c;
	}
	return line;
}

void StreamSink::write(const TailMatch& match)
{
	out << formatLine(match, showMetadata) << '\n';
	out.flush();

	if (!out)
	{
		throw KafkaCliError("output stream closed");
	}
}
