#ifndef KFCLI_MESSAGE_SINK_H
#define KFCLI_MESSAGE_SINK_H

#include <optional>
#include <ostream>
#include <string>

#include <boost/json.hpp>

#include "KafkaTypes.h"

// A message that passed the filter; document is set when the payload decoded.
struct TailMatch
{
	ConsumedMessage message;
	std::optional<boost::json::value> document;
};

// Output boundary of a tail. Only ever called from the writer thread, so
// implementations need no locking; a slow write back-pressures the fetchers.
class MessageSink
{
public:
	virtual ~MessageSink() = default;
	virtual void write(const TailMatch& match) = 0;
};

// One line per match: compact JSON when the payload decoded, raw text otherwise.
class StreamSink final : public MessageSink
{
public:
	StreamSink(std::ostream& out, bool showMetadata);

	void write(const TailMatch& match) override;

	static std::string formatLine(const TailMatch& match, bool showMetadata);

private:
	std::ostream& out;
	bool showMetadata;
};

#endif // KFCLI_MESSAGE_SINK_H
