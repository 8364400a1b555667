#ifndef KFCLI_MESSAGE_FILTER_H
#define KFCLI_MESSAGE_FILTER_H

#include <optional>

#include <boost/json.hpp>

#include "FilterExpression.h"
#include "KafkaTypes.h"

// Decides match/no-match of a single decoded document.
// Unresolved path => no match. When both the value and the literal read as
// numbers they compare numerically, otherwise as text, so "name=19" matches
// both 19 and "19".
bool evaluateFilter(const FilterExpression& expression, const boost::json::value& document);

// Same for a raw message; a payload that does not decode never matches.
bool evaluateFilter(const FilterExpression& expression, const ConsumedMessage& message);

// Filter gate of a tail. Without an expression every message passes.
// Holds no mutable state and can be shared by all partition fetchers.
class MessageFilter
{
public:
	MessageFilter() = default;
	explicit MessageFilter(std::optional<FilterExpression> expression);

	bool passThrough() const { return !expr.has_value(); }
	const std::optional<FilterExpression>& expression() const { return expr; }

	// document is nullptr when the payload did not decode
	bool matches(const boost::json::value* document) const;

private:
	std::optional<FilterExpression> expr;
};

#endif // KFCLI_MESSAGE_FILTER_H
