#include "MessageFilter.h"
#include "PathAccessor.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

namespace {

struct Number
{
	bool integral = false;
	int64_t i = 0;
	double d = 0.0;
};

// Plain decimal notation only: strtod alone would also take hex, inf and nan.
bool parseNumber(const std::string& text, Number& number)
{
	if (text.empty() || text.find_first_not_of("0123456789+-.eE") != std::string::npos)
		return false;

	char* end = nullptr;
	errno = 0;
	long long asInt = std::strtoll(text.c_str(), &end, 10);
	if (errno == 0 && end != text.c_str() && *end == '\0')
	{
		number.integral = true;
		number.i = asInt;
		number.d = static_cast<double>(asInt);
		return true;
	}

	end = nullptr;
	errno = 0;
	double asDouble = std::strtod(text.c_str(), &end);
	if (errno != 0 || end == text.c_str() || *end != '\0' || !std::isfinite(asDouble))
		return false;

	number.integral = false;
	number.d = asDouble;
	return true;
}

bool numberOf(const boost::json::value& value, Number& number)
{
	switch (value.kind())
	{
	case boost::json::kind::int64:
		number.integral = true;
		number.i = value.get_int64();
		number.d = static_cast<double>(number.i);
		return true;
	case boost::json::kind::uint64:
		if (value.get_uint64() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
		{
			number.integral = true;
			number.i = static_cast<int64_t>(value.get_uint64());
		}
		number.d = static_cast<double>(value.get_uint64());
		return true;
	case boost::json::kind::double_:
		number.integral = false;
		number.d = value.get_double();
		return true;
	case boost::json::kind::string:
	{
		const boost::json::string& s = value.get_string();
		return parseNumber(std::string(s.data(), s.size()), number);
	}
	default:
		return false;
	}
}

// text form used for non-numeric comparison; strings lose their quotes
std::string textOf(const boost::json::value& value)
{
	if (value.is_string())
	{
		const boost::json::string& s = value.get_string();
		return std::string(s.data(), s.size());
	}
	return boost::json::serialize(value);
}

// -1, 0, 1
int compareNumbers(const Number& a, const Number& b)
{
	if (a.integral && b.integral)
		return a.i < b.i ? -1 : (a.i > b.i ? 1 : 0);
	return a.d < b.d ? -1 : (a.d > b.d ? 1 : 0);
}

bool applyOperator(CompareOp op, int order)
{
	switch (op)
	{
	case CompareOp::Equal: return order == 0;
	case CompareOp::NotEqual: return order != 0;
	case CompareOp::Less: return order < 0;
	case CompareOp::LessEqual: return order <= 0;
	case CompareOp::Greater: return order > 0;
	case CompareOp::GreaterEqual: return order >= 0;
	}
	return false;
}

}

bool evaluateFilter(const FilterExpression& expression, const boost::json::value& document)
{
	const boost::json::value* value = resolvePath(document, expression.path);
	if (!value)
		return false;

	Number actual;
	Number expected;
	if (numberOf(*value, actual) && parseNumber(expression.literal, expected))
	{
		return applyOperator(expression.op, compareNumbers(actual, expected));
	}

	int order = textOf(*value).compare(expression.literal);
	return applyOperator(expression.op, order < 0 ? -1 : (order > 0 ? 1 : 0));
}

bool evaluateFilter(const FilterExpression& expression, const ConsumedMessage& message)
{
	boost::json::value document;
	std::string errorMsg;

	if (!tryDecodePayload(message.payload, document, errorMsg))
		return false;

	return evaluateFilter(expression, document);
}

MessageFilter::MessageFilter(std::optional<FilterExpression> expression)
	: expr(std::move(expression))
{
}

bool MessageFilter::matches(const boost::json::value* document) const
{
	if (!expr)
		return true;
	if (!document)
		return false;
	return evaluateFilter(*expr, *document);
}
