/*
 *  kfcli - Filter Expression Parser
 *  expression := path op literal
 *  path       := segment ("." segment)*
 *  segment    := identifier ("[" integer "]")*
 *  literal    := quoted-string | bare-token
 */

#include "FilterExpression.h"
#include "errors.h"

#include <cctype>
#include <cstring>

PathSegment PathSegment::makeKey(const std::string& name)
{
	PathSegment segment;
	segment.kind = Kind::Key;
	segment.key = name;
	return segment;
}

PathSegment PathSegment::makeIndex(size_t position)
{
	PathSegment segment;
	segment.kind = Kind::Index;
	segment.index = position;
	return segment;
}

const char* compareOpSymbol(CompareOp op)
{
	switch (op)
	{
	case CompareOp::Equal: return "=";
	case CompareOp::NotEqual: return "!=";
	case CompareOp::Less: return "<";
	case CompareOp::LessEqual: return "<=";
	case CompareOp::Greater: return ">";
	case CompareOp::GreaterEqual: return ">=";
	}
	return "?";
}

std::string formatFieldPath(const FieldPath& path)
{
	std::string result;

	for (const auto& segment : path)
	{
		if (segment.isIndex())
		{
			result += "[" + std::to_string(segment.index) + "]";
		}
		else
		{
			if (!result.empty())
				result += '.';
			result += segment.key;
		}
	}
	return result;
}

std::string FilterExpression::toString() const
{
	std::string text = formatFieldPath(path) + compareOpSymbol(op);

	if (!quoted)
		return text + literal;

	text += '"';
	for (char c : literal)
	{
		if (c == '"' || c == '\\')
			text += '\\';
		text += c;
	}
	return text + '"';
}

//================================== Parser ==========================================

namespace {

constexpr size_t maxIndexDigits = 18;

bool isOperatorChar(char c)
{
	return c == '=' || c == '!' || c == '<' || c == '>';
}

bool isIdentifierChar(char c)
{
	return !std::isspace(static_cast<unsigned char>(c)) && !isOperatorChar(c)
		&& std::strchr(".[]\"'", c) == nullptr;
}

class FilterParser
{
public:
	explicit FilterParser(const std::string& text) : input(text), pos(0) {}

	FilterExpression parseExpression()
	{
		FilterExpression expression;

		skipWhitespace();
		if (atEnd())
			fail("empty filter expression", "");

		expression.path = parsePath();

		skipWhitespace();
		expression.op = parseOperator();

		skipWhitespace();
		parseLiteral(expression);

		return expression;
	}

	FieldPath parsePathOnly()
	{
		skipWhitespace();
		FieldPath path = parsePath();
		skipWhitespace();
		if (!atEnd())
			fail("unexpected input after path", input.substr(pos, 1));
		return path;
	}

private:
	FieldPath parsePath()
	{
		FieldPath path;

		for (;;)
		{
			parseSegment(path);

			if (atEnd() || peek() != '.')
				break;
			advance();
		}
		return path;
	}

	void parseSegment(FieldPath& path)
	{
		size_t start = pos;
		while (!atEnd() && isIdentifierChar(peek()))
			advance();

		if (pos == start)
		{
			if (path.empty() && (atEnd() || isOperatorChar(peek())))
				fail("empty field path", atEnd() ? "" : std::string(1, peek()));
			fail("expected field name", atEnd() ? "" : std::string(1, peek()));
		}

		path.push_back(PathSegment::makeKey(input.substr(start, pos - start)));

		while (!atEnd() && peek() == '[')
		{
			size_t bracket = pos;
			advance();

			size_t digitsStart = pos;
			while (!atEnd() && std::isdigit(static_cast<unsigned char>(peek())))
				advance();

			std::string digits = input.substr(digitsStart, pos - digitsStart);
			if (digits.empty())
				failAt(bracket, "expected array index", input.substr(bracket, pos - bracket + 1));
			if (digits.size() > maxIndexDigits)
				failAt(digitsStart, "array index out of range", digits);
			if (atEnd() || peek() != ']')
				failAt(bracket, "unterminated array index", input.substr(bracket, pos - bracket));
			advance();

			path.push_back(PathSegment::makeIndex(static_cast<size_t>(std::stoull(digits))));
		}
	}

	CompareOp parseOperator()
	{
		if (atEnd())
			fail("missing operator", "");

		char c = peek();
		if (!isOperatorChar(c))
			fail("expected operator", tokenAt(pos));

		advance();
		bool followedByEquals = !atEnd() && peek() == '=';

		switch (c)
		{
		case '=':
			if (followedByEquals) advance();	// "==" reads as "="
			return CompareOp::Equal;
		case '!':
			if (!followedByEquals)
				failAt(pos - 1, "expected '!='", "!");
			advance();
			return CompareOp::NotEqual;
		case '<':
			if (followedByEquals)
			{
				advance();
				return CompareOp::LessEqual;
			}
			return CompareOp::Less;
		default:
			if (followedByEquals)
			{
				advance();
				return CompareOp::GreaterEqual;
			}
			return CompareOp::Greater;
		}
	}

	void parseLiteral(FilterExpression& expression)
	{
		if (atEnd())
			fail("empty literal", "");

		char quote = peek();
		if (quote == '"' || quote == '\'')
		{
			size_t open = pos;
			advance();

			std::string value;
			bool closed = false;
			while (!atEnd())
			{
				char c = advance();
				if (c == '\\' && !atEnd())
				{
					char next = advance();
					if (next != quote && next != '\\')
						value += '\\';
					value += next;
				}
				else if (c == quote)
				{
					closed = true;
					break;
				}
				else
				{
					value += c;
				}
			}

			if (!closed)
				failAt(open, "unterminated quoted literal", input.substr(open));
			if (value.empty())
				failAt(open, "empty literal", input.substr(open, pos - open));

			skipWhitespace();
			if (!atEnd())
				fail("unexpected input after literal", input.substr(pos));

			expression.literal = value;
			expression.quoted = true;
			return;
		}

		size_t start = pos;
		size_t end = input.size();
		while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])))
			end--;

		std::string value = input.substr(start, end - start);
		size_t stray = value.find('=');
		if (stray != std::string::npos)
			failAt(start + stray, "second operator in expression, quote the literal", value);

		expression.literal = value;
		expression.quoted = false;
	}

	std::string tokenAt(size_t at) const
	{
		size_t end = at;
		while (end < input.size() && !std::isspace(static_cast<unsigned char>(input[end])))
			end++;
		return input.substr(at, end - at);
	}

	[[noreturn]] void fail(const std::string& message, const std::string& token) const
	{
		failAt(pos, message, token);
	}

	[[noreturn]] void failAt(size_t at, const std::string& message, const std::string& token) const
	{
		throw FilterSyntaxError(message, token, at);
	}

	bool atEnd() const { return pos >= input.size(); }
	char peek() const { return input[pos]; }
	char advance() { return input[pos++]; }

	void skipWhitespace()
	{
		while (!atEnd() && std::isspace(static_cast<unsigned char>(peek())))
			pos++;
	}

	const std::string& input;
	size_t pos;
};

}

FilterExpression parseFilterExpression(const std::string& text)
{
	FilterParser parser(text);
	return parser.parseExpression();
}

FieldPath parseFieldPath(const std::string& text)
{
	FilterParser parser(text);
	return parser.parsePathOnly();
}
