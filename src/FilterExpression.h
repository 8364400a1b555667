#ifndef KFCLI_FILTER_EXPRESSION_H
#define KFCLI_FILTER_EXPRESSION_H

#include <cstddef>
#include <string>
#include <vector>

// One step of a field path: a map key or a sequence index.
struct PathSegment
{
	enum class Kind
	{
		Key,
		Index
	};

	Kind kind = Kind::Key;
	std::string key;
	size_t index = 0;

	static PathSegment makeKey(const std::string& name);
	static PathSegment makeIndex(size_t position);

	bool isIndex() const { return kind == Kind::Index; }

	bool operator==(const PathSegment& other) const
	{
		return kind == other.kind && key == other.key && index == other.index;
	}
	bool operator!=(const PathSegment& other) const { return !(*this == other); }
};

using FieldPath = std::vector<PathSegment>;

enum class CompareOp
{
	Equal,
	NotEqual,
	Less,
	LessEqual,
	Greater,
	GreaterEqual
};

const char* compareOpSymbol(CompareOp op);

// path <op> literal, built once per tail invocation and never modified.
// The literal keeps its text form; numeric coercion happens at evaluation.
struct FilterExpression
{
	FieldPath path;
	CompareOp op = CompareOp::Equal;
	std::string literal;
	bool quoted = false;

	std::string toString() const;
};

// Parses "data.attributes.name=19", "items[2].id != 'x'" and similar.
// Throws FilterSyntaxError naming the malformed token.
FilterExpression parseFilterExpression(const std::string& text);

// Parses a bare path ("a.b[3].c"). Throws FilterSyntaxError.
FieldPath parseFieldPath(const std::string& text);

// Dotted/indexed form of a path; inverse of parseFieldPath.
std::string formatFieldPath(const FieldPath& path);

#endif // KFCLI_FILTER_EXPRESSION_H
