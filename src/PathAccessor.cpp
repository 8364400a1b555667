#include "PathAccessor.h"
#include "errors.h"

const boost::json::value* resolvePath(const boost::json::value& document, const FieldPath& path)
{
	const boost::json::value* current = &document;

	for (const auto& segment : path)
	{
		if (segment.isIndex())
		{
			const boost::json::array* array = current->if_array();
			if (!array)
				return nullptr;
			current = array->if_contains(segment.index);
		}
		else
		{
			const boost::json::object* object = current->if_object();
			if (!object)
				return nullptr;
			current = object->if_contains(segment.key);
		}

		if (!current)
			return nullptr;
	}

	return current;
}

bool tryDecodePayload(const std::string& payload, boost::json::value& document, std::string& errorMsg)
{
	if (payload.empty())
	{
		errorMsg = "empty payload";
		return false;
	}

	boost::json::error_code ec;
	boost::json::value parsed = boost::json::parse(payload, ec);
	if (ec)
	{
		errorMsg = ec.message();
		return false;
	}

	document = std::move(parsed);
	return true;
}

boost::json::value decodePayload(const std::string& payload)
{
	boost::json::value document;
	std::string errorMsg;

	if (!tryDecodePayload(payload, document, errorMsg))
	{
		throw DecodeError(errorMsg);
	}
	return document;
}
