#ifndef KFCLI_PATH_ACCESSOR_H
#define KFCLI_PATH_ACCESSOR_H

#include <string>

#include <boost/json.hpp>

#include "FilterExpression.h"

// Walks the document along the path. Returns nullptr when a key is missing,
// an index is out of bounds, or a segment does not fit the node it is applied
// to (key on a sequence, index on a map, anything on a scalar).
const boost::json::value* resolvePath(const boost::json::value& document, const FieldPath& path);

// Parses a message payload as JSON. Throws DecodeError.
boost::json::value decodePayload(const std::string& payload);

// Non-throwing variant for the per-message hot path.
bool tryDecodePayload(const std::string& payload, boost::json::value& document, std::string& errorMsg);

#endif // KFCLI_PATH_ACCESSOR_H
