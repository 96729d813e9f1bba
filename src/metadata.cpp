/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "metadata.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <utility>

auto metadata_value(std::string_view json, std::string_view key) noexcept
	-> MetadataValueResult
{
	using namespace google::protobuf;
	Struct root;
	if(!util::JsonStringToMessage(std::string(json), &root).ok())
		return {RoflError::INVALID_BUFFER, {}};
	auto const& fields = root.fields();
	auto const it = fields.find(std::string(key));
	if(it == fields.end())
		return {RoflError::NO_DATA, {}};
	if(it->second.kind_case() == Value::kStringValue)
		return {RoflError::NONE, it->second.string_value()};
	std::string out;
	if(!util::MessageToJsonString(it->second, &out).ok())
		return {RoflError::INVALID_BUFFER, {}};
	return {RoflError::NONE, std::move(out)};
}
