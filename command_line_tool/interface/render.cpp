// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "commands/render.hpp"
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <sstream>

namespace TzBucket::cmd::interface
{

using Allocator = rapidjson::Document::AllocatorType;

static rapidjson::Value make_string(const std::string &text, Allocator &allocator)
{
	rapidjson::Value value;
	value.SetString(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), allocator);
	return value;
}

static rapidjson::Value make_bucket(const core::Bucket &bucket, Allocator &allocator)
{
	rapidjson::Value obj;
	obj.SetObject();
	obj.AddMember("key", make_string(bucket.key, allocator), allocator);
	obj.AddMember("start_local", make_string(bucket.start_local, allocator), allocator);
	obj.AddMember("end_local", make_string(bucket.end_local, allocator), allocator);
	obj.AddMember("start_utc", make_string(bucket.start_utc, allocator), allocator);
	obj.AddMember("end_utc", make_string(bucket.end_utc, allocator), allocator);
	return obj;
}

static std::string compact(const rapidjson::Document &doc)
{
	rapidjson::StringBuffer buffer;
	rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
	doc.Accept(writer);
	return buffer.GetString();
}

static std::string pretty(const rapidjson::Document &doc)
{
	rapidjson::StringBuffer buffer;
	rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
	doc.Accept(writer);
	return buffer.GetString();
}

std::string to_json_line(const core::BucketResult &result)
{
	rapidjson::Document doc;
	doc.SetObject();
	auto &allocator = doc.GetAllocator();

	rapidjson::Value input;
	input.SetObject();
	input.AddMember("ts", make_string(result.input.ts, allocator), allocator);
	input.AddMember("epoch_ms", rapidjson::Value(static_cast<int64_t>(result.input.epoch_ms)),
					allocator);

	doc.AddMember("input", input, allocator);
	doc.AddMember("tz", make_string(result.tz, allocator), allocator);
	doc.AddMember("interval", make_string(core::toString(result.interval), allocator), allocator);
	doc.AddMember("bucket", make_bucket(result.bucket, allocator), allocator);
	return compact(doc);
}

std::string to_json(const std::vector<core::Bucket> &buckets)
{
	rapidjson::Document doc;
	doc.SetArray();
	auto &allocator = doc.GetAllocator();
	for (const auto &bucket : buckets)
		doc.PushBack(make_bucket(bucket, allocator), allocator);
	return pretty(doc);
}

std::string to_json(const core::ExplainResult &result)
{
	rapidjson::Document doc;
	doc.SetObject();
	auto &allocator = doc.GetAllocator();

	doc.AddMember("local_time", make_string(result.local_time, allocator), allocator);
	doc.AddMember("tz", make_string(result.tz, allocator), allocator);
	doc.AddMember("status", make_string(core::toString(result.status), allocator), allocator);
	if (result.resolution) {
		rapidjson::Value resolution;
		resolution.SetObject();
		resolution.AddMember("policy", make_string(result.resolution->policy, allocator),
							 allocator);
		resolution.AddMember("result", make_string(result.resolution->result, allocator),
							 allocator);
		doc.AddMember("resolution", resolution, allocator);
	}
	return pretty(doc);
}

std::string to_text(const core::BucketResult &result)
{
	return result.bucket.key + " -> " + result.bucket.start_local + " to " + result.bucket.end_local;
}

std::string to_text(const core::Bucket &bucket)
{
	return bucket.key + ": " + bucket.start_local + " to " + bucket.end_local;
}

std::string to_text(const core::ExplainResult &result)
{
	std::ostringstream oss;
	oss << "Local time: " << result.local_time << '\n';
	oss << "Timezone: " << result.tz << '\n';
	oss << "Status: " << core::toString(result.status) << '\n';
	if (result.resolution)
		oss << "Resolution: " << result.resolution->policy << " -> " << result.resolution->result
			<< '\n';
	return oss.str();
}

} // namespace TzBucket::cmd::interface
