// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TZBUCKET_CMD_RENDER_HPP
#define TZBUCKET_CMD_RENDER_HPP

#include "TzBucket/core/Types.hpp"
#include <string>
#include <vector>

namespace TzBucket::cmd::interface
{

// {"input":{"ts","epoch_ms"},"tz","interval","bucket":{...}} on a single line
std::string to_json_line(const core::BucketResult &result);

// pretty array of {"key","start_local","end_local","start_utc","end_utc"}
std::string to_json(const std::vector<core::Bucket> &buckets);

// pretty {"local_time","tz","status","resolution"?:{"policy","result"}}
std::string to_json(const core::ExplainResult &result);

// "<key> -> <start_local> to <end_local>"
std::string to_text(const core::BucketResult &result);

// "<key>: <start_local> to <end_local>"
std::string to_text(const core::Bucket &bucket);

std::string to_text(const core::ExplainResult &result);

} // namespace TzBucket::cmd::interface

#endif // TZBUCKET_CMD_RENDER_HPP
