// Copyright (c) 2018-present Baidu, Inc. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "store_client.h"

namespace kvdict {

struct TtlPolicy {
    // Relative expiry applied on every write; unset = persistent.
    std::optional<std::chrono::seconds> expire;
    // Keep the remaining TTL of keys that already exist.
    bool preserve_expiration = false;
};

class CommandBuilder {
public:
    // Stores never ask for a non-positive expiry.
    static int64_t clamp_expire_seconds(std::chrono::seconds expire);

    // SET k v KEEPTTL           preserve_expiration and key_exists
    // SET k v [EX n]            otherwise
    static RedisCommand build_store(const std::string& formatted_key,
                                    const std::string& envelope,
                                    const TtlPolicy& policy,
                                    bool key_exists);

    // SET k v NX GET [EX n | KEEPTTL]
    static RedisCommand build_set_default(const std::string& formatted_key,
                                          const std::string& envelope,
                                          const TtlPolicy& policy);

    static RedisCommand build_get(const std::string& formatted_key);
    static RedisCommand build_get_del(const std::string& formatted_key);
    static RedisCommand build_exists(const std::string& formatted_key);
    static RedisCommand build_ttl(const std::string& formatted_key);
    static RedisCommand build_del(const std::vector<std::string>& formatted_keys);
    static RedisCommand build_mget(const std::vector<std::string>& formatted_keys);

    // SCAN cursor MATCH pattern [COUNT n]; count <= 0 omits COUNT.
    static RedisCommand build_scan(const std::string& cursor,
                                   const std::string& pattern,
                                   int64_t count);

    static RedisCommand build_info();
};

} // namespace kvdict
