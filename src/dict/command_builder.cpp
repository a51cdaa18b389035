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

#include "command_builder.h"

namespace kvdict {

int64_t CommandBuilder::clamp_expire_seconds(std::chrono::seconds expire) {
    const int64_t seconds = expire.count();
    return seconds < 1 ? 1 : seconds;
}

RedisCommand CommandBuilder::build_store(const std::string& formatted_key,
                                         const std::string& envelope,
                                         const TtlPolicy& policy,
                                         bool key_exists) {
    RedisCommand cmd{"SET", formatted_key, envelope};
    if (policy.preserve_expiration && key_exists) {
        cmd.emplace_back("KEEPTTL");
    } else if (policy.expire) {
        cmd.emplace_back("EX");
        cmd.emplace_back(std::to_string(clamp_expire_seconds(*policy.expire)));
    }
    return cmd;
}

RedisCommand CommandBuilder::build_set_default(const std::string& formatted_key,
                                               const std::string& envelope,
                                               const TtlPolicy& policy) {
    RedisCommand cmd{"SET", formatted_key, envelope, "NX", "GET"};
    if (policy.expire) {
        cmd.emplace_back("EX");
        cmd.emplace_back(std::to_string(clamp_expire_seconds(*policy.expire)));
    } else if (policy.preserve_expiration) {
        cmd.emplace_back("KEEPTTL");
    }
    return cmd;
}

RedisCommand CommandBuilder::build_get(const std::string& formatted_key) {
    return RedisCommand{"GET", formatted_key};
}

RedisCommand CommandBuilder::build_get_del(const std::string& formatted_key) {
    return RedisCommand{"GETDEL", formatted_key};
}

RedisCommand CommandBuilder::build_exists(const std::string& formatted_key) {
    return RedisCommand{"EXISTS", formatted_key};
}

RedisCommand CommandBuilder::build_ttl(const std::string& formatted_key) {
    return RedisCommand{"TTL", formatted_key};
}

RedisCommand CommandBuilder::build_del(const std::vector<std::string>& formatted_keys) {
    RedisCommand cmd{"DEL"};
    cmd.insert(cmd.end(), formatted_keys.begin(), formatted_keys.end());
    return cmd;
}

RedisCommand CommandBuilder::build_mget(const std::vector<std::string>& formatted_keys) {
    RedisCommand cmd{"MGET"};
    cmd.insert(cmd.end(), formatted_keys.begin(), formatted_keys.end());
    return cmd;
}

RedisCommand CommandBuilder::build_scan(const std::string& cursor,
                                        const std::string& pattern,
                                        int64_t count) {
    RedisCommand cmd{"SCAN", cursor, "MATCH", pattern};
    if (count > 0) {
        cmd.emplace_back("COUNT");
        cmd.emplace_back(std::to_string(count));
    }
    return cmd;
}

RedisCommand CommandBuilder::build_info() {
    return RedisCommand{"INFO"};
}

} // namespace kvdict
