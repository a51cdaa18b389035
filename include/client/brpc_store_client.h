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

#include <string>
#include <vector>

#include <brpc/channel.h>
#include <brpc/redis.h>
#include <gflags/gflags.h>

#include "store_client.h"

namespace kvdict {

DECLARE_string(kvdict_server);
DECLARE_int32(kvdict_timeout_ms);
DECLARE_int32(kvdict_max_retry);
DECLARE_string(kvdict_connection_type);

struct BrpcStoreClientOptions {
    int32_t timeout_ms = 1000;
    int32_t max_retry = 3;
    // "single", "pooled" or "short"; empty keeps the brpc default.
    std::string connection_type;

    static BrpcStoreClientOptions from_flags();
};

// StoreClient speaking RESP over a brpc::Channel. A batch is sent as a single
// RedisRequest carrying every command, which brpc pipelines on one connection.
class BrpcStoreClient : public StoreClient {
public:
    BrpcStoreClient() = default;

    // server: "host:port" or any brpc naming url. Returns 0 on success.
    int init(const std::string& server, const BrpcStoreClientOptions& options);

    butil::Status execute(const RedisCommand& command, StoreReply* reply) override;

    butil::Status execute_batch(const std::vector<RedisCommand>& commands,
                                std::vector<StoreReply>* replies) override;

    static void convert_reply(const brpc::RedisReply& in, StoreReply* out);

private:
    bool _inited = false;
    std::string _server;
    brpc::Channel _channel;
};

} // namespace kvdict
