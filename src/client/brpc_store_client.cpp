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

#include "brpc_store_client.h"

#include <brpc/controller.h>
#include <butil/strings/string_piece.h>

#include "errors.h"
#include "log.h"

namespace kvdict {

DEFINE_string(kvdict_server, "127.0.0.1:6379", "address of the key-value store");
DEFINE_int32(kvdict_timeout_ms, 1000, "store rpc timeout in ms");
DEFINE_int32(kvdict_max_retry, 3, "store rpc max retry");
DEFINE_string(kvdict_connection_type, "", "brpc connection type: single, pooled or short");

BrpcStoreClientOptions BrpcStoreClientOptions::from_flags() {
    BrpcStoreClientOptions options;
    options.timeout_ms = FLAGS_kvdict_timeout_ms;
    options.max_retry = FLAGS_kvdict_max_retry;
    options.connection_type = FLAGS_kvdict_connection_type;
    return options;
}

namespace {

bool add_command(const RedisCommand& command, brpc::RedisRequest* request) {
    std::vector<butil::StringPiece> components;
    components.reserve(command.size());
    for (const auto& arg : command) {
        components.emplace_back(arg.data(), arg.size());
    }
    return request->AddCommandByComponents(components.data(), components.size());
}

} // namespace

int BrpcStoreClient::init(const std::string& server, const BrpcStoreClientOptions& options) {
    brpc::ChannelOptions channel_opt;
    channel_opt.protocol = brpc::PROTOCOL_REDIS;
    channel_opt.timeout_ms = options.timeout_ms;
    channel_opt.max_retry = options.max_retry;
    if (!options.connection_type.empty()) {
        channel_opt.connection_type = options.connection_type;
    }
    if (_channel.Init(server.c_str(), &channel_opt) != 0) {
        KVDICT_FATAL("init channel to %s fail", server.c_str());
        return -1;
    }
    _server = server;
    _inited = true;
    KVDICT_NOTICE("store client connected to %s, timeout_ms: %d, max_retry: %d",
            server.c_str(), options.timeout_ms, options.max_retry);
    return 0;
}

void BrpcStoreClient::convert_reply(const brpc::RedisReply& in, StoreReply* out) {
    out->elements.clear();
    out->str.clear();
    out->integer = 0;
    switch (in.type()) {
    case brpc::REDIS_REPLY_STRING:
        out->type = StoreReply::STRING;
        out->str = in.data().as_string();
        break;
    case brpc::REDIS_REPLY_STATUS:
        out->type = StoreReply::STATUS;
        out->str = in.data().as_string();
        break;
    case brpc::REDIS_REPLY_INTEGER:
        out->type = StoreReply::INTEGER;
        out->integer = in.integer();
        break;
    case brpc::REDIS_REPLY_ERROR:
        out->type = StoreReply::ERROR;
        out->str = in.error_message();
        break;
    case brpc::REDIS_REPLY_ARRAY:
        out->type = StoreReply::ARRAY;
        out->elements.resize(in.size());
        for (size_t i = 0; i < in.size(); ++i) {
            convert_reply(in[i], &out->elements[i]);
        }
        break;
    default:
        out->type = StoreReply::NIL;
        break;
    }
}

butil::Status BrpcStoreClient::execute(const RedisCommand& command, StoreReply* reply) {
    std::vector<StoreReply> replies;
    butil::Status s = execute_batch(std::vector<RedisCommand>{command}, &replies);
    if (!s.ok()) {
        return s;
    }
    *reply = std::move(replies[0]);
    return butil::Status::OK();
}

butil::Status BrpcStoreClient::execute_batch(const std::vector<RedisCommand>& commands,
                                             std::vector<StoreReply>* replies) {
    replies->clear();
    if (commands.empty()) {
        return butil::Status::OK();
    }
    if (!_inited) {
        return butil::Status(STORE_ERROR, "store client is not initialized");
    }
    brpc::RedisRequest request;
    for (const auto& command : commands) {
        if (command.empty() || !add_command(command, &request)) {
            return butil::Status(STORE_ERROR, "invalid command with %zu arguments", command.size());
        }
    }
    brpc::RedisResponse response;
    brpc::Controller cntl;
    _channel.CallMethod(nullptr, &cntl, &request, &response, nullptr);
    if (cntl.Failed()) {
        KVDICT_WARNING("store %s call fail, commands: %zu, error: %s",
                _server.c_str(), commands.size(), cntl.ErrorText().c_str());
        return butil::Status(STORE_ERROR, "%s", cntl.ErrorText().c_str());
    }
    if (response.reply_size() != static_cast<int>(commands.size())) {
        return butil::Status(STORE_ERROR, "expect %zu replies, got %d",
                commands.size(), response.reply_size());
    }
    replies->resize(commands.size());
    for (int i = 0; i < response.reply_size(); ++i) {
        convert_reply(response.reply(i), &(*replies)[i]);
    }
    KVDICT_DEBUG("store %s executed %zu commands, first: %s",
            _server.c_str(), commands.size(), commands[0][0].c_str());
    return butil::Status::OK();
}

} // namespace kvdict
