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

#include "pipeline_scope.h"

#include "errors.h"
#include "log.h"

namespace kvdict {

butil::Status BatchingSink::flush(StoreClient* client) {
    if (_commands.empty()) {
        return butil::Status::OK();
    }
    std::vector<RedisCommand> commands;
    commands.swap(_commands);
    std::vector<StoreReply> replies;
    butil::Status s = client->execute_batch(commands, &replies);
    if (!s.ok()) {
        KVDICT_WARNING("pipeline flush of %zu commands fail: %s", commands.size(), s.error_cstr());
        return s;
    }
    for (size_t i = 0; i < replies.size(); ++i) {
        if (replies[i].is_error()) {
            KVDICT_WARNING("pipeline command %zu/%zu (%s) fail: %s",
                    i + 1, commands.size(), commands[i][0].c_str(), replies[i].str.c_str());
            return butil::Status(STORE_ERROR, "%s", replies[i].str.c_str());
        }
    }
    KVDICT_DEBUG("pipeline flushed %zu commands", commands.size());
    return butil::Status::OK();
}

void PipelineState::enter() {
    if (_depth == 0) {
        _sink.reset(new BatchingSink);
    }
    ++_depth;
}

butil::Status PipelineState::exit() {
    if (_depth == 0) {
        return butil::Status::OK();
    }
    if (--_depth > 0) {
        return butil::Status::OK();
    }
    std::unique_ptr<BatchingSink> sink;
    sink.swap(_sink);
    return sink->flush(_client);
}

butil::Status PipelineState::send(const RedisCommand& command, StoreReply* reply, bool* queued) {
    if (_depth > 0) {
        _sink->add(command);
        if (queued) {
            *queued = true;
        }
        return butil::Status::OK();
    }
    if (queued) {
        *queued = false;
    }
    butil::Status s = _client->execute(command, reply);
    if (!s.ok()) {
        return s;
    }
    if (reply->is_error()) {
        return butil::Status(STORE_ERROR, "%s", reply->str.c_str());
    }
    return butil::Status::OK();
}

PipelineScope::~PipelineScope() {
    if (_closed) {
        return;
    }
    butil::Status s = close();
    if (!s.ok()) {
        KVDICT_WARNING("pipeline scope ended with a failed flush: %s", s.error_cstr());
    }
}

butil::Status PipelineScope::close() {
    if (_closed) {
        return butil::Status::OK();
    }
    _closed = true;
    return _state->exit();
}

} // namespace kvdict
