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

#include <memory>
#include <vector>

#include <butil/status.h>

#include "store_client.h"

namespace kvdict {

// Queue of write commands sent as one round trip on flush.
class BatchingSink {
public:
    void add(RedisCommand command) {
        _commands.push_back(std::move(command));
    }
    size_t size() const {
        return _commands.size();
    }
    const std::vector<RedisCommand>& commands() const {
        return _commands;
    }

    // Sends everything queued, even when an earlier command will fail on the
    // store. The first error reply is reported after the batch was sent.
    butil::Status flush(StoreClient* client);

private:
    std::vector<RedisCommand> _commands;
};

// Idle (depth 0, writes go to the client) or Batching (depth >= 1, writes are
// queued in the owned sink). Only the outermost exit flushes.
class PipelineState {
public:
    explicit PipelineState(StoreClient* client) : _client(client) {}

    void enter();

    // Leaves one level; the exit reaching depth 0 flushes the sink and
    // returns its status.
    butil::Status exit();

    bool batching() const {
        return _depth > 0;
    }
    int depth() const {
        return _depth;
    }
    // Commands waiting for the outermost exit.
    size_t pending() const {
        return _sink ? _sink->size() : 0;
    }

    // Write path: queued while batching (*queued = true, reply untouched),
    // executed immediately otherwise.
    butil::Status send(const RedisCommand& command, StoreReply* reply, bool* queued);

private:
    StoreClient* _client;
    int _depth = 0;
    std::unique_ptr<BatchingSink> _sink;
};

// Scope guard over a PipelineState. Every write issued while at least one
// scope is open is sent in one round trip when the outermost scope ends.
class PipelineScope {
public:
    explicit PipelineScope(PipelineState* state) : _state(state) {
        _state->enter();
    }
    ~PipelineScope();

    PipelineScope(const PipelineScope&) = delete;
    PipelineScope& operator=(const PipelineScope&) = delete;

    // Ends the scope early and returns the flush status (OK for inner scopes).
    butil::Status close();

private:
    PipelineState* _state;
    bool _closed = false;
};

} // namespace kvdict
