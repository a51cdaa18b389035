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

#include <cstdint>
#include <string>
#include <vector>

#include <butil/status.h>

namespace kvdict {

// One store command as its argument vector, e.g. {"SET", "main:k", "str:v", "EX", "60"}.
typedef std::vector<std::string> RedisCommand;

// Transport independent copy of a RESP reply.
struct StoreReply {
    enum Type {
        NIL = 0,
        STRING,
        STATUS,
        INTEGER,
        ARRAY,
        ERROR,
    };

    Type type = NIL;
    std::string str;     // STRING / STATUS / ERROR text
    int64_t integer = 0; // INTEGER
    std::vector<StoreReply> elements;

    bool is_nil() const { return type == NIL; }
    bool is_error() const { return type == ERROR; }
    bool is_integer() const { return type == INTEGER; }
    bool is_string() const { return type == STRING || type == STATUS; }
    bool is_array() const { return type == ARRAY; }

    static StoreReply nil() {
        return StoreReply();
    }
    static StoreReply string(std::string s) {
        StoreReply r;
        r.type = STRING;
        r.str = std::move(s);
        return r;
    }
    static StoreReply status(std::string s) {
        StoreReply r;
        r.type = STATUS;
        r.str = std::move(s);
        return r;
    }
    static StoreReply integer_reply(int64_t i) {
        StoreReply r;
        r.type = INTEGER;
        r.integer = i;
        return r;
    }
    static StoreReply error(std::string s) {
        StoreReply r;
        r.type = ERROR;
        r.str = std::move(s);
        return r;
    }
    static StoreReply array(std::vector<StoreReply> items) {
        StoreReply r;
        r.type = ARRAY;
        r.elements = std::move(items);
        return r;
    }
};

// Command sink to the key-value store.
class StoreClient {
public:
    virtual ~StoreClient() {}

    // One round trip. An error reply is returned in *reply with an OK status;
    // a non-OK status means the transport failed.
    virtual butil::Status execute(const RedisCommand& command, StoreReply* reply) = 0;

    // All commands in one round trip, replies in command order.
    virtual butil::Status execute_batch(const std::vector<RedisCommand>& commands,
                                        std::vector<StoreReply>* replies) = 0;

    // False for transports that cannot enumerate keys by prefix.
    virtual bool supports_scan() const {
        return true;
    }
};

} // namespace kvdict
