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
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <butil/status.h>

#include "command_builder.h"
#include "dict_options.h"
#include "errors.h"
#include "pipeline_scope.h"
#include "scan_iterator.h"
#include "store_client.h"
#include "type_registry.h"
#include "value.h"

namespace kvdict {

// Prefix of the insertion-order index key, see KeyCodec::insertion_order_key.
extern const char* const INSERTION_ORDER_KEY_PREFIX;

class KvDict;

// Overrides the expire of a KvDict for its lifetime; the previous setting is
// restored on destruction, also when the scope is left early.
class ExpireScope {
public:
    ExpireScope(KvDict* dict, std::optional<std::chrono::seconds> expire);
    ~ExpireScope();

    ExpireScope(const ExpireScope&) = delete;
    ExpireScope& operator=(const ExpireScope&) = delete;

private:
    KvDict* _dict;
    std::optional<std::chrono::seconds> _saved;
};

// Typed dictionary view over the keys "{ns}:*" of a key-value store.
//
// Values are stored as "{type_tag}:{payload}" (see TypeRegistry). Writes issued
// while a pipeline() scope is open are queued and sent in one round trip when
// the outermost scope ends; reads always go straight to the store.
//
// Not thread safe: one KvDict per thread, or external locking.
class KvDict {
public:
    // registry == nullptr gives the dict a private registry with the built-in
    // types; pass TypeRegistry::default_instance() to share registrations.
    KvDict(StoreClient* client, const DictOptions& options = DictOptions(),
           TypeRegistry* registry = nullptr);

    KvDict(const KvDict&) = delete;
    KvDict& operator=(const KvDict&) = delete;

    const std::string& ns() const {
        return _options.ns;
    }
    const DictOptions& options() const {
        return _options;
    }
    TypeRegistry* registry() const {
        return _registry;
    }
    const std::optional<std::chrono::seconds>& expire() const {
        return _ttl.expire;
    }
    void set_expire(std::optional<std::chrono::seconds> expire) {
        _ttl.expire = expire;
    }
    bool preserve_expiration() const {
        return _ttl.preserve_expiration;
    }
    void set_preserve_expiration(bool preserve) {
        _ttl.preserve_expiration = preserve;
    }
    std::string insertion_order_key() const;
    const PipelineState& pipeline_state() const {
        return _pipeline;
    }

    // *found = false and OK status when the key is absent.
    butil::Status get(const std::string& key, Value* value, bool* found);
    // NOT_FOUND when the key is absent.
    butil::Status get_item(const std::string& key, Value* value);
    butil::Status get_or(const std::string& key, const Value& default_value, Value* value);

    butil::Status set(const std::string& key, const Value& value);

    // Deleting an absent key is a no-op unless raise_on_missing_delete is set.
    butil::Status remove(const std::string& key);

    butil::Status contains(const std::string& key, bool* exists);

    // Full scan, not cached.
    butil::Status len(int64_t* count);

    butil::Status keys(std::vector<std::string>* keys);
    butil::Status values(ValueList* values);
    butil::Status items(std::vector<std::pair<std::string, Value>>* items);
    // Keys of the dict, fetched page by page while iterating.
    ScanIterator key_iterator();
    // No insertion order is kept, this is keys() reversed.
    butil::Status reversed_keys(std::vector<std::string>* keys);

    butil::Status to_dict(ValueDict* dict);
    butil::Status copy(ValueDict* dict) {
        return to_dict(dict);
    }
    butil::Status debug_string(std::string* out);

    butil::Status clear();

    // GETDEL: NOT_FOUND when absent, or default_value with the second form.
    butil::Status pop(const std::string& key, Value* value);
    butil::Status pop(const std::string& key, const Value& default_value, Value* value);

    // Removes and returns some key. NOT_FOUND when the dict is empty.
    butil::Status popitem(std::string* key, Value* value);

    // Atomic: stores default_value when the key is absent. *value is what the
    // store holds afterwards, i.e. the existing value when another writer won.
    butil::Status setdefault(const std::string& key, const Value& default_value, Value* value);

    butil::Status update(const ValueDict& mapping);
    // TYPE_MISMATCH unless mapping is a dict.
    butil::Status update(const Value& mapping);
    butil::Status fromkeys(const std::vector<std::string>& keys, const Value& value = Value());

    // First key starting with search_term; *found = false when none.
    butil::Status key(const std::string& search_term, std::string* key, bool* found);

    // {"a", "b"} addresses key "a:b".
    butil::Status chain_set(const std::vector<std::string>& chain, const Value& value);
    butil::Status chain_get(const std::vector<std::string>& chain, Value* value);
    butil::Status chain_del(const std::vector<std::string>& chain);

    // Values / items / deletion of every key starting with prefix. UNSUPPORTED
    // when the store cannot scan.
    butil::Status multi_get(const std::string& prefix, ValueList* values);
    butil::Status multi_chain_get(const std::vector<std::string>& chain, ValueList* values);
    butil::Status multi_dict(const std::string& prefix, ValueDict* dict);
    // *deleted is the store's count, or the number of keys queued inside a pipeline.
    butil::Status multi_del(const std::string& prefix, int64_t* deleted);

    // self | other
    butil::Status union_with(const Value& other, ValueDict* result);
    // other | self
    butil::Status reverse_union(const Value& other, ValueDict* result);
    // self |= other
    butil::Status merge(const Value& other);

    butil::Status equals(const ValueDict& other, bool* equal);
    butil::Status equals(KvDict& other, bool* equal);

    // Remaining seconds; unset for absent keys and keys without expire.
    butil::Status get_ttl(const std::string& key, std::optional<int64_t>* ttl);

    // Store INFO as field -> value.
    butil::Status info(std::map<std::string, std::string>* fields);

    // Writes inside the returned scope are sent as one batch when the
    // outermost scope ends. Use close() to observe the flush status.
    PipelineScope pipeline() {
        return PipelineScope(&_pipeline);
    }

    // Writes inside the returned scope expire after `seconds`.
    ExpireScope expire_at(std::chrono::seconds seconds) {
        return ExpireScope(this, seconds);
    }

    // Registers a custom type on this dict's registry, taking missing sides
    // from the members named by encode_method_name / decode_method_name.
    butil::Status extend_type(const TypeDescriptor& type,
                              EncodeFn encode = nullptr,
                              DecodeFn decode = nullptr);
    butil::Status check_type_compliance(const TypeDescriptor& type) const;

private:
    butil::Status validate_input(const std::string& key, const Value* value) const;
    butil::Status check_scan(const char* op) const;

    // Direct round trip; an error reply becomes STORE_ERROR.
    butil::Status read(const RedisCommand& command, StoreReply* reply);
    // Through the pipeline state.
    butil::Status write(const RedisCommand& command, StoreReply* reply, bool* queued);

    butil::Status decode_reply(const StoreReply& reply, Value* value) const;

    // Formatted keys (strip == false) or user keys matching "{ns}:{search_term}*".
    butil::Status collect_keys(const std::string& search_term, bool full_scan, bool strip,
                               std::vector<std::string>* keys);
    // MGET in batch_size chunks; absent keys stay unset.
    butil::Status fetch(const std::vector<std::string>& formatted_keys,
                        std::vector<std::optional<Value>>* values);

    StoreClient* _client;
    DictOptions _options;
    TtlPolicy _ttl;
    std::unique_ptr<TypeRegistry> _own_registry;
    TypeRegistry* _registry;
    PipelineState _pipeline;
};

} // namespace kvdict
