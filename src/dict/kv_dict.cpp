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

#include "kv_dict.h"

#include <algorithm>
#include <unordered_set>

#include "key_codec.h"
#include "log.h"

namespace kvdict {

const char* const INSERTION_ORDER_KEY_PREFIX = "kvdict";

ExpireScope::ExpireScope(KvDict* dict, std::optional<std::chrono::seconds> expire)
        : _dict(dict), _saved(dict->expire()) {
    _dict->set_expire(expire);
}

ExpireScope::~ExpireScope() {
    _dict->set_expire(_saved);
}

KvDict::KvDict(StoreClient* client, const DictOptions& options, TypeRegistry* registry)
        : _client(client),
          _options(options),
          _registry(registry),
          _pipeline(client) {
    _ttl.expire = options.expire;
    _ttl.preserve_expiration = options.preserve_expiration;
    if (_registry == nullptr) {
        _own_registry.reset(new TypeRegistry);
        _registry = _own_registry.get();
    }
    if (_options.batch_size_hint <= 0) {
        _options.batch_size_hint = 200;
    }
}

std::string KvDict::insertion_order_key() const {
    return KeyCodec::insertion_order_key(INSERTION_ORDER_KEY_PREFIX, _options.ns);
}

butil::Status KvDict::validate_input(const std::string& key, const Value* value) const {
    const int64_t max_size = _options.max_string_size;
    if (static_cast<int64_t>(key.size()) > max_size
            || (value != nullptr && value->is_string()
                && static_cast<int64_t>(value->as_string().size()) > max_size)) {
        return butil::Status(VALIDATION_ERROR,
                "Invalid input value or key size exceeded the maximum limit.");
    }
    return butil::Status::OK();
}

butil::Status KvDict::check_scan(const char* op) const {
    if (!_client->supports_scan()) {
        return butil::Status(UNSUPPORTED, "%s needs a store that can scan keys", op);
    }
    return butil::Status::OK();
}

butil::Status KvDict::read(const RedisCommand& command, StoreReply* reply) {
    butil::Status s = _client->execute(command, reply);
    if (!s.ok()) {
        return s;
    }
    if (reply->is_error()) {
        KVDICT_WARNING("ns: %s, %s fail: %s", _options.ns.c_str(), command[0].c_str(), reply->str.c_str());
        return butil::Status(STORE_ERROR, "%s", reply->str.c_str());
    }
    return butil::Status::OK();
}

butil::Status KvDict::write(const RedisCommand& command, StoreReply* reply, bool* queued) {
    butil::Status s = _pipeline.send(command, reply, queued);
    if (!s.ok()) {
        KVDICT_WARNING("ns: %s, %s fail: %s", _options.ns.c_str(), command[0].c_str(), s.error_cstr());
    }
    return s;
}

butil::Status KvDict::decode_reply(const StoreReply& reply, Value* value) const {
    if (!reply.is_string()) {
        return butil::Status(STORE_ERROR, "unexpected reply type %d for a value", reply.type);
    }
    return _registry->decode(reply.str, value);
}

butil::Status KvDict::collect_keys(const std::string& search_term, bool full_scan, bool strip,
                                   std::vector<std::string>* keys) {
    keys->clear();
    ScanIterator iter(_client, KeyCodec::scan_pattern(_options.ns, search_term),
            full_scan ? 0 : _options.batch_size_hint,
            strip ? KeyCodec::prefix_length(_options.ns) : 0);
    for (iter.seek(); iter.valid(); iter.next()) {
        keys->push_back(iter.key());
    }
    return iter.status();
}

butil::Status KvDict::fetch(const std::vector<std::string>& formatted_keys,
                            std::vector<std::optional<Value>>* values) {
    values->clear();
    values->reserve(formatted_keys.size());
    const size_t batch = _options.batch_size_hint;
    for (size_t begin = 0; begin < formatted_keys.size(); begin += batch) {
        const size_t end = std::min(formatted_keys.size(), begin + batch);
        std::vector<std::string> chunk(formatted_keys.begin() + begin, formatted_keys.begin() + end);
        StoreReply reply;
        butil::Status s = read(CommandBuilder::build_mget(chunk), &reply);
        if (!s.ok()) {
            return s;
        }
        if (!reply.is_array() || reply.elements.size() != chunk.size()) {
            return butil::Status(STORE_ERROR, "malformed MGET reply for %zu keys", chunk.size());
        }
        for (const auto& item : reply.elements) {
            if (item.is_nil()) {
                values->emplace_back();
                continue;
            }
            Value value;
            s = decode_reply(item, &value);
            if (!s.ok()) {
                return s;
            }
            values->emplace_back(std::move(value));
        }
    }
    return butil::Status::OK();
}

butil::Status KvDict::get(const std::string& key, Value* value, bool* found) {
    *found = false;
    StoreReply reply;
    butil::Status s = read(CommandBuilder::build_get(KeyCodec::format_key(_options.ns, key)), &reply);
    if (!s.ok()) {
        return s;
    }
    if (reply.is_nil()) {
        return butil::Status::OK();
    }
    s = decode_reply(reply, value);
    if (!s.ok()) {
        return s;
    }
    *found = true;
    return butil::Status::OK();
}

butil::Status KvDict::get_item(const std::string& key, Value* value) {
    bool found = false;
    butil::Status s = get(key, value, &found);
    if (!s.ok()) {
        return s;
    }
    if (!found) {
        return butil::Status(NOT_FOUND, "%s", key.c_str());
    }
    return butil::Status::OK();
}

butil::Status KvDict::get_or(const std::string& key, const Value& default_value, Value* value) {
    bool found = false;
    butil::Status s = get(key, value, &found);
    if (!s.ok()) {
        return s;
    }
    if (!found) {
        *value = default_value;
    }
    return butil::Status::OK();
}

butil::Status KvDict::set(const std::string& key, const Value& value) {
    butil::Status s = validate_input(key, &value);
    if (!s.ok()) {
        return s;
    }
    std::string envelope;
    s = _registry->encode(value, &envelope);
    if (!s.ok()) {
        return s;
    }
    const std::string formatted_key = KeyCodec::format_key(_options.ns, key);
    bool key_exists = false;
    if (_ttl.preserve_expiration) {
        StoreReply reply;
        s = read(CommandBuilder::build_exists(formatted_key), &reply);
        if (!s.ok()) {
            return s;
        }
        key_exists = reply.integer > 0;
    }
    StoreReply reply;
    return write(CommandBuilder::build_store(formatted_key, envelope, _ttl, key_exists), &reply, nullptr);
}

butil::Status KvDict::remove(const std::string& key) {
    StoreReply reply;
    bool queued = false;
    butil::Status s = write(CommandBuilder::build_del({KeyCodec::format_key(_options.ns, key)}),
            &reply, &queued);
    if (!s.ok()) {
        return s;
    }
    if (!_options.raise_on_missing_delete) {
        return butil::Status::OK();
    }
    if (queued) {
        KVDICT_WARNING("ns: %s, delete of %s is pipelined, missing key check skipped",
                _options.ns.c_str(), key.c_str());
        return butil::Status::OK();
    }
    if (reply.integer == 0) {
        return butil::Status(NOT_FOUND, "%s", key.c_str());
    }
    return butil::Status::OK();
}

butil::Status KvDict::contains(const std::string& key, bool* exists) {
    StoreReply reply;
    butil::Status s = read(CommandBuilder::build_exists(KeyCodec::format_key(_options.ns, key)), &reply);
    if (!s.ok()) {
        return s;
    }
    *exists = reply.integer > 0;
    return butil::Status::OK();
}

butil::Status KvDict::len(int64_t* count) {
    butil::Status s = check_scan("len");
    if (!s.ok()) {
        return s;
    }
    // SCAN may return a key more than once.
    std::unordered_set<std::string> seen;
    ScanIterator iter(_client, KeyCodec::scan_pattern(_options.ns, ""), 0, 0);
    for (iter.seek(); iter.valid(); iter.next()) {
        seen.insert(iter.key());
    }
    if (!iter.status().ok()) {
        return iter.status();
    }
    *count = seen.size();
    return butil::Status::OK();
}

butil::Status KvDict::keys(std::vector<std::string>* keys) {
    butil::Status s = check_scan("keys");
    if (!s.ok()) {
        return s;
    }
    return collect_keys("", false, true, keys);
}

butil::Status KvDict::values(ValueList* values) {
    std::vector<std::pair<std::string, Value>> kvs;
    butil::Status s = items(&kvs);
    if (!s.ok()) {
        return s;
    }
    values->clear();
    values->reserve(kvs.size());
    for (auto& kv : kvs) {
        values->push_back(std::move(kv.second));
    }
    return butil::Status::OK();
}

butil::Status KvDict::items(std::vector<std::pair<std::string, Value>>* items) {
    butil::Status s = check_scan("items");
    if (!s.ok()) {
        return s;
    }
    std::vector<std::string> formatted_keys;
    s = collect_keys("", false, false, &formatted_keys);
    if (!s.ok()) {
        return s;
    }
    std::vector<std::optional<Value>> values;
    s = fetch(formatted_keys, &values);
    if (!s.ok()) {
        return s;
    }
    items->clear();
    for (size_t i = 0; i < formatted_keys.size(); ++i) {
        // deleted between SCAN and MGET
        if (!values[i]) {
            continue;
        }
        items->emplace_back(KeyCodec::parse_key(_options.ns, formatted_keys[i]), std::move(*values[i]));
    }
    return butil::Status::OK();
}

ScanIterator KvDict::key_iterator() {
    return ScanIterator(_client, KeyCodec::scan_pattern(_options.ns, ""),
            _options.batch_size_hint, KeyCodec::prefix_length(_options.ns));
}

butil::Status KvDict::reversed_keys(std::vector<std::string>* keys) {
    butil::Status s = this->keys(keys);
    if (!s.ok()) {
        return s;
    }
    std::reverse(keys->begin(), keys->end());
    return butil::Status::OK();
}

butil::Status KvDict::to_dict(ValueDict* dict) {
    std::vector<std::pair<std::string, Value>> kvs;
    butil::Status s = items(&kvs);
    if (!s.ok()) {
        return s;
    }
    dict->clear();
    for (auto& kv : kvs) {
        (*dict)[kv.first] = std::move(kv.second);
    }
    return butil::Status::OK();
}

butil::Status KvDict::debug_string(std::string* out) {
    ValueDict dict;
    butil::Status s = to_dict(&dict);
    if (!s.ok()) {
        return s;
    }
    *out = Value(std::move(dict)).debug_string();
    return butil::Status::OK();
}

butil::Status KvDict::clear() {
    butil::Status s = check_scan("clear");
    if (!s.ok()) {
        return s;
    }
    PipelineScope scope(&_pipeline);
    ScanIterator iter(_client, KeyCodec::scan_pattern(_options.ns, ""), 0, 0);
    std::vector<std::string> chunk;
    StoreReply reply;
    for (iter.seek(); iter.valid(); iter.next()) {
        chunk.push_back(iter.key());
        if (chunk.size() >= static_cast<size_t>(_options.batch_size_hint)) {
            s = write(CommandBuilder::build_del(chunk), &reply, nullptr);
            if (!s.ok()) {
                break;
            }
            chunk.clear();
        }
    }
    if (s.ok() && !iter.status().ok()) {
        s = iter.status();
    }
    if (s.ok() && !chunk.empty()) {
        s = write(CommandBuilder::build_del(chunk), &reply, nullptr);
    }
    butil::Status flush = scope.close();
    if (!s.ok()) {
        return s;
    }
    if (flush.ok()) {
        KVDICT_DEBUG("ns: %s cleared", _options.ns.c_str());
    }
    return flush;
}

butil::Status KvDict::pop(const std::string& key, Value* value) {
    StoreReply reply;
    butil::Status s = read(CommandBuilder::build_get_del(KeyCodec::format_key(_options.ns, key)), &reply);
    if (!s.ok()) {
        return s;
    }
    if (reply.is_nil()) {
        return butil::Status(NOT_FOUND, "%s", key.c_str());
    }
    return decode_reply(reply, value);
}

butil::Status KvDict::pop(const std::string& key, const Value& default_value, Value* value) {
    butil::Status s = pop(key, value);
    if (is_not_found(s)) {
        *value = default_value;
        return butil::Status::OK();
    }
    return s;
}

butil::Status KvDict::popitem(std::string* key, Value* value) {
    while (true) {
        bool found = false;
        butil::Status s = this->key("", key, &found);
        if (!s.ok()) {
            return s;
        }
        if (!found) {
            return butil::Status(NOT_FOUND, "popitem(): dictionary is empty");
        }
        s = pop(*key, value);
        if (!is_not_found(s)) {
            return s;
        }
        KVDICT_DEBUG("ns: %s, key %s vanished before popitem, retry", _options.ns.c_str(), key->c_str());
    }
}

butil::Status KvDict::setdefault(const std::string& key, const Value& default_value, Value* value) {
    butil::Status s = validate_input(key, &default_value);
    if (!s.ok()) {
        return s;
    }
    std::string envelope;
    s = _registry->encode(default_value, &envelope);
    if (!s.ok()) {
        return s;
    }
    StoreReply reply;
    s = read(CommandBuilder::build_set_default(KeyCodec::format_key(_options.ns, key), envelope, _ttl),
            &reply);
    if (!s.ok()) {
        return s;
    }
    if (reply.is_nil()) {
        *value = default_value;
        return butil::Status::OK();
    }
    return decode_reply(reply, value);
}

butil::Status KvDict::update(const ValueDict& mapping) {
    PipelineScope scope(&_pipeline);
    for (const auto& kv : mapping) {
        butil::Status s = set(kv.first, kv.second);
        if (!s.ok()) {
            butil::Status flush = scope.close();
            if (!flush.ok()) {
                KVDICT_WARNING("ns: %s, flush after failed update: %s",
                        _options.ns.c_str(), flush.error_cstr());
            }
            return s;
        }
    }
    return scope.close();
}

butil::Status KvDict::update(const Value& mapping) {
    if (!mapping.is_dict()) {
        return butil::Status(TYPE_MISMATCH, "'%s' object is not a mapping",
                Value::type_name(mapping.type()));
    }
    return update(mapping.as_dict());
}

butil::Status KvDict::fromkeys(const std::vector<std::string>& keys, const Value& value) {
    for (const auto& key : keys) {
        butil::Status s = set(key, value);
        if (!s.ok()) {
            return s;
        }
    }
    return butil::Status::OK();
}

butil::Status KvDict::key(const std::string& search_term, std::string* key, bool* found) {
    butil::Status s = check_scan("key");
    if (!s.ok()) {
        return s;
    }
    *found = false;
    ScanIterator iter(_client, KeyCodec::scan_pattern(_options.ns, search_term),
            _options.batch_size_hint, KeyCodec::prefix_length(_options.ns));
    iter.seek();
    if (iter.valid()) {
        *key = iter.key();
        *found = true;
    }
    return iter.status();
}

butil::Status KvDict::chain_set(const std::vector<std::string>& chain, const Value& value) {
    return set(KeyCodec::join_chain(chain), value);
}

butil::Status KvDict::chain_get(const std::vector<std::string>& chain, Value* value) {
    return get_item(KeyCodec::join_chain(chain), value);
}

butil::Status KvDict::chain_del(const std::vector<std::string>& chain) {
    return remove(KeyCodec::join_chain(chain));
}

butil::Status KvDict::multi_get(const std::string& prefix, ValueList* values) {
    butil::Status s = check_scan("multi_get");
    if (!s.ok()) {
        return s;
    }
    values->clear();
    std::vector<std::string> formatted_keys;
    s = collect_keys(prefix, false, false, &formatted_keys);
    if (!s.ok() || formatted_keys.empty()) {
        return s;
    }
    std::vector<std::optional<Value>> found;
    s = fetch(formatted_keys, &found);
    if (!s.ok()) {
        return s;
    }
    for (auto& v : found) {
        if (v) {
            values->push_back(std::move(*v));
        }
    }
    return butil::Status::OK();
}

butil::Status KvDict::multi_chain_get(const std::vector<std::string>& chain, ValueList* values) {
    return multi_get(KeyCodec::join_chain(chain), values);
}

butil::Status KvDict::multi_dict(const std::string& prefix, ValueDict* dict) {
    butil::Status s = check_scan("multi_dict");
    if (!s.ok()) {
        return s;
    }
    dict->clear();
    std::vector<std::string> formatted_keys;
    s = collect_keys(prefix, false, false, &formatted_keys);
    if (!s.ok() || formatted_keys.empty()) {
        return s;
    }
    std::vector<std::optional<Value>> found;
    s = fetch(formatted_keys, &found);
    if (!s.ok()) {
        return s;
    }
    // A pattern prefix has no fixed length; such names keep the whole user key.
    const bool literal = !KeyCodec::has_glob_meta(prefix);
    const size_t strip_len = KeyCodec::prefix_length(_options.ns) + (literal ? prefix.size() : 0);
    for (size_t i = 0; i < formatted_keys.size(); ++i) {
        if (!found[i]) {
            continue;
        }
        std::string name = formatted_keys[i].size() > strip_len
                ? formatted_keys[i].substr(strip_len) : std::string();
        if (literal && !name.empty() && name[0] == KEY_SEPARATOR) {
            name.erase(0, 1);
        }
        (*dict)[name] = std::move(*found[i]);
    }
    return butil::Status::OK();
}

butil::Status KvDict::multi_del(const std::string& prefix, int64_t* deleted) {
    butil::Status s = check_scan("multi_del");
    if (!s.ok()) {
        return s;
    }
    *deleted = 0;
    std::vector<std::string> formatted_keys;
    s = collect_keys(prefix, false, false, &formatted_keys);
    if (!s.ok()) {
        return s;
    }
    const size_t batch = _options.batch_size_hint;
    for (size_t begin = 0; begin < formatted_keys.size(); begin += batch) {
        const size_t end = std::min(formatted_keys.size(), begin + batch);
        std::vector<std::string> chunk(formatted_keys.begin() + begin, formatted_keys.begin() + end);
        StoreReply reply;
        bool queued = false;
        s = write(CommandBuilder::build_del(chunk), &reply, &queued);
        if (!s.ok()) {
            return s;
        }
        *deleted += queued ? static_cast<int64_t>(chunk.size()) : reply.integer;
    }
    return butil::Status::OK();
}

butil::Status KvDict::union_with(const Value& other, ValueDict* result) {
    if (!other.is_dict()) {
        return butil::Status(TYPE_MISMATCH, "unsupported operand type(s) for |: 'KvDict' and '%s'",
                Value::type_name(other.type()));
    }
    butil::Status s = to_dict(result);
    if (!s.ok()) {
        return s;
    }
    for (const auto& kv : other.as_dict()) {
        (*result)[kv.first] = kv.second;
    }
    return butil::Status::OK();
}

butil::Status KvDict::reverse_union(const Value& other, ValueDict* result) {
    if (!other.is_dict()) {
        return butil::Status(TYPE_MISMATCH, "unsupported operand type(s) for |: '%s' and 'KvDict'",
                Value::type_name(other.type()));
    }
    ValueDict mine;
    butil::Status s = to_dict(&mine);
    if (!s.ok()) {
        return s;
    }
    *result = other.as_dict();
    for (auto& kv : mine) {
        (*result)[kv.first] = std::move(kv.second);
    }
    return butil::Status::OK();
}

butil::Status KvDict::merge(const Value& other) {
    if (!other.is_dict()) {
        return butil::Status(TYPE_MISMATCH, "unsupported operand type(s) for |=: 'KvDict' and '%s'",
                Value::type_name(other.type()));
    }
    return update(other.as_dict());
}

butil::Status KvDict::equals(const ValueDict& other, bool* equal) {
    ValueDict mine;
    butil::Status s = to_dict(&mine);
    if (!s.ok()) {
        return s;
    }
    *equal = (mine == other);
    return butil::Status::OK();
}

butil::Status KvDict::equals(KvDict& other, bool* equal) {
    ValueDict theirs;
    butil::Status s = other.to_dict(&theirs);
    if (!s.ok()) {
        return s;
    }
    return equals(theirs, equal);
}

butil::Status KvDict::get_ttl(const std::string& key, std::optional<int64_t>* ttl) {
    StoreReply reply;
    butil::Status s = read(CommandBuilder::build_ttl(KeyCodec::format_key(_options.ns, key)), &reply);
    if (!s.ok()) {
        return s;
    }
    // -2: no such key, -1: no expire
    if (!reply.is_integer() || reply.integer < 0) {
        ttl->reset();
    } else {
        *ttl = reply.integer;
    }
    return butil::Status::OK();
}

butil::Status KvDict::info(std::map<std::string, std::string>* fields) {
    StoreReply reply;
    butil::Status s = read(CommandBuilder::build_info(), &reply);
    if (!s.ok()) {
        return s;
    }
    fields->clear();
    size_t begin = 0;
    const std::string& text = reply.str;
    while (begin < text.size()) {
        size_t end = text.find('\n', begin);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(begin, end - begin);
        begin = end + 1;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const size_t pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }
        (*fields)[line.substr(0, pos)] = line.substr(pos + 1);
    }
    return butil::Status::OK();
}

butil::Status KvDict::extend_type(const TypeDescriptor& type, EncodeFn encode, DecodeFn decode) {
    return _registry->extend(type, std::move(encode), std::move(decode),
            _options.encode_method_name, _options.decode_method_name);
}

butil::Status KvDict::check_type_compliance(const TypeDescriptor& type) const {
    return TypeRegistry::check_compliance(type, _options.encode_method_name, _options.decode_method_name);
}

} // namespace kvdict
