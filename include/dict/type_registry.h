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

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include <butil/status.h>

#include "errors.h"
#include "value.h"

namespace kvdict {

// Encoder: value -> payload (the part after "tag:").
typedef std::function<butil::Status(const Value&, std::string*)> EncodeFn;
// Decoder: payload -> value. May reject a malformed payload.
typedef std::function<butil::Status(const std::string&, Value*)> DecodeFn;

// Built-in type tags. Kept identical to the tags written by existing
// deployments so their data stays readable.
extern const char* const TAG_STR;
extern const char* const TAG_INT;
extern const char* const TAG_FLOAT;
extern const char* const TAG_BOOL;
extern const char* const TAG_NONE;
extern const char* const TAG_LIST;
extern const char* const TAG_DICT;

// Wraps `fn(const T&) -> std::string` into an EncodeFn that rejects values
// not holding a T.
template <typename T, typename Fn>
EncodeFn make_object_encoder(const std::string& type_tag, Fn fn) {
    return [type_tag, fn](const Value& value, std::string* payload) -> butil::Status {
        const T* obj = value.as_object<T>();
        if (obj == nullptr) {
            return butil::Status(TYPE_MISMATCH, "Object of type %s cannot be encoded as %s",
                    value.is_object() ? value.object_tag().c_str() : Value::type_name(value.type()),
                    type_tag.c_str());
        }
        *payload = fn(*obj);
        return butil::Status::OK();
    };
}

// Wraps `fn(const std::string&) -> T` into a DecodeFn producing an OBJECT
// value tagged type_tag.
template <typename T, typename Fn>
DecodeFn make_object_decoder(const std::string& type_tag, Fn fn) {
    return [type_tag, fn](const std::string& payload, Value* value) -> butil::Status {
        *value = Value::object<T>(type_tag, fn(payload));
        return butil::Status::OK();
    };
}

namespace detail {

template <typename T, typename = void>
struct has_encode_member : std::false_type {};

template <typename T>
struct has_encode_member<T, std::void_t<decltype(std::declval<const T&>().encode())>>
        : std::is_convertible<decltype(std::declval<const T&>().encode()), std::string> {};

template <typename T, typename = void>
struct has_decode_member : std::false_type {};

template <typename T>
struct has_decode_member<T, std::void_t<decltype(T::decode(std::declval<const std::string&>()))>>
        : std::is_same<decltype(T::decode(std::declval<const std::string&>())), T> {};

} // namespace detail

// Describes a caller type to the registry: its tag (the type name) and the
// named encode/decode members it offers.
class TypeDescriptor {
public:
    explicit TypeDescriptor(std::string name) : _name(std::move(name)) {}

    const std::string& name() const {
        return _name;
    }

    TypeDescriptor& add_encode_method(const std::string& method, EncodeFn fn) {
        _encode_methods[method] = std::move(fn);
        return *this;
    }
    TypeDescriptor& add_decode_method(const std::string& method, DecodeFn fn) {
        _decode_methods[method] = std::move(fn);
        return *this;
    }

    // nullptr when the type has no member of that name.
    const EncodeFn* encode_method(const std::string& method) const;
    const DecodeFn* decode_method(const std::string& method) const;

    // Picks up `std::string T::encode() const` and
    // `static T T::decode(const std::string&)` when T declares them.
    template <typename T>
    static TypeDescriptor of(const std::string& name) {
        TypeDescriptor desc(name);
        if constexpr (detail::has_encode_member<T>::value) {
            desc.add_encode_method("encode", make_object_encoder<T>(name,
                    [](const T& obj) { return std::string(obj.encode()); }));
        }
        if constexpr (detail::has_decode_member<T>::value) {
            desc.add_decode_method("decode", make_object_decoder<T>(name,
                    [](const std::string& payload) { return T::decode(payload); }));
        }
        return desc;
    }

private:
    std::string _name;
    std::map<std::string, EncodeFn> _encode_methods;
    std::map<std::string, DecodeFn> _decode_methods;
};

// tag -> encoder and tag -> decoder, two independent maps with
// last-write-wins registration. Constructed pre-populated with the built-ins.
class TypeRegistry {
public:
    TypeRegistry();

    // Process-wide registry for containers that opt into sharing.
    static TypeRegistry* default_instance();

    // Tags must be non-empty and free of ':', else VALIDATION_ERROR.
    butil::Status register_encoder(const std::string& type_tag, EncodeFn fn);
    butil::Status register_decoder(const std::string& type_tag, DecodeFn fn);

    // Registers `type` under its name. A side passed as nullptr is taken from
    // the descriptor's member called encode_method / decode_method; a missing
    // member fails with MISSING_CAPABILITY. An invalid name is rejected
    // before either side is touched. The encode side is registered
    // before the decode side is checked and is not rolled back.
    butil::Status extend(const TypeDescriptor& type,
                         EncodeFn encode = nullptr,
                         DecodeFn decode = nullptr,
                         const std::string& encode_method = "encode",
                         const std::string& decode_method = "decode");

    static butil::Status check_type_tag(const std::string& type_tag);

    // Capability check only. An empty method name skips that side.
    static butil::Status check_compliance(const TypeDescriptor& type,
                                          const std::string& encode_method,
                                          const std::string& decode_method);

    // Tag a value is stored under: built-in tag by kind, object tag otherwise.
    static std::string type_tag_of(const Value& value);

    // value -> "tag:payload"
    butil::Status encode(const Value& value, std::string* envelope) const;

    // "tag:payload" -> value. Unknown tags and envelopes without a separator
    // decode to the payload as a string and never fail.
    butil::Status decode(const std::string& envelope, Value* value) const;

    bool has_encoder(const std::string& type_tag) const;
    bool has_decoder(const std::string& type_tag) const;

private:
    void register_builtins();

    mutable std::mutex _mutex;
    std::unordered_map<std::string, EncodeFn> _encoders;
    std::unordered_map<std::string, DecodeFn> _decoders;
};

} // namespace kvdict
