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

#include "type_registry.h"

#include <cmath>
#include <limits>

#include <boost/lexical_cast.hpp>
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include "envelope.h"
#include "key_codec.h"
#include "log.h"

namespace kvdict {

const char* const TAG_STR = "str";
const char* const TAG_INT = "int";
const char* const TAG_FLOAT = "float";
const char* const TAG_BOOL = "bool";
const char* const TAG_NONE = "NoneType";
const char* const TAG_LIST = "list";
const char* const TAG_DICT = "dict";

namespace {

typedef rapidjson::Writer<rapidjson::StringBuffer,
                          rapidjson::UTF8<>,
                          rapidjson::UTF8<>,
                          rapidjson::CrtAllocator,
                          rapidjson::kWriteNanAndInfFlag> JsonWriter;

butil::Status write_json(const Value& value, JsonWriter* writer) {
    switch (value.type()) {
    case Value::NONE:
        writer->Null();
        break;
    case Value::BOOL:
        writer->Bool(value.as_bool());
        break;
    case Value::INT:
        writer->Int64(value.as_int());
        break;
    case Value::DOUBLE:
        writer->Double(value.as_double());
        break;
    case Value::STRING: {
        const std::string& s = value.as_string();
        writer->String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
        break;
    }
    case Value::LIST:
        writer->StartArray();
        for (const auto& item : value.as_list()) {
            butil::Status s = write_json(item, writer);
            if (!s.ok()) {
                return s;
            }
        }
        writer->EndArray();
        break;
    case Value::DICT:
        writer->StartObject();
        for (const auto& kv : value.as_dict()) {
            writer->Key(kv.first.data(), static_cast<rapidjson::SizeType>(kv.first.size()));
            butil::Status s = write_json(kv.second, writer);
            if (!s.ok()) {
                return s;
            }
        }
        writer->EndObject();
        break;
    case Value::OBJECT:
        return butil::Status(TYPE_MISMATCH, "Object of type %s is not JSON serializable",
                value.object_tag().c_str());
    }
    return butil::Status::OK();
}

Value read_json(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return Value();
    }
    if (json.IsBool()) {
        return Value(json.GetBool());
    }
    if (json.IsInt64()) {
        return Value(static_cast<int64_t>(json.GetInt64()));
    }
    if (json.IsNumber()) {
        return Value(json.GetDouble());
    }
    if (json.IsString()) {
        return Value(std::string(json.GetString(), json.GetStringLength()));
    }
    if (json.IsArray()) {
        ValueList list;
        list.reserve(json.Size());
        for (auto it = json.Begin(); it != json.End(); ++it) {
            list.push_back(read_json(*it));
        }
        return Value(std::move(list));
    }
    ValueDict dict;
    for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
        dict[std::string(it->name.GetString(), it->name.GetStringLength())] = read_json(it->value);
    }
    return Value(std::move(dict));
}

butil::Status encode_json(const Value& value, std::string* payload) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    butil::Status s = write_json(value, &writer);
    if (!s.ok()) {
        return s;
    }
    payload->assign(buffer.GetString(), buffer.GetSize());
    return butil::Status::OK();
}

butil::Status decode_json(const std::string& payload, const char* expect_tag, Value* value) {
    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseNanAndInfFlag>(payload.data(), payload.size());
    if (doc.HasParseError()) {
        return butil::Status(VALIDATION_ERROR, "invalid %s payload at offset %zu: %s",
                expect_tag, doc.GetErrorOffset(),
                rapidjson::GetParseError_En(doc.GetParseError()));
    }
    *value = read_json(doc);
    return butil::Status::OK();
}

butil::Status decode_double(const std::string& payload, Value* value) {
    if (payload == "inf" || payload == "infinity") {
        *value = Value(std::numeric_limits<double>::infinity());
        return butil::Status::OK();
    }
    if (payload == "-inf" || payload == "-infinity") {
        *value = Value(-std::numeric_limits<double>::infinity());
        return butil::Status::OK();
    }
    if (payload == "nan") {
        *value = Value(std::numeric_limits<double>::quiet_NaN());
        return butil::Status::OK();
    }
    try {
        *value = Value(boost::lexical_cast<double>(payload));
    } catch (const boost::bad_lexical_cast&) {
        return butil::Status(VALIDATION_ERROR, "invalid float payload '%s'", payload.c_str());
    }
    return butil::Status::OK();
}

} // namespace

const EncodeFn* TypeDescriptor::encode_method(const std::string& method) const {
    auto it = _encode_methods.find(method);
    return it == _encode_methods.end() ? nullptr : &it->second;
}

const DecodeFn* TypeDescriptor::decode_method(const std::string& method) const {
    auto it = _decode_methods.find(method);
    return it == _decode_methods.end() ? nullptr : &it->second;
}

TypeRegistry::TypeRegistry() {
    register_builtins();
}

TypeRegistry* TypeRegistry::default_instance() {
    static TypeRegistry instance;
    return &instance;
}

void TypeRegistry::register_builtins() {
    _encoders[TAG_STR] = [](const Value& v, std::string* payload) {
        *payload = v.as_string();
        return butil::Status::OK();
    };
    _decoders[TAG_STR] = [](const std::string& payload, Value* v) {
        *v = Value(payload);
        return butil::Status::OK();
    };

    _encoders[TAG_INT] = [](const Value& v, std::string* payload) {
        *payload = std::to_string(v.as_int());
        return butil::Status::OK();
    };
    _decoders[TAG_INT] = [](const std::string& payload, Value* v) {
        try {
            *v = Value(boost::lexical_cast<int64_t>(payload));
        } catch (const boost::bad_lexical_cast&) {
            return butil::Status(VALIDATION_ERROR, "invalid int payload '%s'", payload.c_str());
        }
        return butil::Status::OK();
    };

    _encoders[TAG_FLOAT] = [](const Value& v, std::string* payload) {
        *payload = format_double(v.as_double());
        return butil::Status::OK();
    };
    _decoders[TAG_FLOAT] = decode_double;

    _encoders[TAG_BOOL] = [](const Value& v, std::string* payload) {
        *payload = v.as_bool() ? "True" : "False";
        return butil::Status::OK();
    };
    _decoders[TAG_BOOL] = [](const std::string& payload, Value* v) {
        if (payload == "True") {
            *v = Value(true);
        } else if (payload == "False") {
            *v = Value(false);
        } else {
            return butil::Status(VALIDATION_ERROR, "invalid bool payload '%s'", payload.c_str());
        }
        return butil::Status::OK();
    };

    _encoders[TAG_NONE] = [](const Value&, std::string* payload) {
        *payload = "None";
        return butil::Status::OK();
    };
    _decoders[TAG_NONE] = [](const std::string&, Value* v) {
        *v = Value();
        return butil::Status::OK();
    };

    _encoders[TAG_LIST] = encode_json;
    _decoders[TAG_LIST] = [](const std::string& payload, Value* v) {
        return decode_json(payload, TAG_LIST, v);
    };
    _encoders[TAG_DICT] = encode_json;
    _decoders[TAG_DICT] = [](const std::string& payload, Value* v) {
        return decode_json(payload, TAG_DICT, v);
    };
}

butil::Status TypeRegistry::check_type_tag(const std::string& type_tag) {
    if (type_tag.empty() || type_tag.find(KEY_SEPARATOR) != std::string::npos) {
        return butil::Status(VALIDATION_ERROR, "invalid type tag '%s': must be non-empty and not contain '%c'",
                type_tag.c_str(), KEY_SEPARATOR);
    }
    return butil::Status::OK();
}

butil::Status TypeRegistry::register_encoder(const std::string& type_tag, EncodeFn fn) {
    butil::Status s = check_type_tag(type_tag);
    if (!s.ok()) {
        return s;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    _encoders[type_tag] = std::move(fn);
    return butil::Status::OK();
}

butil::Status TypeRegistry::register_decoder(const std::string& type_tag, DecodeFn fn) {
    butil::Status s = check_type_tag(type_tag);
    if (!s.ok()) {
        return s;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    _decoders[type_tag] = std::move(fn);
    return butil::Status::OK();
}

butil::Status TypeRegistry::check_compliance(const TypeDescriptor& type,
                                             const std::string& encode_method,
                                             const std::string& decode_method) {
    if (!encode_method.empty() && type.encode_method(encode_method) == nullptr) {
        return butil::Status(MISSING_CAPABILITY,
                "Class %s does not implement the required %s method.",
                type.name().c_str(), encode_method.c_str());
    }
    if (!decode_method.empty() && type.decode_method(decode_method) == nullptr) {
        return butil::Status(MISSING_CAPABILITY,
                "Class %s does not implement the required %s method.",
                type.name().c_str(), decode_method.c_str());
    }
    return butil::Status::OK();
}

butil::Status TypeRegistry::extend(const TypeDescriptor& type,
                                   EncodeFn encode,
                                   DecodeFn decode,
                                   const std::string& encode_method,
                                   const std::string& decode_method) {
    butil::Status tag_status = check_type_tag(type.name());
    if (!tag_status.ok()) {
        KVDICT_WARNING("extend type %s failed: %s", type.name().c_str(), tag_status.error_cstr());
        return tag_status;
    }
    if (!encode) {
        butil::Status s = check_compliance(type, encode_method, "");
        if (!s.ok()) {
            KVDICT_WARNING("extend type %s failed: %s", type.name().c_str(), s.error_cstr());
            return s;
        }
        encode = *type.encode_method(encode_method);
    }
    butil::Status s = register_encoder(type.name(), std::move(encode));
    if (!s.ok()) {
        return s;
    }

    if (!decode) {
        s = check_compliance(type, "", decode_method);
        if (!s.ok()) {
            KVDICT_WARNING("extend type %s failed after registering its encoder: %s",
                    type.name().c_str(), s.error_cstr());
            return s;
        }
        decode = *type.decode_method(decode_method);
    }
    s = register_decoder(type.name(), std::move(decode));
    if (!s.ok()) {
        return s;
    }
    KVDICT_NOTICE("registered type %s", type.name().c_str());
    return butil::Status::OK();
}

std::string TypeRegistry::type_tag_of(const Value& value) {
    switch (value.type()) {
    case Value::NONE:
        return TAG_NONE;
    case Value::BOOL:
        return TAG_BOOL;
    case Value::INT:
        return TAG_INT;
    case Value::DOUBLE:
        return TAG_FLOAT;
    case Value::STRING:
        return TAG_STR;
    case Value::LIST:
        return TAG_LIST;
    case Value::DICT:
        return TAG_DICT;
    case Value::OBJECT:
        return value.object_tag();
    }
    return TAG_STR;
}

butil::Status TypeRegistry::encode(const Value& value, std::string* envelope) const {
    const std::string tag = type_tag_of(value);
    EncodeFn encoder;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _encoders.find(tag);
        if (it != _encoders.end()) {
            encoder = it->second;
        }
    }
    if (!encoder) {
        return butil::Status(TYPE_MISMATCH, "no encoder registered for type %s", tag.c_str());
    }
    std::string payload;
    butil::Status s = encoder(value, &payload);
    if (!s.ok()) {
        return s;
    }
    *envelope = Envelope::format(tag, payload);
    return butil::Status::OK();
}

butil::Status TypeRegistry::decode(const std::string& envelope, Value* value) const {
    std::string tag;
    std::string payload;
    if (!Envelope::split(envelope, &tag, &payload)) {
        *value = Value(payload);
        return butil::Status::OK();
    }
    DecodeFn decoder;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _decoders.find(tag);
        if (it != _decoders.end()) {
            decoder = it->second;
        }
    }
    if (!decoder) {
        KVDICT_DEBUG("no decoder for type %s, returning payload as string", tag.c_str());
        *value = Value(std::move(payload));
        return butil::Status::OK();
    }
    return decoder(payload, value);
}

bool TypeRegistry::has_encoder(const std::string& type_tag) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _encoders.count(type_tag) > 0;
}

bool TypeRegistry::has_decoder(const std::string& type_tag) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _decoders.count(type_tag) > 0;
}

} // namespace kvdict
