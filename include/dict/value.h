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

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

namespace kvdict {

class Value;
typedef std::vector<Value> ValueList;
typedef std::map<std::string, Value> ValueDict;

// Typed value stored in a KvDict.
//
// Built-in kinds map 1:1 to a wire type tag (see TypeRegistry). OBJECT holds a
// caller-defined type together with the tag it was registered under; the
// payload is immutable and shared between copies.
class Value {
public:
	enum Type {
		NONE = 0,
		BOOL,
		INT,
		DOUBLE,
		STRING,
		LIST,
		DICT,
		OBJECT,
	};

	Value() : _type(NONE) {
	}
	Value(std::nullptr_t) : _type(NONE) {
	}
	Value(bool b) : _type(BOOL), _bool(b) {
	}
	Value(int i) : _type(INT), _int(i) {
	}
	Value(int64_t i) : _type(INT), _int(i) {
	}
	Value(double d) : _type(DOUBLE), _double(d) {
	}
	Value(const char* s) : _type(STRING), _str(s) {
	}
	Value(std::string s) : _type(STRING), _str(std::move(s)) {
	}
	Value(ValueList list);
	Value(ValueDict dict);

	// Wraps a caller-defined object registered under type_tag.
	template <typename T>
	static Value object(const std::string& type_tag, T obj) {
		Value v;
		v._type = OBJECT;
		v._str = type_tag;
		v._object = std::make_shared<T>(std::move(obj));
		v._object_type = &typeid(T);
		return v;
	}

	Type type() const {
		return _type;
	}
	bool is_none() const {
		return _type == NONE;
	}
	bool is_bool() const {
		return _type == BOOL;
	}
	bool is_int() const {
		return _type == INT;
	}
	bool is_double() const {
		return _type == DOUBLE;
	}
	bool is_string() const {
		return _type == STRING;
	}
	bool is_list() const {
		return _type == LIST;
	}
	bool is_dict() const {
		return _type == DICT;
	}
	bool is_object() const {
		return _type == OBJECT;
	}

	// Accessors return a zero value when the kind does not match.
	bool as_bool() const {
		return _type == BOOL ? _bool : false;
	}
	int64_t as_int() const {
		return _type == INT ? _int : 0;
	}
	double as_double() const {
		return _type == DOUBLE ? _double : 0.0;
	}
	const std::string& as_string() const;
	const ValueList& as_list() const;
	const ValueDict& as_dict() const;

	// nullptr unless this is an OBJECT holding exactly a T.
	template <typename T>
	const T* as_object() const {
		if (_type != OBJECT || _object_type == nullptr || *_object_type != typeid(T)) {
			return nullptr;
		}
		return static_cast<const T*>(_object.get());
	}

	// Tag an OBJECT was created with, empty otherwise.
	const std::string& object_tag() const;

	// OBJECT values compare by tag and shared instance.
	bool operator==(const Value& other) const;
	bool operator!=(const Value& other) const {
		return !(*this == other);
	}

	// Literal-style rendering, e.g. {'a': [1, 2.5, None, True]}.
	std::string debug_string() const;

	static const char* type_name(Type type);

private:
	void append_debug_string(std::string* out) const;

	Type _type;
	bool _bool = false;
	int64_t _int = 0;
	double _double = 0.0;
	std::string _str; // STRING payload, or the OBJECT tag
	std::shared_ptr<const ValueList> _list;
	std::shared_ptr<const ValueDict> _dict;
	std::shared_ptr<const void> _object;
	const std::type_info* _object_type = nullptr;
};

// Shortest text that parses back to the same double; integral values keep a
// trailing ".0" ("2.0"), non-finite values render as inf, -inf and nan.
std::string format_double(double d);

} // namespace kvdict
