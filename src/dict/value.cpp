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

#include "value.h"

#include <charconv>
#include <cmath>

namespace kvdict {

namespace {

const std::string& empty_string() {
	static const std::string s;
	return s;
}

const ValueList& empty_list() {
	static const ValueList l;
	return l;
}

const ValueDict& empty_dict() {
	static const ValueDict d;
	return d;
}

void append_quoted(const std::string& s, std::string* out) {
	out->push_back('\'');
	for (char c : s) {
		if (c == '\'' || c == '\\') {
			out->push_back('\\');
		}
		out->push_back(c);
	}
	out->push_back('\'');
}

} // namespace

std::string format_double(double d) {
	if (std::isnan(d)) {
		return "nan";
	}
	if (std::isinf(d)) {
		return d > 0 ? "inf" : "-inf";
	}
	char buf[64];
	auto res = std::to_chars(buf, buf + sizeof(buf), d);
	std::string out(buf, res.ptr);
	if (out.find_first_of(".e") == std::string::npos) {
		out.append(".0");
	}
	return out;
}

Value::Value(ValueList list) : _type(LIST), _list(std::make_shared<ValueList>(std::move(list))) {
}

Value::Value(ValueDict dict) : _type(DICT), _dict(std::make_shared<ValueDict>(std::move(dict))) {
}

const std::string& Value::as_string() const {
	return _type == STRING ? _str : empty_string();
}

const ValueList& Value::as_list() const {
	return _type == LIST && _list ? *_list : empty_list();
}

const ValueDict& Value::as_dict() const {
	return _type == DICT && _dict ? *_dict : empty_dict();
}

const std::string& Value::object_tag() const {
	return _type == OBJECT ? _str : empty_string();
}

bool Value::operator==(const Value& other) const {
	if (_type != other._type) {
		return false;
	}
	switch (_type) {
	case NONE:
		return true;
	case BOOL:
		return _bool == other._bool;
	case INT:
		return _int == other._int;
	case DOUBLE:
		return _double == other._double;
	case STRING:
		return _str == other._str;
	case LIST:
		return as_list() == other.as_list();
	case DICT:
		return as_dict() == other.as_dict();
	case OBJECT:
		return _str == other._str && _object == other._object;
	}
	return false;
}

const char* Value::type_name(Type type) {
	switch (type) {
	case NONE:
		return "none";
	case BOOL:
		return "bool";
	case INT:
		return "int";
	case DOUBLE:
		return "float";
	case STRING:
		return "string";
	case LIST:
		return "list";
	case DICT:
		return "dict";
	case OBJECT:
		return "object";
	}
	return "unknown";
}

std::string Value::debug_string() const {
	std::string out;
	append_debug_string(&out);
	return out;
}

void Value::append_debug_string(std::string* out) const {
	switch (_type) {
	case NONE:
		out->append("None");
		break;
	case BOOL:
		out->append(_bool ? "True" : "False");
		break;
	case INT:
		out->append(std::to_string(_int));
		break;
	case DOUBLE:
		out->append(format_double(_double));
		break;
	case STRING:
		append_quoted(_str, out);
		break;
	case LIST: {
		out->push_back('[');
		bool first = true;
		for (const auto& item : as_list()) {
			if (!first) {
				out->append(", ");
			}
			first = false;
			item.append_debug_string(out);
		}
		out->push_back(']');
		break;
	}
	case DICT: {
		out->push_back('{');
		bool first = true;
		for (const auto& kv : as_dict()) {
			if (!first) {
				out->append(", ");
			}
			first = false;
			append_quoted(kv.first, out);
			out->append(": ");
			kv.second.append_debug_string(out);
		}
		out->push_back('}');
		break;
	}
	case OBJECT:
		out->append("<").append(_str).append(" object>");
		break;
	}
}

} // namespace kvdict
