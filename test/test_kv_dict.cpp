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

#include "fake_store.h"
#include "kv_dict.h"
#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace kvdict {

namespace {

struct Customer {
	std::string name;
	int64_t age = 0;

	std::string encode() const {
		return name + "|" + std::to_string(age);
	}
	static Customer decode(const std::string& s) {
		Customer c;
		size_t pos = s.find('|');
		c.name = s.substr(0, pos);
		c.age = std::stoll(s.substr(pos + 1));
		return c;
	}
};

struct Ticket {
	std::string id;
};

DictOptions make_options(const std::string& ns) {
	DictOptions options;
	options.ns = ns;
	options.max_string_size = 1024;
	return options;
}

} // namespace

class KvDictTest : public ::testing::Test {
protected:
	KvDictTest() : client(&store) {}

	Value must_get(KvDict& dict, const std::string& key) {
		Value value;
		butil::Status s = dict.get_item(key, &value);
		EXPECT_TRUE(s.ok()) << key << ": " << s.error_cstr();
		return value;
	}

	std::string raw(const std::string& key) {
		std::string value;
		store.get_raw(key, &value);
		return value;
	}

	FakeStore store;
	FakeStoreClient client;
};

TEST_F(KvDictTest, SetThenGet) {
	KvDict dict(&client, make_options("t"));
	ASSERT_TRUE(dict.set("a", Value(42)).ok());
	EXPECT_EQ("int:42", raw("t:a"));
	EXPECT_EQ((RedisCommand{"SET", "t:a", "int:42"}), client.commands.back());

	Value value;
	bool found = false;
	ASSERT_TRUE(dict.get("a", &value, &found).ok());
	EXPECT_TRUE(found);
	EXPECT_EQ(Value(42), value);

	ASSERT_TRUE(dict.get("missing", &value, &found).ok());
	EXPECT_FALSE(found);
	EXPECT_EQ(NOT_FOUND, dict.get_item("missing", &value).error_code());

	ASSERT_TRUE(dict.get_or("missing", Value("fallback"), &value).ok());
	EXPECT_EQ(Value("fallback"), value);
}

TEST_F(KvDictTest, AllBuiltinTypesThroughStore) {
	KvDict dict(&client, make_options("t"));
	std::vector<Value> values{
	        Value("text"), Value(""), Value(-12), Value(1.25), Value(true), Value(),
	        Value(ValueList{Value(1), Value("a"), Value()}),
	        Value(ValueDict{{"k", Value(ValueList{Value(false)})}}),
	};
	for (size_t i = 0; i < values.size(); ++i) {
		ASSERT_TRUE(dict.set("k" + std::to_string(i), values[i]).ok());
	}
	for (size_t i = 0; i < values.size(); ++i) {
		EXPECT_EQ(values[i], must_get(dict, "k" + std::to_string(i))) << i;
	}
}

TEST_F(KvDictTest, KeysWithSeparators) {
	KvDict dict(&client, make_options("t"));
	ASSERT_TRUE(dict.set("a:b:c", Value(1)).ok());
	EXPECT_EQ("int:1", raw("t:a:b:c"));
	std::vector<std::string> keys;
	ASSERT_TRUE(dict.keys(&keys).ok());
	EXPECT_EQ((std::vector<std::string>{"a:b:c"}), keys);
}

TEST_F(KvDictTest, SetDefaultWithExpire) {
	DictOptions options = make_options("t");
	options.expire = std::chrono::seconds(60);
	KvDict dict(&client, options);

	Value value;
	ASSERT_TRUE(dict.setdefault("a", Value("x"), &value).ok());
	EXPECT_EQ(Value("x"), value);
	std::optional<int64_t> ttl;
	ASSERT_TRUE(dict.get_ttl("a", &ttl).ok());
	ASSERT_TRUE(ttl.has_value());
	EXPECT_EQ(60, *ttl);

	store.advance_ms(10000);
	ASSERT_TRUE(dict.setdefault("a", Value("y"), &value).ok());
	EXPECT_EQ(Value("x"), value);
	ASSERT_TRUE(dict.get_ttl("a", &ttl).ok());
	EXPECT_EQ(50, *ttl);
	EXPECT_EQ(Value("x"), must_get(dict, "a"));
}

TEST_F(KvDictTest, SetDefaultConvergesAcrossTtlConfigs) {
	DictOptions with_expire = make_options("t");
	with_expire.expire = std::chrono::seconds(30);
	DictOptions preserve = make_options("t");
	preserve.preserve_expiration = true;
	KvDict first(&client, with_expire);
	KvDict second(&client, preserve);

	Value won;
	Value lost;
	ASSERT_TRUE(first.setdefault("race", Value(1), &won).ok());
	ASSERT_TRUE(second.setdefault("race", Value(2), &lost).ok());
	EXPECT_EQ(Value(1), won);
	EXPECT_EQ(won, lost);

	std::optional<int64_t> ttl;
	ASSERT_TRUE(second.get_ttl("race", &ttl).ok());
	EXPECT_EQ(30, *ttl);

	// no expire configured: persistent
	Value value;
	ASSERT_TRUE(second.setdefault("other", Value(3), &value).ok());
	ASSERT_TRUE(second.get_ttl("other", &ttl).ok());
	EXPECT_FALSE(ttl.has_value());
}

TEST_F(KvDictTest, SetDefaultNone) {
	KvDict dict(&client, make_options("t"));
	Value value(5);
	ASSERT_TRUE(dict.setdefault("n", Value(), &value).ok());
	EXPECT_TRUE(value.is_none());
	EXPECT_EQ("NoneType:None", raw("t:n"));
}

TEST_F(KvDictTest, Pop) {
	KvDict dict(&client, make_options("t"));
	Value value;
	ASSERT_TRUE(dict.pop("missing", Value("d"), &value).ok());
	EXPECT_EQ(Value("d"), value);
	EXPECT_EQ(NOT_FOUND, dict.pop("missing", &value).error_code());

	ASSERT_TRUE(dict.set("empty", Value("")).ok());
	ASSERT_TRUE(dict.pop("empty", &value).ok());
	EXPECT_EQ(Value(""), value);
	bool exists = true;
	ASSERT_TRUE(dict.contains("empty", &exists).ok());
	EXPECT_FALSE(exists);
	EXPECT_EQ(3u, client.count_of("GETDEL"));
}

TEST_F(KvDictTest, PopItem) {
	KvDict dict(&client, make_options("t"));
	std::string key;
	Value value;
	EXPECT_EQ(NOT_FOUND, dict.popitem(&key, &value).error_code());

	ASSERT_TRUE(dict.set("a", Value(1)).ok());
	ASSERT_TRUE(dict.set("b", Value(2)).ok());
	std::set<std::string> popped;
	for (int i = 0; i < 2; ++i) {
		ASSERT_TRUE(dict.popitem(&key, &value).ok());
		popped.insert(key);
		EXPECT_EQ(key == "a" ? Value(1) : Value(2), value);
	}
	EXPECT_EQ((std::set<std::string>{"a", "b"}), popped);
	EXPECT_EQ(NOT_FOUND, dict.popitem(&key, &value).error_code());
}

TEST_F(KvDictTest, PopItemRetriesWhenKeyVanishes) {
	KvDict dict(&client, make_options("t"));
	ASSERT_TRUE(dict.set("a", Value(1)).ok());
	ASSERT_TRUE(dict.set("b", Value(2)).ok());

	// another writer deletes the selected key right before our GETDEL
	std::string stolen;
	client.before_execute = [&](const RedisCommand& cmd) {
		if (cmd[0] == "GETDEL" && stolen.empty()) {
			stolen = cmd[1];
			store.execute({"DEL", cmd[1]});
		}
	};
	client.reset_stats();
	std::string key;
	Value value;
	ASSERT_TRUE(dict.popitem(&key, &value).ok());
	ASSERT_FALSE(stolen.empty());
	EXPECT_NE(stolen, "t:" + key);
	EXPECT_EQ(key == "a" ? Value(1) : Value(2), value);
	EXPECT_EQ(2u, client.count_of("GETDEL"));
	int64_t count = -1;
	ASSERT_TRUE(dict.len(&count).ok());
	EXPECT_EQ(0, count);

	// every selection vanishes: NOT_FOUND only once nothing is left to select
	ASSERT_TRUE(dict.set("c", Value(3)).ok());
	ASSERT_TRUE(dict.set("d", Value(4)).ok());
	client.before_execute = [&](const RedisCommand& cmd) {
		if (cmd[0] == "GETDEL") {
			store.execute({"DEL", cmd[1]});
		}
	};
	client.reset_stats();
	butil::Status s = dict.popitem(&key, &value);
	EXPECT_EQ(NOT_FOUND, s.error_code());
	EXPECT_STREQ("popitem(): dictionary is empty", s.error_cstr());
	EXPECT_EQ(2u, client.count_of("GETDEL"));
	client.before_execute = nullptr;
}

TEST_F(KvDictTest, MultiDictStripsPrefix) {
	KvDict dict(&client, make_options("t"));
	ASSERT_TRUE(dict.set("foobar", Value(1)).ok());
	ASSERT_TRUE(dict.set("foobaz", Value(2)).ok());
	ASSERT_TRUE(dict.set("goobar", Value(3)).ok());

	ValueDict result;
	ASSERT_TRUE(dict.multi_dict("foo", &result).ok());
	EXPECT_EQ((ValueDict{{"bar", Value(1)}, {"baz", Value(2)}}), result);

	ASSERT_TRUE(dict.chain_set({"user", "1"}, Value("x")).ok());
	ASSERT_TRUE(dict.chain_set({"user", "2"}, Value("y")).ok());
	ASSERT_TRUE(dict.multi_dict("user", &result).ok());
	EXPECT_EQ((ValueDict{{"1", Value("x")}, {"2", Value("y")}}), result);

	ASSERT_TRUE(dict.multi_dict("nothing", &result).ok());
	EXPECT_TRUE(result.empty());
}

TEST_F(KvDictTest, MultiDictWithPatternKeepsUserKey) {
	KvDict dict(&client, make_options("t"));
	ASSERT_TRUE(dict.set("foobar", Value(1)).ok());
	ASSERT_TRUE(dict.set("fizz", Value(2)).ok());
	ASSERT_TRUE(dict.set("goobar", Value(3)).ok());

	ValueDict result;
	ASSERT_TRUE(dict.multi_dict("f*", &result).ok());
	EXPECT_EQ((ValueDict{{"foobar", Value(1)}, {"fizz", Value(2)}}), result);

	ASSERT_TRUE(dict.multi_dict("[fg]oo", &result).ok());
	EXPECT_EQ((ValueDict{{"foobar", Value(1)}, {"goobar", Value(3)}}), result);
}

TEST_F(KvDictTest, MultiGetAndDel) {
	KvDict dict(&client, make_options("t"));
	ASSERT_TRUE(dict.chain_set({"a", "b", "1"}, Value(1)).ok());
	ASSERT_TRUE(dict.chain_set({"a", "b", "2"}, Value(2)).ok());
	ASSERT_TRUE(dict.chain_set({"a", "c"}, Value(3)).ok());

	ValueList values;
	ASSERT_TRUE(dict.multi_chain_get({"a", "b"}, &values).ok());
	std::sort(values.begin(), values.end(), [](const Value& l, const Value& r) {
		return l.as_int() < r.as_int();
	});
	EXPECT_EQ((ValueList{Value(1), Value(2)}), values);
	ASSERT_TRUE(dict.multi_get("a", &values).ok());
	EXPECT_EQ(3u, values.size());
	EXPECT_EQ(Value(3), must_get(dict, "a:c"));

	Value value;
	ASSERT_TRUE(dict.chain_get({"a", "c"}, &value).ok());
	EXPECT_EQ(Value(3), value);
	EXPECT_EQ(NOT_FOUND, dict.chain_get({"a", "z"}, &value).error_code());

	int64_t deleted = 0;
	ASSERT_TRUE(dict.multi_del("a:b", &deleted).ok());
	EXPECT_EQ(2, deleted);
	ASSERT_TRUE(dict.multi_del("a:b", &deleted).ok());
	EXPECT_EQ(0, deleted);
	ASSERT_TRUE(dict.chain_del({"a", "c"}).ok());

	int64_t count = -1;
	ASSERT_TRUE(dict.len(&count).ok());
	EXPECT_EQ(0, count);
}

TEST_F(KvDictTest, PartialExtendKeepsDefaultDecoder) {
	KvDict dict(&client, make_options("t"));
	EncodeFn enc = make_object_encoder<Ticket>("Ticket", [](const Ticket& t) { return t.id; });
	butil::Status s = dict.extend_type(TypeDescriptor("Ticket"), enc, nullptr);
	EXPECT_EQ(MISSING_CAPABILITY, s.error_code());
	EXPECT_STREQ("Class Ticket does not implement the required decode method.", s.error_cstr());

	ASSERT_TRUE(dict.set("ticket", Value::object("Ticket", Ticket{"T-1"})).ok());
	EXPECT_EQ("Ticket:T-1", raw("t:ticket"));

	store.put_raw("t:foreign", "SomethingElse:payload");
	EXPECT_EQ(Value("payload"), must_get(dict, "foreign"));
	// Ticket has no decoder either
	EXPECT_EQ(Value("T-1"), must_get(dict, "ticket"));
}

TEST_F(KvDictTest, ExtendTypeRoundTrip) {
	KvDict dict(&client, make_options("t"));
	ASSERT_TRUE(dict.extend_type(TypeDescriptor::of<Customer>("Customer")).ok());
	ASSERT_TRUE(dict.set("c", Value::object("Customer", Customer{"Ann", 41})).ok());
	Value value = must_get(dict, "c");
	ASSERT_NE(nullptr, value.as_object<Customer>());
	EXPECT_EQ("Ann", value.as_object<Customer>()->name);
	EXPECT_EQ(41, value.as_object<Customer>()->age);

	// registrations stay on this dict's registry
	KvDict other(&client, make_options("t"));
	Value raw_value = must_get(other, "c");
	EXPECT_EQ(Value("Ann|41"), raw_value);
}

TEST_F(KvDictTest, CustomMethodNames) {
	DictOptions options = make_options("t");
	options.encode_method_name = "to_text";
	options.decode_method_name = "from_text";
	KvDict dict(&client, options);

	TypeDescriptor desc = TypeDescriptor::of<Customer>("Customer");
	EXPECT_EQ(MISSING_CAPABILITY, dict.check_type_compliance(desc).error_code());
	desc.add_encode_method("to_text", make_object_encoder<Customer>("Customer",
	        [](const Customer& c) { return c.name; }));
	desc.add_decode_method("from_text", make_object_decoder<Customer>("Customer",
	        [](const std::string& s) { return Customer{s, 0}; }));
	ASSERT_TRUE(dict.check_type_compliance(desc).ok());
	ASSERT_TRUE(dict.extend_type(desc).ok());
	ASSERT_TRUE(dict.set("c", Value::object("Customer", Customer{"Bo", 9})).ok());
	EXPECT_EQ("Customer:Bo", raw("t:c"));
}

TEST_F(KvDictTest, SharedDefaultRegistry) {
	KvDict first(&client, make_options("t"), TypeRegistry::default_instance());
	KvDict second(&client, make_options("t"), TypeRegistry::default_instance());
	EXPECT_EQ(first.registry(), second.registry());

	KvDict isolated(&client, make_options("t"));
	EXPECT_NE(first.registry(), isolated.registry());
}

TEST_F(KvDictTest, DeleteIsIdempotent) {
	KvDict dict(&client, make_options("t"));
	ASSERT_TRUE(dict.set("a", Value(1)).ok());
	EXPECT_TRUE(dict.remove("a").ok());
	EXPECT_TRUE(dict.remove("a").ok());

	DictOptions strict_options = make_options("t");
	strict_options.raise_on_missing_delete = true;
	KvDict strict(&client, strict_options);
	ASSERT_TRUE(strict.set("a", Value(1)).ok());
	EXPECT_TRUE(strict.remove("a").ok());
	EXPECT_EQ(NOT_FOUND, strict.remove("a").error_code());
}

TEST_F(KvDictTest, SizeBoundary) {
	KvDict dict(&client, make_options("t"));
	const std::string exact(1024, 'k');
	const std::string over(1025, 'k');

	EXPECT_TRUE(dict.set(exact, Value("v")).ok());
	EXPECT_TRUE(dict.set("v", Value(exact)).ok());

	client.reset_stats();
	butil::Status s = dict.set(over, Value("v"));
	EXPECT_EQ(VALIDATION_ERROR, s.error_code());
	EXPECT_STREQ("Invalid input value or key size exceeded the maximum limit.", s.error_cstr());
	EXPECT_EQ(VALIDATION_ERROR, dict.set("v", Value(over)).error_code());
	Value value;
	EXPECT_EQ(VALIDATION_ERROR, dict.setdefault("v2", Value(over), &value).error_code());
	// rejected before anything was sent
	EXPECT_EQ(0, client.round_trips);
	EXPECT_EQ(Value(exact), must_get(dict, "v"));
}

TEST_F(KvDictTest, PreserveExpiration) {
	DictOptions options = make_options("t");
	options.expire = std::chrono::seconds(100);
	options.preserve_expiration = true;
	KvDict dict(&client, options);

	ASSERT_TRUE(dict.set("a", Value(1)).ok());
	store.advance_ms(40000);
	ASSERT_TRUE(dict.set("a", Value(2)).ok());
	EXPECT_EQ((RedisCommand{"SET", "t:a", "int:2", "KEEPTTL"}), client.commands.back());

	std::optional<int64_t> ttl;
	ASSERT_TRUE(dict.get_ttl("a", &ttl).ok());
	EXPECT_EQ(60, *ttl);
	EXPECT_EQ(Value(2), must_get(dict, "a"));

	store.advance_ms(60000);
	bool exists = true;
	ASSERT_TRUE(dict.contains("a", &exists).ok());
	EXPECT_FALSE(exists);
}

TEST_F(KvDictTest, ExpireScopeRestores) {
	KvDict dict(&client, make_options("t"));
	{
		auto scope = dict.expire_at(std::chrono::seconds(5));
		ASSERT_TRUE(dict.set("short", Value(1)).ok());
	}
	EXPECT_FALSE(dict.expire().has_value());
	ASSERT_TRUE(dict.set("long", Value(1)).ok());

	std::optional<int64_t> ttl;
	ASSERT_TRUE(dict.get_ttl("short", &ttl).ok());
	EXPECT_EQ(5, *ttl);
	ASSERT_TRUE(dict.get_ttl("long", &ttl).ok());
	EXPECT_FALSE(ttl.has_value());
	ASSERT_TRUE(dict.get_ttl("absent", &ttl).ok());
	EXPECT_FALSE(ttl.has_value());

	try {
		auto scope = dict.expire_at(std::chrono::seconds(7));
		throw std::runtime_error("abort");
	} catch (const std::runtime_error&) {
	}
	EXPECT_FALSE(dict.expire().has_value());

	store.advance_ms(6000);
	bool exists = true;
	ASSERT_TRUE(dict.contains("short", &exists).ok());
	EXPECT_FALSE(exists);
}

TEST_F(KvDictTest, PipelineBatchesWrites) {
	KvDict dict(&client, make_options("t"));
	client.reset_stats();
	{
		auto scope = dict.pipeline();
		for (int i = 0; i < 10; ++i) {
			ASSERT_TRUE(dict.set("k" + std::to_string(i), Value(i)).ok());
		}
		{
			auto inner = dict.pipeline();
			ASSERT_TRUE(dict.remove("k0").ok());
		}
		// reads go to the store and do not see queued writes
		bool exists = true;
		ASSERT_TRUE(dict.contains("k1", &exists).ok());
		EXPECT_FALSE(exists);
		EXPECT_EQ(11u, dict.pipeline_state().pending());
		ASSERT_TRUE(scope.close().ok());
	}
	EXPECT_EQ(1, client.batches);
	EXPECT_EQ(2, client.round_trips);
	int64_t count = 0;
	ASSERT_TRUE(dict.len(&count).ok());
	EXPECT_EQ(9, count);
}

TEST_F(KvDictTest, PipelineFlushesOnException) {
	KvDict dict(&client, make_options("t"));
	try {
		auto scope = dict.pipeline();
		ASSERT_TRUE(dict.set("a", Value(1)).ok());
		ASSERT_TRUE(dict.set("b", Value(2)).ok());
		throw std::runtime_error("fail in scope");
	} catch (const std::runtime_error&) {
	}
	EXPECT_EQ(Value(1), must_get(dict, "a"));
	EXPECT_EQ(Value(2), must_get(dict, "b"));
}

TEST_F(KvDictTest, StrictDeleteInsidePipeline) {
	DictOptions options = make_options("t");
	options.raise_on_missing_delete = true;
	KvDict dict(&client, options);
	auto scope = dict.pipeline();
	EXPECT_TRUE(dict.remove("never-there").ok());
	EXPECT_TRUE(scope.close().ok());
}

TEST_F(KvDictTest, UpdateAndFromKeys) {
	DictOptions options = make_options("t");
	options.batch_size_hint = 3;
	KvDict dict(&client, options);
	client.reset_stats();
	ASSERT_TRUE(dict.update(ValueDict{{"a", Value(1)}, {"b", Value(2)}, {"c", Value(3)}}).ok());
	EXPECT_EQ(1, client.round_trips);

	EXPECT_EQ(TYPE_MISMATCH, dict.update(Value(ValueList{Value(1)})).error_code());

	ASSERT_TRUE(dict.fromkeys({"x", "y"}, Value("same")).ok());
	EXPECT_EQ(Value("same"), must_get(dict, "y"));
	ASSERT_TRUE(dict.fromkeys({"z"}).ok());
	EXPECT_TRUE(must_get(dict, "z").is_none());

	// a failing item stops the update, earlier items are still sent
	ASSERT_EQ(VALIDATION_ERROR,
	          dict.update(ValueDict{{"ok", Value(1)}, {"too_big", Value(std::string(2000, 'x'))}}).error_code());
	EXPECT_EQ(Value(1), must_get(dict, "ok"));
}

TEST_F(KvDictTest, IterationViews) {
	DictOptions options = make_options("t");
	options.batch_size_hint = 2;
	KvDict dict(&client, options);
	KvDict neighbour(&client, make_options("u"));
	ASSERT_TRUE(neighbour.set("noise", Value(0)).ok());
	for (int i = 0; i < 5; ++i) {
		ASSERT_TRUE(dict.set("k" + std::to_string(i), Value(i)).ok());
	}

	int64_t count = 0;
	ASSERT_TRUE(dict.len(&count).ok());
	EXPECT_EQ(5, count);

	std::vector<std::string> keys;
	ASSERT_TRUE(dict.keys(&keys).ok());
	std::sort(keys.begin(), keys.end());
	EXPECT_EQ((std::vector<std::string>{"k0", "k1", "k2", "k3", "k4"}), keys);

	std::vector<std::string> reversed;
	ASSERT_TRUE(dict.reversed_keys(&reversed).ok());
	ASSERT_TRUE(dict.keys(&keys).ok());
	std::reverse(keys.begin(), keys.end());
	EXPECT_EQ(keys, reversed);

	std::vector<std::pair<std::string, Value>> items;
	ASSERT_TRUE(dict.items(&items).ok());
	EXPECT_EQ(5u, items.size());
	for (const auto& kv : items) {
		EXPECT_EQ(Value(static_cast<int64_t>(kv.first[1] - '0')), kv.second);
	}

	ValueList values;
	ASSERT_TRUE(dict.values(&values).ok());
	EXPECT_EQ(5u, values.size());

	std::set<std::string> iterated;
	ScanIterator iter = dict.key_iterator();
	for (iter.seek(); iter.valid(); iter.next()) {
		iterated.insert(iter.key());
	}
	ASSERT_TRUE(iter.status().ok());
	EXPECT_EQ(5u, iterated.size());

	ValueDict copy;
	ASSERT_TRUE(dict.copy(&copy).ok());
	EXPECT_EQ(Value(4), copy["k4"]);

	std::string text;
	ASSERT_TRUE(dict.debug_string(&text).ok());
	EXPECT_EQ("{'k0': 0, 'k1': 1, 'k2': 2, 'k3': 3, 'k4': 4}", text);

	std::string key;
	bool found = false;
	ASSERT_TRUE(dict.key("k3", &key, &found).ok());
	EXPECT_TRUE(found);
	EXPECT_EQ("k3", key);
	ASSERT_TRUE(dict.key("zz", &key, &found).ok());
	EXPECT_FALSE(found);
}

TEST_F(KvDictTest, ClearOnlyTouchesNamespace) {
	DictOptions options = make_options("t");
	options.batch_size_hint = 4;
	KvDict dict(&client, options);
	KvDict neighbour(&client, make_options("u"));
	ASSERT_TRUE(neighbour.set("keep", Value(1)).ok());
	for (int i = 0; i < 10; ++i) {
		ASSERT_TRUE(dict.set("k" + std::to_string(i), Value(i)).ok());
	}
	client.reset_stats();
	ASSERT_TRUE(dict.clear().ok());
	EXPECT_EQ(1, client.batches);
	EXPECT_EQ(3u, client.count_of("DEL"));

	int64_t count = -1;
	ASSERT_TRUE(dict.len(&count).ok());
	EXPECT_EQ(0, count);
	EXPECT_EQ(Value(1), must_get(neighbour, "keep"));
}

TEST_F(KvDictTest, UnionOperators) {
	KvDict dict(&client, make_options("t"));
	ASSERT_TRUE(dict.set("a", Value(1)).ok());
	ASSERT_TRUE(dict.set("b", Value(2)).ok());
	Value other(ValueDict{{"b", Value(20)}, {"c", Value(30)}});

	ValueDict result;
	ASSERT_TRUE(dict.union_with(other, &result).ok());
	EXPECT_EQ((ValueDict{{"a", Value(1)}, {"b", Value(20)}, {"c", Value(30)}}), result);

	ASSERT_TRUE(dict.reverse_union(other, &result).ok());
	EXPECT_EQ((ValueDict{{"a", Value(1)}, {"b", Value(2)}, {"c", Value(30)}}), result);

	EXPECT_EQ(TYPE_MISMATCH, dict.union_with(Value("str"), &result).error_code());
	EXPECT_EQ(TYPE_MISMATCH, dict.reverse_union(Value(1), &result).error_code());
	EXPECT_EQ(TYPE_MISMATCH, dict.merge(Value(ValueList{})).error_code());

	ASSERT_TRUE(dict.merge(other).ok());
	bool equal = false;
	ASSERT_TRUE(dict.equals(ValueDict{{"a", Value(1)}, {"b", Value(20)}, {"c", Value(30)}}, &equal).ok());
	EXPECT_TRUE(equal);
	ASSERT_TRUE(dict.equals(ValueDict{{"a", Value(1)}}, &equal).ok());
	EXPECT_FALSE(equal);

	KvDict mirror(&client, make_options("m"));
	ASSERT_TRUE(mirror.update(other.as_dict()).ok());
	ASSERT_TRUE(mirror.set("a", Value(1)).ok());
	ASSERT_TRUE(dict.equals(mirror, &equal).ok());
	EXPECT_TRUE(equal);
}

TEST_F(KvDictTest, UnsupportedWithoutScan) {
	KvDict dict(&client, make_options("t"));
	client.scan_enabled = false;
	ValueList values;
	ValueDict result;
	int64_t deleted = 0;
	EXPECT_EQ(UNSUPPORTED, dict.multi_get("a", &values).error_code());
	EXPECT_EQ(UNSUPPORTED, dict.multi_dict("a", &result).error_code());
	EXPECT_EQ(UNSUPPORTED, dict.multi_del("a", &deleted).error_code());
	EXPECT_EQ(UNSUPPORTED, dict.multi_chain_get({"a"}, &values).error_code());
	EXPECT_EQ(0u, client.count_of("SCAN"));
	// single key operations still work
	EXPECT_TRUE(dict.set("a", Value(1)).ok());
}

TEST_F(KvDictTest, StoreErrorsSurface) {
	KvDict dict(&client, make_options("t"));
	store.put_raw("t:bad", "int:abc");
	Value value;
	EXPECT_EQ(VALIDATION_ERROR, dict.get_item("bad", &value).error_code());

	client.fail_transport = true;
	EXPECT_EQ(STORE_ERROR, dict.set("a", Value(1)).error_code());
	EXPECT_EQ(STORE_ERROR, dict.get_item("a", &value).error_code());
	int64_t count = 0;
	EXPECT_EQ(STORE_ERROR, dict.len(&count).error_code());
}

TEST_F(KvDictTest, Info) {
	KvDict dict(&client, make_options("t"));
	std::map<std::string, std::string> fields;
	ASSERT_TRUE(dict.info(&fields).ok());
	EXPECT_EQ("7.2.4", fields["redis_version"]);
	EXPECT_EQ("keys=0", fields["db0"]);
	EXPECT_EQ(0u, fields.count("# Server"));
	EXPECT_EQ("kvdict-insertion-order-t", dict.insertion_order_key());
}

TEST_F(KvDictTest, OptionsFromFlags) {
	FLAGS_kvdict_namespace = "flagged";
	FLAGS_kvdict_expire_seconds = 30;
	FLAGS_kvdict_preserve_expiration = true;
	DictOptions options = DictOptions::from_flags();
	EXPECT_EQ("flagged", options.ns);
	ASSERT_TRUE(options.expire.has_value());
	EXPECT_EQ(30, options.expire->count());
	EXPECT_TRUE(options.preserve_expiration);
	EXPECT_EQ(200, options.batch_size_hint);
	EXPECT_EQ(MAX_STRING_SIZE, options.max_string_size);

	FLAGS_kvdict_expire_seconds = 0;
	EXPECT_FALSE(DictOptions::from_flags().expire.has_value());
	FLAGS_kvdict_namespace = "main";
	FLAGS_kvdict_preserve_expiration = false;
}

} // namespace kvdict

int main(int argc, char* argv[]) {
	testing::InitGoogleTest(&argc, argv);
	google::ParseCommandLineFlags(&argc, &argv, true);
	return RUN_ALL_TESTS();
}
