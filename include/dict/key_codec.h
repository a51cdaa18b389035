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

#include <string>
#include <vector>

namespace kvdict {

// Separator between namespace and user key, and between chained keys.
constexpr char KEY_SEPARATOR = ':';

// Namespaced key codec
//
// Store key format:
//   {namespace}:{user_key}
//   - no escaping: ':' inside user_key is kept as is, parse() only strips
//     the fixed-length "{namespace}:" prefix
//
// Scan match pattern:
//   {namespace}:{search_term}*
//   - glob metacharacters in search_term reach the store unescaped
class KeyCodec {
public:
    static std::string format_key(const std::string& ns, const std::string& user_key);

    // Strips "{ns}:". A key shorter than the prefix yields an empty string.
    static std::string parse_key(const std::string& ns, const std::string& formatted_key);

    static std::string scan_pattern(const std::string& ns, const std::string& search_term);

    // True when search_term holds a glob metacharacter: * ? [ or backslash.
    static bool has_glob_meta(const std::string& search_term);

    // Joins a key chain with ':' ({"a", "b"} -> "a:b").
    static std::string join_chain(const std::vector<std::string>& chain);

    // Name of the secondary index key kept by an insertion-ordered container.
    static std::string insertion_order_key(const std::string& prefix, const std::string& ns);

    static size_t prefix_length(const std::string& ns) {
        return ns.size() + 1;
    }
};

} // namespace kvdict
