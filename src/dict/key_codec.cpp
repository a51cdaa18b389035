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

#include "key_codec.h"

namespace kvdict {

std::string KeyCodec::format_key(const std::string& ns, const std::string& user_key) {
    std::string result;
    result.reserve(ns.size() + 1 + user_key.size());
    result.append(ns);
    result.push_back(KEY_SEPARATOR);
    result.append(user_key);
    return result;
}

std::string KeyCodec::parse_key(const std::string& ns, const std::string& formatted_key) {
    const size_t prefix_len = prefix_length(ns);
    if (formatted_key.size() < prefix_len) {
        return std::string();
    }
    return formatted_key.substr(prefix_len);
}

std::string KeyCodec::scan_pattern(const std::string& ns, const std::string& search_term) {
    std::string result = format_key(ns, search_term);
    result.push_back('*');
    return result;
}

bool KeyCodec::has_glob_meta(const std::string& search_term) {
    return search_term.find_first_of("*?[\\") != std::string::npos;
}

std::string KeyCodec::join_chain(const std::vector<std::string>& chain) {
    std::string result;
    for (size_t i = 0; i < chain.size(); ++i) {
        if (i > 0) {
            result.push_back(KEY_SEPARATOR);
        }
        result.append(chain[i]);
    }
    return result;
}

std::string KeyCodec::insertion_order_key(const std::string& prefix, const std::string& ns) {
    return prefix + "-insertion-order-" + ns;
}

} // namespace kvdict
