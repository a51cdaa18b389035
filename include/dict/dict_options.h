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
#include <optional>
#include <string>

#include <gflags/gflags.h>

namespace kvdict {

DECLARE_string(kvdict_namespace);
DECLARE_int64(kvdict_expire_seconds);
DECLARE_bool(kvdict_preserve_expiration);
DECLARE_bool(kvdict_raise_on_missing_delete);
DECLARE_int32(kvdict_batch_size_hint);
DECLARE_string(kvdict_encode_method);
DECLARE_string(kvdict_decode_method);

// 500MB, the largest string value the store accepts.
constexpr int64_t MAX_STRING_SIZE = 500LL * 1024 * 1024;

struct DictOptions {
    std::string ns = "main";
    std::optional<std::chrono::seconds> expire;
    bool preserve_expiration = false;
    // delete() of an absent key fails with NOT_FOUND instead of being a no-op.
    bool raise_on_missing_delete = false;
    // SCAN COUNT and MGET / DEL chunk size.
    int32_t batch_size_hint = 200;
    int64_t max_string_size = MAX_STRING_SIZE;
    std::string encode_method_name = "encode";
    std::string decode_method_name = "decode";

    static DictOptions from_flags();
};

} // namespace kvdict
