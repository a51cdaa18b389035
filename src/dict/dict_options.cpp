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

#include "dict_options.h"

namespace kvdict {

DEFINE_string(kvdict_namespace, "main", "key prefix of the dict, keys are stored as {ns}:{key}");
DEFINE_int64(kvdict_expire_seconds, 0, "expire applied to every write in seconds, 0 means never expire");
DEFINE_bool(kvdict_preserve_expiration, false, "keep the remaining ttl when overwriting an existing key");
DEFINE_bool(kvdict_raise_on_missing_delete, false, "deleting an absent key is an error");
DEFINE_int32(kvdict_batch_size_hint, 200, "scan count hint and mget/del batch size");
DEFINE_string(kvdict_encode_method, "encode", "member used to encode custom types");
DEFINE_string(kvdict_decode_method, "decode", "member used to decode custom types");

DictOptions DictOptions::from_flags() {
    DictOptions options;
    options.ns = FLAGS_kvdict_namespace;
    if (FLAGS_kvdict_expire_seconds > 0) {
        options.expire = std::chrono::seconds(FLAGS_kvdict_expire_seconds);
    }
    options.preserve_expiration = FLAGS_kvdict_preserve_expiration;
    options.raise_on_missing_delete = FLAGS_kvdict_raise_on_missing_delete;
    if (FLAGS_kvdict_batch_size_hint > 0) {
        options.batch_size_hint = FLAGS_kvdict_batch_size_hint;
    }
    options.encode_method_name = FLAGS_kvdict_encode_method;
    options.decode_method_name = FLAGS_kvdict_decode_method;
    return options;
}

} // namespace kvdict
