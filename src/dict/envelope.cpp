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

#include "envelope.h"
#include "key_codec.h"

namespace kvdict {

std::string Envelope::format(const std::string& type_tag, const std::string& payload) {
    std::string result;
    result.reserve(type_tag.size() + 1 + payload.size());
    result.append(type_tag);
    result.push_back(KEY_SEPARATOR);
    result.append(payload);
    return result;
}

bool Envelope::split(const std::string& envelope, std::string* type_tag, std::string* payload) {
    const size_t pos = envelope.find(KEY_SEPARATOR);
    if (pos == std::string::npos) {
        if (type_tag) {
            type_tag->clear();
        }
        if (payload) {
            *payload = envelope;
        }
        return false;
    }
    if (type_tag) {
        type_tag->assign(envelope, 0, pos);
    }
    if (payload) {
        payload->assign(envelope, pos + 1, std::string::npos);
    }
    return true;
}

} // namespace kvdict
