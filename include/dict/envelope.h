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

namespace kvdict {

// Store value format:
//   {type_tag}:{payload}
//   - type_tag: tag the value was encoded under (never contains ':')
//   - payload: encoder output, may itself contain ':'
class Envelope {
public:
    static std::string format(const std::string& type_tag, const std::string& payload);

    // Splits on the first ':'. Returns false when there is no separator, in
    // which case type_tag is cleared and payload receives the whole envelope.
    static bool split(const std::string& envelope, std::string* type_tag, std::string* payload);
};

} // namespace kvdict
