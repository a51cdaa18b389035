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

#include <butil/status.h>

namespace kvdict {

// Error codes carried by butil::Status::error_code().
// 0 is reserved by butil::Status for OK.
enum ErrCode {
	SUCCESS = 0,
	VALIDATION_ERROR = 1,   // key/value too large, undecodable payload
	NOT_FOUND = 2,          // mapping-style key error
	MISSING_CAPABILITY = 3, // type lacks the named encode/decode member
	TYPE_MISMATCH = 4,      // non-mapping operand, unserializable object
	UNSUPPORTED = 5,        // transport cannot scan by prefix
	STORE_ERROR = 6,        // transport failure or error reply
};

const char* err_code_name(int code);

inline bool is_not_found(const butil::Status& status) {
	return status.error_code() == NOT_FOUND;
}

} // namespace kvdict
