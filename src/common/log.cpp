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

#include "log.h"
#include "errors.h"

namespace kvdict {

DEFINE_bool(kvdict_enable_debug_log, false, "log every command kvdict sends to the store");

const char* err_code_name(int code) {
	switch (code) {
	case SUCCESS:
		return "SUCCESS";
	case VALIDATION_ERROR:
		return "VALIDATION_ERROR";
	case NOT_FOUND:
		return "NOT_FOUND";
	case MISSING_CAPABILITY:
		return "MISSING_CAPABILITY";
	case TYPE_MISMATCH:
		return "TYPE_MISMATCH";
	case UNSUPPORTED:
		return "UNSUPPORTED";
	case STORE_ERROR:
		return "STORE_ERROR";
	}
	return "UNKNOWN";
}

} // namespace kvdict
