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

#include <gflags/gflags.h>
#include <butil/logging.h>
#include <butil/strings/stringprintf.h>

namespace kvdict {
DECLARE_bool(kvdict_enable_debug_log);
} // namespace kvdict

// printf-style logging on top of butil logging.
#define KVDICT_DEBUG(_fmt_, args...)                                              \
	do {                                                                          \
		if (::kvdict::FLAGS_kvdict_enable_debug_log) {                            \
			LOG(INFO) << "[DEBUG] " << butil::string_printf(_fmt_, ##args);       \
		}                                                                         \
	} while (0)

#define KVDICT_NOTICE(_fmt_, args...)                                             \
	do {                                                                          \
		LOG(INFO) << butil::string_printf(_fmt_, ##args);                         \
	} while (0)

#define KVDICT_WARNING(_fmt_, args...)                                            \
	do {                                                                          \
		LOG(WARNING) << butil::string_printf(_fmt_, ##args);                      \
	} while (0)

// Error level, does not abort.
#define KVDICT_FATAL(_fmt_, args...)                                              \
	do {                                                                          \
		LOG(ERROR) << butil::string_printf(_fmt_, ##args);                        \
	} while (0)
