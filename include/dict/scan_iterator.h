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

#include <cstdint>
#include <string>
#include <vector>

#include <butil/status.h>

#include "store_client.h"

namespace kvdict {

// Lazy SCAN cursor walk over keys matching a pattern.
//
//   ScanIterator iter(client, "main:user*", 0, 0);
//   for (iter.seek(); iter.valid(); iter.next()) {
//       use(iter.key());
//   }
//   if (!iter.status().ok()) { ... }
//
// count_hint <= 0 is a full scan (no COUNT). strip_len characters are removed
// from the front of every key. Keys written or deleted during the walk may or
// may not show up.
class ScanIterator {
public:
    ScanIterator(StoreClient* client, std::string pattern, int64_t count_hint, size_t strip_len)
            : _client(client),
              _pattern(std::move(pattern)),
              _count_hint(count_hint),
              _strip_len(strip_len) {}

    // (Re)starts from cursor 0 and positions on the first key.
    void seek();
    bool valid() const {
        return _status.ok() && _pos < _page.size();
    }
    void next();
    const std::string& key() const {
        return _page[_pos];
    }
    const butil::Status& status() const {
        return _status;
    }
    // SCAN round trips issued so far.
    int64_t round_trips() const {
        return _round_trips;
    }

private:
    // Loads pages until one is non-empty or the cursor wraps to 0.
    void fill();

    StoreClient* _client;
    std::string _pattern;
    int64_t _count_hint;
    size_t _strip_len;

    std::string _cursor = "0";
    bool _finished = true;
    std::vector<std::string> _page;
    size_t _pos = 0;
    int64_t _round_trips = 0;
    butil::Status _status;
};

} // namespace kvdict
