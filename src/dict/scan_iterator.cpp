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

#include "scan_iterator.h"

#include "command_builder.h"
#include "errors.h"
#include "log.h"

namespace kvdict {

void ScanIterator::seek() {
    _cursor = "0";
    _finished = false;
    _page.clear();
    _pos = 0;
    _status = butil::Status::OK();
    fill();
}

void ScanIterator::next() {
    if (!valid()) {
        return;
    }
    if (++_pos < _page.size()) {
        return;
    }
    _page.clear();
    _pos = 0;
    fill();
}

void ScanIterator::fill() {
    while (_page.empty() && !_finished) {
        StoreReply reply;
        _status = _client->execute(CommandBuilder::build_scan(_cursor, _pattern, _count_hint), &reply);
        ++_round_trips;
        if (!_status.ok()) {
            return;
        }
        if (reply.is_error()) {
            _status = butil::Status(STORE_ERROR, "%s", reply.str.c_str());
            return;
        }
        // [next_cursor, [key, ...]]
        if (!reply.is_array() || reply.elements.size() != 2
                || !reply.elements[0].is_string() || !reply.elements[1].is_array()) {
            _status = butil::Status(STORE_ERROR, "malformed SCAN reply for pattern %s", _pattern.c_str());
            return;
        }
        _cursor = reply.elements[0].str;
        _finished = (_cursor == "0");
        for (const auto& item : reply.elements[1].elements) {
            if (item.str.size() < _strip_len) {
                KVDICT_WARNING("scan of %s returned short key %s", _pattern.c_str(), item.str.c_str());
                continue;
            }
            _page.push_back(item.str.substr(_strip_len));
        }
    }
}

} // namespace kvdict
