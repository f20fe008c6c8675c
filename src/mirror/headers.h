/*
   Copyright The Overlaybd Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Ordered header list, duplicates allowed, names compared case-insensitively.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

bool iequals(std::string_view a, std::string_view b);
bool istarts_with(std::string_view s, std::string_view prefix);

// first value of `key`, empty view when absent
std::string_view find_header(const HeaderList &headers, std::string_view key);
bool has_header(const HeaderList &headers, std::string_view key);
// replaces every occurrence of `key` by a single entry
void set_header(HeaderList &headers, std::string_view key, std::string_view value);
size_t remove_header(HeaderList &headers, std::string_view key);

// connection-management headers that never cross the proxy
bool is_hop_by_hop(std::string_view key);

// host of an absolute http(s) url, with the port when present; empty otherwise
std::string url_host(std::string_view url);
// same path and query on another host, empty when `url` is not absolute http(s)
std::string replace_host(std::string_view url, std::string_view host);
