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

enum class ProxyError {
    None,
    UnresolvedPath,
    AuthFailed,
    RateLimited,
    TransportError,
    RedirectExhausted,
    Cancelled,
};

const char *error_name(ProxyError err);

// status sent to the client when no upstream response is available;
// a timed out transport (ETIMEDOUT) maps to 504
int error_status(ProxyError err, int transport_errno = 0);

// Registry API error code, e.g. NAME_UNKNOWN
const char *error_code(ProxyError err);

// {"errors":[{"code":...,"message":...}]}
std::string error_body(ProxyError err, std::string_view message);
