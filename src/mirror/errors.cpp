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
#include "errors.h"

#include <errno.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

const char *error_name(ProxyError err) {
    switch (err) {
    case ProxyError::None:
        return "None";
    case ProxyError::UnresolvedPath:
        return "UnresolvedPath";
    case ProxyError::AuthFailed:
        return "AuthFailed";
    case ProxyError::RateLimited:
        return "RateLimited";
    case ProxyError::TransportError:
        return "TransportError";
    case ProxyError::RedirectExhausted:
        return "RedirectExhausted";
    case ProxyError::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

int error_status(ProxyError err, int transport_errno) {
    switch (err) {
    case ProxyError::None:
        return 200;
    case ProxyError::UnresolvedPath:
        return 404;
    case ProxyError::AuthFailed:
        return 401;
    case ProxyError::RateLimited:
        return 429;
    case ProxyError::TransportError:
        return transport_errno == ETIMEDOUT ? 504 : 502;
    case ProxyError::RedirectExhausted:
        return 502;
    case ProxyError::Cancelled:
        return 503;
    }
    return 500;
}

const char *error_code(ProxyError err) {
    switch (err) {
    case ProxyError::UnresolvedPath:
        return "NAME_UNKNOWN";
    case ProxyError::AuthFailed:
        return "UNAUTHORIZED";
    case ProxyError::RateLimited:
        return "TOOMANYREQUESTS";
    case ProxyError::RedirectExhausted:
        return "BLOB_UNKNOWN";
    default:
        return "UNAVAILABLE";
    }
}

std::string error_body(ProxyError err, std::string_view message) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("errors");
    writer.StartArray();
    writer.StartObject();
    writer.Key("code");
    writer.String(error_code(err));
    writer.Key("message");
    writer.String(message.data(), message.size());
    writer.EndObject();
    writer.EndArray();
    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}
