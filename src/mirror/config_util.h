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

#include <photon/common/alog-stdstring.h>
#include <photon/common/utility.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <rapidjson/pointer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <errno.h>
#include <stdio.h>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ConfigUtils {

using Document = rapidjson::Document;
using Value = rapidjson::Value;

class Config : public Document {
public:
    Config() = default;
    Config(Document &&node) : Document(std::move(node)) {}
    Config(Config &&node) : Document(std::move(node)) {}

    // With `optional` set, a missing file leaves an empty object so every
    // accessor falls back to its default.
    bool ParseJSON(const std::string &fn, bool optional = false) {
        FILE *fp = fopen(fn.c_str(), "r");
        if (fp == nullptr) {
            if (optional && errno == ENOENT) {
                LOG_INFO("config file ` not found, using defaults", fn);
                SetObject();
                return true;
            }
            LOG_ERRNO_RETURN(0, false, "error open json file: `", fn);
        }
        DEFER(fclose(fp));
        char readBuffer[65536];
        rapidjson::FileReadStream frs(fp, readBuffer, sizeof(readBuffer));
        if (ParseStream(frs).HasParseError()) {
            LOG_ERROR_RETURN(EINVAL, false, "error parse json: `, offset: `, reason: `", fn,
                             GetErrorOffset(), rapidjson::GetParseError_En(GetParseError()));
        }
        if (!IsObject())
            LOG_ERROR_RETURN(EINVAL, false, "json root of ` is not an object", fn);
        return true;
    }

    bool ParseJSONStream(std::string_view json_stream) {
        if (Parse(json_stream.data(), json_stream.size()).HasParseError()) {
            LOG_ERROR_RETURN(EINVAL, false, "error parse json: `", json_stream);
        }
        return true;
    }

    std::string DumpString() const {
        rapidjson::StringBuffer buffer;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        Accept(writer);
        return buffer.GetString();
    }
};

template <typename T>
struct is_vector : std::false_type {};

template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

// scalar with default, a value of the wrong json type also yields the default
template <typename T, size_t N>
typename std::enable_if<!is_vector<T>::value && !std::is_base_of<Document, T>::value, T>::type
GetResult(Document *j, const char (&path)[N], const T &default_value) {
    const Value *val = rapidjson::GetValueByPointer(*j, path);
    if (!val || !val->Is<T>())
        return default_value;
    return val->Get<T>();
}

// nested section, an absent section becomes an empty object
template <typename T, size_t N>
typename std::enable_if<std::is_base_of<Document, T>::value, T>::type
GetResult(Document *j, const char (&path)[N]) {
    T ret;
    const Value *val = rapidjson::GetValueByPointer(*j, path);
    if (val && val->IsObject())
        ret.CopyFrom(*val, ret.GetAllocator());
    else
        ret.SetObject();
    return ret;
}

template <typename T, size_t N>
typename std::enable_if<is_vector<T>::value &&
                            !std::is_base_of<Document, typename T::value_type>::value,
                        T>::type
GetResult(Document *j, const char (&path)[N]) {
    T ret;
    const Value *val = rapidjson::GetValueByPointer(*j, path);
    if (!val || !val->IsArray())
        return ret;
    for (auto &x : val->GetArray()) {
        if (x.Is<typename T::value_type>())
            ret.emplace_back(x.Get<typename T::value_type>());
    }
    return ret;
}

template <typename T, size_t N>
typename std::enable_if<is_vector<T>::value &&
                            std::is_base_of<Document, typename T::value_type>::value,
                        T>::type
GetResult(Document *j, const char (&path)[N]) {
    T ret;
    const Value *val = rapidjson::GetValueByPointer(*j, path);
    if (!val || !val->IsArray())
        return ret;
    for (auto &x : val->GetArray()) {
        Document node;
        node.CopyFrom(x, node.GetAllocator());
        ret.emplace_back(std::move(node));
    }
    return ret;
}

#define MIRRORCFG_CLASS using ConfigUtils::Config::Config;
#define MIRRORCFG_PARA(paraname, paratype, ...)                                                    \
    paratype paraname() {                                                                          \
        return ConfigUtils::GetResult<paratype>(this, "/" #paraname, ##__VA_ARGS__);               \
    }

} // namespace ConfigUtils
