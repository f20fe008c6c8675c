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
#include <vector>
#include "mirror/config_util.h"

#define DEFAULT_CONFIG_PATH "/etc/docker-mirror/config.json"

namespace MirrorConfigNS {

struct RegistryConfig : public ConfigUtils::Config {
    MIRRORCFG_CLASS

    MIRRORCFG_PARA(alias, std::string, "");
    MIRRORCFG_PARA(host, std::string, "");
    MIRRORCFG_PARA(scheme, std::string, "https");
    MIRRORCFG_PARA(defaultNamespace, std::string, "");
    MIRRORCFG_PARA(aliasHosts, std::vector<std::string>);
    MIRRORCFG_PARA(requiresAuth, bool, false);
    MIRRORCFG_PARA(authServer, std::string, "");
    MIRRORCFG_PARA(authService, std::string, "");
    MIRRORCFG_PARA(cdnHosts, std::vector<std::string>);
};

struct RetryConfig : public ConfigUtils::Config {
    MIRRORCFG_CLASS

    MIRRORCFG_PARA(maxAttempts, int, 4);
    MIRRORCFG_PARA(baseDelayMs, int, 500);
    MIRRORCFG_PARA(maxDelayMs, int, 8000);
    MIRRORCFG_PARA(lastResort, bool, true);
};

struct TimeoutConfig : public ConfigUtils::Config {
    MIRRORCFG_CLASS

    MIRRORCFG_PARA(requestTimeoutSec, int, 30);
    MIRRORCFG_PARA(blobTimeoutSec, int, 300);
    MIRRORCFG_PARA(authTimeoutSec, int, 15);
};

struct ExporterConfig : public ConfigUtils::Config {
    MIRRORCFG_CLASS

    MIRRORCFG_PARA(enable, bool, false);
    MIRRORCFG_PARA(uriPrefix, std::string, "/metrics");
    MIRRORCFG_PARA(port, int, 9864);
};

struct CredentialConfig : public ConfigUtils::Config {
    MIRRORCFG_CLASS

    MIRRORCFG_PARA(path, std::string, "");
};

struct LogConfig : public ConfigUtils::Config {
    MIRRORCFG_CLASS

    MIRRORCFG_PARA(logLevel, uint32_t, 1);
    MIRRORCFG_PARA(logPath, std::string, "");
    MIRRORCFG_PARA(logSizeMB, uint32_t, 10);
    MIRRORCFG_PARA(logRotateNum, int, 3);
};

struct GlobalConfig : public ConfigUtils::Config {
    MIRRORCFG_CLASS

    MIRRORCFG_PARA(listenAddress, std::string, "0.0.0.0");
    MIRRORCFG_PARA(port, int, 8080);
    MIRRORCFG_PARA(defaultRegistry, std::string, "docker");
    MIRRORCFG_PARA(hostHintHeader, std::string, "X-Upstream-Registry");
    MIRRORCFG_PARA(userAgents, std::vector<std::string>);
    MIRRORCFG_PARA(tokenCacheSize, int, 1024);
    MIRRORCFG_PARA(retryConfig, RetryConfig);
    MIRRORCFG_PARA(timeoutConfig, TimeoutConfig);
    MIRRORCFG_PARA(credentialConfig, CredentialConfig);
    MIRRORCFG_PARA(logConfig, LogConfig);
    MIRRORCFG_PARA(exporterConfig, ExporterConfig);
    MIRRORCFG_PARA(registries, std::vector<RegistryConfig>);
};

struct AuthConfig : public ConfigUtils::Config {
    MIRRORCFG_CLASS

    MIRRORCFG_PARA(auths, ConfigUtils::Document);
};

} // namespace MirrorConfigNS
