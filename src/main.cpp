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
#include "api_server.h"
#include "mirror_service.h"
#include <CLI/CLI.hpp>
#include <photon/common/alog.h>
#include <photon/common/alog-stdstring.h>
#include <photon/common/utility.h>
#include <photon/io/signal.h>
#include <photon/photon.h>
#include <photon/thread/thread.h>

#include <signal.h>
#include <string>

static bool running = true;

void sigint_handler(int signal = SIGINT) {
    LOG_INFO("signal ` received, stopping", signal);
    running = false;
}

int main(int argc, char **argv) {
    std::string config_path = DEFAULT_CONFIG_PATH;
    int port = 0;
    bool verbose = false;

    CLI::App app{"docker-mirror, a pull-through mirror for Docker Registry V2"};
    app.add_option("-c,--config", config_path, "config file path")->type_name("FILEPATH");
    app.add_option("-p,--port", port, "listen port, overrides the config file")
        ->check(CLI::Range(0, 65535));
    app.add_flag("--verbose", verbose, "debug log level");
    app.set_version_flag("--version", DOCKER_MIRROR_VERSION);
    CLI11_PARSE(app, argc, argv);

    if (photon::init(photon::INIT_EVENT_DEFAULT, photon::INIT_IO_DEFAULT) < 0) {
        LOG_ERROR("failed to init photon");
        return -1;
    }
    DEFER(photon::fini());
    photon::block_all_signal();
    photon::sync_signal(SIGTERM, &sigint_handler);
    photon::sync_signal(SIGINT, &sigint_handler);

    auto mirror = create_mirror_service(config_path.c_str());
    if (mirror == nullptr) {
        LOG_ERROR("failed to create mirror service");
        return -1;
    }
    DEFER(delete mirror);
    if (verbose)
        set_log_output_level(ALOG_DEBUG);

    if (port == 0)
        port = mirror->global_conf.port();
    auto listen_address = mirror->global_conf.listenAddress();
    LOG_INFO("current version: `", DOCKER_MIRROR_VERSION);

    ProxyHandler handler(mirror);
    auto server = new ApiServer(listen_address, port, &handler);
    DEFER(delete server);
    if (!server->ready) {
        LOG_ERROR("failed to start mirror listener on `:`", listen_address, port);
        return -1;
    }

    while (running) {
        photon::thread_usleep(200 * 1000);
    }
    mirror->cancel_all();
    LOG_INFO("main loop exited");
    return 0;
}
