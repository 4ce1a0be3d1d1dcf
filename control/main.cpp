/**
 * Copyright © 2024 IBM Corporation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include "config.h"

#include "errors.hpp"
#include "json_config.hpp"
#include "json_parser.hpp"
#include "logging.hpp"
#include "manager.hpp"

#include <CLI/CLI.hpp>
#include <phosphor-logging/lg2.hpp>
#include <sdeventplus/event.hpp>
#include <sdeventplus/source/signal.hpp>
#include <stdplus/signal.hpp>

#include <csignal>
#include <functional>
#include <string>

using namespace smfc;
using namespace smfc::control;

int main(int argc, char* argv[])
{
    CLI::App app{"Super Micro fan control"};

    std::string configPath;
    int logLevel = Logger::error;
    app.add_option("-c,--config", configPath, "Configuration file");
    app.add_option("-l,--log-level", logLevel,
                   "Log level: 0 none, 1 error, 2 info, 3 debug")
        ->check(CLI::Range(0, 3));
    app.set_version_flag("-v,--version",
                         std::string{SMFC_APP_NAME} + " " + SMFC_VERSION);

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::Error& e)
    {
        return app.exit(e);
    }

    auto& logger = getLogger();
    logger.setLevel(static_cast<Logger::Level>(logLevel));

    auto event = sdeventplus::Event::get_default();

    try
    {
        auto conf =
            JsonConfig::load(JsonConfig::getConfFile(confFileName, configPath));

        auto fans = getIpmiTool(conf);
        std::shared_ptr<DiskPowerInterface> power;
        if (usesStandbyGuard(conf))
        {
            power = getSmartctl(conf);
        }

        auto zones = getZones(conf, std::make_shared<SysfsSensor>(), fans,
                              power, Clock::now());
        Manager manager(event, fans, std::move(zones));

        // Finish the running tick, then leave the loop
        auto stop = [&event](sdeventplus::source::Signal&,
                             const struct signalfd_siginfo*) {
            event.exit(0);
        };
        stdplus::signal::block(SIGTERM);
        sdeventplus::source::Signal sigTerm(event, SIGTERM, stop);
        stdplus::signal::block(SIGINT);
        sdeventplus::source::Signal sigInt(event, SIGINT, stop);

        // Enable SIGUSR1 handling to dump the debug data
        stdplus::signal::block(SIGUSR1);
        sdeventplus::source::Signal sigUsr1(
            event, SIGUSR1,
            std::bind(&Manager::dumpDebugData, &manager,
                      std::placeholders::_1, std::placeholders::_2));

        manager.start();

        return event.loop();
    }
    // Log the useful metadata on these exceptions and let the app
    // return 1 so it is restarted.
    catch (const ConfigurationError& e)
    {
        lg2::error("Configuration error: {ERROR}", "ERROR", e.what());
    }
    catch (const IOError& e)
    {
        lg2::error("I/O error: {ERROR}", "ERROR", e.what());
    }

    return 1;
}
