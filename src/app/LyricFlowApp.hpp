/**
 * @file LyricFlowApp.hpp
 * @brief Main application class of the LyricFlow server.
 */

#pragma once

#include <memory>
#include <string>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace lyricflow::infrastructure {
class HttpApiServer;
}

namespace lyricflow::app {

/**
 * @class LyricFlowApp
 * @brief Orchestrates the server lifecycle: composition, serving and shutdown.
 */
class LyricFlowApp {
public:
    explicit LyricFlowApp(const std::string& configPath);
    ~LyricFlowApp();

    /**
     * @brief Builds the services and serves until stopped.
     * @return Exit code (0 for success).
     */
    int Run();

    /** @brief Makes Run() return. Safe to call from a signal handler thread. */
    void RequestStop();

private:
    /**
     * @brief Loads configuration and wires every service.
     * @return True if initialization succeeded.
     */
    bool Init();

    /** @brief Releases the speech model. Running jobs are not waited for. */
    void Shutdown();

    std::string m_configPath;
    infrastructure::AppConfig m_config;
    application::AppServices m_services;
    std::unique_ptr<infrastructure::HttpApiServer> m_server;
};

} // namespace lyricflow::app
