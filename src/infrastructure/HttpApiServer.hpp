/**
 * @file HttpApiServer.hpp
 * @brief JSON/HTTP surface of the processing pipeline, library and audio streaming.
 */

#pragma once

#include <memory>
#include <string>
#include "application/JobOrchestrator.hpp"
#include "application/MediaRangeService.hpp"
#include "application/SpeechModelManager.hpp"
#include "domain/SongRepository.hpp"

namespace httplib {
class Server;
}

namespace lyricflow::infrastructure {

/**
 * @class HttpApiServer
 * @brief Binds the application services to cpp-httplib routes under /api.
 */
class HttpApiServer {
public:
    HttpApiServer(std::shared_ptr<application::JobOrchestrator> orchestrator,
                  std::shared_ptr<application::MediaRangeService> media,
                  std::shared_ptr<domain::SongRepository> repository,
                  std::shared_ptr<application::SpeechModelManager> models);
    ~HttpApiServer();

    /** @brief Blocks serving requests until stop() is called. Returns false if binding failed. */
    bool listen(const std::string& host, int port);

    /** @brief Binds without serving yet; port 0 picks a free port. Returns the port, -1 on failure. */
    int bind(const std::string& host, int port);

    /** @brief Serves on the bound socket until stop() is called. */
    bool serve();

    void stop();

private:
    void registerRoutes();

    std::shared_ptr<application::JobOrchestrator> m_orchestrator;
    std::shared_ptr<application::MediaRangeService> m_media;
    std::shared_ptr<domain::SongRepository> m_repository;
    std::shared_ptr<application::SpeechModelManager> m_models;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace lyricflow::infrastructure
