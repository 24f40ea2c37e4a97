/**
 * @file StaticFileServer.hpp
 * @brief Serves a directory over HTTP with byte-range support for media players.
 */

#pragma once

#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace lyricflow::infrastructure {

class StaticFileServer {
public:
    explicit StaticFileServer(const std::string& root);
    ~StaticFileServer();

    /** @brief Blocks serving requests until stop() is called. Returns false if binding failed. */
    bool listen(const std::string& host, int port);
    void stop();

private:
    std::string m_root;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace lyricflow::infrastructure
