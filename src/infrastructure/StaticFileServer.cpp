#include "infrastructure/StaticFileServer.hpp"
#include "infrastructure/HttpMedia.hpp"
#include "application/MediaRangeService.hpp"
#include <httplib.h>
#include <filesystem>
#include <iostream>

namespace lyricflow::infrastructure {

StaticFileServer::StaticFileServer(const std::string& root)
    : m_root(root), m_server(std::make_unique<httplib::Server>()) {
    m_server->Get(R"(/(.*))", [this](const httplib::Request& req, httplib::Response& res) {
        std::string requested = req.matches[1];
        if (requested.empty()) {
            requested = "index.html";
        }
        std::optional<std::string> range;
        if (req.has_header("Range")) {
            range = req.get_header_value("Range");
        }
        try {
            const std::string path = application::MediaRangeService::ResolveStaticPath(m_root, requested);
            application::MediaResponse media = application::MediaRangeService::PrepareFile(
                path, application::MediaRangeService::ContentTypeFor(path), range);
            SendMedia(media, res);
        } catch (const domain::NotFoundError& e) {
            std::cerr << "[StaticFileServer] " << e.what() << std::endl;
            SendJsonError(res, 404, "File not found");
        } catch (const domain::RangeNotSatisfiableError& e) {
            std::cerr << "[StaticFileServer] " << e.what() << std::endl;
            SendRangeError(e, res);
        }
    });

    m_server->set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        std::string requested = req.path.empty() ? std::string() : req.path.substr(1);
        if (requested.empty()) {
            requested = "index.html";
        }
        return CompleteUnparsedRange(req, res, [this, &requested] {
            return std::filesystem::file_size(application::MediaRangeService::ResolveStaticPath(m_root, requested));
        }, "File not found");
    });

    m_server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << "[StaticFileServer] " << req.method << " " << req.path << " -> " << res.status << std::endl;
    });
}

StaticFileServer::~StaticFileServer() = default;

bool StaticFileServer::listen(const std::string& host, int port) {
    std::cout << "[StaticFileServer] Serving " << m_root << " at http://" << host << ":" << port << std::endl;
    if (!m_server->listen(host, port)) {
        std::cerr << "[StaticFileServer] Could not bind " << host << ":" << port << std::endl;
        return false;
    }
    return true;
}

void StaticFileServer::stop() {
    m_server->stop();
}

} // namespace lyricflow::infrastructure
