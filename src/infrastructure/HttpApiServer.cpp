#include "infrastructure/HttpApiServer.hpp"
#include "infrastructure/HttpMedia.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <regex>

namespace lyricflow::infrastructure {

using json = nlohmann::json;

namespace {

const char* const kAudioRoute = R"(/api/audio/([^/]+))";

void SendJson(httplib::Response& res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

} // namespace

HttpApiServer::HttpApiServer(std::shared_ptr<application::JobOrchestrator> orchestrator,
                             std::shared_ptr<application::MediaRangeService> media,
                             std::shared_ptr<domain::SongRepository> repository,
                             std::shared_ptr<application::SpeechModelManager> models)
    : m_orchestrator(std::move(orchestrator))
    , m_media(std::move(media))
    , m_repository(std::move(repository))
    , m_models(std::move(models))
    , m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

HttpApiServer::~HttpApiServer() = default;

void HttpApiServer::registerRoutes() {
    httplib::Server& svr = *m_server;

    svr.Get("/api/library", [this](const httplib::Request&, httplib::Response& res) {
        json library = json::array();
        for (const auto& record : m_repository->loadLibrary()) {
            library.push_back(JsonCodec::ToJson(record));
        }
        SendJson(res, library);
    });

    svr.Post("/api/process", [this](const httplib::Request& req, httplib::Response& res) {
        json body;
        try {
            body = json::parse(req.body);
        } catch (const json::exception& e) {
            std::cerr << "[HttpApiServer] Bad /api/process body: " << e.what() << std::endl;
            SendJsonError(res, 400, "Invalid JSON body");
            return;
        }
        if (!body.is_object()) {
            SendJsonError(res, 400, "Invalid JSON body");
            return;
        }

        std::string url;
        bool translate = false;
        std::optional<std::string> language;
        try {
            url = body.value("url", std::string());
            translate = body.value("translate", false);
            if (body.contains("language") && body["language"].is_string() &&
                !body["language"].get<std::string>().empty()) {
                language = body["language"].get<std::string>();
            }
        } catch (const json::exception& e) {
            SendJsonError(res, 400, std::string("Invalid request field: ") + e.what());
            return;
        }

        try {
            application::SubmitOutcome outcome = m_orchestrator->submit(url, translate, language);
            json reply = {{"success", true}, {"song_id", outcome.songId}};
            if (outcome.alreadyProcessed && outcome.metadata) {
                reply["metadata"] = JsonCodec::ToJson(*outcome.metadata);
                reply["already_processed"] = true;
                reply["message"] = "This video has already been processed. Loading existing data...";
            } else {
                reply["processing"] = true;
            }
            SendJson(res, reply);
        } catch (const domain::InvalidSourceError& e) {
            SendJsonError(res, 400, e.what());
        } catch (const std::exception& e) {
            std::cerr << "[HttpApiServer] Submit failed: " << e.what() << std::endl;
            SendJsonError(res, 500, e.what());
        }
    });

    svr.Get(R"(/api/process-status/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        domain::Job job = m_orchestrator->status(req.matches[1]);
        json reply = {{"status", domain::JobStatusToString(job.status)}, {"step", job.step}};
        if (job.status == domain::JobStatus::Error && job.errorDetail) {
            reply["error"] = *job.errorDetail;
        }
        if (job.status == domain::JobStatus::Completed && job.result) {
            reply["metadata"] = JsonCodec::ToJson(*job.result);
        }
        SendJson(res, reply);
    });

    svr.Post("/api/clear-cache", [this](const httplib::Request&, httplib::Response& res) {
        try {
            bool ok = m_models->clearCache();
            SendJson(res, {{"success", ok}, {"message", ok ? "Cache cleared" : "Failed to clear cache"}});
        } catch (const std::exception& e) {
            std::cerr << "[HttpApiServer] Cache clear failed: " << e.what() << std::endl;
            SendJson(res, {{"success", false}, {"message", e.what()}}, 500);
        }
    });

    svr.Get(R"(/api/song/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string songId = req.matches[1];
        auto metadata = m_repository->findMetadata(songId);
        if (!metadata) {
            SendJsonError(res, 404, "Song not found");
            return;
        }
        auto lyrics = m_repository->findSegments(songId);
        SendJson(res, {
            {"metadata", JsonCodec::ToJson(*metadata)},
            {"lyrics", lyrics ? JsonCodec::ToJson(*lyrics) : json::array()}
        });
    });

    svr.Get(kAudioRoute, [this](const httplib::Request& req, httplib::Response& res) {
        std::optional<std::string> range;
        if (req.has_header("Range")) {
            range = req.get_header_value("Range");
        }
        try {
            application::MediaResponse media = m_media->prepare(req.matches[1], range);
            SendMedia(media, res);
        } catch (const domain::NotFoundError&) {
            SendJsonError(res, 404, "Audio file not found");
        } catch (const domain::RangeNotSatisfiableError& e) {
            std::cerr << "[HttpApiServer] " << e.what() << std::endl;
            SendRangeError(e, res);
        }
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "Internal server error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "Non-standard exception";
        }
        std::cerr << "[HttpApiServer] " << req.method << " " << req.path << " failed: " << message << std::endl;
        SendJsonError(res, 500, message);
    });

    svr.set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        static const std::regex audioRoute(kAudioRoute);
        std::smatch match;
        if (!std::regex_match(req.path, match, audioRoute)) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        const std::string songId = match[1];
        return CompleteUnparsedRange(req, res, [this, &songId] {
            return m_media->prepare(songId, std::nullopt).fileSize;
        }, "Audio file not found");
    });

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << "[HttpApiServer] " << req.method << " " << req.path << " -> " << res.status << std::endl;
    });
}

bool HttpApiServer::listen(const std::string& host, int port) {
    return bind(host, port) > 0 && serve();
}

int HttpApiServer::bind(const std::string& host, int port) {
    int bound = port;
    if (port == 0) {
        bound = m_server->bind_to_any_port(host);
    } else if (!m_server->bind_to_port(host, port)) {
        bound = -1;
    }
    if (bound <= 0) {
        std::cerr << "[HttpApiServer] Could not bind " << host << ":" << port << std::endl;
        return -1;
    }
    std::cout << "[HttpApiServer] Listening on http://" << host << ":" << bound << std::endl;
    return bound;
}

bool HttpApiServer::serve() {
    return m_server->listen_after_bind();
}

void HttpApiServer::stop() {
    if (m_server->is_running()) {
        std::cout << "[HttpApiServer] Stopping" << std::endl;
    }
    m_server->stop();
}

} // namespace lyricflow::infrastructure
