#include "infrastructure/HttpMedia.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace lyricflow::infrastructure {

namespace {

// Written by httplib from the content provider and the request's range
bool IsTransportHeader(const std::string& name) {
    return name == "Content-Type" || name == "Content-Length" || name == "Content-Range";
}

} // namespace

void SendJsonError(httplib::Response& res, int status, const std::string& message) {
    nlohmann::json body = {{"error", message}};
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void SendRangeError(const domain::RangeNotSatisfiableError& error, httplib::Response& res) {
    res.set_header("Content-Range", "bytes */" + std::to_string(error.fileSize()));
    SendJsonError(res, 416, error.what());
}

void SendMedia(const application::MediaResponse& media, httplib::Response& res) {
    res.status = media.status;
    for (const auto& header : media.headers) {
        if (!IsTransportHeader(header.first)) {
            res.set_header(header.first, header.second);
        }
    }

    if (media.fileSize == 0) {
        res.set_content("", media.contentType);
        return;
    }

    auto reader = std::make_shared<application::ChunkReader>(media.path);
    res.set_content_provider(
        static_cast<size_t>(media.fileSize), media.contentType,
        [reader](size_t offset, size_t length, httplib::DataSink& sink) {
            size_t sent = reader->readChunk(offset, length, [&sink](const char* data, std::size_t size) {
                return sink.write(data, size);
            });
            return sent > 0;
        });
}

httplib::Server::HandlerResponse CompleteUnparsedRange(const httplib::Request& req,
                                                      httplib::Response& res,
                                                      const std::function<std::uintmax_t()>& fileSizeOf,
                                                      const std::string& notFoundMessage) {
    if (res.status != 416 || !res.body.empty()) {
        return httplib::Server::HandlerResponse::Unhandled;
    }
    const std::string header = req.get_header_value("Range");
    try {
        domain::RangeNotSatisfiableError error("Malformed range: " + header, fileSizeOf());
        std::cerr << "[HttpMedia] " << error.what() << std::endl;
        SendRangeError(error, res);
    } catch (const domain::NotFoundError&) {
        SendJsonError(res, 404, notFoundMessage);
    } catch (const std::exception& e) {
        std::cerr << "[HttpMedia] Cannot size " << req.path << ": " << e.what() << std::endl;
        SendJsonError(res, 416, "Malformed range: " + header);
    }
    return httplib::Server::HandlerResponse::Handled;
}

} // namespace lyricflow::infrastructure
