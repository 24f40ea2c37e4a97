#pragma once

#include <httplib.h>
#include <cstdint>
#include <functional>
#include <string>
#include "application/MediaRangeService.hpp"
#include "domain/Errors.hpp"

namespace lyricflow::infrastructure {

/**
 * @brief Writes a prepared media response through cpp-httplib.
 *
 * The content provider is declared over the whole file. For a 206 httplib
 * narrows it to the single requested range itself and writes Content-Range,
 * Content-Length and Content-Type; the values equal the ones in
 * @p media.headers because only ranges httplib reads the same way get here.
 * Every other header of @p media is copied. Chunks are pulled at absolute
 * offsets, at most 8 KiB each.
 */
void SendMedia(const application::MediaResponse& media, httplib::Response& res);

/** @brief 416 with an unsatisfied Content-Range carrying the file size, and a JSON error body. */
void SendRangeError(const domain::RangeNotSatisfiableError& error, httplib::Response& res);

/** @brief JSON `{"error": message}` with @p status. */
void SendJsonError(httplib::Response& res, int status, const std::string& message);

/**
 * @brief Completes the bare 416 httplib sends for a Range header it cannot parse.
 *
 * httplib rejects such requests before routing, so no handler has run. Meant
 * for the server's error handler: anything but an empty-bodied 416 is left
 * alone. @p fileSizeOf returns the size of the requested resource and throws
 * domain::NotFoundError when there is none, which turns the answer into a 404
 * with @p notFoundMessage.
 */
httplib::Server::HandlerResponse CompleteUnparsedRange(const httplib::Request& req,
                                                      httplib::Response& res,
                                                      const std::function<std::uintmax_t()>& fileSizeOf,
                                                      const std::string& notFoundMessage);

} // namespace lyricflow::infrastructure
