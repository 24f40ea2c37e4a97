/**
 * @file StaticServerMain.cpp
 * @brief Serves a directory with byte-range support, for local playback pages.
 */

#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

#include "infrastructure/StaticFileServer.hpp"

using namespace lyricflow;

namespace {
infrastructure::StaticFileServer* g_server = nullptr;

void HandleSignal(int) {
    if (g_server) {
        g_server->stop();
    }
}
} // namespace

int main(int argc, char** argv) {
    int port = 8000;
    std::string root = std::filesystem::current_path().string();
    if (argc > 1) {
        try {
            port = std::stoi(argv[1]);
        } catch (const std::exception&) {
            std::cerr << "Usage: " << argv[0] << " [port] [root]" << std::endl;
            return 1;
        }
    }
    if (argc > 2) {
        root = argv[2];
    }
    if (!std::filesystem::is_directory(root)) {
        std::cerr << "Error: '" << root << "' is not a directory" << std::endl;
        return 1;
    }

    infrastructure::StaticFileServer server(root);
    g_server = &server;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    bool ok = server.listen("0.0.0.0", port);
    g_server = nullptr;
    return ok ? 0 : 1;
}
