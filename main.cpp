#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

#include "app/LyricFlowApp.hpp"

using namespace lyricflow;

namespace {

app::LyricFlowApp* g_app = nullptr;

void HandleSignal(int signum) {
    std::cout << "\n[main] Signal " << signum << " received, stopping server" << std::endl;
    if (g_app) {
        g_app->RequestStop();
    }
}

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config settings.json]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = "settings.json";
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else {
            PrintUsage(argv[0]);
            return 1;
        }
    }

    app::LyricFlowApp lyricFlow(configPath);
    g_app = &lyricFlow;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    int rc = lyricFlow.Run();
    g_app = nullptr;
    return rc;
}
