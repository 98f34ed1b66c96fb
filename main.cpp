#include "app/CrmTermApp.hpp"

#include <cstdio>
#include <cstring>
#include <filesystem>

namespace {

void PrintUsage(const char* argv0) {
    std::printf("Usage: %s [--data FILE] [--config FILE]\n", argv0);
}

} // namespace

int main(int argc, char** argv) {
    std::filesystem::path dataFile;
    std::filesystem::path configFile;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--data") == 0 && i + 1 < argc) {
            dataFile = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configFile = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else {
            PrintUsage(argv[0]);
            return 2;
        }
    }

    crmterm::app::CrmTermApp app(dataFile, configFile);
    return app.Run();
}
