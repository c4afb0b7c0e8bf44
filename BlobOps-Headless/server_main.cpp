// server_main.cpp - BlobOps headless server
#include <iostream>
#include <atomic>
#include <thread>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>

#include "config/ServerConfig.hpp"
#include "network/ServerNetwork.hpp"
#include "survival/SurvivalSystem.hpp"

using namespace std::chrono_literals;

static std::atomic<bool> g_running{ true };

static void handle_signal(int) {
    g_running = false;
}

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "config/server.yaml";
    std::cout << "BlobOps headless server starting (config=" << configPath << ")...\n";

    ServerConfig config;
    try {
        config = loadServerConfig(configPath);
    }
    catch (const ConfigError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }

    // Handle Ctrl+C and termination signals
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::unique_ptr<ServerNetwork> serverNet;
    try {
        serverNet = std::make_unique<ServerNetwork>(config);
    }
    catch (const std::runtime_error& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }

    if (config.survival.enabled) {
        auto survival = std::make_shared<SurvivalSystem>(config.survival);
        serverNet->Game().setPlayerTickHook([survival](ServerPlayer& player, float dt) {
            if (!player.survival) player.survival = survival->initialStats();
            SurvivalActivity activity;
            activity.moving = player.moving;
            survival->update(*player.survival, dt, activity);
        });
        std::cout << "[game] survival hook enabled\n";
    }

    if (!serverNet->Start()) {
        std::cerr << "Failed to start ServerNetwork on " << config.network.host << ":" << config.network.port << "\n";
        return 1;
    }

    while (g_running && serverNet->IsRunning()) {
        std::this_thread::sleep_for(100ms);
    }

    std::cout << "Shutdown requested. Stopping server...\n";
    serverNet->Stop();
    std::cout << "Server stopped\n";
    return 0;
}
