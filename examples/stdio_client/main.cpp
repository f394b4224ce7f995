//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/stdio_client/main.cpp
// Purpose: Spawn one stdio MCP server, optionally subscribe to a resource, call a tool with progress
//==========================================================================================================
//
// Usage:
//   mcpio_stdio_client "<config>" [tool] [json-arguments] [--subscribe <uri>] [--timeout-ms <n>]
//
// <config> is a ProcessConfig string, e.g. "command=/usr/bin/my-server; args=--stdio; kill_timeout_ms=2000".
// When omitted, MCPIO_SERVER_CONFIG is used.
//
//==========================================================================================================

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpio/ConnectionManager.h"
#include "mcpio/version.h"

int main(int argc, char** argv) {
    using namespace mcpio;
    Logger::configureFromEnv();

    std::string configText;
    std::string tool;
    std::string toolArgs = "{}";
    std::optional<std::string> subscribeUri;
    std::optional<std::chrono::milliseconds> timeout;
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--subscribe" && i + 1 < argc) {
            subscribeUri = argv[++i];
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            try {
                timeout = std::chrono::milliseconds(std::stoll(argv[++i]));
            } catch (const std::exception& e) {
                std::cerr << "invalid --timeout-ms: " << e.what() << std::endl;
                return 2;
            }
        } else if (positional == 0) {
            configText = arg;
            ++positional;
        } else if (positional == 1) {
            tool = arg;
            ++positional;
        } else {
            toolArgs = arg;
        }
    }
    if (configText.empty()) {
        configText = GetEnvOrDefault("MCPIO_SERVER_CONFIG", "");
    }
    if (configText.empty()) {
        std::cerr << "usage: " << argv[0] << " \"command=...; args=...\" [tool] [json-arguments]"
                  << " [--subscribe <uri>] [--timeout-ms <n>]" << std::endl;
        return 2;
    }

    ProcessConfig config = ParseProcessConfig(configText);
    ConnectionManager manager;
    manager.SetNotificationHandler([](const std::string& server, const std::string& method, const JSONValue& params) {
        std::cout << "[" << server << "] " << method << " " << SerializeJSON(params) << std::endl;
    });
    manager.Subscriptions().SetResourceUpdatedHandler([](const std::string& uri, const std::string& server) {
        std::cout << "[" << server << "] resource updated: " << uri << std::endl;
    });
    manager.SetServerClosedHandler([](const std::string& server, std::optional<int> exitCode) {
        std::cout << "[" << server << "] closed" << (exitCode ? " with exit code " + std::to_string(*exitCode) : "")
                  << std::endl;
    });

    std::cout << CLIENT_NAME << " " << getVersionString() << std::endl;
    int rc = 0;
    try {
        auto caps = manager.Connect("server", config).get();
        auto conn = manager.Get("server");
        auto info = conn->ServerInfo();
        std::cout << "connected to " << (info ? info->name + " " + info->version : std::string("server"))
                  << " (pid " << conn->Pid() << ", subscriptions "
                  << (caps.supportsSubscriptions() ? "supported" : "unsupported") << ")" << std::endl;

        if (subscribeUri) {
            auto outcome = manager.Subscriptions().Subscribe("server", *subscribeUri).get();
            std::cout << "subscribe " << *subscribeUri << ": "
                      << (outcome.success ? "ok" : std::string(errors::outcomeCodeName(outcome.code)) + " " + outcome.message)
                      << std::endl;
        }

        if (!tool.empty()) {
            CallToolOptions opts;
            opts.timeout = timeout;
            const auto started = std::chrono::steady_clock::now();
            opts.onProgress = [started](const ProgressUpdate& update) {
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started);
                std::cout << FormatProgress(update) << " " << FormatElapsedTime(elapsed) << std::endl;
            };
            auto call = conn->CallTool(tool, ParseJSON(toolArgs), std::move(opts));
            auto response = call.response.get();
            if (response.IsError()) {
                std::cout << "error: " << SerializeJSON(response.error.value()) << std::endl;
                rc = 1;
            } else {
                std::cout << SerializeJSON(response.result.value_or(JSONValue(nullptr))) << std::endl;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("stdio_client: {}", e.what());
        rc = 1;
    }

    manager.Shutdown().get();
    return rc;
}
