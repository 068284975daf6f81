//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Walter command-line client example (chat, chats, turfs, search, cancel)
//==========================================================================================================

#include "logging/Logger.h"
#include "walter/Client.h"
#include "walter/Config.h"
#include "walter/errors/Errors.h"
#include "walter/version.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

using namespace walter;

namespace {
std::atomic<bool> gInterrupted{false};

void onSignal(int) {
    gInterrupted.store(true);
}
}

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--chat")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            if (a.substr(0, eq) == key) {
                return a.substr(eq + 1);
            }
        }
    }
    return std::nullopt;
}

// Positional arguments (anything not starting with "--")
static std::vector<std::string> positionalArgs(int argc, char** argv) {
    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) != 0) {
            out.push_back(a);
        }
    }
    return out;
}

static void printUsage() {
    std::cerr << "walter_chat " << getVersionString() << "\n"
              << "Usage:\n"
              << "  walter_chat chat <message> [--chat=<id>]\n"
              << "  walter_chat chats\n"
              << "  walter_chat turfs\n"
              << "  walter_chat search [--name=] [--type=] [--os=] [--status=]\n"
              << "  walter_chat cancel <chat_id>\n"
              << "Configuration: WALTER_TOKEN, WALTER_URL, WALTER_TIMEOUT_MS or --config=\"url=...; token=...\"\n";
}

static void printTurf(const Turf& t) {
    std::string label = t.name;
    if (label.empty()) label = t.hostname.value_or(t.id);
    std::cout << (t.status == "online" ? "[online]  " : "[offline] ") << label;
    if (t.os.has_value()) std::cout << " (" << t.os.value() << ")";
    std::cout << " - " << t.kind << "\n";
}

static int run(IClient& client, const std::vector<std::string>& args, int argc, char** argv, std::stop_token st) {
    const std::string& cmd = args[0];
    if (cmd == "chat") {
        if (args.size() < 2) {
            printUsage();
            return 2;
        }
        auto reply = client.Converse(args[1], getArgValue(argc, argv, "--chat"),
            [](const std::string& partial) {
                std::cout << "... " << partial << std::endl;
            }, st).get();
        std::cout << reply.response << "\n\n(chat " << reply.chatId << ")" << std::endl;
        return 0;
    }
    if (cmd == "chats") {
        auto chats = client.ListChats(st).get();
        if (chats.empty()) {
            std::cout << "No chats yet." << std::endl;
        }
        for (const auto& c : chats) {
            std::cout << c.id << "  [" << c.status << "]  " << c.displayName.value_or(c.firstMessage.value_or("(untitled)"));
            if (c.lastActivityAt.has_value()) std::cout << "  " << c.lastActivityAt.value();
            std::cout << "\n";
        }
        return 0;
    }
    if (cmd == "turfs") {
        auto turfs = client.ListTurfs(st).get();
        if (turfs.empty()) {
            std::cout << "No systems connected. Set up a turf in Walter first." << std::endl;
        } else {
            std::cout << turfs.size() << " connected system(s):\n\n";
        }
        for (const auto& t : turfs) printTurf(t);
        return 0;
    }
    if (cmd == "search") {
        TurfSearchFilters f;
        f.name = getArgValue(argc, argv, "--name");
        f.type = getArgValue(argc, argv, "--type");
        f.os = getArgValue(argc, argv, "--os");
        f.status = getArgValue(argc, argv, "--status");
        auto result = client.SearchTurfs(f, st).get();
        std::cout << result.count << " match(es):\n\n";
        for (const auto& t : result.turfs) printTurf(t);
        return 0;
    }
    if (cmd == "cancel") {
        if (args.size() < 2) {
            printUsage();
            return 2;
        }
        auto r = client.CancelProcessing(args[1], st).get();
        std::cout << r.status;
        if (r.message.has_value()) std::cout << ": " << r.message.value();
        std::cout << std::endl;
        return 0;
    }
    printUsage();
    return 2;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevel(LogLevel::LOG_WARN_LEVEL);
    Logger::configureFromEnv();

    auto args = positionalArgs(argc, argv);
    if (args.empty()) {
        printUsage();
        return 2;
    }

    ClientOptions opts;
    try {
        auto cfg = getArgValue(argc, argv, "--config");
        opts = cfg.has_value() ? ClientOptionsFromConfigString(cfg.value()) : ClientOptionsFromEnv();
    } catch (const errors::ConfigError& e) {
        LOG_ERROR("{}", e.what());
        return 2;
    }

    // Ctrl-C cancels the in-flight operation cooperatively
    std::stop_source stopSource;
    std::signal(SIGINT, onSignal);
    std::jthread watcher([&stopSource](std::stop_token watcherStop) {
        while (!watcherStop.stop_requested()) {
            if (gInterrupted.load()) {
                stopSource.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    ClientFactory factory;
    auto client = factory.CreateClient(opts);
    try {
        return run(*client, args, argc, argv, stopSource.get_token());
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        LOG_DEBUG("Command failed: {}", e.what());
        std::cerr << "Error: " << errors::toUserMessage(e) << std::endl;
        return 1;
    }
}
