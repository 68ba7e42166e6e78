/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/sibling.hpp"
#include "scriba/logger.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace scriba {

OllamaNotifier::OllamaNotifier(std::string baseUrl, std::chrono::seconds timeout)
    : baseUrl_(std::move(baseUrl)), timeout_(timeout) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') {
        baseUrl_.pop_back();
    }
}

bool OllamaNotifier::releaseMemory() noexcept {
    try {
        LOG_INFO("Requesting sibling model unload at " + baseUrl_);

        httplib::Client client(baseUrl_);
        client.set_connection_timeout(timeout_);
        client.set_read_timeout(timeout_);
        client.set_write_timeout(timeout_);

        // keep_alive 0 tells Ollama to unload immediately
        nlohmann::json body = {{"model", ""}, {"keep_alive", 0}};
        auto res = client.Post("/api/generate", body.dump(), "application/json");
        if (!res) {
            LOG_INFO("Sibling not reachable (" + httplib::to_string(res.error()) + "), skipping unload");
            return false;
        }

        LOG_INFO("Sibling unload response: " + std::to_string(res->status));
        return res->status >= 200 && res->status < 300;
    } catch (const std::exception& e) {
        LOG_WARN("Could not unload sibling model: " + std::string(e.what()));
        return false;
    }
}

}
