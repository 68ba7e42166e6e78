/*
 * scriba - Transcription daemon (scribad)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/config.hpp"
#include "scriba/executor.hpp"
#include "scriba/logger.hpp"
#include "scriba/orchestrator.hpp"
#include "scriba/probe.hpp"
#include "scriba/sibling.hpp"
#include "scriba/transcript.hpp"
#include "scriba/whisper_model.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

using namespace scriba;
using json = nlohmann::json;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage() {
    std::cout << "scribad " << VERSION << " - transcription job daemon\n\n";
    std::cout << "  scribad [--host <addr>] [--port <n>] [--models <dir>] [--process]\n\n";
    std::cout << "  POST /transcribe        multipart 'file' (+ 'model_name')\n";
    std::cout << "  GET  /status/<job-id>   job record\n";
    std::cout << "  POST /cancel/<job-id>   request cancellation\n";
    std::cout << "  POST /model/unload      drop the idle model\n";
    std::cout << "  GET  /model/status      model slot\n";
    std::cout << "  GET  /health\n\n";
    std::cout << "  Settings come from SCRIBA_* environment variables; flags override them.\n";
}

void sendJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void sendDetail(httplib::Response& res, int status, const std::string& detail) {
    sendJson(res, status, json{{"detail", detail}});
}

json modelStatusJson(const ModelStatus& status) {
    json j;
    j["loaded"] = status.loaded;
    j["model_name"] = status.modelName ? json(*status.modelName) : json(nullptr);
    j["device"] = status.device;
    j["memory_used_mb"] = status.memoryUsedMb ? json(*status.memoryUsedMb) : json(nullptr);
    j["last_used"] = status.lastUsedAt ? json(toEpochSeconds(*status.lastUsedAt)) : json(nullptr);
    j["idle_timeout_seconds"] = status.idleTimeoutSeconds;
    j["active_jobs"] = status.activeJobs;
    return j;
}

// Reads a text form field from either multipart parts or url-encoded params.
std::string formField(const httplib::Request& req, const std::string& key) {
    if (req.has_file(key)) {
        return req.get_file_value(key).content;
    }
    if (req.has_param(key)) {
        return req.get_param_value(key);
    }
    return {};
}

std::filesystem::path uploadPath(const std::filesystem::path& dir, const std::string& filename) {
    static std::atomic<unsigned long> counter{0};
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();

    std::string ext = std::filesystem::path(filename).extension().string();
    if (ext.size() > 8) {
        ext.clear();
    }
    return dir / ("upload_" + std::to_string(ns) + "_" + std::to_string(counter.fetch_add(1)) + ext);
}

OrchestratorDeps buildDeps(const ServiceConfig& config) {
    OrchestratorDeps deps;
    deps.probe = std::make_shared<FfprobeDurationProbe>(config.ffprobeBinary);
    if (!config.siblingUrl.empty()) {
        deps.sibling = std::make_shared<OllamaNotifier>(config.siblingUrl);
    }

    if (config.execution == ExecutionMode::Process) {
        deps.loader = std::make_shared<WorkerModelLoader>(config.modelsDir);
        ProcessExecutor::Options options;
        options.workerBinary = config.workerBinary;
        options.grace = config.terminationGrace;
        deps.executor = std::make_shared<ProcessExecutor>(options);
    } else {
        WhisperOptions options;
        options.modelsDir = config.modelsDir;
        options.useGpu = config.gpuLayers > 0;
        options.threads = config.threads;
        options.language = config.language;
        deps.loader = std::make_shared<WhisperModelLoader>(options);
        deps.executor = std::make_shared<InProcessExecutor>();
    }
    return deps;
}

void registerRoutes(httplib::Server& svr, JobOrchestrator& orchestrator) {
    const ServiceConfig& config = orchestrator.config();

    svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
        sendJson(res, 200, json{{"service", "scriba"}, {"version", VERSION}});
    });

    svr.Get("/health", [&orchestrator](const httplib::Request&, httplib::Response& res) {
        auto model = orchestrator.modelStatus();
        sendJson(res, 200, json{
            {"status", "ok"},
            {"execution", toString(orchestrator.config().execution)},
            {"live_jobs", orchestrator.liveJobs()},
            {"model_loaded", model.loaded},
        });
    });

    svr.Post("/transcribe", [&orchestrator, &config](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_file("file")) {
            sendDetail(res, 400, "No 'file' field in the request");
            return;
        }
        const auto& upload = req.get_file_value("file");
        if (upload.content.empty()) {
            sendDetail(res, 400, "Uploaded file is empty");
            return;
        }

        std::string modelName = formField(req, "model_name");
        if (modelName.empty()) {
            modelName = config.defaultModel;
        }

        auto path = uploadPath(config.inputDir(), upload.filename);
        {
            std::ofstream out(path, std::ios::binary);
            out.write(upload.content.data(), static_cast<std::streamsize>(upload.content.size()));
            if (!out) {
                LOG_ERROR("Could not write upload to " + path.string());
                sendDetail(res, 500, "Could not store uploaded file");
                return;
            }
        }

        auto result = orchestrator.submit(SubmitRequest{path, modelName, true});
        if (!result) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            sendDetail(res, result.error == ErrorCode::InvalidInput ? 400 : 503, result.message);
            return;
        }

        sendJson(res, 200, json{
            {"job_id", result.id},
            {"status", toString(JobStatus::Queued)},
            {"message", result.message},
        });
    });

    svr.Get(R"(/status/([^/]+))", [&orchestrator](const httplib::Request& req, httplib::Response& res) {
        auto record = orchestrator.status(req.matches[1].str());
        if (!record) {
            sendDetail(res, 404, "Job not found");
            return;
        }
        sendJson(res, 200, json(*record));
    });

    svr.Post(R"(/cancel/([^/]+))", [&orchestrator](const httplib::Request& req, httplib::Response& res) {
        const std::string id = req.matches[1].str();
        switch (orchestrator.cancel(id)) {
            case CancelOutcome::NotFound:
                sendDetail(res, 404, "Job not found");
                return;
            case CancelOutcome::AlreadyTerminal: {
                auto record = orchestrator.status(id);
                sendDetail(res, 400, std::string("Job already finished with status ") +
                                     (record ? toString(record->status) : "unknown"));
                return;
            }
            case CancelOutcome::AlreadyCanceling:
            case CancelOutcome::Accepted:
                sendJson(res, 200, json{
                    {"job_id", id},
                    {"status", toString(JobStatus::Canceling)},
                    {"message", "Cancellation requested"},
                });
                return;
        }
    });

    svr.Post("/model/unload", [&orchestrator](const httplib::Request&, httplib::Response& res) {
        auto before = orchestrator.modelStatus();
        if (!before.loaded) {
            sendJson(res, 200, json{{"unloaded", false}, {"message", "No model loaded"}});
            return;
        }
        if (orchestrator.unloadModel()) {
            sendJson(res, 200, json{{"unloaded", true}, {"message", "Model '" + before.modelName.value_or("") + "' unloaded"}});
        } else {
            sendJson(res, 409, json{{"unloaded", false}, {"message", "Model is in use by active jobs"}});
        }
    });

    svr.Get("/model/status", [&orchestrator](const httplib::Request&, httplib::Response& res) {
        sendJson(res, 200, modelStatusJson(orchestrator.modelStatus()));
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "Unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            // reported below as an unknown exception
        }
        LOG_ERROR("Handler for " + req.path + " failed: " + what);
        sendDetail(res, 500, "Internal server error");
    });
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();
    setThreadName("Main");

    ServiceConfig config = ServiceConfig::fromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        if (arg == "--port" && i + 1 < argc) {
            try {
                config.port = std::stoi(argv[++i]);
                if (config.port < 1 || config.port > 65535) {
                    std::cerr << "Error: Invalid port\n";
                    return 1;
                }
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid port\n";
                return 1;
            }
        } else if (arg == "--host" && i + 1 < argc) {
            config.host = argv[++i];
        } else if (arg == "--models" && i + 1 < argc) {
            config.modelsDir = argv[++i];
        } else if (arg == "--process") {
            config.execution = ExecutionMode::Process;
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        JobOrchestrator orchestrator(config, buildDeps(config));
        if (!orchestrator.start()) {
            LOG_ERROR("Failed to start orchestrator");
            return 1;
        }

        httplib::Server svr;
        registerRoutes(svr, orchestrator);

        if (!svr.bind_to_port(config.host, config.port)) {
            LOG_ERROR("Couldn't bind to " + config.host + ":" + std::to_string(config.port));
            orchestrator.shutdown();
            return 1;
        }

        std::atomic<bool> listenerDone{false};
        std::thread listener([&svr, &listenerDone] {
            setThreadName("Http");
            if (!svr.listen_after_bind()) {
                LOG_WARN("HTTP listener stopped unexpectedly");
            }
            listenerDone.store(true);
        });

        LOG_INFO("scribad " + std::string(VERSION) + " listening on http://" + config.host + ":" +
                 std::to_string(config.port) + " (" + toString(config.execution) + ")");

        while (!g_shutdown_requested && !listenerDone.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Shutdown requested, stopping server...");
        svr.stop();
        if (listener.joinable()) {
            listener.join();
        }
        orchestrator.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
