/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/model.hpp"
#include "scriba/sibling.hpp"
#include "scriba/logger.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace scriba {

std::filesystem::path resolveModelPath(const std::filesystem::path& modelsDir, const std::string& modelName) {
    std::filesystem::path candidate(modelName);
    std::error_code ec;
    if (candidate.has_extension() && std::filesystem::is_regular_file(candidate, ec)) {
        return candidate;
    }
    return modelsDir / ("ggml-" + modelName + ".bin");
}

ModelLease::ModelLease(ModelLease&& other) noexcept
    : manager_(other.manager_), instance_(std::move(other.instance_)) {
    other.manager_ = nullptr;
    other.instance_.reset();
}

ModelLease& ModelLease::operator=(ModelLease&& other) noexcept {
    if (this != &other) {
        release();
        manager_ = other.manager_;
        instance_ = std::move(other.instance_);
        other.manager_ = nullptr;
        other.instance_.reset();
    }
    return *this;
}

void ModelLease::release() noexcept {
    if (manager_ && instance_) {
        instance_.reset();
        manager_->releaseLease();
    }
    manager_ = nullptr;
    instance_.reset();
}

ModelResourceManager::ModelResourceManager(std::shared_ptr<ModelLoader> loader,
                                           std::shared_ptr<SiblingNotifier> sibling,
                                           std::chrono::milliseconds idleTimeout)
    : loader_(std::move(loader)), sibling_(std::move(sibling)), idleTimeout_(idleTimeout) {
    if (!loader_) {
        throw std::invalid_argument("ModelResourceManager requires a model loader");
    }
    timerThread_ = std::thread(&ModelResourceManager::idleLoop, this);
    LOG_DEBUG("Model manager created, idle timeout " + std::to_string(idleTimeout_.count()) + "ms");
}

ModelResourceManager::~ModelResourceManager() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    timerCv_.notify_all();
    if (timerThread_.joinable()) {
        timerThread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (activeRefcount_ > 0) {
        LOG_WARN("Model manager destroyed with " + std::to_string(activeRefcount_) + " active lease(s)");
    }
    instance_.reset();
    modelName_.reset();
}

AcquireResult ModelResourceManager::acquire(const std::string& modelName) {
    AcquireResult out;
    std::lock_guard<std::mutex> lock(mutex_);

    if (instance_ && modelName_ && *modelName_ != modelName) {
        if (activeRefcount_ > 0) {
            out.error = ErrorCode::ResourceBusy;
            out.message = "Cannot switch models while " + std::to_string(activeRefcount_) +
                          " jobs active (loaded: " + *modelName_ + ", requested: " + modelName + ")";
            LOG_WARN(out.message);
            return out;
        }
        LOG_INFO("Switching from " + *modelName_ + " to " + modelName);
        unloadLocked("model switch");
    }

    if (!instance_) {
        if (sibling_) {
            (void)sibling_->releaseMemory();
        }

        LOG_INFO("Loading model '" + modelName + "'...");
        auto start = std::chrono::steady_clock::now();
        try {
            std::unique_ptr<ModelInstance> loaded = loader_->load(modelName);
            if (!loaded) {
                throw std::runtime_error("loader returned no instance");
            }
            instance_ = std::move(loaded);
            modelName_ = modelName;
        } catch (const std::exception& e) {
            instance_.reset();
            modelName_.reset();
            out.error = ErrorCode::ResourceLoadFailed;
            out.message = "Failed to load model '" + modelName + "': " + e.what();
            LOG_ERROR(out.message);
            return out;
        }

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << elapsed;
        LOG_INFO("Model '" + modelName + "' loaded in " + oss.str() + "s");
    }

    disarmIdleTimerLocked();
    ++activeRefcount_;
    lastUsedAt_ = std::chrono::steady_clock::now();
    lastUsedWall_ = Clock::now();

    out.ok = true;
    out.lease = ModelLease(this, instance_);
    return out;
}

void ModelResourceManager::releaseLease() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (activeRefcount_ <= 0) {
        LOG_ERROR("Model lease released with no active holders");
        return;
    }
    --activeRefcount_;
    lastUsedAt_ = std::chrono::steady_clock::now();
    lastUsedWall_ = Clock::now();
    armIdleTimerLocked();
    LOG_DEBUG("Model lease released, active: " + std::to_string(activeRefcount_));
}

bool ModelResourceManager::unload() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (activeRefcount_ > 0) {
        LOG_INFO("Unload refused: " + std::to_string(activeRefcount_) + " jobs active");
        return false;
    }
    return unloadLocked("requested");
}

bool ModelResourceManager::unloadLocked(const char* reason) {
    disarmIdleTimerLocked();
    if (!instance_) {
        return false;
    }

    std::string name = modelName_.value_or("");
    LOG_INFO("Unloading model '" + name + "' (" + reason + ")...");
    // Last owner; freeing the instance releases accelerator memory now.
    instance_.reset();
    modelName_.reset();
    LOG_INFO("Model '" + name + "' unloaded, memory freed");
    return true;
}

void ModelResourceManager::armIdleTimerLocked() {
    ++timerGeneration_;
    if (idleTimeout_.count() <= 0 || activeRefcount_ > 0 || !instance_) {
        idleDeadline_.reset();
    } else {
        idleDeadline_ = lastUsedAt_ + idleTimeout_;
        armedLastUsed_ = lastUsedAt_;
    }
    timerCv_.notify_all();
}

void ModelResourceManager::disarmIdleTimerLocked() {
    ++timerGeneration_;
    idleDeadline_.reset();
    timerCv_.notify_all();
}

void ModelResourceManager::idleLoop() {
    setThreadName("IdleTimer");
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_) {
        if (!idleDeadline_) {
            timerCv_.wait(lock, [this] { return stopping_ || idleDeadline_.has_value(); });
            continue;
        }

        const auto deadline = *idleDeadline_;
        const uint64_t generation = timerGeneration_;
        bool interrupted = timerCv_.wait_until(lock, deadline, [&] {
            return stopping_ || timerGeneration_ != generation;
        });
        if (interrupted) {
            continue;
        }

        idleDeadline_.reset();
        if (activeRefcount_ == 0 && instance_ && lastUsedAt_ == armedLastUsed_) {
            LOG_INFO("Idle timeout (" + std::to_string(idleTimeout_.count()) + "ms), unloading...");
            unloadLocked("idle timeout");
        }
    }
}

ModelStatus ModelResourceManager::status() const {
    ModelStatus out;
    std::lock_guard<std::mutex> lock(mutex_);
    out.loaded = instance_ != nullptr;
    out.modelName = modelName_;
    out.device = instance_ ? instance_->device() : loader_->device();
    if (instance_) {
        out.memoryUsedMb = static_cast<double>(instance_->memoryBytes()) / (1024.0 * 1024.0);
    }
    out.lastUsedAt = lastUsedWall_;
    out.idleTimeoutSeconds = std::chrono::duration<double>(idleTimeout_).count();
    out.activeJobs = activeRefcount_;
    return out;
}

int ModelResourceManager::activeRefcount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeRefcount_;
}

std::optional<std::string> ModelResourceManager::loadedModel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return modelName_;
}

}
