/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/whisper_model.hpp"
#include "scriba/logger.hpp"
#include "whisper.h"
#include "ggml-backend.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace scriba {

namespace {

// Keep the UI clean: drop progress dots and anything below the filter level.
void filtered_whisper_log(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text || text[0] == '.' || text[0] == '\n' || text[0] == '\0') {
        return;
    }

    static int filter_level = -1;

    if (filter_level == -1) {
        const char* env = std::getenv("WHISPER_LOG_LEVEL");
        filter_level = env ?
            (std::string(env) == "info" ? GGML_LOG_LEVEL_INFO :
             std::string(env) == "warn" ? GGML_LOG_LEVEL_WARN :
             std::string(env) == "debug" ? GGML_LOG_LEVEL_DEBUG :
             GGML_LOG_LEVEL_ERROR) : GGML_LOG_LEVEL_ERROR;
    }

    if (level >= filter_level) {
        fprintf(stderr, "%s", text);
    }
}

uint16_t read_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

struct CallbackState {
    const InferenceHooks* hooks = nullptr;
    int lastProgress = -1;
};

void onWhisperProgress(whisper_context* /*ctx*/, whisper_state* /*state*/, int progress, void* user_data) {
    auto* cb = static_cast<CallbackState*>(user_data);
    if (!cb || !cb->hooks->onProgress || progress <= cb->lastProgress) {
        return;
    }
    cb->lastProgress = progress;
    cb->hooks->onProgress(static_cast<double>(progress));
}

void onWhisperSegment(whisper_context* /*ctx*/, whisper_state* state, int n_new, void* user_data) {
    auto* cb = static_cast<CallbackState*>(user_data);
    if (!cb || !cb->hooks->onSegment) {
        return;
    }
    const int n_segments = whisper_full_n_segments_from_state(state);
    for (int i = n_segments - n_new; i < n_segments; ++i) {
        Segment segment;
        segment.start = whisper_full_get_segment_t0_from_state(state, i) * 0.01;
        segment.end = whisper_full_get_segment_t1_from_state(state, i) * 0.01;
        const char* text = whisper_full_get_segment_text_from_state(state, i);
        segment.text = text ? text : "";
        cb->hooks->onSegment(segment);
    }
}

bool onWhisperAbort(void* user_data) {
    auto* cb = static_cast<CallbackState*>(user_data);
    return cb && cb->hooks->shouldAbort && cb->hooks->shouldAbort();
}

}

void installWhisperLogFilter() {
    static std::once_flag once;
    std::call_once(once, [] {
        whisper_log_set(filtered_whisper_log, nullptr);
        ggml_backend_load_all();
    });
}

bool readWav16k(const std::filesystem::path& path, std::vector<float>& out, std::string& error) {
    std::ifstream f(path, std::ios::binary);
    if (!f.good()) {
        error = "failed to open audio file '" + path.string() + "'";
        return false;
    }

    f.seekg(0, std::ios::end);
    const std::streamoff size = f.tellg();
    if (size <= 0) {
        error = "audio file '" + path.string() + "' is empty";
        return false;
    }
    f.seekg(0, std::ios::beg);

    std::vector<uint8_t> buf(static_cast<size_t>(size));
    f.read(reinterpret_cast<char*>(buf.data()), size);
    if (!f.good()) {
        error = "failed to read audio file '" + path.string() + "'";
        return false;
    }

    if (buf.size() < 44 || std::memcmp(buf.data(), "RIFF", 4) != 0 || std::memcmp(buf.data() + 8, "WAVE", 4) != 0) {
        error = "'" + path.string() + "' is not a RIFF/WAVE file (transcode to 16 kHz WAV first)";
        return false;
    }

    uint16_t audio_format = 0;
    uint16_t num_channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    size_t data_off = 0;
    size_t data_size = 0;

    size_t off = 12;
    while (off + 8 <= buf.size()) {
        const char* tag = reinterpret_cast<const char*>(buf.data() + off);
        const uint32_t chunk_sz = read_u32_le(buf.data() + off + 4);
        const size_t chunk_data_off = off + 8;
        if (chunk_data_off + chunk_sz > buf.size()) {
            // Streamed WAVs often carry a bogus data size; take what is there.
            if (std::memcmp(tag, "data", 4) == 0) {
                data_off = chunk_data_off;
                data_size = buf.size() - chunk_data_off;
            }
            break;
        }

        if (std::memcmp(tag, "fmt ", 4) == 0 && chunk_sz >= 16) {
            audio_format = read_u16_le(buf.data() + chunk_data_off + 0);
            num_channels = read_u16_le(buf.data() + chunk_data_off + 2);
            sample_rate = read_u32_le(buf.data() + chunk_data_off + 4);
            bits_per_sample = read_u16_le(buf.data() + chunk_data_off + 14);
        } else if (std::memcmp(tag, "data", 4) == 0) {
            data_off = chunk_data_off;
            data_size = chunk_sz;
        }

        off = chunk_data_off + chunk_sz;
        if (off & 1) off++;
    }

    if (!data_off || !data_size) {
        error = "'" + path.string() + "' has no data chunk";
        return false;
    }
    if (!sample_rate || !num_channels) {
        error = "'" + path.string() + "' missing fmt chunk";
        return false;
    }
    if (sample_rate != WHISPER_SAMPLE_RATE) {
        error = "'" + path.string() + "' is " + std::to_string(sample_rate) +
                " Hz, expected " + std::to_string(WHISPER_SAMPLE_RATE) + " Hz";
        return false;
    }
    const bool pcm16 = audio_format == 1 && bits_per_sample == 16;
    const bool pcm32 = audio_format == 1 && bits_per_sample == 32;
    const bool f32 = audio_format == 3 && bits_per_sample == 32;
    if (!pcm16 && !pcm32 && !f32) {
        error = "'" + path.string() + "' unsupported WAV encoding (format " +
                std::to_string(audio_format) + ", " + std::to_string(bits_per_sample) + " bits)";
        return false;
    }

    const size_t sample_bytes = bits_per_sample / 8;
    const size_t frame_bytes = num_channels * sample_bytes;
    const size_t n_frames = data_size / frame_bytes;
    out.clear();
    out.reserve(n_frames);

    const uint8_t* data = buf.data() + data_off;
    for (size_t i = 0; i < n_frames; ++i) {
        double sum = 0.0;
        const uint8_t* frame = data + i * frame_bytes;
        for (uint16_t ch = 0; ch < num_channels; ++ch) {
            const uint8_t* p = frame + ch * sample_bytes;
            if (pcm16) {
                int16_t s;
                std::memcpy(&s, p, sizeof(s));
                sum += s / 32768.0;
            } else if (pcm32) {
                int32_t s;
                std::memcpy(&s, p, sizeof(s));
                sum += s / 2147483648.0;
            } else {
                float s;
                std::memcpy(&s, p, sizeof(s));
                sum += s;
            }
        }
        out.push_back(static_cast<float>(sum / num_channels));
    }
    return true;
}

WhisperModel::WhisperModel(std::string name, const std::filesystem::path& modelPath, const WhisperOptions& options)
    : name_(std::move(name)), options_(options) {
    installWhisperLogFilter();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(modelPath, ec)) {
        throw std::runtime_error("Model file not found: " + modelPath.string());
    }

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = options_.useGpu;
    cparams.gpu_device = options_.gpuDevice;

    ctx_ = whisper_init_from_file_with_params(modelPath.c_str(), cparams);
    if (!ctx_) {
        LOG_ERROR("Failed to load model: " + modelPath.string());
        throw std::runtime_error("Failed to load model: " + modelPath.string());
    }

    memoryBytes_ = static_cast<std::uint64_t>(std::filesystem::file_size(modelPath, ec));
    if (ec) {
        memoryBytes_ = 0;
    }
    LOG_DEBUG("whisper context ready for " + name_ + " (" + modelPath.string() + ")");
}

WhisperModel::~WhisperModel() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

std::string WhisperModel::device() const {
    return options_.useGpu ? "gpu:" + std::to_string(options_.gpuDevice) : "cpu";
}

InferenceResult WhisperModel::transcribe(const std::filesystem::path& audioPath, const InferenceHooks& hooks) {
    InferenceResult out;

    std::vector<float> pcm;
    std::string error;
    if (!readWav16k(audioPath, pcm, error)) {
        out.error = error;
        return out;
    }
    if (pcm.empty()) {
        out.error = "audio file '" + audioPath.string() + "' contains no samples";
        return out;
    }

    std::unique_ptr<whisper_state, decltype(&whisper_free_state)> state(whisper_init_state(ctx_), whisper_free_state);
    if (!state) {
        out.error = "Failed to allocate whisper state";
        return out;
    }

    CallbackState cb;
    cb.hooks = &hooks;

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_realtime   = false;
    wparams.print_progress   = false;
    wparams.print_timestamps = false;
    wparams.print_special    = false;
    wparams.translate        = false;
    wparams.n_threads        = options_.threads;
    wparams.language         = options_.language.empty() ? "auto" : options_.language.c_str();
    wparams.detect_language  = false;

    wparams.progress_callback           = onWhisperProgress;
    wparams.progress_callback_user_data = &cb;
    wparams.new_segment_callback           = onWhisperSegment;
    wparams.new_segment_callback_user_data = &cb;
    wparams.abort_callback           = onWhisperAbort;
    wparams.abort_callback_user_data = &cb;

    const int rc = whisper_full_with_state(ctx_, state.get(), wparams, pcm.data(), static_cast<int>(pcm.size()));
    if (hooks.shouldAbort && hooks.shouldAbort()) {
        out.aborted = true;
        out.error = "Transcription aborted";
        return out;
    }
    if (rc != 0) {
        out.error = "whisper_full failed with code " + std::to_string(rc);
        return out;
    }

    const int n_segments = whisper_full_n_segments_from_state(state.get());
    out.result.segments.reserve(n_segments);
    for (int i = 0; i < n_segments; ++i) {
        Segment segment;
        segment.start = whisper_full_get_segment_t0_from_state(state.get(), i) * 0.01;
        segment.end = whisper_full_get_segment_t1_from_state(state.get(), i) * 0.01;
        const char* text = whisper_full_get_segment_text_from_state(state.get(), i);
        segment.text = text ? text : "";
        out.result.text += segment.text;
        out.result.segments.push_back(std::move(segment));
    }
    const char* lang = whisper_lang_str(whisper_full_lang_id_from_state(state.get()));
    out.result.language = lang ? lang : options_.language;
    out.ok = true;

    LOG_INFO("Transcribed " + std::to_string(n_segments) + " segments, " +
             std::to_string(out.result.text.size()) + " chars");
    return out;
}

WhisperModelLoader::WhisperModelLoader(WhisperOptions options) : options_(std::move(options)) {
    installWhisperLogFilter();
}

std::unique_ptr<ModelInstance> WhisperModelLoader::load(const std::string& modelName) {
    auto path = resolveModelPath(options_.modelsDir, modelName);
    return std::make_unique<WhisperModel>(modelName, path, options_);
}

std::string WhisperModelLoader::device() const {
    return options_.useGpu ? "gpu:" + std::to_string(options_.gpuDevice) : "cpu";
}

}
