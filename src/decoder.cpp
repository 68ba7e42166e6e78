/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/decoder.hpp"
#include "scriba/logger.hpp"
#include <cctype>
#include <cstdio>
#include <regex>

#include <nlohmann/json.hpp>

namespace scriba {

namespace {

// [00:01.000 --> 00:06.250] or [01:00:01.000 --> 01:00:06.250]
const std::regex& timestampRangeRegex() {
    static const std::regex re(
        R"(^\[((?:\d{1,2}:)?\d{1,2}:\d{2}\.\d{3})\s*-->\s*((?:\d{1,2}:)?\d{1,2}:\d{2}\.\d{3})\])");
    return re;
}

std::string_view trimView(std::string_view s) {
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
    return s.substr(a, b - a);
}

// "Audio duration: 2785.08s" or "2785.08"
std::optional<double> firstNumber(const std::string& text) {
    static const std::regex numberRe(R"((\d+(\.\d+)?))");
    std::smatch m;
    if (!std::regex_search(text, m, numberRe)) {
        return std::nullopt;
    }
    try {
        return std::stod(m[1].str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string stringField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

std::optional<double> numberField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        return std::nullopt;
    }
    if (it->is_number()) {
        return it->get<double>();
    }
    if (it->is_string()) {
        return firstNumber(it->get<std::string>());
    }
    return std::nullopt;
}

std::optional<StatusEvent> decodeStructured(std::string_view line) {
    if (line.empty() || line.front() != '{') {
        return std::nullopt;
    }
    auto j = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    auto statusIt = j.find("status");
    if (statusIt == j.end() || !statusIt->is_string()) {
        return std::nullopt;
    }

    const std::string status = statusIt->get<std::string>();
    const std::string code = stringField(j, "code");
    const std::string message = stringField(j, "message");

    if (status == "info") {
        if (code == "audio_duration") {
            auto seconds = firstNumber(message);
            if (seconds && *seconds > 0) {
                return StatusEvent{DurationInfo{*seconds}};
            }
            LOG_WARN("Could not parse duration from message: " + message);
            return StatusEvent{Unrecognized{std::string(line)}};
        }
        return StatusEvent{DeviceInfo{code, message}};
    }
    if (status == "loading") return StatusEvent{PhaseChange{Phase::ModelLoading, message}};
    if (status == "downloading") return StatusEvent{PhaseChange{Phase::ModelDownloading, message}};
    if (status == "loading_complete") return StatusEvent{PhaseChange{Phase::ModelLoaded, message}};
    if (status == "started" || status == "transcribing") {
        return StatusEvent{PhaseChange{Phase::Transcribing, message}};
    }
    if (status == "completed") return StatusEvent{PhaseChange{Phase::Finished, message}};
    if (status == "progress") {
        auto percent = numberField(j, "progress");
        if (!percent) {
            return StatusEvent{Unrecognized{std::string(line)}};
        }
        return StatusEvent{ProgressReport{*percent}};
    }
    if (status == "error") {
        return StatusEvent{ErrorReport{code, message.empty() ? "Unknown error from worker" : message}};
    }
    if (status == "canceled") {
        return StatusEvent{CanceledReport{message.empty() ? "Job canceled" : message}};
    }
    return StatusEvent{Unrecognized{std::string(line)}};
}

}

const char* toString(Phase phase) noexcept {
    switch (phase) {
        case Phase::ModelLoading: return "loading";
        case Phase::ModelDownloading: return "downloading";
        case Phase::ModelLoaded: return "loading_complete";
        case Phase::Transcribing: return "transcribing";
        case Phase::Finished: return "completed";
        default: return "unknown";
    }
}

std::optional<double> parseTimestamp(std::string_view text) noexcept {
    try {
        std::vector<std::string> parts;
        std::string current;
        for (char c : text) {
            if (c == ':') {
                parts.push_back(current);
                current.clear();
            } else {
                current.push_back(c);
            }
        }
        parts.push_back(current);

        if (parts.size() == 3) {
            return std::stoi(parts[0]) * 3600.0 + std::stoi(parts[1]) * 60.0 + std::stod(parts[2]);
        }
        if (parts.size() == 2) {
            return std::stoi(parts[0]) * 60.0 + std::stod(parts[1]);
        }
        return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string formatTimestamp(double seconds) {
    if (seconds < 0) {
        seconds = 0;
    }
    const long long totalMs = static_cast<long long>(seconds * 1000.0 + 0.5);
    const long long hours = totalMs / 3'600'000;
    const int minutes = static_cast<int>((totalMs / 60'000) % 60);
    const int secs = static_cast<int>((totalMs / 1000) % 60);
    const int ms = static_cast<int>(totalMs % 1000);

    char buf[48];
    if (hours > 0) {
        std::snprintf(buf, sizeof(buf), "%02lld:%02d:%02d.%03d", hours, minutes, secs, ms);
    } else {
        std::snprintf(buf, sizeof(buf), "%02d:%02d.%03d", minutes, secs, ms);
    }
    return buf;
}

std::string sanitizeUtf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto c = static_cast<unsigned char>(bytes[i]);
        std::size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;

        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            ++i;
            continue;
        }

        bool valid = i + len <= bytes.size();
        for (std::size_t k = 1; valid && k < len; ++k) {
            const auto cc = static_cast<unsigned char>(bytes[i + k]);
            const unsigned char kl = (k == 1) ? lo : 0x80;
            const unsigned char kh = (k == 1) ? hi : 0xBF;
            if (cc < kl || cc > kh) {
                valid = false;
            }
        }

        if (valid) {
            out.append(bytes.substr(i, len));
            i += len;
        } else {
            ++i;
        }
    }
    return out;
}

StatusEvent decodeLine(std::string_view rawLine) {
    std::string clean = sanitizeUtf8(rawLine);
    std::string_view line = trimView(clean);

    if (auto structured = decodeStructured(line)) {
        return *structured;
    }

    std::string text(line);
    std::smatch m;
    if (std::regex_search(text, m, timestampRangeRegex())) {
        if (auto seconds = parseTimestamp(m[2].str())) {
            return TimestampProgress{*seconds};
        }
    }
    return Unrecognized{text};
}

std::vector<StatusEvent> StatusStreamDecoder::feed(std::string_view chunk) {
    std::vector<StatusEvent> out;
    if (finished_) {
        LOG_WARN("Status decoder fed after end of stream");
        return out;
    }

    pending_.append(chunk.data(), chunk.size());

    std::size_t start = 0;
    for (;;) {
        std::size_t nl = pending_.find('\n', start);
        if (nl == std::string::npos) {
            break;
        }
        emitLine(std::string_view(pending_).substr(start, nl - start), out);
        start = nl + 1;
    }
    pending_.erase(0, start);

    if (pending_.size() > maxLineBytes_) {
        LOG_WARN("Discarding oversized status line (" + std::to_string(pending_.size()) + " bytes)");
        pending_.clear();
    }
    return out;
}

std::vector<StatusEvent> StatusStreamDecoder::finish() {
    std::vector<StatusEvent> out;
    if (finished_) {
        return out;
    }
    finished_ = true;
    if (!pending_.empty()) {
        emitLine(pending_, out);
        pending_.clear();
    }
    return out;
}

void StatusStreamDecoder::emitLine(std::string_view raw, std::vector<StatusEvent>& out) {
    // Carriage returns from progress bars
    if (!raw.empty() && raw.back() == '\r') {
        raw.remove_suffix(1);
    }
    ++lines_;
    out.push_back(decodeLine(raw));
}

}
