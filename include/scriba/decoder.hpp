/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace scriba {

enum class Phase : uint8_t {
    ModelLoading,
    ModelDownloading,
    ModelLoaded,
    Transcribing,
    Finished
};

struct DurationInfo { double seconds = 0.0; };
struct DeviceInfo { std::string code; std::string message; };
struct PhaseChange { Phase phase = Phase::ModelLoading; std::string message; };
struct ProgressReport { double percent = 0.0; };
struct TimestampProgress { double seconds = 0.0; };
struct ErrorReport { std::string code; std::string message; };
struct CanceledReport { std::string message; };
struct Unrecognized { std::string line; };

using StatusEvent = std::variant<DurationInfo, DeviceInfo, PhaseChange, ProgressReport,
                                 TimestampProgress, ErrorReport, CanceledReport, Unrecognized>;

// Visitor helper for StatusEvent.
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

[[nodiscard]] const char* toString(Phase phase) noexcept;

// Parses "MM:SS.mmm" or "HH:MM:SS.mmm" into seconds.
[[nodiscard]] std::optional<double> parseTimestamp(std::string_view text) noexcept;

// Inverse of parseTimestamp: "MM:SS.mmm", or "HH:MM:SS.mmm" past the first hour.
[[nodiscard]] std::string formatTimestamp(double seconds);

// Drops invalid UTF-8 sequences instead of failing.
[[nodiscard]] std::string sanitizeUtf8(std::string_view bytes);

// Decodes one complete line of the status-line protocol.
[[nodiscard]] StatusEvent decodeLine(std::string_view line);

// Incremental decoder for one output channel. Bytes may arrive in arbitrary
// chunks; a trailing partial line is held until its newline (or finish()).
class StatusStreamDecoder {
public:
    explicit StatusStreamDecoder(std::size_t maxLineBytes = 1 << 20) noexcept
        : maxLineBytes_(maxLineBytes) {}

    [[nodiscard]] std::vector<StatusEvent> feed(std::string_view chunk);
    // End of stream: decodes any unterminated trailing line.
    [[nodiscard]] std::vector<StatusEvent> finish();

    [[nodiscard]] std::size_t pendingBytes() const noexcept { return pending_.size(); }
    [[nodiscard]] std::size_t linesDecoded() const noexcept { return lines_; }

private:
    void emitLine(std::string_view raw, std::vector<StatusEvent>& out);

    std::string pending_;
    std::size_t maxLineBytes_;
    std::size_t lines_ = 0;
    bool finished_ = false;
};

}
