/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace elapsed {

enum class FormatError : uint8_t {
    None = 0,
    PrecisionOverflow,
    InvalidPercent,
    BrokenPercent,
    InvalidEscape,
    BrokenEscape
};

struct ParseResult;

/*
 * Parsed status-line template.
 *
 *   %H %M %S   zero-padded hours, minutes within hour, seconds within minute
 *   %s         total whole seconds
 *   %f %<n>f   sub-second digits (6 by default), truncated
 *   %n %t %e   newline, tab, escape (also \n \t \e)
 *   %% \\      literal percent and backslash
 */
class DurationFormat final {
public:
    static constexpr std::size_t kDefaultPrecision = 6;
    static constexpr const char* kDefaultTemplate = "Elapsed: %H:%M:%S";

    // Equivalent to parsing kDefaultTemplate
    DurationFormat();

    [[nodiscard]] static ParseResult parse(const std::string& spec);

    [[nodiscard]] std::string render(std::chrono::nanoseconds elapsed) const;
    [[nodiscard]] std::size_t newlines() const noexcept { return newlines_; }

    bool operator==(const DurationFormat& other) const noexcept;
    bool operator!=(const DurationFormat& other) const noexcept { return !(*this == other); }

private:
    struct Piece {
        enum class Kind : uint8_t { Literal, Hours, Minutes, Seconds, TotalSeconds, Subseconds };

        Kind kind = Kind::Literal;
        std::string text;
        std::size_t precision = 0;

        bool operator==(const Piece& other) const noexcept {
            return kind == other.kind && text == other.text && precision == other.precision;
        }
    };

    void pushChar(char c);
    void push(Piece::Kind kind, std::size_t precision = 0);

    std::vector<Piece> pieces_;
    std::size_t newlines_ = 0;
};

struct ParseResult {
    bool ok = false;
    DurationFormat format;
    FormatError error = FormatError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

}
