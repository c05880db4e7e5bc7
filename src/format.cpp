/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "elapsed/format.hpp"
#include "elapsed/logger.hpp"
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <limits>

namespace elapsed {

namespace {

void appendPadded(std::string& out, std::uint64_t value) {
    if (value < 10) {
        out.push_back('0');
    }
    out += std::to_string(value);
}

ParseResult failure(FormatError error, const std::string& message) {
    ParseResult result;
    result.error = error;
    result.message = message;
    return result;
}

std::string quoted(char c) {
    if (std::isprint(static_cast<unsigned char>(c))) {
        return std::string("'") + c + "'";
    }
    char buf[8];
    std::snprintf(buf, sizeof(buf), "'\\x%02x'", static_cast<unsigned>(static_cast<unsigned char>(c)));
    return buf;
}

}

DurationFormat::DurationFormat() {
    pieces_.push_back({Piece::Kind::Literal, "Elapsed: ", 0});
    pieces_.push_back({Piece::Kind::Hours, "", 0});
    pieces_.push_back({Piece::Kind::Literal, ":", 0});
    pieces_.push_back({Piece::Kind::Minutes, "", 0});
    pieces_.push_back({Piece::Kind::Literal, ":", 0});
    pieces_.push_back({Piece::Kind::Seconds, "", 0});
}

ParseResult DurationFormat::parse(const std::string& spec) {
    DurationFormat fmt;
    fmt.pieces_.clear();

    const std::size_t n = spec.size();
    std::size_t i = 0;
    while (i < n) {
        const char c = spec[i++];
        if (c == '%') {
            if (i >= n) {
                return failure(FormatError::BrokenPercent, "'%' not followed by anything");
            }
            const char spec_char = spec[i++];
            switch (spec_char) {
                case 'H': fmt.push(Piece::Kind::Hours); break;
                case 'M': fmt.push(Piece::Kind::Minutes); break;
                case 'S': fmt.push(Piece::Kind::Seconds); break;
                case 's': fmt.push(Piece::Kind::TotalSeconds); break;
                case 'f': fmt.push(Piece::Kind::Subseconds, kDefaultPrecision); break;
                case 'n': fmt.pushChar('\n'); break;
                case 't': fmt.pushChar('\t'); break;
                case 'e': fmt.pushChar('\x1B'); break;
                case '%': fmt.pushChar('%'); break;
                default: {
                    if (!std::isdigit(static_cast<unsigned char>(spec_char))) {
                        return failure(FormatError::InvalidPercent,
                                       "'%' followed by invalid specifier " + quoted(spec_char));
                    }
                    std::uint64_t precision = static_cast<std::uint64_t>(spec_char - '0');
                    while (i < n && std::isdigit(static_cast<unsigned char>(spec[i]))) {
                        precision = precision * 10 + static_cast<std::uint64_t>(spec[i] - '0');
                        if (precision > std::numeric_limits<std::uint32_t>::max()) {
                            return failure(FormatError::PrecisionOverflow,
                                           "numeric overflow while parsing %f precision");
                        }
                        ++i;
                    }
                    if (i >= n || spec[i] != 'f') {
                        return failure(FormatError::InvalidPercent,
                                       "'%' followed by invalid specifier " + quoted(spec_char));
                    }
                    ++i;
                    fmt.push(Piece::Kind::Subseconds, static_cast<std::size_t>(precision));
                    break;
                }
            }
        } else if (c == '\\') {
            if (i >= n) {
                return failure(FormatError::BrokenEscape, "backslash not followed by anything");
            }
            const char esc = spec[i++];
            switch (esc) {
                case 'n': fmt.pushChar('\n'); break;
                case 't': fmt.pushChar('\t'); break;
                case 'e': fmt.pushChar('\x1B'); break;
                case '\\': fmt.pushChar('\\'); break;
                default:
                    return failure(FormatError::InvalidEscape,
                                   "backslash followed by invalid character " + quoted(esc));
            }
        } else {
            fmt.pushChar(c);
        }
    }

    LOG_DEBUG("Parsed format \"" + spec + "\" into " + std::to_string(fmt.pieces_.size()) + " pieces");

    ParseResult result;
    result.ok = true;
    result.format = std::move(fmt);
    return result;
}

std::string DurationFormat::render(std::chrono::nanoseconds elapsed) const {
    if (elapsed.count() < 0) {
        elapsed = std::chrono::nanoseconds::zero();
    }
    const auto secs = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(elapsed).count());
    const auto nanos = static_cast<std::uint64_t>(elapsed.count() % 1'000'000'000);

    std::string out;
    for (const auto& piece : pieces_) {
        switch (piece.kind) {
            case Piece::Kind::Literal:
                out += piece.text;
                break;
            case Piece::Kind::Hours:
                appendPadded(out, secs / 3600);
                break;
            case Piece::Kind::Minutes:
                appendPadded(out, secs / 60 % 60);
                break;
            case Piece::Kind::Seconds:
                appendPadded(out, secs % 60);
                break;
            case Piece::Kind::TotalSeconds:
                out += std::to_string(secs);
                break;
            case Piece::Kind::Subseconds: {
                // Truncate rather than round: rounding up could carry into
                // every higher field.
                std::uint64_t frac = nanos;
                std::uint64_t divisor = 100'000'000;
                for (std::size_t d = 0; d < piece.precision; ++d) {
                    if (divisor > 0) {
                        out.push_back(static_cast<char>('0' + frac / divisor));
                        frac %= divisor;
                        divisor /= 10;
                    } else {
                        out.push_back('0');
                    }
                }
                break;
            }
        }
    }
    return out;
}

bool DurationFormat::operator==(const DurationFormat& other) const noexcept {
    return newlines_ == other.newlines_ && pieces_ == other.pieces_;
}

void DurationFormat::pushChar(char c) {
    if (!pieces_.empty() && pieces_.back().kind == Piece::Kind::Literal) {
        pieces_.back().text.push_back(c);
    } else {
        pieces_.push_back({Piece::Kind::Literal, std::string(1, c), 0});
    }
    if (c == '\n') {
        ++newlines_;
    }
}

void DurationFormat::push(Piece::Kind kind, std::size_t precision) {
    pieces_.push_back({kind, "", precision});
}

}
