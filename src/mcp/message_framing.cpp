#include <devscope/mcp/message_framing.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <istream>
#include <ostream>

namespace devscope::mcp {

namespace framing_detail {

namespace {

bool isWs(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

std::string_view trimLine(std::string_view line) noexcept {
    while (!line.empty() && isWs(static_cast<unsigned char>(line.front()))) {
        line.remove_prefix(1);
    }
    while (!line.empty() && isWs(static_cast<unsigned char>(line.back()))) {
        line.remove_suffix(1);
    }
    return line;
}

bool matchContentLengthHeader(std::string_view line, std::string_view& value) noexcept {
    constexpr std::string_view kName = "content-length";
    line = trimLine(line);
    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return false;
    }
    if (!iequals(trimLine(line.substr(0, colon)), kName)) {
        return false;
    }
    value = trimLine(line.substr(colon + 1));
    return true;
}

} // namespace framing_detail

namespace {

// Header lines other than Content-Length are "Token: value" pairs (e.g. Content-Type)
bool looksLikeHeader(std::string_view line) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    return std::all_of(line.begin(), line.begin() + static_cast<std::ptrdiff_t>(colon),
                       [](unsigned char c) { return std::isalnum(c) || c == '-' || c == '_'; });
}

void stripByteOrderMark(std::string_view& line) {
    if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
        static_cast<unsigned char>(line[1]) == 0xBB &&
        static_cast<unsigned char>(line[2]) == 0xBF) {
        line.remove_prefix(3);
    }
}

Frame framingError(std::string message) {
    Frame f;
    f.status = FrameStatus::FramingError;
    f.error = std::move(message);
    return f;
}

Frame endOfStream(std::string message) {
    Frame f;
    f.status = FrameStatus::EndOfStream;
    f.error = std::move(message);
    return f;
}

} // namespace

const char* framingModeName(FramingMode mode) noexcept {
    switch (mode) {
        case FramingMode::LineDelimited:
            return "ndjson";
        case FramingMode::ContentLength:
            return "content-length";
    }
    return "unknown";
}

Frame MessageFramer::readOneMessage(std::istream& in) const {
    std::string raw;
    while (true) {
        if (!std::getline(in, raw)) {
            return endOfStream("end of input");
        }

        std::string_view line = framing_detail::trimLine(raw);
        stripByteOrderMark(line);
        if (line.empty()) {
            continue;
        }

        std::string_view lengthText;
        if (!framing_detail::matchContentLengthHeader(line, lengthText)) {
            Frame f;
            f.status = FrameStatus::Message;
            f.mode = FramingMode::LineDelimited;
            f.payload.assign(line.data(), line.size());
            return f;
        }

        std::size_t length = 0;
        auto [ptr, ec] =
            std::from_chars(lengthText.data(), lengthText.data() + lengthText.size(), length);
        if (lengthText.empty() || ec != std::errc{} ||
            ptr != lengthText.data() + lengthText.size()) {
            return framingError("Invalid Content-Length value: '" + std::string(lengthText) +
                                "'");
        }
        if (length > maxMessageBytes_) {
            return framingError("Content-Length " + std::to_string(length) +
                                " exceeds limit of " + std::to_string(maxMessageBytes_));
        }

        // Remaining header lines up to the blank separator
        while (true) {
            if (!std::getline(in, raw)) {
                return endOfStream("stream closed inside header block");
            }
            auto header = framing_detail::trimLine(raw);
            if (header.empty()) {
                break;
            }
            if (!looksLikeHeader(header)) {
                return framingError("Malformed header block: '" + std::string(header) + "'");
            }
            spdlog::debug("MessageFramer: ignoring header '{}'", header);
        }
        return readContentLengthBody(in, length);
    }
}

Frame MessageFramer::readContentLengthBody(std::istream& in, std::size_t length) const {
    Frame f;
    f.mode = FramingMode::ContentLength;
    f.payload.resize(length);
    if (length > 0) {
        in.read(f.payload.data(), static_cast<std::streamsize>(length));
        auto got = static_cast<std::size_t>(in.gcount());
        if (got < length) {
            if (in.eof()) {
                return endOfStream("stream closed after " + std::to_string(got) + " of " +
                                   std::to_string(length) + " body bytes");
            }
            return framingError("short body read: " + std::to_string(got) + " of " +
                                std::to_string(length) + " bytes");
        }
    }
    f.status = FrameStatus::Message;
    return f;
}

std::string MessageFramer::frame(std::string_view payload, FramingMode mode) {
    std::string out;
    if (mode == FramingMode::ContentLength) {
        out = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        out.append(payload);
    } else {
        out.reserve(payload.size() + 1);
        out.append(payload);
        out.push_back('\n');
    }
    return out;
}

void MessageFramer::writeMessage(std::ostream& out, std::string_view payload, FramingMode mode) {
    out << frame(payload, mode);
    out.flush();
}

} // namespace devscope::mcp
