//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length based framer and incremental FrameReader for the stdio transport
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "toolhost/ContentFramer.h"

namespace toolhost {

namespace {
const std::string kHeaderSep = "\r\n\r\n";
const std::string kHeaderName = "content-length:";

bool equalsIgnoreCase(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

std::string trim(const std::string& s) {
    auto b = std::find_if(s.begin(), s.end(), [](unsigned char ch){ return !std::isspace(ch); });
    auto e = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base();
    return (b < e) ? std::string(b, e) : std::string();
}

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + kHeaderSep;
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t headerEnd = buffer.find(kHeaderSep);
        if (headerEnd == std::string::npos) {
            return { DecodeStatus::Incomplete, std::nullopt, 0, 0, {} };
        }
        const std::size_t headerAndSep = headerEnd + kHeaderSep.size();

        std::size_t pos = 0;
        std::size_t contentLength = 0;
        bool haveLength = false;
        while (pos <= headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            std::string line = buffer.substr(pos, eol - pos);
            auto colon = line.find(':');
            if (colon != std::string::npos) {
                std::string name = line.substr(0, colon);
                std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
                name = trim(name);
                if (name == "content-length") {
                    std::string value = trim(line.substr(colon + 1));
                    unsigned long long v64 = 0;
                    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), v64);
                    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
                        LOG_WARN("Invalid Content-Length header: {}", value);
                        return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep, 0,
                                 "Invalid Content-Length header: " + value };
                    }
                    if (v64 > maxContentLength || v64 > std::numeric_limits<std::size_t>::max() - headerAndSep) {
                        LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                        return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep, static_cast<std::size_t>(v64),
                                 "Content-Length " + std::to_string(v64) + " exceeds maximum " + std::to_string(maxContentLength) };
                    }
                    contentLength = static_cast<std::size_t>(v64);
                    haveLength = true;
                }
            }
            pos = eol + 2;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep, 0, "Missing Content-Length header" };
        }

        std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0, contentLength, {} };
        }

        std::string payload = buffer.substr(headerAndSep, contentLength);
        return { DecodeStatus::Ok, std::make_optional(std::move(payload)), frameTotal, contentLength, {} };
    }

private:
    std::size_t maxContentLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

//========================================================================================================
// FrameReader
//========================================================================================================
FrameReader::FrameReader(std::size_t maxContentLength)
    : framer(MakeContentLengthFramer(maxContentLength)) {}

void FrameReader::Feed(const char* data, std::size_t n) {
    if (n == 0) return;
    std::size_t offset = 0;
    if (skipRemaining > 0) {
        offset = std::min(skipRemaining, n);
        skipRemaining -= offset;
    }
    buffer.append(data + offset, n - offset);
}

bool FrameReader::resynchronize() {
    auto it = std::search(buffer.begin(), buffer.end(), kHeaderName.begin(), kHeaderName.end(), equalsIgnoreCase);
    if (it != buffer.end()) {
        const auto dropped = static_cast<std::size_t>(it - buffer.begin());
        if (dropped > 0) {
            LOG_DEBUG("FrameReader: skipped {} bytes after an invalid header", dropped);
        }
        buffer.erase(0, dropped);
        resyncing = false;
        return true;
    }
    // Keep a tail that may be the start of a header split across feeds
    std::size_t keep = std::min(buffer.size(), kHeaderName.size() - 1);
    while (keep > 0 &&
           !std::equal(buffer.end() - static_cast<std::ptrdiff_t>(keep), buffer.end(), kHeaderName.begin(), equalsIgnoreCase)) {
        --keep;
    }
    buffer.erase(0, buffer.size() - keep);
    return false;
}

std::optional<FrameReader::FrameEvent> FrameReader::Next() {
    if (skipRemaining > 0 || buffer.empty()) {
        return std::nullopt;
    }
    if (resyncing && !resynchronize()) {
        return std::nullopt;
    }
    auto r = framer->tryDecodeEx(buffer);
    switch (r.status) {
        case IContentFramer::DecodeStatus::Ok:
            buffer.erase(0, r.bytesConsumed);
            return FrameEvent{ FrameEvent::Kind::Message, std::move(r.payload.value()) };
        case IContentFramer::DecodeStatus::InvalidHeader:
            buffer.erase(0, r.bytesConsumed);
            resyncing = true;
            return FrameEvent{ FrameEvent::Kind::Error, std::move(r.detail) };
        case IContentFramer::DecodeStatus::BodyTooLarge: {
            buffer.erase(0, r.bytesConsumed);
            const std::size_t inBuffer = std::min(r.declaredLength, buffer.size());
            buffer.erase(0, inBuffer);
            skipRemaining = r.declaredLength - inBuffer;
            return FrameEvent{ FrameEvent::Kind::Error, std::move(r.detail) };
        }
        case IContentFramer::DecodeStatus::Incomplete:
            break;
    }
    if (buffer.size() > MaxHeaderBytes && buffer.find(kHeaderSep) == std::string::npos) {
        LOG_WARN("Discarding {} header bytes without terminator", buffer.size());
        std::string detail = "Header exceeds " + std::to_string(MaxHeaderBytes) + " bytes without terminator";
        buffer.clear();
        return FrameEvent{ FrameEvent::Kind::Error, std::move(detail) };
    }
    return std::nullopt;
}

} // namespace toolhost
