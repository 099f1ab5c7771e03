//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceRegistry.cpp
// Purpose: Resource strategy lookup and shared paging helpers
//==========================================================================================================

#include "toolhost/registry/ResourceRegistry.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <format>
#include <stdexcept>

#include "logging/Logger.h"

namespace toolhost {

ResourceRegistry::ResourceRegistry(std::vector<std::shared_ptr<IResourceStrategy>> list) {
    FUNC_SCOPE();
    for (auto& s : list) {
        if (!s) {
            throw std::invalid_argument("null resource strategy");
        }
        std::string prefix = s->UriPrefix();
        if (prefix.empty()) {
            throw std::invalid_argument("resource strategy prefix must not be empty");
        }
        if (strategies.count(prefix) != 0) {
            throw std::invalid_argument(std::format("duplicate resource prefix '{}'", prefix));
        }
        LOG_DEBUG("Registered resource strategy {}", prefix);
        strategies.emplace(std::move(prefix), std::move(s));
    }
}

std::shared_ptr<IResourceStrategy> ResourceRegistry::Find(const std::string& uri) const {
    std::shared_ptr<IResourceStrategy> best;
    std::size_t bestLen = 0;
    for (const auto& [prefix, strategy] : strategies) {
        if (prefix.size() > bestLen && uri.compare(0, prefix.size(), prefix) == 0) {
            best = strategy;
            bestLen = prefix.size();
        }
    }
    return best;
}

std::vector<std::string> ResourceRegistry::Prefixes() const {
    std::vector<std::string> out;
    out.reserve(strategies.size());
    for (const auto& [prefix, strategy] : strategies) {
        out.push_back(prefix);
    }
    return out;
}

ResourcePage MakePage(std::vector<ResourceEntry> sortedEntries, int64_t page, int64_t pageSize) {
    ResourcePage out;
    out.total = static_cast<int64_t>(sortedEntries.size());
    out.page = page;
    out.pageSize = pageSize;
    if (page < 0 || pageSize <= 0) {
        return out;
    }
    // Guard the multiplication against overflow for absurd page numbers
    if (page > out.total / pageSize) {
        return out;
    }
    const int64_t begin = page * pageSize;
    const int64_t end = std::min(out.total, begin + pageSize);
    for (int64_t i = begin; i < end; ++i) {
        out.items.push_back(std::move(sortedEntries[static_cast<std::size_t>(i)]));
    }
    return out;
}

std::pair<int64_t, int64_t> ClampRange(int64_t total, std::optional<int64_t> start, std::optional<int64_t> length) {
    int64_t s = std::clamp<int64_t>(start.value_or(0), 0, total);
    int64_t remaining = total - s;
    int64_t l = length.has_value() ? std::clamp<int64_t>(length.value(), 0, remaining) : remaining;
    return {s, l};
}

std::string SanitizeUtf8(const std::string& bytes) {
    static const char kReplacement[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(bytes.size());
    const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
    const std::size_t n = bytes.size();
    std::size_t i = 0;
    while (i < n) {
        const unsigned char c = p[i];
        std::size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            len = 2; cp = c & 0x1F;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3; cp = c & 0x0F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4; cp = c & 0x07;
        }
        bool ok = len != 0 && i + len <= n;
        for (std::size_t k = 1; ok && k < len; ++k) {
            if ((p[i + k] & 0xC0) != 0x80) {
                ok = false;
            } else {
                cp = (cp << 6) | (p[i + k] & 0x3F);
            }
        }
        // Reject overlong 3/4-byte forms, surrogates and values past U+10FFFF
        if (ok && ((len == 3 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) ||
                   (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)))) {
            ok = false;
        }
        if (ok) {
            out.append(bytes, i, len);
            i += len;
        } else {
            out.append(kReplacement);
            ++i;
        }
    }
    return out;
}

std::string GuessMimeType(const std::string& uri) {
    const auto slash = uri.find_last_of('/');
    const auto dot = uri.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "text/plain";
    }
    std::string ext = uri.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    static const std::map<std::string, std::string> kTypes = {
        {"dart", "text/x-dart"},
        {"md", "text/markdown"},
        {"json", "application/json"},
        {"yaml", "text/yaml"},
        {"yml", "text/yaml"},
        {"txt", "text/plain"},
        {"log", "text/plain"},
        {"html", "text/html"},
        {"cpp", "text/x-c++"},
        {"hpp", "text/x-c++"},
        {"h", "text/x-c++"},
    };
    auto it = kTypes.find(ext);
    return it == kTypes.end() ? "text/plain" : it->second;
}

} // namespace toolhost
