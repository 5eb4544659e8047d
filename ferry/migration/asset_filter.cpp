// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "asset_filter.hpp"

#include <algorithm>

namespace ferry::migration {

AssetTypeFilter::AssetTypeFilter(const std::vector<std::string>& asset_types) {
    if (std::ranges::find(asset_types, "all") != asset_types.end()) {
        return;
    }
    for (const auto& type : asset_types) {
        if (type == "images") {
            patterns_.emplace_back("image/%");
        } else if (type == "videos") {
            patterns_.emplace_back("video/%");
        } else if (type == "documents") {
            patterns_.emplace_back("application/pdf");
            patterns_.emplace_back("application/%document%");
            patterns_.emplace_back("text/%");
        }
    }
}

bool AssetTypeFilter::matches(std::string_view mime_type) const {
    if (patterns_.empty()) return true;
    return std::ranges::any_of(patterns_, [&](const auto& pattern) { return match_pattern(pattern, mime_type); });
}

bool AssetTypeFilter::match_pattern(std::string_view pattern, std::string_view text) {
    size_t p{0}, t{0};
    size_t star_p{std::string_view::npos}, star_t{0};
    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '%') {
            star_p = p++;
            star_t = t;
        } else if (p < pattern.size() && pattern[p] == text[t]) {
            ++p;
            ++t;
        } else if (star_p != std::string_view::npos) {
            p = star_p + 1;
            t = ++star_t;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '%') ++p;
    return p == pattern.size();
}

}  // namespace ferry::migration
