// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ferry::migration {

//! \brief Matches MIME types against the patterns selected by a list of asset types
//! \details "images" -> image/%, "videos" -> video/%, "documents" -> application/pdf, application/%document%, text/%
//! where % matches any run of characters. An empty list, "all" or a list naming no known type means no filter.
class AssetTypeFilter {
  public:
    AssetTypeFilter() = default;
    explicit AssetTypeFilter(const std::vector<std::string>& asset_types);

    bool matches(std::string_view mime_type) const;

    bool is_unfiltered() const { return patterns_.empty(); }
    const std::vector<std::string>& patterns() const { return patterns_; }

    //! \brief Matches a text against a pattern where '%' stands for any (possibly empty) run of characters
    static bool match_pattern(std::string_view pattern, std::string_view text);

  private:
    std::vector<std::string> patterns_;
};

}  // namespace ferry::migration
