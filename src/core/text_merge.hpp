#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace larder {

/**
 * Line-based three-way merge of a free-text field (notes, descriptions).
 *
 * Returns the merged text when the local and remote edits touch disjoint
 * regions of the base, std::nullopt when they overlap or when the inputs are
 * too large for the bounded LCS table. Deterministic for equal inputs.
 */
[[nodiscard]] std::optional<std::string> merge_text(std::string_view base,
                                                    std::string_view local,
                                                    std::string_view remote);

} // namespace larder
