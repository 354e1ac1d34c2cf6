#include "core/text_merge.hpp"

#include <algorithm>
#include <vector>

namespace larder {
namespace {

using Lines = std::vector<std::string>;

// Bounds the (n+1)*(m+1) LCS table (~8MB of ints).
constexpr size_t MAX_TABLE_CELLS = 2'000'000;

Lines split_lines(std::string_view text) {
    Lines out;
    std::string current;
    for (const char c : text) {
        if (c == '\r') continue;
        if (c == '\n') {
            out.push_back(std::move(current));
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    out.push_back(std::move(current));
    return out;
}

std::string join_lines(const Lines& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

/**
 * How one side changed the base: lines inserted before each base position
 * (base.size() + 1 slots) and which base lines it dropped.
 */
struct SideEdits {
    std::vector<Lines> inserted_before;
    std::vector<bool> dropped;
};

std::optional<SideEdits> edits_against(const Lines& base, const Lines& side) {
    const size_t n = base.size();
    const size_t m = side.size();
    if ((n + 1) * (m + 1) > MAX_TABLE_CELLS) {
        return std::nullopt;
    }

    // lcs[i][j] = LCS length of base[i..] and side[j..]
    std::vector<int> lcs((n + 1) * (m + 1), 0);
    const auto at = [&](size_t i, size_t j) -> int& { return lcs[i * (m + 1) + j]; };
    for (size_t i = n; i-- > 0;) {
        for (size_t j = m; j-- > 0;) {
            at(i, j) = base[i] == side[j]
                ? at(i + 1, j + 1) + 1
                : std::max(at(i + 1, j), at(i, j + 1));
        }
    }

    SideEdits edits{std::vector<Lines>(n + 1), std::vector<bool>(n, false)};
    size_t i = 0;
    size_t j = 0;
    while (i < n || j < m) {
        if (i < n && j < m && base[i] == side[j]) {
            ++i;
            ++j;
        } else if (j < m && (i == n || at(i, j + 1) >= at(i + 1, j))) {
            edits.inserted_before[i].push_back(side[j]);
            ++j;
        } else {
            edits.dropped[i] = true;
            ++i;
        }
    }
    return edits;
}

} // namespace

std::optional<std::string> merge_text(std::string_view base_text,
                                      std::string_view local_text,
                                      std::string_view remote_text) {
    if (local_text == remote_text || remote_text == base_text) {
        return std::string(local_text);
    }
    if (local_text == base_text) {
        return std::string(remote_text);
    }

    const auto base = split_lines(base_text);
    const auto local = edits_against(base, split_lines(local_text));
    const auto remote = edits_against(base, split_lines(remote_text));
    if (!local || !remote) {
        return std::nullopt;
    }

    Lines merged;
    const auto take_inserts = [&](size_t slot) -> bool {
        const auto& a = local->inserted_before[slot];
        const auto& b = remote->inserted_before[slot];
        if (!a.empty() && !b.empty() && a != b) {
            return false;
        }
        const auto& chosen = a.empty() ? b : a;
        merged.insert(merged.end(), chosen.begin(), chosen.end());
        return true;
    };

    for (size_t i = 0; i < base.size(); ++i) {
        if (!take_inserts(i)) {
            return std::nullopt;
        }
        const bool local_dropped = local->dropped[i];
        const bool remote_dropped = remote->dropped[i];
        // A replaced line on both sides shows up as drop + differing inserts,
        // which take_inserts already rejected.
        if (!local_dropped && !remote_dropped) {
            merged.push_back(base[i]);
        }
    }
    if (!take_inserts(base.size())) {
        return std::nullopt;
    }
    return join_lines(merged);
}

} // namespace larder
