#include "core/merge_policy.hpp"

#include "core/inventory.hpp"
#include "core/text_merge.hpp"

#include <algorithm>
#include <string_view>

namespace larder {

namespace {

bool is_counter(std::string_view name) {
    return name == field::Quantity || name == field::MinQuantity;
}

bool is_free_text(std::string_view name) {
    return name == field::Notes || name == field::Description;
}

const FieldValue& later_value(const Conflict& c) {
    return c.remote_timestamp > c.local_timestamp ? c.remote_value : c.local_value;
}

FieldValue merge_counter(const Conflict& c) {
    const auto local = as_integer(c.local_value);
    const auto remote = as_integer(c.remote_value);
    const auto base = c.base_value ? as_integer(*c.base_value) : std::nullopt;
    if (!local || !remote || !base) {
        return later_value(c);
    }
    // remote + (local - base); a result outside int64 has no meaningful
    // counter value, so the later edit wins instead.
    int64_t local_delta = 0;
    int64_t merged = 0;
    if (__builtin_sub_overflow(*local, *base, &local_delta) ||
        __builtin_add_overflow(*remote, local_delta, &merged)) {
        return later_value(c);
    }
    return std::max<int64_t>(merged, 0);
}

FieldValue merge_free_text(const Conflict& c) {
    const auto local = as_text(c.local_value);
    const auto remote = as_text(c.remote_value);
    if (!local && !remote) {
        return std::monostate{};
    }
    if (!local) return *remote;
    if (!remote) return *local;

    if (c.base_value) {
        const auto base = as_text(*c.base_value).value_or("");
        if (auto merged = merge_text(base, *local, *remote)) {
            return *merged;
        }
    }
    return *local + TEXT_MERGE_SEPARATOR + *remote;
}

FieldValue merge_tags(const Conflict& c) {
    auto merged = as_list(c.local_value).value_or(StringList{});
    for (const auto& tag : as_list(c.remote_value).value_or(StringList{})) {
        if (std::find(merged.begin(), merged.end(), tag) == merged.end()) {
            merged.push_back(tag);
        }
    }
    return merged;
}

} // namespace

FieldValue suggest_merge(const Conflict& conflict) {
    if (is_counter(conflict.field)) {
        return merge_counter(conflict);
    }
    if (is_free_text(conflict.field)) {
        return merge_free_text(conflict);
    }
    if (conflict.field == field::Tags) {
        return merge_tags(conflict);
    }
    return later_value(conflict);
}

ResolutionStrategy suggest_resolution(const Conflict& conflict) {
    return conflict.remote_timestamp > conflict.local_timestamp
        ? ResolutionStrategy::KeepRemote
        : ResolutionStrategy::KeepLocal;
}

FieldValue resolved_value_for(const Conflict& conflict, ResolutionStrategy strategy) {
    switch (strategy) {
        case ResolutionStrategy::KeepLocal: return conflict.local_value;
        case ResolutionStrategy::KeepRemote: return conflict.remote_value;
        case ResolutionStrategy::Merge: return suggest_merge(conflict);
    }
    return conflict.local_value;
}

ConflictResolution auto_resolution(const Conflict& conflict, AutoStrategy strategy) {
    ResolutionStrategy chosen = ResolutionStrategy::KeepLocal;
    switch (strategy) {
        case AutoStrategy::LatestWins: chosen = suggest_resolution(conflict); break;
        case AutoStrategy::RemoteWins: chosen = ResolutionStrategy::KeepRemote; break;
        case AutoStrategy::LocalWins: chosen = ResolutionStrategy::KeepLocal; break;
    }
    return ConflictResolution{
        .conflict_id = conflict.id,
        .strategy = chosen,
        .resolved_value = resolved_value_for(conflict, chosen),
        .resolved_by = ResolvedBy::Auto,
    };
}

} // namespace larder
