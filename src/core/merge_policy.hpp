#pragma once

#include "core/conflict.hpp"
#include "core/field_value.hpp"

namespace larder {

/**
 * Per-field merge policies. All functions here are pure: identical inputs
 * always give identical outputs, with no dependency on the clock or storage.
 *
 *   quantity, min_quantity  base + local delta + remote delta, floored at 0
 *   notes, description      line three-way merge, else both texts joined
 *   tags                    order-preserving union, local order first
 *   anything else           value with the later timestamp, local on ties
 */
[[nodiscard]] FieldValue suggest_merge(const Conflict& conflict);

/**
 * Strategy a user would most likely pick: the side touched last wins,
 * keep-local on equal timestamps.
 */
[[nodiscard]] ResolutionStrategy suggest_resolution(const Conflict& conflict);

/**
 * The value a strategy commits for `conflict`.
 */
[[nodiscard]] FieldValue resolved_value_for(const Conflict& conflict, ResolutionStrategy strategy);

/**
 * Resolution for the batch strategies used by auto-resolve.
 */
[[nodiscard]] ConflictResolution auto_resolution(const Conflict& conflict, AutoStrategy strategy);

// Separator placed between local and remote text when they cannot be merged.
inline constexpr const char* TEXT_MERGE_SEPARATOR = "\n---\n";

} // namespace larder
