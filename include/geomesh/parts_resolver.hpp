/**
 * GeoMesh Converter - Parts Resolver
 *
 * Turns an optional parts selection into the ordered list of base triangle
 * rows that make up the final triangle set. The selection is two-level:
 *
 *   expand_chunks     base stream   -> S  (concatenated chunk runs)
 *   select_positions  S             -> final rows (S[i] per triangle index)
 *
 * triangle_indices address positions in S, never base rows. Results keep
 * order and duplicates.
 */

#pragma once

#include "result.hpp"
#include "mesh_schema.hpp"
#include "table_schemas.hpp"
#include "table_store.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace geomesh {

/**
 * Parts selection with its arrays loaded.
 */
struct PartsSelection {
    std::vector<Chunk> chunks;
    std::optional<std::vector<uint64_t>> triangle_indices;
};

/**
 * Concatenate [start, start + count) for every chunk in list order.
 * IndexOutOfRange if a chunk reaches past base_count.
 */
Result<std::vector<uint64_t>> expand_chunks(std::span<const Chunk> chunks, uint64_t base_count);

/**
 * [sequence[p] for p in positions]. IndexOutOfRange if any p >= len(sequence).
 */
Result<std::vector<uint64_t>> select_positions(std::span<const uint64_t> sequence,
                                               std::span<const uint64_t> positions);

/**
 * Full resolution. No selection gives the identity 0..base_count-1.
 */
Result<std::vector<uint64_t>> resolve_parts(const std::optional<PartsSelection>& parts, uint64_t base_count);

/**
 * Load the chunk and triangle index tables a descriptor refers to.
 */
Result<PartsSelection> load_parts(const TableStore& store, const PartsDescriptor& descriptor);

} // namespace geomesh
