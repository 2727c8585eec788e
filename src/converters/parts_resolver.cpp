/**
 * GeoMesh Converter - Parts Resolver Implementation
 */

#include "geomesh/parts_resolver.hpp"
#include "geomesh/logging.hpp"

#include <numeric>

namespace geomesh {

Result<std::vector<uint64_t>> expand_chunks(std::span<const Chunk> chunks, uint64_t base_count) {
    uint64_t total = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        // start + count may overflow, compare against what is left instead
        if (chunk.start_segment_index > base_count ||
            chunk.number_of_segments > base_count - chunk.start_segment_index) {
            return Error::index_out_of_range(
                "Chunk " + std::to_string(i) + " [" + std::to_string(chunk.start_segment_index) + ", +"
                + std::to_string(chunk.number_of_segments) + ") exceeds " + std::to_string(base_count)
                + " base triangles");
        }
        total += chunk.number_of_segments;
    }

    std::vector<uint64_t> sequence;
    sequence.reserve(total);
    for (const auto& chunk : chunks) {
        for (uint64_t k = 0; k < chunk.number_of_segments; ++k) {
            sequence.push_back(chunk.start_segment_index + k);
        }
    }
    return sequence;
}

Result<std::vector<uint64_t>> select_positions(std::span<const uint64_t> sequence,
                                               std::span<const uint64_t> positions) {
    std::vector<uint64_t> selected;
    selected.reserve(positions.size());
    for (size_t i = 0; i < positions.size(); ++i) {
        const uint64_t p = positions[i];
        if (p >= sequence.size()) {
            return Error::index_out_of_range(
                "Triangle index " + std::to_string(p) + " at position " + std::to_string(i)
                + " exceeds " + std::to_string(sequence.size()) + " chunk-covered triangles");
        }
        selected.push_back(sequence[p]);
    }
    return selected;
}

Result<std::vector<uint64_t>> resolve_parts(const std::optional<PartsSelection>& parts, uint64_t base_count) {
    if (!parts) {
        std::vector<uint64_t> identity(base_count);
        std::iota(identity.begin(), identity.end(), uint64_t{0});
        return identity;
    }

    TRY_ASSIGN(sequence, expand_chunks(parts->chunks, base_count));
    if (!parts->triangle_indices) {
        return sequence;
    }
    return select_positions(sequence, *parts->triangle_indices);
}

Result<PartsSelection> load_parts(const TableStore& store, const PartsDescriptor& descriptor) {
    PartsSelection selection;

    TRY_ASSIGN(chunk_table, store.load(descriptor.chunks.data));
    auto chunks = read_chunk_table(chunk_table);
    if (!chunks) {
        return chunks.error().with_context("parts.chunks");
    }
    selection.chunks = std::move(*chunks);

    if (descriptor.triangle_indices) {
        TRY_ASSIGN(index_table, store.load(descriptor.triangle_indices->data));
        auto indices = read_index_table(index_table);
        if (!indices) {
            return indices.error().with_context("parts.triangle_indices");
        }
        selection.triangle_indices = std::move(*indices);
    }

    LOG_DEBUG("PartsResolver", "Loaded " << selection.chunks.size() << " chunks"
              << (selection.triangle_indices
                  ? ", " + std::to_string(selection.triangle_indices->size()) + " triangle indices"
                  : std::string()));
    return selection;
}

} // namespace geomesh
