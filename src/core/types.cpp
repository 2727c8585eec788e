/**
 * GeoMesh Converter - Common types
 */

#include "geomesh/types.hpp"

#include <limits>

namespace geomesh {

BoundingBox BoundingBox::from_vertices(const VertexSet& vertices) {
    BoundingBox box;
    if (vertices.empty()) {
        return box;
    }

    constexpr double inf = std::numeric_limits<double>::infinity();
    glm::dvec3 lo(inf);
    glm::dvec3 hi(-inf);
    for (const auto& v : vertices) {
        lo = glm::min(lo, v);
        hi = glm::max(hi, v);
    }

    box.min_x = lo.x; box.max_x = hi.x;
    box.min_y = lo.y; box.max_y = hi.y;
    box.min_z = lo.z; box.max_z = hi.z;
    return box;
}

} // namespace geomesh
