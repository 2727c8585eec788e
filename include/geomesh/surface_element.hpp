/**
 * GeoMesh Converter - Surface Elements
 *
 * In-memory form of the interchange side: a project holding named elements,
 * each with one geometry and an ordered list of data arrays. Elements are
 * built fresh for every export call and own their contents.
 */

#pragma once

#include "result.hpp"
#include "types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace geomesh {

using SegmentSet = std::vector<glm::u64vec2>;

struct SurfaceGeometry {
    VertexSet vertices;
    TriangleSet triangles;
};

struct PointSetGeometry {
    VertexSet vertices;
};

struct LineSetGeometry {
    VertexSet vertices;
    SegmentSet segments;
};

/**
 * Geometry of a type this converter does not know. Only the type string
 * is kept so the element can be reported and skipped.
 */
struct UnknownGeometry {
    std::string type;
};

using ElementGeometry = std::variant<SurfaceGeometry, PointSetGeometry, LineSetGeometry, UnknownGeometry>;

const char* geometry_type_name(const ElementGeometry& geometry);

/**
 * One data array attached to an element. A non-empty legend marks the
 * array as category keys.
 */
struct SurfaceData {
    DataLocation location = DataLocation::Vertices;
    std::string name;
    DataArray array;
    std::vector<CategoryEntry> legend;

    bool is_category() const { return !legend.empty(); }
};

struct SurfaceElement {
    std::string name;
    std::string description;
    ElementGeometry geometry;
    std::vector<SurfaceData> data;
};

struct SurfaceProject {
    std::string name;
    std::string description;
    std::vector<SurfaceElement> elements;

    // Elements listed in a file that could not be decoded; never written
    std::vector<FailedItem> unreadable;
};

} // namespace geomesh
