#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

#include "geomesh/exporter.hpp"
#include "geomesh/table_schemas.hpp"

#include "TestMeshFixtures.h"

using geomesh::DataLocation;
using geomesh::Error;
using geomesh::SurfaceElement;
using geomesh::SurfaceGeometry;
using geomesh::TriangleMesh;

class Exporter : public MeshStoreTest {
protected:
    const SurfaceGeometry& surface(const SurfaceElement& element) {
        return std::get<SurfaceGeometry>(element.geometry);
    }

    geomesh::SurfaceExporter exporter{store};
};

TEST_F(Exporter, NoPartsKeepsEveryTriangle)
{
    auto mesh = make_mesh("grid", 3);
    auto element = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_TRUE(element.ok()) << element.error().full_message();

    EXPECT_EQ(element->name, "grid");
    EXPECT_EQ(element->description, "grid 3");
    EXPECT_EQ(surface(*element).vertices, make_grid_vertices(3));
    EXPECT_EQ(surface(*element).triangles, make_grid_triangles(3));
    EXPECT_TRUE(element->data.empty());
}

TEST_F(Exporter, ChunksSelectTheirTotalLength)
{
    auto parts = save_parts({{0, 3}, {10, 5}, {4, 0}});
    auto mesh = make_mesh("chunked", 3, {}, {}, parts);   // 18 base triangles

    auto element = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_TRUE(element.ok()) << element.error().full_message();

    const auto base = make_grid_triangles(3);
    const std::vector<uint64_t> expected_rows = {0, 1, 2, 10, 11, 12, 13, 14};
    const auto& triangles = surface(*element).triangles;
    ASSERT_EQ(triangles.size(), expected_rows.size());
    for (size_t i = 0; i < expected_rows.size(); ++i) {
        EXPECT_EQ(triangles[i], base[expected_rows[i]]) << "row " << i;
    }
    // Vertices are never compacted by a selection
    EXPECT_EQ(surface(*element).vertices.size(), 16u);
}

TEST_F(Exporter, TriangleIndicesSelectWithinChunks)
{
    // Chunks cover base rows 2,3,4 and 6,7; indices pick positions 4, 0, 0
    auto parts = save_parts({{2, 3}, {6, 2}}, std::vector<uint64_t>{4, 0, 0});
    auto mesh = make_mesh("picked", 2, {}, {}, parts);

    auto element = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_TRUE(element.ok()) << element.error().full_message();

    const auto base = make_grid_triangles(2);
    const auto& triangles = surface(*element).triangles;
    ASSERT_EQ(triangles.size(), 3u);
    EXPECT_EQ(triangles[0], base[7]);
    EXPECT_EQ(triangles[1], base[2]);
    EXPECT_EQ(triangles[2], base[2]);
}

TEST_F(Exporter, FaceValuesFollowTheirTriangles)
{
    const size_t base_count = make_grid_triangles(3).size();
    auto values = ramp(base_count);
    auto parts = save_parts({{1, 4}, {12, 3}}, std::vector<uint64_t>{6, 0, 3, 6});
    auto mesh = make_mesh("faces", 3, {}, {continuous("f", values)}, parts);

    auto element = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_TRUE(element.ok()) << element.error().full_message();

    // Chunks give rows 1..4 then 12..14; indices 6, 0, 3, 6 pick from those
    const std::vector<size_t> expected_rows = {14, 1, 4, 14};
    const auto base = make_grid_triangles(3);
    const auto& triangles = surface(*element).triangles;
    ASSERT_EQ(triangles.size(), expected_rows.size());
    ASSERT_EQ(element->data.size(), 1u);
    const auto& face_values = std::get<std::vector<double>>(element->data[0].array);
    ASSERT_EQ(face_values.size(), expected_rows.size());

    for (size_t i = 0; i < expected_rows.size(); ++i) {
        EXPECT_EQ(triangles[i], base[expected_rows[i]]) << "triangle " << i;
        EXPECT_DOUBLE_EQ(face_values[i], values[expected_rows[i]]) << "triangle " << i;
    }
}

TEST_F(Exporter, VertexAttributesAreUnaffectedByParts)
{
    auto depth = ramp(16, 100.0);
    auto parts = save_parts({{5, 1}});
    auto mesh = make_mesh("vertices", 3, {continuous("depth", depth, {-999.0})}, {}, parts);

    auto element = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_TRUE(element.ok()) << element.error().full_message();
    ASSERT_EQ(element->data.size(), 1u);
    EXPECT_EQ(element->data[0].location, DataLocation::Vertices);
    EXPECT_EQ(std::get<std::vector<double>>(element->data[0].array), depth);
}

TEST_F(Exporter, VertexEntriesComeBeforeFaceEntries)
{
    const size_t faces = make_grid_triangles(1).size();
    auto mesh = make_mesh("order", 1,
                          {continuous("v1", ramp(4)), integer("v2", {1, 2, 3, 4})},
                          {integer("f1", std::vector<int64_t>(faces, 7)), continuous("f2", ramp(faces))});

    auto element = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_TRUE(element.ok()) << element.error().full_message();
    ASSERT_EQ(element->data.size(), 4u);
    EXPECT_EQ(element->data[0].name, "v1");
    EXPECT_EQ(element->data[1].name, "v2");
    EXPECT_EQ(element->data[2].name, "f1");
    EXPECT_EQ(element->data[3].name, "f2");
    EXPECT_EQ(element->data[1].location, DataLocation::Vertices);
    EXPECT_EQ(element->data[2].location, DataLocation::Faces);
    EXPECT_TRUE(std::holds_alternative<std::vector<int64_t>>(element->data[1].array));
}

TEST_F(Exporter, CategoriesCarryTheirLegend)
{
    auto mesh = make_mesh("rock", 1, {}, {category("rock", {1, 2}, {{1, "granite"}, {2, "basalt"}})});

    auto element = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_TRUE(element.ok()) << element.error().full_message();
    ASSERT_EQ(element->data.size(), 1u);
    EXPECT_TRUE(element->data[0].is_category());
    EXPECT_EQ(element->data[0].legend.size(), 2u);
    EXPECT_EQ(std::get<std::vector<int64_t>>(element->data[0].array), (std::vector<int64_t>{1, 2}));
}

TEST_F(Exporter, Version1MeshHasOnlyVertexData)
{
    geomesh::TriangleMeshV1_0_0 mesh;
    mesh.name = "legacy";
    mesh.vertices = save_vertices(make_grid_vertices(1));
    mesh.indices = save_triangles(make_grid_triangles(1));
    mesh.vertex_attributes = {continuous("depth", ramp(4))};
    mesh.vertex_attributes[0].schema = geomesh::AttributeSchema::V1_0_1;
    mesh.vertex_attributes[0].key.clear();

    auto element = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_TRUE(element.ok()) << element.error().full_message();
    EXPECT_EQ(element->description, "");
    ASSERT_EQ(element->data.size(), 1u);
    EXPECT_EQ(element->data[0].location, DataLocation::Vertices);
    EXPECT_EQ(surface(*element).triangles.size(), 2u);
}

TEST_F(Exporter, Version2MeshWithoutFaceAttributes)
{
    geomesh::TriangleMeshV2_0_0 mesh;
    mesh.name = "two";
    mesh.triangles.vertices.data = save_vertices(make_grid_vertices(2));
    mesh.triangles.vertices.attributes = {continuous("depth", ramp(9))};
    mesh.triangles.indices.data = save_triangles(make_grid_triangles(2));

    auto element = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_TRUE(element.ok()) << element.error().full_message();
    ASSERT_EQ(element->data.size(), 1u);
    EXPECT_EQ(element->data[0].location, DataLocation::Vertices);
    EXPECT_EQ(surface(*element).triangles.size(), 8u);
}

TEST_F(Exporter, EmptySelectionIsNotAnError)
{
    const size_t faces = make_grid_triangles(2).size();
    auto parts = save_parts({{3, 0}});
    auto mesh = make_mesh("empty", 2, {continuous("depth", ramp(9))}, {continuous("f", ramp(faces))}, parts);

    auto element = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_TRUE(element.ok()) << element.error().full_message();
    EXPECT_TRUE(surface(*element).triangles.empty());
    EXPECT_EQ(surface(*element).vertices.size(), 9u);
    ASSERT_EQ(element->data.size(), 2u);
    EXPECT_EQ(geomesh::data_array_size(element->data[0].array), 9u);
    EXPECT_EQ(geomesh::data_array_size(element->data[1].array), 0u);
}

TEST_F(Exporter, EmptyTriangleIndicesSelectNothing)
{
    const size_t faces = make_grid_triangles(2).size();
    auto parts = save_parts({{0, 4}}, std::vector<uint64_t>{});
    auto mesh = make_mesh("no-indices", 2, {integer("zone", {1, 1, 1, 2, 2, 2, 3, 3, 3})},
                          {continuous("f", ramp(faces))}, parts);

    auto element = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_TRUE(element.ok()) << element.error().full_message();
    EXPECT_TRUE(surface(*element).triangles.empty());
    EXPECT_EQ(surface(*element).vertices.size(), 9u);
    ASSERT_EQ(element->data.size(), 2u);
    EXPECT_EQ(geomesh::data_array_size(element->data[0].array), 9u);
    EXPECT_EQ(element->data[1].location, DataLocation::Faces);
    EXPECT_EQ(geomesh::data_array_size(element->data[1].array), 0u);
}

TEST_F(Exporter, ChunkPastBaseFails)
{
    auto parts = save_parts({{6, 3}});   // 8 base triangles
    auto mesh = make_mesh("overflow", 2, {}, {}, parts);

    auto element = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_FALSE(element.ok());
    EXPECT_EQ(element.code(), Error::Code::IndexOutOfRange);
    EXPECT_NE(element.error().context.find("overflow"), std::string::npos);
}

TEST_F(Exporter, TriangleIndexPastChunksFails)
{
    auto parts = save_parts({{0, 2}}, std::vector<uint64_t>{0, 2});
    auto mesh = make_mesh("bad-index", 2, {}, {}, parts);

    auto element = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_FALSE(element.ok());
    EXPECT_EQ(element.code(), Error::Code::IndexOutOfRange);
}

TEST_F(Exporter, FaceAttributeLengthIsCheckedAgainstBase)
{
    // Selection has 2 triangles, but face values must match the 8 base rows
    auto parts = save_parts({{0, 2}});
    auto mesh = make_mesh("short", 2, {}, {continuous("f", ramp(2))}, parts);

    auto element = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_FALSE(element.ok());
    EXPECT_EQ(element.code(), Error::Code::AttributeLengthMismatch);
}

TEST_F(Exporter, ExportMeshesSkipsFailures)
{
    std::vector<TriangleMesh> meshes = {
        make_mesh("first", 1),
        make_mesh("broken", 1, {continuous("depth", ramp(3))}),
        make_mesh("third", 2)
    };

    auto report = exporter.export_meshes(meshes, "project", "two of three");
    EXPECT_FALSE(report.all_succeeded());
    EXPECT_EQ(report.project.name, "project");
    EXPECT_EQ(report.project.description, "two of three");
    ASSERT_EQ(report.project.elements.size(), 2u);
    EXPECT_EQ(report.project.elements[0].name, "first");
    EXPECT_EQ(report.project.elements[1].name, "third");
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].name, "broken");
    EXPECT_EQ(report.failed[0].error.code, Error::Code::AttributeLengthMismatch);
}

TEST_F(Exporter, RepeatedExportsAreIndependent)
{
    auto mesh = make_mesh("again", 2, {continuous("depth", ramp(9))});

    auto first = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_TRUE(first.ok());
    std::get<SurfaceGeometry>(first->geometry).triangles.clear();
    std::get<std::vector<double>>(first->data[0].array)[0] = -1.0;

    auto second = exporter.export_mesh(TriangleMesh(mesh));
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(surface(*second).triangles.size(), 8u);
    EXPECT_DOUBLE_EQ(std::get<std::vector<double>>(second->data[0].array)[0], 0.5);
}
