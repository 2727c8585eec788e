#include <gtest/gtest.h>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <vector>

#include "geomesh/surface_file.hpp"

#include "TestMeshFixtures.h"

using geomesh::Error;
using geomesh::SurfaceData;
using geomesh::SurfaceElement;
using geomesh::SurfaceProject;

namespace {

SurfaceElement make_surface_element() {
    SurfaceElement element;
    element.name = "seam";
    element.description = "hanging wall";
    element.geometry = geomesh::SurfaceGeometry{
        {{0.0, 0.0, 0.0}, {1.0, 0.0, 0.125}, {0.0, 1.0, -3.5}, {1.0, 1.0, 1e7}},
        {{0, 1, 2}, {1, 3, 2}}
    };

    SurfaceData depth;
    depth.location = geomesh::DataLocation::Vertices;
    depth.name = "depth";
    depth.array = std::vector<double>{1.0, -999.0, 2.5, 0.0};
    element.data.push_back(depth);

    SurfaceData rock;
    rock.location = geomesh::DataLocation::Faces;
    rock.name = "rock";
    rock.array = std::vector<int64_t>{2, 1};
    rock.legend = {{1, "granite"}, {2, "basalt"}};
    element.data.push_back(rock);
    return element;
}

SurfaceProject make_project() {
    SurfaceProject project;
    project.name = "site";
    project.description = "two elements";
    project.elements.push_back(make_surface_element());

    SurfaceElement points;
    points.name = "collars";
    points.geometry = geomesh::PointSetGeometry{{{5.0, 6.0, 7.0}}};
    project.elements.push_back(points);
    return project;
}

void put_u32_be(std::vector<uint8_t>& bytes, size_t offset, uint32_t value) {
    bytes[offset] = static_cast<uint8_t>(value >> 24);
    bytes[offset + 1] = static_cast<uint8_t>(value >> 16);
    bytes[offset + 2] = static_cast<uint8_t>(value >> 8);
    bytes[offset + 3] = static_cast<uint8_t>(value);
}

} // namespace

TEST(SurfaceFile, EncodeDecodeKeepsProject)
{
    auto project = make_project();
    auto bytes = geomesh::encode_surface_file(project);
    ASSERT_TRUE(bytes.ok()) << bytes.error().full_message();

    auto decoded = geomesh::decode_surface_file(*bytes);
    ASSERT_TRUE(decoded.ok()) << decoded.error().full_message();
    EXPECT_EQ(decoded->name, "site");
    EXPECT_EQ(decoded->description, "two elements");
    ASSERT_EQ(decoded->elements.size(), 2u);

    const auto& element = decoded->elements[0];
    EXPECT_EQ(element.name, "seam");
    EXPECT_EQ(element.description, "hanging wall");
    const auto& expected = std::get<geomesh::SurfaceGeometry>(project.elements[0].geometry);
    const auto& surface = std::get<geomesh::SurfaceGeometry>(element.geometry);
    EXPECT_EQ(surface.vertices, expected.vertices);
    EXPECT_EQ(surface.triangles, expected.triangles);

    ASSERT_EQ(element.data.size(), 2u);
    EXPECT_EQ(element.data[0].name, "depth");
    EXPECT_EQ(element.data[0].location, geomesh::DataLocation::Vertices);
    EXPECT_EQ(element.data[0].array, project.elements[0].data[0].array);
    EXPECT_FALSE(element.data[0].is_category());
    EXPECT_EQ(element.data[1].location, geomesh::DataLocation::Faces);
    EXPECT_EQ(element.data[1].legend, project.elements[0].data[1].legend);
    EXPECT_EQ(element.data[1].array, project.elements[0].data[1].array);

    const auto& points = std::get<geomesh::PointSetGeometry>(decoded->elements[1].geometry);
    EXPECT_EQ(points.vertices, (geomesh::VertexSet{{5.0, 6.0, 7.0}}));
}

TEST(SurfaceFile, LineSetAndWideIndices)
{
    SurfaceProject project;
    SurfaceElement lines;
    lines.name = "traces";
    const uint64_t wide = uint64_t{std::numeric_limits<uint32_t>::max()} + 5;
    lines.geometry = geomesh::LineSetGeometry{{{0.0, 0.0, 0.0}}, {{0, wide}}};
    project.elements.push_back(lines);

    auto bytes = geomesh::encode_surface_file(project);
    ASSERT_TRUE(bytes.ok());
    auto decoded = geomesh::decode_surface_file(*bytes);
    ASSERT_TRUE(decoded.ok()) << decoded.error().full_message();
    const auto& segments = std::get<geomesh::LineSetGeometry>(decoded->elements[0].geometry).segments;
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].y, wide);
}

TEST(SurfaceFile, UnknownGeometryTypeIsKept)
{
    SurfaceProject project;
    SurfaceElement volume;
    volume.name = "block model";
    volume.geometry = geomesh::UnknownGeometry{"regular-grid"};
    project.elements.push_back(volume);

    auto bytes = geomesh::encode_surface_file(project);
    ASSERT_TRUE(bytes.ok());
    auto decoded = geomesh::decode_surface_file(*bytes);
    ASSERT_TRUE(decoded.ok()) << decoded.error().full_message();
    const auto* unknown = std::get_if<geomesh::UnknownGeometry>(&decoded->elements[0].geometry);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->type, "regular-grid");
    EXPECT_STREQ(geomesh::geometry_type_name(decoded->elements[0].geometry), "regular-grid");
}

TEST(SurfaceFile, EmptySurfaceSurvives)
{
    SurfaceProject project;
    SurfaceElement empty;
    empty.name = "nothing";
    empty.geometry = geomesh::SurfaceGeometry{};
    SurfaceData values;
    values.location = geomesh::DataLocation::Faces;
    values.name = "f";
    values.array = std::vector<double>{};
    empty.data.push_back(values);
    project.elements.push_back(empty);

    auto bytes = geomesh::encode_surface_file(project, 0);
    ASSERT_TRUE(bytes.ok());
    auto decoded = geomesh::decode_surface_file(*bytes);
    ASSERT_TRUE(decoded.ok()) << decoded.error().full_message();
    const auto& surface = std::get<geomesh::SurfaceGeometry>(decoded->elements[0].geometry);
    EXPECT_TRUE(surface.vertices.empty());
    EXPECT_TRUE(surface.triangles.empty());
    EXPECT_EQ(geomesh::data_array_size(decoded->elements[0].data[0].array), 0u);
}

TEST(SurfaceFile, CompressionLevelIsValidated)
{
    EXPECT_EQ(geomesh::encode_surface_file(make_project(), -1).code(), Error::Code::InvalidArgument);
    EXPECT_EQ(geomesh::encode_surface_file(make_project(), 10).code(), Error::Code::InvalidArgument);
    EXPECT_TRUE(geomesh::encode_surface_file(make_project(), 9).ok());
}

TEST(SurfaceFile, BadSignatureIsRejected)
{
    auto bytes = geomesh::encode_surface_file(make_project());
    ASSERT_TRUE(bytes.ok());

    auto bad_form = *bytes;
    bad_form[0] = 'X';
    EXPECT_EQ(geomesh::decode_surface_file(bad_form).code(), Error::Code::InvalidFormat);

    auto bad_type = *bytes;
    bad_type[8] = 'X';
    EXPECT_EQ(geomesh::decode_surface_file(bad_type).code(), Error::Code::InvalidFormat);

    EXPECT_EQ(geomesh::decode_surface_file(std::vector<uint8_t>{}).code(), Error::Code::InvalidFormat);
}

TEST(SurfaceFile, TruncatedFileIsRejected)
{
    auto bytes = geomesh::encode_surface_file(make_project());
    ASSERT_TRUE(bytes.ok());
    bytes->resize(bytes->size() - 10);
    EXPECT_EQ(geomesh::decode_surface_file(*bytes).code(), Error::Code::InvalidFormat);
}

TEST(SurfaceFile, ElementCountMustMatchDirectory)
{
    auto bytes = geomesh::encode_surface_file(make_project());
    ASSERT_TRUE(bytes.ok());

    // FORM(4) size(4) GMSX(4) HEAD(4) size(4) version(4) count(4)
    (*bytes)[24] = 7;
    auto decoded = geomesh::decode_surface_file(*bytes);
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.code(), Error::Code::InvalidFormat);
}

TEST(SurfaceFile, NewerVersionIsRejected)
{
    auto bytes = geomesh::encode_surface_file(make_project());
    ASSERT_TRUE(bytes.ok());
    (*bytes)[20] = static_cast<uint8_t>(geomesh::SURFACE_FORMAT_VERSION + 1);
    EXPECT_EQ(geomesh::decode_surface_file(*bytes).code(), Error::Code::InvalidFormat);
}

TEST(SurfaceFile, UnknownChunksAreSkipped)
{
    auto bytes = geomesh::encode_surface_file(make_project());
    ASSERT_TRUE(bytes.ok());

    const std::vector<uint8_t> extra = {'X', 'T', 'R', 'A', 0, 0, 0, 3, 1, 2, 3};
    bytes->insert(bytes->end(), extra.begin(), extra.end());
    put_u32_be(*bytes, 4, static_cast<uint32_t>(bytes->size() - 8));

    auto decoded = geomesh::decode_surface_file(*bytes);
    ASSERT_TRUE(decoded.ok()) << decoded.error().full_message();
    EXPECT_EQ(decoded->elements.size(), 2u);
}

TEST(SurfaceFile, MalformedElementIsReportedAndOthersKept)
{
    auto bytes = geomesh::encode_surface_file(make_project());
    ASSERT_TRUE(bytes.ok());
    auto edited = rewrite_directory(*bytes, [](nlohmann::json& dir) {
        dir["elements"][0]["data"][0]["array"]["dtype"] = "int8";
    });

    auto decoded = geomesh::decode_surface_file(edited);
    ASSERT_TRUE(decoded.ok()) << decoded.error().full_message();
    ASSERT_EQ(decoded->elements.size(), 1u);
    EXPECT_EQ(decoded->elements[0].name, "collars");
    ASSERT_EQ(decoded->unreadable.size(), 1u);
    EXPECT_EQ(decoded->unreadable[0].name, "seam");
    EXPECT_EQ(decoded->unreadable[0].error.code, Error::Code::InvalidFormat);
}

TEST(SurfaceFile, IncompleteElementEntriesAreUnreadable)
{
    auto bytes = geomesh::encode_surface_file(make_project());
    ASSERT_TRUE(bytes.ok());
    auto edited = rewrite_directory(*bytes, [](nlohmann::json& dir) {
        dir["elements"][0].erase("geometry");
        dir["elements"][1] = 5;
    });

    auto decoded = geomesh::decode_surface_file(edited);
    ASSERT_TRUE(decoded.ok()) << decoded.error().full_message();
    EXPECT_TRUE(decoded->elements.empty());
    ASSERT_EQ(decoded->unreadable.size(), 2u);
    EXPECT_EQ(decoded->unreadable[0].name, "seam");
    EXPECT_EQ(decoded->unreadable[1].name, "element 1");
    EXPECT_EQ(decoded->unreadable[1].error.code, Error::Code::InvalidFormat);
}

TEST(SurfaceFile, DamagedDirectoryFailsTheFile)
{
    auto bytes = geomesh::encode_surface_file(make_project());
    ASSERT_TRUE(bytes.ok());
    auto edited = rewrite_directory(*bytes, [](nlohmann::json& dir) {
        dir["elements"] = nlohmann::json::object();
    });
    EXPECT_EQ(geomesh::decode_surface_file(edited).code(), Error::Code::InvalidFormat);
}

TEST(SurfaceFile, WriteAndReadFile)
{
    auto path = std::filesystem::temp_directory_path() / "geomesh_test_project.gmsx";
    std::filesystem::remove(path);

    ASSERT_TRUE(geomesh::write_surface_file(path, make_project()).ok());
    auto project = geomesh::read_surface_file(path);
    ASSERT_TRUE(project.ok()) << project.error().full_message();
    EXPECT_EQ(project->elements.size(), 2u);
    EXPECT_EQ(project->elements[0].data.size(), 2u);

    std::filesystem::remove(path);
    EXPECT_EQ(geomesh::read_surface_file(path).code(), Error::Code::IoError);
}
