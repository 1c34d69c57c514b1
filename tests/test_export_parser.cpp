#include <gtest/gtest.h>
#include <parser/export_parser.hpp>
#include <stdexcept>

using namespace framesplice;
using namespace framesplice::parser;

namespace {

nlohmann::json beam(int id, int ni, int nj, std::vector<double> i, std::vector<double> j) {
    return {
        {"id", id},
        {"nodeI", ni},
        {"nodeJ", nj},
        {"endpoints", {{"i", i}, {"j", j}}}
    };
}

}  // namespace

TEST(ExportParser, ParsesAnalyticalMembers) {
    nlohmann::json member = beam(101, 1, 2, {0.0, 0.0, 3.0}, {6.0, 0.0, 3.0});
    member["section"] = {{"type_id", 55}, {"type_name", "HEB300x117"}};
    member["section_properties"] = {
        {"STRUCTURAL_SECTION_COMMON_HEIGHT", 0.3},
        {"STRUCTURAL_SECTION_COMMON_WIDTH", 0.3},
        {"STRUCTURAL_SECTION_AREA", 0.0149},
        {"STRUCTURAL_SECTION_COMMON_MOMENT_OF_INERTIA_STRONG_AXIS", 2.517e-4},
        {"STRUCTURAL_SECTION_COMMON_MOMENT_OF_INERTIA_WEAK_AXIS", 8.563e-5},
        {"STRUCTURAL_SECTION_COMMON_TORSIONAL_MOMENT_OF_INERTIA", 1.85e-6}
    };
    member["material"] = "Concrete";
    nlohmann::json document = {{"analytical_members", {member}}};

    ExportParser parser;
    ParsedExport parsed = parser.parse(document);

    EXPECT_FALSE(parser.has_warnings());
    ASSERT_EQ(parsed.model.node_count(), 2u);
    EXPECT_EQ(parsed.model.node(1).z, 3.0);
    EXPECT_EQ(parsed.model.node(2).x, 6.0);

    ASSERT_TRUE(parsed.model.has_line(101));
    EXPECT_EQ(parsed.model.line(101).ni, 1);
    EXPECT_EQ(parsed.model.line(101).nj, 2);

    const Member* m = parsed.model.member_for_line(101);
    ASSERT_NE(m, nullptr);
    EXPECT_EQ(m->cross_section_id, 55);
    EXPECT_EQ(m->material, Material::Concrete);

    ASSERT_EQ(parsed.cross_sections.size(), 1u);
    const CrossSection& cs = parsed.cross_sections.at(55);
    EXPECT_EQ(cs.name, "HEB300x117");
    EXPECT_DOUBLE_EQ(cs.area, 0.0149);
    EXPECT_DOUBLE_EQ(cs.iz, 2.517e-4);
    EXPECT_DOUBLE_EQ(cs.iy, 8.563e-5);
    EXPECT_DOUBLE_EQ(cs.jxx, 1.85e-6);
}

TEST(ExportParser, FallsBackToMembersKey) {
    nlohmann::json document = {{"members", {beam(1, 1, 2, {0, 0, 0}, {1, 0, 0})}}};
    ExportParser parser;
    ParsedExport parsed = parser.parse(document);
    EXPECT_EQ(parsed.model.line_count(), 1u);
}

TEST(ExportParser, MissingMembersThrows) {
    ExportParser parser;
    EXPECT_THROW(parser.parse(nlohmann::json::object()), std::runtime_error);
    EXPECT_THROW(parser.parse({{"analytical_members", nlohmann::json::array()}}),
                 std::runtime_error);
}

TEST(ExportParser, SectionDefaults) {
    nlohmann::json member = beam(4, 1, 2, {0, 0, 0}, {1, 0, 0});
    member["section_properties"] = {
        {"STRUCTURAL_SECTION_COMMON_HEIGHT", 0.5},
        {"STRUCTURAL_SECTION_AREA", 0.0},
        {"STRUCTURAL_SECTION_COMMON_MOMENT_OF_INERTIA_STRONG_AXIS", nullptr}
    };
    nlohmann::json document = {{"analytical_members", {member}}};

    ExportParser parser;
    ParsedExport parsed = parser.parse(document);

    // No section block: the section id is the member id
    ASSERT_TRUE(parsed.cross_sections.count(4));
    const CrossSection& cs = parsed.cross_sections.at(4);
    EXPECT_EQ(cs.name, "Section");
    EXPECT_DOUBLE_EQ(cs.height, 0.5);
    EXPECT_DOUBLE_EQ(cs.width, 0.5);
    EXPECT_DOUBLE_EQ(cs.area, 0.01);
    EXPECT_DOUBLE_EQ(cs.iz, 1e-4);
    EXPECT_EQ(parsed.model.member_for_line(4)->material, Material::Steel);
}

TEST(ExportParser, FamilyNameIsUsedWithoutTypeName) {
    nlohmann::json member = beam(4, 1, 2, {0, 0, 0}, {1, 0, 0});
    member["section"] = {{"type_id", 9}, {"family_name", "HEA"}};
    ExportParser parser;
    ParsedExport parsed = parser.parse({{"analytical_members", {member}}});
    EXPECT_EQ(parsed.cross_sections.at(9).name, "HEA");
}

TEST(ExportParser, SharedNodesUseFirstCoordinates) {
    nlohmann::json document = {{"analytical_members", {
        beam(1, 1, 2, {0, 0, 0}, {5, 0, 0}),
        beam(2, 2, 3, {5.001, 0, 0}, {5, 5, 0})
    }}};

    ExportParser parser;
    ParsedExport parsed = parser.parse(document);

    EXPECT_EQ(parsed.model.node_count(), 3u);
    EXPECT_EQ(parsed.model.node(2).x, 5.0);
}

TEST(ExportParser, IdsMayBeStringsOrIntegralFloats) {
    nlohmann::json member = {
        {"id", "12"},
        {"nodeI", 3.0},
        {"nodeJ", "4"},
        {"endpoints", {{"I", {0, 0, 0}}, {"J", {1, 1, 0}}}}
    };
    ExportParser parser;
    ParsedExport parsed = parser.parse({{"analytical_members", {member}}});

    ASSERT_TRUE(parsed.model.has_line(12));
    EXPECT_EQ(parsed.model.line(12).ni, 3);
    EXPECT_EQ(parsed.model.line(12).nj, 4);
    EXPECT_EQ(parsed.model.node(4).y, 1.0);
}

TEST(ExportParser, MissingIdUsesIndex) {
    nlohmann::json member = beam(0, 1, 2, {0, 0, 0}, {1, 0, 0});
    member.erase("id");
    nlohmann::json document = {{"analytical_members", {beam(7, 3, 4, {0, 1, 0}, {1, 1, 0}), member}}};

    ExportParser parser;
    ParsedExport parsed = parser.parse(document);
    EXPECT_TRUE(parsed.model.has_line(1));
    EXPECT_TRUE(parsed.model.has_line(7));
}

TEST(ExportParser, MissingEndpointsDefaultToOrigin) {
    nlohmann::json member = {{"id", 1}, {"nodeI", 1}, {"nodeJ", 2}};
    ExportParser parser;
    ParsedExport parsed = parser.parse({{"analytical_members", {member}}});
    EXPECT_EQ(parsed.model.node(2).x, 0.0);
    EXPECT_EQ(parsed.model.node(2).z, 0.0);
}

TEST(ExportParser, MalformedMembersAreSkipped) {
    nlohmann::json no_nodes = {{"id", 2}};
    nlohmann::json bad_point = beam(3, 5, 6, {0, 0}, {1, 0, 0});
    nlohmann::json bad_id = beam(4, 7, 8, {0, 0, 0}, {1, 0, 0});
    bad_id["nodeI"] = "seven";
    nlohmann::json duplicate = beam(1, 9, 10, {0, 0, 0}, {1, 0, 0});

    nlohmann::json document = {{"analytical_members", {
        beam(1, 1, 2, {0, 0, 0}, {1, 0, 0}),
        no_nodes, bad_point, bad_id, duplicate, 42
    }}};

    ExportParser parser;
    ParsedExport parsed = parser.parse(document);

    EXPECT_EQ(parsed.model.line_count(), 1u);
    EXPECT_EQ(parsed.model.node_count(), 2u);
    ASSERT_EQ(parser.warnings().size(), 5u);
    EXPECT_EQ(parser.warnings()[0].rfind("Skipping member #1", 0), 0u);
    EXPECT_FALSE(parsed.model.has_node(5));
}

TEST(ExportParser, UnknownMaterialWarnsAndUsesSteel) {
    nlohmann::json member = beam(1, 1, 2, {0, 0, 0}, {1, 0, 0});
    member["material"] = "Timber";
    ExportParser parser;
    ParsedExport parsed = parser.parse({{"analytical_members", {member}}});

    EXPECT_EQ(parsed.model.member_for_line(1)->material, Material::Steel);
    ASSERT_EQ(parser.warnings().size(), 1u);
    EXPECT_NE(parser.warnings()[0].find("Timber"), std::string::npos);
}

TEST(ExportParser, WarningsResetBetweenRuns) {
    nlohmann::json member = beam(1, 1, 2, {0, 0, 0}, {1, 0, 0});
    member["material"] = "Timber";
    ExportParser parser;
    parser.parse({{"analytical_members", {member}}});
    ASSERT_TRUE(parser.has_warnings());

    parser.parse({{"analytical_members", {beam(1, 1, 2, {0, 0, 0}, {1, 0, 0})}}});
    EXPECT_FALSE(parser.has_warnings());
}
