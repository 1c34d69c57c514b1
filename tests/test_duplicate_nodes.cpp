#include <gtest/gtest.h>
#include <cleanup/duplicate_nodes.hpp>
#include <connect/connector.hpp>
#include "test_helpers.hpp"

using namespace framesplice;
using namespace framesplice::test;

TEST(DuplicateNodes, MergesOntoSmallestId) {
    StructuralModel model = make_model(
        {{5, 1.0, 2.0, 3.0}, {2, 1.0, 2.0, 3.0}, {9, 1.0, 2.0, 3.0}, {4, 0.0, 0.0, 0.0}},
        {{1, 5, 4}, {2, 4, 9}, {3, 2, 4}});

    NodeReplacements replacements = merge_duplicate_nodes(model);

    ASSERT_EQ(replacements.size(), 2u);
    EXPECT_EQ(replacements.at(5), 2);
    EXPECT_EQ(replacements.at(9), 2);

    EXPECT_EQ(model.node_count(), 2u);
    EXPECT_TRUE(model.has_node(2));
    EXPECT_TRUE(model.has_node(4));
    EXPECT_FALSE(model.has_node(5));

    EXPECT_EQ(model.line(1).ni, 2);
    EXPECT_EQ(model.line(2).nj, 2);
    EXPECT_EQ(model.line(3).ni, 2);
}

TEST(DuplicateNodes, NearbyNodesAreNotMerged) {
    StructuralModel model = make_model(
        {{1, 1.0, 2.0, 3.0}, {2, 1.0, 2.0, 3.0 + 1e-9}},
        {{1, 1, 2}});

    NodeReplacements replacements = merge_duplicate_nodes(model);

    EXPECT_TRUE(replacements.empty());
    EXPECT_EQ(model.node_count(), 2u);
}

TEST(DuplicateNodes, CollapsedLinesAreKept) {
    StructuralModel model = make_model(
        {{1, 0.0, 0.0, 0.0}, {2, 0.0, 0.0, 0.0}},
        {{1, 1, 2}},
        {{1, 3, Material::Steel}});

    merge_duplicate_nodes(model);

    ASSERT_TRUE(model.has_line(1));
    EXPECT_EQ(model.line(1).ni, 1);
    EXPECT_EQ(model.line(1).nj, 1);
    EXPECT_TRUE(model.has_member(1));
}

TEST(DuplicateNodes, MergedModelConnectsThroughSharedNode) {
    // Two beams meeting at (10, 0) through separate but identical nodes
    StructuralModel model = make_model(
        {{1, 0.0, 0.0, 0.0}, {2, 10.0, 0.0, 0.0}, {3, 10.0, 0.0, 0.0}, {4, 20.0, 0.0, 0.0},
         {5, 5.0, -5.0, 0.0}, {6, 5.0, 5.0, 0.0}},
        {{1, 1, 2}, {2, 3, 4}, {3, 5, 6}});

    merge_duplicate_nodes(model);
    ConnectResult result = Connector::connect(model);

    EXPECT_EQ(result.model.line(2).ni, 2);
    EXPECT_EQ(result.stats.created_nodes, 1u);
    EXPECT_EQ(result.model.node_count(), 6u);
    expect_complete_lineage(model, result);
}
