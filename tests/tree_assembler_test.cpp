#include <gtest/gtest.h>
#include "code_atlas/clustering_engine.hpp"
#include "code_atlas/errors.hpp"
#include "code_atlas/sequencer.hpp"
#include "code_atlas/tree_assembler.hpp"
#include "test_helpers.hpp"

using namespace code_atlas;
using code_atlas::test_support::budget_config;
using code_atlas::test_support::file_graph;

namespace {

Module leaf(std::vector<std::string> ids, std::string name = {}) {
    Module m;
    m.leaf = true;
    m.name = std::move(name);
    m.entity_ids = std::move(ids);
    return m;
}

Module branch(std::vector<Module> children, std::string name = {}) {
    Module m;
    m.leaf = false;
    m.name = std::move(name);
    m.children = std::move(children);
    return m;
}

std::string violated(const TreeAssembler& assembler, const Module& saved) {
    try {
        assembler.adopt(saved);
    } catch (const InvariantViolation& e) {
        return e.invariant();
    }
    return "none";
}

class TreeAssemblerTest : public ::testing::Test {
protected:
    TreeAssemblerTest()
        : graph_(file_graph({{"src/net/conn.py", 100}, {"src/net/sock.py", 200}, {"src/ui/view.py", 300},
                             {"main.py", 50}},
                            {{0, 1}, {1, 0}})),
          config_(budget_config(2500, 1000, 2)),
          condensed_(resolve_cycles(graph_)) {}

    DependencyGraph graph_;
    Config config_;
    CondensedGraph condensed_;
};

} // namespace

TEST_F(TreeAssemblerTest, AssignsIdsTotalsAndNames) {
    TreeAssembler assembler(config_, condensed_);
    auto tree = assembler.adopt(branch({leaf({"src/net/conn.py", "src/net/sock.py"}),
                                        branch({leaf({"src/ui/view.py"}), leaf({"main.py"})})}));

    const Module& root = tree.root();
    EXPECT_EQ(root.module_id, "root");
    EXPECT_EQ(root.name, "repo");
    EXPECT_EQ(root.token_count, 650u);
    EXPECT_EQ(root.depth, 0);
    EXPECT_TRUE(root.complex);
    EXPECT_TRUE(root.entity_ids.empty());

    const Module& net = root.children[0];
    EXPECT_EQ(net.module_id, "root.1");
    EXPECT_EQ(net.name, "src/net");
    EXPECT_EQ(net.path, "src/net");
    EXPECT_EQ(net.token_count, 300u);
    EXPECT_TRUE(net.complex);

    const Module& mixed = root.children[1];
    EXPECT_EQ(mixed.module_id, "root.2");
    EXPECT_EQ(mixed.name, "(top level)");
    EXPECT_EQ(mixed.children[0].module_id, "root.2.1");
    EXPECT_EQ(mixed.children[0].name, "view.py");
    EXPECT_EQ(mixed.children[0].path, "src/ui");
    EXPECT_FALSE(mixed.children[0].complex);
    EXPECT_EQ(mixed.children[1].name, "main.py");
    EXPECT_EQ(mixed.children[1].depth, 2);
}

TEST_F(TreeAssemblerTest, AdoptKeepsSavedNamesButRecomputesEverythingElse) {
    Module saved = branch({leaf({"src/net/conn.py", "src/net/sock.py", "main.py"}, "Networking"),
                           leaf({"src/ui/view.py"}, "User interface")},
                          "My project");
    saved.children[0].token_count = 999999;
    saved.children[0].module_id = "stale";

    TreeAssembler assembler(config_, condensed_);
    auto tree = assembler.adopt(saved);
    EXPECT_EQ(tree.root().name, "My project");
    EXPECT_EQ(tree.root().children[0].name, "Networking");
    EXPECT_EQ(tree.root().children[0].module_id, "root.1");
    EXPECT_EQ(tree.root().children[0].token_count, 350u);
    EXPECT_EQ(tree.root().children[0].path, "");
    EXPECT_EQ(tree.root().children[1].name, "User interface");
}

TEST_F(TreeAssemblerTest, SiblingNameClashesAreNumbered) {
    TreeAssembler assembler(config_, condensed_);
    auto tree = assembler.adopt(branch({leaf({"src/net/conn.py", "src/net/sock.py"}, "core"),
                                        leaf({"src/ui/view.py"}, "core"), leaf({"main.py"}, "core")}));
    EXPECT_EQ(tree.root().children[0].name, "core");
    EXPECT_EQ(tree.root().children[1].name, "core (2)");
    EXPECT_EQ(tree.root().children[2].name, "core (3)");
}

TEST_F(TreeAssemblerTest, RejectsTreesThatDoNotPartitionTheGraph) {
    TreeAssembler assembler(config_, condensed_);

    // unknown entity
    EXPECT_EQ(violated(assembler, branch({leaf({"src/net/conn.py", "src/net/sock.py", "ghost.py"}),
                                          leaf({"src/ui/view.py", "main.py"})})),
              invariant::kPartition);
    // entity in two leaves
    EXPECT_EQ(violated(assembler, branch({leaf({"src/net/conn.py", "src/net/sock.py", "main.py"}),
                                          leaf({"src/ui/view.py", "main.py"})})),
              invariant::kPartition);
    // entity in no leaf
    EXPECT_EQ(violated(assembler, branch({leaf({"src/net/conn.py", "src/net/sock.py"}),
                                          leaf({"src/ui/view.py"})})),
              invariant::kPartition);
    // leaf that still has children
    Module odd = leaf({"src/net/conn.py", "src/net/sock.py", "src/ui/view.py", "main.py"});
    odd.children.push_back(leaf({}));
    EXPECT_EQ(violated(assembler, odd), invariant::kPartition);
}

TEST_F(TreeAssemblerTest, RejectsTreesDeeperThanMaxDepth) {
    TreeAssembler assembler(config_, condensed_);
    Module deep = branch({branch({branch({leaf({"src/net/conn.py", "src/net/sock.py"})}),
                                  leaf({"src/ui/view.py", "main.py"})})});
    EXPECT_EQ(violated(assembler, deep), invariant::kDepthBound);
}

TEST_F(TreeAssemblerTest, RejectsCycleGroupsSplitAcrossLeaves) {
    TreeAssembler assembler(config_, condensed_);
    EXPECT_EQ(violated(assembler, branch({leaf({"src/net/conn.py", "main.py"}),
                                          leaf({"src/net/sock.py", "src/ui/view.py"})})),
              invariant::kGroupIntegrity);
}

TEST_F(TreeAssemblerTest, RejectsBranchesWithoutChildrenAndEmptyLeaves) {
    TreeAssembler assembler(config_, condensed_);
    Module all = leaf({"src/net/conn.py", "src/net/sock.py", "src/ui/view.py", "main.py"});

    EXPECT_EQ(violated(assembler, branch({all, branch({})})), invariant::kModuleShape);
    EXPECT_EQ(violated(assembler, branch({all, leaf({})})), invariant::kModuleShape);
    EXPECT_EQ(violated(assembler, branch({})), invariant::kModuleShape);
}

TEST(TreeAssemblerBudgetTest, RejectsLeavesOverBudgetThatCouldBeSplit) {
    auto graph = file_graph({{"a.py", 1000}, {"b.py", 1000}, {"c.py", 1000}});
    Config config = budget_config(3000, 1500, 2);
    auto condensed = resolve_cycles(graph);
    TreeAssembler assembler(config, condensed);

    EXPECT_EQ(violated(assembler, leaf({"a.py", "b.py", "c.py"})), invariant::kLeafBudget);
    EXPECT_NE(violated(assembler, branch({branch({leaf({"a.py", "b.py", "c.py"})}, "x"), branch({}, "y"), leaf({}, "z")})),
              "none");
    EXPECT_EQ(violated(assembler, branch({leaf({"a.py", "b.py"}), leaf({"c.py"})})), invariant::kLeafBudget);

    auto tree = assembler.adopt(branch({leaf({"a.py"}), leaf({"b.py"}), leaf({"c.py"})}));
    EXPECT_EQ(tree.leaves().size(), 3u);
}

TEST(TreeAssemblerBudgetTest, AcceptsAnOversizedLeafHoldingOneCycle) {
    auto graph = file_graph({{"a.py", 1000}, {"b.py", 1000}, {"c.py", 100}}, {{0, 1}, {1, 0}});
    Config config = budget_config(3000, 1500, 2);
    auto condensed = resolve_cycles(graph);
    TreeAssembler assembler(config, condensed);

    auto tree = assembler.adopt(branch({leaf({"a.py", "b.py"}), leaf({"c.py"})}));
    EXPECT_TRUE(tree.root().children[0].oversized);
    EXPECT_EQ(tree.root().children[0].token_count, 2000u);

    EXPECT_EQ(violated(assembler, leaf({"a.py", "b.py", "c.py"})), invariant::kLeafBudget);
}

TEST(TreeAssemblerBudgetTest, EmptyGraphKeepsItsEmptyRootLeaf) {
    DependencyGraph graph;
    graph.finalize();
    Config config = budget_config(3000, 1500, 2);
    auto condensed = resolve_cycles(graph);
    TreeAssembler assembler(config, condensed);

    auto tree = assembler.adopt(leaf({}));
    EXPECT_TRUE(tree.root().leaf);
    EXPECT_EQ(tree.root().token_count, 0u);
}

TEST_F(TreeAssemblerTest, ProcessingOrderVisitsChildrenFirst) {
    TreeAssembler assembler(config_, condensed_);
    auto tree = assembler.adopt(branch({leaf({"src/net/conn.py", "src/net/sock.py"}),
                                        branch({leaf({"src/ui/view.py"}), leaf({"main.py"})})}));
    EXPECT_EQ(tree.processing_order(),
              (std::vector<std::string>{"root.1", "root.2.1", "root.2.2", "root.2", "root"}));
    EXPECT_EQ(tree.module_count(), 5u);
    EXPECT_EQ(tree.max_depth(), 2);
    EXPECT_EQ(tree.find("root.2.1")->name, "view.py");
    EXPECT_EQ(tree.find("root.9"), nullptr);
    EXPECT_EQ(tree.leaf_of("main.py")->module_id, "root.2.2");
    EXPECT_EQ(tree.leaf_of("missing.py"), nullptr);
}

TEST_F(TreeAssemblerTest, RendersAnOutline) {
    TreeAssembler assembler(config_, condensed_);
    auto tree = assembler.adopt(branch({leaf({"src/net/conn.py", "src/net/sock.py"}),
                                        branch({leaf({"src/ui/view.py"}), leaf({"main.py"})})}));
    EXPECT_EQ(tree.render_text(),
              "repo [root] 650 tokens\n"
              "├── src/net [root.1] 300 tokens, 2 entities\n"
              "└── (top level) [root.2] 350 tokens\n"
              "    ├── view.py [root.2.1] 300 tokens, 1 entities\n"
              "    └── main.py [root.2.2] 50 tokens, 1 entities\n");
}

TEST_F(TreeAssemblerTest, JsonKeepsFieldOrderAndRoundTrips) {
    auto order = topological_order(condensed_);
    ClusteringEngine engine(config_);
    TreeAssembler assembler(config_, condensed_);
    auto tree = assembler.assemble(engine.cluster(condensed_, order));

    auto j = tree.to_json();
    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) keys.push_back(it.key());
    EXPECT_EQ(keys, (std::vector<std::string>{"module_id", "name", "leaf", "token_count", "depth", "entity_ids",
                                              "children", "path", "oversized", "complex"}));

    Module parsed = Module::from_json(nlohmann::json::parse(tree.dump()));
    EXPECT_EQ(ModuleTree(parsed).dump(), tree.dump());
}

TEST(ModuleJsonTest, RejectsMalformedModules) {
    EXPECT_THROW(Module::from_json(nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW(Module::from_json(nlohmann::json{{"leaf", true}}), std::invalid_argument);
    EXPECT_THROW(Module::from_json(nlohmann::json{{"module_id", "root"}, {"leaf", "yes"}}), std::invalid_argument);
    EXPECT_THROW(Module::from_json(nlohmann::json{{"module_id", "root"}, {"leaf", false}, {"children", 3}}),
                 std::invalid_argument);
}

TEST(CommonDirectoryTest, FindsTheLongestSharedDirectory) {
    EXPECT_EQ(common_directory({"src/a/x.py", "src/a/y.py"}), "src/a");
    EXPECT_EQ(common_directory({"src/a/x.py", "src/ab/y.py"}), "src");
    EXPECT_EQ(common_directory({"src/a/b/x.py", "src/a/y.py"}), "src/a");
    EXPECT_EQ(common_directory({"x.py", "src/y.py"}), "");
    EXPECT_EQ(common_directory({}), "");
}
