#include <sheetfork-cpp/sheetfork.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace sheetfork_cpp;
using sheetfork_test::CountingLoader;
using sheetfork_test::read_file;
using sheetfork_test::ScratchDir;
using sheetfork_test::StubWorkbook;
using sheetfork_test::write_file;

namespace {

auto contents_of(const WorkbookHandle& handle) -> const std::string& {
    return dynamic_cast<const StubWorkbook&>(*handle).contents;
}

class StampingBackend final : public RecalcBackend {
public:
    auto recalculate(const std::filesystem::path& work_path) -> RecalcResult override {
        write_file(work_path, read_file(work_path) + " (recalculated)");
        return RecalcResult{.success = true};
    }
};

class WorkspaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = dir_ / "models" / "pricing.xlsx";
        write_file(base_, "pricing v1");
    }

    auto config() const -> EngineConfig {
        auto config = EngineConfig{};
        config.workspace_root = dir_ / "models";
        config.forks.fork_dir = dir_ / "forks";
        config.cache.capacity = 4;
        return config;
    }

    // Opens the base by path and returns the id the cache assigned it.
    auto base_id(Workspace& ws) const -> WorkbookId {
        return dynamic_cast<const StubWorkbook&>(*ws.open_workbook(base_.string())).id;
    }

    ScratchDir dir_;
    std::filesystem::path base_;
    CountingLoader loader_;
};

}  // namespace

TEST_F(WorkspaceTest, workspace_root_reaches_both_components) {
    auto ws = Workspace{config(), loader_.loader()};
    EXPECT_EQ(ws.config().cache.workspace_root, dir_ / "models");
    EXPECT_EQ(ws.registry().config().workspace_root, dir_ / "models");
    EXPECT_EQ(ws.cache().capacity(), 4u);
}

TEST_F(WorkspaceTest, fork_is_opened_through_its_id) {
    auto ws = Workspace{config(), loader_.loader()};
    auto id = base_id(ws);

    auto fork = ws.create_fork(id.short_id());
    EXPECT_EQ(ws.registry().get_fork(fork).workbook_id, id);

    ws.with_fork_mut_versioned(fork, 0, [](ForkTransaction& tx) {
        write_file(tx.work_path(), "pricing v2");
    });
    EXPECT_EQ(contents_of(ws.open_workbook(fork.str())), "pricing v2");
    EXPECT_EQ(contents_of(ws.open_workbook(id.str())), "pricing v1");
}

TEST_F(WorkspaceTest, forks_cannot_be_forked) {
    auto ws = Workspace{config(), loader_.loader()};
    auto fork = ws.create_fork(base_id(ws).str());
    try {
        ws.create_fork(fork.str());
        FAIL() << "expected invalid_argument";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_argument);
    }
    EXPECT_EQ(ws.registry().fork_count(), 1u);
}

TEST_F(WorkspaceTest, saving_over_the_base_refreshes_cached_views) {
    auto ws = Workspace{config(), loader_.loader()};
    auto id = base_id(ws);
    auto fork = ws.create_fork(id.str());
    ws.with_fork_mut_versioned(fork, 0, [](ForkTransaction& tx) {
        write_file(tx.work_path(), "pricing v2");
    });
    ws.open_workbook(fork.str());
    ASSERT_TRUE(ws.cache().contains(id.str()));

    ws.save_fork(fork, base_, true);

    EXPECT_FALSE(ws.cache().contains(id.str()));
    EXPECT_FALSE(ws.cache().contains(fork.str()));
    EXPECT_FALSE(ws.registry().contains(fork));
    EXPECT_EQ(read_file(base_), "pricing v2");
    EXPECT_EQ(contents_of(ws.open_workbook(id.str())), "pricing v2");
}

TEST_F(WorkspaceTest, discard_drops_fork_views) {
    auto ws = Workspace{config(), loader_.loader()};
    auto fork = ws.create_fork(base_id(ws).str());
    ws.open_workbook(fork.str());

    ws.discard_fork(fork);

    EXPECT_FALSE(ws.cache().contains(fork.str()));
    EXPECT_THROW(ws.open_workbook(fork.str()), EngineError);
    EXPECT_EQ(read_file(base_), "pricing v1");
}

TEST_F(WorkspaceTest, successful_recalculation_invalidates_fork_view) {
    auto ws = Workspace{config(), loader_.loader()};
    auto fork = ws.create_fork(base_id(ws).str());
    EXPECT_EQ(contents_of(ws.open_workbook(fork.str())), "pricing v1");

    auto backend = StampingBackend{};
    auto result = ws.recalculate(fork, backend);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(contents_of(ws.open_workbook(fork.str())), "pricing v1 (recalculated)");
}

TEST_F(WorkspaceTest, committed_edit_invalidates_fork_view) {
    auto ws = Workspace{config(), loader_.loader()};
    auto fork = ws.create_fork(base_id(ws).str());
    EXPECT_EQ(contents_of(ws.open_workbook(fork.str())), "pricing v1");

    auto version = ws.with_fork_mut_versioned(fork, 0, [](ForkTransaction& tx) {
        write_file(tx.work_path(), "pricing v2");
        return tx.base_version() + 1;
    });

    EXPECT_EQ(version, 1u);
    EXPECT_FALSE(ws.cache().contains(fork.str()));
    EXPECT_EQ(contents_of(ws.open_workbook(fork.str())), "pricing v2");
}

TEST_F(WorkspaceTest, rejected_edit_keeps_fork_view) {
    auto ws = Workspace{config(), loader_.loader()};
    auto fork = ws.create_fork(base_id(ws).str());
    ws.open_workbook(fork.str());

    EXPECT_THROW(ws.with_fork_mut_versioned(fork, 7, [](ForkTransaction&) {}), EngineError);
    EXPECT_TRUE(ws.cache().contains(fork.str()));
}

TEST_F(WorkspaceTest, restored_checkpoint_invalidates_fork_view) {
    auto ws = Workspace{config(), loader_.loader()};
    auto fork = ws.create_fork(base_id(ws).str());
    auto cp = ws.checkpoint_fork(fork);
    ws.with_fork_mut_versioned(fork, 0, [](ForkTransaction& tx) {
        write_file(tx.work_path(), "edited");
    });
    EXPECT_EQ(contents_of(ws.open_workbook(fork.str())), "edited");

    auto version = ws.restore_checkpoint(fork, 1, cp.checkpoint_id);

    EXPECT_EQ(version, 2u);
    EXPECT_EQ(read_file(ws.registry().get_fork_path(fork)), "pricing v1");
    EXPECT_EQ(contents_of(ws.open_workbook(fork.str())), "pricing v1");
}

TEST_F(WorkspaceTest, checkpoint_passes_through) {
    auto ws = Workspace{config(), loader_.loader()};
    auto fork = ws.create_fork(base_id(ws).str());
    auto cp = ws.checkpoint_fork(fork, "start");
    EXPECT_EQ(cp.label, "start");
    EXPECT_EQ(ws.registry().list_checkpoints(fork).size(), 1u);
}

TEST_F(WorkspaceTest, cache_stats_reflect_workspace_traffic) {
    auto ws = Workspace{config(), loader_.loader()};
    auto id = base_id(ws);
    ws.open_workbook(id.str());

    auto stats = ws.cache_stats();
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_DOUBLE_EQ(stats.hit_rate(), 0.5);
}
