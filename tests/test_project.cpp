#include <gtest/gtest.h>
#include <managers/project.hpp>
#include <storage/sqlite_kv_store.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <atomic>
#include <filesystem>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

class ProjectTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::unique_ptr<Project> proj;
    std::atomic<int> double_calls{0};

    void SetUp() override {
        test_dir = platform::make_temp_dir("memostore_project_test");
        open_project();
    }

    void TearDown() override {
        proj.reset();
        fs::remove_all(test_dir);
    }

    void open_project() {
        auto config = ConfigBuilder().echo_errors(false).build();
        auto r = Project::open(test_dir / "proj", config);
        ASSERT_TRUE(r.is_ok()) << r.error;
        proj = std::move(r.value);

        auto reg = proj->register_collection("double",
            [this](const std::string& id, const Value& args, ComputeContext& ctx) -> Value {
                ++double_calls;
                ctx.info("doubling {}", id);
                if (id == "bad" || args["throw_error"].as<bool>(false)) {
                    throw std::runtime_error("cannot double '" + id + "'");
                }
                Value out;
                out["val"] = std::stoi(id) * 2;
                out["stamp"] = now_ms();
                return out;
            });
        ASSERT_TRUE(reg.is_ok()) << reg.error;
    }

    Result<Resource> fetch_blocking(const std::string& id, bool recompute = false) {
        return proj->fetch("double", id, Value(), recompute, true);
    }
};

TEST_F(ProjectTest, DoubleScenario) {
    auto res = fetch_blocking("5");
    ASSERT_TRUE(res.is_ok()) << res.error;
    EXPECT_EQ(res.value.status, Status::Complete);
    ASSERT_TRUE(res.value.result.has_value());
    EXPECT_EQ((*res.value.result)["val"].as<int>(), 10);
    ASSERT_TRUE(res.value.start_time && res.value.end_time);
    EXPECT_LE(*res.value.start_time, *res.value.end_time);

    auto bad = fetch_blocking("bad");
    ASSERT_TRUE(bad.is_ok()) << bad.error;
    EXPECT_EQ(bad.value.status, Status::Error);
    EXPECT_FALSE(bad.value.result.has_value());

    auto err = proj->fetch_error("double", "bad");
    ASSERT_TRUE(err.is_ok());
    EXPECT_NE(err.value.find("cannot double 'bad'"), std::string::npos);
}

TEST_F(ProjectTest, OnDiskLayoutIsPlainFiles) {
    ASSERT_TRUE(fetch_blocking("5").is_ok());

    fs::path dir = test_dir / "proj" / "double" / "5";
    for (const char* f : {"status", "start_time", "end_time", "result.yaml",
                          "error.log", "run.log"}) {
        EXPECT_TRUE(fs::is_regular_file(dir / f)) << f;
    }
    EXPECT_TRUE(fs::is_directory(dir / "storage"));
    EXPECT_TRUE(fs::exists(test_dir / "proj" / "double" / ".index" / "status.sqlite3"));
    EXPECT_EQ(read_text_file(dir / "status"), "complete");
    EXPECT_TRUE(safe_stoll(read_text_file(dir / "start_time")).has_value());
}

TEST_F(ProjectTest, CacheHitDoesNotRecompute) {
    auto first = fetch_blocking("3");
    ASSERT_TRUE(first.is_ok());
    ASSERT_EQ(double_calls.load(), 1);

    for (int i = 0; i < 3; ++i) {
        auto again = proj->fetch("double", "3");
        ASSERT_TRUE(again.is_ok());
        EXPECT_EQ(again.value.status, Status::Complete);
        EXPECT_EQ((*again.value.result)["stamp"].as<int64_t>(),
                  (*first.value.result)["stamp"].as<int64_t>());
    }
    EXPECT_EQ(double_calls.load(), 1);
}

TEST_F(ProjectTest, ForcedRecomputeMovesForward) {
    auto first = fetch_blocking("4");
    ASSERT_TRUE(first.is_ok());
    platform::sleep_ms(5);

    auto second = fetch_blocking("4", true);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(double_calls.load(), 2);
    EXPECT_GE(*second.value.end_time, *first.value.end_time);
    EXPECT_GE((*second.value.result)["stamp"].as<int64_t>(),
              (*first.value.result)["stamp"].as<int64_t>());
}

TEST_F(ProjectTest, ErrorIsCachedNotRetried) {
    auto first = fetch_blocking("bad");
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value.status, Status::Error);
    ASSERT_EQ(double_calls.load(), 1);

    auto again = proj->fetch("double", "bad");
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value.status, Status::Error);
    EXPECT_EQ(double_calls.load(), 1);
}

TEST_F(ProjectTest, RecomputeReplacesPreviousError) {
    Value args;
    args["throw_error"] = true;
    auto failed = proj->fetch("double", "6", args, false, true);
    ASSERT_TRUE(failed.is_ok());
    EXPECT_EQ(failed.value.status, Status::Error);

    auto fixed = fetch_blocking("6", true);
    ASSERT_TRUE(fixed.is_ok());
    EXPECT_EQ(fixed.value.status, Status::Complete);
    EXPECT_EQ(proj->fetch_error("double", "6").value, "");
}

TEST_F(ProjectTest, IndexCorruptionIsRepairedFromDisk) {
    ASSERT_TRUE(fetch_blocking("5").is_ok());

    // Second connection to the same index, as an outside tool would have
    SqliteKeyValueStore kv;
    ASSERT_TRUE(kv.open((test_dir / "proj" / "double" / ".index" / "status.sqlite3").string()).is_ok());
    ASSERT_TRUE(kv.put("5", "error").is_ok());

    auto found = proj->find_by_status("double", Status::Error);
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value, std::vector<std::string>{"5"});

    auto st = proj->status("double", "5");
    ASSERT_TRUE(st.is_ok()) << st.error;
    EXPECT_EQ(st.value, Status::Complete);
    EXPECT_EQ(kv.get("5").value, std::optional<std::string>("complete"));

    ASSERT_TRUE(kv.put("5", "pending").is_ok());
    auto res = proj->fetch("double", "5");
    ASSERT_TRUE(res.is_ok());
    EXPECT_EQ(res.value.status, Status::Complete);
    EXPECT_EQ(kv.get("5").value, std::optional<std::string>("complete"));
    EXPECT_EQ(double_calls.load(), 1);
}

TEST_F(ProjectTest, AggregateCounts) {
    ASSERT_TRUE(fetch_blocking("1").is_ok());
    ASSERT_TRUE(fetch_blocking("2").is_ok());
    ASSERT_TRUE(fetch_blocking("bad").is_ok());

    auto s = proj->status("double");
    ASSERT_TRUE(s.is_ok()) << s.error;
    EXPECT_EQ(s.value.total, 3);
    EXPECT_EQ(s.value.complete, 2);
    EXPECT_EQ(s.value.error, 1);
    EXPECT_EQ(s.value.pending, 0);
    EXPECT_EQ(s.value.unknown, 0);
}

TEST_F(ProjectTest, FindByStatus) {
    ASSERT_TRUE(fetch_blocking("1").is_ok());
    ASSERT_TRUE(fetch_blocking("2").is_ok());
    ASSERT_TRUE(fetch_blocking("bad").is_ok());

    auto complete = proj->find_by_status("double", Status::Complete);
    ASSERT_TRUE(complete.is_ok());
    EXPECT_EQ(complete.value, (std::vector<std::string>{"1", "2"}));

    auto errors = proj->find_by_status("double", Status::Error);
    ASSERT_TRUE(errors.is_ok());
    EXPECT_EQ(errors.value, std::vector<std::string>{"bad"});

    auto pending = proj->find_by_status("double", Status::Pending);
    ASSERT_TRUE(pending.is_ok());
    EXPECT_TRUE(pending.value.empty());
}

TEST_F(ProjectTest, LogsAndErrors) {
    ASSERT_TRUE(fetch_blocking("7").is_ok());

    auto log = proj->fetch_log("double", "7");
    ASSERT_TRUE(log.is_ok());
    EXPECT_NE(log.value.find("doubling 7"), std::string::npos);
    EXPECT_NE(log.value.find("INFO"), std::string::npos);

    auto err = proj->fetch_error("double", "7");
    ASSERT_TRUE(err.is_ok());
    EXPECT_EQ(err.value, "");
}

TEST_F(ProjectTest, ComputeWritesIntoStorageDir) {
    ASSERT_TRUE(proj->register_collection("files",
        [](const std::string& id, const Value&, ComputeContext& ctx) -> Value {
            EXPECT_TRUE(write_text_file(ctx.storage_dir() / "hello.txt", "hello " + id).is_ok());
            if (id == "partial") throw std::runtime_error("died after writing");
            return Value("ok");
        }).is_ok());

    auto ok = proj->fetch("files", "a", Value(), false, true);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(read_text_file(ok.value.paths.storage / "hello.txt"), "hello a");
    EXPECT_EQ(ok.value.result->as<std::string>(), "ok");

    // Side output survives a failure, but there is no result
    auto partial = proj->fetch("files", "partial", Value(), false, true);
    ASSERT_TRUE(partial.is_ok());
    EXPECT_EQ(partial.value.status, Status::Error);
    EXPECT_FALSE(partial.value.result.has_value());
    EXPECT_EQ(read_text_file(partial.value.paths.storage / "hello.txt"), "hello partial");
}

TEST_F(ProjectTest, UnknownCollection) {
    auto r = proj->fetch("nope", "1");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::UnknownCollection);

    EXPECT_EQ(proj->status("nope").code, ErrorCode::UnknownCollection);
    EXPECT_EQ(proj->find_by_status("nope", Status::Complete).code, ErrorCode::UnknownCollection);
    EXPECT_EQ(proj->fetch_log("nope", "1").code, ErrorCode::UnknownCollection);
}

TEST_F(ProjectTest, UnknownResource) {
    auto st = proj->status("double", "never");
    ASSERT_TRUE(st.is_err());
    EXPECT_EQ(st.code, ErrorCode::UnknownResource);

    EXPECT_EQ(proj->fetch_log("double", "never").code, ErrorCode::UnknownResource);
    EXPECT_EQ(proj->fetch_error("double", "never").code, ErrorCode::UnknownResource);
    EXPECT_EQ(proj->inspect("double", "never").code, ErrorCode::UnknownResource);
    EXPECT_FALSE(fs::exists(test_dir / "proj" / "double" / "never"));
}

TEST_F(ProjectTest, InvalidIdentifiers) {
    EXPECT_EQ(proj->fetch("double", "").code, ErrorCode::InvalidIdentifier);
    EXPECT_EQ(proj->fetch("double", "../escape").code, ErrorCode::InvalidIdentifier);
    EXPECT_EQ(proj->fetch("double", ".index").code, ErrorCode::InvalidIdentifier);
    EXPECT_EQ(proj->status("double", "../x").code, ErrorCode::UnknownResource);
}

TEST_F(ProjectTest, DuplicateAndInvalidCollections) {
    auto dup = proj->register_collection("double",
        [](const std::string&, const Value&, ComputeContext&) { return Value(); });
    ASSERT_TRUE(dup.is_err());
    EXPECT_EQ(dup.code, ErrorCode::DuplicateCollection);

    auto bad = proj->register_collection("a/b",
        [](const std::string&, const Value&, ComputeContext&) { return Value(); });
    EXPECT_EQ(bad.code, ErrorCode::InvalidIdentifier);

    EXPECT_EQ(proj->collections(), std::vector<std::string>{"double"});
}

TEST_F(ProjectTest, ProjectPathMustBeDirectory) {
    fs::path file = test_dir / "plain_file";
    ASSERT_TRUE(write_text_file(file, "x").is_ok());
    auto r = Project::open(file);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::InvalidProject);
}

TEST_F(ProjectTest, BadConfigFileFailsOpen) {
    fs::path dir = test_dir / "badcfg";
    fs::create_directories(dir);
    ASSERT_TRUE(write_text_file(dir / "memostore.yaml", "index:\n  synchronous: maybe\n").is_ok());
    auto r = Project::open(dir);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::ConfigError);
}

TEST_F(ProjectTest, ResultsSurviveReopen) {
    ASSERT_TRUE(fetch_blocking("8").is_ok());
    proj.reset();
    double_calls = 0;

    open_project();
    auto res = proj->fetch("double", "8");
    ASSERT_TRUE(res.is_ok());
    EXPECT_EQ(res.value.status, Status::Complete);
    EXPECT_EQ((*res.value.result)["val"].as<int>(), 16);
    EXPECT_EQ(double_calls.load(), 0);
}

TEST_F(ProjectTest, OrphanedPendingIsRecomputed) {
    // A pending status left by a process that died mid-computation
    fs::path dir = test_dir / "proj" / "double" / "9";
    fs::create_directories(dir / "storage");
    ASSERT_TRUE(write_text_file(dir / "status", "pending").is_ok());
    ASSERT_TRUE(write_text_file(dir / "start_time", "1").is_ok());

    EXPECT_EQ(proj->status("double", "9").value, Status::Pending);

    auto res = proj->fetch("double", "9", Value(), false, true);
    ASSERT_TRUE(res.is_ok());
    EXPECT_EQ(res.value.status, Status::Complete);
    EXPECT_EQ(double_calls.load(), 1);
}

TEST_F(ProjectTest, ProjectWideStats) {
    ASSERT_TRUE(proj->register_collection("always_error",
        [](const std::string&, const Value&, ComputeContext& ctx) -> Value {
            ctx.info("output here");
            throw std::runtime_error("This is an error!");
        }).is_ok());

    ASSERT_TRUE(fetch_blocking("1").is_ok());
    ASSERT_TRUE(proj->fetch("always_error", "1", Value(), false, true).is_ok());

    auto all = proj->stats();
    ASSERT_TRUE(all.is_ok()) << all.error;
    ASSERT_EQ(all.value.size(), 2u);
    EXPECT_EQ(all.value["double"].complete, 1);
    EXPECT_EQ(all.value["always_error"].error, 1);

    EXPECT_NE(proj->fetch_log("always_error", "1").value.find("output here"), std::string::npos);
    EXPECT_NE(proj->fetch_error("always_error", "1").value.find("This is an error!"),
              std::string::npos);
}

TEST_F(ProjectTest, EngineLogRecordsActivity) {
    ASSERT_TRUE(fetch_blocking("5").is_ok());
    std::string log = read_text_file(test_dir / "proj" / "memostore.log");
    EXPECT_NE(log.find("collection registered: double"), std::string::npos);
    EXPECT_NE(log.find("computing resource \"5\" in \"double\""), std::string::npos);
}

TEST_F(ProjectTest, DefaultArgsAreEmptyMapping) {
    std::atomic<bool> saw_empty_map{false};
    ASSERT_TRUE(proj->register_collection("echo_args",
        [&saw_empty_map](const std::string&, const Value& args, ComputeContext&) -> Value {
            saw_empty_map = args.IsMap() && args.size() == 0;
            return Value("done");
        }).is_ok());

    ASSERT_TRUE(proj->fetch("echo_args", "1").is_ok());
    auto done = proj->wait("echo_args", "1");
    ASSERT_TRUE(done.is_ok()) << done.error;
    EXPECT_EQ(done.value.status, Status::Complete);
    EXPECT_TRUE(saw_empty_map.load());
}

TEST_F(ProjectTest, BuilderSynchronousModeIsValidated) {
    proj.reset();
    auto config = ConfigBuilder().echo_errors(false).synchronous("extra; PRAGMA x").build();
    auto r = Project::open(test_dir / "proj", config);
    ASSERT_TRUE(r.is_ok()) << r.error;
    proj = std::move(r.value);

    auto reg = proj->register_collection("double",
        [](const std::string&, const Value&, ComputeContext&) { return Value(); });
    ASSERT_TRUE(reg.is_err());
    EXPECT_EQ(reg.code, ErrorCode::ConfigError);
    EXPECT_TRUE(proj->collections().empty());
}
