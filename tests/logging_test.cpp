// logging_test.cpp: the library logger

#include <jsondiff-cpp/invertible.hpp>
#include <jsondiff-cpp/logging.hpp>

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace jsondiff_cpp;

namespace {

/// Routes the library logger into a string for the lifetime of the fixture.
class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
        sink_->set_pattern("%l %v");
        logger()->sinks().push_back(sink_);
        saved_level_ = logger()->level();
    }

    void TearDown() override {
        auto& sinks = logger()->sinks();
        std::erase(sinks, sink_);
        set_log_level(saved_level_);
    }

    std::ostringstream out_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
    spdlog::level::level_enum saved_level_ = spdlog::level::warn;
};

}  // namespace

TEST(Logging, logger_is_named_and_registered) {
    EXPECT_EQ(logger()->name(), "jsondiff");
    EXPECT_EQ(spdlog::get("jsondiff"), logger());
    EXPECT_EQ(logger(), logger());
}

TEST_F(LoggingTest, set_log_level_changes_level) {
    set_log_level(spdlog::level::err);
    EXPECT_EQ(logger()->level(), spdlog::level::err);
}

TEST_F(LoggingTest, rejected_patch_is_logged_at_debug) {
    set_log_level(spdlog::level::debug);
    auto r = from_patch(Patch{PatchRemove{Pointer{"/x"}}});
    ASSERT_FALSE(r.has_value());
    logger()->flush();
    EXPECT_NE(out_.str().find("debug"), std::string::npos);
    EXPECT_NE(out_.str().find("/x"), std::string::npos);
}

TEST_F(LoggingTest, quiet_at_default_level) {
    set_log_level(spdlog::level::warn);
    auto r = from_patch(Patch{PatchRemove{Pointer{"/x"}}});
    ASSERT_FALSE(r.has_value());
    logger()->flush();
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(LoggingTest, merge_traces_folds) {
    set_log_level(spdlog::level::trace);
    const auto merged = merge(InvertiblePatch{
        InvertibleRemove{Pointer{"/a"}, 1},
        InvertibleAdd{Pointer{"/b"}, 1},
    });
    ASSERT_EQ(merged.size(), 1u);
    logger()->flush();
    EXPECT_NE(out_.str().find("merge folded"), std::string::npos);
}
