#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "report/emit_run_json.hpp"
#include "util/json_escape.hpp"
#include "test_util.hpp"

using namespace repcat;
using repcat_test::read_all;

TEST(JsonEscape, EscapesQuotesBackslashesAndControls) {
    EXPECT_EQ(json_escape("plain"), "plain");
    EXPECT_EQ(json_escape("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(json_escape("x\ny\t"), "x\\ny\\t");
    EXPECT_EQ(json_escape(std::string(1, '\x01')), "\\u0001");
}

class RunJsonTest : public repcat_test::TempDirTest {};

TEST_F(RunJsonTest, WritesSummaryAndSamples) {
    RunSummary run;
    run.started_iso = "2026-01-01T00:00:00Z";
    run.ended_iso = "2026-01-01T00:00:01Z";
    run.wall_ms = 1000.0;
    run.output = "out \"1\".bin";
    run.inputs = {"a.bin", "b.bin"};
    run.result.bytes_written = 2u << 20;
    run.result.bytes_total = 2u << 20;
    run.result.tasks = 4;
    run.result.cached_files = 2;
    run.repeat_all = 2;

    const std::vector<RunSample> samples = {{0, 0, 1.5}, {500, 1u << 20, 2.0}};
    const auto p = path("run.json");
    emit_run_json(p.string(), run, samples);

    const std::string json = read_all(p);
    EXPECT_NE(json.find(R"("bytes_written":2097152,)"), std::string::npos);
    EXPECT_NE(json.find(R"("tasks":4,)"), std::string::npos);
    EXPECT_NE(json.find(R"("throughput_output_mb_s":2,)"), std::string::npos);
    EXPECT_NE(json.find(R"("output":"out \"1\".bin",)"), std::string::npos);
    EXPECT_NE(json.find(R"("a.bin",)"), std::string::npos);
    EXPECT_NE(json.find(R"({"ts_ms":500,"bytes_out":1048576,"rss_mb":2})"), std::string::npos);
    EXPECT_EQ(json.front(), '{');
}

TEST_F(RunJsonTest, UnwritablePathIsIoError) {
    RunSummary run;
    const auto p = path("missing/dir/run.json").string();
    try {
        emit_run_json(p, run, {});
        FAIL() << "expected io_error";
    } catch (const io_error& e) {
        EXPECT_EQ(e.operation(), "create");
        EXPECT_EQ(e.path(), p);
    }
}
