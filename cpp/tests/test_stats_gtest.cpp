// ==============================================================================
// test_stats_gtest.cpp - Тесты статистики по набору отчётов (GoogleTest)
// ==============================================================================

#include "curator/output.hpp"
#include "curator/report.hpp"
#include "curator/stats.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace curator::curate::test {

namespace {

Value parse_json(const std::string& json) {
    auto result = io::parse_report(json, "inline.json");
    EXPECT_TRUE(result.ok) << result.error.format();
    return result.report.data;
}

/// Отчёт с заданным числом детектов VT, процессов и вызовов на процесс
Value make_report(std::int64_t positives, int processes = 1, int calls = 1,
                  const std::string& detections = R"([{"family": "Emotet"}])",
                  const std::string& avclass = R"("emotet")") {
    std::string procs;
    for (int p = 0; p < processes; ++p) {
        std::string call_list;
        for (int c = 0; c < calls; ++c) {
            call_list += (c == 0 ? "" : ",") + std::string(R"({"api": "NtClose"})");
        }
        procs += (p == 0 ? "" : ",") + std::string(R"({"calls": [)") + call_list + "]}";
    }
    return parse_json(R"({"target": {"file": {"virustotal": {"positives": )" +
                      std::to_string(positives) + R"(}}}, "behavior": {"processes": [)" + procs +
                      R"(]}, "detections": )" + detections +
                      R"(, "avclass_detection": )" + avclass + "}");
}

}  // namespace

// ==============================================================================
// ExtremumTracker / LabelCounter / capitalize_label
// ==============================================================================

TEST(StatsTest, ExtremumTracker_FirstUpdateTakesSlot) {
    MaxTracker<std::int64_t> max;
    MinTracker<std::int64_t> min;

    EXPECT_TRUE(max.update(-3, "a.json"));
    EXPECT_TRUE(min.update(100, "a.json"));

    EXPECT_EQ(max.value(), -3);
    EXPECT_EQ(min.value(), 100);
}

TEST(StatsTest, ExtremumTracker_TieKeepsFirstExemplar) {
    MaxTracker<std::int64_t> max;

    max.update(5, "first.json");
    EXPECT_FALSE(max.update(5, "second.json"));

    EXPECT_EQ(max.exemplar(), std::filesystem::path("first.json"));
}

TEST(StatsTest, LabelCounter_MostCommon_StableOnTies) {
    LabelCounter counter;
    counter.add("Agenttesla");
    counter.add("Emotet");
    counter.add("Emotet");
    counter.add("Formbook");

    auto common = counter.most_common();

    ASSERT_EQ(common.size(), 3u);
    EXPECT_EQ(common[0], std::make_pair(std::string("Emotet"), std::size_t{2}));
    EXPECT_EQ(common[1].first, "Agenttesla");
    EXPECT_EQ(common[2].first, "Formbook");
    EXPECT_EQ(counter.count("Missing"), 0u);
}

TEST(StatsTest, CapitalizeLabel_OnlyFirstLetter) {
    EXPECT_EQ(capitalize_label("emotet"), "Emotet");
    EXPECT_EQ(capitalize_label("agentTesla"), "AgentTesla");
    EXPECT_EQ(capitalize_label("Emotet"), "Emotet");
    EXPECT_EQ(capitalize_label("(n/a)"), "(n/a)");
    EXPECT_EQ(capitalize_label(""), "");
}

// ==============================================================================
// StatsAggregator
// ==============================================================================

TEST(StatsTest, Aggregator_VtMinMaxSumAverage) {
    // Arrange
    StatsAggregator agg(10);

    // Act
    agg.add_report(make_report(1), "a.json");
    agg.add_report(make_report(5), "b.json");
    agg.add_report(make_report(3), "c.json");

    // Assert
    const auto& acc = agg.current();
    EXPECT_EQ(acc.total_reports, 3u);
    EXPECT_EQ(acc.min_vt_positives.value(), 1);
    EXPECT_EQ(acc.min_vt_positives.exemplar(), std::filesystem::path("a.json"));
    EXPECT_EQ(acc.max_vt_positives.value(), 5);
    EXPECT_EQ(acc.max_vt_positives.exemplar(), std::filesystem::path("b.json"));
    EXPECT_EQ(acc.total_vt_positives, 9);
    ASSERT_TRUE(acc.average_vt_positives().has_value());
    EXPECT_DOUBLE_EQ(*acc.average_vt_positives(), 3.0);
}

TEST(StatsTest, Aggregator_ProcessesAndHookedFunctions) {
    StatsAggregator agg(10);

    agg.add_report(make_report(20, 2, 3), "a.json");
    agg.add_report(make_report(20, 4, 1), "b.json");

    const auto& acc = agg.current();
    EXPECT_EQ(acc.total_spawned_processes, 6u);
    EXPECT_EQ(acc.min_spawned_processes.value(), 2u);
    EXPECT_EQ(acc.max_spawned_processes.value(), 4u);
    EXPECT_EQ(acc.total_hooked_functions, 10u);
    EXPECT_EQ(acc.min_hooked_functions.value(), 1u);
    EXPECT_EQ(acc.max_hooked_functions.value(), 3u);
    EXPECT_DOUBLE_EQ(*acc.average_spawned_processes(), 3.0);
    EXPECT_DOUBLE_EQ(*acc.average_hooked_functions(), 10.0 / 6.0);
}

TEST(StatsTest, Aggregator_SpawnedProcessesMinMaxSumAverage) {
    // Arrange
    StatsAggregator agg(10);

    // Act: 1, 5 и 3 порождённых процесса
    agg.add_report(make_report(20, 1), "a.json");
    agg.add_report(make_report(20, 5), "b.json");
    agg.add_report(make_report(20, 3), "c.json");

    // Assert: среднее = сумма / число отчётов
    const auto& acc = agg.current();
    EXPECT_EQ(acc.total_reports, 3u);
    EXPECT_EQ(acc.min_spawned_processes.value(), 1u);
    EXPECT_EQ(acc.min_spawned_processes.exemplar(), std::filesystem::path("a.json"));
    EXPECT_EQ(acc.max_spawned_processes.value(), 5u);
    EXPECT_EQ(acc.max_spawned_processes.exemplar(), std::filesystem::path("b.json"));
    EXPECT_EQ(acc.total_spawned_processes, 9u);
    ASSERT_TRUE(acc.average_spawned_processes().has_value());
    EXPECT_DOUBLE_EQ(*acc.average_spawned_processes(), 9.0 / 3.0);
}

TEST(StatsTest, Aggregator_ThresholdInclusive) {
    StatsAggregator agg(10);

    agg.add_report(make_report(10), "at.json");
    agg.add_report(make_report(11), "above.json");
    agg.add_report(make_report(0), "zero.json");

    const auto& acc = agg.current();
    ASSERT_EQ(acc.undetected.size(), 2u);
    EXPECT_EQ(acc.undetected[0], std::filesystem::path("at.json"));
    EXPECT_EQ(acc.undetected[1], std::filesystem::path("zero.json"));
}

TEST(StatsTest, Aggregator_CapeLabelsNormalized) {
    StatsAggregator agg(10);

    agg.add_report(make_report(20, 1, 1, R"([{"family": "Emotet"}])"), "a.json");
    agg.add_report(make_report(20, 1, 1, R"([{"family": "emotet"}, {"other": 1}])"), "b.json");

    const auto& acc = agg.current();
    EXPECT_EQ(acc.cape_labels.count("Emotet"), 2u);
    EXPECT_EQ(acc.cape_labels.distinct(), 1u);
    EXPECT_EQ(acc.avclass_labels.count("Emotet"), 2u);
}

TEST(StatsTest, Aggregator_NoCapeConsensus) {
    StatsAggregator agg(10);

    agg.add_report(make_report(20, 1, 1, R"("(n/a)")"), "na.json");
    // При нуле детектов VT отсутствие консенсуса не учитывается
    agg.add_report(make_report(0, 1, 1, R"("(n/a)")"), "zero.json");

    const auto& acc = agg.current();
    ASSERT_EQ(acc.no_cape_consensus.size(), 1u);
    EXPECT_EQ(acc.no_cape_consensus[0], std::filesystem::path("na.json"));
    EXPECT_EQ(acc.cape_labels.count("(n/a)"), 1u);
}

TEST(StatsTest, Aggregator_NoAvclassConsensus) {
    StatsAggregator agg(10);

    agg.add_report(make_report(20, 1, 1, "[]", R"("(n/a)")"), "na.json");

    const auto& acc = agg.current();
    ASSERT_EQ(acc.no_avclass_consensus.size(), 1u);
    EXPECT_EQ(acc.avclass_labels.count("(n/a)"), 1u);
}

TEST(StatsTest, Aggregator_MissingVirustotal_CountsOnlyStructure) {
    StatsAggregator agg(10);
    Value report = parse_json(R"({"target": {}, "behavior": {"processes": [{"calls": []}]}})");

    agg.add_report(report, "novt.json");

    const auto& acc = agg.current();
    EXPECT_EQ(acc.total_reports, 1u);
    EXPECT_EQ(acc.total_spawned_processes, 1u);
    EXPECT_FALSE(acc.min_vt_positives.has_value());
    EXPECT_TRUE(acc.undetected.empty());
}

TEST(StatsTest, Aggregator_Empty_NullAverages) {
    StatsAggregator agg(10);
    StatsAccumulator acc = agg.take();

    EXPECT_FALSE(acc.average_spawned_processes().has_value());
    EXPECT_FALSE(acc.average_hooked_functions().has_value());
    EXPECT_FALSE(acc.average_vt_positives().has_value());

    auto doc = summary_to_json(acc);
    EXPECT_TRUE(doc["Process stats"]["Average spawned processes"].IsNull());
    EXPECT_TRUE(doc["Detection stats"]["Min VT detections"]["n_detections"].IsNull());
}

TEST(StatsTest, Aggregator_TakeResetsButKeepsThreshold) {
    StatsAggregator agg(7);
    agg.add_report(make_report(1), "a.json");

    StatsAccumulator acc = agg.take();

    EXPECT_EQ(acc.total_reports, 1u);
    EXPECT_EQ(agg.current().total_reports, 0u);
    EXPECT_EQ(agg.current().vt_threshold, 7);
}

// ==============================================================================
// Артефакты
// ==============================================================================

TEST(StatsTest, SummaryToJson_Layout) {
    StatsAggregator agg(10);
    agg.add_report(make_report(4, 2, 2), "a.json");

    auto doc = summary_to_json(agg.current());

    EXPECT_EQ(doc["Total reports"].GetUint64(), 1u);
    EXPECT_EQ(doc["Process stats"]["Max spawned processes"]["n_processes"].GetUint64(), 2u);
    EXPECT_STREQ(doc["Process stats"]["Max spawned processes"]["Example report"].GetString(),
                 "a.json");
    EXPECT_DOUBLE_EQ(doc["Detection stats"]["Average VT detections"].GetDouble(), 4.0);
    const auto& cape = doc["Detection stats"]["CAPE Detections"];
    ASSERT_EQ(cape.Size(), 1u);
    EXPECT_STREQ(cape[0][0].GetString(), "Emotet");
    EXPECT_EQ(cape[0][1].GetUint64(), 1u);
}

TEST(StatsTest, UndetectedKey_MentionsThreshold) {
    EXPECT_EQ(undetected_key(10), "Undetected or benign (10/N or less VT detections)");
}

class StatsPhaseTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("curator_stats_") + test_info->test_case_name() +
                                  "_" + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );

        test_dir_ = std::filesystem::temp_directory_path() / unique_name;
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }
};

TEST_F(StatsPhaseTest, RunStats_WritesThreeArtifacts) {
    // Arrange
    auto path = test_dir_ / "a.json";
    {
        std::ofstream file(path, std::ios::binary);
        file << io::serialize_report(make_report(2, 1, 1, R"("(n/a)")"), true);
    }
    auto unreadable = test_dir_ / "bad.json";
    {
        std::ofstream file(unreadable, std::ios::binary);
        file << "{";
    }
    StagingLayout layout(test_dir_ / "out");
    output::OutputConfig cfg;
    cfg.quiet = true;
    output::Writer writer(cfg);

    // Act
    ::testing::internal::CaptureStderr();
    StatsAccumulator acc = run_stats({path, unreadable}, 10, layout, writer);
    ::testing::internal::GetCapturedStderr();

    // Assert
    EXPECT_EQ(acc.total_reports, 2u);
    EXPECT_TRUE(std::filesystem::exists(layout.statistics_json()));
    EXPECT_TRUE(std::filesystem::exists(layout.unlabeled_json()));
    ASSERT_TRUE(std::filesystem::exists(layout.undetected_json()));

    std::ifstream file(layout.undetected_json(), std::ios::binary);
    std::ostringstream ss;
    ss << file.rdbuf();
    rapidjson::Document doc;
    doc.Parse(ss.str().c_str());
    ASSERT_TRUE(doc.IsObject());
    const auto& list = doc[undetected_key(10).c_str()];
    ASSERT_EQ(list.Size(), 1u);
}

}  // namespace curator::curate::test
