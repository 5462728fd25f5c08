#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include "ServiceConfig.hpp"
#include "TestLexicon.hpp"

namespace {

std::string write_file(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
    return path;
}

} // namespace

TEST(ServiceConfig, Defaults) {
    ServiceConfig config;
    EXPECT_EQ(config.lexicon_path, "data/lexicon.jsonl");
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.beam_width, 64);
    EXPECT_EQ(config.max_results, 20);
    EXPECT_EQ(config.empty_target, EmptyTargetPolicy::Reject);
    EXPECT_EQ(config.reconcile, ReconcilePolicy::KeepMax);
    EXPECT_DOUBLE_EQ(config.source_weights.at(SOURCE_URIMAL), 1.0);
    EXPECT_DOUBLE_EQ(config.source_weights.at(SOURCE_STD), 2.0);
    EXPECT_DOUBLE_EQ(config.source_weights.at(SOURCE_BASIC), 3.0);
}

TEST(ServiceConfig, LoadsJsonFile) {
    std::string path = write_file(scratch_path(".json"), R"({
        "lexicon_path": "/srv/mnemo/lexicon.jsonl",
        "port": 9100,
        "beam_width": 16,
        "max_results": 5,
        "allow_repeated_words": false,
        "empty_target": "trivial",
        "granularity": "consonant",
        "reconcile": "reject",
        "length_bonus": 0.5,
        "search_timeout_ms": 250,
        "workers": 3,
        "source_weights": {"우리말샘": 0.5, "사용자사전": 4.0}
    })");

    ServiceConfig config;
    ASSERT_TRUE(config.load_from_json(path));
    EXPECT_EQ(config.lexicon_path, "/srv/mnemo/lexicon.jsonl");
    EXPECT_EQ(config.port, 9100);
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.beam_width, 16);
    EXPECT_EQ(config.max_results, 5);
    EXPECT_FALSE(config.allow_repeated_words);
    EXPECT_EQ(config.empty_target, EmptyTargetPolicy::TrivialCombo);
    EXPECT_EQ(config.granularity, InitialGranularity::Consonant);
    EXPECT_EQ(config.reconcile, ReconcilePolicy::RejectConflicts);
    EXPECT_DOUBLE_EQ(config.length_bonus, 0.5);
    EXPECT_DOUBLE_EQ(config.segment_penalty, 0.2);
    EXPECT_EQ(config.search_timeout_ms, 250);
    EXPECT_EQ(config.workers, 3u);
    EXPECT_DOUBLE_EQ(config.source_weights.at("우리말샘"), 0.5);
    EXPECT_DOUBLE_EQ(config.source_weights.at("사용자사전"), 4.0);
    EXPECT_DOUBLE_EQ(config.source_weights.at("한국어기초사전"), 3.0);

    SearchParams params = config.search_defaults();
    EXPECT_EQ(params.beam_width, 16);
    EXPECT_EQ(params.max_results, 5);
    EXPECT_FALSE(params.allow_repeated_words);
    EXPECT_EQ(params.empty_target, EmptyTargetPolicy::TrivialCombo);
    EXPECT_EQ(params.mode, SearchMode::Sequence);
    std::remove(path.c_str());
}

TEST(ServiceConfig, UnknownEnumKeepsDefault) {
    std::string path = write_file(scratch_path(".json"), R"({"granularity": "jamo", "beam_width": 8})");
    ServiceConfig config;
    ASSERT_TRUE(config.load_from_json(path));
    EXPECT_EQ(config.granularity, InitialGranularity::Syllable);
    EXPECT_EQ(config.beam_width, 8);
    std::remove(path.c_str());
}

TEST(ServiceConfig, NegativeWorkersKeepDefault) {
    std::string path = write_file(scratch_path(".json"), R"({"workers": -2, "port": 9000})");
    ServiceConfig config;
    ASSERT_TRUE(config.load_from_json(path));
    EXPECT_EQ(config.workers, 0u);
    EXPECT_EQ(config.port, 9000);

    write_file(path, R"({"workers": 3})");
    ASSERT_TRUE(config.load_from_json(path));
    EXPECT_EQ(config.workers, 3u);
    std::remove(path.c_str());
}

TEST(ServiceConfig, BadFilesKeepCurrentValues) {
    ServiceConfig config;
    EXPECT_FALSE(config.load_from_json(scratch_path(".missing")));

    std::string broken = write_file(scratch_path(".json"), "{\"port\": ");
    EXPECT_FALSE(config.load_from_json(broken));
    EXPECT_EQ(config.port, 8000);

    write_file(broken, "[1, 2, 3]");
    EXPECT_FALSE(config.load_from_json(broken));

    write_file(broken, R"({"port": "eighty"})");
    EXPECT_FALSE(config.load_from_json(broken));
    std::remove(broken.c_str());
}

TEST(ServiceConfig, EnvironmentOverrides) {
    setenv("MNEMO_LEXICON", "/tmp/other.jsonl", 1);
    setenv("MNEMO_HOST", "127.0.0.1", 1);
    setenv("MNEMO_PORT", "8123", 1);

    ServiceConfig config;
    config.apply_environment();
    EXPECT_EQ(config.lexicon_path, "/tmp/other.jsonl");
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 8123);

    setenv("MNEMO_PORT", "not-a-port", 1);
    config.apply_environment();
    EXPECT_EQ(config.port, 8123);

    unsetenv("MNEMO_LEXICON");
    unsetenv("MNEMO_HOST");
    unsetenv("MNEMO_PORT");
}
