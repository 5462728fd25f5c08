#pragma once
// ServiceConfig.hpp
// Runtime settings for the combo service, read from a JSON file (every key optional)
// and then overridden by MNEMO_LEXICON / MNEMO_HOST / MNEMO_PORT when set

#include <map>
#include <string>
#include "ComboSearch.hpp"
#include "InitialsCodec.hpp"
#include "LexiconIndex.hpp"

// Dictionary provenance tags and their default weights
extern const char* const SOURCE_URIMAL;  // 우리말샘
extern const char* const SOURCE_STD;     // 표준국어대사전
extern const char* const SOURCE_BASIC;   // 한국어기초사전

struct ServiceConfig {
    std::string lexicon_path = "data/lexicon.jsonl";
    std::string host = "0.0.0.0";
    int port = 8000;

    // Search defaults (requests may override beam width and result count)
    int beam_width = 64;
    int max_results = 20;
    int branch_limit = 32;
    bool allow_repeated_words = true;
    EmptyTargetPolicy empty_target = EmptyTargetPolicy::Reject;

    InitialGranularity granularity = InitialGranularity::Syllable;
    ReconcilePolicy reconcile = ReconcilePolicy::KeepMax;

    double length_bonus = 0.3;
    double segment_penalty = 0.2;

    int search_timeout_ms = 2000;
    size_t workers = 0;  // 0 = hardware concurrency

    std::map<std::string, double> source_weights;

    ServiceConfig();

    // Returns false (and keeps the current values) if the file cannot be read or parsed.
    // Unknown enum values are reported and ignored
    bool load_from_json(const std::string& path);

    void apply_environment();

    // Parameters for one search, starting from the configured defaults
    SearchParams search_defaults() const;
};
