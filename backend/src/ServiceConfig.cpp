#include "ServiceConfig.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

const char* const SOURCE_URIMAL = "우리말샘";
const char* const SOURCE_STD = "표준국어대사전";
const char* const SOURCE_BASIC = "한국어기초사전";

ServiceConfig::ServiceConfig() {
    source_weights = {
        {SOURCE_URIMAL, 1.0},
        {SOURCE_STD, 2.0},
        {SOURCE_BASIC, 3.0},
    };
}

bool ServiceConfig::load_from_json(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[Config] Error: could not open " << path << "\n";
        return false;
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        std::cerr << "[Config] Error parsing JSON: " << e.what() << "\n";
        return false;
    }

    if (!j.is_object()) {
        std::cerr << "[Config] Error: " << path << " is not a JSON object\n";
        return false;
    }

    try {
        lexicon_path = j.value("lexicon_path", lexicon_path);
        host = j.value("host", host);
        port = j.value("port", port);
        beam_width = j.value("beam_width", beam_width);
        max_results = j.value("max_results", max_results);
        branch_limit = j.value("branch_limit", branch_limit);
        allow_repeated_words = j.value("allow_repeated_words", allow_repeated_words);
        length_bonus = j.value("length_bonus", length_bonus);
        segment_penalty = j.value("segment_penalty", segment_penalty);
        search_timeout_ms = j.value("search_timeout_ms", search_timeout_ms);
        int worker_count = j.value("workers", static_cast<int>(workers));
        if (worker_count < 0) {
            std::cerr << "[Config] Warning: ignoring negative workers (" << worker_count << ")\n";
        } else {
            workers = static_cast<size_t>(worker_count);
        }

        if (j.contains("empty_target") && !parse_empty_target_policy(j["empty_target"].get<std::string>(), empty_target)) {
            std::cerr << "[Config] Warning: unknown empty_target '" << j["empty_target"].get<std::string>() << "'\n";
        }
        if (j.contains("granularity") && !parse_granularity(j["granularity"].get<std::string>(), granularity)) {
            std::cerr << "[Config] Warning: unknown granularity '" << j["granularity"].get<std::string>() << "'\n";
        }
        if (j.contains("reconcile") && !parse_reconcile_policy(j["reconcile"].get<std::string>(), reconcile)) {
            std::cerr << "[Config] Warning: unknown reconcile policy '" << j["reconcile"].get<std::string>() << "'\n";
        }

        if (j.contains("source_weights") && j["source_weights"].is_object()) {
            for (auto it = j["source_weights"].begin(); it != j["source_weights"].end(); ++it) {
                if (it.value().is_number()) source_weights[it.key()] = it.value().get<double>();
            }
        }
    } catch (const json::type_error& e) {
        std::cerr << "[Config] Error: wrong value type in " << path << ": " << e.what() << "\n";
        return false;
    }

    std::cout << "[Config] Loaded " << path << "\n";
    return true;
}

void ServiceConfig::apply_environment() {
    if (const char* lexicon = std::getenv("MNEMO_LEXICON")) {
        lexicon_path = lexicon;
    }
    if (const char* h = std::getenv("MNEMO_HOST")) {
        host = h;
    }
    if (const char* p = std::getenv("MNEMO_PORT")) {
        try {
            port = std::stoi(p);
        } catch (const std::exception&) {
            std::cerr << "[Config] Warning: ignoring MNEMO_PORT='" << p << "'\n";
        }
    }
}

SearchParams ServiceConfig::search_defaults() const {
    SearchParams params;
    params.beam_width = beam_width;
    params.max_results = max_results;
    params.branch_limit = branch_limit;
    params.allow_repeated_words = allow_repeated_words;
    params.empty_target = empty_target;
    return params;
}
