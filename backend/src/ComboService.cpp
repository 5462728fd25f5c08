#include "ComboService.hpp"
#include "ComboErrors.hpp"
#include "HangulText.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

ComboService::ComboService(const ServiceConfig& config) : config_(config) {
    std::cout << "[Service] Initializing combo service...\n";

    auto start_time = std::chrono::steady_clock::now();
    index_ = LexiconIndex::load_from_jsonl(config_.lexicon_path,
                                           config_.source_weights,
                                           config_.reconcile,
                                           InitialsCodec(config_.granularity));
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    std::cout << "[Service] Lexicon loaded in " << duration << "ms\n";

    start();
}

ComboService::ComboService(std::shared_ptr<const LexiconIndex> index, const ServiceConfig& config)
    : config_(config), index_(std::move(index)) {
    if (!index_) {
        throw InvalidParameterError("combo service needs a lexicon index");
    }
    start();
}

void ComboService::start() {
    ComboScorer scorer;
    scorer.set_weights(config_.length_bonus, config_.segment_penalty);
    engine_ = std::make_shared<ComboSearchEngine>(index_, scorer);

    size_t num_workers = config_.workers;
    if (num_workers == 0) num_workers = std::thread::hardware_concurrency();
    if (num_workers == 0) num_workers = 4;
    pool_ = std::make_unique<SearchWorkerPool>(num_workers, engine_);

    std::cout << "[Service] Combo service ready!\n";
}

std::vector<std::string> ComboService::normalize_target(const std::vector<std::string>& initials) const {
    std::vector<std::string> target;
    target.reserve(initials.size());
    for (const auto& unit : initials) {
        target.push_back(index_->codec().normalize_unit(unit));
    }
    return target;
}

SearchOutcome ComboService::run(const std::vector<std::string>& initials, const SuggestOptions& options) {
    SearchParams params = config_.search_defaults();
    if (options.beam_width != 0) params.beam_width = options.beam_width;
    if (options.max_results != 0) params.max_results = options.max_results;
    params.mode = options.keep_order ? SearchMode::Sequence : SearchMode::Bag;
    params.trace = options.trace;

    auto cancel = std::make_shared<CancellationToken>();
    std::future<SearchOutcome> pending = pool_->submit(normalize_target(initials), params, cancel);

    if (config_.search_timeout_ms > 0 &&
        pending.wait_for(std::chrono::milliseconds(config_.search_timeout_ms)) == std::future_status::timeout) {
        std::cerr << "[Service] Search exceeded " << config_.search_timeout_ms << "ms, cancelling\n";
        cancel->request_cancel();
    }

    // Rethrows whatever the engine threw
    return pending.get();
}

json ComboService::respond(const std::vector<std::string>& initials,
                           const SuggestOptions& options,
                           const SearchOutcome& outcome) const {
    json response = outcome_to_json(outcome, options.trace);
    response["initials"] = initials;
    response["mode"] = options.keep_order ? "sequence" : "bag";
    return response;
}

std::string ComboService::suggest(const std::vector<std::string>& initials, const SuggestOptions& options) {
    auto start_time = std::chrono::steady_clock::now();

    std::vector<std::string> target = normalize_target(initials);
    SearchOutcome outcome = run(target, options);

    json response = respond(target, options, outcome);
    double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_time).count();
    response["search_time_ms"] = elapsed;
    return response.dump();
}

std::string ComboService::suggest_from_words(const std::vector<std::string>& words, const SuggestOptions& options) {
    std::vector<std::string> initials = index_->codec().initials_from_words(words);
    return suggest(initials, options);
}

std::string ComboService::check_word(const std::string& word) const {
    std::string clean = hangul::nfc(word);

    json response;
    response["word"] = clean;

    const LexiconEntry* entry = index_->find(clean);
    response["is_word"] = entry != nullptr;
    response["sources"] = entry ? entry->sources() : std::vector<std::string>();
    response["score"] = entry ? entry->score() : 0.0;

    bool has_prefix = false;
    try {
        has_prefix = index_->has_word_prefix(clean);
    } catch (const UnsupportedCharacterError&) {
        // Not Hangul, so nothing in the lexicon can start with it
        has_prefix = false;
    }
    response["has_prefix"] = has_prefix;
    return response.dump();
}

std::string ComboService::words_starting_with(const std::string& letter, int limit, bool with_metadata) const {
    std::string unit = index_->codec().normalize_unit(letter);

    json response;
    response["letter"] = unit;
    response["words"] = json::array();

    // Lookup is by exactly one initial-unit
    if (unit.empty() || hangul::length(unit) != 1 || limit <= 0) {
        return response.dump();
    }

    for (const LexiconEntry* entry : index_->words_starting_with(unit, static_cast<size_t>(limit))) {
        if (with_metadata) {
            response["words"].push_back(entry_to_json(*entry));
        } else {
            response["words"].push_back(entry->word());
        }
    }
    return response.dump();
}

std::string ComboService::stats() const {
    SearchWorkerPool::Stats pool_stats = pool_->get_stats();

    json response;
    response["lexicon_words"] = index_->size();
    response["trie_nodes"] = index_->node_count();
    response["granularity"] = to_string(index_->codec().granularity());
    response["workers"] = pool_stats.workers;
    response["queue_size"] = pool_stats.queue_size;
    response["completed_searches"] = pool_stats.completed_tasks;
    response["failed_searches"] = pool_stats.failed_tasks;
    response["cancelled_searches"] = pool_stats.cancelled_tasks;
    return response.dump();
}
