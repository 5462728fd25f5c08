#pragma once
#include <memory>
#include <string>
#include <vector>
#include "ComboJson.hpp"
#include "ComboSearch.hpp"
#include "LexiconIndex.hpp"
#include "SearchWorkerPool.hpp"
#include "ServiceConfig.hpp"

// Per request knobs, zero means "use the configured default"
struct SuggestOptions {
    int beam_width = 0;
    int max_results = 0;
    bool keep_order = true;   // false = bag mode
    bool trace = false;
};

class ComboService {
public:
    // Loads the lexicon named by config.lexicon_path, throws std::runtime_error if that fails
    explicit ComboService(const ServiceConfig& config);
    ComboService(std::shared_ptr<const LexiconIndex> index, const ServiceConfig& config);

    // Returns a raw JSON string of ranked combos.
    // ComboError subclasses propagate to the caller
    std::string suggest(const std::vector<std::string>& initials, const SuggestOptions& options);

    // Takes the first syllable of every word, then behaves like suggest
    std::string suggest_from_words(const std::vector<std::string>& words, const SuggestOptions& options);

    // Dictionary metadata for a single word
    std::string check_word(const std::string& word) const;

    // Words whose first initial is letter, best first
    std::string words_starting_with(const std::string& letter, int limit = 50, bool with_metadata = false) const;

    std::string stats() const;

    // Same search as suggest, without the JSON layer (used by the CLI and tests)
    SearchOutcome run(const std::vector<std::string>& initials, const SuggestOptions& options);

    const LexiconIndex& index() const { return *index_; }
    const ServiceConfig& config() const { return config_; }

private:
    ServiceConfig config_;
    std::shared_ptr<const LexiconIndex> index_;
    std::shared_ptr<const ComboSearchEngine> engine_;
    std::unique_ptr<SearchWorkerPool> pool_;

    void start();
    std::vector<std::string> normalize_target(const std::vector<std::string>& initials) const;
    json respond(const std::vector<std::string>& initials, const SuggestOptions& options, const SearchOutcome& outcome) const;
};
