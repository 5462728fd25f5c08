#include "ComboErrors.hpp"
#include "ComboJson.hpp"
#include "ComboSearch.hpp"
#include "LexiconIndex.hpp"
#include "ServiceConfig.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace std;

static void print_usage() {
    cerr << "Usage: combo_trace [--config PATH] [--lexicon PATH] [--beam N] [--max N]\n"
         << "                   [--from-words] [--bag-mode] [--trace-limit N] items...\n"
         << "Example: combo_trace --from-words 결합 근육 상피 신경\n";
}

int main(int argc, char* argv[]) {
    ServiceConfig config;
    string lexicon_override;
    int beam = 0;
    bool beam_set = false;
    int max_results = 10;
    bool from_words = false;
    bool bag_mode = false;
    int trace_limit = 0;
    vector<string> items;

    try {
        for (int i = 1; i < argc; ++i) {
            string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "--config" && has_value) {
                if (!config.load_from_json(argv[++i])) return 1;
            } else if (arg == "--lexicon" && has_value) {
                lexicon_override = argv[++i];
            } else if (arg == "--beam" && has_value) {
                beam = stoi(argv[++i]);
                beam_set = true;
            } else if (arg == "--max" && has_value) {
                max_results = stoi(argv[++i]);
            } else if (arg == "--trace-limit" && has_value) {
                trace_limit = stoi(argv[++i]);
            } else if (arg == "--from-words") {
                from_words = true;
            } else if (arg == "--bag-mode") {
                bag_mode = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage();
                return 0;
            } else if (arg.rfind("--", 0) == 0) {
                cerr << "Unknown option: " << arg << "\n";
                print_usage();
                return 1;
            } else {
                items.push_back(arg);
            }
        }
    } catch (const std::exception&) {
        cerr << "Error: numeric option expected an integer\n";
        return 1;
    }

    if (items.empty()) {
        print_usage();
        return 1;
    }

    config.apply_environment();
    if (!lexicon_override.empty()) config.lexicon_path = lexicon_override;

    try {
        InitialsCodec codec(config.granularity);
        auto index = LexiconIndex::load_from_jsonl(config.lexicon_path, config.source_weights, config.reconcile, codec);

        ComboScorer scorer;
        scorer.set_weights(config.length_bonus, config.segment_penalty);
        ComboSearchEngine engine(index, scorer);

        vector<string> initials = from_words ? codec.initials_from_words(items) : items;

        SearchParams params = config.search_defaults();
        if (beam_set) params.beam_width = beam;
        params.max_results = max_results;
        params.mode = bag_mode ? SearchMode::Bag : SearchMode::Sequence;
        params.trace = true;

        SearchOutcome outcome = engine.search(initials, params);

        cout << "Initials: " << json(initials).dump() << "\n";
        cout << "\nCombinations (ranked):\n";
        json results = json::array();
        for (const auto& combo : outcome.combos) results.push_back(combo_to_json(combo));
        cout << results.dump(2) << "\n";

        cout << "\nTrace events:\n";
        for (size_t i = 0; i < outcome.trace.size(); ++i) {
            if (trace_limit > 0 && static_cast<int>(i) >= trace_limit) {
                cout << "... truncated after " << trace_limit << " events.\n";
                break;
            }
            cout << "Step " << (i + 1) << ": " << outcome.trace[i].event << "\n";
            cout << trace_to_json(outcome.trace[i]).dump(2) << "\n";
        }
    } catch (const ComboError& e) {
        cerr << "Error (" << e.kind() << "): " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
