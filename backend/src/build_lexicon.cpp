#include "ComboErrors.hpp"
#include "EntryStore.hpp"
#include "HangulText.hpp"
#include "LexiconIndex.hpp"
#include "ServiceConfig.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>
#include <string>

using namespace std;

// Input: one headword per line, optionally followed by a tab and its source tag
//   결근\t표준국어대사전
// Lines without a tag are credited to the fallback source
int main(int argc, char* argv[]) {
    string input_path = "data/headwords.tsv";
    string output_path = "data/lexicon.jsonl";
    ServiceConfig config;

    if (argc >= 2) input_path = argv[1];
    if (argc >= 3) output_path = argv[2];
    if (argc >= 4 && !config.load_from_json(argv[3])) return 1;

    cout << "Building lexicon from: " << input_path << "\n";
    cout << "Output: " << output_path << "\n\n";

    ifstream in(input_path);
    if (!in.is_open()) {
        cerr << "Error: could not open " << input_path << "\n";
        return 1;
    }

    InitialsCodec codec(config.granularity);
    EntryStore store;
    store.set_source_weights(config.source_weights);

    string line;
    size_t skipped = 0;
    while (getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        string raw = line;
        string source = SOURCE_URIMAL;
        size_t tab = line.find('\t');
        if (tab != string::npos) {
            raw = line.substr(0, tab);
            source = line.substr(tab + 1);
        }

        string word = hangul::normalize_word(raw);
        if (word.empty()) {
            ++skipped;
            continue;
        }
        try {
            store.add(LexiconEntry::from_word(word, store.source_weight(source), {source}, codec));
        } catch (const ComboError& e) {
            cerr << "Warning: skipping '" << raw << "': " << e.what() << "\n";
            ++skipped;
        }
    }

    shared_ptr<const LexiconIndex> index;
    try {
        index = LexiconIndex::build(store.entries(), config.reconcile, codec);
    } catch (const DuplicateSourceConflictError& e) {
        cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (!index->save_to_jsonl(output_path)) {
        cerr << "Error: Failed to write lexicon\n";
        return 1;
    }

    cout << "\nLexicon built successfully!\n";
    cout << "Total unique words: " << index->size() << " (" << skipped << " lines skipped)\n";

    // Coverage report
    map<size_t, size_t> length_counts;
    map<string, size_t> source_counts;
    for (const auto& entry : index->entries()) {
        length_counts[entry.length()]++;
        for (const auto& s : entry.sources()) source_counts[s]++;
    }

    cout << "\nHeadword lengths:\n";
    size_t shown = 0;
    for (const auto& p : length_counts) {
        if (++shown > 10) break;
        cout << "  " << p.first << ": " << p.second << "\n";
    }
    cout << "Source coverage:\n";
    for (const auto& p : source_counts) {
        cout << "  " << p.first << ": " << p.second << "\n";
    }

    const char* sample_words[] = {"결근", "신상", "상피", "신경", "근육", "결합"};
    for (const char* word : sample_words) {
        cout << "  contains " << word << ": " << (index->contains(word) ? "yes" : "no") << "\n";
    }

    // Verification: the artifact loads back to the same index
    try {
        auto reloaded = LexiconIndex::load_from_jsonl(output_path, config.source_weights, config.reconcile, codec);
        if (reloaded->size() == index->size()) {
            cout << "Verification: Lexicon loads correctly\n";
        } else {
            cerr << "Verification failed: " << reloaded->size() << " words after reload\n";
            return 1;
        }
    } catch (const std::exception& e) {
        cerr << "Verification failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
