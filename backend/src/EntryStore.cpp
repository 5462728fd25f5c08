#include "EntryStore.hpp"
#include "ComboErrors.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

EntryStore::EntryStore() = default;

void EntryStore::set_source_weights(const std::map<std::string, double>& weights) {
    source_weights_ = weights;
}

double EntryStore::source_weight(const std::string& source) const {
    auto it = source_weights_.find(source);
    return it == source_weights_.end() ? 0.0 : it->second;
}

void EntryStore::add(LexiconEntry entry) {
    entries_.push_back(std::move(entry));
}

bool EntryStore::load_from_jsonl(const std::string& path, const InitialsCodec& codec) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[Index] Error: could not open " << path << "\n";
        return false;
    }

    entries_.clear();
    skipped_lines_ = 0;
    rederived_lines_ = 0;

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

        try {
            json j = json::parse(line);
            if (!j.contains("w") || !j["w"].is_string()) {
                throw std::runtime_error("missing 'w'");
            }
            std::string word = j["w"].get<std::string>();

            std::vector<std::string> sources;
            if (j.contains("sources") && j["sources"].is_array()) {
                for (const auto& s : j["sources"]) {
                    if (s.is_string()) sources.push_back(s.get<std::string>());
                }
            } else if (j.contains("source") && j["source"].is_string()) {
                sources.push_back(j["source"].get<std::string>());
            }

            double score = 0.0;
            if (j.contains("score") && j["score"].is_number()) {
                score = j["score"].get<double>();
            } else {
                for (const auto& s : sources) score = std::max(score, source_weight(s));
            }

            // Stored initials are only a cross-check, the configured codec decides the units
            LexiconEntry entry = LexiconEntry::from_word(word, score, std::move(sources), codec);
            if (j.contains("initials") && j["initials"].is_array() &&
                j["initials"].get<std::vector<std::string>>() != entry.initials()) {
                ++rederived_lines_;
            }
            entries_.push_back(std::move(entry));
        } catch (const json::exception& e) {
            ++skipped_lines_;
            std::cerr << "[Index] Warning: " << path << ":" << line_no << " malformed record: " << e.what() << "\n";
        } catch (const ComboError& e) {
            ++skipped_lines_;
            std::cerr << "[Index] Warning: " << path << ":" << line_no << " rejected: " << e.what() << "\n";
        } catch (const std::runtime_error& e) {
            ++skipped_lines_;
            std::cerr << "[Index] Warning: " << path << ":" << line_no << " " << e.what() << "\n";
        }
    }

    if (rederived_lines_ > 0) {
        std::cerr << "[Index] Warning: " << rederived_lines_ << " records in " << path
                  << " carry initials for another granularity, re-derived as "
                  << to_string(codec.granularity()) << "\n";
    }

    std::cout << "[Index] Read " << entries_.size() << " records from " << path;
    if (skipped_lines_ > 0) std::cout << " (" << skipped_lines_ << " skipped)";
    std::cout << "\n";
    return !entries_.empty();
}

bool EntryStore::save_to_jsonl(const std::string& path, const std::vector<LexiconEntry>& entries) {
    try {
        fs::path outp(path);
        if (outp.has_parent_path()) fs::create_directories(outp.parent_path());
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[Index] Warning: could not create directories: " << e.what() << "\n";
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        std::cerr << "[Index] Error: could not create file " << path << "\n";
        return false;
    }

    for (const auto& entry : entries) {
        json j;
        j["w"] = entry.word();
        j["sources"] = entry.sources();
        j["score"] = entry.score();
        j["initials"] = entry.initials();
        out << j.dump() << "\n";
    }

    out.close();
    if (!out) {
        std::cerr << "[Index] Error: failed writing " << path << "\n";
        return false;
    }

    std::cout << "[Index] Saved " << entries.size() << " entries to " << path << "\n";
    return true;
}
