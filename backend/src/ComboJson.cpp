#include "ComboJson.hpp"

json combo_to_json(const Combo& combo) {
    json item;
    item["combo"] = combo.combo;
    item["words"] = combo.words;
    item["word_sources"] = combo.word_sources;
    item["word_scores"] = combo.word_scores;
    item["matched_initials"] = combo.matched_initials;
    item["coverage"] = combo.coverage;
    item["mode"] = to_string(combo.mode);
    item["score"] = combo.score;
    return item;
}

json entry_to_json(const LexiconEntry& entry) {
    json item;
    item["word"] = entry.word();
    item["initials"] = entry.initials();
    item["sources"] = entry.sources();
    item["score"] = entry.score();
    return item;
}

json trace_to_json(const TraceEvent& event) {
    json item;
    item["event"] = event.event;
    item["level"] = event.level;
    if (!event.words.empty()) item["words"] = event.words;
    if (!event.remaining.empty()) item["remaining"] = event.remaining;
    item["score"] = event.score;

    // "count" means something different per event
    if (event.event == "expand") {
        item["candidates"] = event.count;
    } else if (event.event == "prune") {
        item["frontier_size"] = event.count;
    } else if (event.event == "result" || event.event == "complete" || event.event == "cancel") {
        item["result_count"] = event.count;
    }
    return item;
}

json outcome_to_json(const SearchOutcome& outcome, bool include_trace) {
    json response;
    response["results"] = json::array();
    for (const auto& combo : outcome.combos) {
        response["results"].push_back(combo_to_json(combo));
    }
    response["cancelled"] = outcome.cancelled;
    response["levels"] = outcome.levels;

    if (include_trace) {
        response["trace"] = json::array();
        for (const auto& event : outcome.trace) {
            response["trace"].push_back(trace_to_json(event));
        }
    }
    return response;
}
