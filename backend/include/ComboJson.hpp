#pragma once
// ComboJson.hpp
// JSON views of combos, lexicon entries and trace events (wire format of the service)

#include <nlohmann/json.hpp>
#include "ComboSearch.hpp"
#include "LexiconEntry.hpp"

using json = nlohmann::json;

json combo_to_json(const Combo& combo);
json entry_to_json(const LexiconEntry& entry);
json trace_to_json(const TraceEvent& event);

// {"results": [...], "cancelled": bool, "levels": n[, "trace": [...]]}
json outcome_to_json(const SearchOutcome& outcome, bool include_trace);
