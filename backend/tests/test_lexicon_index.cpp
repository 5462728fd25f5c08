#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <gtest/gtest.h>
#include "ComboErrors.hpp"
#include "ComboSearch.hpp"
#include "EntryStore.hpp"
#include "LexiconIndex.hpp"
#include "TestLexicon.hpp"

using Units = std::vector<std::string>;

namespace {

std::vector<std::string> words_of(const std::vector<const LexiconEntry*>& entries) {
    std::vector<std::string> out;
    for (const auto* e : entries) out.push_back(e->word());
    return out;
}

} // namespace

TEST(LexiconEntry, RejectsInvalidRecords) {
    EXPECT_THROW(LexiconEntry("", {"결"}, 1.0, {"우리말샘"}), InvalidParameterError);
    EXPECT_THROW(LexiconEntry("결", {}, 1.0, {"우리말샘"}), InvalidParameterError);
    EXPECT_THROW(LexiconEntry("결", {""}, 1.0, {"우리말샘"}), InvalidParameterError);
    EXPECT_THROW(LexiconEntry("결", {"결"}, -0.5, {"우리말샘"}), InvalidParameterError);
    EXPECT_THROW(LexiconEntry("결", {"결"}, std::numeric_limits<double>::quiet_NaN(), {"우리말샘"}),
                 InvalidParameterError);
    EXPECT_THROW(LexiconEntry("결", {"결"}, 1.0, {}), InvalidParameterError);
}

TEST(LexiconEntry, SourcesAreSortedAndUnique) {
    LexiconEntry entry("결근", {"결", "근"}, 2.0, {"표준국어대사전", "우리말샘", "표준국어대사전"});
    EXPECT_EQ(entry.sources().size(), 2u);
    EXPECT_TRUE(std::is_sorted(entry.sources().begin(), entry.sources().end()));
    EXPECT_TRUE(entry.has_source("우리말샘"));
    EXPECT_FALSE(entry.has_source("한국어기초사전"));
    EXPECT_EQ(entry.length(), 2u);
}

TEST(LexiconEntry, FromWordDerivesInitials) {
    LexiconEntry entry = make_entry("결근신", 1.0);
    EXPECT_EQ(entry.initials(), (Units{"결", "근", "신"}));
    EXPECT_THROW(make_entry("결x", 1.0), UnsupportedCharacterError);
}

TEST(LexiconIndex, MergesDuplicateWords) {
    auto index = anatomy_index();
    const LexiconEntry* entry = index->find("결근");
    ASSERT_NE(entry, nullptr);
    EXPECT_DOUBLE_EQ(entry->score(), 3.0);
    EXPECT_EQ(entry->sources().size(), 2u);
    EXPECT_TRUE(entry->has_source("표준국어대사전"));
    EXPECT_TRUE(entry->has_source("한국어기초사전"));
}

TEST(LexiconIndex, KeepMaxResolvesSameSourceConflict) {
    auto index = LexiconIndex::build({make_entry("결근", 1.0), make_entry("결근", 2.5)});
    EXPECT_EQ(index->size(), 1u);
    EXPECT_DOUBLE_EQ(*index->score_of("결근"), 2.5);
}

TEST(LexiconIndex, RejectConflictsThrows) {
    std::vector<LexiconEntry> entries = {make_entry("결근", 1.0), make_entry("결근", 2.5)};
    try {
        LexiconIndex::build(entries, ReconcilePolicy::RejectConflicts);
        FAIL() << "expected DuplicateSourceConflictError";
    } catch (const DuplicateSourceConflictError& e) {
        EXPECT_STREQ(e.kind(), "duplicate_source_conflict");
    }
}

TEST(LexiconIndex, RejectConflictsAcceptsIdenticalDuplicates) {
    auto index = LexiconIndex::build({make_entry("결근", 2.0), make_entry("결근", 2.0)},
                                     ReconcilePolicy::RejectConflicts);
    EXPECT_EQ(index->size(), 1u);
}

TEST(LexiconIndex, EntriesAreInRankOrder) {
    auto index = anatomy_index();
    const auto& entries = index->entries();
    EXPECT_TRUE(std::is_sorted(entries.begin(), entries.end(), entry_ranks_before));
}

TEST(LexiconIndex, LookupPrefixIsBestFirst) {
    auto index = anatomy_index();
    // 결근 3.0, 결합 3.0, 결 1.0, 결근신 1.0
    EXPECT_EQ(words_of(index->lookup_prefix({"결"})), (Units{"결근", "결합", "결", "결근신"}));
    EXPECT_EQ(words_of(index->lookup_prefix({"결"}, 2)), (Units{"결근", "결합"}));
    EXPECT_EQ(words_of(index->lookup_prefix({"결", "근"})), (Units{"결근", "결근신"}));
    EXPECT_TRUE(index->lookup_prefix({"피"}).empty());
}

TEST(LexiconIndex, LookupExact) {
    auto index = anatomy_index();
    EXPECT_EQ(words_of(index->lookup_exact({"결", "근"})), (Units{"결근"}));
    EXPECT_TRUE(index->lookup_exact({"결", "근", "상"}).empty());
    EXPECT_TRUE(index->lookup_exact({}).empty());
}

TEST(LexiconIndex, ExactAndPrefixAgree) {
    auto index = anatomy_index();
    for (const auto& entry : index->entries()) {
        auto exact = index->lookup_exact(entry.initials());
        auto prefix = index->lookup_prefix(entry.initials());
        EXPECT_NE(std::find(exact.begin(), exact.end(), &entry), exact.end()) << entry.word();
        EXPECT_NE(std::find(prefix.begin(), prefix.end(), &entry), prefix.end()) << entry.word();
        for (const auto* e : exact) {
            EXPECT_NE(std::find(prefix.begin(), prefix.end(), e), prefix.end());
        }
    }
}

TEST(LexiconIndex, WordValidation) {
    auto index = anatomy_index();
    EXPECT_TRUE(index->contains("신경"));
    EXPECT_FALSE(index->contains("신발"));
    EXPECT_DOUBLE_EQ(*index->score_of("신경"), 3.0);
    EXPECT_FALSE(index->score_of("신발").has_value());
}

TEST(LexiconIndex, HasPrefix) {
    auto index = anatomy_index();
    EXPECT_TRUE(index->has_prefix({"상"}));
    EXPECT_TRUE(index->has_prefix({"결", "근"}));
    EXPECT_FALSE(index->has_prefix({"근", "결"}));
    EXPECT_TRUE(index->has_prefix({}));

    auto empty = LexiconIndex::build({});
    EXPECT_FALSE(empty->has_prefix({}));
    EXPECT_EQ(empty->size(), 0u);
}

TEST(LexiconIndex, WordsStartingWith) {
    auto index = anatomy_index();
    EXPECT_EQ(words_of(index->words_starting_with("신", 10)), (Units{"신경", "신", "신상", "신상결"}));
    EXPECT_EQ(index->words_starting_with("신", 1).size(), 1u);
}

TEST(LexiconIndex, MatchesAlongIsShortestFirst) {
    auto index = anatomy_index();
    Units target = {"결", "근", "신", "상"};
    EXPECT_EQ(words_of(index->matches_along(target, 0, 32)), (Units{"결", "결근", "결근신"}));
    EXPECT_EQ(words_of(index->matches_along(target, 1, 32)), (Units{"근", "근신"}));
    EXPECT_EQ(words_of(index->matches_along(target, 3, 32)), (Units{"상"}));
    EXPECT_TRUE(index->matches_along(target, 4, 32).empty());
}

TEST(LexiconIndex, MatchesWithinRespectsCounts) {
    auto index = anatomy_index();
    std::map<std::string, int> bag = {{"신", 1}, {"상", 1}};
    Units words = words_of(index->matches_within(bag, 32));
    std::sort(words.begin(), words.end());
    EXPECT_EQ(words, (Units{"상", "상신", "신", "신상"}));
}

TEST(LexiconIndex, ConsonantGranularity) {
    InitialsCodec codec(InitialGranularity::Consonant);
    auto index = LexiconIndex::build({
        LexiconEntry::from_word("결근", 2.0, {"표준국어대사전"}, codec),
        LexiconEntry::from_word("가격", 1.0, {"표준국어대사전"}, codec),
    }, ReconcilePolicy::KeepMax, codec);

    EXPECT_EQ(words_of(index->lookup_exact({"ㄱ", "ㄱ"})), (Units{"결근", "가격"}));
    EXPECT_EQ(index->codec().granularity(), InitialGranularity::Consonant);
}

TEST(LexiconIndex, HasWordPrefixChecksHeadwords) {
    InitialsCodec codec(InitialGranularity::Consonant);
    auto index = LexiconIndex::build({
        LexiconEntry::from_word("가격", 1.0, {"표준국어대사전"}, codec),
    }, ReconcilePolicy::KeepMax, codec);

    // 결 and 가 both reduce to ㄱ
    EXPECT_TRUE(index->has_prefix({"ㄱ"}));
    EXPECT_FALSE(index->has_word_prefix("결"));
    EXPECT_TRUE(index->has_word_prefix("가"));
    EXPECT_TRUE(index->has_word_prefix("가격"));
    EXPECT_FALSE(index->has_word_prefix("가격표"));
    EXPECT_THROW(index->has_word_prefix("abc"), UnsupportedCharacterError);
}

TEST(LexiconIndex, LoadRederivesInitialsForConfiguredGranularity) {
    std::string path = scratch_path(".jsonl");
    ASSERT_TRUE(anatomy_index()->save_to_jsonl(path));

    InitialsCodec consonant(InitialGranularity::Consonant);
    EntryStore store;
    ASSERT_TRUE(store.load_from_jsonl(path, consonant));
    EXPECT_EQ(store.rederived_lines(), store.size());
    for (const auto& entry : store.entries()) {
        EXPECT_EQ(entry.initials(), consonant.initials_of(entry.word()));
    }

    auto index = LexiconIndex::load_from_jsonl(path, {}, ReconcilePolicy::KeepMax, consonant);
    EXPECT_EQ(index->codec().granularity(), InitialGranularity::Consonant);
    auto exact = words_of(index->lookup_exact({"ㄱ", "ㄱ"}));
    EXPECT_NE(std::find(exact.begin(), exact.end(), "결근"), exact.end());

    ComboSearchEngine engine(index);
    SearchOutcome outcome = engine.search({"ㄱ", "ㄱ"}, SearchParams());
    ASSERT_FALSE(outcome.combos.empty());
    EXPECT_DOUBLE_EQ(outcome.combos[0].coverage, 1.0);

    // Same granularity as the writer, nothing to re-derive
    EntryStore same;
    ASSERT_TRUE(same.load_from_jsonl(path, InitialsCodec()));
    EXPECT_EQ(same.rederived_lines(), 0u);
    std::remove(path.c_str());
}

TEST(LexiconIndex, SaveReportsWriteFailure) {
    if (!std::filesystem::exists("/dev/full")) GTEST_SKIP() << "/dev/full not available";
    EXPECT_FALSE(EntryStore::save_to_jsonl("/dev/full", anatomy_index()->entries()));
}

TEST(LexiconIndex, SaveAndLoadJsonl) {
    auto index = anatomy_index();
    std::string path = scratch_path(".jsonl");
    ASSERT_TRUE(index->save_to_jsonl(path));

    auto reloaded = LexiconIndex::load_from_jsonl(path, {});
    ASSERT_EQ(reloaded->size(), index->size());
    for (size_t i = 0; i < index->size(); ++i) {
        EXPECT_EQ(reloaded->entries()[i].word(), index->entries()[i].word());
        EXPECT_DOUBLE_EQ(reloaded->entries()[i].score(), index->entries()[i].score());
        EXPECT_EQ(reloaded->entries()[i].sources(), index->entries()[i].sources());
    }
    std::remove(path.c_str());
}

TEST(LexiconIndex, LoadFallsBackToSourceWeights) {
    std::string path = scratch_path(".jsonl");
    {
        std::ofstream out(path);
        out << "{\"w\": \"결근\", \"sources\": [\"우리말샘\", \"한국어기초사전\"]}\n";
        out << "{\"w\": \"신경\", \"source\": \"표준국어대사전\"}\n";
        out << "not json\n";
        out << "{\"w\": \"abc\", \"sources\": [\"우리말샘\"], \"score\": 1}\n";
        out << "\n";
    }

    std::map<std::string, double> weights = {{"우리말샘", 1.0}, {"표준국어대사전", 2.0}, {"한국어기초사전", 3.0}};
    EntryStore store;
    store.set_source_weights(weights);
    ASSERT_TRUE(store.load_from_jsonl(path, InitialsCodec()));
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.skipped_lines(), 2u);

    auto index = LexiconIndex::load_from_jsonl(path, weights);
    EXPECT_DOUBLE_EQ(*index->score_of("결근"), 3.0);
    EXPECT_DOUBLE_EQ(*index->score_of("신경"), 2.0);
    std::remove(path.c_str());
}

TEST(LexiconIndex, LoadMissingFileThrows) {
    EXPECT_THROW(LexiconIndex::load_from_jsonl(scratch_path(".missing"), {}), std::runtime_error);
}
