#include "pathrouter/candidate-index.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pathrouter/candidate-set.hpp"
#include "pathrouter/path-pattern.hpp"
#include "pathrouter/router-config.hpp"

namespace pathrouter {

namespace {

struct Collected {
  bool operator==(const Collected&) const noexcept = default;

  uint32_t exactEndpoint;
  std::vector<uint32_t> candidates;
};

Collected Collect(const CandidateIndex& index, std::string_view path) {
  CandidateSet candidates(index.endpointCount());
  Collected collected{index.collect(path, candidates), {}};
  for (uint32_t pos = candidates.next(0); pos != CandidateSet::kEnd; pos = candidates.next(pos + 1U)) {
    collected.candidates.push_back(pos);
  }
  return collected;
}

class CandidateIndexTest : public ::testing::Test {
 protected:
  void addPatterns(std::initializer_list<std::string_view> sources) {
    for (std::string_view source : sources) {
      patterns.emplace_back(source);
    }
  }

  std::unique_ptr<CandidateIndex> create(CandidateIndexKind kind) const {
    std::vector<const PathPattern*> ranked;
    for (const PathPattern& pattern : patterns) {
      ranked.push_back(&pattern);
    }
    return CandidateIndex::Create(RouterConfig{}.withCandidateIndex(kind), ranked);
  }

  void expectSameResults(std::initializer_list<std::string_view> paths) const {
    const auto flat = create(CandidateIndexKind::Flat);
    const auto trie = create(CandidateIndexKind::Trie);
    ASSERT_EQ(flat->kind(), CandidateIndexKind::Flat);
    ASSERT_EQ(trie->kind(), CandidateIndexKind::Trie);
    for (std::string_view path : paths) {
      const Collected flatResult = Collect(*flat, path);
      const Collected trieResult = Collect(*trie, path);
      EXPECT_EQ(flatResult.exactEndpoint, trieResult.exactEndpoint) << path;
      EXPECT_EQ(flatResult.candidates, trieResult.candidates) << path;
    }
  }

  std::vector<PathPattern> patterns;
};

}  // namespace

TEST_F(CandidateIndexTest, EmptyIndex) {
  for (CandidateIndexKind kind : {CandidateIndexKind::Flat, CandidateIndexKind::Trie}) {
    const auto index = create(kind);
    EXPECT_EQ(index->endpointCount(), 0U);
    EXPECT_EQ(Collect(*index, ""), (Collected{CandidateIndex::kNoEndpoint, {}}));
    EXPECT_EQ(Collect(*index, "/a"), (Collected{CandidateIndex::kNoEndpoint, {}}));
  }
}

TEST_F(CandidateIndexTest, CollectsPrefixesAndExactMatch) {
  addPatterns({"/api/users", "/api/{rest}", "/api/users/{id}", "/{any}", "/api/users/{id}/posts", "/static/{file}"});
  for (CandidateIndexKind kind : {CandidateIndexKind::Flat, CandidateIndexKind::Trie}) {
    const auto index = create(kind);
    EXPECT_EQ(Collect(*index, "/api/users"), (Collected{0, {1, 3}}));
    EXPECT_EQ(Collect(*index, "/api/users/42"), (Collected{CandidateIndex::kNoEndpoint, {1, 2, 3, 4}}));
    EXPECT_EQ(Collect(*index, "/api/users/42/posts"), (Collected{CandidateIndex::kNoEndpoint, {1, 2, 3, 4}}));
    EXPECT_EQ(Collect(*index, "/static/a.css"), (Collected{CandidateIndex::kNoEndpoint, {3, 5}}));
    EXPECT_EQ(Collect(*index, "/ap"), (Collected{CandidateIndex::kNoEndpoint, {3}}));
    EXPECT_EQ(Collect(*index, "nothing"), (Collected{CandidateIndex::kNoEndpoint, {}}));
  }
}

TEST_F(CandidateIndexTest, FlatAndTrieAgreeOnOverlappingPrefixes) {
  addPatterns({"", "{a}", "a", "a{b}", "ab{c}", "abc", "abd{x}", "abde", "b{y}", "abcdef{z}", "abcdeg{z}", "abcd{w}"});
  expectSameResults({"", "a", "ab", "abc", "abcd", "abcde", "abcdef", "abcdeg", "abcdex", "abd", "abde", "abdef",
                     "b", "bb", "c", "abx"});
}

TEST_F(CandidateIndexTest, FlatAndTrieAgreeOnMultiByteSequences) {
  // U+1F648, U+1F649 and U+1F600 share their first bytes, U+00E9 and U+00E8 share their first byte.
  addPatterns({"\xF0\x9F\x99\x88", "\xF0\x9F\x99\x89{x}", "\xF0\x9F\x98\x80{x}", "/caf\xC3\xA9{x}",
               "/caf\xC3\xA8", "/caf{x}", "/\xF0\x9F\x99\x88/{x}"});
  expectSameResults({"\xF0\x9F\x99\x88", "\xF0\x9F\x99\x89", "\xF0\x9F\x99\x89x", "\xF0\x9F\x98\x80x", "\xF0\x9F",
                     "\xF0\x9F\x99", "/caf\xC3\xA9", "/caf\xC3\xA9s", "/caf\xC3\xA8", "/caf\xC3", "/cafe",
                     "/\xF0\x9F\x99\x88/", "/\xF0\x9F"});

  const auto trie = create(CandidateIndexKind::Trie);
  EXPECT_EQ(Collect(*trie, "\xF0\x9F"), (Collected{CandidateIndex::kNoEndpoint, {}}));
  EXPECT_EQ(Collect(*trie, "\xF0\x9F\x99\x88"), (Collected{0, {}}));
  EXPECT_EQ(Collect(*trie, "/caf\xC3\xA9x"), (Collected{CandidateIndex::kNoEndpoint, {3, 5}}));
  EXPECT_EQ(Collect(*trie, "/caf\xC3\xA8"), (Collected{4, {5}}));
}

TEST_F(CandidateIndexTest, DeepChainOfPrefixes) {
  for (std::size_t idx = 0; idx < 2000; ++idx) {
    patterns.emplace_back(std::string(idx, 'a') + "{suffix:.*}");
  }
  const auto trie = create(CandidateIndexKind::Trie);
  const Collected collected = Collect(*trie, std::string(1500, 'a'));
  ASSERT_EQ(collected.candidates.size(), 1501U);
  EXPECT_EQ(collected.candidates.back(), 1500U);
  EXPECT_EQ(Collect(*create(CandidateIndexKind::Flat), std::string(1500, 'a')), collected);
}

TEST_F(CandidateIndexTest, AutoSelectsRepresentation) {
  addPatterns({"/a/{x}", "/b/{x}", "/c", "/d"});
  EXPECT_EQ(CandidateIndex::Create(RouterConfig{}, {})->kind(), CandidateIndexKind::Flat);

  std::vector<const PathPattern*> ranked;
  for (const PathPattern& pattern : patterns) {
    ranked.push_back(&pattern);
  }
  EXPECT_EQ(CandidateIndex::Create(RouterConfig{}.withFlatScanMaxEndpoints(2), ranked)->kind(),
            CandidateIndexKind::Flat);
  EXPECT_EQ(CandidateIndex::Create(RouterConfig{}.withFlatScanMaxEndpoints(1), ranked)->kind(),
            CandidateIndexKind::Trie);
}

}  // namespace pathrouter
