#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include "pathrouter/candidate-index.hpp"
#include "pathrouter/candidate-set.hpp"
#include "pathrouter/endpoint.hpp"
#include "pathrouter/match-result.hpp"

namespace pathrouter {

template <class V>
class PathRouter;

// Lazy, single pass range over the endpoints matching one path, in ranked order (exact literal match first).
// Matchers are only evaluated when the range is advanced, so stopping early skips the remaining candidates.
// The router and the queried path must outlive the range.
template <class V>
class MatchingEndpoints {
 public:
  class iterator {
   public:
    using iterator_concept = std::input_iterator_tag;
    using iterator_category = std::input_iterator_tag;
    using value_type = MatchingEndpoint<V>;
    using difference_type = std::ptrdiff_t;
    using reference = const MatchingEndpoint<V>&;

    iterator() noexcept = default;

    reference operator*() const { return *_range->_current; }

    const MatchingEndpoint<V>* operator->() const { return &*_range->_current; }

    iterator& operator++() {
      _range->advance();
      return *this;
    }

    void operator++(int) { _range->advance(); }

    bool operator==(std::default_sentinel_t) const noexcept {
      return _range == nullptr || !_range->_current.has_value();
    }

   private:
    friend class MatchingEndpoints;

    explicit iterator(MatchingEndpoints* range) noexcept : _range(range) {}

    MatchingEndpoints* _range{nullptr};
  };

  MatchingEndpoints(const MatchingEndpoints&) = delete;
  MatchingEndpoints(MatchingEndpoints&&) noexcept = default;
  MatchingEndpoints& operator=(const MatchingEndpoints&) = delete;
  MatchingEndpoints& operator=(MatchingEndpoints&&) noexcept = default;

  ~MatchingEndpoints() = default;

  // Evaluates candidates until the first match. Calling begin() again resumes where the range stands.
  iterator begin() {
    if (!_started) {
      _started = true;
      advance();
    }
    return iterator(this);
  }

  [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

 private:
  friend class PathRouter<V>;

  MatchingEndpoints(std::span<const Endpoint<V>> endpoints, const CandidateIndex& index, std::string_view path)
      : _endpoints(endpoints),
        _path(path),
        _candidates(index.endpointCount()),
        _exactEndpoint(index.collect(path, _candidates)),
        _cursor(_candidates.next(0)) {}

  void advance() {
    _current.reset();
    if (_exactEndpoint != CandidateIndex::kNoEndpoint) {
      _current.emplace(_endpoints[_exactEndpoint], PathVariables{});
      _exactEndpoint = CandidateIndex::kNoEndpoint;
      return;
    }
    while (_cursor != CandidateSet::kEnd) {
      const Endpoint<V>& endpoint = _endpoints[_cursor];
      _cursor = _candidates.next(_cursor + 1U);
      MatchResult result = endpoint.pathPattern().match(_path);
      if (result.matches()) {
        _current.emplace(endpoint, std::move(result).variables());
        return;
      }
    }
  }

  std::span<const Endpoint<V>> _endpoints;
  std::string_view _path;
  CandidateSet _candidates;
  uint32_t _exactEndpoint;
  uint32_t _cursor;
  std::optional<MatchingEndpoint<V>> _current;
  bool _started{false};
};

}  // namespace pathrouter
