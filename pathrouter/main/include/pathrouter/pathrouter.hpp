// pathrouter Umbrella Header
//
// Include this single header to pull in the public routing API:
//   - Path patterns (PathPattern, ParsePathSegments, MatchResult, Specificity)
//   - Routing (PathRouter, PathRouterBuilder, Endpoint, MatchingEndpoint)
//   - Configuration (RouterConfig)
//   - Errors (PatternSyntaxError, DuplicateRouteError)
//
// Usage Example:
//    #include <pathrouter/pathrouter.hpp>
//    using namespace pathrouter;
//    int main() {
//      auto router = PathRouter<int>::builder().add("/", 1).add("/raw/{file}", 2).build();
//      if (auto match = router.find("/raw/report.txt")) {
//        // match->value() == 2, match->variables().at("file") == "report.txt"
//      }
//    }

#pragma once

// Patterns
#include "pathrouter/match-result.hpp"    // IWYU pragma: export
#include "pathrouter/path-pattern.hpp"    // IWYU pragma: export
#include "pathrouter/path-segment.hpp"    // IWYU pragma: export
#include "pathrouter/pattern-errors.hpp"  // IWYU pragma: export
#include "pathrouter/specificity.hpp"     // IWYU pragma: export

// Routing
#include "pathrouter/duplicate-route-error.hpp"  // IWYU pragma: export
#include "pathrouter/endpoint.hpp"               // IWYU pragma: export
#include "pathrouter/matching-endpoints.hpp"     // IWYU pragma: export
#include "pathrouter/path-router.hpp"            // IWYU pragma: export

// Configuration
#include "pathrouter/router-config.hpp"  // IWYU pragma: export
