#pragma once

#include <string>

#include "helpers/temp_workspace.hpp"

namespace aiknowsys::testing {

/*
  Small knowledge base shared by the storage tests:

    plans     auth_refactor (COMPLETE, alice), search_index (ACTIVE via
              bob's pointer), legacy (CANCELLED, carol)
    sessions  2026-01-20-session, 2026-01-25, 2026-02-01-session
    learned   esm-imports

  "token" appears twice in auth_refactor, twice in the 2026-01-20 session and
  once in the 2026-01-25 session, bodies only.
*/
inline void WriteSampleKnowledgeBase(const TempWorkspace& ws) {
  ws.Write(".aiknowsys/PLAN_auth_refactor.md",
           "---\n"
           "title: Auth refactor\n"
           "status: complete\n"
           "author: alice\n"
           "created: 2026-01-05\n"
           "updated: 2026-01-20\n"
           "topics: [auth, security]\n"
           "---\n"
           "# Auth refactor\n"
           "\n"
           "Move token validation into middleware. The middleware owns token refresh.\n");

  ws.Write(".aiknowsys/plans/PLAN_search_index.md",
           "# Search index\n"
           "\n"
           "**Status:** 📋 PLANNED\n"
           "**Created:** 2026-01-10\n"
           "**Updated:** 2026-01-12\n"
           "\n"
           "Build the FTS5 index for context search.\n");

  ws.Write(".aiknowsys/plans/active-bob.md",
           "# Bob's active plan\n"
           "\n"
           "**Currently Working On:** [Search index](PLAN_search_index.md)\n"
           "**Status:** 🎯 ACTIVE\n");

  ws.Write(".aiknowsys/PLAN_legacy.md",
           "---\n"
           "title: Legacy cleanup\n"
           "status: cancelled\n"
           "author: carol\n"
           "created: 2025-11-01\n"
           "updated: 2025-12-01\n"
           "---\n"
           "Remove deprecated endpoints.\n");

  ws.Write(".aiknowsys/sessions/2026-01-20-session.md",
           "---\n"
           "topic: Token middleware\n"
           "plan: PLAN_auth_refactor\n"
           "topics: [auth]\n"
           "---\n"
           "# Session: Token middleware (Jan 20)\n"
           "\n"
           "**Key Learning:** ESM chalk import error needs dynamic import\n"
           "Wired the token check.\n");

  ws.Write(".aiknowsys/sessions/2026-01-25.md",
           "# Session: FTS experiments (Jan 25)\n"
           "\n"
           "**Plan:** [Search index](../plans/PLAN_search_index.md)\n"
           "Tried bm25 ranking for token queries.\n");

  ws.Write(".aiknowsys/sessions/2026-02-01-session.md",
           "---\n"
           "topic: Release prep\n"
           "---\n"
           "Tagged the release.\n");

  ws.Write(".aiknowsys/learned/esm-imports.md",
           "---\n"
           "category: error_resolution\n"
           "keywords: [esm, chalk]\n"
           "created: 2026-01-21\n"
           "---\n"
           "# Learned Skill: ESM imports\n"
           "\n"
           "Use a dynamic import for chalk.\n");
}

} // namespace aiknowsys::testing
