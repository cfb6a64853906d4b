#ifndef UPDATE_REPOS_VERSION_HPP
#define UPDATE_REPOS_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define UPDATE_REPOS_VERSION_MAJOR 1
#define UPDATE_REPOS_VERSION_MINOR 2
#define UPDATE_REPOS_VERSION_PATCH 0

/*
 * Release tag, overridden by the build when packaging.
 * Example format: "1.2.0".
 */
#ifndef UPDATE_REPOS_VERSION_STR
#define UPDATE_REPOS_VERSION_STR "1.2.0"
#endif
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* UPDATE_REPOS_VERSION = UPDATE_REPOS_VERSION_STR;

#endif /* UPDATE_REPOS_VERSION_HPP */
