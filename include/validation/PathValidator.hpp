#pragma once

#include "validation/Check.hpp"
#include "validation/errors.hpp"
#include "validation/FileKind.hpp"

#include <string>
#include <string_view>

namespace tr::validation {

inline constexpr std::string_view CURRENT_DIRECTORY = ".";

/**
 * Checks a test file path against the grammar for its kind. Rules are applied in order and
 * the first violation wins:
 *   1. NUL or newline                      -> InvalidCharacters
 *   2. contains "../" (raw path)           -> Traversal
 *   3. one leading "./" is ignored from here on
 *   4. no accepted suffix for the kind     -> WrongKind
 *   5. nothing but the suffix              -> Malformed
 *
 * Pure string check; the filesystem is never consulted.
 */
[[nodiscard]] Check<PathError> validatePath(std::string_view path, FileKind kind);

/**
 * Rewrites a project-root relative path so it is relative to a nested working directory.
 * "cypress/cypress/e2e/t.cy.js" with working dir "cypress" becomes "cypress/e2e/t.cy.js".
 * A working dir of "." (or empty) returns the path untouched.
 */
[[nodiscard]] std::string normalizeToWorkingDirectory(std::string_view path, std::string_view workingDir);

[[nodiscard]] std::string_view stripCurrentDirPrefix(std::string_view path);

}
