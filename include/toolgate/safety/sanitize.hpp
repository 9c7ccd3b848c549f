/*
 * ToolGate C++ - Input sanitizers
 *
 * Free-text cleanup, node-name validation and shell command screening.
 * Sanitizers never throw on hostile input; they return a decision.
 */
#ifndef toolgate_SAFETY_SANITIZE_HPP
#define toolgate_SAFETY_SANITIZE_HPP

#include <string>
#include <cstddef>

namespace toolgate {

struct CommandCheck {
    bool safe;
    std::string reason;

    CommandCheck() : safe(false) {}
    CommandCheck(bool s, const std::string& r) : safe(s), reason(r) {}
};

struct NodeNameCheck {
    bool safe;
    std::string reason;
    std::string value;   // trimmed name when safe

    NodeNameCheck() : safe(false) {}
};

// Strip NUL and control bytes (keeping \n and \t) and truncate to max_len
// bytes without splitting a UTF-8 sequence.
std::string sanitize_text(const std::string& input, size_t max_len = 10000);

// Trim, cap at 50 characters, require [A-Za-z0-9_-]+.
NodeNameCheck sanitize_node_name(const std::string& name);

// Screen a shell command line.
//
//  1. empty -> rejected
//  2. deny-list substring (case-insensitive) -> rejected, even under override
//  3. backtick or $( substitution -> rejected
//  4. chaining (; && || newline) -> rejected unless the whole command
//     matches an allow-listed compound pattern, or override is active and
//     every segment passes step 5
//  5. every pipe/chain segment must start with an allow-listed command;
//     under override the secondary allow-list is consulted as well
CommandCheck sanitize_command(const std::string& command, bool override_active = false);

} // namespace toolgate

#endif // toolgate_SAFETY_SANITIZE_HPP
