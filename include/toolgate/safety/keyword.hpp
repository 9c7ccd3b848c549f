/*
 * ToolGate C++ - Keyword approval
 *
 * Upstream helper that turns an operator's phrase into the boolean the
 * dispatcher expects. The dispatcher itself never sees phrases.
 */
#ifndef toolgate_SAFETY_KEYWORD_HPP
#define toolgate_SAFETY_KEYWORD_HPP

#include <string>

namespace toolgate {

class Config;

class KeywordApproval {
public:
    KeywordApproval() {}
    explicit KeywordApproval(const std::string& keyword) : keyword_(keyword) {}

    // safety.approval_keyword
    static KeywordApproval from_config(const Config& config);

    bool enabled() const { return !keyword_.empty(); }

    // Case-insensitive comparison of the trimmed phrase. Always false when
    // no keyword is configured.
    bool validate(const std::string& phrase) const;

    // "passphrase" -> "p********e"; two characters or fewer are returned as-is
    std::string hint() const;

private:
    std::string keyword_;
};

} // namespace toolgate

#endif // toolgate_SAFETY_KEYWORD_HPP
