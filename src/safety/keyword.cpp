/*
 * ToolGate C++ - Keyword approval
 */
#include <toolgate/safety/keyword.hpp>
#include <toolgate/core/config.hpp>
#include <toolgate/core/utils.hpp>

namespace toolgate {

KeywordApproval KeywordApproval::from_config(const Config& config) {
    return KeywordApproval(trim(config.get_string("safety.approval_keyword", "")));
}

bool KeywordApproval::validate(const std::string& phrase) const {
    if (keyword_.empty()) return false;
    return to_lower(trim(phrase)) == to_lower(keyword_);
}

std::string KeywordApproval::hint() const {
    if (keyword_.size() <= 2) return keyword_;
    return keyword_.substr(0, 1) + std::string(keyword_.size() - 2, '*') +
           keyword_.substr(keyword_.size() - 1);
}

} // namespace toolgate
