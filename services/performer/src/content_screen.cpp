#include "../include/content_screen.hpp"
#include "../include/util.hpp"
#include <stdexcept>
#include <utility>

const std::vector<std::string>& DenylistScreen::default_patterns() {
    static const std::vector<std::string> patterns = {
        "<script>", "</script>", "javascript:", "data:text/html",
        "eval(", "exec(", "system(", "rm -rf", "DROP TABLE",
    };
    return patterns;
}

DenylistScreen::DenylistScreen() : DenylistScreen(default_patterns()) {}

DenylistScreen::DenylistScreen(std::vector<std::string> patterns) : patterns_(std::move(patterns)) {
    lowered_.reserve(patterns_.size());
    for (const auto& p : patterns_) {
        if (p.empty()) throw std::invalid_argument("denylist pattern must not be empty");
        lowered_.push_back(to_lower_unicode(p));
    }
}

std::optional<std::string> DenylistScreen::screen(const std::string& text) const {
    const std::string haystack = to_lower_unicode(text);
    for (size_t i = 0; i < lowered_.size(); ++i) {
        if (haystack.find(lowered_[i]) != std::string::npos) return patterns_[i];
    }
    return std::nullopt;
}
