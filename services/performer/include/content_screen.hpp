#pragma once
#include <optional>
#include <string>
#include <vector>

// Heuristic screening of prompt text for injection and command markers.
//
// This is a best-effort filter, not a parser and not a security boundary:
// encodings, spacing tricks or paraphrase get past it. It only keeps the most
// blatant payloads away from the inference call; the downstream computation
// still has to be treated as handling untrusted input.
class ContentScreen {
public:
    virtual ~ContentScreen() = default;
    // Returns the first offending fragment, or nullopt if nothing matched.
    virtual std::optional<std::string> screen(const std::string& text) const = 0;
    virtual const char* name() const = 0;
};

// Case-insensitive substring scan (simple Unicode lowercasing on both sides). Patterns are tried in list order and
// the first one found is reported as written in the list.
class DenylistScreen : public ContentScreen {
public:
    DenylistScreen();
    explicit DenylistScreen(std::vector<std::string> patterns);

    std::optional<std::string> screen(const std::string& text) const override;
    const char* name() const override { return "denylist-substring"; }

    static const std::vector<std::string>& default_patterns();

private:
    std::vector<std::string> patterns_;
    std::vector<std::string> lowered_;
};
