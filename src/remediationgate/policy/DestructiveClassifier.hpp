#pragma once

#include <set>
#include <string>
#include <vector>

namespace policy {

// Flags recommendation text that names a destructive verb.
//
// Matching is a case-insensitive membership test of whole alphanumeric tokens
// against the vocabulary. Over-flagging only forces a confirmation. Known
// misses: inflected or compound forms ("deleting", "removal", "rm -rf",
// "wipe") are not in the default vocabulary and pass as non-destructive.
//
// Construction throws std::invalid_argument for an empty vocabulary or for a
// term that is not a single alphanumeric word; blank entries are ignored.
class DestructiveClassifier {
public:
    DestructiveClassifier();
    explicit DestructiveClassifier(const std::vector<std::string>& terms);

    bool IsDestructive(const std::string& text) const noexcept;

    const std::set<std::string>& Terms() const { return terms_; }

    static std::vector<std::string> DefaultTerms();

private:
    std::set<std::string> terms_;
};

} // namespace policy
