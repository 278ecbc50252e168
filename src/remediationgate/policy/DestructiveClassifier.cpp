#include "policy/DestructiveClassifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <string_view>

namespace policy {

namespace {
constexpr std::size_t kMaxTermLength = 64;

bool IsBlank(unsigned char c) {
    return std::isspace(c) != 0;
}

// Blank entries yield an empty string; anything that could never equal a
// whole token is rejected.
std::string NormalizeTerm(const std::string& term) {
    auto begin = std::find_if_not(term.begin(), term.end(), [](char c) { return IsBlank(c); });
    auto end = std::find_if_not(term.rbegin(), term.rend(), [](char c) { return IsBlank(c); }).base();

    std::string out;
    for (auto iter = begin; iter < end; ++iter) {
        auto uc = static_cast<unsigned char>(*iter);
        if (!std::isalnum(uc)) {
            throw std::invalid_argument("destructive term '" + term
                + "' contains characters other than letters and digits and can never match");
        }
        out.push_back(static_cast<char>(std::tolower(uc)));
    }

    if (out.size() > kMaxTermLength) {
        throw std::invalid_argument("destructive term '" + term + "' is longer than "
            + std::to_string(kMaxTermLength) + " characters");
    }

    return out;
}
} // namespace

DestructiveClassifier::DestructiveClassifier()
    : DestructiveClassifier(DefaultTerms()) {}

DestructiveClassifier::DestructiveClassifier(const std::vector<std::string>& terms) {
    for (const auto& term : terms) {
        auto normalized = NormalizeTerm(term);
        if (!normalized.empty()) {
            terms_.insert(std::move(normalized));
        }
    }

    if (terms_.empty()) {
        throw std::invalid_argument("destructive term vocabulary is empty");
    }
}

std::vector<std::string> DestructiveClassifier::DefaultTerms() {
    return {"delete", "remove", "kill", "uninstall", "erase"};
}

bool DestructiveClassifier::IsDestructive(const std::string& text) const noexcept {
    std::array<char, kMaxTermLength> token{};
    std::size_t length = 0;
    bool overflow = false;

    auto matches = [&]() {
        if (length == 0 || overflow) {
            return false;
        }
        const std::string_view candidate{token.data(), length};
        return std::any_of(terms_.begin(), terms_.end(),
            [candidate](const std::string& term) { return candidate == term; });
    };

    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            if (length < token.size()) {
                token[length++] = static_cast<char>(std::tolower(uc));
            } else {
                overflow = true;
            }
            continue;
        }

        if (matches()) {
            return true;
        }
        length = 0;
        overflow = false;
    }

    return matches();
}

} // namespace policy
