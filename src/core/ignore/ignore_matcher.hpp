#pragma once

#include <optional>
#include <string>
#include <string_view>
#include "infra/config/config.hpp"
#include "infra/logging/logger.hpp"

namespace s3pull::core {

enum class IgnoreRuleKind {
    StartsWith,
    EndsWith,
    Contains,
};

struct IgnoreMatch {
    IgnoreRuleKind kind;
    std::string pattern;
};

// Первое совпадение выигрывает: prefix -> suffix -> substring
[[nodiscard]] auto match_ignore_rule(std::string_view name, const infra::IgnoreRuleSet& rules)
    -> std::optional<IgnoreMatch>;

[[nodiscard]] auto should_ignore(std::string_view name, const infra::IgnoreRuleSet& rules) -> bool;

/// Rule set bound to a logger so each decision ends up in the log.
class IgnoreMatcher {
public:
    IgnoreMatcher(const infra::IgnoreRuleSet& rules, infra::Logger log);

    [[nodiscard]] auto should_ignore(std::string_view bucket) const -> bool;

private:
    const infra::IgnoreRuleSet& rules_;
    infra::Logger log_;
};

} // namespace s3pull::core
