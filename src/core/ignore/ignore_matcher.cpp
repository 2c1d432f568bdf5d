#include "ignore_matcher.hpp"

namespace s3pull::core {

auto match_ignore_rule(std::string_view name, const infra::IgnoreRuleSet& rules)
    -> std::optional<IgnoreMatch>
{
    for (const auto& prefix : rules.starts_with) {
        if (name.starts_with(prefix)) {
            return IgnoreMatch{IgnoreRuleKind::StartsWith, prefix};
        }
    }
    for (const auto& suffix : rules.ends_with) {
        if (name.ends_with(suffix)) {
            return IgnoreMatch{IgnoreRuleKind::EndsWith, suffix};
        }
    }
    for (const auto& substr : rules.contains) {
        if (name.find(substr) != std::string_view::npos) {
            return IgnoreMatch{IgnoreRuleKind::Contains, substr};
        }
    }
    return std::nullopt;
}

auto should_ignore(std::string_view name, const infra::IgnoreRuleSet& rules) -> bool {
    return match_ignore_rule(name, rules).has_value();
}

IgnoreMatcher::IgnoreMatcher(const infra::IgnoreRuleSet& rules, infra::Logger log)
    : rules_(rules)
    , log_(log ? std::move(log) : infra::null_logger()) {}

auto IgnoreMatcher::should_ignore(std::string_view bucket) const -> bool {
    log_->debug("Evaluating bucket '{}' against ignore patterns.", bucket);

    const auto match = match_ignore_rule(bucket, rules_);
    if (!match) {
        log_->info("Bucket '{}' will be processed.", bucket);
        return false;
    }

    switch (match->kind) {
        case IgnoreRuleKind::StartsWith:
            log_->info("Bucket '{}' ignored because it starts with '{}'.", bucket, match->pattern);
            break;
        case IgnoreRuleKind::EndsWith:
            log_->info("Bucket '{}' ignored because it ends with '{}'.", bucket, match->pattern);
            break;
        case IgnoreRuleKind::Contains:
            log_->info("Bucket '{}' ignored because it contains '{}'.", bucket, match->pattern);
            break;
    }
    return true;
}

} // namespace s3pull::core
