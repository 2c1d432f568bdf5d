#pragma once

#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include <chrono>
#include <cmath>
#include <string_view>
#include <thread>

namespace s3pull::infra {
/*

auto res = infra::with_retry(*log_, "GetObject", [&]() {
    return perform_range_request(bucket, key, first, last);
}, config.retry);

*/
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(200);
    double backoff_factor = 2.0; // exponential backoff
};

template<typename F>
[[nodiscard]] auto with_retry(spdlog::logger& log, std::string_view what,
                              F&& operation, const RetryPolicy& policy = {})
    -> decltype(operation())
{
    const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;

    for (int attempt = 1; ; ++attempt) {
        auto result = operation();
        if (result.has_value()) {
            return result;
        }

        const auto& err = result.error();
        // Нетранзиентная ошибка, последняя попытка или Ctrl+C: отдаём как есть
        if (!err.is_transient() || attempt >= attempts || is_interrupted()) {
            return result;
        }

        auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
            policy.initial_delay * std::pow(policy.backoff_factor, attempt - 1));
        log.warn("{} failed ({}), retrying in {} ms (attempt {}/{})",
                 what, err.message, delay.count(), attempt + 1, attempts);
        std::this_thread::sleep_for(delay);
    }
}

} // namespace s3pull::infra
