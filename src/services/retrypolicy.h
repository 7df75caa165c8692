/**
 * @file retrypolicy.h
 * @brief Retry decisions for failed transfer invocations.
 */

#ifndef RETRYPOLICY_H
#define RETRYPOLICY_H

#include <QString>

/**
 * @brief Class of a transfer failure, derived from the executor's report.
 */
enum class ErrorClass {
    Timeout,     ///< I/O or connection timeout
    Connection,  ///< Network or connection failure
    DiskFull,    ///< No space left on the destination
    Other        ///< Anything else
};

/// @brief Convert ErrorClass to string for logs and messages
[[nodiscard]] inline const char* errorClassToString(ErrorClass errorClass) {
    switch (errorClass) {
        case ErrorClass::Timeout: return "timeout";
        case ErrorClass::Connection: return "connection";
        case ErrorClass::DiskFull: return "disk-full";
        case ErrorClass::Other: return "other";
    }
    return "unknown";
}

/**
 * @brief Verdict of RetryPolicy::decide().
 */
struct RetryDecision {
    bool retry = false;
    int delayMs = 0;
    QString reason;  ///< Set when retry is false
};

/**
 * @brief Pure mapping from (error class, attempt number) to a retry verdict.
 *
 * | class      | attempts | delay                          |
 * |------------|----------|--------------------------------|
 * | Timeout    | 3        | timeoutBaseDelayMs x attempt   |
 * | Connection | 5        | connectionBaseDelayMs x attempt|
 * | DiskFull   | 1        | none                           |
 * | Other      | 2        | otherDelayMs                   |
 *
 * The attempt number counts invocations already made for the task, so the
 * first failure is attempt 1.
 */
class RetryPolicy
{
public:
    struct Limits {
        int timeoutMaxAttempts = 3;
        int timeoutBaseDelayMs = 2000;
        int connectionMaxAttempts = 5;
        int connectionBaseDelayMs = 3000;
        int otherMaxAttempts = 2;
        int otherDelayMs = 1000;
    };

    RetryPolicy() = default;
    explicit RetryPolicy(const Limits &limits) : limits_(limits) {}

    /**
     * @brief Decides whether a failed attempt is retried and after how long.
     * @param errorClass The classified failure.
     * @param attempt Number of attempts made so far (1-based).
     */
    [[nodiscard]] RetryDecision decide(ErrorClass errorClass, int attempt) const;

    /// @brief Total attempts allowed for a class (1 means never retried).
    [[nodiscard]] int maxAttempts(ErrorClass errorClass) const;

    [[nodiscard]] const Limits &limits() const { return limits_; }

    /**
     * @brief Classifies an executor failure from its exit code and error text.
     *
     * Text is inspected first (timeout, then connection/network, then disk
     * space); rsync exit codes are the fallback: 30 and 35 are timeouts,
     * 10, 12 and 255 (ssh) are connection failures.
     */
    [[nodiscard]] static ErrorClass classify(int exitCode, const QString &errorText);

private:
    Limits limits_;
};

#endif // RETRYPOLICY_H
