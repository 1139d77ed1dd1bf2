#pragma once

#include "infer_bench/fwd.hpp"
#include "infer_bench/types.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace infer_bench {

/**
 * Sends one workload unit to the target service.
 *
 * Each worker owns its own clone, so an implementation may keep per-connection
 * state without locking. Send() never throws for request-level failures: they
 * are reported through the returned outcome.
 */
class RequestIssuer {
public:
    virtual ~RequestIssuer() = default;

    // `token` lets a blocked call abort when the trial ends; such calls return FailureKind::Cancelled.
    virtual RequestOutcome Send(const std::string& workload_id,
                                const std::string& prompt,
                                const CancelToken& token) = 0;

    virtual std::unique_ptr<RequestIssuer> Clone() const = 0;
};

struct HttpIssuerOptions {
    std::string endpoint = "http://localhost:11434/api/generate";
    std::chrono::milliseconds request_timeout{60000};
    std::chrono::milliseconds connect_timeout{10000};
};

// POSTs {"model", "prompt", "stream": false} as JSON with libcurl.
// Success requires HTTP 200 and a JSON object body.
class CurlRequestIssuer final : public RequestIssuer {
public:
    explicit CurlRequestIssuer(HttpIssuerOptions options);
    ~CurlRequestIssuer() override;

    CurlRequestIssuer(const CurlRequestIssuer&) = delete;
    CurlRequestIssuer& operator=(const CurlRequestIssuer&) = delete;

    RequestOutcome Send(const std::string& workload_id,
                        const std::string& prompt,
                        const CancelToken& token) override;

    std::unique_ptr<RequestIssuer> Clone() const override;

    // Builds the request body sent for one prompt.
    static std::string BuildRequestBody(const std::string& workload_id, const std::string& prompt);

private:
    struct Handle;

    HttpIssuerOptions options_;
    std::unique_ptr<Handle> handle_; // reused across calls for keep-alive
};

// Process-wide libcurl setup; construct once in main before any worker starts.
class CurlGlobalGuard {
public:
    CurlGlobalGuard();
    ~CurlGlobalGuard();
    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};

}
