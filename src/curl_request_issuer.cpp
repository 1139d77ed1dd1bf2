#include "infer_bench/request_issuer.hpp"

#include "infer_bench/cancel_token.hpp"
#include "logger.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace infer_bench {

struct CurlRequestIssuer::Handle {
    CURL* curl = nullptr;
    curl_slist* headers = nullptr;

    Handle() {
        curl = curl_easy_init();
        headers = curl_slist_append(headers, "Content-Type: application/json");
    }
    ~Handle() {
        if (headers) curl_slist_free_all(headers);
        if (curl) curl_easy_cleanup(curl);
    }
    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;
};

namespace {

size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int CheckCancel(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancelToken*>(clientp);
    return token->IsCancelled() ? 1 : 0;
}

FailureKind ClassifyCurlError(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return FailureKind::Timeout;
        case CURLE_ABORTED_BY_CALLBACK:
            return FailureKind::Cancelled;
        default:
            return FailureKind::Network;
    }
}

}

CurlGlobalGuard::CurlGlobalGuard() {
    curl_global_init(CURL_GLOBAL_ALL);
}

CurlGlobalGuard::~CurlGlobalGuard() {
    curl_global_cleanup();
}

CurlRequestIssuer::CurlRequestIssuer(HttpIssuerOptions options)
    : options_(std::move(options)), handle_(std::make_unique<Handle>()) {}

CurlRequestIssuer::~CurlRequestIssuer() = default;

std::unique_ptr<RequestIssuer> CurlRequestIssuer::Clone() const {
    return std::make_unique<CurlRequestIssuer>(options_);
}

std::string CurlRequestIssuer::BuildRequestBody(const std::string& workload_id, const std::string& prompt) {
    nlohmann::json body = {
        {"model", workload_id},
        {"prompt", prompt},
        {"stream", false},
    };
    return body.dump();
}

RequestOutcome CurlRequestIssuer::Send(const std::string& workload_id,
                                       const std::string& prompt,
                                       const CancelToken& token) {
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] { return std::chrono::steady_clock::now() - start; };

    CURL* curl = handle_->curl;
    if (curl == nullptr) {
        return RequestOutcome::Failure(elapsed(), FailureKind::Internal, "curl_easy_init failed");
    }

    const std::string payload = BuildRequestBody(workload_id, prompt);
    std::string response;

    curl_easy_setopt(curl, CURLOPT_URL, options_.endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, handle_->headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.request_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &WriteBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &CheckCancel);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<CancelToken*>(&token));

    const CURLcode rc = curl_easy_perform(curl);
    const auto took = elapsed();

    if (rc != CURLE_OK) {
        const auto kind = ClassifyCurlError(rc);
        IB_LOG_DEBUG("[{}] request failed after {} ms: {}", workload_id,
                     std::chrono::duration_cast<std::chrono::milliseconds>(took).count(),
                     curl_easy_strerror(rc));
        return RequestOutcome::Failure(took, kind, curl_easy_strerror(rc));
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        IB_LOG_DEBUG("[{}] non-200 status {}", workload_id, status);
        return RequestOutcome::Failure(took, FailureKind::HttpStatus,
                                       "non-200 status: " + std::to_string(status));
    }

    const auto doc = nlohmann::json::parse(response, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return RequestOutcome::Failure(took, FailureKind::MalformedResponse, "response is not a JSON object");
    }

    std::size_t text_size = 0;
    if (auto it = doc.find("response"); it != doc.end() && it->is_string()) {
        text_size = it->get_ref<const std::string&>().size();
    }
    IB_LOG_DEBUG("[{}] [{}] took {} ms, response size {}", workload_id, prompt,
                 std::chrono::duration_cast<std::chrono::milliseconds>(took).count(), text_size);
    return RequestOutcome::Success(took);
}

}
