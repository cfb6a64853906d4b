#include "webhook_notifier.hpp"

#include <curl/curl.h>

#include "logger.hpp"
#include "report_export.hpp"
#include "run_coordinator.hpp"

WebhookNotifier::WebhookNotifier(std::string url, std::optional<std::string> secret)
    : url_(std::move(url)), secret_(std::move(secret)) {}

bool WebhookNotifier::notify(const RunResult& result) const {
    if (url_.empty())
        return false;
    std::string payload;
    try {
        payload = dump_json(run_result_to_json(result));
    } catch (const nlohmann::json::exception& e) {
        log_warning(std::string("Webhook payload could not be built: ") + e.what(),
                    {{"url", url_}});
        return false;
    }
    return post(payload);
}

bool WebhookNotifier::post(const std::string& payload) const {
    if (url_.empty())
        return false;
    CURL* curl = curl_easy_init();
    if (!curl) {
        log_warning("Webhook: curl initialization failed");
        return false;
    }
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (secret_) {
        std::string hdr = "X-Webhook-Secret: " + *secret_;
        headers = curl_slist_append(headers, hdr.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    CURLcode rc = curl_easy_perform(curl);
    long http_code = 0;
    if (rc == CURLE_OK)
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    if (rc != CURLE_OK) {
        log_warning(std::string("Webhook delivery failed: ") + curl_easy_strerror(rc),
                    {{"url", url_}});
        return false;
    }
    if (http_code >= 400) {
        log_warning("Webhook rejected with HTTP " + std::to_string(http_code), {{"url", url_}});
        return false;
    }
    log_debug("Webhook delivered", {{"url", url_}});
    return true;
}
