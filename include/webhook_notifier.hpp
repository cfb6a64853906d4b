#ifndef WEBHOOK_NOTIFIER_HPP
#define WEBHOOK_NOTIFIER_HPP

#include <optional>
#include <string>

struct RunResult;

/**
 * @brief Posts the run summary as JSON to an HTTP endpoint.
 *
 * Delivery failures are logged as warnings and reported through the return
 * value; they never abort the program.
 */
class WebhookNotifier {
  public:
    explicit WebhookNotifier(std::string url, std::optional<std::string> secret = std::nullopt);
    bool notify(const RunResult& result) const;
    bool post(const std::string& payload) const;
    const std::string& url() const { return url_; }

  private:
    std::string url_;
    std::optional<std::string> secret_;
};

#endif // WEBHOOK_NOTIFIER_HPP
