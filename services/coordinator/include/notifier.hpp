#pragma once
#include <nlohmann/json.hpp>
#include <string>

// Lifecycle event sink. notify() must not block on delivery; failures are the
// implementation's to log and drop.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string& event_type, const nlohmann::json& payload) = 0;
};

class NullNotifier : public Notifier {
public:
    void notify(const std::string&, const nlohmann::json&) override {}
};
