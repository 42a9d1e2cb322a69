#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <thread>
#include <chrono>
#include <cstdlib>
#include <curl/curl.h>
#include "coordinator_client.hpp"

static std::string getenv_or(const char* k, const std::string& def) {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}

static std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

// Stand-in for real work: echoes the task back as its result.
static std::string process_task(const TaskAssignment& a) {
    std::cout << "[sample-worker] Processing task " << a.task_id << ": " << a.title << std::endl;
    return "processed: " + a.title;
}

int main(int argc, char** argv) {
    const std::string url = getenv_or("COORDINATOR_URL", "http://localhost:4001");
    AgentRegistration reg;
    reg.id = getenv_or("AGENT_ID", "sample-worker-1");
    reg.role = getenv_or("AGENT_ROLE", "backend_developer");
    reg.capabilities = split_csv(getenv_or("AGENT_CAPABILITIES", "python,testing"));
    int poll_ms = 1000;
    bool once = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--once") once = true;
        else if (a == "--poll-ms" && i + 1 < argc) poll_ms = std::stoi(argv[++i]);
        else if (a == "--id" && i + 1 < argc) reg.id = argv[++i];
        else if (a == "--capabilities" && i + 1 < argc) reg.capabilities = split_csv(argv[++i]);
    }
    reg.name = reg.id;

    curl_global_init(CURL_GLOBAL_DEFAULT);
    CoordinatorClient client(url);
    if (!client.register_agent(reg)) {
        std::cerr << "[sample-worker] Registration failed" << std::endl;
        curl_global_cleanup();
        return 1;
    }
    std::cout << "[sample-worker] Registered " << reg.id << ". COORDINATOR_URL=" << url
              << " poll_ms=" << poll_ms << (once ? " once" : " loop") << std::endl;
    do {
        auto t = client.current_assignment(reg.id);
        if (!t) {
            std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));
            continue;
        }
        if (t->cancel_requested) {
            client.fail(t->task_id, "cancelled");
            continue;
        }
        if (t->status == "assigned") client.start(t->task_id);
        try {
            std::string result = process_task(*t);
            client.complete(t->task_id, result);
        } catch (const std::exception& e) {
            std::cerr << "[sample-worker] Error: " << e.what() << std::endl;
            client.fail(t->task_id, e.what());
        }
    } while (!once);
    curl_global_cleanup();
    return 0;
}
