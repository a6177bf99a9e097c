#include <iostream>
#include <cstdlib>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include "../../../shared/cpp/performer_sdk/include/performer_client.hpp"

using json = nlohmann::json;

static std::string getenv_or(const char* k, const std::string& def) {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}

static void usage() {
    std::cerr << "submit_task usage:\n"
              << "  submit_task --id <task-id> --payload \"...\" [--url <performer-url>] [--timeout-ms N]\n"
              << "  submit_task --health [--url <performer-url>]\n";
}

int main(int argc, char** argv) {
    std::string url = getenv_or("PERFORMER_URL", "http://localhost:8080");
    std::string id;
    std::string payload;
    bool have_payload = false;
    bool health = false;
    long timeout_ms = 30000;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--id" && i + 1 < argc) id = argv[++i];
            else if (a == "--payload" && i + 1 < argc) { payload = argv[++i]; have_payload = true; }
            else if (a == "--url" && i + 1 < argc) url = argv[++i];
            else if (a == "--timeout-ms" && i + 1 < argc) timeout_ms = std::stol(argv[++i]);
            else if (a == "--health") health = true;
            else { usage(); return 1; }
        }
    } catch (const std::exception& e) {
        std::cerr << "[submit-task] Bad argument: " << e.what() << "\n";
        return 1;
    }
    if (!health && !have_payload) { usage(); return 2; }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int rc = 0;
    try {
        PerformerClient client(url, timeout_ms);
        if (health) {
            bool ok = client.healthy();
            std::cout << (ok ? "[OK] " : "[DOWN] ") << url << "\n";
            rc = ok ? 0 : 1;
        } else {
            auto res = client.submit(Task{id, payload});
            if (auto* r = std::get_if<TaskResponse>(&res)) {
                std::cout << "[OK] task " << r->task_id << "\n" << json::parse(r->result).dump(2) << "\n";
            } else {
                const auto& err = std::get<SubmitError>(res);
                std::cerr << "[ERROR] status " << err.status;
                if (err.pipeline) {
                    std::cerr << " " << to_string(err.pipeline->category()) << "/" << to_string(err.pipeline->code);
                    if (err.pipeline->fragment) std::cerr << " (" << *err.pipeline->fragment << ")";
                }
                std::cerr << ": " << err.message << "\n";
                rc = 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        rc = 1;
    }
    curl_global_cleanup();
    return rc;
}
