#include <httplib.h>
#include "ComboErrors.hpp"
#include "ComboService.hpp"
#include "ServiceConfig.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void set_error(httplib::Response& res, int status, const std::string& message, const std::string& kind) {
    json err;
    err["error"] = message;
    err["kind"] = kind;
    res.status = status;
    res.set_content(err.dump(), "application/json");
}

// Body: {"<items_key>": [...], "beam_width": 64, "max_candidates": 20, "keep_order": true, "trace": false}
std::vector<std::string> parse_suggest_body(const std::string& body, const char* items_key, SuggestOptions& options) {
    json j = json::parse(body);
    if (!j.is_object() || !j.contains(items_key) || !j[items_key].is_array()) {
        throw InvalidParameterError(std::string("request body needs a '") + items_key + "' array");
    }

    options.beam_width = j.value("beam_width", 0);
    options.max_results = j.value("max_candidates", 0);
    options.keep_order = j.value("keep_order", true);
    options.trace = j.value("trace", false);
    return j[items_key].get<std::vector<std::string>>();
}

// Runs a handler and maps failures onto HTTP status codes
template <typename Handler>
void guarded(httplib::Response& res, Handler handler) {
    try {
        handler();
    } catch (const json::exception& e) {
        set_error(res, 400, e.what(), "malformed_request");
    } catch (const ComboError& e) {
        set_error(res, 400, e.what(), e.kind());
    } catch (const std::exception& e) {
        std::cerr << "[Server] Error: " << e.what() << "\n";
        set_error(res, 500, e.what(), "internal");
    }
}

} // namespace

int main(int argc, char* argv[]) {
    ServiceConfig config;
    if (argc >= 2 && !config.load_from_json(argv[1])) {
        std::cerr << "[Server] CRITICAL: Could not load config " << argv[1] << "\n";
        return 1;
    }
    config.apply_environment();

    std::cout << "[Server] Initializing combo service...\n";
    std::unique_ptr<ComboService> service;
    try {
        service = std::make_unique<ComboService>(config);
    } catch (const std::exception& e) {
        std::cerr << "[Server] CRITICAL: " << e.what() << "\n";
        return 1;
    }

    httplib::Server svr;

    // CORS middleware - Add CORS headers to all responses
    svr.set_post_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    // Handle CORS preflight requests
    svr.Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    svr.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
        json j;
        j["ok"] = true;
        j["lexicon_words"] = service->index().size();
        res.set_content(j.dump(), "application/json");
    });

    // Define Route: POST /initial-combos/suggest  {"initials": ["결","근","신","상"], ...}
    svr.Post("/initial-combos/suggest", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&]() {
            SuggestOptions options;
            std::vector<std::string> initials = parse_suggest_body(req.body, "initials", options);
            res.set_content(service->suggest(initials, options), "application/json");
            std::cout << "[Server] suggest " << initials.size() << " initials ("
                      << (options.keep_order ? "sequence" : "bag") << ")\n";
        });
    });

    // Define Route: POST /initial-combos/from-words  {"words": ["결합","근육","상피","신경"], ...}
    svr.Post("/initial-combos/from-words", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&]() {
            SuggestOptions options;
            std::vector<std::string> words = parse_suggest_body(req.body, "words", options);
            res.set_content(service->suggest_from_words(words, options), "application/json");
        });
    });

    // Define Route: /lexicon/check-word?word=...
    svr.Get("/lexicon/check-word", [&](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_param("word")) {
            set_error(res, 400, "Missing 'word' parameter", "invalid_parameter");
            return;
        }
        guarded(res, [&]() {
            res.set_content(service->check_word(req.get_param_value("word")), "application/json");
        });
    });

    // Define Route: /lexicon/words-starting-with?letter=...&limit=50&with_metadata=false
    svr.Get("/lexicon/words-starting-with", [&](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_param("letter")) {
            set_error(res, 400, "Missing 'letter' parameter", "invalid_parameter");
            return;
        }
        int limit = 50;
        if (req.has_param("limit")) {
            try {
                limit = std::stoi(req.get_param_value("limit"));
            } catch (const std::exception&) {
                set_error(res, 400, "'limit' must be an integer", "invalid_parameter");
                return;
            }
            if (limit > 500) limit = 500;
        }
        bool with_metadata = req.has_param("with_metadata") && req.get_param_value("with_metadata") == "true";

        guarded(res, [&]() {
            res.set_content(service->words_starting_with(req.get_param_value("letter"), limit, with_metadata),
                            "application/json");
        });
    });

    // Stats endpoint for monitoring
    svr.Get("/stats", [&](const httplib::Request&, httplib::Response& res) {
        res.set_content(service->stats(), "application/json");
    });

    std::cout << "======================================" << std::endl;
    std::cout << "   Initial-Combination API" << std::endl;
    std::cout << "======================================" << std::endl;
    std::cout << "API Endpoints:" << std::endl;
    std::cout << "  - GET  /health" << std::endl;
    std::cout << "  - POST /initial-combos/suggest" << std::endl;
    std::cout << "  - POST /initial-combos/from-words" << std::endl;
    std::cout << "  - GET  /lexicon/check-word?word=<word>" << std::endl;
    std::cout << "  - GET  /lexicon/words-starting-with?letter=<unit>&limit=<num>" << std::endl;
    std::cout << "  - GET  /stats" << std::endl;
    std::cout << "======================================" << std::endl;
    std::cout << "Listening on " << config.host << ":" << config.port << std::endl;
    std::cout << "======================================" << std::endl;

    if (!svr.listen(config.host.c_str(), config.port)) {
        std::cerr << "Failed to start server!" << std::endl;
        return 1;
    }

    return 0;
}
