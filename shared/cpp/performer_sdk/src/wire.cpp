#include "../include/wire.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <cctype>
#include <stdexcept>

using json = nlohmann::json;

std::string base64_encode(const std::string& bytes) {
    if (bytes.empty()) return {};
    // EVP_EncodeBlock writes a trailing NUL
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(bytes.data()),
                            static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(n));
    return out;
}

std::string base64_decode(const std::string& text) {
    if (text.empty()) return {};
    if (text.size() % 4 != 0) throw std::invalid_argument("base64: length is not a multiple of 4");
    // EVP_DecodeBlock tolerates '=' and whitespace anywhere; only the canonical form is accepted here
    size_t pad = 0;
    while (pad < text.size() && text[text.size() - 1 - pad] == '=') ++pad;
    if (pad > 2) throw std::invalid_argument("base64: too much padding");
    for (size_t i = 0; i < text.size() - pad; ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isalnum(c) && c != '+' && c != '/') throw std::invalid_argument("base64: invalid character");
    }
    std::string out(text.size() / 4 * 3, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0) throw std::invalid_argument("base64: invalid input");
    // padding is decoded as zero bytes
    out.resize(static_cast<size_t>(n) - pad);
    return out;
}

static json parse_object(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("body is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) throw std::invalid_argument("body must be a JSON object");
    return j;
}

static std::string bytes_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) throw std::invalid_argument(std::string("missing field: ") + key);
    if (!it->is_string()) throw std::invalid_argument(std::string("field must be a base64 string: ") + key);
    return base64_decode(it->get<std::string>());
}

std::string encode_task_request(const Task& t) {
    json j = {
        {"task_id", base64_encode(t.id)},
        {"payload", base64_encode(t.payload)}
    };
    return j.dump();
}

Task decode_task_request(const std::string& body) {
    auto j = parse_object(body);
    Task t;
    t.id = bytes_field(j, "task_id");
    t.payload = bytes_field(j, "payload");
    return t;
}

std::string encode_task_response(const TaskResponse& r) {
    json j = {
        {"task_id", base64_encode(r.task_id)},
        {"result", base64_encode(r.result)}
    };
    return j.dump();
}

TaskResponse decode_task_response(const std::string& body) {
    auto j = parse_object(body);
    TaskResponse r;
    r.task_id = bytes_field(j, "task_id");
    r.result = bytes_field(j, "result");
    return r;
}

std::string encode_error(const PipelineError& e) {
    json err = {
        {"category", to_string(e.category())},
        {"code", to_string(e.code)},
        {"message", e.message}
    };
    if (e.fragment) err["fragment"] = *e.fragment;
    // Messages can quote payload bytes; never let an invalid sequence abort the reply
    return json({{"error", err}}).dump(-1, ' ', false, json::error_handler_t::replace);
}

PipelineError decode_error(const std::string& body) {
    auto j = parse_object(body);
    auto it = j.find("error");
    if (it == j.end() || !it->is_object()) throw std::invalid_argument("missing error object");
    auto code = error_code_from_string(it->value("code", std::string()));
    if (!code) throw std::invalid_argument("unknown error code");
    PipelineError e;
    e.code = *code;
    e.message = it->value("message", std::string());
    if (it->contains("fragment") && (*it)["fragment"].is_string()) {
        e.fragment = (*it)["fragment"].get<std::string>();
    }
    return e;
}
