// modules/tools/network_builtins.cpp
#include "common/utils/logger.h"
#include "tools/builtin_registry.h"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <optional>

namespace agentflow {

namespace {

struct HttpReply {
    long status = 0;
    std::string body;
};

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string string_arg(const Value& args, const std::string& key, const std::string& fallback = "") {
    if (!args.contains(key) || args[key].is_null()) return fallback;
    return value::to_display(args[key]);
}

// One blocking request; transport failures throw CALL_FAILURE, HTTP errors come back as status
HttpReply perform(const std::string& url, const std::string& method, const Value& headers,
                  const std::optional<std::string>& body, long timeout_ms, const NodeId& node) {
    static std::once_flag init;
    std::call_once(init, [] { curl_global_init(CURL_GLOBAL_ALL); });

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) throw FlowError(ErrorCode::CALL_FAILURE, "fetch(): curl_easy_init failed", node);

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(nullptr, &curl_slist_free_all);
    auto add_header = [&](const std::string& line) {
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (appended) {
            header_list.release();
            header_list.reset(appended);
        }
    };
    if (headers.is_object()) {
        for (auto it = headers.begin(); it != headers.end(); ++it) add_header(it.key() + ": " + value::to_display(it.value()));
    }

    HttpReply reply;
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, "agentflow/0.1");
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &reply.body);
    if (method != "GET") curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
    if (body) {
        if (!headers.is_object() || !headers.contains("Content-Type")) add_header("Content-Type: application/json");
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }
    if (header_list) curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());

    CURLcode res = curl_easy_perform(h);
    if (res != CURLE_OK) {
        throw FlowError(ErrorCode::CALL_FAILURE, "fetch(): " + url + ": " + curl_easy_strerror(res), node,
                        Value{{"url", url}, {"curl_code", static_cast<int>(res)}});
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &reply.status);
    return reply;
}

// file:// and other non-HTTP schemes report no status code
bool reply_ok(const std::string& url, long status) {
    if (url.rfind("http", 0) != 0) return true;
    return status >= 200 && status < 300;
}

struct FetchCall {
    std::string url;
    std::string method;
    HttpReply reply;
    Value content;
};

FetchCall run_fetch(const Value& args, ToolCallContext& tc) {
    FetchCall call;
    call.url = string_arg(args, "url");
    call.method = upper(string_arg(args, "method", "GET"));
    std::optional<std::string> body;
    if (args.contains("body") && !args["body"].is_null()) {
        body = args["body"].is_string() ? args["body"].get<std::string>() : args["body"].dump();
    }
    long timeout_ms = args.contains("timeout_ms") ? static_cast<long>(value::to_number(args["timeout_ms"])) : 30000;

    tc.services.cancel.throw_if_cancelled(tc.node);
    log_info("fetch: " + call.method + " " + call.url);
    call.reply = perform(call.url, call.method, args.value("headers", Value(nullptr)), body, timeout_ms, tc.node);

    // JSON bodies are parsed, anything else stays text
    call.content = Value::parse(call.reply.body, nullptr, false);
    if (call.content.is_discarded()) call.content = call.reply.body;
    return call;
}

} // namespace

void register_network_builtins(BuiltinRegistry& registry) {
    // fetch(url, method="GET", headers={...}, body=...): status, ok, data
    registry.register_tool("fetch", [](const Value& args, ToolCallContext& tc) -> Value {
        FetchCall call = run_fetch(args, tc);
        return Value{{"status", call.reply.status},
                     {"ok", reply_ok(call.url, call.reply.status)},
                     {"data", std::move(call.content)}};
    }, {"url"}, "Fetch a URL over HTTP(S)");

    registry.register_tool("fetch_url", [](const Value& args, ToolCallContext& tc) -> Value {
        FetchCall call = run_fetch(args, tc);
        return Value{{"status", call.reply.status},
                     {"method", call.method},
                     {"url", call.url},
                     {"content", std::move(call.content)},
                     {"ok", reply_ok(call.url, call.reply.status)}};
    }, {"url"}, "Fetch a URL and echo the request");
}

} // namespace agentflow
