#include "../include/queue_client.hpp"
#include <curl/curl.h>
#include <stdexcept>

using json = nlohmann::json;

namespace {
static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct HeaderList {
    curl_slist* list{nullptr};
    ~HeaderList() { curl_slist_free_all(list); }
};
}

QueueClient::QueueClient(std::string base_url, long timeout_ms)
    : base_(std::move(base_url)), timeout_ms_(timeout_ms) {
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
}

json QueueClient::enqueue_body(const std::string& queue, const std::string& task, const json& args) {
    return json{
        {"queue", queue},
        {"class", task},
        {"args", args.is_null() ? json::array() : args}
    };
}

void QueueClient::enqueue(const std::string& queue, const std::string& task, const json& args) {
    CurlHandle c;
    HeaderList headers;
    headers.list = curl_slist_append(headers.list, "Content-Type: application/json");
    std::string url = base_ + "/enqueue";
    std::string body_str = enqueue_body(queue, task, args).dump();
    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, body_str.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)body_str.size());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw std::runtime_error("enqueue to " + url + " failed: " + curl_easy_strerror(code));
    }
    long status = 0;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        throw std::runtime_error("enqueue to " + url + " failed: status " + std::to_string(status));
    }
}
