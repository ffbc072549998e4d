#include <semnote/embedding/embedder.hpp>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <memory>
#include <mutex>

namespace semnote::embedding {

using json = nlohmann::json;

// ============================================================================
// Static Utility Functions
// ============================================================================

void Embedder::normalize(Embedding& embedding) {
    float norm = 0.0f;
    for (float v : embedding) {
        norm += v * v;
    }

    if (norm > 0.0f) {
        norm = std::sqrt(norm);
        for (float& v : embedding) {
            v /= norm;
        }
    }
}

// ============================================================================
// Ollama Embedder Implementation
// ============================================================================

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    size_t total_size = size * nmemb;
    buffer->append(ptr, total_size);
    return total_size;
}

void init_curl_once() {
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

ErrorCode map_curl_error(CURLcode res) {
    switch (res) {
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCode::TIMEOUT;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
            return ErrorCode::PROVIDER_UNAVAILABLE;
        default:
            return ErrorCode::NETWORK_ERROR;
    }
}

}  // namespace

OllamaEmbedder::OllamaEmbedder(EmbedderSettings settings)
    : settings_(std::move(settings)) {
    init_curl_once();
}

Result<void> OllamaEmbedder::initialize() {
    // Test connection and get dimension
    auto test_result = embed("test");
    if (!test_result.ok()) {
        return test_result.error();
    }

    dimension_ = static_cast<int>(test_result->size());
    initialized_ = true;
    return {};
}

Result<Embedding> OllamaEmbedder::embed(const std::string& text) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return Error(ErrorCode::INTERNAL_ERROR, "Failed to initialize CURL");
    }

    json body;
    body["model"] = settings_.model;
    body["prompt"] = text;
    std::string request_body = body.dump();

    std::string url = settings_.base_url + "/api/embeddings";

    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    std::string response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request_body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(settings_.timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return Error(map_curl_error(res),
            std::string("Request to ") + url + " failed: " + curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code == 404) {
        return Error(ErrorCode::PROVIDER_UNAVAILABLE,
            "Model '" + settings_.model + "' not found on " + settings_.base_url);
    }
    if (http_code >= 400) {
        return Error(ErrorCode::NETWORK_ERROR,
            "HTTP error " + std::to_string(http_code));
    }

    return parse_response(response);
}

Result<Embedding> OllamaEmbedder::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object() || !j.contains("embedding")) {
            return Error(ErrorCode::MALFORMED_RESPONSE, "Response missing 'embedding' field");
        }
        if (!j["embedding"].is_array() || j["embedding"].empty()) {
            return Error(ErrorCode::MALFORMED_RESPONSE, "'embedding' is not a non-empty array");
        }

        return j["embedding"].get<Embedding>();
    } catch (const json::exception& e) {
        return Error(ErrorCode::MALFORMED_RESPONSE,
            std::string("Failed to parse response: ") + e.what());
    }
}

Result<EmbedderPtr> OllamaEmbedder::create(EmbedderSettings settings) {
    bool probe = settings.probe_on_create;
    auto embedder = std::make_shared<OllamaEmbedder>(std::move(settings));
    if (probe) {
        auto init_result = embedder->initialize();
        if (!init_result.ok()) {
            return init_result.error();
        }
    } else {
        embedder->initialized_ = true;
    }
    return EmbedderPtr(std::move(embedder));
}

// ============================================================================
// Embedder Factory
// ============================================================================

Result<EmbedderPtr> EmbedderFactory::create(const EmbedderSettings& settings) {
    if (settings.type == "ollama") {
        return OllamaEmbedder::create(settings);
    }

    return Error(ErrorCode::INVALID_ARGUMENT,
        "Unknown embedder type: " + settings.type);
}

}  // namespace semnote::embedding
