#pragma once

#include <string>
#include <stdexcept>
#include <curl/curl.h>
#include <mutex>

#include "debug.hpp"

#define HTTP_ERROR(message) LOG_COMPONENT("HTTP", LOG_LEVEL_ERROR, message)
#define HTTP_ERROR_FMT(fmt, ...) HTTP_ERROR(debug::format_log(fmt, __VA_ARGS__))
#define HTTP_INFO(message) LOG_COMPONENT("HTTP", LOG_LEVEL_INFO, message)
#define HTTP_INFO_FMT(fmt, ...) HTTP_INFO(debug::format_log(fmt, __VA_ARGS__))
#define HTTP_DEBUG(message) LOG_COMPONENT("HTTP", LOG_LEVEL_DEBUG, message)
#define HTTP_DEBUG_FMT(fmt, ...) HTTP_DEBUG(debug::format_log(fmt, __VA_ARGS__))

namespace http {

// CURL RAII wrapper
class curl_handle {
public:
    curl_handle() : handle(curl_easy_init()) {
        if (!handle) {
            throw std::runtime_error("Failed to initialize CURL");
        }
    }

    ~curl_handle() {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }

    // No copying
    curl_handle(const curl_handle&) = delete;
    curl_handle& operator=(const curl_handle&) = delete;

    // Access the underlying handle
    CURL* get() { return handle; }

private:
    CURL* handle;
};

// Header list RAII wrapper
class curl_headers {
public:
    curl_headers() = default;
    ~curl_headers() {
        if (list_) {
            curl_slist_free_all(list_);
        }
    }

    curl_headers(const curl_headers&) = delete;
    curl_headers& operator=(const curl_headers&) = delete;

    void append(const std::string& header) {
        auto* appended = curl_slist_append(list_, header.c_str());
        if (!appended) {
            throw std::runtime_error("Failed to append HTTP header");
        }
        list_ = appended;
    }

    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ {nullptr};
};

// Default callback function for CURL to write data
inline size_t write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    size_t real_size = size * nmemb;
    std::string* response = static_cast<std::string*>(userp);
    response->append(contents, real_size);
    return real_size;
}

// HTTP client with configurable timeout. The content-generation client only
// needs JSON POSTs, so that is all this wrapper offers.
class fetch {
public:
    fetch() : fetch(60) {}

    explicit fetch(long timeout) : timeout_(timeout), connect_timeout_(timeout > 10 ? 10 : timeout) {
        static std::once_flag curl_initialized;
        std::call_once(curl_initialized, [] {
            if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
                throw std::runtime_error("Failed to initialize CURL globally");
            }
            HTTP_INFO("CURL globally initialized");
        });
        HTTP_DEBUG_FMT("Created fetch client with timeout: {}s", timeout);
    }

    // POST with lambda for header setup
    template<typename F>
    std::string post(
        const std::string& url,
        const std::string& data,
        F header_setter
    ) {
        try {
            curl_handle handle;
            std::string response;

            curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());

            curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
            curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, data.c_str());
            curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(data.length()));

            curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
            curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response);

            curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT, timeout_);
            curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT, connect_timeout_);

            curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(handle.get(), CURLOPT_MAXREDIRS, 10L);

            curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, "Itinera-HTTP/1.0");

            // Setup headers using the provided setter
            curl_headers headers;
            header_setter([&headers](const std::string& header) { headers.append(header); });
            if (headers.get()) {
                curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
            }

            HTTP_INFO_FMT("Posting to URL: {}", url);
            CURLcode res = curl_easy_perform(handle.get());

            if (res != CURLE_OK) {
                HTTP_ERROR_FMT("CURL POST request failed: {}", curl_easy_strerror(res));
                throw std::runtime_error(std::string("CURL POST request failed: ") + curl_easy_strerror(res));
            }

            long http_code = 0;
            curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &http_code);

            if (http_code >= 400) {
                HTTP_ERROR_FMT("HTTP error: {} ({})", http_code, url);
                throw std::runtime_error("HTTP error " + std::to_string(http_code) + ": " + response);
            }

            HTTP_DEBUG_FMT("Posted {} bytes, received {} bytes from {}", data.size(), response.size(), url);
            return response;
        } catch (const std::exception& e) {
            HTTP_ERROR_FMT("Exception during POST: {}", e.what());
            throw;
        }
    }

private:
    long timeout_;         // Request timeout in seconds
    long connect_timeout_; // Connection timeout in seconds
};

} // namespace http
