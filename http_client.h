#pragma once

#include <string>
#include <map>
#include <functional>
#include <curl/curl.h>

/// @brief HTTP response structure
struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string error_message;   ///< Transport error (empty when the exchange completed)
    bool timed_out = false;      ///< Transfer exceeded the configured timeout
    bool aborted = false;        ///< Stream stopped by the callback or the abort check

    bool is_success() const {
        return error_message.empty() && status_code >= 200 && status_code < 300;
    }
};

/// @brief Callback for streaming responses
/// @param chunk The chunk of data received
/// @param user_data User-provided data pointer
/// @return true to continue streaming, false to abort
using StreamCallback = std::function<bool(const std::string& chunk, void* user_data)>;

/// @brief Polled while a transfer is in flight; returning true aborts it
using AbortCheck = std::function<bool()>;

/// @brief HTTP client for the upstream service
/// One instance owns one curl handle and serves one request at a time.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    // Disable copy
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// @brief Perform HTTP POST request
    /// @param url Full URL to request
    /// @param body Request body (typically JSON)
    /// @param headers Optional custom headers
    /// @return Response object
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers = {});

    /// @brief Perform HTTP POST request with streaming response
    ///
    /// Chunks of a 2xx response are handed to @p callback as they arrive.
    /// A non-2xx response is not streamed; its body is collected into the
    /// returned response so the caller can report it.
    ///
    /// @param url Full URL to request
    /// @param body Request body (typically JSON)
    /// @param headers Optional custom headers
    /// @param callback Callback function for each chunk
    /// @param user_data User data passed to callback
    /// @return Response object (body holds only a non-2xx error body)
    HttpResponse post_stream(const std::string& url,
                             const std::string& body,
                             const std::map<std::string, std::string>& headers,
                             StreamCallback callback,
                             void* user_data = nullptr);

    /// @brief Set request timeout in seconds
    /// @param timeout_seconds Timeout in seconds (0 = no timeout)
    void set_timeout(long timeout_seconds);

    /// @brief Set connect timeout in seconds
    void set_connect_timeout(long timeout_seconds);

    /// @brief Set whether to verify SSL certificates
    /// @param verify true to verify (default), false to skip verification
    void set_ssl_verify(bool verify);

    /// @brief Set custom CA bundle path for SSL verification
    /// @param ca_bundle_path Path to CA bundle file
    void set_ca_bundle(const std::string& ca_bundle_path);

    /// @brief Set a predicate polled during transfers (client disconnect detection)
    void set_abort_check(AbortCheck check);

    /// @brief Enable/disable verbose debug output
    /// @param verbose true to enable curl verbose output
    void set_verbose(bool verbose);

private:
    CURL* curl_ = nullptr;
    long timeout_seconds_ = 0;  // No timeout by default
    long connect_timeout_seconds_ = 30;
    bool ssl_verify_ = true;
    bool verbose_ = false;
    std::string ca_bundle_path_;
    AbortCheck abort_check_;

    /// @brief Configure curl handle with common options
    void configure_curl();

    /// @brief Set headers on curl handle
    /// @return curl_slist that must be freed by caller
    struct curl_slist* set_headers(const std::map<std::string, std::string>& headers);

    /// @brief Translate the curl result into the response's error fields
    void finish_response(CURLcode res, HttpResponse& response, const char* what);

    /// @brief Static callback for curl write function
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);

    /// @brief Static callback for curl progress function (used for cancellation)
    static int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);

    /// @brief Static callback for streaming write function
    static size_t stream_callback(char* ptr, size_t size, size_t nmemb, void* userdata);

    /// @brief Structure for streaming callback data
    struct StreamCallbackData {
        StreamCallback callback;
        void* user_data = nullptr;
        CURL* curl = nullptr;
        HttpResponse* response = nullptr;
        bool status_checked = false;
        bool deliver = true;             // false for non-2xx bodies
        bool continue_streaming = true;
    };
};

/// @brief RAII guard for curl_global_init / curl_global_cleanup
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};
