#include "nimbridge.h"
#include "http_client.h"

CurlGlobal::CurlGlobal() {
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK) {
        LOG_ERROR("curl_global_init failed: " + std::string(curl_easy_strerror(res)));
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

HttpClient::HttpClient() {
    curl_ = curl_easy_init();
    if (!curl_) {
        LOG_ERROR("Failed to initialize CURL for HttpClient");
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

void HttpClient::set_timeout(long timeout_seconds) {
    timeout_seconds_ = timeout_seconds;
}

void HttpClient::set_connect_timeout(long timeout_seconds) {
    connect_timeout_seconds_ = timeout_seconds;
}

void HttpClient::set_ssl_verify(bool verify) {
    ssl_verify_ = verify;
}

void HttpClient::set_ca_bundle(const std::string& ca_bundle_path) {
    ca_bundle_path_ = ca_bundle_path;
}

void HttpClient::set_abort_check(AbortCheck check) {
    abort_check_ = std::move(check);
}

void HttpClient::set_verbose(bool verbose) {
    verbose_ = verbose;
}

void HttpClient::configure_curl() {
    if (!curl_) return;

    // Reset to clean state
    curl_easy_reset(curl_);

    if (timeout_seconds_ > 0) {
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
    }
    if (connect_timeout_seconds_ > 0) {
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds_);
    }

    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, ssl_verify_ ? 1L : 0L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, ssl_verify_ ? 2L : 0L);

    if (!ca_bundle_path_.empty()) {
        curl_easy_setopt(curl_, CURLOPT_CAINFO, ca_bundle_path_.c_str());
    }

    if (verbose_) {
        curl_easy_setopt(curl_, CURLOPT_VERBOSE, 1L);
    }

    if (abort_check_) {
        curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, this);
    }

    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 5L);
}

struct curl_slist* HttpClient::set_headers(const std::map<std::string, std::string>& headers) {
    struct curl_slist* header_list = nullptr;

    for (const auto& [key, value] : headers) {
        std::string header = key + ": " + value;
        header_list = curl_slist_append(header_list, header.c_str());
    }

    return header_list;
}

size_t HttpClient::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total_size = size * nmemb;
    auto* response = static_cast<HttpResponse*>(userdata);
    response->body.append(ptr, total_size);
    return total_size;
}

int HttpClient::progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* client = static_cast<HttpClient*>(clientp);
    if (client->abort_check_ && client->abort_check_()) {
        return 1;  // CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

size_t HttpClient::stream_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total_size = size * nmemb;
    auto* data = static_cast<StreamCallbackData*>(userdata);

    if (!data->continue_streaming) {
        return 0; // Abort transfer
    }

    // Decide on the first body byte whether this is a stream or an error body
    if (!data->status_checked) {
        data->status_checked = true;
        long status = 0;
        curl_easy_getinfo(data->curl, CURLINFO_RESPONSE_CODE, &status);
        data->deliver = status >= 200 && status < 300;
        if (!data->deliver) {
            LOG_DEBUG("Upstream answered " + std::to_string(status) + ", collecting error body");
        }
    }

    if (!data->deliver) {
        data->response->body.append(ptr, total_size);
        return total_size;
    }

    std::string chunk(ptr, total_size);

    if (data->callback) {
        data->continue_streaming = data->callback(chunk, data->user_data);
    }

    return data->continue_streaming ? total_size : 0;
}

void HttpClient::finish_response(CURLcode res, HttpResponse& response, const char* what) {
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status_code);

    if (res == CURLE_OK) {
        LOG_DEBUG(std::string(what) + " completed with status: " + std::to_string(response.status_code));
        return;
    }

    response.error_message = curl_easy_strerror(res);
    if (res == CURLE_OPERATION_TIMEDOUT) {
        response.timed_out = true;
        LOG_WARN(std::string(what) + " timed out after " + std::to_string(timeout_seconds_) + "s");
    } else if (res == CURLE_WRITE_ERROR || res == CURLE_ABORTED_BY_CALLBACK) {
        // Callback returned false or the abort check fired - intentional
        response.aborted = true;
        LOG_DEBUG(std::string(what) + " stopped by callback");
    } else {
        LOG_ERROR(std::string(what) + " failed: " + response.error_message);
    }
}

HttpResponse HttpClient::post(const std::string& url,
                              const std::string& body,
                              const std::map<std::string, std::string>& headers) {
    HttpResponse response;

    if (!curl_) {
        response.error_message = "CURL not initialized";
        return response;
    }

    LOG_DEBUG("HTTP POST: " + url + " (" + std::to_string(body.length()) + " bytes)");
    dprintf(5, "POST body: %s", body.c_str());

    configure_curl();

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.length()));

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);

    struct curl_slist* header_list = set_headers(headers);
    if (header_list) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl_);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    finish_response(res, response, "HTTP POST");
    return response;
}

HttpResponse HttpClient::post_stream(const std::string& url,
                                     const std::string& body,
                                     const std::map<std::string, std::string>& headers,
                                     StreamCallback callback,
                                     void* user_data) {
    HttpResponse response;

    if (!curl_) {
        response.error_message = "CURL not initialized";
        return response;
    }

    LOG_DEBUG("HTTP POST (streaming): " + url + " (" + std::to_string(body.length()) + " bytes)");
    dprintf(5, "POST body: %s", body.c_str());

    configure_curl();

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.length()));

    StreamCallbackData callback_data;
    callback_data.callback = std::move(callback);
    callback_data.user_data = user_data;
    callback_data.curl = curl_;
    callback_data.response = &response;

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, stream_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &callback_data);

    struct curl_slist* header_list = set_headers(headers);
    if (header_list) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl_);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    finish_response(res, response, "HTTP POST (streaming)");
    return response;
}
