#ifndef JOIN_RELAY_CURL_EASY_HPP
#define JOIN_RELAY_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <chrono>
#include <string>
#include <vector>

#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    // Per-call cancellation token. The transfer is aborted from the progress
    // callback once the deadline passes.
    struct CancellationToken {
        std::chrono::steady_clock::time_point deadline_;
        bool cancelled_ = false;

        [[nodiscard]] bool expired() const { return std::chrono::steady_clock::now() >= deadline_; }
    };

    class CurlEasy : public IHttpClient {
       public:
        CurlEasy();

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response send(const http::model::Request& req) override;
        void set_url(const std::string& u);
        void set_headers(const std::vector<std::string>& hs);

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        http::model::Response make_response(std::string& incoming_body);
        void set_defaults_once();
        void prepare_for_new_request(const http::model::Request& req, std::string& body, CancellationToken& token);
        [[noreturn]] void throw_transport_error(const http::model::Request& req, CURLcode rc, bool timed_out) const;
        static int progress_cb(void* clientp, curl_off_t dl_total, curl_off_t dl_now, curl_off_t ul_total, curl_off_t ul_now);
        static bool is_body_read_error(CURLcode rc) {
            return rc == CURLE_RECV_ERROR || rc == CURLE_PARTIAL_FILE || rc == CURLE_BAD_CONTENT_ENCODING || rc == CURLE_WRITE_ERROR;
        }

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace http::client

#endif
