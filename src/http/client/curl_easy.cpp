#include "curl_easy.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = constants::MAX_REDIRECTS;
        static constexpr const char* USER_AGENT = constants::USER_AGENT;
        static constexpr const char* ACCEPT_ENCODING = "";
        static constexpr long NO_PROGRESS = 0L;  // progress callback carries the cancellation token
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long HTTP_GET = 1L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
    };

    CurlEasy::CurlEasy() : handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
    }

    // Closes any connection still held by the handle, including one left behind by an aborted transfer.
    CurlEasy::~CurlEasy() {
        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }

        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }
    }

    void CurlEasy::set_url(const std::string& u) { setopt(CURLOPT_URL, u.c_str()); }

    void CurlEasy::set_headers(const std::vector<std::string>& hs) {
        // Detach first so the handle never points at a freed list.
        setopt(CURLOPT_HTTPHEADER, static_cast<curl_slist*>(nullptr));
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& h : hs) {
            curl_slist* appended = curl_slist_append(headers_, h.c_str());
            if (appended == nullptr) {
                throw std::runtime_error("curl_slist_append failed");
            }
            headers_ = appended;
        }
        if (headers_ != nullptr) {
            setopt(CURLOPT_HTTPHEADER, headers_);
        }
    }

    void CurlEasy::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        // Empty string => accept all supported encodings (gzip/deflate/br)
        setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_XFERINFOFUNCTION, &CurlEasy::progress_cb);
    }

    namespace {
        // Keeps the deadline arithmetic on steady_clock inside its range.
        std::chrono::milliseconds bounded_timeout(const http::model::Request& req) {
            return std::clamp(req.timeout_, std::chrono::milliseconds{0}, std::chrono::milliseconds{constants::MAX_TIMEOUT_MS});
        }
    }  // namespace

    void CurlEasy::prepare_for_new_request(const http::model::Request& req, std::string& body, CancellationToken& token) {
        body.clear();
        error_buf_[0] = '\0';

        // Always set these per request (don't rely on old values)
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(&body));
        setopt(CURLOPT_XFERINFODATA, static_cast<void*>(&token));
        const long timeout_ms = static_cast<long>(bounded_timeout(req).count());
        setopt(CURLOPT_TIMEOUT_MS, timeout_ms);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);

        if (req.method_ == "POST") {
            setopt(CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body_.size()));
            setopt(CURLOPT_COPYPOSTFIELDS, req.body_.c_str());
        } else {
            setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        }
    }

    int CurlEasy::progress_cb(void* clientp, curl_off_t /*dl_total*/, curl_off_t /*dl_now*/, curl_off_t /*ul_total*/, curl_off_t /*ul_now*/) {
        auto* token = static_cast<CancellationToken*>(clientp);
        if (token == nullptr || !token->expired()) {
            return 0;
        }
        token->cancelled_ = true;
        return 1;  // makes curl_easy_perform return CURLE_ABORTED_BY_CALLBACK
    }

    http::model::Response CurlEasy::send(const http::model::Request& req) {
        set_url(req.url_);
        set_headers(req.headers_);

        std::string body;
        CancellationToken token{.deadline_ = std::chrono::steady_clock::now() + bounded_timeout(req)};
        prepare_for_new_request(req, body, token);

        const auto rc = curl_easy_perform(handle_);

        // The token lives on this frame; never let the handle keep a pointer to it.
        setopt(CURLOPT_XFERINFODATA, static_cast<void*>(nullptr));
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(nullptr));

        if (rc == CURLE_OK) {
            return make_response(body);
        }

        const bool timed_out = rc == CURLE_OPERATION_TIMEDOUT || token.cancelled_;
        long code = 0;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);

        if (!timed_out && code > 0 && is_body_read_error(rc)) {
            std::string empty;
            http::model::Response r = make_response(empty);
            r.body_read_failed_ = true;
            return r;
        }

        throw_transport_error(req, rc, timed_out);
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }
    // explicit instantiations for used types (optional but can help some compilers)
    template void CurlEasy::setopt<long>(int, long);
    template void CurlEasy::setopt<const char*>(int, const char*);
    template void CurlEasy::setopt<void*>(int, void*);
    template void CurlEasy::setopt<char*>(int, char*);
    template void CurlEasy::setopt<curl_slist*>(int, curl_slist*);

    void CurlEasy::throw_transport_error(const http::model::Request& req, CURLcode rc, bool timed_out) const {
        std::string err = timed_out ? "request timed out: " : "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw http::http_error::TransportError(req.url_, static_cast<int>(rc), timed_out, err);
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        http::model::Response r;
        r.status_ = code;
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        return r;
    }

}  // namespace http::client
