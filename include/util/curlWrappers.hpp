#pragma once

#include <curl/curl.h>
#include <stdexcept>
#include <string>

namespace ds::util {

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*() { return h_; }

private:
    CURL* h_;
};

// Owns a multipart form built against a given handle.
class Mime {
public:
    explicit Mime(CURL* h) : m_(curl_mime_init(h)) {
        if (!m_) throw std::runtime_error("curl_mime_init failed");
    }
    ~Mime() { curl_mime_free(m_); }

    Mime(const Mime&) = delete;
    Mime& operator=(const Mime&) = delete;

    void addFile(const std::string& field, const std::string& path, const std::string& filename) {
        curl_mimepart* part = curl_mime_addpart(m_);
        curl_mime_name(part, field.c_str());
        if (curl_mime_filedata(part, path.c_str()) != CURLE_OK)
            throw std::runtime_error("Unable to attach file to multipart form: " + path);
        curl_mime_filename(part, filename.c_str());
    }

    curl_mime* get() const { return m_; }

private:
    curl_mime* m_;
};

struct HttpResponse {
    CURLcode curl = CURLE_OK;
    long http = 0;
    std::string body;
    bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
};

inline size_t appendToString(char* p, const size_t s, const size_t n, void* ud) {
    static_cast<std::string*>(ud)->append(p, s * n);
    return s * n;
}

template <class SetupFn>
HttpResponse performCurl(CurlEasy& h, SetupFn&& setup) {
    std::string bodyBuf;

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, appendToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &bodyBuf);

    setup(h);                      // caller-specific tweaks

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    r.body.swap(bodyBuf);
    return r;
}

}
