#include "utils.hpp"
#include <curl/curl.h>
#include <stdexcept>
#include <iostream>

namespace NetcapSetup {

/**
 * @brief libcurl callback function. Appends downloaded data into a std::string.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t totalSize      = size * nmemb;
    std::string* response = static_cast<std::string*>(userp);

    try {
        response->append(static_cast<char*>(contents), totalSize);
    } catch (const std::exception& e) {
        std::cerr << "Error appending data to response: "
                  << e.what() << std::endl;
        return 0; // Signal failure to libcurl
    }

    return totalSize;
}

/**
 * @brief Fetches a document from a given URL using libcurl. Returns
 *        the response body as a string. Throws on error.
 */
std::string fetchRemoteText(const std::string& url)
{
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize libcurl");
    }

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        curl_easy_cleanup(curl);
        throw std::runtime_error(
            "Failed to fetch " + url + ": " +
            std::string(curl_easy_strerror(res))
        );
    }

    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    curl_easy_cleanup(curl);

    if (httpCode >= 400) {
        throw std::runtime_error(
            "Failed to fetch " + url + ": HTTP status " + std::to_string(httpCode)
        );
    }

    return response;
}

bool isRemoteSource(const std::string& source)
{
    return source.rfind("http://", 0) == 0 || source.rfind("https://", 0) == 0;
}

std::string joinCommandLine(const std::vector<std::string>& args)
{
    std::string line;
    for (const auto& arg : args) {
        if (!line.empty()) {
            line += ' ';
        }

        bool needsQuotes = arg.empty() ||
            arg.find_first_of(" \t\n'\"\\$;&|*?<>()[]{}`#~!") != std::string::npos;
        if (!needsQuotes) {
            line += arg;
            continue;
        }

        // POSIX single quoting: ' becomes '\''
        line += '\'';
        for (char c : arg) {
            if (c == '\'') {
                line += "'\\''";
            } else {
                line += c;
            }
        }
        line += '\'';
    }
    return line;
}

std::size_t displayWidth(const std::string& text)
{
    std::size_t width = 0;
    for (unsigned char c : text) {
        // UTF-8 continuation bytes look like 10xxxxxx
        if ((c & 0xC0) != 0x80) {
            width++;
        }
    }
    return width;
}

} // namespace NetcapSetup
