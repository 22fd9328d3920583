#include "utils.hpp"
#include <curl/curl.h>
#include <stdexcept>
#include <iostream>
#include <sstream>

namespace Bulkpack {

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
 *        the response as a string. Throws on error.
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
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        curl_easy_cleanup(curl);
        throw std::runtime_error(
            "Failed to fetch " + url + ": " +
            std::string(curl_easy_strerror(res))
        );
    }

    curl_easy_cleanup(curl);
    return response;
}

bool isRemoteSource(const std::string& source)
{
    return source.rfind("http://", 0) == 0 || source.rfind("https://", 0) == 0;
}

std::string trim(const std::string& s)
{
    const char* whitespace = " \t\n\r\f\v";
    size_t start = s.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return {};
    }
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

std::string sanitizeTag(const std::string& tag)
{
    std::string unquoted;
    unquoted.reserve(tag.size());
    for (char c : tag) {
        if (c != '"' && c != '\'') {
            unquoted.push_back(c);
        }
    }
    return trim(unquoted);
}

std::vector<std::string> splitWords(const std::string& s)
{
    std::vector<std::string> words;
    std::istringstream iss(s);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::string join(const std::vector<std::string>& words, const std::string& separator)
{
    std::string result;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += words[i];
    }
    return result;
}

} // namespace Bulkpack
