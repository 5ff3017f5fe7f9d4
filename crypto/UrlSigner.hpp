/**
 * @file UrlSigner.hpp
 * @brief Signed request URLs for the Google Maps web service APIs
 *
 * Premium and client-ID Maps accounts authenticate requests with an
 * HMAC-SHA1 signature over the path and query of the request URL. The
 * signing secret is distributed as URL-safe Base64.
 */

#pragma once

#include <string>

namespace triplog {

/**
 * @brief HMAC-SHA1 URL signing using OpenSSL
 *
 * All members are static; the class holds no state.
 */
class UrlSigner {
public:
    /**
     * @brief Sign a request path and query
     *
     * @param pathAndQuery e.g. "/maps/api/geocode/json?latlng=1,2&key=K"
     * @param secretUrlSafeBase64 Signing secret as issued (URL-safe Base64)
     * @return pathAndQuery with "&signature=<sig>" appended
     * @throws std::invalid_argument if the secret does not decode
     */
    static std::string signPathAndQuery(const std::string& pathAndQuery,
                                        const std::string& secretUrlSafeBase64);

    /**
     * @brief Sign a full URL, keeping scheme and host untouched
     *
     * @param url Absolute URL including a query string
     * @throws std::invalid_argument if the URL has no path or the secret
     *         does not decode
     */
    static std::string signUrl(const std::string& url, const std::string& secretUrlSafeBase64);

    /**
     * @brief URL signature (URL-safe Base64 of HMAC-SHA1) for the given data
     */
    static std::string signature(const std::string& data, const std::string& secretUrlSafeBase64);

    /**
     * @brief Percent-encode per RFC 3986, keeping A-Z a-z 0-9 - _ . ~
     */
    static std::string urlEncode(const std::string& value);

    static std::string base64Encode(const std::string& data);
    static std::string base64Decode(const std::string& encoded);

    /// Convert between standard and URL-safe Base64 alphabets
    static std::string toUrlSafe(const std::string& base64);
    static std::string fromUrlSafe(const std::string& urlSafe);

private:
    static std::string hmacSha1(const std::string& key, const std::string& message);
};

} // namespace triplog
