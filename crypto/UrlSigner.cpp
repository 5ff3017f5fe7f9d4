#include "UrlSigner.hpp"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <sstream>
#include <iomanip>
#include <cctype>
#include <stdexcept>

namespace triplog {

std::string UrlSigner::signPathAndQuery(const std::string& pathAndQuery,
                                        const std::string& secretUrlSafeBase64) {
    return pathAndQuery + "&signature=" + signature(pathAndQuery, secretUrlSafeBase64);
}

std::string UrlSigner::signUrl(const std::string& url, const std::string& secretUrlSafeBase64) {
    // Skip "scheme://host" so only path and query are signed.
    std::string::size_type hostStart = url.find("://");
    hostStart = (hostStart == std::string::npos) ? 0 : hostStart + 3;

    const std::string::size_type pathStart = url.find('/', hostStart);
    if (pathStart == std::string::npos) {
        throw std::invalid_argument("URL has no path to sign: " + url);
    }

    return url.substr(0, pathStart) + signPathAndQuery(url.substr(pathStart), secretUrlSafeBase64);
}

std::string UrlSigner::signature(const std::string& data, const std::string& secretUrlSafeBase64) {
    const std::string key = base64Decode(fromUrlSafe(secretUrlSafeBase64));
    if (key.empty()) {
        throw std::invalid_argument("URL signing secret is not valid Base64");
    }
    return toUrlSafe(base64Encode(hmacSha1(key, data)));
}

std::string UrlSigner::hmacSha1(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;

    unsigned char* result = HMAC(EVP_sha1(),
                                 key.data(), static_cast<int>(key.length()),
                                 reinterpret_cast<const unsigned char*>(message.data()),
                                 message.length(),
                                 digest, &digestLength);
    if (result == nullptr) {
        throw std::runtime_error("HMAC-SHA1 computation failed");
    }

    return std::string(reinterpret_cast<char*>(digest), digestLength);
}

std::string UrlSigner::base64Encode(const std::string& data) {
    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    BIO_write(bio, data.data(), static_cast<int>(data.length()));
    (void)BIO_flush(bio);

    BUF_MEM* bufferPtr;
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    return result;
}

// Returns an empty string when the input is not valid Base64.
std::string UrlSigner::base64Decode(const std::string& encoded) {
    BIO* bio = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.length()));
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    std::string result(encoded.length(), 0);
    int decodedLength = BIO_read(bio, &result[0], static_cast<int>(result.size()));

    BIO_free_all(bio);

    if (decodedLength > 0) {
        result.resize(static_cast<std::size_t>(decodedLength));
    } else {
        result.clear();
    }

    return result;
}

std::string UrlSigner::toUrlSafe(const std::string& base64) {
    std::string out = base64;
    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

std::string UrlSigner::fromUrlSafe(const std::string& urlSafe) {
    std::string out = urlSafe;
    for (char& c : out) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
    }
    while (out.size() % 4 != 0) {
        out.push_back('=');
    }
    return out;
}

std::string UrlSigner::urlEncode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << std::uppercase;
            escaped << '%' << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
            escaped << std::nouppercase;
        }
    }

    return escaped.str();
}

} // namespace triplog
