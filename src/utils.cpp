#include "utils.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

Sha256Stream::Sha256Stream() {
    auto* md = EVP_MD_CTX_new();
    if(!md || EVP_DigestInit_ex(md, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(md);
        throw std::runtime_error("SHA-256 context initialisation failed");
    }
    ctx_ = md;
}

Sha256Stream::~Sha256Stream() {
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
}

void Sha256Stream::update(const char* data, std::size_t size) {
    EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, size);
}

std::string Sha256Stream::finish_hex() {
    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), out.data(), &len);
    out.resize(len);
    return hex_from_bytes(out);
}

std::string base64_encode(const std::string& bytes){
    if(bytes.empty()) return "";
    std::string out(4 * ((bytes.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(bytes.data()),
                                  static_cast<int>(bytes.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::optional<std::string> base64_decode(const std::string& text){
    if(text.empty()) return std::string();
    if(text.size() % 4 != 0) return std::nullopt;
    std::string out(3 * text.size() / 4, '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if(written < 0) return std::nullopt;
    // EVP_DecodeBlock keeps the bytes produced by '=' padding
    std::size_t padding = 0;
    if(text[text.size() - 1] == '=') ++padding;
    if(text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

std::string random_hex_id(std::size_t bytes){
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<unsigned char> raw(bytes);
    for(auto& b : raw) b = static_cast<unsigned char>(dist(rng));
    return hex_from_bytes(raw);
}
