#include "utils.hpp"

#include <openssl/evp.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& bytes){
    std::ostringstream oss;
    for(auto c: bytes) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

std::string sha256_hex(const std::string& data){
    Sha256 digest;
    digest.update(data.data(), data.size());
    return digest.final_hex();
}

struct Sha256::Context {
    EVP_MD_CTX* md = nullptr;
};

Sha256::Sha256() : ctx_(std::make_unique<Context>()) {
    ctx_->md = EVP_MD_CTX_new();
    if(!ctx_->md || EVP_DigestInit_ex(ctx_->md, EVP_sha256(), nullptr) != 1){
        if(ctx_->md) EVP_MD_CTX_free(ctx_->md);
        throw std::runtime_error("unable to initialise SHA-256 context");
    }
}

Sha256::~Sha256(){
    if(ctx_ && ctx_->md) EVP_MD_CTX_free(ctx_->md);
}

void Sha256::update(const void* data, std::size_t size){
    if(size == 0) return;
    if(EVP_DigestUpdate(ctx_->md, data, size) != 1){
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256::final_hex(){
    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(ctx_->md, out.data(), &length) != 1){
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    out.resize(length);
    return hex_from_bytes(out);
}

std::string format_size(std::uint64_t bytes){
    static const char* units[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(bytes);
    for(const char* unit : units){
        if(size < 1024.0){
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.1f %s", size, unit);
            return buf;
        }
        size /= 1024.0;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f TB", size);
    return buf;
}

std::string to_lower_copy(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string local_hostname(){
    char hostname[256] = {};
    if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0'){
        return "unknown";
    }
    return hostname;
}

std::string random_instance_id(){
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<std::uint32_t> dist;
    std::ostringstream oss;
    oss << std::nouppercase << std::hex << std::setfill('0') << std::setw(8) << dist(rng);
    return oss.str();
}
