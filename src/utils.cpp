#include "utils.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::filesystem::path normalize_path(const std::filesystem::path& path){
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if(ec) absolute = path;
    return absolute.lexically_normal();
}

bool is_hidden(const std::filesystem::path& path){
    auto name = path.filename().string();
    return !name.empty() && name.front() == '.';
}

bool is_readable_file(const std::filesystem::path& path){
    std::error_code ec;
    if(!std::filesystem::is_regular_file(path, ec) || ec) return false;
    std::ifstream probe(path, std::ios::binary);
    return static_cast<bool>(probe);
}

std::vector<std::filesystem::path> list_directory_files(const std::filesystem::path& directory,
                                                        bool include_hidden){
    std::vector<std::filesystem::path> out;
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec), end;
    for(; !ec && it != end; it.increment(ec)){
        std::error_code type_ec;
        if(!it->is_regular_file(type_ec) || type_ec) continue;
        if(!include_hidden && is_hidden(it->path())) continue;
        out.push_back(normalize_path(it->path()));
    }
    std::sort(out.begin(), out.end());
    return out;
}

struct Sha256::Context {
    EVP_MD_CTX* md = nullptr;
};

Sha256::Sha256() : ctx_(std::make_unique<Context>()) {
    ctx_->md = EVP_MD_CTX_new();
    if(!ctx_->md || EVP_DigestInit_ex(ctx_->md, EVP_sha256(), nullptr) != 1){
        EVP_MD_CTX_free(ctx_->md);
        throw std::runtime_error("unable to initialise SHA-256 context");
    }
}

Sha256::~Sha256(){
    EVP_MD_CTX_free(ctx_->md);
}

void Sha256::update(const void* data, std::size_t size){
    if(size == 0) return;
    if(EVP_DigestUpdate(ctx_->md, data, size) != 1){
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256::hex_digest(){
    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(ctx_->md, out.data(), &length) != 1){
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    out.resize(length);
    return hex_from_bytes(out);
}

std::string sha256_hex(const std::string &data){
    Sha256 digest;
    digest.update(data.data(), data.size());
    return digest.hex_digest();
}

std::string sha256_file_hex(const std::filesystem::path& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw std::runtime_error("cannot open " + path.string());
    Sha256 digest;
    std::array<char, 64 * 1024> buffer{};
    while(in){
        in.read(buffer.data(), buffer.size());
        digest.update(buffer.data(), static_cast<std::size_t>(in.gcount()));
    }
    return digest.hex_digest();
}
