#include "HashHelper.hpp"

#include <cstdint>
#include <stdexcept>
#include <utility>

namespace searchnet {

Hash::Hash(const EVP_MD* md) : md_(md), ctx_(EVP_MD_CTX_new()) {
	if (!md_) throw std::invalid_argument("Digest: null EVP_MD");
	if (!ctx_) throw std::runtime_error("Digest: EVP_MD_CTX_new failed");
	if (EVP_DigestInit_ex(ctx_, md_, nullptr) != 1) {
		EVP_MD_CTX_free(ctx_);
		throw std::runtime_error("Digest: EVP_DigestInit_ex failed");
	}
}

Hash::~Hash() {
	if (this->ctx_) EVP_MD_CTX_free(this->ctx_);
}

// Define factory and helper methods
#define HASH_DECLARE(name, evp_func) \
	Hash Hash::name() { return Hash(evp_func()); } \
	std::string Hash::name(std::string_view data) { \
		return Hash(evp_func()).update(data).final(); \
	}

HASH_ALGORITHMS(HASH_DECLARE)

#undef HASH_DECLARE

Hash::Hash(Hash&& other) noexcept
	: md_(std::exchange(other.md_, nullptr)),
	  ctx_(std::exchange(other.ctx_, nullptr)),
	  finalized_(std::exchange(other.finalized_, false)),
	  cached_result_(std::move(other.cached_result_)) {}

Hash& Hash::operator=(Hash&& other) noexcept {
	if (this != &other) {
		EVP_MD_CTX_free(this->ctx_);
		this->ctx_ = std::exchange(other.ctx_, nullptr);
		this->md_ = std::exchange(other.md_, nullptr);
		this->finalized_ = std::exchange(other.finalized_, false);
		this->cached_result_ = std::move(other.cached_result_);
	}
	return *this;
}

Hash& Hash::update(std::string_view data) {
	if (this->finalized_)
		throw std::logic_error("Digest: update after final");
	if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1)
		throw std::runtime_error("Digest: EVP_DigestUpdate failed");
	return *this;
}

std::string Hash::final() {
	// idempotent
	if (!this->finalized_) {
		this->finalized_ = true;

		int md_size = EVP_MD_size(md_);
		if (md_size <= 0) throw std::runtime_error("Digest: EVP_MD_size <= 0");

		unsigned int out_len = 0;
		this->cached_result_.resize(md_size);
		if (EVP_DigestFinal_ex(ctx_, reinterpret_cast<unsigned char*>(this->cached_result_.data()), &out_len) != 1)
			throw std::runtime_error("Digest: EVP_DigestFinal_ex failed");

		this->cached_result_.resize(out_len);
	}
	return this->cached_result_;
}

std::string Hash::hexdigest(const std::string& bin_hash) {
	static const char hex_chars[] = "0123456789abcdef";
	std::string hex_hash;
	hex_hash.reserve(bin_hash.size() * 2);
	for (unsigned char c : bin_hash) {
		hex_hash += hex_chars[(c >> 4) & 0x0F];
		hex_hash += hex_chars[c & 0x0F];
	}
	return hex_hash;
}

} // namespace searchnet
