#pragma once

#include <string>
#include <string_view>
#ifdef __cplusplus
extern "C" {
#endif
#include <openssl/evp.h>
#ifdef __cplusplus
}
#endif

namespace searchnet {

// To add a new algorithm, just add a line here
#define HASH_ALGORITHMS(HASH_ALGORITHM) \
	HASH_ALGORITHM(sha1, EVP_sha1)

/*
Message digest over OpenSSL EVP, used to fingerprint pooled client keys.
NOT THREAD-SAFE!!!
*/
class Hash {
public:
	explicit Hash(const EVP_MD* md);
	~Hash();

	// Declare factory and helper methods for each algorithm using X-macro
#define HASH_DECLARE(name, evp_func) \
	static Hash name(); \
	static std::string name(std::string_view data);

	HASH_ALGORITHMS(HASH_DECLARE)

#undef HASH_DECLARE

	// Movable, not copyable
	Hash(const Hash&) = delete;
	Hash& operator=(const Hash&) = delete;
	Hash(Hash&& other) noexcept;
	Hash& operator=(Hash&& other) noexcept;

	Hash& update(std::string_view data);
	std::string final();

	static std::string hexdigest(const std::string& bin_hash);

private:
	const EVP_MD* md_ = nullptr;
	EVP_MD_CTX* ctx_ = nullptr;
	bool finalized_ = false;
	std::string cached_result_;
};

} // namespace searchnet
