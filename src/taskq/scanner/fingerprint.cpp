#include "taskq/scanner/fingerprint.hpp"

#include "taskq/core/constants.hpp"

#include <openssl/evp.h>

#include <array>
#include <format>
#include <fstream>
#include <memory>

namespace taskq {
namespace {

struct DigestCtxDeleter {
  auto operator()(EVP_MD_CTX *ctx) const noexcept -> void {
    EVP_MD_CTX_free(ctx);
  }
};

} // namespace

auto file_fingerprint(const std::filesystem::path &path)
    -> Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(Error::FileOpenFailed);
  }

  std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter> ctx{EVP_MD_CTX_new()};
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    return fail(Error::Unknown);
  }

  std::array<char, io::kFingerprintChunkSize> chunk{};
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const auto got = in.gcount();
    if (got > 0 && EVP_DigestUpdate(ctx.get(), chunk.data(),
                                    static_cast<std::size_t>(got)) != 1) {
      return fail(Error::Unknown);
    }
  }
  if (in.bad()) {
    return fail(Error::FileOpenFailed);
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
    return fail(Error::Unknown);
  }

  std::string hex;
  hex.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    std::format_to(std::back_inserter(hex), "{:02x}", digest[i]);
  }
  return ok(std::move(hex));
}

} // namespace taskq
