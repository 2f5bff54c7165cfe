#include <inspecta/model/base64.hpp>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <limits>
#include <memory>
#include <stdexcept>

namespace inspecta::model {

namespace {

struct BioChainDeleter {
  void operator()(BIO* bio) const noexcept { BIO_free_all(bio); }
};

}  // namespace

std::string base64_encode(std::span<const std::byte> data) {
  if (data.empty()) return {};
  if (data.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("base64_encode: input too large");
  }

  BIO* b64 = BIO_new(BIO_f_base64());
  BIO* mem = BIO_new(BIO_s_mem());
  if (!b64 || !mem) {
    if (b64) BIO_free(b64);
    if (mem) BIO_free(mem);
    throw std::runtime_error("base64_encode: BIO_new failed");
  }
  BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
  std::unique_ptr<BIO, BioChainDeleter> chain(BIO_push(b64, mem));

  if (BIO_write(chain.get(), data.data(), static_cast<int>(data.size())) <= 0 ||
      BIO_flush(chain.get()) != 1) {
    throw std::runtime_error("base64_encode: BIO_write failed");
  }

  BUF_MEM* buf = nullptr;
  BIO_get_mem_ptr(mem, &buf);
  return std::string(buf->data, buf->length);
}

}  // namespace inspecta::model
