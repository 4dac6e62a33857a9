#include "declutter/fingerprint.hh"

#include <openssl/evp.h>
#include <xxhash.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

#include "declutter/log.hh"

namespace declutter {

inline namespace detail_v1 {

namespace {

constexpr std::string_view xxh128_name = "xxh128";

// RAII wrapper for xxhash library.
class xxh_hasher_t {
  XXH3_state_t *_state;

 public:
  xxh_hasher_t() {
    _state = XXH3_createState();
    if (_state == nullptr) {
      throw std::runtime_error("XXH3_createState failed");
    }
    if (XXH3_128bits_reset_withSeed(_state, hash_seed) == XXH_ERROR) {
      XXH3_freeState(_state);
      throw std::runtime_error("XXH3_128bits_reset_withSeed failed");
    }
  }
  ~xxh_hasher_t() noexcept {
    if (_state != nullptr) {
      XXH3_freeState(_state);
    }
  }

  xxh_hasher_t(const xxh_hasher_t &rhs) = delete;
  xxh_hasher_t(xxh_hasher_t &&rhs) = delete;
  xxh_hasher_t &operator=(const xxh_hasher_t &rhs) = delete;
  xxh_hasher_t &operator=(xxh_hasher_t &&rhs) = delete;

  void update(const char *data, const uint64_t size) {
    if (XXH3_128bits_update(_state, data, size) == XXH_ERROR) {
      throw std::runtime_error("XXH3_128bits_update failed");
    }
  }
  digest_t digest() const {
    XXH128_canonical_t canon;
    XXH128_canonicalFromHash(&canon, XXH3_128bits_digest(_state));
    return digest_t(std::begin(canon.digest), std::end(canon.digest));
  }
};

// RAII wrapper for libcrypto message digests.
class evp_hasher_t {
  EVP_MD_CTX *_ctx;

 public:
  explicit evp_hasher_t(const EVP_MD *md) {
    _ctx = EVP_MD_CTX_new();
    if (_ctx == nullptr) {
      throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(_ctx, md, nullptr) != 1) {
      EVP_MD_CTX_free(_ctx);
      throw std::runtime_error("EVP_DigestInit_ex failed");
    }
  }
  ~evp_hasher_t() noexcept {
    if (_ctx != nullptr) {
      EVP_MD_CTX_free(_ctx);
    }
  }

  evp_hasher_t(const evp_hasher_t &rhs) = delete;
  evp_hasher_t(evp_hasher_t &&rhs) = delete;
  evp_hasher_t &operator=(const evp_hasher_t &rhs) = delete;
  evp_hasher_t &operator=(evp_hasher_t &&rhs) = delete;

  void update(const char *data, const uint64_t size) {
    if (EVP_DigestUpdate(_ctx, data, size) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }
  digest_t digest() const {
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(_ctx, out.data(), &len) != 1) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return digest_t(out.begin(), out.begin() + len);
  }
};

const EVP_MD *lookup_md(const std::string &algo) {
  const EVP_MD *md = EVP_get_digestbyname(algo.c_str());
  if (md == nullptr) {
    throw std::invalid_argument("unknown digest algorithm: " + algo);
  }
  return md;
}

// stream the whole file through hasher, false on open or read error
template <typename Hasher>
bool hash_file(const std::filesystem::path &path, Hasher &hasher) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    return false;
  }
  std::vector<char> buf(buf_sz);
  while (true) {
    ifs.read(buf.data(), (std::streamsize)buf.size());
    const auto read_len = ifs.gcount();
    if (read_len > 0) {
      hasher.update(buf.data(), (uint64_t)read_len);
    }
    if (!ifs) {
      break;
    }
  }
  return !ifs.bad();
}

std::optional<digest_t> content_digest(const std::filesystem::path &path,
                                       const std::string &algo) {
  if (algo == xxh128_name) {
    xxh_hasher_t hasher;
    if (!hash_file(path, hasher)) {
      return std::nullopt;
    }
    return hasher.digest();
  }
  evp_hasher_t hasher(lookup_md(algo));
  if (!hash_file(path, hasher)) {
    return std::nullopt;
  }
  return hasher.digest();
}

void fingerprint_slot(const file_entry_t &entry, const config_t &config,
                      std::optional<file_record_t> &slot) {
  try {
    slot.emplace(fingerprint(entry, config));
  } catch (const std::exception &e) {
    logger_t(*config.log_stream)
        .err("fingerprint failed: ", entry.path(), " - ", e.what());
    slot.emplace(entry, digest_t(digest_size(config.digest_algo), 0),
                 std::nullopt, scan_error_t::unreadable);
  }
}

}  // namespace

bool is_image_path(const std::filesystem::path &path) {
  static const std::array<std::string_view, 8> image_ext{
      ".png", ".jpg", ".jpeg", ".bmp", ".gif", ".webp", ".tif", ".tiff"};
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return std::find(image_ext.begin(), image_ext.end(), ext) != image_ext.end();
}

std::size_t digest_size(const std::string &algo) {
  if (algo == xxh128_name) {
    return sizeof(XXH128_canonical_t);
  }
  return (std::size_t)EVP_MD_size(lookup_md(algo));
}

std::optional<uint64_t> perceptual_digest(const std::filesystem::path &path) {
  cv::Mat small;
  try {
    auto img = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
    if (img.empty()) {
      return std::nullopt;
    }
    cv::resize(img, small, cv::Size(phash_cols, phash_rows), 0, 0,
               cv::INTER_AREA);
  } catch (const cv::Exception &) {
    // decoder rejected the file, treat as not an image
    return std::nullopt;
  }

  uint64_t bits = 0;
  for (auto row = 0; row < phash_rows; ++row) {
    for (auto col = 0; col + 1 < phash_cols; ++col) {
      bits <<= 1U;
      if (small.at<uint8_t>(row, col) > small.at<uint8_t>(row, col + 1)) {
        bits |= 1U;
      }
    }
  }
  return bits;
}

file_record_t fingerprint(const file_entry_t &entry, const config_t &config) {
  const auto sentinel = digest_t(digest_size(config.digest_algo), 0);
  if (entry.size() == 0) {
    return file_record_t(entry, sentinel, std::nullopt, scan_error_t::empty);
  }

  auto digest = content_digest(entry.path(), config.digest_algo);
  if (!digest) {
    // reported once, by the caller deciding what to do with it
    return file_record_t(entry, sentinel, std::nullopt,
                         scan_error_t::unreadable);
  }

  std::optional<uint64_t> phash;
  if (is_image_path(entry.path())) {
    phash = perceptual_digest(entry.path());
    if (!phash) {
      logger_t(*config.log_stream)
          .warn("no perceptual digest: ", entry.path());
    }
  }
  return file_record_t(entry, std::move(*digest), phash, scan_error_t::none);
}

file_record_vec fingerprint_all(const file_entry_vec &entries,
                                const config_t &config) {
  // reject a bad algorithm before any work is queued
  digest_size(config.digest_algo);

  std::vector<std::optional<file_record_t>> slots(entries.size());
  {
    boost::asio::thread_pool pool(std::max(config.max_thread, 1U));
    for (std::size_t i = 0; i < entries.size(); ++i) {
      // each task owns exactly one slot
      boost::asio::post(pool, std::bind(fingerprint_slot, std::cref(entries[i]),
                                        std::cref(config), std::ref(slots[i])));
    }
    pool.join();
  }

  file_record_vec records;
  records.reserve(slots.size());
  for (auto &slot : slots) {
    records.emplace_back(std::move(*slot));
  }
  return records;
}

}  // namespace detail_v1

}  // namespace declutter
