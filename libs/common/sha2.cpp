/**
 * @file sha2.cpp
 * @brief SHA-256, SHA-384 and SHA-512 (FIPS 180-4, no external dependency)
 *
 * One compression engine parameterised by a traits struct: word type,
 * round count, block and length-field sizes, rotation amounts, round
 * constants, initial state and digest length. SHA-384 is SHA-512 with a
 * different initial state, truncated to six words.
 */

#include "canonjson/common.hpp"

#include <array>
#include <bit>
#include <cstddef>
#include <cstring>
#include <format>
#include <ranges>
#include <span>

namespace canonjson::common {

namespace {

/// Rotation amounts for one of the four SHA-2 mixing functions.
/// The big sigmas rotate three times; the small sigmas rotate twice and shift once.
using Rotations = std::array<int, 3>;

struct Sha256Traits {
    using Word = std::uint32_t;
    static constexpr std::size_t kRounds = 64;
    static constexpr std::size_t kBlockBytes = 64;
    static constexpr std::size_t kLengthBytes = 8;
    static constexpr std::size_t kDigestBytes = 32;

    static constexpr Rotations kSigma0 = {2, 13, 22};
    static constexpr Rotations kSigma1 = {6, 11, 25};
    static constexpr Rotations kGamma0 = {7, 18, 3};
    static constexpr Rotations kGamma1 = {17, 19, 10};

    static constexpr std::array<Word, kRounds> kRoundConstants = {{
        0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
        0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
        0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
        0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
        0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
        0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
        0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
        0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
    }};

    static constexpr std::array<Word, 8> kInitialState = {{
        0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
        0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
    }};
};

struct Sha512Traits {
    using Word = std::uint64_t;
    static constexpr std::size_t kRounds = 80;
    static constexpr std::size_t kBlockBytes = 128;
    static constexpr std::size_t kLengthBytes = 16;
    static constexpr std::size_t kDigestBytes = 64;

    static constexpr Rotations kSigma0 = {28, 34, 39};
    static constexpr Rotations kSigma1 = {14, 18, 41};
    static constexpr Rotations kGamma0 = {1, 8, 7};
    static constexpr Rotations kGamma1 = {19, 61, 6};

    static constexpr std::array<Word, kRounds> kRoundConstants = {{
        0x428a2f98d728ae22, 0x7137449123ef65cd, 0xb5c0fbcfec4d3b2f, 0xe9b5dba58189dbbc,
        0x3956c25bf348b538, 0x59f111f1b605d019, 0x923f82a4af194f9b, 0xab1c5ed5da6d8118,
        0xd807aa98a3030242, 0x12835b0145706fbe, 0x243185be4ee4b28c, 0x550c7dc3d5ffb4e2,
        0x72be5d74f27b896f, 0x80deb1fe3b1696b1, 0x9bdc06a725c71235, 0xc19bf174cf692694,
        0xe49b69c19ef14ad2, 0xefbe4786384f25e3, 0x0fc19dc68b8cd5b5, 0x240ca1cc77ac9c65,
        0x2de92c6f592b0275, 0x4a7484aa6ea6e483, 0x5cb0a9dcbd41fbd4, 0x76f988da831153b5,
        0x983e5152ee66dfab, 0xa831c66d2db43210, 0xb00327c898fb213f, 0xbf597fc7beef0ee4,
        0xc6e00bf33da88fc2, 0xd5a79147930aa725, 0x06ca6351e003826f, 0x142929670a0e6e70,
        0x27b70a8546d22ffc, 0x2e1b21385c26c926, 0x4d2c6dfc5ac42aed, 0x53380d139d95b3df,
        0x650a73548baf63de, 0x766a0abb3c77b2a8, 0x81c2c92e47edaee6, 0x92722c851482353b,
        0xa2bfe8a14cf10364, 0xa81a664bbc423001, 0xc24b8b70d0f89791, 0xc76c51a30654be30,
        0xd192e819d6ef5218, 0xd69906245565a910, 0xf40e35855771202a, 0x106aa07032bbd1b8,
        0x19a4c116b8d2d0c8, 0x1e376c085141ab53, 0x2748774cdf8eeb99, 0x34b0bcb5e19b48a8,
        0x391c0cb3c5c95a63, 0x4ed8aa4ae3418acb, 0x5b9cca4f7763e373, 0x682e6ff3d6b2b8a3,
        0x748f82ee5defb2fc, 0x78a5636f43172f60, 0x84c87814a1f0ab72, 0x8cc702081a6439ec,
        0x90befffa23631e28, 0xa4506cebde82bde9, 0xbef9a3f7b2c67915, 0xc67178f2e372532b,
        0xca273eceea26619c, 0xd186b8c721c0c207, 0xeada7dd6cde0eb1e, 0xf57d4f7fee6ed178,
        0x06f067aa72176fba, 0x0a637dc5a2c898a6, 0x113f9804bef90dae, 0x1b710b35131c471b,
        0x28db77f523047d84, 0x32caab7b40c72493, 0x3c9ebe0a15c9bebc, 0x431d67c49c100d4c,
        0x4cc5d4becb3e42b6, 0x597f299cfc657e2a, 0x5fcb6fab3ad6faec, 0x6c44198c4a475817
    }};

    static constexpr std::array<Word, 8> kInitialState = {{
        0x6a09e667f3bcc908, 0xbb67ae8584caa73b, 0x3c6ef372fe94f82b, 0xa54ff53a5f1d36f1,
        0x510e527fade682d1, 0x9b05688c2b3e6c1f, 0x1f83d9abfb41bd6b, 0x5be0cd19137e2179
    }};
};

struct Sha384Traits : Sha512Traits {
    static constexpr std::size_t kDigestBytes = 48;

    static constexpr std::array<Word, 8> kInitialState = {{
        0xcbbb9d5dc1059ed8, 0x629a292a367cd507, 0x9159015a3070dd17, 0x152fecd8f70e5939,
        0x67332667ffc00b31, 0x8eb44a8768581511, 0xdb0c2e0d64f98fa7, 0x47b5481dbefa4fa4
    }};
};

template <typename Word>
[[nodiscard]] constexpr Word ch(Word x, Word y, Word z) noexcept {
    return (x & y) ^ (~x & z);
}

template <typename Word>
[[nodiscard]] constexpr Word maj(Word x, Word y, Word z) noexcept {
    return (x & y) ^ (x & z) ^ (y & z);
}

template <typename Word>
[[nodiscard]] constexpr Word big_sigma(Word x, const Rotations& r) noexcept {
    return std::rotr(x, r[0]) ^ std::rotr(x, r[1]) ^ std::rotr(x, r[2]);
}

template <typename Word>
[[nodiscard]] constexpr Word small_sigma(Word x, const Rotations& r) noexcept {
    return std::rotr(x, r[0]) ^ std::rotr(x, r[1]) ^ (x >> r[2]);
}

template <typename Traits>
class Sha2 {
public:
    using Word = typename Traits::Word;
    using Digest = std::array<std::uint8_t, Traits::kDigestBytes>;

    static constexpr std::size_t kWordBytes = sizeof(Word);
    static constexpr std::size_t kBlockBytes = Traits::kBlockBytes;

    Sha2() : state_{Traits::kInitialState}, buffer_{}, buffer_len_{0}, count_{0} {}

    void update(std::string_view data) {
        for (char c : data) {
            buffer_[buffer_len_++] = static_cast<std::uint8_t>(c);
            if (buffer_len_ == kBlockBytes) {
                transform();
                count_ += kBlockBytes * 8U;
                buffer_len_ = 0;
            }
        }
    }

    Digest finalize() {
        const std::uint64_t total_bits = count_ + buffer_len_ * 8U;
        constexpr std::size_t length_offset = kBlockBytes - Traits::kLengthBytes;

        buffer_[buffer_len_++] = 0x80;
        if (buffer_len_ > length_offset) {
            while (buffer_len_ < kBlockBytes) buffer_[buffer_len_++] = 0;
            transform();
            buffer_len_ = 0;
        }
        // Inputs are held in memory, so any length bytes above the low 64 bits are zero.
        while (buffer_len_ < kBlockBytes - 8U) buffer_[buffer_len_++] = 0;

        for (auto i : std::views::iota(0, 8) | std::views::reverse) {
            const auto shift = static_cast<std::uint64_t>(i) * 8U;
            buffer_[buffer_len_++] = static_cast<std::uint8_t>(total_bits >> shift);
        }
        transform();

        Digest digest;
        for (auto [i, byte] : std::views::enumerate(digest)) {
            const auto idx = static_cast<std::size_t>(i);
            const auto shift = (kWordBytes - 1U - (idx % kWordBytes)) * 8U;
            byte = static_cast<std::uint8_t>(state_[idx / kWordBytes] >> shift);
        }
        return digest;
    }

private:
    void transform() {
        std::array<Word, Traits::kRounds> w;

        std::span<Word, Traits::kRounds> schedule(w);
        for (auto [i, slot] : std::views::enumerate(schedule.template first<16>())) {
            const auto idx = static_cast<std::size_t>(i);
            Word val{};
            std::memcpy(&val, &buffer_[idx * kWordBytes], sizeof(val));
            if constexpr (std::endian::native == std::endian::little) {
                slot = std::byteswap(val);
            } else {
                slot = val;
            }
        }
        for (auto [i, slot] : std::views::enumerate(schedule.subspan(16))) {
            const auto idx = static_cast<std::size_t>(i) + 16uz;
            slot = small_sigma(schedule[idx - 2], Traits::kGamma1) + schedule[idx - 7]
                 + small_sigma(schedule[idx - 15], Traits::kGamma0) + schedule[idx - 16];
        }

        Word a = state_[0], b = state_[1], c = state_[2], d = state_[3];
        Word e = state_[4], f = state_[5], g = state_[6], h = state_[7];

        for (auto [i, w_val] : std::views::enumerate(schedule)) {
            const auto idx = static_cast<std::size_t>(i);
            Word t1 = h + big_sigma(e, Traits::kSigma1) + ch(e, f, g) + Traits::kRoundConstants[idx] + w_val;
            Word t2 = big_sigma(a, Traits::kSigma0) + maj(a, b, c);
            h = g; g = f; f = e; e = d + t1;
            d = c; c = b; b = a; a = t1 + t2;
        }

        state_[0] += a; state_[1] += b; state_[2] += c; state_[3] += d;
        state_[4] += e; state_[5] += f; state_[6] += g; state_[7] += h;
    }

    std::array<Word, 8> state_;
    std::array<std::uint8_t, kBlockBytes> buffer_;
    std::size_t buffer_len_;
    std::uint64_t count_;
};

template <typename Traits>
[[nodiscard]] typename Sha2<Traits>::Digest digest_of(std::string_view data) {
    Sha2<Traits> hasher;
    hasher.update(data);
    return hasher.finalize();
}

} // namespace

Sha256Digest sha256(std::string_view data) {
    return digest_of<Sha256Traits>(data);
}

Sha384Digest sha384(std::string_view data) {
    return digest_of<Sha384Traits>(data);
}

Sha512Digest sha512(std::string_view data) {
    return digest_of<Sha512Traits>(data);
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::string result;
    result.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        result += std::format("{:02x}", b);
    }
    return result;
}

std::string sha256_prefixed(std::string_view data) {
    return "sha256:" + to_hex(sha256(data));
}

} // namespace canonjson::common
