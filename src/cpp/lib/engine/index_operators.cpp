#include "index_operators.hpp"
#include <openssl/evp.h>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace sbm {

namespace {
    constexpr uint64_t MASK32 = 0xFFFFFFFFULL;

    uint64_t isqrt(uint64_t n) {
        uint64_t r = static_cast<uint64_t>(std::sqrt(static_cast<double>(n)));
        // Correct the floating point estimate in both directions
        while (r > 0 && r > n / r) {
            --r;
        }
        while ((r + 1) <= n / (r + 1)) {
            ++r;
        }
        return r;
    }

    uint64_t decimal_digit_sum(uint64_t x) {
        uint64_t s = 0;
        while (x != 0) {
            s += x % 10;
            x /= 10;
        }
        return s;
    }

    uint32_t sha1_prefix32(uint32_t x) {
        const unsigned char input[4] = {
            static_cast<unsigned char>((x >> 24) & 0xFF),
            static_cast<unsigned char>((x >> 16) & 0xFF),
            static_cast<unsigned char>((x >> 8) & 0xFF),
            static_cast<unsigned char>(x & 0xFF),
        };
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_len = 0;
        if (EVP_Digest(input, sizeof(input), digest, &digest_len, EVP_sha1(), nullptr) != 1 ||
            digest_len < 4) {
            throw std::runtime_error("SHA-1 digest computation failed");
        }
        return (static_cast<uint32_t>(digest[0]) << 24) |
               (static_cast<uint32_t>(digest[1]) << 16) |
               (static_cast<uint32_t>(digest[2]) << 8) |
               static_cast<uint32_t>(digest[3]);
    }
}

uint64_t min_divisor(uint64_t n) {
    if (n <= 3) {
        return 0;
    }
    const uint64_t r = isqrt(n);
    for (uint64_t d = 2; d <= r; ++d) {
        if (n % d == 0) {
            return d;
        }
    }
    return 0;
}

char band_from_divisor(uint64_t d, const BandThresholds& bands) {
    if (d == 0) {
        return PRIME_BAND;
    }
    if (d <= bands.t1) {
        return 'A';
    }
    if (d <= bands.t2) {
        return 'B';
    }
    if (d <= bands.t3) {
        return 'C';
    }
    if (d <= bands.t4) {
        return 'D';
    }
    return 'E';
}

uint32_t bucket01(double x, Length k) {
    if (k <= 1) {
        return 0;
    }
    if (x < 0.0) {
        x = 0.0;
    }
    if (x > 1.0) {
        x = 1.0;
    }
    if (x > 0.0) {
        return static_cast<uint32_t>((x - BUCKET_EPSILON) * k);
    }
    return 0;
}

Signature ssnt_closure_signature(uint64_t n, Length H, const BandThresholds& bands) {
    const uint64_t d = min_divisor(n);
    const char band = band_from_divisor(d, bands);
    if (d == 0) {
        return Signature(band, 0);
    }
    const double hardness = static_cast<double>(d) / std::sqrt(static_cast<double>(n));
    return Signature(band, bucket01(hardness, H));
}

Signature collatz_parity_signature(uint64_t n, Length H) {
    std::vector<uint32_t> trace;
    trace.reserve(H);
    uint64_t x = n;
    for (Length i = 0; i < H; ++i) {
        const bool odd = (x & 1U) != 0;
        trace.push_back(odd ? 1U : 0U);
        if (odd) {
            if (x > (std::numeric_limits<uint64_t>::max() - 1) / 3) {
                throw std::overflow_error("Collatz trajectory of " + std::to_string(n) +
                                          " exceeds 64 bits");
            }
            x = 3 * x + 1;
        } else {
            x /= 2;
        }
    }
    return Signature(std::move(trace));
}

Signature xorshift_parity_signature(uint64_t n, Length H) {
    std::vector<uint32_t> trace;
    trace.reserve(H);
    uint64_t x = n & MASK32;
    for (Length i = 0; i < H; ++i) {
        trace.push_back(static_cast<uint32_t>(x & 1U));
        x ^= (x << 13) & MASK32;
        x ^= (x >> 17) & MASK32;
        x ^= (x << 5) & MASK32;
        x &= MASK32;
    }
    return Signature(std::move(trace));
}

Signature digitsum_mod9_signature(uint64_t n, Length H) {
    std::vector<uint32_t> trace;
    trace.reserve(H);
    uint64_t x = n;
    for (Length i = 0; i < H; ++i) {
        trace.push_back(static_cast<uint32_t>(x % 9));
        x = decimal_digit_sum(x);
    }
    return Signature(std::move(trace));
}

Signature sha1_parity_signature(uint64_t n, Length H) {
    std::vector<uint32_t> trace;
    trace.reserve(H);
    uint32_t x = static_cast<uint32_t>(n & MASK32);
    for (Length i = 0; i < H; ++i) {
        trace.push_back(x & 1U);
        x = sha1_prefix32(x);
    }
    return Signature(std::move(trace));
}

Signature operator_signature(uint64_t n, const OperatorConfig& config) {
    switch (config.op) {
        case OperatorKind::SSNT_CLOSURE:
            return ssnt_closure_signature(n, config.H, config.bands);
        case OperatorKind::COLLATZ_PARITY:
            return collatz_parity_signature(n, config.H);
        case OperatorKind::XORSHIFT_PARITY:
            return xorshift_parity_signature(n, config.H);
        case OperatorKind::DIGITSUM_MOD9:
            return digitsum_mod9_signature(n, config.H);
        case OperatorKind::SHA1_PARITY:
            return sha1_parity_signature(n, config.H);
    }
    throw ConfigError("Unknown operator");
}

OperatorSignatureSource::OperatorSignatureSource(const OperatorConfig& config)
    : config_(config) {
    config_.validate();
}

Signature OperatorSignatureSource::signature_at(Index n) const {
    return operator_signature(n, config_);
}

} // namespace sbm
