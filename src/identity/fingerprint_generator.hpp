#pragma once
#include <chrono>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include "tls_profile.hpp"

namespace Umbra {
namespace Identity {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct IdentityProfile {
    HeaderList                headers;
    TlsProfile                tls_profile = TlsProfile::Firefox102;
    std::chrono::milliseconds jitter{0};

    std::string header(const std::string& name) const;
};

class FingerprintGenerator {
public:
    explicit FingerprintGenerator(std::chrono::milliseconds max_jitter);

    IdentityProfile generate() const;
    IdentityProfile generate(std::mt19937_64& rng) const;

    // Used when no randomness source is available.
    static IdentityProfile default_identity();

private:
    std::chrono::milliseconds max_jitter_;
};

}  // namespace Identity
}  // namespace Umbra
